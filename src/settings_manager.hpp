#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "retry_policy.hpp"
#include "transfer_client.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","watch_folder"},        {"aliases", {"folder","w"}},     {"type","string"}, {"default",""},        {"description","Folder to watch and mirror"}},
  {{"key","ftp_host"},            {"aliases", {"host"}},           {"type","string"}, {"default",""},        {"description","FTP server host"}, {"env","FTP_HOST"}},
  {{"key","ftp_port"},            {"aliases", {"port"}},           {"type","int"},    {"default",21},        {"description","FTP server port"}, {"env","FTP_PORT"}},
  {{"key","ftp_user"},            {"aliases", {"user","u"}},       {"type","string"}, {"default",""},        {"description","FTP user name"}, {"env","FTP_USER"}},
  {{"key","ftp_password"},        {"aliases", {"password"}},       {"type","string"}, {"default",""},        {"description","FTP password"}, {"env","FTP_PASSWORD"}},
  {{"key","ftp_secure"},          {"aliases", {"secure"}},         {"type","bool"},   {"default",false},     {"description","Require explicit FTPS (AUTH TLS)"}, {"env","FTP_SECURE"}},
  {{"key","max_retries"},         {"aliases", {"retries"}},        {"type","int"},    {"default",3},         {"description","Extra attempts after the first failed upload"}, {"env","FTP_MAX_RETRIES"}},
  {{"key","retry_delay_ms"},      {"aliases", {"delay"}},          {"type","int"},    {"default",1000},      {"description","Initial backoff delay in milliseconds"}, {"env","FTP_RETRY_DELAY_MS"}},
  {{"key","max_retry_delay_ms"},  {"aliases", {"max_delay"}},      {"type","int"},    {"default",30000},     {"description","Backoff ceiling in milliseconds"}, {"env","FTP_MAX_RETRY_DELAY_MS"}},
  {{"key","backoff_multiplier"},  {"aliases", {"backoff"}},        {"type","float"},  {"default",2.0},       {"description","Exponential backoff growth factor"}, {"env","FTP_BACKOFF_MULTIPLIER"}},
  {{"key","connect_timeout_ms"},  {"aliases", {"timeout"}},        {"type","int"},    {"default",10000},     {"description","Connection timeout in milliseconds"}, {"env","FTP_CONNECT_TIMEOUT_MS"}},
  {{"key","upload_workers"},      {"aliases", {"workers"}},        {"type","int"},    {"default",4},         {"description","Uploads that may run at the same time"}, {"env","FTP_UPLOAD_WORKERS"}},
  {{"key","ledger_path"},         {"aliases", {"ledger"}},         {"type","string"}, {"default","uploaded-files.json"}, {"description","Uploaded files list, relative to the working directory"}, {"env","FTP_LEDGER_PATH"}},
  {{"key","watch_stability_ms"},  {"aliases", {"stability"}},      {"type","int"},    {"default",2000},      {"description","Quiet period before a written file is picked up"}},
  {{"key","watch_poll_ms"},       {"aliases", {"poll"}},           {"type","int"},    {"default",100},       {"description","Folder scan interval in milliseconds"}},
  {{"key","log_file"},            {"aliases", {"log"}},            {"type","string"}, {"default",""},        {"description","Also write log lines to this file"}},
  {{"key","verbose"},             {"aliases", {"v"}},              {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}},
  {{"key","help"},                {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},     {"description","Show command help and exit"}}
});

class SettingsManager {
public:
  // Returns the variable's value, or nullopt when it is unset.
  using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Applies every setting that names an environment variable. Returns the
  // number of values taken from the environment.
  std::size_t load_from_environment(const EnvLookup& lookup = process_environment);
  static std::optional<std::string> process_environment(const std::string& name);

  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    std::string env;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = SettingsManager::to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.env = entry.value("env", "");
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline std::optional<std::string> SettingsManager::process_environment(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if(!value) return std::nullopt;
  return std::string(value);
}

inline std::size_t SettingsManager::load_from_environment(const EnvLookup& lookup) {
  if(!lookup) return 0;
  std::size_t applied = 0;
  for(const auto& spec : setting_specs_) {
    if(spec.env.empty()) continue;
    auto raw = lookup(spec.env);
    if(!raw) continue;
    std::string value = trim_copy(*raw);
    if(value.empty()) continue;

    std::string error;
    nlohmann::json parsed;
    if(spec.type == "bool") {
      // only the exact literal enables a flag from the environment
      parsed = (value == "true");
    } else {
      parsed = parse_string_value(spec, value, error);
    }
    if(error.empty() && convert_and_store(spec, parsed, error)) {
      ++applied;
      continue;
    }
    log_warn(nullptr, "Ignoring invalid {}='{}': {} (using default {})",
             spec.env, value, error, value_as_string(spec.key));
  }
  return applied;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                                  const nlohmann::json& value,
                                                  std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<int>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "float") {
    if(value.is_number()) {
      settings_[spec.key] = value.get<double>();
      return true;
    }
    error = "expected number";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                             const std::string& value,
                                                             std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      int parsed = std::stoi(clean, &consumed);
      if(consumed != clean.size()) {
        error = "expected integer";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "float") {
    try {
      std::size_t consumed = 0;
      double parsed = std::stod(clean, &consumed);
      if(consumed != clean.size()) {
        error = "expected number";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                                const std::string& value,
                                                std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                    const nlohmann::json& value,
                                    std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}

// ---- mirror configuration -------------------------------------------------

// Every constraint the settings break; empty when they are usable.
inline std::vector<std::string> validate_mirror_settings(const SettingsManager& settings) {
  std::vector<std::string> problems;
  if(settings.get<std::string>("ftp_host").empty() ||
     settings.get<std::string>("ftp_user").empty() ||
     settings.get<std::string>("ftp_password").empty()) {
    problems.push_back("Missing FTP configuration. Required: FTP_HOST, FTP_USER, FTP_PASSWORD");
  }
  int port = settings.get<int>("ftp_port");
  if(port <= 0 || port > 65535) {
    problems.push_back("Invalid ftp_port '" + std::to_string(port) + "'");
  }
  if(settings.get<int>("connect_timeout_ms") <= 0) {
    problems.push_back("connect_timeout_ms must be > 0");
  }
  if(settings.get<int>("upload_workers") < 1) {
    problems.push_back("upload_workers must be >= 1");
  }
  if(settings.get<std::string>("ledger_path").empty()) {
    problems.push_back("ledger_path must not be empty");
  }

  RetryPolicy::Config retry;
  retry.max_retries = settings.get<int>("max_retries");
  retry.initial_delay = std::chrono::milliseconds(settings.get<int>("retry_delay_ms"));
  retry.max_delay = std::chrono::milliseconds(settings.get<int>("max_retry_delay_ms"));
  retry.backoff_multiplier = settings.get<double>("backoff_multiplier");
  auto retry_problem = retry.validate();
  if(!retry_problem.empty()) {
    problems.push_back("Invalid retry configuration: " + retry_problem);
  }
  return problems;
}

inline TransferConfig transfer_config_from(const SettingsManager& settings) {
  TransferConfig config;
  config.host = settings.get<std::string>("ftp_host");
  config.port = static_cast<unsigned short>(settings.get<int>("ftp_port"));
  config.user = settings.get<std::string>("ftp_user");
  config.password = settings.get<std::string>("ftp_password");
  config.secure = settings.get<bool>("ftp_secure");
  config.connect_timeout = std::chrono::milliseconds(settings.get<int>("connect_timeout_ms"));
  return config;
}

inline RetryPolicy::Config retry_config_from(const SettingsManager& settings) {
  RetryPolicy::Config config;
  config.max_retries = settings.get<int>("max_retries");
  config.initial_delay = std::chrono::milliseconds(settings.get<int>("retry_delay_ms"));
  config.max_delay = std::chrono::milliseconds(settings.get<int>("max_retry_delay_ms"));
  config.backoff_multiplier = settings.get<double>("backoff_multiplier");
  return config;
}
