#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Thrown by parse() for unknown options, missing values and stray arguments.
class CommandLineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "ftp_mirror",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","watch_folder"}}
                    }));

  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;

  // Usage goes to stdout for --help and to stderr after a command line error.
  void usage(bool to_stderr = false) const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
