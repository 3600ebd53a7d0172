#include "upload_ledger.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

UploadLedger::UploadLedger(std::filesystem::path storage_path,
                           std::shared_ptr<Logger> logger)
    : storage_path_(std::move(storage_path)), logger_(std::move(logger))
{
}

std::set<std::string> UploadLedger::load(){
    std::set<std::string> loaded;
    std::error_code ec;
    if(!std::filesystem::exists(storage_path_, ec)){
        std::lock_guard lg(m_);
        entries_.clear();
        return loaded;
    }

    try{
        std::ifstream in(storage_path_);
        if(!in) throw std::runtime_error("unable to open for reading");
        nlohmann::json doc;
        in >> doc;
        if(!doc.is_array()) throw std::runtime_error("expected a JSON array of paths");
        for(const auto& item : doc){
            if(!item.is_string()) throw std::runtime_error("expected only string entries");
            loaded.insert(item.get<std::string>());
        }
    } catch(const std::exception& e){
        log_warn(logger_.get(), "Could not load uploaded files list {}: {}", storage_path_.string(), e.what());
        loaded.clear();
    }

    std::lock_guard lg(m_);
    entries_ = loaded;
    return loaded;
}

bool UploadLedger::contains(const std::string& relative_path) const {
    std::lock_guard lg(m_);
    return entries_.count(relative_path) > 0;
}

bool UploadLedger::record(const std::string& relative_path){
    {
        std::lock_guard lg(m_);
        entries_.insert(relative_path);
    }
    return persist();
}

std::size_t UploadLedger::size() const {
    std::lock_guard lg(m_);
    return entries_.size();
}

std::set<std::string> UploadLedger::snapshot() const {
    std::lock_guard lg(m_);
    return entries_;
}

bool UploadLedger::persist() const {
    // writers are serialized and snapshot under the write lock, so the file
    // always ends up holding the newest set
    std::lock_guard wl(write_m_);
    auto to_write = snapshot();

    std::error_code ec;
    if(storage_path_.has_parent_path()){
        std::filesystem::create_directories(storage_path_.parent_path(), ec);
    }
    std::ofstream out(storage_path_, std::ios::trunc);
    if(!out){
        log_error(logger_.get(), "Could not save uploaded files list {}: unable to open for writing", storage_path_.string());
        return false;
    }
    nlohmann::json doc = nlohmann::json::array();
    for(const auto& path : to_write) doc.push_back(path);
    out << doc.dump(2);
    out.flush();
    if(!out){
        log_error(logger_.get(), "Could not save uploaded files list {}: write failed", storage_path_.string());
        return false;
    }
    return true;
}
