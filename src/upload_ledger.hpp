#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "log.hpp"

// Presence set of relative paths whose most recent upload succeeded.
// Persisted as a JSON array of strings, rewritten in full on every change.
// Losing it only costs redundant uploads, so I/O problems are logged and
// reported through return values but never thrown.
class UploadLedger {
public:
    explicit UploadLedger(std::filesystem::path storage_path,
                          std::shared_ptr<Logger> logger = nullptr);

    // Reads persisted state and makes it current. Missing file -> empty set;
    // unreadable or malformed file -> warning and empty set.
    std::set<std::string> load();

    bool contains(const std::string& relative_path) const;

    // Adds to the in-memory set and persists. Returns false only when the
    // persist failed; the entry stays recorded in memory either way.
    bool record(const std::string& relative_path);

    bool persist() const;

    std::size_t size() const;
    std::set<std::string> snapshot() const;

private:
    std::filesystem::path storage_path_;
    std::shared_ptr<Logger> logger_;
    mutable std::mutex m_;
    mutable std::mutex write_m_;
    std::set<std::string> entries_;
};
