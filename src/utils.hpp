#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

// Generic (forward slash) path of `path` relative to `root`, or nullopt when
// the path lies outside the root.
std::optional<std::string> relative_to_root(const std::filesystem::path& root,
                                            const std::filesystem::path& path);

std::string to_remote_path(const std::string& relative_path);

// Directory part of a remote path; empty for files at the root.
std::string remote_parent(const std::string& remote_path);

bool is_hidden_path(const std::filesystem::path& relative);

std::string format_size(uint64_t bytes);
