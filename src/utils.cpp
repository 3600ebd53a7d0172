#include "utils.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

std::optional<std::string> relative_to_root(const std::filesystem::path& root,
                                            const std::filesystem::path& path){
    // lexical only: a symlink inside the root keeps its own name
    auto rel = path.lexically_normal().lexically_relative(root.lexically_normal());
    auto rel_str = rel.generic_string();
    if(rel_str.empty() || rel_str == ".") return std::nullopt;
    if(rel_str == ".." || rel_str.rfind("../", 0) == 0) return std::nullopt;
    return rel_str;
}

std::string to_remote_path(const std::string& relative_path){
    std::string out = relative_path;
    std::replace(out.begin(), out.end(), '\\', '/');
    while(!out.empty() && out.front() == '/') out.erase(out.begin());
    return out;
}

std::string remote_parent(const std::string& remote_path){
    auto pos = remote_path.find_last_of('/');
    if(pos == std::string::npos) return "";
    auto parent = remote_path.substr(0, pos);
    if(parent == ".") return "";
    return parent;
}

bool is_hidden_path(const std::filesystem::path& relative){
    for(const auto& part : relative){
        auto name = part.string();
        if(name.size() > 1 && name[0] == '.' && name != "..") return true;
    }
    return false;
}

std::string format_size(uint64_t bytes){
    if(bytes < 1024) return std::to_string(bytes) + "b";
    static const char* suffixes[] = {"B", "K", "M", "G", "T", "P"};
    constexpr std::size_t suffix_count = sizeof(suffixes) / sizeof(suffixes[0]);
    double value = static_cast<double>(bytes);
    std::size_t idx = 0;
    while(idx + 1 < suffix_count && value >= 1024.0){
        value /= 1024.0;
        ++idx;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << suffixes[idx];
    return oss.str();
}
