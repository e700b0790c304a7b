/*
 * PATH resolution implementation - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellkit/exec/path.hpp>
#include <cstdlib>
#include <sys/stat.h>
#include <unistd.h>

namespace shellkit {

static bool is_executable_file(const std::string& p) {
    struct stat st{};
    if (::stat(p.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
    return ::access(p.c_str(), X_OK) == 0;
}

std::vector<std::string> split_search_path(const std::string& path_list) {
    std::vector<std::string> dirs;
    std::size_t start = 0;
    while (start <= path_list.size()) {
        std::size_t colon = path_list.find(':', start);
        if (colon == std::string::npos) colon = path_list.size();
        if (colon > start) dirs.push_back(path_list.substr(start, colon - start));
        start = colon + 1;
    }
    return dirs;
}

std::optional<std::string> resolve_executable(const std::string& program, const std::optional<std::string>& search_path) {
    if (program.empty()) return std::nullopt;
    if (program.find('/') != std::string::npos) {
        if (is_executable_file(program)) return program;
        return std::nullopt;
    }
    std::string list;
    if (search_path) list = *search_path;
    else if (const char* env = std::getenv("PATH")) list = env;
    for (auto& dir : split_search_path(list)) {
        std::string full = dir + '/' + program;
        if (is_executable_file(full)) return full;
    }
    return std::nullopt;
}

} // namespace shellkit
