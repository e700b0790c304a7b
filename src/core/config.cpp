/*
 * Engine configuration implementation - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellkit/core/config.hpp>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>

namespace shellkit {

static std::string getenv_or(const char* k, const std::string& def = "") {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static std::optional<long> parse_long(const std::string& s) {
    long v = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

std::string default_config_path() {
    std::string home = getenv_or("HOME");
    if (home.empty()) return "";
    return home + "/.shellkitrc";
}

std::string default_aliases_path(const EngineConfig& cfg) {
    if (!cfg.aliases_file.empty()) return cfg.aliases_file;
    std::string home = getenv_or("HOME");
    if (home.empty()) return "." + cfg.app_name + "_aliases";
    return home + "/." + cfg.app_name + "_aliases";
}

static void apply_depth(EngineConfig& cfg, const std::string& val, const std::string& origin) {
    auto v = parse_long(val);
    if (!v || *v < 1) { log_warn(origin + ": invalid max_exec_depth '" + val + "', keeping " + std::to_string(cfg.max_exec_depth)); return; }
    cfg.max_exec_depth = static_cast<int>(*v);
}

static void apply_level(EngineConfig& cfg, const std::string& val, const std::string& origin) {
    auto lvl = parse_log_level(val);
    if (!lvl) { log_warn(origin + ": invalid log_level '" + val + "'"); return; }
    cfg.log_level = *lvl;
}

bool load_config(const std::string& path, EngineConfig& cfg) {
    if (path.empty()) return false;
    std::ifstream in(path);
    if (!in) return false;
    std::string line; std::size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        std::string origin = path + ":" + std::to_string(lineno);
        if (eq == std::string::npos) { log_warn(origin + ": expected key=value"); continue; }
        auto key = trim(line.substr(0, eq)); auto val = trim(line.substr(eq + 1));
        if (key == "max_exec_depth") apply_depth(cfg, val, origin);
        else if (key == "log_level") apply_level(cfg, val, origin);
        else if (key == "kill_grace_ms") {
            auto v = parse_long(val);
            if (!v || *v < 0) log_warn(origin + ": invalid kill_grace_ms '" + val + "'");
            else cfg.kill_grace = std::chrono::milliseconds(*v);
        }
        else if (key == "aliases_file") cfg.aliases_file = val;
        else if (key == "app_name") { if (!val.empty()) cfg.app_name = val; }
        else log_debug(origin + ": unknown key '" + key + "' ignored");
    }
    return true;
}

void apply_env_overrides(EngineConfig& cfg) {
    std::string lvl = getenv_or("SHELLKIT_LOG_LEVEL");
    if (!lvl.empty()) apply_level(cfg, lvl, "SHELLKIT_LOG_LEVEL");
    std::string depth = getenv_or("SHELLKIT_MAX_EXEC_DEPTH");
    if (!depth.empty()) apply_depth(cfg, depth, "SHELLKIT_MAX_EXEC_DEPTH");
}

} // namespace shellkit
