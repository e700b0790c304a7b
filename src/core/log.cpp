/*
 * Diagnostics logging implementation - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellkit/core/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace shellkit {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};
static std::mutex g_log_mutex;

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }
LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }
bool log_enabled(LogLevel level) { return static_cast<int>(level) <= g_level.load(); }

std::optional<LogLevel> parse_log_level(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (v == "error") return LogLevel::Error;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "info") return LogLevel::Info;
    if (v == "debug") return LogLevel::Debug;
    return std::nullopt;
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
    }
    return "?";
}

void log_message(LogLevel level, const std::string& msg) {
    if (!log_enabled(level)) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[shellkit] " << to_string(level) << ": " << msg << '\n';
}

} // namespace shellkit
