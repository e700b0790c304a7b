/*
 * Diagnostics logging - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Minimal leveled logger writing "[shellkit] <level>: message" lines to
 *   std::cerr. Lines from concurrent callers are serialized.
 */
#pragma once
#include <string>
#include <optional>

namespace shellkit {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);
// Accepts error|warn|warning|info|debug (case-insensitive).
std::optional<LogLevel> parse_log_level(const std::string& s);
const char* to_string(LogLevel level);

void log_message(LogLevel level, const std::string& msg);

inline void log_error(const std::string& msg) { log_message(LogLevel::Error, msg); }
inline void log_warn(const std::string& msg) { log_message(LogLevel::Warn, msg); }
inline void log_info(const std::string& msg) { log_message(LogLevel::Info, msg); }
inline void log_debug(const std::string& msg) { log_message(LogLevel::Debug, msg); }

} // namespace shellkit
