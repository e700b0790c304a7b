/*
 * Engine configuration - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Engine knobs and the ~/.shellkitrc loader (key=value lines, '#' comments).
 */
#pragma once
#include <chrono>
#include <string>
#include <shellkit/core/log.hpp>

namespace shellkit {

struct EngineConfig {
    int max_exec_depth = 10;                      // recursion ceiling for nested execute calls
    LogLevel log_level = LogLevel::Warn;
    std::chrono::milliseconds kill_grace{5000};   // how long kill waits for a job to observe cancellation
    std::string aliases_file;                     // alias save/load target; empty = ~/.shellkit_aliases
    std::string app_name = "shellkit";
};

// $HOME/.shellkitrc, or empty when HOME is unset.
std::string default_config_path();
std::string default_aliases_path(const EngineConfig& cfg);

// Returns false when the file cannot be opened; cfg is left untouched then.
bool load_config(const std::string& path, EngineConfig& cfg);

// SHELLKIT_LOG_LEVEL and SHELLKIT_MAX_EXEC_DEPTH override file values.
void apply_env_overrides(EngineConfig& cfg);

} // namespace shellkit
