/*
 * PATH resolution utilities - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>
#include <vector>

namespace shellkit {

// Splits a PATH-style list; empty entries are dropped.
std::vector<std::string> split_search_path(const std::string& path_list);

// Absolute path of an executable program. Names containing '/' are checked
// as given; bare names are searched in search_path (PATH when omitted).
std::optional<std::string> resolve_executable(const std::string& program,
                                              const std::optional<std::string>& search_path = std::nullopt);

} // namespace shellkit
