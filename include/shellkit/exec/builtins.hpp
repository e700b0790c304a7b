/*
 * Built-in commands - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace shellkit {

class Engine;

// Registers every group below.
void register_builtins(Engine& engine);

// print/echo, grep, cat, tee, sleep, date, env, help
void register_core_builtins(Engine& engine);
// let, unset, vars, inc, dec
void register_variable_builtins(Engine& engine);
// alias add|delete|print|save|load
void register_alias_builtins(Engine& engine);
// jobs, job, killall, jobclean, spawn, osexec, run
void register_job_builtins(Engine& engine);

// \n \t \r \\ escapes as understood by print.
std::string interpret_escapes(const std::string& s);
std::optional<long long> parse_integer(const std::string& s);
// Lines of text without their terminators; a trailing newline adds no line.
std::vector<std::string> split_lines(const std::string& text);
std::string join_words(const std::vector<std::string>& words, std::size_t from = 0);

} // namespace shellkit
