/*
 * shellkit Value Expansion Interface
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Expansion helpers applied to values being assigned to variables:
 *   $((expr)) arithmetic, $(cmd) command substitution through the engine,
 *   $VAR / ${VAR} from the OS environment and @name engine variables. Also
 *   the textual @name substitution shared with line expansion.
 */
#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <shellkit/core/error.hpp>
#include <shellkit/core/var_store.hpp>

namespace shellkit {

// Re-entry point into the engine for @exec: and $(cmd).
using ExecFn = std::function<ExecResult(const std::string& line, VariableStore* scope)>;

struct Expansion {
    std::string text;
    Status error; // only set when recursion aborted the expansion
};

std::string getenv_or(const std::string& key, const std::string& def = "");

// Strips one pair of matching surrounding quotes.
std::string strip_quotes(const std::string& s);
std::string trim_trailing_space(std::string s);

// Replaces every occurrence of every key, longer keys first so that "@xy"
// wins over "@x". Substitution is textual, not word-boundary aware.
std::string substitute_variables(std::string text, std::vector<VariableStore::Entry> entries);

// $VAR and ${VAR}; unset variables expand to the empty string.
std::string expand_env_vars(const std::string& in);

// Resolves "name" (or "@name") against globals then scope; nullopt when unknown.
std::optional<std::string> lookup_variable(const std::string& name, const VariableStore& globals, const VariableStore* scope);

// $((expr)) with nested parentheses; identifiers resolve to variable values
// and anything malformed evaluates to 0.
std::string expand_arithmetic(const std::string& in, const VariableStore& globals, const VariableStore* scope);

// $(cmd) through exec, trailing whitespace trimmed. A failing command leaves
// the text unchanged; only recursion errors abort.
Expansion expand_command_substitution(const std::string& in, const ExecFn& exec, VariableStore* scope);

// Full pipeline used by let: quotes, arithmetic, command substitution,
// environment, then @name variables.
Expansion expand_value(const std::string& value, const VariableStore& globals, VariableStore* scope, const ExecFn& exec);

} // namespace shellkit
