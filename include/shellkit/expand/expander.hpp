/*
 * shellkit Line Expander
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Resolves aliases, variables, custom expanders and @env:/@exec: tokens in
 *   a fixed order:
 *     1. whole-line alias
 *     2. first-word alias (only when 1 did not match)
 *     3. global @name variables
 *     4. scoped @name variables
 *     5. custom expanders, in registration order, until one is terminal
 *     6. token forms: @exec:cmd, @env:NAME, bare variable names
 *   Unresolved tokens pass through unchanged; only a recursion error coming
 *   back from @exec: aborts the expansion.
 */
#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <shellkit/core/var_store.hpp>
#include <shellkit/expand/expand.hpp>

namespace shellkit {

// Returns the rewritten text and true to stop further expansion.
using CustomExpander = std::function<std::pair<std::string, bool>(const std::string& input)>;

class Expander {
public:
    Expander(const AliasTable& aliases, const VariableStore& globals);

    void set_exec(ExecFn exec) { m_exec = std::move(exec); }
    // Registration happens while configuring the engine, before concurrent use.
    void add_custom(CustomExpander fn) { m_custom.push_back(std::move(fn)); }

    Expansion expand(const std::string& line, VariableStore* scope) const;
    // Same without alias substitution; used on individual arguments.
    Expansion expand_variables_only(const std::string& text, VariableStore* scope) const;

    // Steps 1 and 2 only.
    std::string resolve_aliases(const std::string& line) const;
    // Step 6 only.
    Expansion resolve_tokens(const std::string& text, VariableStore* scope) const;

private:
    Expansion expand_impl(std::string text, VariableStore* scope, bool with_aliases) const;
    std::string expand_env_tokens(const std::string& text) const;

    const AliasTable& m_aliases;
    const VariableStore& m_globals;
    ExecFn m_exec;
    std::vector<CustomExpander> m_custom;
};

} // namespace shellkit
