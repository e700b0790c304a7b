/*
 * shellkit Line Expander Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cctype>
#include <cstdlib>
#include <shellkit/core/log.hpp>
#include <shellkit/expand/expander.hpp>

namespace shellkit {

static const char* kExecPrefix = "@exec:";
static const char* kEnvPrefix = "@env:";

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static std::string trim_trailing_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

Expander::Expander(const AliasTable& aliases, const VariableStore& globals)
    : m_aliases(aliases), m_globals(globals) {}

std::string Expander::resolve_aliases(const std::string& line) const {
    if (auto exact = m_aliases.get(line)) return *exact;
    auto cut = line.find_first_of(" \t|>;&\n");
    if (cut == std::string::npos) return line; // whole line already tried
    std::string first = line.substr(0, cut);
    if (first.empty()) return line;
    if (auto repl = m_aliases.get(first)) return *repl + line.substr(cut);
    return line;
}

std::string Expander::expand_env_tokens(const std::string& text) const {
    std::string out;
    const std::size_t plen = std::char_traits<char>::length(kEnvPrefix);
    std::size_t i = 0;
    while (i < text.size()) {
        if (text.compare(i, plen, kEnvPrefix) == 0) {
            std::size_t j = i + plen;
            while (j < text.size() && (std::isalnum(static_cast<unsigned char>(text[j])) || text[j] == '_')) ++j;
            std::string name = text.substr(i + plen, j - i - plen);
            const char* v = name.empty() ? nullptr : std::getenv(name.c_str());
            if (v) out += v;
            else out += text.substr(i, j - i); // unset: token stays as written
            i = j; continue;
        }
        out.push_back(text[i++]);
    }
    return out;
}

Expansion Expander::resolve_tokens(const std::string& text, VariableStore* scope) const {
    Expansion res;
    if (text.rfind(kExecPrefix, 0) == 0) {
        std::string cmd = text.substr(std::char_traits<char>::length(kExecPrefix));
        if (!m_exec) { res.text = text; return res; }
        ExecResult r = m_exec(cmd, scope);
        if (r.error) {
            if (r.error->kind == ErrorKind::RecursionExceeded) { res.error = r.error; return res; }
            log_debug("@exec:" + cmd + " failed: " + r.error->message);
        }
        res.text = trim_trailing_newlines(r.output);
        return res;
    }
    if (text.find(kEnvPrefix) != std::string::npos) {
        res.text = expand_env_tokens(text);
        return res;
    }
    if (auto v = m_globals.get(text)) { res.text = *v; return res; }
    if (scope) if (auto v = scope->get(text)) { res.text = *v; return res; }
    res.text = text;
    return res;
}

Expansion Expander::expand_impl(std::string text, VariableStore* scope, bool with_aliases) const {
    if (with_aliases) text = resolve_aliases(text);
    text = substitute_variables(std::move(text), m_globals.snapshot());
    if (scope) text = substitute_variables(std::move(text), scope->snapshot());
    for (auto& fn : m_custom) {
        auto r = fn(text);
        text = std::move(r.first);
        if (r.second) return Expansion{text, std::nullopt};
    }
    return resolve_tokens(text, scope);
}

Expansion Expander::expand(const std::string& line, VariableStore* scope) const {
    return expand_impl(trim(line), scope, true);
}

Expansion Expander::expand_variables_only(const std::string& text, VariableStore* scope) const {
    return expand_impl(text, scope, false);
}

} // namespace shellkit
