/*
 * shellkit Value Expansion Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 * Description: Implements $((..)), $(..), $VAR, ${VAR} and @name value expansion.
 */
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <shellkit/core/log.hpp>
#include <shellkit/expand/arith.hpp>
#include <shellkit/expand/expand.hpp>

namespace shellkit {

std::string getenv_or(const std::string& key, const std::string& def) {
    const char* v = std::getenv(key.c_str());
    return v ? std::string(v) : def;
}

static bool is_name_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
static bool is_name_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

std::string strip_quotes(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front())
        return s.substr(1, s.size() - 2);
    return s;
}

std::string trim_trailing_space(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

std::string substitute_variables(std::string text, std::vector<VariableStore::Entry> entries) {
    std::sort(entries.begin(), entries.end(), [](const VariableStore::Entry& a, const VariableStore::Entry& b){
        if (a.first.size() != b.first.size()) return a.first.size() > b.first.size();
        return a.first < b.first;
    });
    for (auto& kv : entries) {
        const std::string& key = kv.first;
        if (key.empty()) continue;
        std::size_t pos = 0;
        while ((pos = text.find(key, pos)) != std::string::npos) {
            text.replace(pos, key.size(), kv.second);
            pos += kv.second.size();
        }
    }
    return text;
}

std::string expand_env_vars(const std::string& in) {
    std::string out; out.reserve(in.size());
    for (size_t i=0;i<in.size();) {
        if (in[i]=='$') {
            if (i+1 < in.size() && in[i+1]=='{') {
                size_t end = in.find('}', i+2);
                if (end != std::string::npos) {
                    out += getenv_or(in.substr(i+2, end-(i+2)));
                    i = end+1; continue;
                }
            }
            size_t j=i+1;
            if (j < in.size() && is_name_start(in[j])) {
                ++j; while (j<in.size() && is_name_char(in[j])) ++j;
                out += getenv_or(in.substr(i+1, j-(i+1)));
                i=j; continue;
            }
        }
        out.push_back(in[i++]);
    }
    return out;
}

std::optional<std::string> lookup_variable(const std::string& name, const VariableStore& globals, const VariableStore* scope) {
    std::string key = (!name.empty() && name[0] == '@') ? name : "@" + name;
    if (auto v = globals.get(key)) return v;
    if (scope) if (auto v = scope->get(key)) return v;
    return std::nullopt;
}

// Index of the ')' matching the '(' at open, or npos.
static size_t matching_paren(const std::string& s, size_t open) {
    int depth = 0;
    for (size_t k = open; k < s.size(); ++k) {
        if (s[k] == '(') ++depth;
        else if (s[k] == ')') { if (--depth == 0) return k; }
    }
    return std::string::npos;
}

static std::string resolve_identifiers(const std::string& expr, const VariableStore& globals, const VariableStore* scope) {
    std::string out;
    for (size_t i = 0; i < expr.size();) {
        bool at = expr[i] == '@' && i + 1 < expr.size() && is_name_start(expr[i+1]);
        if (at || is_name_start(expr[i])) {
            size_t j = at ? i + 1 : i;
            size_t start = j;
            while (j < expr.size() && is_name_char(expr[j])) ++j;
            std::string name = expr.substr(start, j - start);
            auto v = lookup_variable(name, globals, scope);
            out += v ? *v : name; // unknown names make the expression malformed
            i = j; continue;
        }
        out.push_back(expr[i++]);
    }
    return out;
}

std::string expand_arithmetic(const std::string& in, const VariableStore& globals, const VariableStore* scope) {
    std::string out;
    size_t i = 0;
    while (i < in.size()) {
        if (in.compare(i, 3, "$((") == 0) {
            size_t close = matching_paren(in, i + 1);
            if (close != std::string::npos && close > i + 3 && in[close-1] == ')') {
                std::string expr = in.substr(i + 3, close - 1 - (i + 3));
                auto value = evaluate_arithmetic(resolve_identifiers(expr, globals, scope));
                if (!value) log_debug("arithmetic: malformed expression '" + expr + "', using 0");
                out += std::to_string(value ? *value : 0);
                i = close + 1; continue;
            }
        }
        out.push_back(in[i++]);
    }
    return out;
}

Expansion expand_command_substitution(const std::string& in, const ExecFn& exec, VariableStore* scope) {
    Expansion res;
    size_t i = 0;
    while (i < in.size()) {
        if (in.compare(i, 2, "$(") == 0 && in.compare(i, 3, "$((") != 0) {
            size_t close = matching_paren(in, i + 1);
            if (close != std::string::npos && exec) {
                std::string cmd = in.substr(i + 2, close - (i + 2));
                ExecResult r = exec(cmd, scope);
                if (r.error) {
                    if (r.error->kind == ErrorKind::RecursionExceeded) { res.error = r.error; return res; }
                    log_debug("command substitution '" + cmd + "' failed: " + r.error->message);
                    res.text += in.substr(i, close + 1 - i);
                } else {
                    res.text += trim_trailing_space(r.output);
                }
                i = close + 1; continue;
            }
        }
        res.text.push_back(in[i++]);
    }
    return res;
}

Expansion expand_value(const std::string& value, const VariableStore& globals, VariableStore* scope, const ExecFn& exec) {
    std::string v = strip_quotes(value);
    v = expand_arithmetic(v, globals, scope);
    Expansion res = expand_command_substitution(v, exec, scope);
    if (res.error) return res;
    res.text = expand_env_vars(res.text);
    res.text = substitute_variables(res.text, globals.snapshot());
    if (scope) res.text = substitute_variables(res.text, scope->snapshot());
    return res;
}

} // namespace shellkit
