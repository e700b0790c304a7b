/*
 * Built-in commands implementation - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellkit/exec/builtins.hpp>
#include <shellkit/exec/engine.hpp>
#include <shellkit/exec/pipeline.hpp>
#include <shellkit/expand/expand.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

extern char** environ;

namespace shellkit {

std::string interpret_escapes(const std::string& s) {
    std::string out; out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            char n = s[i+1];
            if (n == 'n') { out.push_back('\n'); ++i; continue; }
            if (n == 't') { out.push_back('\t'); ++i; continue; }
            if (n == 'r') { out.push_back('\r'); ++i; continue; }
            if (n == '\\') { out.push_back('\\'); ++i; continue; }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::optional<long long> parse_integer(const std::string& s) {
    std::size_t start = (!s.empty() && s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return std::nullopt;
    long long v = 0;
    auto res = std::from_chars(s.data() + start, s.data() + s.size(), v);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t nl = text.find('\n', start);
        if (nl == std::string::npos) { lines.push_back(text.substr(start)); break; }
        std::string line = text.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
        start = nl + 1;
    }
    return lines;
}

std::string join_words(const std::vector<std::string>& words, std::size_t from) {
    std::string out;
    for (std::size_t i = from; i < words.size(); ++i) {
        if (i > from) out.push_back(' ');
        out += words[i];
    }
    return out;
}

static Error usage_error(const std::string& usage) {
    return make_error(ErrorKind::Dispatch, "usage: " + usage);
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

// ---- core verbs ----

static Status do_print(Invocation& inv) {
    inv.out << interpret_escapes(join_words(inv.args)) << '\n';
    return std::nullopt;
}

static Status do_grep(Invocation& inv) {
    bool invert = false, icase = false, regex = false;
    std::size_t i = 0;
    for (; i < inv.args.size() && inv.args[i].size() > 1 && inv.args[i][0] == '-'; ++i) {
        const std::string& f = inv.args[i];
        if (f == "--") { ++i; break; }
        for (std::size_t k = 1; k < f.size(); ++k) {
            if (f[k] == 'v') invert = true;
            else if (f[k] == 'i') icase = true;
            else if (f[k] == 'E') regex = true;
            else return make_error(ErrorKind::Dispatch, "grep: unknown flag -" + std::string(1, f[k]));
        }
    }
    if (i >= inv.args.size()) return usage_error("grep [-v] [-i] [-E] pattern");
    const std::string pattern = inv.args[i];
    if (!inv.has_input()) return std::nullopt;

    std::regex re;
    if (regex) {
        try {
            re = std::regex(pattern, icase ? std::regex::ECMAScript | std::regex::icase : std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return make_error(ErrorKind::Dispatch, "grep: invalid pattern '" + pattern + "': " + e.what());
        }
    }
    const std::string needle = icase ? lower(pattern) : pattern;
    for (auto& line : split_lines(*inv.input)) {
        bool matched = regex ? std::regex_search(line, re)
                             : (icase ? lower(line) : line).find(needle) != std::string::npos;
        if (matched != invert) inv.out << line << '\n';
    }
    return std::nullopt;
}

static Status do_cat(Engine& engine, Invocation& inv) {
    if (inv.args.empty()) {
        if (inv.has_input()) inv.out << *inv.input;
        return std::nullopt;
    }
    for (auto& path : inv.args) {
        std::string content;
        if (auto err = engine.files().read_file(path, content)) return err;
        inv.out << content;
    }
    return std::nullopt;
}

static Status do_tee(Engine& engine, Invocation& inv) {
    bool append = false;
    std::vector<std::string> files;
    for (auto& a : inv.args) {
        if (a == "-a") append = true;
        else files.push_back(a);
    }
    const std::string data = inv.has_input() ? *inv.input : std::string();
    for (auto& f : files) {
        if (auto err = engine.files().write_file(f, data, append ? RedirType::OutAppend : RedirType::Out)) return err;
    }
    inv.out << data;
    return std::nullopt;
}

static Status do_sleep(Invocation& inv) {
    if (inv.args.size() != 1) return usage_error("sleep seconds");
    char* end = nullptr;
    double secs = std::strtod(inv.args[0].c_str(), &end);
    if (end == inv.args[0].c_str() || *end != '\0' || secs < 0)
        return make_error(ErrorKind::Dispatch, "sleep: invalid duration '" + inv.args[0] + "'");
    auto d = std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(secs));
    if (inv.ctx.wait_for(d)) return cancelled_error(inv.ctx);
    return std::nullopt;
}

static Status do_date(Invocation& inv) {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    inv.out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S%z") << '\n';
    return std::nullopt;
}

static Status do_env(Invocation& inv) {
    if (!inv.args.empty()) {
        for (auto& name : inv.args) {
            const char* v = std::getenv(name.c_str());
            if (!v) return make_error(ErrorKind::Dispatch, "env: " + name + " is not set");
            inv.out << v << '\n';
        }
        return std::nullopt;
    }
    std::vector<std::string> vars;
    for (char** e = environ; e && *e; ++e) vars.emplace_back(*e);
    std::sort(vars.begin(), vars.end());
    for (auto& v : vars) inv.out << v << '\n';
    return std::nullopt;
}

static Status do_help(Engine& engine, Invocation& inv) {
    const Dispatcher& d = engine.dispatcher();
    if (!inv.args.empty()) {
        Resolution r = d.resolve(inv.args);
        if (!r.command) return make_error(ErrorKind::Dispatch, "help: unknown command: " + inv.args[0]);
        if (r.command->has_children()) inv.out << r.command->usage(r.path);
        else inv.out << r.path << " - " << r.command->summary() << '\n';
        return std::nullopt;
    }
    inv.out << "Available commands:\n";
    std::size_t width = 0;
    for (auto* c : d.root().children()) width = std::max(width, c->name().size());
    for (auto* c : d.root().children()) {
        inv.out << "  " << c->name() << std::string(width - c->name().size() + 2, ' ') << c->summary();
        if (!c->aliases().empty()) inv.out << " (aliases: " << join_words(c->aliases()) << ")";
        inv.out << '\n';
    }
    return std::nullopt;
}

void register_core_builtins(Engine& engine) {
    Dispatcher& d = engine.dispatcher();
    d.add("print", "Print arguments joined by spaces (\\n and \\t are interpreted)", do_print).alias("echo");
    d.add("grep", "Filter input lines: grep [-v] [-i] [-E] pattern", do_grep);
    d.add("cat", "Print files, or the piped input", [&engine](Invocation& inv){ return do_cat(engine, inv); });
    d.add("tee", "Copy the piped input to files and to the output: tee [-a] file...",
          [&engine](Invocation& inv){ return do_tee(engine, inv); });
    d.add("sleep", "Wait for the given number of seconds (cancellable)", do_sleep);
    d.add("date", "Print the local time (RFC 3339)", do_date);
    d.add("env", "Print the environment, or the named variables", do_env);
    d.add("help", "List commands, or describe one", [&engine](Invocation& inv){ return do_help(engine, inv); });
}

// ---- variables ----

static bool valid_var_name(const std::string& name) {
    if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c){ return std::isalnum(c) || c == '_'; });
}

static std::string display_name(const std::string& key) { return key.size() > 1 && key[0] == '@' ? key.substr(1) : key; }

// "x=$(print" "hi)" -> one assignment: words without '=' continue the
// previous value.
static std::vector<std::string> group_assignments(const std::vector<std::string>& words) {
    std::vector<std::string> out;
    for (auto& w : words) {
        if (w.find('=') != std::string::npos || out.empty()) out.push_back(w);
        else out.back() += " " + w;
    }
    return out;
}

static Status do_let(Engine& engine, Invocation& inv) {
    std::vector<std::string> words = inv.args;
    bool scoped = false;
    if (!words.empty() && (words[0] == "-s" || words[0] == "--scope")) { scoped = true; words.erase(words.begin()); }
    if (words.empty()) return usage_error("let [-s] name=value...");
    if (scoped && !inv.scope) return make_error(ErrorKind::Dispatch, "let: no scope for this call");
    Status result;
    for (auto& a : group_assignments(words)) {
        auto eq = a.find('=');
        std::string name = eq == std::string::npos ? "" : a.substr(0, eq);
        if (!name.empty() && name[0] == '@') name.erase(0, 1);
        if (eq == std::string::npos || !valid_var_name(name)) {
            inv.out << "Invalid assignment: " << a << " (expected name=value)\n";
            result = make_error(ErrorKind::Dispatch, "let: invalid assignment '" + a + "'");
            continue;
        }
        Expansion v = engine.expand_value(a.substr(eq + 1), inv.scope);
        if (v.error) return v.error;
        if (scoped) inv.scope->set(variable_key(name), v.text);
        else engine.set_variable(name, v.text);
        inv.out << name << " = " << v.text << '\n';
    }
    return result;
}

static Status do_unset(Engine& engine, Invocation& inv) {
    std::vector<std::string> names = inv.args;
    bool scoped = false;
    if (!names.empty() && (names[0] == "-s" || names[0] == "--scope")) { scoped = true; names.erase(names.begin()); }
    if (names.empty()) return usage_error("unset [-s] name...");
    for (auto& n : names) {
        std::string name = display_name(n);
        bool removed = scoped ? (inv.scope && inv.scope->erase(variable_key(name))) : engine.unset_variable(name);
        if (removed) inv.out << "Removed variable: " << name << '\n';
        else inv.out << "Variable not found: " << name << '\n';
    }
    return std::nullopt;
}

static std::string json_escape(const std::string& s) {
    std::ostringstream os;
    for (unsigned char c : s) {
        switch (c) {
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (c < 0x20) os << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                else os << c;
        }
    }
    return os.str();
}

static Status do_vars(Engine& engine, Invocation& inv) {
    bool json = false, exp = false;
    for (auto& a : inv.args) {
        if (a == "--json") json = true;
        else if (a == "--export") exp = true;
        else return usage_error("vars [--json | --export]");
    }
    std::vector<VariableStore::Entry> vars;
    for (auto& kv : engine.variables().sorted_snapshot()) {
        const std::string& k = kv.first;
        if (k.size() < 2 || k[0] != '@' || k.rfind("@arg", 0) == 0) continue;
        vars.emplace_back(k.substr(1), kv.second);
    }
    if (json) {
        inv.out << "{";
        for (std::size_t i = 0; i < vars.size(); ++i) {
            inv.out << (i ? ",\n  " : "\n  ") << '"' << json_escape(vars[i].first) << "\": \"" << json_escape(vars[i].second) << '"';
        }
        inv.out << (vars.empty() ? "}\n" : "\n}\n");
        return std::nullopt;
    }
    if (exp) {
        inv.out << "# Variable export\n";
        for (auto& kv : vars) {
            std::string name = kv.first;
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
            std::string value;
            for (char c : kv.second) { if (c == '"' || c == '\\' || c == '$') value.push_back('\\'); value.push_back(c); }
            inv.out << "export " << name << "=\"" << value << "\"\n";
        }
        return std::nullopt;
    }
    if (vars.empty()) { inv.out << "No variables set\n"; return std::nullopt; }
    inv.out << "Variables:\n" << std::string(60, '-') << '\n';
    for (auto& kv : vars) {
        std::string v = kv.second.size() > 50 ? kv.second.substr(0, 47) + "..." : kv.second;
        inv.out << std::left << std::setw(20) << kv.first << " = " << v << '\n';
    }
    return std::nullopt;
}

static Status adjust_variable(Engine& engine, Invocation& inv, int sign) {
    const char* verb = sign > 0 ? "inc" : "dec";
    if (inv.args.empty() || inv.args.size() > 2) return usage_error(std::string(verb) + " name [amount]");
    std::string name = display_name(inv.args[0]);
    long long amount = 1;
    if (inv.args.size() == 2) {
        auto a = parse_integer(inv.args[1]);
        if (!a) return make_error(ErrorKind::Dispatch, std::string(verb) + ": invalid amount: " + inv.args[1] + " (must be integer)");
        amount = *a;
    }
    std::optional<std::string> bad;
    bool overflow = false;
    std::string next = engine.variables().update(variable_key(name), [&](const std::optional<std::string>& cur) {
        auto v = parse_integer(cur.value_or("0"));
        if (!v) { bad = *cur; return *cur; }
        long long result = 0;
        overflow = sign > 0 ? __builtin_add_overflow(*v, amount, &result) : __builtin_sub_overflow(*v, amount, &result);
        if (overflow) return cur.value_or("0");
        return std::to_string(result);
    });
    if (bad) return make_error(ErrorKind::Dispatch, std::string(verb) + ": variable " + name + " is not numeric: " + *bad);
    if (overflow) return make_error(ErrorKind::Dispatch, std::string(verb) + ": result out of range for " + name);
    inv.out << name << " = " << next << '\n';
    return std::nullopt;
}

void register_variable_builtins(Engine& engine) {
    Dispatcher& d = engine.dispatcher();
    d.add("let", "Set variables: let [-s] name=value... ($((expr)), $(cmd), $VAR and @var are expanded)",
          [&engine](Invocation& inv){ return do_let(engine, inv); });
    d.add("unset", "Remove variables: unset [-s] name...", [&engine](Invocation& inv){ return do_unset(engine, inv); });
    d.add("vars", "List variables: vars [--json | --export]", [&engine](Invocation& inv){ return do_vars(engine, inv); });
    d.add("inc", "Increment a numeric variable: inc name [amount]", [&engine](Invocation& inv){ return adjust_variable(engine, inv, 1); });
    d.add("dec", "Decrement a numeric variable: dec name [amount]", [&engine](Invocation& inv){ return adjust_variable(engine, inv, -1); });
}

// ---- aliases ----

void register_alias_builtins(Engine& engine) {
    Command& alias = engine.dispatcher().add("alias", "Manage aliases");
    alias.add("add", "Add an alias: alias add name expansion...", [&engine](Invocation& inv) -> Status {
        if (inv.args.size() < 2) return usage_error("alias add name expansion");
        std::string expansion = join_words(inv.args, 1);
        engine.aliases().set(inv.args[0], expansion);
        inv.out << "Setting alias, `" << inv.args[0] << "` command: `" << expansion << "`\n";
        return std::nullopt;
    }).alias("a");
    alias.add("delete", "Delete an alias: alias delete name", [&engine](Invocation& inv) -> Status {
        if (inv.args.size() != 1) return usage_error("alias delete name");
        if (!engine.aliases().erase(inv.args[0]))
            return make_error(ErrorKind::Dispatch, "alias `" + inv.args[0] + "` not found");
        inv.out << "removing alias `" << inv.args[0] << "`\n";
        return std::nullopt;
    }).alias("del");
    alias.add("print", "Print one alias, or all of them", [&engine](Invocation& inv) -> Status {
        if (inv.args.size() > 1) return usage_error("alias print [name]");
        if (inv.args.size() == 1) {
            auto v = engine.aliases().get(inv.args[0]);
            if (!v) return make_error(ErrorKind::Dispatch, "alias `" + inv.args[0] + "` not found");
            inv.out << inv.args[0] << '=' << *v << '\n';
            return std::nullopt;
        }
        auto all = engine.aliases().sorted_snapshot();
        if (all.empty()) { inv.out << "No aliases defined\n"; return std::nullopt; }
        inv.out << "Aliases:\n" << std::string(40, '-') << '\n';
        for (auto& kv : all) inv.out << kv.first << '=' << kv.second << '\n';
        return std::nullopt;
    }).alias("p").alias("list").alias("ls");
    alias.add("save", "Save aliases to the aliases file: alias save [path]", [&engine](Invocation& inv) -> Status {
        if (inv.args.size() > 1) return usage_error("alias save [path]");
        std::string path = inv.args.empty() ? default_aliases_path(engine.config()) : inv.args[0];
        if (auto err = engine.save_aliases(path)) return err;
        inv.out << "Saved " << engine.aliases().size() << " alias(es) to " << path << '\n';
        return std::nullopt;
    }).alias("s");
    alias.add("load", "Load aliases from the aliases file: alias load [path]", [&engine](Invocation& inv) -> Status {
        if (inv.args.size() > 1) return usage_error("alias load [path]");
        std::string path = inv.args.empty() ? default_aliases_path(engine.config()) : inv.args[0];
        if (auto err = engine.load_aliases(path)) return err;
        inv.out << "Loaded aliases from " << path << '\n';
        return std::nullopt;
    });
}

void register_builtins(Engine& engine) {
    register_core_builtins(engine);
    register_variable_builtins(engine);
    register_alias_builtins(engine);
    register_job_builtins(engine);
}

} // namespace shellkit
