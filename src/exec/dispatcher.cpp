/*
 * Command dispatcher implementation - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellkit/exec/dispatcher.hpp>
#include <shellkit/core/log.hpp>
#include <algorithm>
#include <exception>
#include <sstream>

namespace shellkit {

Command::Command(std::string name, std::string summary, Handler handler)
    : m_name(std::move(name)), m_summary(std::move(summary)), m_handler(std::move(handler)) {}

Command& Command::add(std::string name, std::string summary, Handler handler) {
    if (m_children.count(name)) log_debug("replacing command '" + name + "'");
    auto node = std::make_unique<Command>(name, std::move(summary), std::move(handler));
    Command& ref = *node;
    m_children[name] = std::move(node);
    return ref;
}

Command& Command::alias(std::string other) {
    m_aliases.push_back(std::move(other));
    return *this;
}

bool Command::matches(const std::string& word) const {
    if (word == m_name) return true;
    return std::find(m_aliases.begin(), m_aliases.end(), word) != m_aliases.end();
}

const Command* Command::find(const std::string& word) const {
    auto it = m_children.find(word);
    if (it != m_children.end()) return it->second.get();
    for (auto& kv : m_children) if (kv.second->matches(word)) return kv.second.get();
    return nullptr;
}

std::vector<const Command*> Command::children() const {
    std::vector<const Command*> out;
    for (auto& kv : m_children) out.push_back(kv.second.get());
    return out;
}

std::string Command::usage(const std::string& path) const {
    std::ostringstream os;
    os << "Usage: " << path << " <command>\n";
    if (!m_summary.empty()) os << m_summary << "\n";
    os << "Available commands:\n";
    std::size_t width = 0;
    for (auto* c : children()) width = std::max(width, c->name().size());
    for (auto* c : children()) {
        os << "  " << c->name() << std::string(width - c->name().size() + 2, ' ') << c->summary() << "\n";
    }
    return os.str();
}

Dispatcher::Dispatcher() : m_root("", "") {}

Command& Dispatcher::add(std::string name, std::string summary, Handler handler) {
    return m_root.add(std::move(name), std::move(summary), std::move(handler));
}

Resolution Dispatcher::resolve(const std::vector<std::string>& argv) const {
    Resolution res;
    const Command* node = &m_root;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        const Command* next = node->find(argv[i]);
        if (!next) break;
        node = next;
        if (!res.path.empty()) res.path.push_back(' ');
        res.path += node->name();
        res.consumed = i + 1;
    }
    if (node != &m_root) res.command = node;
    return res;
}

Status Dispatcher::invoke(const std::vector<std::string>& argv, const std::string* input, std::ostream& out,
                          const Context& ctx, VariableStore* scope) const {
    if (argv.empty()) return make_error(ErrorKind::Dispatch, "empty command");
    Resolution r = resolve(argv);
    if (!r.command) return make_error(ErrorKind::Dispatch, "unknown command: " + argv[0]);
    Invocation inv{r.path, std::vector<std::string>(argv.begin() + static_cast<std::ptrdiff_t>(r.consumed), argv.end()),
                   input, out, ctx, scope};
    if (!r.command->handler()) {
        if (!inv.args.empty())
            return make_error(ErrorKind::Dispatch, "unknown subcommand '" + inv.args[0] + "' for '" + r.path + "'");
        out << r.command->usage(r.path);
        return std::nullopt;
    }
    try {
        return r.command->handler()(inv);
    } catch (const std::exception& e) {
        log_debug(r.path + " threw: " + e.what());
        return make_error(ErrorKind::Dispatch, r.path + ": " + e.what());
    } catch (...) {
        log_debug(r.path + " threw a non-standard exception");
        return make_error(ErrorKind::Dispatch, r.path + ": unknown exception");
    }
}

static void collect_names(const Command& node, const std::string& prefix, std::vector<std::string>& out) {
    for (auto* c : node.children()) {
        std::string path = prefix.empty() ? c->name() : prefix + " " + c->name();
        out.push_back(path);
        collect_names(*c, path, out);
    }
}

std::vector<std::string> Dispatcher::names() const {
    std::vector<std::string> out;
    collect_names(m_root, "", out);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace shellkit
