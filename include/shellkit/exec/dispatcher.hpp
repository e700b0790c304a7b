/*
 * Command dispatcher - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Name-addressed tree of verbs. Commands are registered explicitly while
 *   the engine is configured; lookups walk the tree by argument words
 *   ("alias add x y" resolves to the "alias add" node with args {x, y}).
 *   The tree is not mutated once execution starts.
 */
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <shellkit/core/context.hpp>
#include <shellkit/core/error.hpp>
#include <shellkit/core/var_store.hpp>

namespace shellkit {

struct Invocation {
    std::string path;                     // resolved command path, e.g. "alias add"
    std::vector<std::string> args;        // words following the path
    const std::string* input = nullptr;   // previous stage output; nullptr for stage 1
    std::ostream& out;                    // captures both output and error text
    Context ctx;
    VariableStore* scope = nullptr;

    bool has_input() const { return input != nullptr; }
};

using Handler = std::function<Status(Invocation&)>;

class Command {
public:
    Command(std::string name, std::string summary, Handler handler = {});

    // Registers (or replaces) a subcommand and returns it.
    Command& add(std::string name, std::string summary, Handler handler = {});
    // Alternate name, e.g. "echo" for "print". Returns *this for chaining.
    Command& alias(std::string other);

    const std::string& name() const { return m_name; }
    const std::string& summary() const { return m_summary; }
    const Handler& handler() const { return m_handler; }
    const std::vector<std::string>& aliases() const { return m_aliases; }
    bool matches(const std::string& word) const;

    const Command* find(const std::string& word) const;
    std::vector<const Command*> children() const; // sorted by name
    bool has_children() const { return !m_children.empty(); }

    // Help text listing the subcommands.
    std::string usage(const std::string& path) const;

private:
    std::string m_name;
    std::string m_summary;
    Handler m_handler;
    std::vector<std::string> m_aliases;
    std::map<std::string, std::unique_ptr<Command>> m_children;
};

struct Resolution {
    const Command* command = nullptr;
    std::string path;
    std::size_t consumed = 0; // argv words used by the path
};

class Dispatcher {
public:
    Dispatcher();

    Command& add(std::string name, std::string summary, Handler handler = {});

    // Longest command path matching the leading argv words.
    Resolution resolve(const std::vector<std::string>& argv) const;
    bool has(const std::string& name) const { return m_root.find(name) != nullptr; }

    // Looks up argv and runs the handler. Unknown verbs and handler
    // exceptions come back as Dispatch errors.
    Status invoke(const std::vector<std::string>& argv, const std::string* input, std::ostream& out,
                  const Context& ctx, VariableStore* scope) const;

    // Every command path (top-level and nested), sorted.
    std::vector<std::string> names() const;
    const Command& root() const { return m_root; }

private:
    Command m_root;
};

} // namespace shellkit
