/*
 * shellkit Parse Tree Helpers
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Cloning, comparison and re-quoting of parsed chains.
 */
#include <shellkit/parse/ast.hpp>

namespace shellkit {

std::vector<std::string> ParsedCommand::argv() const {
    std::vector<std::string> out; out.reserve(args.size() + 1);
    out.push_back(name);
    out.insert(out.end(), args.begin(), args.end());
    return out;
}

std::unique_ptr<ParsedCommand> ParsedCommand::clone() const {
    auto c = std::make_unique<ParsedCommand>();
    c->name = name; c->args = args;
    if (next) c->next = next->clone();
    return c;
}

std::size_t Chain::stage_count() const {
    std::size_t n = 0;
    for (const ParsedCommand* s = head.get(); s; s = s->next.get()) ++n;
    return n;
}

std::string quote_word(const std::string& word) {
    if (word.empty()) return "\"\"";
    bool plain = word[0] != '#';
    for (char c : word) {
        if (c==' '||c=='\t'||c=='\n'||c=='\r'||c=='"'||c=='\''||c=='\\'||c=='|'||c==';'||c=='>'||c=='&') { plain = false; break; }
    }
    if (plain) return word;
    std::string out = "\"";
    for (char c : word) {
        if (c=='"' || c=='\\' || c=='$') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string Chain::to_string() const {
    std::string out;
    for (const ParsedCommand* s = head.get(); s; s = s->next.get()) {
        if (s != head.get()) out += " | ";
        out += quote_word(s->name);
        for (auto& a : s->args) { out.push_back(' '); out += quote_word(a); }
    }
    if (!redirect.empty()) { out += append ? " >> " : " > "; out += quote_word(redirect); }
    if (background) out += " &";
    return out;
}

Chain Chain::clone() const {
    Chain c;
    if (head) c.head = head->clone();
    c.redirect = redirect; c.append = append; c.background = background;
    return c;
}

bool operator==(const ParsedCommand& a, const ParsedCommand& b) {
    if (a.name != b.name || a.args != b.args) return false;
    if (!a.next || !b.next) return !a.next && !b.next;
    return *a.next == *b.next;
}

bool operator==(const Chain& a, const Chain& b) {
    if (a.redirect != b.redirect || a.append != b.append || a.background != b.background) return false;
    if (!a.head || !b.head) return !a.head && !b.head;
    return *a.head == *b.head;
}

std::string ParseResult::redirect_target() const {
    for (auto& c : chains) if (!c.redirect.empty()) return c.redirect;
    return "";
}

} // namespace shellkit
