/*
 * shellkit Parser Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for the grammar.
 */
#include <shellkit/parse/ast.hpp>
#include <shellkit/parse/parser.hpp>
#include <shellkit/lex/lexer.hpp>

namespace shellkit {

namespace {

class Parser {
public:
    explicit Parser(const TokenStream& ts) : m_ts(ts) {}

    ParseResult parse_list() {
        ParseResult res;
        while (true) {
            while (peek().kind == TokenKind::Newline) get();
            if (eof()) break;
            if (peek().kind == TokenKind::Semi) { res.error = fail("missing command before ';'"); break; }
            Chain chain;
            if (auto err = parse_chain(chain)) { res.error = err; break; }
            res.chains.push_back(std::move(chain));
            auto k = peek().kind;
            if (k == TokenKind::Semi || k == TokenKind::Newline) { get(); continue; }
            if (k == TokenKind::Eof) break;
            res.error = unexpected(peek());
            break;
        }
        if (res.error) res.chains.clear();
        return res;
    }

private:
    const Token& peek() const { return m_ts[m_index]; }
    bool eof() const { return peek().kind == TokenKind::Eof; }
    const Token& get() { const Token& t = m_ts[m_index]; if (m_index + 1 < m_ts.size()) ++m_index; return t; }

    static Error fail(const std::string& msg) { return make_error(ErrorKind::Syntax, "syntax error: " + msg); }

    static Error unexpected(const Token& t) {
        if (t.kind == TokenKind::Invalid) return fail(t.lexeme);
        if (t.kind == TokenKind::Word) return fail("unexpected word '" + t.lexeme + "'");
        return fail(std::string("unexpected ") + to_string(t.kind));
    }

    Status parse_stage(std::unique_ptr<ParsedCommand>& out, bool after_pipe) {
        if (peek().kind != TokenKind::Word) {
            if (peek().kind == TokenKind::Invalid) return unexpected(peek());
            if (after_pipe) return fail("missing command after '|'");
            if (peek().kind == TokenKind::Pipe) return fail("missing command before '|'");
            return unexpected(peek());
        }
        out = std::make_unique<ParsedCommand>();
        out->name = get().lexeme;
        while (peek().kind == TokenKind::Word) out->args.push_back(get().lexeme);
        return std::nullopt;
    }

    Status parse_chain(Chain& chain) {
        if (auto err = parse_stage(chain.head, false)) return err;
        ParsedCommand* tail = chain.head.get();
        while (peek().kind == TokenKind::Pipe) {
            get();
            if (auto err = parse_stage(tail->next, true)) return err;
            tail = tail->next.get();
        }
        if (peek().kind == TokenKind::RedirOut || peek().kind == TokenKind::RedirOutAppend) {
            bool append = get().kind == TokenKind::RedirOutAppend;
            if (peek().kind != TokenKind::Word) {
                if (peek().kind == TokenKind::Invalid) return unexpected(peek());
                return fail("missing redirect target");
            }
            if (m_redirect_seen) return fail("multiple output redirections are not allowed");
            m_redirect_seen = true;
            chain.redirect = get().lexeme;
            chain.append = append;
            auto k = peek().kind;
            if (k == TokenKind::Word) return fail("unexpected '" + peek().lexeme + "' after redirect target");
            if (k == TokenKind::Pipe) return fail("cannot pipe the output of a redirect");
            if (k == TokenKind::RedirOut || k == TokenKind::RedirOutAppend) return fail("multiple output redirections are not allowed");
        }
        if (peek().kind == TokenKind::Background) {
            get();
            chain.background = true;
        }
        return std::nullopt;
    }

    const TokenStream& m_ts;
    std::size_t m_index = 0;
    bool m_redirect_seen = false;
};

} // namespace

ParseResult parse_tokens(const TokenStream& ts) {
    if (ts.empty()) return ParseResult{};
    Parser p(ts);
    return p.parse_list();
}

ParseResult parse_line(const std::string& line) {
    return parse_tokens(tokenize(line));
}

} // namespace shellkit
