/*
 * shellkit Lexer Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Converts an engine line into a TokenStream. See header for details.
 */
#include <cctype>
#include <shellkit/lex/lexer.hpp>

namespace shellkit {

const char* to_string(TokenKind kind) {
    switch (kind) {
        case TokenKind::Word: return "word";
        case TokenKind::Pipe: return "'|'";
        case TokenKind::Semi: return "';'";
        case TokenKind::Newline: return "newline";
        case TokenKind::RedirOut: return "'>'";
        case TokenKind::RedirOutAppend: return "'>>'";
        case TokenKind::Background: return "'&'";
        case TokenKind::Eof: return "end of input";
        case TokenKind::Invalid: return "invalid token";
    }
    return "?";
}

Lexer::Lexer(std::string input) : m_input(std::move(input)) {}

char Lexer::peek(std::size_t ahead) const { return m_pos + ahead < m_input.size() ? m_input[m_pos + ahead] : '\0'; }
char Lexer::get() { return eof() ? '\0' : m_input[m_pos++]; }
bool Lexer::eof() const { return m_pos >= m_input.size(); }

bool Lexer::is_operator_char(char c) { return c=='|' || c==';' || c=='>' || c=='&' || c=='\n'; }

void Lexer::skip_blank() {
    while (!eof()) {
        char c = peek();
        if (c=='\\' && peek(1)=='\n') { m_pos += 2; continue; } // line continuation
        if (c=='\\' && peek(1)=='\r' && peek(2)=='\n') { m_pos += 3; continue; }
        if (c==' ' || c=='\t' || c=='\r' || c=='\v' || c=='\f') { get(); continue; }
        break;
    }
}

void Lexer::skip_comment() { while (!eof() && peek() != '\n') get(); }

Token Lexer::lex_operator() {
    std::size_t start = m_pos;
    char c = get();
    switch (c) {
        case '|':
            if (peek() == '|') { m_failed = true; return {TokenKind::Invalid, "unsupported operator '||'", start}; }
            return {TokenKind::Pipe, "|", start};
        case '&':
            if (peek() == '&') { m_failed = true; return {TokenKind::Invalid, "unsupported operator '&&'", start}; }
            return {TokenKind::Background, "&", start};
        case ';': return {TokenKind::Semi, ";", start};
        case '\n': return {TokenKind::Newline, "\n", start};
        case '>': if (peek() == '>') { get(); return {TokenKind::RedirOutAppend, ">>", start}; } return {TokenKind::RedirOut, ">", start};
        default: m_failed = true; return {TokenKind::Invalid, std::string("unexpected character '") + c + "'", start};
    }
}

Token Lexer::lex_word() {
    std::size_t start = m_pos; std::string out; bool in_single=false, in_double=false;
    while (!eof()) {
        char c = peek();
        if (!in_single && !in_double) {
            if (c==' ' || c=='\t' || c=='\r' || c=='\v' || c=='\f') break;
            if (is_operator_char(c)) break;
            if (c=='\'') { in_single=true; get(); continue; }
            if (c=='"') { in_double=true; get(); continue; }
            if (c=='\\') {
                get();
                if (eof()) { m_failed = true; return {TokenKind::Invalid, "unterminated escape at end of input", m_pos}; }
                if (peek()=='\n') { get(); continue; } // continuation inside a word
                out.push_back(get());
                continue;
            }
            out.push_back(get());
        } else if (in_single) {
            get(); if (c=='\'') { in_single=false; continue; } out.push_back(c);
        } else {
            get(); if (c=='"') { in_double=false; continue; }
            if (c=='\\' && !eof()) { char n=peek(); if (n=='"'||n=='\\'||n=='$') { out.push_back(n); get(); continue; }}
            out.push_back(c);
        }
    }
    if (in_single || in_double) {
        m_failed = true;
        return {TokenKind::Invalid, std::string("unterminated ") + (in_single ? "single" : "double") + " quote", start};
    }
    return {TokenKind::Word, out, start};
}

Token Lexer::next() {
    skip_blank();
    if (eof()) return {TokenKind::Eof, "", m_pos};
    char c = peek();
    if (c=='#') { skip_comment(); return next(); }
    if (is_operator_char(c)) return lex_operator();
    return lex_word();
}

TokenStream Lexer::run() {
    TokenStream ts;
    while (true) {
        Token t = next(); ts.push_back(t);
        if (t.kind==TokenKind::Eof) break;
        if (m_failed) { ts.push_back({TokenKind::Eof, "", m_pos}); break; }
    }
    return ts;
}

TokenStream tokenize(const std::string& line) {
    Lexer lx(line);
    return lx.run();
}

} // namespace shellkit
