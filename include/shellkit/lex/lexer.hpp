/*
 * shellkit Lexer Module
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Quote-aware lexical analysis of an engine line. Single and double quoted
 *   spans produce one word even when they contain operators or whitespace,
 *   backslash escapes the next character, '#' at the start of a word drops
 *   the rest of its line and a trailing backslash continues onto the next
 *   line. Operators: | ; > >> & and newline. Lexing stops at the first error,
 *   reported as an Invalid token.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include "shellkit/parse/tokens.hpp"

namespace shellkit {

class Lexer {
public:
    explicit Lexer(std::string input);
    TokenStream run();
private:
    Token next();
    char peek(std::size_t ahead = 0) const;
    char get();
    bool eof() const;
    void skip_blank();
    void skip_comment();
    Token lex_word();
    Token lex_operator();
    static bool is_operator_char(char c);

    std::string m_input;
    std::size_t m_pos = 0; // current index
    bool m_failed = false;
};

// Convenience: lex a whole line.
TokenStream tokenize(const std::string& line);

} // namespace shellkit
