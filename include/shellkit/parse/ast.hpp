/*
 * shellkit Parse Tree Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   A parsed line is a list of independent chains. Each chain is a singly
 *   linked list of pipeline stages (ParsedCommand) with an optional output
 *   redirect and a background flag. Nodes are immutable once parsed and are
 *   owned by whoever holds the ParseResult.
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
#include <memory>
#include <shellkit/core/error.hpp>

namespace shellkit {

struct ParsedCommand {
    std::string name;
    std::vector<std::string> args;
    std::unique_ptr<ParsedCommand> next; // following pipeline stage

    std::vector<std::string> argv() const;
    std::unique_ptr<ParsedCommand> clone() const;
};

struct Chain {
    std::unique_ptr<ParsedCommand> head;
    std::string redirect;    // empty when the chain has no redirect
    bool append = false;     // '>>' instead of '>'
    bool background = false; // trailing '&'

    std::size_t stage_count() const;
    // Re-quoted, human readable form; parsing it again yields an equal chain.
    std::string to_string() const;
    Chain clone() const;
};

bool operator==(const ParsedCommand& a, const ParsedCommand& b);
bool operator==(const Chain& a, const Chain& b);
inline bool operator!=(const Chain& a, const Chain& b) { return !(a == b); }

struct ParseResult {
    std::vector<Chain> chains;
    Status error;

    bool ok() const { return !error.has_value(); }
    // Redirect target of the line, empty when none (at most one per line).
    std::string redirect_target() const;
};

// Quotes a word so that the lexer reads it back unchanged.
std::string quote_word(const std::string& word);

} // namespace shellkit
