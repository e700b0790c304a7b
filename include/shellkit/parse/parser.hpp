/*
 * shellkit Parser Interface
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Declares parse_tokens, which turns a TokenStream into chains of pipeline
 *   stages, and parse_line, which lexes first. Grammar:
 *     list  := chain ((';' | newline) chain)* [';']
 *     chain := stage ('|' stage)* [('>' | '>>') WORD] ['&']
 *     stage := WORD WORD*
 *   Errors (Syntax kind): unbalanced quotes, a pipe or ';' with a missing
 *   operand, a redirect without target or not at the end of its chain, and
 *   more than one redirect per line.
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
#include "shellkit/parse/tokens.hpp"
#include "shellkit/parse/ast.hpp"

namespace shellkit {

ParseResult parse_tokens(const TokenStream& ts);
ParseResult parse_line(const std::string& line);

} // namespace shellkit
