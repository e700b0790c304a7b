/*
 * Integer arithmetic evaluation - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>

namespace shellkit {

// Recursive descent over + - * / % with parentheses and unary minus/plus,
// 64-bit integers, usual precedence, left associative. Returns nullopt for
// malformed input, identifiers, division by zero and results that do not
// fit in a long long.
std::optional<long long> evaluate_arithmetic(const std::string& expr);

} // namespace shellkit
