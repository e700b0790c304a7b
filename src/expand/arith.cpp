/*
 * Integer arithmetic evaluation implementation - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellkit/expand/arith.hpp>
#include <cctype>
#include <climits>

namespace shellkit {

namespace {

class ArithParser {
public:
    explicit ArithParser(const std::string& s) : m_s(s) {}

    std::optional<long long> run() {
        auto v = expr();
        skip_space();
        if (!v || m_pos != m_s.size()) return std::nullopt;
        return v;
    }

private:
    void skip_space() { while (m_pos < m_s.size() && std::isspace(static_cast<unsigned char>(m_s[m_pos]))) ++m_pos; }
    char peek() { skip_space(); return m_pos < m_s.size() ? m_s[m_pos] : '\0'; }

    std::optional<long long> expr() {
        auto lhs = term();
        if (!lhs) return std::nullopt;
        while (true) {
            char op = peek();
            if (op != '+' && op != '-') return lhs;
            ++m_pos;
            auto rhs = term();
            if (!rhs) return std::nullopt;
            long long r = 0;
            bool overflow = op == '+' ? __builtin_add_overflow(*lhs, *rhs, &r) : __builtin_sub_overflow(*lhs, *rhs, &r);
            if (overflow) return std::nullopt;
            lhs = r;
        }
    }

    std::optional<long long> term() {
        auto lhs = factor();
        if (!lhs) return std::nullopt;
        while (true) {
            char op = peek();
            if (op != '*' && op != '/' && op != '%') return lhs;
            ++m_pos;
            auto rhs = factor();
            if (!rhs) return std::nullopt;
            if (op == '*') {
                long long r = 0;
                if (__builtin_mul_overflow(*lhs, *rhs, &r)) return std::nullopt;
                lhs = r;
            } else {
                // LLONG_MIN / -1 traps on most targets
                if (*rhs == 0 || (*rhs == -1 && *lhs == LLONG_MIN)) return std::nullopt;
                lhs = op == '/' ? *lhs / *rhs : *lhs % *rhs;
            }
        }
    }

    std::optional<long long> factor() {
        char c = peek();
        if (c == '-') {
            ++m_pos;
            auto v = factor();
            if (!v || *v == LLONG_MIN) return std::nullopt;
            return -*v;
        }
        if (c == '+') { ++m_pos; return factor(); }
        if (c == '(') {
            ++m_pos;
            auto v = expr();
            if (!v || peek() != ')') return std::nullopt;
            ++m_pos;
            return v;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        long long v = 0;
        while (m_pos < m_s.size() && std::isdigit(static_cast<unsigned char>(m_s[m_pos]))) {
            if (__builtin_mul_overflow(v, 10LL, &v) || __builtin_add_overflow(v, static_cast<long long>(m_s[m_pos] - '0'), &v))
                return std::nullopt;
            ++m_pos;
        }
        return v;
    }

    const std::string& m_s;
    std::size_t m_pos = 0;
};

} // namespace

std::optional<long long> evaluate_arithmetic(const std::string& expr) {
    ArithParser p(expr);
    return p.run();
}

} // namespace shellkit
