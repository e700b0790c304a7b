/*
 * Recursion depth guard - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <atomic>
#include <string>

namespace shellkit {

// Increments the engine's shared depth counter for the lifetime of one
// execute call and decrements it on every exit path.
class DepthGuard {
public:
    DepthGuard(std::atomic<int>& counter, int max_depth)
        : m_counter(counter), m_depth(counter.fetch_add(1) + 1), m_max(max_depth) {}
    ~DepthGuard() { m_counter.fetch_sub(1); }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

    int depth() const { return m_depth; }
    bool exceeded() const { return m_depth > m_max; }
    std::string message() const {
        return "maximum execution depth exceeded (" + std::to_string(m_max) + ") - possible infinite recursion";
    }

private:
    std::atomic<int>& m_counter;
    int m_depth;
    int m_max;
};

} // namespace shellkit
