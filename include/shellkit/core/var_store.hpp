/*
 * Concurrent string stores - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   SafeMap guards a std::unordered_map with a reader/writer lock. Reads
 *   (every expansion) share the lock; mutations are exclusive. Enumeration
 *   works on snapshots so callers never re-enter the lock they hold.
 */
#pragma once
#include <algorithm>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace shellkit {

template <typename K, typename V>
class SafeMap {
public:
    using Entry = std::pair<K, V>;

    SafeMap() = default;
    explicit SafeMap(const std::vector<Entry>& entries) { for (auto& e : entries) m_map.insert(e); }
    SafeMap(const SafeMap&) = delete;
    SafeMap& operator=(const SafeMap&) = delete;

    void set(const K& key, V value) {
        std::unique_lock<std::shared_mutex> lock(m_mu);
        m_map[key] = std::move(value);
    }

    std::optional<V> get(const K& key) const {
        std::shared_lock<std::shared_mutex> lock(m_mu);
        auto it = m_map.find(key);
        if (it == m_map.end()) return std::nullopt;
        return it->second;
    }

    bool contains(const K& key) const {
        std::shared_lock<std::shared_mutex> lock(m_mu);
        return m_map.count(key) != 0;
    }

    // Returns false when the key was absent.
    bool erase(const K& key) {
        std::unique_lock<std::shared_mutex> lock(m_mu);
        return m_map.erase(key) != 0;
    }

    void clear() {
        std::unique_lock<std::shared_mutex> lock(m_mu);
        m_map.clear();
    }

    std::size_t size() const {
        std::shared_lock<std::shared_mutex> lock(m_mu);
        return m_map.size();
    }

    std::vector<Entry> snapshot() const {
        std::shared_lock<std::shared_mutex> lock(m_mu);
        return std::vector<Entry>(m_map.begin(), m_map.end());
    }

    std::vector<Entry> sorted_snapshot() const {
        auto out = snapshot();
        std::sort(out.begin(), out.end(), [](const Entry& a, const Entry& b){ return a.first < b.first; });
        return out;
    }

    // fn runs under the read lock: it must not call back into this map.
    void for_each(const std::function<void(const K&, const V&)>& fn) const {
        std::shared_lock<std::shared_mutex> lock(m_mu);
        for (auto& kv : m_map) fn(kv.first, kv.second);
    }

    // Applies fn to the current value (nullopt when absent) and stores the
    // result atomically with respect to other writers.
    V update(const K& key, const std::function<V(const std::optional<V>&)>& fn) {
        std::unique_lock<std::shared_mutex> lock(m_mu);
        auto it = m_map.find(key);
        std::optional<V> cur;
        if (it != m_map.end()) cur = it->second;
        V next = fn(cur);
        m_map[key] = next;
        return next;
    }

private:
    mutable std::shared_mutex m_mu;
    std::unordered_map<K, V> m_map;
};

// Keys follow the "@name" convention; lookup is exact-match only.
using VariableStore = SafeMap<std::string, std::string>;
// Keys are full lines or first words.
using AliasTable = SafeMap<std::string, std::string>;

} // namespace shellkit
