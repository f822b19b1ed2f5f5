#pragma once

/**
 * @file lru_cache.hpp
 * @brief Bounded least-recently-used cache
 *
 * Holds at most capacity() entries. A get() hit or a put() marks the entry
 * as most recently used; inserting into a full cache evicts the least
 * recently used entry. All operations are synchronised.
 */

#include "ChannelDeck/core/types.hpp"

#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace ChannelDeck::core {

struct CacheStats {
  u64 hitCount = 0;
  u64 missCount = 0;
  u64 evictionCount = 0;
  usize entryCount = 0;
  usize capacity = 0;

  [[nodiscard]] f64 hitRate() const {
    const u64 total = hitCount + missCount;
    return total == 0 ? 0.0 : static_cast<f64>(hitCount) / static_cast<f64>(total);
  }
};

template <typename Key, typename Value, typename Hash = std::hash<Key>> class LruCache {
public:
  explicit LruCache(usize capacity) : m_capacity(capacity) {}

  LruCache(const LruCache&) = delete;
  LruCache& operator=(const LruCache&) = delete;

  [[nodiscard]] std::optional<Value> get(const Key& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(key);
    if (it == m_index.end()) {
      ++m_missCount;
      return std::nullopt;
    }
    ++m_hitCount;
    m_entries.splice(m_entries.begin(), m_entries, it->second);
    return it->second->second;
  }

  void put(const Key& key, Value value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_capacity == 0) {
      return;
    }

    auto it = m_index.find(key);
    if (it != m_index.end()) {
      it->second->second = std::move(value);
      m_entries.splice(m_entries.begin(), m_entries, it->second);
      return;
    }

    if (m_entries.size() >= m_capacity) {
      m_index.erase(m_entries.back().first);
      m_entries.pop_back();
      ++m_evictionCount;
    }

    m_entries.emplace_front(key, std::move(value));
    m_index.emplace(key, m_entries.begin());
  }

  /// Does not affect recency or statistics.
  [[nodiscard]] bool contains(const Key& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.find(key) != m_index.end();
  }

  bool remove(const Key& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(key);
    if (it == m_index.end()) {
      return false;
    }
    m_entries.erase(it->second);
    m_index.erase(it);
    return true;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_index.clear();
  }

  [[nodiscard]] usize entryCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
  }

  [[nodiscard]] usize capacity() const { return m_capacity; }

  [[nodiscard]] CacheStats stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    CacheStats stats;
    stats.hitCount = m_hitCount;
    stats.missCount = m_missCount;
    stats.evictionCount = m_evictionCount;
    stats.entryCount = m_entries.size();
    stats.capacity = m_capacity;
    return stats;
  }

  void resetStats() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hitCount = 0;
    m_missCount = 0;
    m_evictionCount = 0;
  }

private:
  using EntryList = std::list<std::pair<Key, Value>>;

  const usize m_capacity;
  EntryList m_entries; // front = most recently used
  std::unordered_map<Key, typename EntryList::iterator, Hash> m_index;
  u64 m_hitCount = 0;
  u64 m_missCount = 0;
  u64 m_evictionCount = 0;
  mutable std::mutex m_mutex;
};

} // namespace ChannelDeck::core
