// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace shardnet {
namespace util {

/**
 * LruCache - bounded map with least-recently-used eviction
 *
 * get() and put() mark an entry as most recently used; peek() and contains()
 * do not. Inserting beyond capacity evicts the least recently used entry.
 * Iteration runs from most to least recently used.
 *
 * Not thread-safe: owners guard it with their own mutex.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
public:
  using Entry = std::pair<Key, Value>;
  using const_iterator = typename std::list<Entry>::const_iterator;

  // A capacity of 0 is treated as 1.
  explicit LruCache(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

  LruCache(const LruCache&) = delete;
  LruCache& operator=(const LruCache&) = delete;
  LruCache(LruCache&&) = default;
  LruCache& operator=(LruCache&&) = default;

  // Returns pointer to the value and marks it most recently used, or nullptr.
  // The pointer is invalidated by the next mutating call.
  Value* get(const Key& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      return nullptr;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    return &it->second->second;
  }

  // Look up without touching recency.
  const Value* peek(const Key& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &it->second->second;
  }

  bool contains(const Key& key) const { return index_.find(key) != index_.end(); }

  // Insert or replace, marking the entry most recently used.
  // Returns the entry evicted to make room, if any.
  std::optional<Entry> put(const Key& key, Value value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
      it->second->second = std::move(value);
      entries_.splice(entries_.begin(), entries_, it->second);
      return std::nullopt;
    }

    std::optional<Entry> evicted;
    if (entries_.size() >= capacity_) {
      evicted = pop_lru();
    }
    entries_.emplace_front(key, std::move(value));
    index_.emplace(key, entries_.begin());
    return evicted;
  }

  bool erase(const Key& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      return false;
    }
    entries_.erase(it->second);
    index_.erase(it);
    return true;
  }

  std::optional<Entry> pop_lru() {
    if (entries_.empty()) {
      return std::nullopt;
    }
    Entry last = std::move(entries_.back());
    entries_.pop_back();
    index_.erase(last.first);
    return last;
  }

  void clear() {
    entries_.clear();
    index_.clear();
  }

  size_t size() const { return entries_.size(); }
  size_t capacity() const { return capacity_; }
  bool empty() const { return entries_.empty(); }

  const_iterator begin() const { return entries_.cbegin(); }
  const_iterator end() const { return entries_.cend(); }

private:
  size_t capacity_;
  std::list<Entry> entries_;  // front = most recently used
  std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
};

}  // namespace util
}  // namespace shardnet
