#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace dumptruck {

// Fixed-capacity map with least-recently-used eviction. Not thread-safe.
template <typename Key, typename Value, typename Hash = std::hash<Key>,
          typename KeyEqual = std::equal_to<Key>>
class LruCache {
public:
  explicit LruCache(std::size_t capacity) : capacity_{capacity} {
  }

  // Returns a copy so the caller never holds a reference into a node that a
  // later insertion may evict.
  [[nodiscard]] auto get(const Key& key) -> std::optional<Value> {
    auto it = index_.find(key);
    if (it == index_.end()) {
      ++misses_;
      return std::nullopt;
    }
    // Move to front (most recently used)
    entries_.splice(entries_.begin(), entries_, it->second);
    ++hits_;
    return it->second->second;
  }

  [[nodiscard]] auto contains(const Key& key) const -> bool {
    return index_.contains(key);
  }

  auto put(Key key, Value value) -> void {
    if (capacity_ == 0) {
      return;
    }

    if (auto it = index_.find(key); it != index_.end()) {
      it->second->second = std::move(value);
      entries_.splice(entries_.begin(), entries_, it->second);
      return;
    }

    if (entries_.size() >= capacity_) {
      evict_lru();
    }

    entries_.emplace_front(std::move(key), std::move(value));
    index_.emplace(entries_.front().first, entries_.begin());
  }

  auto clear() -> void {
    index_.clear();
    entries_.clear();
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return entries_.size();
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return capacity_;
  }

  [[nodiscard]] auto hits() const noexcept -> std::size_t {
    return hits_;
  }

  [[nodiscard]] auto misses() const noexcept -> std::size_t {
    return misses_;
  }

private:
  using Entry = std::pair<Key, Value>;
  using EntryList = std::list<Entry>;

  auto evict_lru() -> void {
    if (entries_.empty()) {
      return;
    }
    // Remove from back (least recently used)
    index_.erase(entries_.back().first);
    entries_.pop_back();
  }

  std::size_t capacity_;
  EntryList entries_;
  std::unordered_map<Key, typename EntryList::iterator, Hash, KeyEqual> index_;
  std::size_t hits_{0};
  std::size_t misses_{0};
};

}  // namespace dumptruck
