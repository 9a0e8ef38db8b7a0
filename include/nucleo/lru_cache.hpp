#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace nucleo {

/**
 * Bounded key -> value cache with least-recently-used eviction.
 *
 * A hit moves the entry to the front; inserting into a full cache drops
 * the entry at the back. Capacity 0 disables caching. Not synchronized:
 * one cache belongs to one caller.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
public:
    explicit LruCache(size_t capacity) : capacity_(capacity) {}

    std::optional<Value> get(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++misses_;
            return std::nullopt;
        }
        ++hits_;
        entries_.splice(entries_.begin(), entries_, it->second);
        return it->second->second;
    }

    void put(const Key& key, Value value) {
        if (capacity_ == 0) return;

        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }
        if (entries_.size() >= capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
        entries_.emplace_front(key, std::move(value));
        index_[key] = entries_.begin();
    }

    bool contains(const Key& key) const { return index_.find(key) != index_.end(); }

    void clear() {
        entries_.clear();
        index_.clear();
    }

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }

private:
    using Entry = std::pair<Key, Value>;

    size_t capacity_;
    std::list<Entry> entries_;  // most recent first
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace nucleo
