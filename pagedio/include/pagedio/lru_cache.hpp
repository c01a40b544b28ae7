#pragma once
#include <cstddef>
#include <functional>
#include <iterator>
#include <list>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

// Bounded map ordered by access. get() and put() both count as an access.
// put() hands back whatever value left the cache so the caller can reuse it.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
public:
    explicit LruCache(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("LruCache capacity must be at least 1");
        }
    }

    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;

    Value* get(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return nullptr;
        }
        touch(it->second);
        return &it->second->second;
    }

    // Returns the evicted least recently used value, or the displaced value
    // when key was already present.
    std::optional<Value> put(const Key& key, Value value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            std::optional<Value> displaced(std::move(it->second->second));
            it->second->second = std::move(value);
            touch(it->second);
            return displaced;
        }

        entries_.emplace_front(key, std::move(value));
        index_[key] = entries_.begin();
        if (entries_.size() <= capacity_) {
            return std::nullopt;
        }

        auto victim = std::prev(entries_.end());
        std::optional<Value> evicted(std::move(victim->second));
        index_.erase(victim->first);
        entries_.erase(victim);
        return evicted;
    }

    bool contains(const Key& key) const { return index_.find(key) != index_.end(); }

    // Most recently used first.
    std::vector<Key> keys() const {
        std::vector<Key> out;
        out.reserve(entries_.size());
        for (const auto& entry : entries_) out.push_back(entry.first);
        return out;
    }

    void clear() {
        index_.clear();
        entries_.clear();
    }

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return entries_.empty(); }

private:
    using Entry = std::pair<Key, Value>;
    using EntryIter = typename std::list<Entry>::iterator;

    void touch(EntryIter it) { entries_.splice(entries_.begin(), entries_, it); }

    std::list<Entry> entries_;
    std::unordered_map<Key, EntryIter, Hash> index_;
    size_t capacity_;
};
