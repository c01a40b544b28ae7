#pragma once
#include "pagedio/lru_cache.hpp"
#include <cstdint>
#include <optional>
#include <vector>

using Page = std::vector<uint8_t>;

// Resident pages keyed by page aligned file offset. The buffer of the most
// recent eviction is kept back and handed out by acquire_buffer() so a miss
// after an eviction does not allocate.
class PagePool {
public:
    PagePool(size_t page_size, size_t max_pages);

    PagePool(const PagePool&) = delete;
    PagePool& operator=(const PagePool&) = delete;

    const Page* get(uint64_t page_offset);
    const Page* put(uint64_t page_offset, Page page);

    // Recycled buffer if one is held, else a fresh page_size buffer.
    // Recycled contents are stale.
    Page acquire_buffer();

    void clear();

    size_t size() const { return cache_.size(); }
    size_t max_pages() const { return cache_.capacity(); }
    size_t page_size() const { return page_size_; }
    bool has_recycled_buffer() const { return recycled_.has_value(); }
    bool contains(uint64_t page_offset) const { return cache_.contains(page_offset); }

    // Most recently used first.
    std::vector<uint64_t> resident_offsets() const { return cache_.keys(); }

    struct PoolStats {
        size_t resident_pages;
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        uint64_t recycled;
    };

    PoolStats get_stats() const;

private:
    LruCache<uint64_t, Page> cache_;
    std::optional<Page> recycled_;
    size_t page_size_;
    uint64_t hits_{0};
    uint64_t misses_{0};
    uint64_t evictions_{0};
    uint64_t recycled_count_{0};
};
