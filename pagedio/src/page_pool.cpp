#include "pagedio/page_pool.hpp"
#include "pagedio/debug.hpp"
#include <stdexcept>

PagePool::PagePool(size_t page_size, size_t max_pages)
    : cache_(max_pages), page_size_(page_size) {
    if (page_size_ == 0 || (page_size_ & (page_size_ - 1)) != 0) {
        throw std::invalid_argument("Page size must be a power of two");
    }
}

const Page* PagePool::get(uint64_t page_offset) {
    Page* page = cache_.get(page_offset);
    if (page) {
        hits_++;
    } else {
        misses_++;
    }
    return page;
}

const Page* PagePool::put(uint64_t page_offset, Page page) {
    if (page.size() != page_size_) {
        throw std::invalid_argument("Page must be exactly page_size bytes");
    }
    auto evicted = cache_.put(page_offset, std::move(page));
    if (evicted) {
        evictions_++;
        DEBUG_LOG("pagepool", "evicted a page, ", cache_.size(), "/", cache_.capacity(), " resident",
                  recycled_ ? ", dropping older recycled buffer" : "");
        recycled_ = std::move(evicted);
    }
    return cache_.get(page_offset);
}

Page PagePool::acquire_buffer() {
    if (recycled_) {
        Page page = std::move(*recycled_);
        recycled_.reset();
        recycled_count_++;
        return page;
    }
    return Page(page_size_);
}

void PagePool::clear() {
    cache_.clear();
    recycled_.reset();
}

PagePool::PoolStats PagePool::get_stats() const {
    PoolStats stats;
    stats.resident_pages = cache_.size();
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    stats.recycled = recycled_count_;
    return stats;
}
