#pragma once
#include <cstddef>
#include <cstdint>

constexpr uint32_t DEFAULT_PAGE_SIZE_SHIFT = 12; // 4KB
constexpr size_t DEFAULT_MAX_CACHED_PAGES = 1000;
constexpr uint32_t MIN_PAGE_SIZE_SHIFT = 6;
constexpr uint32_t MAX_PAGE_SIZE_SHIFT = 24;

struct ReaderOptions {
    uint32_t page_size_shift = DEFAULT_PAGE_SIZE_SHIFT;
    size_t max_cached_pages = DEFAULT_MAX_CACHED_PAGES;

    size_t page_size() const { return size_t{1} << page_size_shift; }

    // Throws std::invalid_argument when a field is out of range.
    void validate() const;
};
