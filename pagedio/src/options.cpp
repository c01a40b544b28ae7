#include "pagedio/options.hpp"
#include <stdexcept>
#include <string>

void ReaderOptions::validate() const {
    if (page_size_shift < MIN_PAGE_SIZE_SHIFT || page_size_shift > MAX_PAGE_SIZE_SHIFT) {
        throw std::invalid_argument("page_size_shift must be in [" + std::to_string(MIN_PAGE_SIZE_SHIFT) +
                                    ", " + std::to_string(MAX_PAGE_SIZE_SHIFT) + "], got " +
                                    std::to_string(page_size_shift));
    }
    if (max_cached_pages == 0) {
        throw std::invalid_argument("max_cached_pages must be at least 1");
    }
}
