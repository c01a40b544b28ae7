#pragma once
#include "pagedio/file_handle.hpp"
#include "pagedio/options.hpp"
#include "pagedio/page_pool.hpp"
#include "pagedio/random_access_read.hpp"
#include <optional>
#include <string>

// Random access over a read-only file through an LRU cache of fixed size
// pages. Reads never cross a page boundary in a single call.
//
// The last page of the file may carry filler past the physical end (stale
// bytes from a recycled buffer). Every read path checks file_offset_ against
// the file length first, so filler is never returned.
class PagedFileReader : public RandomAccessRead {
public:
    explicit PagedFileReader(const std::string& path, const ReaderOptions& options = ReaderOptions{});
    ~PagedFileReader() override;

    PagedFileReader(const PagedFileReader&) = delete;
    PagedFileReader& operator=(const PagedFileReader&) = delete;

    using RandomAccessRead::read;
    int read() override;
    int read(uint8_t* buffer, size_t off, size_t len) override;

    int64_t get_position() const override;
    void seek(int64_t new_offset) override;
    int64_t length() const override;
    int available() const override;

    void close() override;
    bool is_closed() const override { return closed_; }

    std::unique_ptr<RandomAccessRead> create_view(int64_t start, int64_t length) override;

    size_t page_size() const { return page_size_; }
    PagePool::PoolStats get_stats() const { return pool_.get_stats(); }
    const PagePool& pool() const { return pool_; }

private:
    void check_closed() const;
    Page load_page(uint64_t page_offset);

    FileHandle file_;
    PagePool pool_;
    size_t page_size_;
    uint64_t page_offset_mask_;
    int64_t file_length_;

    int64_t file_offset_{0};
    std::optional<uint64_t> current_page_offset_;
    // Points into a buffer owned by pool_. Only the buffer of an evicted page
    // is ever recycled, and by then the cursor has moved to the new page.
    const uint8_t* current_page_{nullptr};
    size_t offset_within_page_{0};
    bool closed_{false};
};
