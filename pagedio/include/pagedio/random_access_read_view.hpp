#pragma once
#include "pagedio/random_access_read.hpp"

// Window [start, start + length) over another reader. Positions are relative
// to start. The parent must outlive the view; reads go through it, so a view
// over a PagedFileReader shares its page cache.
class RandomAccessReadView : public RandomAccessRead {
public:
    RandomAccessReadView(RandomAccessRead& parent, int64_t start, int64_t length, bool close_parent = false);

    RandomAccessReadView(const RandomAccessReadView&) = delete;
    RandomAccessReadView& operator=(const RandomAccessReadView&) = delete;

    using RandomAccessRead::read;
    int read() override;
    int read(uint8_t* buffer, size_t off, size_t len) override;

    int64_t get_position() const override;
    // Positions past the window are clamped to its end.
    void seek(int64_t position) override;
    int64_t length() const override;
    int available() const override;
    bool is_eof() override;

    // Closes the parent only when the view was built with close_parent.
    void close() override;
    bool is_closed() const override;

    // Nested views are created on the parent, clipped to this window.
    std::unique_ptr<RandomAccessRead> create_view(int64_t start, int64_t length) override;

    int64_t start() const { return start_; }

private:
    void check_closed() const;
    void restore_position();

    RandomAccessRead& parent_;
    int64_t start_;
    int64_t length_;
    int64_t position_{0};
    bool close_parent_;
    bool closed_{false};
};
