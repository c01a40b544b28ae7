#include "pagedio/random_access_read_view.hpp"
#include "pagedio/errors.hpp"
#include <algorithm>
#include <climits>

RandomAccessReadView::RandomAccessReadView(RandomAccessRead& parent, int64_t start, int64_t length,
                                           bool close_parent)
    : parent_(parent), start_(start), length_(length), close_parent_(close_parent) {
    if (start < 0) {
        throw RangeError("View start must not be negative", start);
    }
    if (length < 0) {
        throw RangeError("View length must not be negative", length);
    }
}

void RandomAccessReadView::check_closed() const {
    if (is_closed()) {
        throw ClosedError("RandomAccessReadView already closed");
    }
}

void RandomAccessReadView::restore_position() {
    parent_.seek(start_ + position_);
}

int RandomAccessReadView::read() {
    if (is_eof()) {
        return END_OF_FILE;
    }
    restore_position();
    int value = parent_.read();
    if (value != END_OF_FILE) {
        position_++;
    }
    return value;
}

int RandomAccessReadView::read(uint8_t* buffer, size_t off, size_t len) {
    if (is_eof()) {
        return END_OF_FILE;
    }
    restore_position();
    size_t bounded = std::min(len, static_cast<size_t>(length_ - position_));
    int n = parent_.read(buffer, off, bounded);
    if (n > 0) {
        position_ += n;
    }
    return n;
}

int64_t RandomAccessReadView::get_position() const {
    check_closed();
    return position_;
}

void RandomAccessReadView::seek(int64_t position) {
    check_closed();
    if (position < 0) {
        throw RangeError("Cannot seek to a negative position", position);
    }
    position_ = std::min(position, length_);
}

int64_t RandomAccessReadView::length() const {
    check_closed();
    return length_;
}

int RandomAccessReadView::available() const {
    check_closed();
    return static_cast<int>(std::min<int64_t>(length_ - position_, INT_MAX));
}

bool RandomAccessReadView::is_eof() {
    check_closed();
    return position_ >= length_;
}

void RandomAccessReadView::close() {
    if (closed_) return;
    closed_ = true;
    if (close_parent_) {
        parent_.close();
    }
}

bool RandomAccessReadView::is_closed() const {
    return closed_ || parent_.is_closed();
}

std::unique_ptr<RandomAccessRead> RandomAccessReadView::create_view(int64_t start, int64_t length) {
    check_closed();
    if (start < 0 || start > length_) {
        throw RangeError("View start outside of window", start);
    }
    if (length < 0) {
        throw RangeError("View length must not be negative", length);
    }
    return parent_.create_view(start_ + start, std::min(length, length_ - start));
}
