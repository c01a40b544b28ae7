#include "pagedio/paged_file_reader.hpp"
#include "pagedio/debug.hpp"
#include "pagedio/errors.hpp"
#include "pagedio/random_access_read_view.hpp"
#include <algorithm>
#include <climits>
#include <cstring>

static const ReaderOptions& validated(const ReaderOptions& options) {
    options.validate();
    return options;
}

PagedFileReader::PagedFileReader(const std::string& path, const ReaderOptions& options)
    : file_(path),
      pool_(validated(options).page_size(), options.max_cached_pages),
      page_size_(options.page_size()),
      page_offset_mask_(~static_cast<uint64_t>(options.page_size() - 1)),
      file_length_(static_cast<int64_t>(file_.length())) {
    seek(0);
}

PagedFileReader::~PagedFileReader() {
    try {
        close();
    } catch (const IOError& e) {
        DEBUG_LOG("reader", "close on destruction failed: ", e.what());
    }
}

void PagedFileReader::check_closed() const {
    if (closed_) {
        throw ClosedError("PagedFileReader already closed: " + file_.path());
    }
}

int64_t PagedFileReader::get_position() const {
    check_closed();
    return file_offset_;
}

void PagedFileReader::seek(int64_t new_offset) {
    check_closed();
    if (new_offset < 0) {
        throw RangeError("Cannot seek to a negative position", new_offset);
    }
    uint64_t new_page_offset = static_cast<uint64_t>(new_offset) & page_offset_mask_;
    if (!current_page_offset_ || *current_page_offset_ != new_page_offset) {
        const Page* page = pool_.get(new_page_offset);
        if (!page) {
            page = pool_.put(new_page_offset, load_page(new_page_offset));
        }
        current_page_offset_ = new_page_offset;
        current_page_ = page->data();
    }
    offset_within_page_ = static_cast<size_t>(static_cast<uint64_t>(new_offset) - new_page_offset);
    file_offset_ = new_offset;
}

Page PagedFileReader::load_page(uint64_t page_offset) {
    Page page = pool_.acquire_buffer();
    file_.seek(page_offset);

    size_t read_bytes = 0;
    while (read_bytes < page_size_) {
        size_t n = file_.read_into(page.data() + read_bytes, page_size_ - read_bytes);
        if (n == 0) {
            break;
        }
        read_bytes += n;
    }
    DEBUG_LOG("reader", "loaded page at ", page_offset, " (", read_bytes, " bytes)");
    return page;
}

int PagedFileReader::read() {
    check_closed();
    if (file_offset_ >= file_length_) {
        return END_OF_FILE;
    }
    if (offset_within_page_ == page_size_) {
        seek(file_offset_);
    }
    file_offset_++;
    return current_page_[offset_within_page_++];
}

int PagedFileReader::read(uint8_t* buffer, size_t off, size_t len) {
    check_closed();
    if (file_offset_ >= file_length_) {
        return END_OF_FILE;
    }
    if (offset_within_page_ == page_size_) {
        seek(file_offset_);
    }
    size_t count = std::min(page_size_ - offset_within_page_, len);
    count = std::min(count, static_cast<size_t>(file_length_ - file_offset_));

    if (count == 0) {
        return 0;
    }
    std::memcpy(buffer + off, current_page_ + offset_within_page_, count);
    offset_within_page_ += count;
    file_offset_ += static_cast<int64_t>(count);
    return static_cast<int>(count);
}

int64_t PagedFileReader::length() const {
    check_closed();
    return file_length_;
}

int PagedFileReader::available() const {
    check_closed();
    int64_t remaining = std::max<int64_t>(0, file_length_ - file_offset_);
    return static_cast<int>(std::min<int64_t>(remaining, INT_MAX));
}

void PagedFileReader::close() {
    if (closed_) return;
    closed_ = true;
    pool_.clear();
    current_page_ = nullptr;
    current_page_offset_.reset();
    DEBUG_LOG("reader", "closed ", file_.path());
    file_.close();
}

std::unique_ptr<RandomAccessRead> PagedFileReader::create_view(int64_t start, int64_t length) {
    check_closed();
    return std::make_unique<RandomAccessReadView>(*this, start, length);
}
