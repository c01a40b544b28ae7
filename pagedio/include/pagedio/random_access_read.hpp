#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

constexpr int END_OF_FILE = -1;

// Read-only byte source with a movable position.
class RandomAccessRead {
public:
    virtual ~RandomAccessRead() = default;

    // Next byte as 0-255, or END_OF_FILE.
    virtual int read() = 0;

    // Copies up to len bytes to buffer + off. Returns the count, or
    // END_OF_FILE when already at the end. May return fewer than len bytes.
    virtual int read(uint8_t* buffer, size_t off, size_t len) = 0;
    int read(std::vector<uint8_t>& buffer) { return read(buffer.data(), 0, buffer.size()); }

    virtual int64_t get_position() const = 0;
    virtual void seek(int64_t position) = 0;
    virtual int64_t length() const = 0;
    virtual int available() const = 0;

    virtual void close() = 0;
    virtual bool is_closed() const = 0;

    virtual std::unique_ptr<RandomAccessRead> create_view(int64_t start, int64_t length) = 0;

    virtual int peek();
    virtual void rewind(int64_t bytes);
    virtual bool is_eof();

    void skip(int64_t bytes) { seek(get_position() + bytes); }

    // Loops until len bytes are copied. Throws EndOfFileError if the data runs out first.
    void read_fully(uint8_t* buffer, size_t off, size_t len);
    std::vector<uint8_t> read_fully(size_t len);
};
