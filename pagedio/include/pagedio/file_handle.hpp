#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

// Read-only file descriptor. Closing is terminal.
class FileHandle {
public:
    explicit FileHandle(const std::string& path);
    ~FileHandle();

    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    void seek(uint64_t offset);

    // One read(2) call. Returns 0 at physical end of file.
    size_t read_into(uint8_t* buffer, size_t len);

    uint64_t length() const { return length_; }
    const std::string& path() const { return path_; }
    bool is_open() const { return fd_ >= 0; }
    void close();

private:
    std::string path_;
    uint64_t length_{0};
    int fd_{-1};
};
