#include "pagedio/file_handle.hpp"
#include "pagedio/debug.hpp"
#include "pagedio/errors.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

FileHandle::FileHandle(const std::string& path) : path_(path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw IOError("Failed to open file", path_, errno);
    }
    struct stat st;
    if (::fstat(fd_, &st) < 0) {
        int e = errno;
        ::close(fd_);
        fd_ = -1;
        throw IOError("Failed to stat file", path_, e);
    }
    length_ = static_cast<uint64_t>(st.st_size);
    DEBUG_LOG("file", "opened ", path_, " fd=", fd_, " length=", length_);
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : path_(std::move(other.path_)), length_(other.length_), fd_(other.fd_) {
    other.fd_ = -1;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this == &other) return *this;
    if (fd_ >= 0) {
        ::close(fd_);
    }
    path_ = std::move(other.path_);
    length_ = other.length_;
    fd_ = other.fd_;
    other.fd_ = -1;
    return *this;
}

FileHandle::~FileHandle() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void FileHandle::seek(uint64_t offset) {
    if (fd_ < 0) {
        throw ClosedError("FileHandle already closed");
    }
    if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) {
        throw IOError("Failed to seek to offset " + std::to_string(offset) + " in", path_, errno);
    }
}

size_t FileHandle::read_into(uint8_t* buffer, size_t len) {
    if (fd_ < 0) {
        throw ClosedError("FileHandle already closed");
    }
    while (true) {
        ssize_t n = ::read(fd_, buffer, len);
        if (n >= 0) {
            if (static_cast<size_t>(n) < len) {
                DEBUG_LOG("file", "short read of ", n, "/", len, " bytes from ", path_);
            }
            return static_cast<size_t>(n);
        }
        if (errno != EINTR) {
            throw IOError("Failed to read", path_, errno);
        }
    }
}

void FileHandle::close() {
    if (fd_ < 0) return;
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) < 0) {
        throw IOError("Failed to close", path_, errno);
    }
    DEBUG_LOG("file", "closed ", path_);
}
