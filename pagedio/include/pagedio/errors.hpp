#pragma once
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

// I/O failure reported by the operating system.
struct IOError : public std::runtime_error {
    int err;
    std::string path;
    IOError(const std::string& msg, const std::string& p, int e)
        : std::runtime_error(msg + " '" + p + "': " + std::strerror(e)), err(e), path(p) {}
};

struct ClosedError : public std::runtime_error {
    ClosedError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

struct RangeError : public std::out_of_range {
    int64_t offset;
    RangeError(const std::string& msg, int64_t o)
        : std::out_of_range(msg + " (offset " + std::to_string(o) + ")"), offset(o) {}
};

struct EndOfFileError : public std::runtime_error {
    EndOfFileError(std::string msg) : std::runtime_error(std::move(msg)) {}
};
