#include <gtest/gtest.h>
#include <cerrno>
#include <filesystem>
#include "pagedio/errors.hpp"
#include "pagedio/file_handle.hpp"
#include "temp_file.hpp"

class FileHandleTest : public ::testing::Test {
protected:
    std::vector<std::string> paths;
    std::string make_file(const std::string& name, const std::vector<uint8_t>& data) {
        auto path = temp_file(name);
        write_file(path, data);
        paths.push_back(path);
        return path;
    }
    void TearDown() override {
        for (auto& p : paths) std::filesystem::remove(p);
    }
};

TEST_F(FileHandleTest, OpenReportsLength) {
    auto path = make_file("length", pattern_bytes(5000));
    FileHandle fh(path);
    EXPECT_TRUE(fh.is_open());
    EXPECT_EQ(fh.length(), 5000u);
    EXPECT_EQ(fh.path(), path);
}

TEST_F(FileHandleTest, MissingFileThrowsIOError) {
    auto path = temp_file("missing");
    try {
        FileHandle fh(path);
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.err, ENOENT);
        EXPECT_EQ(e.path, path);
    }
}

TEST_F(FileHandleTest, SeekAndReadInto) {
    auto path = make_file("seek_read", pattern_bytes(1000));
    FileHandle fh(path);
    fh.seek(300);
    std::vector<uint8_t> buf(10);
    size_t n = fh.read_into(buf.data(), buf.size());
    ASSERT_EQ(n, 10u);
    for (size_t i = 0; i < n; i++) EXPECT_EQ(buf[i], (300 + i) % 256);
}

TEST_F(FileHandleTest, ReadAtEndReturnsZero) {
    auto path = make_file("at_end", pattern_bytes(64));
    FileHandle fh(path);
    fh.seek(60);
    std::vector<uint8_t> buf(16);
    size_t total = 0;
    size_t n;
    while ((n = fh.read_into(buf.data() + total, buf.size() - total)) > 0) total += n;
    EXPECT_EQ(total, 4u);
    fh.seek(1000);
    EXPECT_EQ(fh.read_into(buf.data(), buf.size()), 0u);
}

TEST_F(FileHandleTest, CloseIsTerminal) {
    auto path = make_file("close", pattern_bytes(16));
    FileHandle fh(path);
    fh.close();
    EXPECT_FALSE(fh.is_open());
    fh.close();
    uint8_t b;
    EXPECT_THROW(fh.seek(0), ClosedError);
    EXPECT_THROW(fh.read_into(&b, 1), ClosedError);
}

TEST_F(FileHandleTest, MoveTransfersDescriptor) {
    auto path = make_file("move", pattern_bytes(32));
    FileHandle a(path);
    FileHandle b(std::move(a));
    EXPECT_FALSE(a.is_open());
    ASSERT_TRUE(b.is_open());
    b.seek(31);
    uint8_t byte = 0;
    EXPECT_EQ(b.read_into(&byte, 1), 1u);
    EXPECT_EQ(byte, 31);
}
