#include <gtest/gtest.h>
#include <filesystem>
#include "pagedio/errors.hpp"
#include "pagedio/paged_file_reader.hpp"
#include "pagedio/random_access_read_view.hpp"
#include "temp_file.hpp"

class ReadViewTest : public ::testing::Test {
protected:
    std::string path;
    std::unique_ptr<PagedFileReader> reader;

    void SetUp() override {
        path = temp_file("view");
        write_file(path, pattern_bytes(500));
        ReaderOptions options;
        options.page_size_shift = 6;
        options.max_cached_pages = 4;
        reader = std::make_unique<PagedFileReader>(path, options);
    }
    void TearDown() override {
        reader.reset();
        std::filesystem::remove(path);
    }
};

TEST_F(ReadViewTest, ReadsOnlyInsideWindow) {
    auto view = reader->create_view(100, 50);
    EXPECT_EQ(view->length(), 50);
    EXPECT_EQ(view->get_position(), 0);
    std::vector<uint8_t> out;
    int b;
    while ((b = view->read()) != END_OF_FILE) out.push_back(static_cast<uint8_t>(b));
    ASSERT_EQ(out.size(), 50u);
    for (size_t i = 0; i < out.size(); i++) EXPECT_EQ(out[i], 100 + i);
    EXPECT_TRUE(view->is_eof());
    EXPECT_EQ(view->available(), 0);
}

TEST_F(ReadViewTest, BufferedReadClippedToWindow) {
    auto view = reader->create_view(120, 10);
    std::vector<uint8_t> buf(64);
    EXPECT_EQ(view->read(buf), 8); // page boundary at 128
    EXPECT_EQ(view->read(buf), 2);
    EXPECT_EQ(buf[0], 128);
    EXPECT_EQ(buf[1], 129);
    EXPECT_EQ(view->read(buf), END_OF_FILE);
}

TEST_F(ReadViewTest, SeekIsRelativeAndClamped) {
    auto view = reader->create_view(200, 40);
    view->seek(5);
    EXPECT_EQ(view->read(), 205);
    view->seek(1000);
    EXPECT_EQ(view->get_position(), 40);
    EXPECT_EQ(view->read(), END_OF_FILE);
    EXPECT_THROW(view->seek(-1), RangeError);
}

TEST_F(ReadViewTest, PeekAndRewind) {
    auto view = reader->create_view(10, 20);
    view->skip(3);
    EXPECT_EQ(view->peek(), 13);
    EXPECT_EQ(view->get_position(), 3);
    view->read();
    view->rewind(2);
    EXPECT_EQ(view->get_position(), 2);
    EXPECT_EQ(view->read(), 12);
    EXPECT_THROW(view->rewind(10), RangeError);
}

TEST_F(ReadViewTest, ParentPositionDoesNotLeakIntoView) {
    auto view = reader->create_view(300, 100);
    view->seek(10);
    reader->seek(0);
    EXPECT_EQ(reader->read(), 0);
    EXPECT_EQ(view->read(), 310 % 256);
    EXPECT_EQ(view->get_position(), 11);
}

TEST_F(ReadViewTest, SharesParentCache) {
    auto view = reader->create_view(64, 64);
    view->read_fully(64);
    auto misses = reader->get_stats().misses;
    reader->seek(0);
    reader->seek(70);
    EXPECT_EQ(reader->get_stats().misses, misses);
}

TEST_F(ReadViewTest, WindowPastParentEndStopsAtParentEof) {
    auto view = reader->create_view(490, 50);
    std::vector<uint8_t> buf(64);
    EXPECT_EQ(view->read(buf), 10);
    EXPECT_EQ(view->read(buf), END_OF_FILE);
    EXPECT_EQ(view->read(), END_OF_FILE);
}

TEST_F(ReadViewTest, NestedViewTranslatesOffsets) {
    auto outer = reader->create_view(100, 100);
    auto inner = outer->create_view(20, 500);
    EXPECT_EQ(inner->length(), 80);
    EXPECT_EQ(inner->read(), 120);
    EXPECT_THROW(outer->create_view(101, 1), RangeError);
}

TEST_F(ReadViewTest, CloseLeavesParentOpenByDefault) {
    auto view = reader->create_view(0, 10);
    view->close();
    EXPECT_TRUE(view->is_closed());
    EXPECT_FALSE(reader->is_closed());
    EXPECT_THROW(view->read(), ClosedError);
    EXPECT_THROW(view->get_position(), ClosedError);
    view->close();
}

TEST_F(ReadViewTest, CloseParentWhenRequested) {
    RandomAccessReadView view(*reader, 0, 10, true);
    view.close();
    EXPECT_TRUE(reader->is_closed());
}

TEST_F(ReadViewTest, ClosedParentClosesView) {
    auto view = reader->create_view(0, 10);
    reader->close();
    EXPECT_TRUE(view->is_closed());
    EXPECT_THROW(view->read(), ClosedError);
}

TEST_F(ReadViewTest, NegativeBoundsRejected) {
    EXPECT_THROW((RandomAccessReadView(*reader, -1, 10)), RangeError);
    EXPECT_THROW((RandomAccessReadView(*reader, 0, -10)), RangeError);
}
