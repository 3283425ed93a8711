#include "filefuse/chunk_layout.h"

#include <gtest/gtest.h>

#include <limits>
#include <string>

namespace {

TEST(ChunkLayoutTest, NamesAreUnpaddedDecimal) {
    EXPECT_EQ(filefuse::chunkFileName(0), "0");
    EXPECT_EQ(filefuse::chunkFileName(7), "7");
    EXPECT_EQ(filefuse::chunkFileName(10), "10");
    EXPECT_EQ(filefuse::chunkPath("/tmp/chunks", 12).string(), "/tmp/chunks/12");
}

TEST(ChunkLayoutTest, ParsesDigitsOnly) {
    EXPECT_EQ(filefuse::parseChunkIndex("0"), 0u);
    EXPECT_EQ(filefuse::parseChunkIndex("42"), 42u);
    EXPECT_EQ(filefuse::parseChunkIndex("007"), 7u);

    EXPECT_FALSE(filefuse::parseChunkIndex("").has_value());
    EXPECT_FALSE(filefuse::parseChunkIndex("-1").has_value());
    EXPECT_FALSE(filefuse::parseChunkIndex("+1").has_value());
    EXPECT_FALSE(filefuse::parseChunkIndex(" 1").has_value());
    EXPECT_FALSE(filefuse::parseChunkIndex("1 ").has_value());
    EXPECT_FALSE(filefuse::parseChunkIndex("1a").has_value());
    EXPECT_FALSE(filefuse::parseChunkIndex("chunk").has_value());
    EXPECT_FALSE(filefuse::parseChunkIndex(".DS_Store").has_value());
}

TEST(ChunkLayoutTest, RejectsOverflow) {
    const auto tooLarge = std::to_string(std::numeric_limits<std::size_t>::max()) + "0";
    EXPECT_FALSE(filefuse::parseChunkIndex(tooLarge).has_value());
}

TEST(ChunkLayoutTest, NameRoundTrips) {
    for (std::size_t index : {std::size_t{0}, std::size_t{1}, std::size_t{99}, std::size_t{123456}}) {
        EXPECT_EQ(filefuse::parseChunkIndex(filefuse::chunkFileName(index)), index);
    }
}

}  // namespace
