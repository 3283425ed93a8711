#include "filefuse/check.h"
#include "filefuse/merge.h"
#include "filefuse/split.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "test_support.h"

namespace {

namespace fs = std::filesystem;

using filefuse::testing::readFile;
using filefuse::testing::ScopedTempDir;

std::size_t expectedChunks(std::size_t fileSize, std::size_t chunkSize) {
    return (fileSize + chunkSize - 1) / chunkSize;
}

// Split, verify, merge and compare for one input and one geometry.
void roundTrip(const std::string &data, std::size_t chunkSize, std::size_t bufferCapacity) {
    SCOPED_TRACE("size " + std::to_string(data.size()) + " chunk " + std::to_string(chunkSize) + " buffer " +
                 std::to_string(bufferCapacity));
    ScopedTempDir dir;
    filefuse::testing::writeFile(dir / "input", data);

    const auto split = filefuse::split(filefuse::SplitOptions{}
                                           .withInFile(dir / "input")
                                           .withOutDir(dir / "chunks")
                                           .withChunkSize(chunkSize)
                                           .withBufferCapacity(bufferCapacity));
    ASSERT_TRUE(split.ok());
    EXPECT_EQ(split.data->fileSize, data.size());
    EXPECT_EQ(split.data->totalChunks, expectedChunks(data.size(), chunkSize));

    for (std::size_t i = 0; i < split.data->totalChunks; ++i) {
        const auto chunkBytes = fs::file_size(dir / "chunks" / std::to_string(i));
        if (i + 1 < split.data->totalChunks) {
            EXPECT_EQ(chunkBytes, chunkSize);
        } else {
            EXPECT_GE(chunkBytes, 1u);
            EXPECT_LE(chunkBytes, chunkSize);
        }
    }

    const auto checked = filefuse::check(filefuse::CheckOptions{}
                                             .withInDir(dir / "chunks")
                                             .withFileSize(split.data->fileSize)
                                             .withTotalChunks(split.data->totalChunks));
    ASSERT_TRUE(checked.ok());

    if (split.data->totalChunks == 0) {
        return;
    }
    const auto merged = filefuse::merge(filefuse::MergeOptions{}
                                            .withInDir(dir / "chunks")
                                            .withOutFile(dir / "restored")
                                            .withBufferCapacity(bufferCapacity));
    ASSERT_TRUE(merged.ok());
    EXPECT_EQ(readFile(dir / "restored"), data);
}

TEST(RoundTripTest, EveryChunkSizeUpToBeyondFileSize) {
    const auto data = filefuse::testing::patternBytes(37);
    for (std::size_t chunkSize = 1; chunkSize <= data.size() + 3; ++chunkSize) {
        roundTrip(data, chunkSize, 8);
    }
}

TEST(RoundTripTest, BufferSmallerAndLargerThanChunk) {
    const auto data = filefuse::testing::patternBytes(100'003);
    roundTrip(data, 4096, 1);
    roundTrip(data, 4096, 100);
    roundTrip(data, 4096, 65536);
    roundTrip(data, 1 << 20, 4096);
}

TEST(RoundTripTest, EmptyFileHasNoChunks) {
    roundTrip(std::string{}, 1, 1);
    roundTrip(std::string{}, filefuse::kDefaultChunkSize, filefuse::kDefaultBufferCapacity);
}

TEST(RoundTripTest, DefaultGeometry) {
    const auto data = filefuse::testing::patternBytes(filefuse::kDefaultChunkSize * 2 + 17);
    roundTrip(data, filefuse::kDefaultChunkSize, filefuse::kDefaultBufferCapacity);
}

}  // namespace
