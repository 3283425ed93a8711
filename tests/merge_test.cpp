#include "filefuse/merge.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "test_support.h"

namespace {

namespace fs = std::filesystem;

using filefuse::MergeError;
using filefuse::MergeOptions;
using filefuse::testing::readFile;
using filefuse::testing::ScopedTempDir;
using filefuse::testing::writeFile;

class MergeTest : public ::testing::Test {
   protected:
    void SetUp() override {
        chunks_ = dir_ / "chunks";
        fs::create_directories(chunks_);
    }

    MergeOptions options() const { return MergeOptions{}.withInDir(chunks_).withOutFile(dir_ / "out.bin"); }

    ScopedTempDir dir_;
    fs::path chunks_;
};

TEST_F(MergeTest, ConcatenatesInNumericOrder) {
    writeFile(chunks_ / "10", "c");
    writeFile(chunks_ / "2", "b");
    writeFile(chunks_ / "1", "a");

    const auto outcome = filefuse::merge(options());
    ASSERT_TRUE(outcome.ok());
    EXPECT_TRUE(*outcome.data);
    EXPECT_EQ(readFile(dir_ / "out.bin"), "abc");
}

TEST_F(MergeTest, GapsAreNotDetected) {
    writeFile(chunks_ / "0", "first-");
    writeFile(chunks_ / "5", "last");
    ASSERT_TRUE(filefuse::merge(options()).ok());
    EXPECT_EQ(readFile(dir_ / "out.bin"), "first-last");
}

TEST_F(MergeTest, SmallBufferCopiesEverything) {
    const auto first = filefuse::testing::patternBytes(100);
    const auto second = filefuse::testing::patternBytes(37);
    writeFile(chunks_ / "0", first);
    writeFile(chunks_ / "1", second);

    ASSERT_TRUE(filefuse::merge(options().withBufferCapacity(1)).ok());
    EXPECT_EQ(readFile(dir_ / "out.bin"), first + second);
}

TEST_F(MergeTest, EmptyDirectoryFails) {
    const auto outcome = filefuse::merge(options());
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(*outcome.error, MergeError::InDirNoFile);
}

TEST_F(MergeTest, SubdirectoriesAreSkipped) {
    fs::create_directory(chunks_ / "7");
    writeFile(chunks_ / "3", "only");
    ASSERT_TRUE(filefuse::merge(options()).ok());
    EXPECT_EQ(readFile(dir_ / "out.bin"), "only");

    fs::remove(chunks_ / "3");
    EXPECT_EQ(*filefuse::merge(options()).error, MergeError::InDirNoFile);
}

TEST_F(MergeTest, NonNumericNameFails) {
    writeFile(chunks_ / "0", "a");
    writeFile(chunks_ / "readme.txt", "b");
    const auto outcome = filefuse::merge(options());
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(*outcome.error, MergeError::InFileNameInvalid);
}

TEST_F(MergeTest, ListingFailureKeepsExistingOutput) {
    writeFile(dir_ / "out.bin", "keep me");
    ASSERT_FALSE(filefuse::merge(options()).ok());
    EXPECT_EQ(readFile(dir_ / "out.bin"), "keep me");
}

TEST_F(MergeTest, ReplacesExistingFileAndDirectory) {
    writeFile(chunks_ / "0", "fresh");

    writeFile(dir_ / "out.bin", "a much longer previous file");
    ASSERT_TRUE(filefuse::merge(options()).ok());
    EXPECT_EQ(readFile(dir_ / "out.bin"), "fresh");

    fs::remove(dir_ / "out.bin");
    fs::create_directories(dir_ / "out.bin" / "inner");
    writeFile(dir_ / "out.bin" / "inner" / "file", "x");
    ASSERT_TRUE(filefuse::merge(options()).ok());
    ASSERT_TRUE(fs::is_regular_file(dir_ / "out.bin"));
    EXPECT_EQ(readFile(dir_ / "out.bin"), "fresh");
}

TEST_F(MergeTest, CreatesParentDirectories) {
    writeFile(chunks_ / "0", "data");
    const auto target = dir_ / "nested" / "deeper" / "out.bin";
    ASSERT_TRUE(filefuse::merge(options().withOutFile(target)).ok());
    EXPECT_EQ(readFile(target), "data");
}

TEST_F(MergeTest, ParentThatIsAFileCannotBeCreated) {
    writeFile(chunks_ / "0", "data");
    writeFile(dir_ / "blocker", "x");
    const auto outcome = filefuse::merge(options().withOutFile(dir_ / "blocker" / "out.bin"));
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(*outcome.error, MergeError::OutDirNotCreated);
}

TEST_F(MergeTest, PreconditionFailures) {
    EXPECT_EQ(*filefuse::merge(MergeOptions{}).error, MergeError::InDirNotSet);
    EXPECT_EQ(*filefuse::merge(options().withInDir(dir_ / "absent")).error, MergeError::InDirNotFound);

    writeFile(dir_ / "plain", "x");
    EXPECT_EQ(*filefuse::merge(options().withInDir(dir_ / "plain")).error, MergeError::InDirNotDir);
    EXPECT_EQ(*filefuse::merge(MergeOptions{}.withInDir(chunks_)).error, MergeError::OutFileNotSet);
    EXPECT_EQ(*filefuse::merge(options().withBufferCapacity(0)).error, MergeError::BufferCapacityInvalid);
}

TEST_F(MergeTest, BufferCapacityFarBeyondChunkSizes) {
    writeFile(chunks_ / "0", "big ");
    writeFile(chunks_ / "1", "buffer");
    ASSERT_TRUE(filefuse::merge(options().withBufferCapacity(std::size_t{1} << 50)).ok());
    EXPECT_EQ(readFile(dir_ / "out.bin"), "big buffer");
}

TEST_F(MergeTest, UnreadableDirectoryPathIsNotReportedAsMissing) {
    const auto outcome = filefuse::merge(options().withInDir(dir_ / std::string(300, 'x')));
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(*outcome.error, MergeError::InDirNotRead);
}

}  // namespace
