#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace filefuse {

inline constexpr std::size_t kDefaultChunkSize = 2 * 1024 * 1024;
inline constexpr std::size_t kDefaultBufferCapacity = 1024 * 1024;

// Options are plain values. The with* helpers return a modified copy so a
// configuration can be spelled out in one expression.
struct SplitOptions {
    std::optional<std::filesystem::path> inFile;
    std::optional<std::filesystem::path> outDir;
    std::size_t chunkSize{kDefaultChunkSize};
    std::size_t bufferCapacity{kDefaultBufferCapacity};

    [[nodiscard]] SplitOptions withInFile(std::filesystem::path path) const {
        auto copy = *this;
        copy.inFile = std::move(path);
        return copy;
    }

    [[nodiscard]] SplitOptions withOutDir(std::filesystem::path path) const {
        auto copy = *this;
        copy.outDir = std::move(path);
        return copy;
    }

    [[nodiscard]] SplitOptions withChunkSize(std::size_t size) const {
        auto copy = *this;
        copy.chunkSize = size;
        return copy;
    }

    [[nodiscard]] SplitOptions withBufferCapacity(std::size_t capacity) const {
        auto copy = *this;
        copy.bufferCapacity = capacity;
        return copy;
    }
};

struct CheckOptions {
    std::optional<std::filesystem::path> inDir;
    std::optional<std::uint64_t> fileSize;
    std::optional<std::size_t> totalChunks;

    [[nodiscard]] CheckOptions withInDir(std::filesystem::path path) const {
        auto copy = *this;
        copy.inDir = std::move(path);
        return copy;
    }

    [[nodiscard]] CheckOptions withFileSize(std::uint64_t size) const {
        auto copy = *this;
        copy.fileSize = size;
        return copy;
    }

    [[nodiscard]] CheckOptions withTotalChunks(std::size_t chunks) const {
        auto copy = *this;
        copy.totalChunks = chunks;
        return copy;
    }
};

struct MergeOptions {
    std::optional<std::filesystem::path> inDir;
    std::optional<std::filesystem::path> outFile;
    std::size_t bufferCapacity{kDefaultBufferCapacity};

    [[nodiscard]] MergeOptions withInDir(std::filesystem::path path) const {
        auto copy = *this;
        copy.inDir = std::move(path);
        return copy;
    }

    [[nodiscard]] MergeOptions withOutFile(std::filesystem::path path) const {
        auto copy = *this;
        copy.outFile = std::move(path);
        return copy;
    }

    [[nodiscard]] MergeOptions withBufferCapacity(std::size_t capacity) const {
        auto copy = *this;
        copy.bufferCapacity = capacity;
        return copy;
    }
};

}  // namespace filefuse
