#pragma once

#include "filefuse/options.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace YAML {
class Node;
}  // namespace YAML

namespace filefuse {

struct AppConfig {
    std::size_t chunkSize{kDefaultChunkSize};
    std::size_t bufferCapacity{kDefaultBufferCapacity};
    // 0 lets the async runner pick the hardware concurrency.
    std::size_t workers{0};
    std::string logLevel{"info"};
};

// "4096", "64K", "2MiB", "1gb": binary multiples, case-insensitive suffix.
// Throws std::invalid_argument for zero, garbage or overflow.
std::uint64_t parseByteSize(std::string_view text);

// Reads the `fuse` and `logging` sections, then applies FILEFUSE_CHUNK_SIZE,
// FILEFUSE_BUFFER_CAPACITY, FILEFUSE_WORKERS and LOG_LEVEL on top.
AppConfig loadAppConfig(const YAML::Node &config);

SplitOptions splitOptionsFrom(const AppConfig &config);
MergeOptions mergeOptionsFrom(const AppConfig &config);

}  // namespace filefuse
