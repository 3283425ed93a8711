#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace filefuse {

// Chunk i of a split lives in <dir>/<i>, decimal, unpadded, starting at 0.
std::string chunkFileName(std::size_t index);
std::filesystem::path chunkPath(const std::filesystem::path &dir, std::size_t index);

// Accepts ASCII digits only: no sign, no whitespace, no empty string.
// Leading zeros are tolerated. Overflowing values are rejected.
std::optional<std::size_t> parseChunkIndex(std::string_view name);

}  // namespace filefuse
