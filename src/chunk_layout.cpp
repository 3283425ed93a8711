#include "filefuse/chunk_layout.h"

#include <charconv>
#include <system_error>

namespace filefuse {

std::string chunkFileName(std::size_t index) {
    return std::to_string(index);
}

std::filesystem::path chunkPath(const std::filesystem::path &dir, std::size_t index) {
    return dir / chunkFileName(index);
}

std::optional<std::size_t> parseChunkIndex(std::string_view name) {
    if (name.empty()) {
        return std::nullopt;
    }
    // from_chars stops at the first non-digit; the whole name must be consumed.
    std::size_t value = 0;
    const auto *begin = name.data();
    const auto *end = name.data() + name.size();
    auto [ptr, ec] = std::from_chars(begin, end, value, 10);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace filefuse
