#include "filefuse/app_config.h"

#include "filefuse/environment.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>

namespace filefuse {
namespace {

std::string_view trim(std::string_view input) {
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.front()))) {
        input.remove_prefix(1);
    }
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.back()))) {
        input.remove_suffix(1);
    }
    return input;
}

std::string toLower(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

std::uint64_t suffixMultiplier(const std::string &suffix) {
    if (suffix.empty() || suffix == "b") {
        return 1;
    }
    if (suffix == "k" || suffix == "kb" || suffix == "kib") {
        return std::uint64_t{1} << 10;
    }
    if (suffix == "m" || suffix == "mb" || suffix == "mib") {
        return std::uint64_t{1} << 20;
    }
    if (suffix == "g" || suffix == "gb" || suffix == "gib") {
        return std::uint64_t{1} << 30;
    }
    return 0;
}

std::size_t toSize(std::uint64_t value, std::string_view key) {
    if (value > std::numeric_limits<std::size_t>::max()) {
        throw std::invalid_argument(std::string(key) + " does not fit in memory: " + std::to_string(value));
    }
    return static_cast<std::size_t>(value);
}

std::size_t parseWorkers(const std::string &value) {
    std::size_t workers = 0;
    const auto *end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, workers);
    if (ec != std::errc{} || ptr != end) {
        throw std::invalid_argument("FILEFUSE_WORKERS is not a number: " + value);
    }
    return workers;
}

}  // namespace

std::uint64_t parseByteSize(std::string_view text) {
    const auto trimmed = trim(text);
    std::size_t digits = 0;
    while (digits < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        throw std::invalid_argument("Invalid byte size: '" + std::string(text) + "'");
    }

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + digits, value);
    if (ec != std::errc{}) {
        throw std::invalid_argument("Byte size out of range: '" + std::string(text) + "'");
    }

    const auto multiplier = suffixMultiplier(toLower(trim(trimmed.substr(digits))));
    if (multiplier == 0) {
        throw std::invalid_argument("Unknown byte size suffix: '" + std::string(text) + "'");
    }
    if (value == 0) {
        throw std::invalid_argument("Byte size must be positive: '" + std::string(text) + "'");
    }
    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        throw std::invalid_argument("Byte size out of range: '" + std::string(text) + "'");
    }
    return value * multiplier;
}

AppConfig loadAppConfig(const YAML::Node &config) {
    AppConfig result{};

    if (config) {
        if (auto fuse = config["fuse"]; fuse) {
            if (auto chunkSize = fuse["chunk_size"]; chunkSize) {
                result.chunkSize = toSize(parseByteSize(chunkSize.as<std::string>()), "fuse.chunk_size");
            }
            if (auto bufferCapacity = fuse["buffer_capacity"]; bufferCapacity) {
                result.bufferCapacity =
                    toSize(parseByteSize(bufferCapacity.as<std::string>()), "fuse.buffer_capacity");
            }
            if (auto workers = fuse["workers"]; workers) {
                result.workers = parseWorkers(workers.as<std::string>());
            }
        }
        if (auto logging = config["logging"]; logging) {
            result.logLevel = logging["level"].as<std::string>(result.logLevel);
        }
    }

    if (auto chunkSize = getEnv("FILEFUSE_CHUNK_SIZE"); chunkSize && !chunkSize->empty()) {
        result.chunkSize = toSize(parseByteSize(*chunkSize), "FILEFUSE_CHUNK_SIZE");
    }
    if (auto bufferCapacity = getEnv("FILEFUSE_BUFFER_CAPACITY"); bufferCapacity && !bufferCapacity->empty()) {
        result.bufferCapacity = toSize(parseByteSize(*bufferCapacity), "FILEFUSE_BUFFER_CAPACITY");
    }
    if (auto workers = getEnv("FILEFUSE_WORKERS"); workers && !workers->empty()) {
        result.workers = parseWorkers(*workers);
    }
    result.logLevel = getEnvOrDefault("LOG_LEVEL", result.logLevel);

    return result;
}

SplitOptions splitOptionsFrom(const AppConfig &config) {
    return SplitOptions{}.withChunkSize(config.chunkSize).withBufferCapacity(config.bufferCapacity);
}

MergeOptions mergeOptionsFrom(const AppConfig &config) {
    return MergeOptions{}.withBufferCapacity(config.bufferCapacity);
}

}  // namespace filefuse
