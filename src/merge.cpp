#include "filefuse/merge.h"

#include "filefuse/chunk_layout.h"
#include "filefuse/file_io.h"
#include "filefuse/logging.h"

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

namespace filefuse {
namespace {

namespace fs = std::filesystem;

struct ChunkEntry {
    std::size_t index{0};
    fs::path path;
    std::uint64_t size{0};
};

MergeOutcome fail(MergeError error) {
    LOG_WARN << "merge failed: " << std::string(errorCode(error));
    return MergeOutcome::failure(error);
}

// Regular files of `dir` in numeric name order.
std::optional<MergeError> listChunks(const fs::path &dir, std::vector<ChunkEntry> &entries) {
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc)) {
            continue;
        }
        const auto name = it->path().filename().string();
        auto index = parseChunkIndex(name);
        if (!index) {
            LOG_WARN << "not a chunk index: " << name;
            return MergeError::InFileNameInvalid;
        }
        std::error_code sizeEc;
        const auto size = it->file_size(sizeEc);
        entries.push_back(ChunkEntry{*index, it->path(), sizeEc ? 0 : size});
    }
    if (ec) {
        LOG_WARN << "cannot list " << dir.string() << ": " << ec.message();
        return MergeError::InDirNotRead;
    }
    if (entries.empty()) {
        return MergeError::InDirNoFile;
    }

    std::sort(entries.begin(), entries.end(), [](const ChunkEntry &lhs, const ChunkEntry &rhs) {
        return std::tie(lhs.index, lhs.path) < std::tie(rhs.index, rhs.path);
    });
    return std::nullopt;
}

}  // namespace

MergeOutcome merge(const MergeOptions &options) {
    if (!options.inDir) {
        return fail(MergeError::InDirNotSet);
    }
    const fs::path &inDir = *options.inDir;
    ScopedLogContext logContext(LogContext{"merge", inDir.string()});

    std::error_code ec;
    const auto dirStatus = fs::status(inDir, ec);
    if (dirStatus.type() == fs::file_type::none) {
        LOG_WARN << "cannot stat " << inDir.string() << ": " << ec.message();
        return fail(MergeError::InDirNotRead);
    }
    if (!fs::exists(dirStatus)) {
        return fail(MergeError::InDirNotFound);
    }
    if (!fs::is_directory(dirStatus)) {
        return fail(MergeError::InDirNotDir);
    }
    if (!options.outFile) {
        return fail(MergeError::OutFileNotSet);
    }
    const fs::path &outFile = *options.outFile;
    if (options.bufferCapacity == 0) {
        return fail(MergeError::BufferCapacityInvalid);
    }

    std::vector<ChunkEntry> entries;
    if (auto listError = listChunks(inDir, entries)) {
        return fail(*listError);
    }
    LOG_DEBUG << "merging " << entries.size() << " chunks";

    if (fs::exists(fs::symlink_status(outFile, ec))) {
        fs::remove_all(outFile, ec);
        if (ec) {
            LOG_WARN << "cannot remove " << outFile.string() << ": " << ec.message();
            return fail(MergeError::OutFileNotRemoved);
        }
    }
    if (const auto parent = outFile.parent_path(); !parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            LOG_WARN << "cannot create " << parent.string() << ": " << ec.message();
            return fail(MergeError::OutDirNotCreated);
        }
    }

    // The copy buffer is never larger than the biggest chunk.
    std::uint64_t largest = 1;
    for (const auto &entry : entries) {
        largest = std::max(largest, entry.size);
    }
    const auto blockSize = static_cast<std::size_t>(std::min<std::uint64_t>(options.bufferCapacity, largest));

    BufferedWriter writer(outFile, blockSize);
    if (!writer.isOpen()) {
        LOG_WARN << "cannot open " << outFile.string() << ": " << describeErrno(writer.lastErrno());
        return fail(MergeError::OutFileNotOpened);
    }

    std::vector<char> buffer(blockSize);
    std::uint64_t bytesWritten = 0;

    // On any failure below the partial output stays where it is.
    for (const auto &entry : entries) {
        BufferedReader reader(entry.path, 0);
        if (!reader.isOpen()) {
            LOG_WARN << "cannot open chunk " << entry.path.string() << ": " << describeErrno(reader.lastErrno());
            return fail(MergeError::InFileNotOpened);
        }

        while (true) {
            const auto received = reader.read(std::span<char>(buffer));
            if (!received) {
                LOG_WARN << "cannot read chunk " << entry.path.string() << ": "
                         << describeErrno(reader.lastErrno());
                return fail(MergeError::InFileNotRead);
            }
            if (*received == 0) {
                break;
            }
            if (!writer.write(std::span<const char>(buffer.data(), *received))) {
                LOG_WARN << "cannot write " << outFile.string() << ": " << describeErrno(writer.lastErrno());
                return fail(MergeError::OutFileNotWritten);
            }
            bytesWritten += *received;
        }
        LOG_DEBUG << "chunk " << entry.index << " appended";
    }

    if (!writer.close()) {
        LOG_WARN << "cannot flush " << outFile.string() << ": " << describeErrno(writer.lastErrno());
        return fail(MergeError::OutFileNotWritten);
    }

    LOG_INFO << "merged " << entries.size() << " chunks into " << outFile.string() << " (" << bytesWritten
             << " bytes)";
    return MergeOutcome::success(true);
}

}  // namespace filefuse
