#include "filefuse/split.h"

#include "filefuse/chunk_layout.h"
#include "filefuse/file_io.h"
#include "filefuse/logging.h"

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <span>
#include <system_error>
#include <vector>

namespace filefuse {
namespace {

namespace fs = std::filesystem;

SplitOutcome fail(SplitError error) {
    LOG_WARN << "split failed: " << std::string(errorCode(error));
    return SplitOutcome::failure(error);
}

// Bounded by what one chunk of this file can hold; at least one byte so the
// end of file is still observed.
std::size_t blockSizeFor(const SplitOptions &options, std::uint64_t fileSize) {
    const auto limit = std::min<std::uint64_t>({options.bufferCapacity, options.chunkSize, fileSize});
    return static_cast<std::size_t>(std::max<std::uint64_t>(limit, 1));
}

}  // namespace

SplitOutcome split(const SplitOptions &options) {
    if (!options.inFile) {
        return fail(SplitError::InFileNotSet);
    }
    const fs::path &inFile = *options.inFile;
    ScopedLogContext logContext(LogContext{"split", inFile.string()});

    std::error_code ec;
    const auto inStatus = fs::status(inFile, ec);
    if (inStatus.type() == fs::file_type::none) {
        LOG_WARN << "cannot stat " << inFile.string() << ": " << ec.message();
        return fail(SplitError::InFileNotOpened);
    }
    if (!fs::exists(inStatus)) {
        return fail(SplitError::InFileNotFound);
    }
    if (!fs::is_regular_file(inStatus)) {
        return fail(SplitError::InFileNotFile);
    }

    if (!options.outDir) {
        return fail(SplitError::OutDirNotSet);
    }
    const fs::path &outDir = *options.outDir;

    if (options.chunkSize == 0) {
        return fail(SplitError::ChunkSizeInvalid);
    }
    if (options.bufferCapacity == 0) {
        return fail(SplitError::BufferCapacityInvalid);
    }

    const auto outStatus = fs::status(outDir, ec);
    if (outStatus.type() == fs::file_type::none) {
        LOG_WARN << "cannot stat " << outDir.string() << ": " << ec.message();
        return fail(SplitError::OutDirNotCreated);
    }
    if (!fs::exists(outStatus)) {
        fs::create_directories(outDir, ec);
        if (ec) {
            LOG_WARN << "cannot create " << outDir.string() << ": " << ec.message();
            return fail(SplitError::OutDirNotCreated);
        }
    } else if (!fs::is_directory(outStatus)) {
        return fail(SplitError::OutDirNotDir);
    }

    // Unbuffered: every read lands directly in `block`.
    BufferedReader reader(inFile, 0);
    if (!reader.isOpen()) {
        LOG_WARN << "cannot open " << inFile.string() << ": " << describeErrno(reader.lastErrno());
        return fail(SplitError::InFileNotOpened);
    }

    const auto fileSize = reader.size();
    if (!fileSize) {
        LOG_WARN << "cannot stat " << inFile.string() << ": " << describeErrno(reader.lastErrno());
        return fail(SplitError::InFileNotRead);
    }

    std::vector<char> block(blockSizeFor(options, *fileSize));
    const std::uint64_t chunkSize = options.chunkSize;
    std::size_t totalChunks = 0;
    bool exhausted = false;

    auto readBlock = [&](std::uint64_t chunkRemaining) {
        const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(block.size(), chunkRemaining));
        return reader.read(std::span<char>(block.data(), wanted));
    };

    while (!exhausted) {
        // The chunk file is only created once it has at least one byte.
        auto received = readBlock(chunkSize);
        if (!received) {
            LOG_WARN << "read failed after " << totalChunks << " chunks: " << describeErrno(reader.lastErrno());
            return fail(SplitError::InFileNotRead);
        }
        if (*received == 0) {
            break;
        }

        const auto target = chunkPath(outDir, totalChunks);
        BufferedWriter writer(target, block.size());
        if (!writer.isOpen()) {
            LOG_WARN << "cannot open chunk " << target.string() << ": " << describeErrno(writer.lastErrno());
            return fail(SplitError::OutFileNotOpened);
        }

        std::uint64_t chunkBytes = 0;
        while (true) {
            if (!writer.write(std::span<const char>(block.data(), *received))) {
                LOG_WARN << "cannot write chunk " << target.string() << ": " << describeErrno(writer.lastErrno());
                return fail(SplitError::OutFileNotWritten);
            }
            chunkBytes += *received;
            if (chunkBytes == chunkSize) {
                break;
            }
            received = readBlock(chunkSize - chunkBytes);
            if (!received) {
                LOG_WARN << "read failed in chunk " << totalChunks << ": " << describeErrno(reader.lastErrno());
                return fail(SplitError::InFileNotRead);
            }
            if (*received == 0) {
                exhausted = true;
                break;
            }
        }

        if (!writer.close()) {
            LOG_WARN << "cannot write chunk " << target.string() << ": " << describeErrno(writer.lastErrno());
            return fail(SplitError::OutFileNotWritten);
        }

        LOG_DEBUG << "chunk " << totalChunks << " written (" << chunkBytes << " bytes)";
        ++totalChunks;
    }

    LOG_INFO << "split " << inFile.string() << " into " << totalChunks << " chunks (" << *fileSize << " bytes)";
    return SplitOutcome::success(SplitResult{*fileSize, totalChunks});
}

}  // namespace filefuse
