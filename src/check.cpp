#include "filefuse/check.h"

#include "filefuse/chunk_layout.h"
#include "filefuse/file_io.h"
#include "filefuse/logging.h"

#include <trantor/utils/Logger.h>

#include <filesystem>
#include <system_error>
#include <vector>

namespace filefuse {
namespace {

namespace fs = std::filesystem;

VerifyOutcome fail(CheckError error) {
    LOG_WARN << "check could not run: " << std::string(errorCode(error));
    return VerifyOutcome::failure(error);
}

}  // namespace

VerifyOutcome verify(const CheckOptions &options) {
    if (!options.inDir) {
        return fail(CheckError::InDirNotSet);
    }
    const fs::path &inDir = *options.inDir;
    ScopedLogContext logContext(LogContext{"check", inDir.string()});

    std::error_code ec;
    const auto dirStatus = fs::status(inDir, ec);
    if (dirStatus.type() == fs::file_type::none) {
        LOG_WARN << "cannot stat " << inDir.string() << ": " << ec.message();
        return fail(CheckError::InFileNotOpened);
    }
    if (!fs::exists(dirStatus)) {
        return fail(CheckError::InDirNotFound);
    }
    if (!fs::is_directory(dirStatus)) {
        return fail(CheckError::InDirNotDir);
    }
    if (!options.fileSize) {
        return fail(CheckError::FileSizeNotSet);
    }
    if (!options.totalChunks) {
        return fail(CheckError::TotalChunksNotSet);
    }

    const std::uint64_t expectedSize = *options.fileSize;
    const std::size_t totalChunks = *options.totalChunks;

    std::uint64_t actualSize = 0;
    std::vector<std::size_t> missing;

    // Every index is visited so the report names all missing chunks.
    for (std::size_t index = 0; index < totalChunks; ++index) {
        const auto target = chunkPath(inDir, index);
        if (!fs::is_regular_file(fs::status(target, ec))) {
            missing.push_back(index);
            continue;
        }

        BufferedReader chunk(target, 0);
        if (!chunk.isOpen()) {
            LOG_DEBUG << "chunk " << index << " not readable: " << describeErrno(chunk.lastErrno());
            missing.push_back(index);
            continue;
        }

        const auto chunkSize = chunk.size();
        if (!chunkSize) {
            LOG_WARN << "cannot stat chunk " << target.string() << ": " << describeErrno(chunk.lastErrno());
            return VerifyOutcome::failure(CheckError::InFileNotRead);
        }
        actualSize += *chunkSize;
    }

    CheckReport report;
    if (!missing.empty()) {
        LOG_INFO << missing.size() << " of " << totalChunks << " chunks missing";
        report.finding = MissingChunks{std::move(missing)};
    } else if (actualSize != expectedSize) {
        LOG_INFO << "size mismatch: expected " << expectedSize << " bytes, found " << actualSize;
        report.finding = SizeMismatch{expectedSize, actualSize};
    } else {
        LOG_INFO << "all " << totalChunks << " chunks present (" << actualSize << " bytes)";
    }
    return VerifyOutcome::success(std::move(report));
}

CheckOutcome toCheckOutcome(const VerifyOutcome &outcome) {
    if (!outcome.ok()) {
        return CheckOutcome::failure(CheckFailure{*outcome.error, std::nullopt, std::nullopt});
    }
    const auto &report = *outcome.data;
    if (const auto *missing = report.missingChunks()) {
        return CheckOutcome::failure(CheckFailure{CheckError::MissingChunks, *missing, std::nullopt});
    }
    if (const auto *mismatch = report.sizeMismatch()) {
        return CheckOutcome::failure(CheckFailure{CheckError::SizeMismatch, std::nullopt, *mismatch});
    }
    return CheckOutcome::success(true);
}

CheckOutcome check(const CheckOptions &options) {
    return toCheckOutcome(verify(options));
}

}  // namespace filefuse
