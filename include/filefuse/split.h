#pragma once

#include "filefuse/errors.h"
#include "filefuse/options.h"

#include <cstddef>
#include <cstdint>

namespace filefuse {

struct SplitResult {
    // Size of the source as reported by the filesystem when it was opened.
    std::uint64_t fileSize{0};
    // Number of chunk files written, named 0 .. totalChunks - 1.
    std::size_t totalChunks{0};
};

using SplitOutcome = OperationResult<SplitResult, SplitError>;

/**
 * Splits options.inFile into chunkSize pieces written to options.outDir.
 *
 * The output directory is created when missing. Existing chunk files with
 * the same names are truncated; unrelated files in the directory are left
 * alone. A failure can leave the chunks written so far on disk.
 */
SplitOutcome split(const SplitOptions &options);

}  // namespace filefuse
