#pragma once

#include "filefuse/errors.h"
#include "filefuse/options.h"

namespace filefuse {

using MergeOutcome = OperationResult<bool, MergeError>;

/**
 * Concatenates every regular file of options.inDir into options.outFile, in
 * ascending numeric order of the file names.
 *
 * Entries that are not regular files are skipped. A file name that is not a
 * decimal index fails the merge before the output is touched. Whatever
 * occupies outFile is removed first, a directory recursively.
 *
 * A read or write failure while copying leaves the partially written output
 * file in place; it is not cleaned up.
 */
MergeOutcome merge(const MergeOptions &options);

}  // namespace filefuse
