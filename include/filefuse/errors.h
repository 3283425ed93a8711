#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace filefuse {

enum class SplitError {
    InFileNotFound,
    InFileNotFile,
    InFileNotSet,
    InFileNotOpened,
    InFileNotRead,
    OutDirNotCreated,
    OutDirNotDir,
    OutDirNotSet,
    OutFileNotOpened,
    OutFileNotWritten,
    ChunkSizeInvalid,
    BufferCapacityInvalid,
};

enum class CheckError {
    InDirNotFound,
    InDirNotDir,
    InDirNotSet,
    InFileNotOpened,
    InFileNotRead,
    FileSizeNotSet,
    TotalChunksNotSet,
    MissingChunks,
    SizeMismatch,
};

enum class MergeError {
    InDirNotFound,
    InDirNotDir,
    InDirNotSet,
    InDirNotRead,
    InDirNoFile,
    InFileNotOpened,
    InFileNotRead,
    InFileNameInvalid,
    OutDirNotCreated,
    OutFileNotSet,
    OutFileNotRemoved,
    OutFileNotOpened,
    OutFileNotWritten,
    BufferCapacityInvalid,
};

// Stable snake_case identifiers, safe to branch on and to persist.
std::string_view errorCode(SplitError error);
std::string_view errorCode(CheckError error);
std::string_view errorCode(MergeError error);

std::string_view errorMessage(SplitError error);
std::string_view errorMessage(CheckError error);
std::string_view errorMessage(MergeError error);

// Verification findings are not operation failures: the scan ran and the
// data turned out to be wrong.
[[nodiscard]] bool isFinding(CheckError error);

struct MissingChunks {
    std::vector<std::size_t> missing;

    bool operator==(const MissingChunks &other) const = default;
};

struct SizeMismatch {
    std::uint64_t expected{0};
    std::uint64_t actual{0};

    bool operator==(const SizeMismatch &other) const = default;
};

// Error-carrying shape of a check: operation failures and findings share one
// error type, findings bring their payload along.
struct CheckFailure {
    CheckError error{CheckError::InDirNotSet};
    std::optional<MissingChunks> missingChunks;
    std::optional<SizeMismatch> sizeMismatch;

    [[nodiscard]] std::string_view code() const { return errorCode(error); }
    [[nodiscard]] std::string_view message() const { return errorMessage(error); }
};

template <typename T, typename E>
struct OperationResult {
    std::optional<T> data;
    std::optional<E> error;

    [[nodiscard]] bool ok() const { return data.has_value(); }

    static OperationResult success(T value) {
        OperationResult result;
        result.data = std::move(value);
        return result;
    }

    static OperationResult failure(E reason) {
        OperationResult result;
        result.error = std::move(reason);
        return result;
    }
};

}  // namespace filefuse
