#pragma once

#include "filefuse/errors.h"
#include "filefuse/options.h"

#include <variant>

namespace filefuse {

struct ChunksIntact {
    bool operator==(const ChunksIntact &other) const = default;
};

// What a successful scan found. MissingChunks wins over SizeMismatch: a
// missing chunk always skews the total as well.
struct CheckReport {
    std::variant<ChunksIntact, MissingChunks, SizeMismatch> finding{ChunksIntact{}};

    [[nodiscard]] bool valid() const { return std::holds_alternative<ChunksIntact>(finding); }
    [[nodiscard]] const MissingChunks *missingChunks() const { return std::get_if<MissingChunks>(&finding); }
    [[nodiscard]] const SizeMismatch *sizeMismatch() const { return std::get_if<SizeMismatch>(&finding); }
};

using VerifyOutcome = OperationResult<CheckReport, CheckError>;
using CheckOutcome = OperationResult<bool, CheckFailure>;

// Result-carrying convention: only a scan that could not run is an error,
// findings are reported in the CheckReport.
VerifyOutcome verify(const CheckOptions &options);

// Error-carrying convention over the same scan: missing chunks and size
// mismatches come back as CheckError::MissingChunks / CheckError::SizeMismatch.
CheckOutcome check(const CheckOptions &options);

// Projection used by check(); exposed for callers holding a VerifyOutcome.
CheckOutcome toCheckOutcome(const VerifyOutcome &outcome);

}  // namespace filefuse
