#pragma once

#include <iosfwd>

namespace filefuse {

// filefuse [--config FILE] split|check|merge ...
// Writes exactly one JSON result object to `out`; usage text and log lines go
// to `err`. Returns 0 on success, 1 on a failed operation or negative check,
// 2 on usage or configuration errors.
int runCli(int argc, char **argv, std::ostream &out, std::ostream &err);

}  // namespace filefuse
