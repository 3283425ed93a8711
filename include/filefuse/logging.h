#pragma once

#include <iostream>
#include <string>

namespace YAML {
class Node;
}  // namespace YAML

namespace filefuse {

// Attached to every log line emitted on the current thread.
struct LogContext {
    std::string operation;
    std::string target;
};

class ScopedLogContext {
   public:
    explicit ScopedLogContext(LogContext context);
    ScopedLogContext(const ScopedLogContext &) = delete;
    ScopedLogContext &operator=(const ScopedLogContext &) = delete;
    ScopedLogContext(ScopedLogContext &&other) noexcept;
    ScopedLogContext &operator=(ScopedLogContext &&other) noexcept;
    ~ScopedLogContext();

   private:
    bool active_{false};
    LogContext previous_{};
};

// Installs a JSON-lines output for trantor's logger. Recognised keys:
// logging.stdout (bool, console output on or off), logging.file.enabled
// (bool), logging.file.path. Console lines go to `console`. Throws
// YAML::Exception when a key has the wrong shape.
void initializeLogging(const std::string &level, const YAML::Node &loggingConfig, std::ostream &console = std::cout);
void shutdownLogging();

void setLogContext(const LogContext &context);
LogContext currentLogContext();
void clearLogContext();

}  // namespace filefuse
