#include "filefuse/logging.h"

#include <nlohmann/json.hpp>
#include <trantor/utils/Logger.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace filefuse {
namespace {

std::mutex logMutex;
std::unique_ptr<std::ofstream> fileSink;
bool consoleEnabled{true};
std::ostream *consoleStream{&std::cout};

thread_local LogContext threadLogContext{};

std::string isoTimestampUtc() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto seconds = time_point_cast<std::chrono::seconds>(now);
    const auto micro = duration_cast<microseconds>(now - seconds).count();
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%FT%T");
    oss << '.' << std::setw(6) << std::setfill('0') << micro << 'Z';
    return oss.str();
}

trantor::Logger::LogLevel toTrantorLevel(const std::string &level) {
    std::string lowered = level;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "trace") {
        return trantor::Logger::kTrace;
    }
    if (lowered == "debug") {
        return trantor::Logger::kDebug;
    }
    if (lowered == "warn" || lowered == "warning") {
        return trantor::Logger::kWarn;
    }
    if (lowered == "error") {
        return trantor::Logger::kError;
    }
    if (lowered == "fatal" || lowered == "critical") {
        return trantor::Logger::kFatal;
    }
    return trantor::Logger::kInfo;
}

// trantor pads the level name with spaces inside the formatted line.
std::string extractLevel(std::string_view line) {
    static constexpr std::array<std::string_view, 6> levels = {
        " TRACE ", " DEBUG ", " INFO ", " WARN ", " ERROR ", " FATAL "};
    std::size_t best = std::string_view::npos;
    std::string_view found = " INFO ";
    for (auto candidate : levels) {
        auto pos = line.find(candidate);
        if (pos < best) {
            best = pos;
            found = candidate;
        }
    }
    return std::string(found.substr(1, found.size() - 2));
}

void nullableField(nlohmann::json &payload, const char *key, const std::string &value) {
    if (value.empty()) {
        payload[key] = nullptr;
    } else {
        payload[key] = value;
    }
}

void emitLogPayload(const nlohmann::json &payload) {
    // Paths are raw bytes on POSIX; invalid UTF-8 becomes U+FFFD instead of throwing.
    const std::string serialized = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(logMutex);
    if (consoleEnabled) {
        (*consoleStream) << serialized << '\n';
    }
    if (fileSink && fileSink->is_open()) {
        (*fileSink) << serialized << '\n';
    }
}

void flushSinks() {
    std::lock_guard<std::mutex> lock(logMutex);
    consoleStream->flush();
    if (fileSink && fileSink->is_open()) {
        fileSink->flush();
    }
}

}  // namespace

ScopedLogContext::ScopedLogContext(LogContext context) : active_(true), previous_(currentLogContext()) {
    setLogContext(context);
}

ScopedLogContext::ScopedLogContext(ScopedLogContext &&other) noexcept
    : active_(std::exchange(other.active_, false)), previous_(std::move(other.previous_)) {}

ScopedLogContext &ScopedLogContext::operator=(ScopedLogContext &&other) noexcept {
    if (this != &other) {
        if (active_) {
            threadLogContext = previous_;
        }
        active_ = std::exchange(other.active_, false);
        previous_ = std::move(other.previous_);
    }
    return *this;
}

ScopedLogContext::~ScopedLogContext() {
    if (active_) {
        threadLogContext = previous_;
    }
}

void initializeLogging(const std::string &level, const YAML::Node &loggingConfig, std::ostream &console) {
    using trantor::Logger;

    Logger::setLogLevel(toTrantorLevel(level));

    bool enableStdout = true;
    std::unique_ptr<std::ofstream> sink;

    if (loggingConfig) {
        if (auto logging = loggingConfig["logging"]; logging) {
            if (auto stdoutNode = logging["stdout"]; stdoutNode) {
                enableStdout = stdoutNode.as<bool>(enableStdout);
            }
            if (auto fileNode = logging["file"]; fileNode) {
                const bool enableFile = fileNode["enabled"].as<bool>(false);
                if (enableFile && fileNode["path"]) {
                    std::filesystem::path logPath = fileNode["path"].as<std::string>();
                    if (!logPath.empty()) {
                        auto parent = logPath.parent_path();
                        if (!parent.empty()) {
                            std::error_code ec;
                            std::filesystem::create_directories(parent, ec);
                            if (ec) {
                                std::clog << "[logging] failed to create " << parent << ": " << ec.message()
                                          << '\n';
                            }
                        }
                        sink = std::make_unique<std::ofstream>(logPath, std::ios::app);
                        if (!sink->is_open()) {
                            std::clog << "[logging] failed to open log file " << logPath << '\n';
                            sink.reset();
                        }
                    }
                }
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(logMutex);
        consoleEnabled = enableStdout;
        consoleStream = &console;
        fileSink = std::move(sink);
    }

    Logger::setOutputFunction(
        [](const char *msg, const uint64_t len) {
            std::string_view view(msg, len);
            if (!view.empty() && view.back() == '\n') {
                view.remove_suffix(1);
            }

            auto context = currentLogContext();

            nlohmann::json payload;
            payload["ts"] = isoTimestampUtc();
            payload["level"] = extractLevel(view);
            payload["msg"] = std::string(view);
            nullableField(payload, "operation", context.operation);
            nullableField(payload, "target", context.target);

            emitLogPayload(payload);
        },
        []() { flushSinks(); });

    LOG_DEBUG << "Logging initialized at level " << level;
}

void shutdownLogging() {
    flushSinks();
    trantor::Logger::setOutputFunction(
        [](const char *msg, const uint64_t len) { std::fwrite(msg, 1, static_cast<std::size_t>(len), stdout); },
        []() { std::fflush(stdout); });

    std::lock_guard<std::mutex> lock(logMutex);
    fileSink.reset();
    consoleEnabled = true;
    consoleStream = &std::cout;
}

void setLogContext(const LogContext &context) {
    threadLogContext = context;
}

LogContext currentLogContext() {
    return threadLogContext;
}

void clearLogContext() {
    threadLogContext = LogContext{};
}

}  // namespace filefuse
