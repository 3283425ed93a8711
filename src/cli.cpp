#include "filefuse/cli.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "filefuse/app_config.h"
#include "filefuse/check.h"
#include "filefuse/logging.h"
#include "filefuse/merge.h"
#include "filefuse/split.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

struct CommandLine {
    std::optional<std::filesystem::path> configPath;
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::string> chunkSize;
    std::optional<std::string> bufferCapacity;
    std::optional<std::string> fileSize;
    std::optional<std::string> totalChunks;
    bool help{false};
};

class UsageError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

void printUsage(std::ostream &err, std::string_view executable) {
    err << "Usage:\n"
              << "  " << executable
              << " [--config FILE] split <in-file> <out-dir> [--chunk-size N] [--buffer-capacity N]\n"
              << "  " << executable << " [--config FILE] check <in-dir> --file-size N --total-chunks N\n"
              << "  " << executable << " [--config FILE] merge <in-dir> <out-file> [--buffer-capacity N]\n\n"
              << "Sizes accept plain byte counts or K/KiB, M/MiB, G/GiB suffixes.\n";
}

CommandLine parseArguments(int argc, char **argv) {
    CommandLine line;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        auto requireValue = [&](std::string_view name) -> std::string {
            if (i + 1 >= argc) {
                throw UsageError(std::string{"Missing value for option "} + std::string{name});
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            line.help = true;
        } else if (arg == "--config") {
            line.configPath = requireValue(arg);
        } else if (arg == "--chunk-size") {
            line.chunkSize = requireValue(arg);
        } else if (arg == "--buffer-capacity") {
            line.bufferCapacity = requireValue(arg);
        } else if (arg == "--file-size") {
            line.fileSize = requireValue(arg);
        } else if (arg == "--total-chunks") {
            line.totalChunks = requireValue(arg);
        } else if (arg.size() > 1 && arg.front() == '-') {
            throw UsageError(std::string{"Unknown option "} + std::string{arg});
        } else if (line.command.empty()) {
            line.command = std::string(arg);
        } else {
            line.positional.emplace_back(arg);
        }
    }
    return line;
}

std::uint64_t parseCount(const std::string &value, std::string_view name) {
    std::size_t consumed = 0;
    std::uint64_t parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception &) {
        throw UsageError(std::string{name} + " is not a number: " + value);
    }
    if (consumed != value.size() || value.front() == '-') {
        throw UsageError(std::string{name} + " is not a number: " + value);
    }
    return parsed;
}

void requirePositional(const CommandLine &line, std::size_t count) {
    if (line.positional.size() != count) {
        throw UsageError(line.command + " expects " + std::to_string(count) + " positional arguments");
    }
}

int report(std::ostream &out, const nlohmann::json &payload) {
    out << payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return payload.value("ok", false) ? kExitOk : kExitFailed;
}

template <typename Error>
nlohmann::json failurePayload(Error error) {
    return nlohmann::json{{"ok", false},
                          {"code", std::string(filefuse::errorCode(error))},
                          {"message", std::string(filefuse::errorMessage(error))}};
}

int runSplit(std::ostream &out, const CommandLine &line, const filefuse::AppConfig &config) {
    requirePositional(line, 2);
    auto options = filefuse::splitOptionsFrom(config)
                       .withInFile(line.positional[0])
                       .withOutDir(line.positional[1]);
    if (line.chunkSize) {
        options = options.withChunkSize(static_cast<std::size_t>(filefuse::parseByteSize(*line.chunkSize)));
    }
    if (line.bufferCapacity) {
        options =
            options.withBufferCapacity(static_cast<std::size_t>(filefuse::parseByteSize(*line.bufferCapacity)));
    }

    const auto outcome = filefuse::split(options);
    if (!outcome.ok()) {
        return report(out, failurePayload(*outcome.error));
    }
    return report(out, nlohmann::json{
        {"ok", true}, {"file_size", outcome.data->fileSize}, {"total_chunks", outcome.data->totalChunks}});
}

int runCheck(std::ostream &out, const CommandLine &line) {
    requirePositional(line, 1);
    if (!line.fileSize || !line.totalChunks) {
        throw UsageError("check requires --file-size and --total-chunks");
    }
    const auto options = filefuse::CheckOptions{}
                             .withInDir(line.positional[0])
                             .withFileSize(parseCount(*line.fileSize, "--file-size"))
                             .withTotalChunks(static_cast<std::size_t>(parseCount(*line.totalChunks, "--total-chunks")));

    const auto outcome = filefuse::check(options);
    if (outcome.ok()) {
        return report(out, nlohmann::json{{"ok", true}});
    }

    const auto &failure = *outcome.error;
    auto payload = failurePayload(failure.error);
    if (failure.missingChunks) {
        payload["missing"] = failure.missingChunks->missing;
    }
    if (failure.sizeMismatch) {
        payload["expected"] = failure.sizeMismatch->expected;
        payload["actual"] = failure.sizeMismatch->actual;
    }
    return report(out, payload);
}

int runMerge(std::ostream &out, const CommandLine &line, const filefuse::AppConfig &config) {
    requirePositional(line, 2);
    auto options = filefuse::mergeOptionsFrom(config)
                       .withInDir(line.positional[0])
                       .withOutFile(line.positional[1]);
    if (line.bufferCapacity) {
        options =
            options.withBufferCapacity(static_cast<std::size_t>(filefuse::parseByteSize(*line.bufferCapacity)));
    }

    const auto outcome = filefuse::merge(options);
    if (!outcome.ok()) {
        return report(out, failurePayload(*outcome.error));
    }
    return report(out, nlohmann::json{{"ok", true}});
}

}  // namespace

namespace filefuse {

int runCli(int argc, char **argv, std::ostream &out, std::ostream &err) {
    const std::string_view executable = argc > 0 ? argv[0] : "filefuse";
    CommandLine line;
    AppConfig config;
    YAML::Node configNode;

    try {
        line = parseArguments(argc, argv);
        if (line.help) {
            printUsage(err, executable);
            return kExitOk;
        }
        if (line.command.empty()) {
            throw UsageError("Missing command");
        }
        if (line.configPath) {
            configNode = YAML::LoadFile(line.configPath->string());
        }
        config = loadAppConfig(configNode);
        // stdout carries the result object only; log lines go to `err`.
        initializeLogging(config.logLevel, configNode, err);
    } catch (const UsageError &ex) {
        err << ex.what() << "\n\n";
        printUsage(err, executable);
        return kExitUsage;
    } catch (const std::exception &ex) {
        err << "Failed to load configuration: " << ex.what() << '\n';
        return kExitUsage;
    }

    int exitCode = kExitUsage;
    try {
        if (line.command == "split") {
            exitCode = runSplit(out, line, config);
        } else if (line.command == "check") {
            exitCode = runCheck(out, line);
        } else if (line.command == "merge") {
            exitCode = runMerge(out, line, config);
        } else {
            throw UsageError("Unknown command " + line.command);
        }
    } catch (const UsageError &ex) {
        err << ex.what() << "\n\n";
        printUsage(err, executable);
        exitCode = kExitUsage;
    } catch (const std::invalid_argument &ex) {
        err << ex.what() << '\n';
        exitCode = kExitUsage;
    }

    shutdownLogging();
    return exitCode;
}

}  // namespace filefuse
