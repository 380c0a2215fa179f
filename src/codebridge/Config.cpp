//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Environment and command-line option parsing for codebridge-mcp
//==========================================================================================================

#include "codebridge/Config.h"

#include <cctype>

#include <fmt/format.h>

#include "env/EnvVars.h"

namespace codebridge {

namespace {

std::optional<uint64_t> parseUnsigned(const std::string& text) {
    if (text.empty() || text.size() > 19) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

// Flags that take a value. --help and --version are handled separately.
enum class Flag {
    Project,
    Index,
    Framing,
    Workers,
    IndexThreads,
    MaxMessageBytes,
    WriteQueueMaxBytes,
    WriteTimeoutMs,
    LogLevel,
    LogFile
};

std::optional<Flag> flagFromName(const std::string& name) {
    if (name == "--project") return Flag::Project;
    if (name == "--index") return Flag::Index;
    if (name == "--framing") return Flag::Framing;
    if (name == "--workers") return Flag::Workers;
    if (name == "--index-threads") return Flag::IndexThreads;
    if (name == "--max-message-bytes") return Flag::MaxMessageBytes;
    if (name == "--write-queue-max-bytes") return Flag::WriteQueueMaxBytes;
    if (name == "--write-timeout-ms") return Flag::WriteTimeoutMs;
    if (name == "--log-level") return Flag::LogLevel;
    if (name == "--log-file") return Flag::LogFile;
    return std::nullopt;
}

bool isLogLevel(const std::string& level) {
    return level == "DEBUG" || level == "INFO" || level == "WARN" || level == "WARNING" ||
           level == "ERROR" || level == "OFF";
}

// Returns an error message, or nullopt when the value was applied.
std::optional<std::string> applyFlag(ServerOptions& options, Flag flag, const std::string& name,
                                     const std::string& value) {
    auto positive = [&](std::size_t& target) -> std::optional<std::string> {
        auto parsed = parseUnsigned(value);
        if (!parsed.has_value() || *parsed == 0) {
            return fmt::format("{} expects a positive integer, got '{}'", name, value);
        }
        target = static_cast<std::size_t>(*parsed);
        return std::nullopt;
    };

    switch (flag) {
        case Flag::Project:
            if (value.empty()) return fmt::format("{} expects a directory", name);
            options.projectRoot = value;
            return std::nullopt;
        case Flag::Index:
            if (value.empty()) return fmt::format("{} expects a file path", name);
            options.indexFile = value;
            return std::nullopt;
        case Flag::Framing: {
            auto mode = FramingModeFromString(value);
            if (!mode.has_value()) {
                return fmt::format("{} expects 'newline' or 'content-length', got '{}'", name, value);
            }
            options.framing = *mode;
            return std::nullopt;
        }
        case Flag::Workers:
            return positive(options.workerThreads);
        case Flag::IndexThreads:
            return positive(options.providerThreads);
        case Flag::MaxMessageBytes:
            return positive(options.maxMessageBytes);
        case Flag::WriteQueueMaxBytes:
            return positive(options.writeQueueMaxBytes);
        case Flag::WriteTimeoutMs: {
            auto parsed = parseUnsigned(value);
            if (!parsed.has_value()) {
                return fmt::format("{} expects milliseconds, got '{}'", name, value);
            }
            options.writeTimeoutMs = *parsed;
            return std::nullopt;
        }
        case Flag::LogLevel: {
            std::string upper = value;
            for (auto& c : upper) {
                c = static_cast<char>(::toupper(static_cast<unsigned char>(c)));
            }
            if (!isLogLevel(upper)) {
                return fmt::format("{} expects DEBUG, INFO, WARN or ERROR, got '{}'", name, value);
            }
            options.logLevel = upper;
            return std::nullopt;
        }
        case Flag::LogFile:
            options.logFile = value;
            return std::nullopt;
    }
    return fmt::format("unhandled option {}", name);
}

} // namespace

ServerOptions OptionsFromEnvironment() {
    ServerOptions options;
    options.projectRoot = GetEnvOrDefault("CODEBRIDGE_PROJECT", options.projectRoot);
    options.indexFile = GetEnvOrDefault("CODEBRIDGE_INDEX", options.indexFile);
    if (auto mode = FramingModeFromString(GetEnvOrDefault("CODEBRIDGE_FRAMING", "newline"))) {
        options.framing = *mode;
    }
    options.workerThreads = static_cast<std::size_t>(
        GetEnvUInt64OrDefault("CODEBRIDGE_WORKERS", options.workerThreads));
    options.providerThreads = static_cast<std::size_t>(
        GetEnvUInt64OrDefault("CODEBRIDGE_INDEX_THREADS", options.providerThreads));
    options.maxMessageBytes = static_cast<std::size_t>(
        GetEnvUInt64OrDefault("CODEBRIDGE_MAX_MESSAGE_BYTES", options.maxMessageBytes));
    options.writeQueueMaxBytes = static_cast<std::size_t>(
        GetEnvUInt64OrDefault("CODEBRIDGE_WRITE_QUEUE_MAX_BYTES", options.writeQueueMaxBytes));
    options.writeTimeoutMs = GetEnvUInt64OrDefault("CODEBRIDGE_WRITE_TIMEOUT_MS", options.writeTimeoutMs);
    options.logLevel = GetEnvOrDefault("CODEBRIDGE_LOG_LEVEL", options.logLevel);
    options.logFile = GetEnvOrDefault("CODEBRIDGE_LOG_FILE", options.logFile);
    if (options.workerThreads == 0) options.workerThreads = 1;
    if (options.providerThreads == 0) options.providerThreads = 1;
    return options;
}

CommandLine ParseCommandLine(const std::vector<std::string>& args) {
    CommandLine cl;
    cl.options = OptionsFromEnvironment();

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            cl.action = CommandLineAction::ShowHelp;
            return cl;
        }
        if (arg == "--version") {
            cl.action = CommandLineAction::ShowVersion;
            return cl;
        }

        std::string name = arg;
        std::optional<std::string> value;
        if (const auto eq = arg.find('='); eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }
        auto flag = flagFromName(name);
        if (!flag.has_value()) {
            cl.error = fmt::format("unknown option '{}'", arg);
            return cl;
        }
        if (!value.has_value()) {
            if (i + 1 >= args.size()) {
                cl.error = fmt::format("option {} requires a value", name);
                return cl;
            }
            value = args[++i];
        }
        if (auto err = applyFlag(cl.options, *flag, name, *value)) {
            cl.error = *err;
            return cl;
        }
    }
    return cl;
}

std::string StdioTransportConfig(const ServerOptions& options) {
    return fmt::format("framing={};max_message_bytes={};write_queue_max_bytes={};write_timeout_ms={}",
                       FramingModeName(options.framing), options.maxMessageBytes, options.writeQueueMaxBytes,
                       options.writeTimeoutMs);
}

std::string UsageText(const std::string& program) {
    return fmt::format(
        "Usage: {} [options]\n"
        "\n"
        "MCP server over stdio exposing a pre-built code index.\n"
        "\n"
        "Options:\n"
        "  --project <dir>               Project root (CODEBRIDGE_PROJECT, default .)\n"
        "  --index <file>                Index snapshot, relative to the project (CODEBRIDGE_INDEX,\n"
        "                                default .adi/index.json)\n"
        "  --framing <mode>              newline | content-length (CODEBRIDGE_FRAMING, default newline)\n"
        "  --workers <n>                 Request worker threads (CODEBRIDGE_WORKERS, default 4)\n"
        "  --index-threads <n>           Index query threads (CODEBRIDGE_INDEX_THREADS, default 2)\n"
        "  --max-message-bytes <n>       Largest accepted frame (CODEBRIDGE_MAX_MESSAGE_BYTES, default 4194304)\n"
        "  --write-queue-max-bytes <n>   Outbound queue bound (CODEBRIDGE_WRITE_QUEUE_MAX_BYTES, default 8388608)\n"
        "  --write-timeout-ms <ms>       Give up on a stalled stdout write (CODEBRIDGE_WRITE_TIMEOUT_MS,\n"
        "                                default 5000, 0 waits forever)\n"
        "  --log-level <level>           DEBUG | INFO | WARN | ERROR (CODEBRIDGE_LOG_LEVEL, default INFO)\n"
        "  --log-file <path>             Mirror log output to a file (CODEBRIDGE_LOG_FILE)\n"
        "  --version                     Print the version and exit\n"
        "  --help                        Print this help and exit\n",
        program);
}

} // namespace codebridge
