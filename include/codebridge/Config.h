//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server options from CODEBRIDGE_* environment variables and command-line flags
//==========================================================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "codebridge/ContentFramer.h"

namespace codebridge {

struct ServerOptions {
    std::string projectRoot{"."};
    std::string indexFile{".adi/index.json"};
    FramingMode framing{FramingMode::Newline};
    std::size_t maxMessageBytes{4u * 1024u * 1024u};
    std::size_t writeQueueMaxBytes{8u * 1024u * 1024u};
    std::size_t workerThreads{4};
    std::size_t providerThreads{2};
    uint64_t writeTimeoutMs{5000};     // 0 disables
    std::string logLevel{"INFO"};
    std::string logFile;
};

enum class CommandLineAction {
    Run,
    ShowHelp,
    ShowVersion
};

struct CommandLine {
    CommandLineAction action{CommandLineAction::Run};
    ServerOptions options;
    std::optional<std::string> error; // usage error; the process should exit with ExitCodes::UsageError
};

//==========================================================================================================
// OptionsFromEnvironment
// Purpose: Defaults overridden by CODEBRIDGE_PROJECT, CODEBRIDGE_INDEX, CODEBRIDGE_FRAMING,
//          CODEBRIDGE_WORKERS, CODEBRIDGE_MAX_MESSAGE_BYTES, CODEBRIDGE_WRITE_QUEUE_MAX_BYTES,
//          CODEBRIDGE_WRITE_TIMEOUT_MS, CODEBRIDGE_LOG_LEVEL and CODEBRIDGE_LOG_FILE.
// Notes:
//   Unparseable numeric values keep the default.
//==========================================================================================================
ServerOptions OptionsFromEnvironment();

//==========================================================================================================
// ParseCommandLine
// Purpose: Applies --flag=value / --flag value arguments on top of OptionsFromEnvironment().
// Args:
//   args: argv[1..] as strings.
// Returns:
//   CommandLine with the requested action. Unknown flags, missing values and bad numbers set error.
//==========================================================================================================
CommandLine ParseCommandLine(const std::vector<std::string>& args);

// Renders the stdio transport settings as a StdioTransportFactory configuration string.
std::string StdioTransportConfig(const ServerOptions& options);

std::string UsageText(const std::string& program);

} // namespace codebridge
