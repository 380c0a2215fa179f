//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: codebridge-mcp entry point (MCP server over stdio)
//==========================================================================================================

#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "logging/Logger.h"
#include "codebridge/Config.h"
#include "codebridge/Dispatcher.h"
#include "codebridge/Server.h"
#include "codebridge/version.h"

using namespace codebridge;

int main(int argc, char** argv) {
    FUNC_SCOPE();
    // A host that goes away must surface as a write error, not a signal.
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr) {
            args.emplace_back(argv[i]);
        }
    }
    const std::string program = (argc > 0 && argv[0] != nullptr) ? std::filesystem::path(argv[0]).filename().string()
                                                                  : std::string("codebridge-mcp");

    CommandLine cl = ParseCommandLine(args);
    if (cl.error.has_value()) {
        std::cerr << program << ": " << *cl.error << "\n\n" << UsageText(program);
        return ExitCodes::UsageError;
    }
    if (cl.action == CommandLineAction::ShowHelp) {
        std::cerr << UsageText(program);
        return ExitCodes::Clean;
    }
    if (cl.action == CommandLineAction::ShowVersion) {
        // stdout is free here: no session is running.
        std::cout << "codebridge-mcp " << getVersionString() << std::endl;
        return ExitCodes::Clean;
    }

    Logger::setLogLevelFromString(cl.options.logLevel);
    if (!cl.options.logFile.empty() && !Logger::setLogFile(cl.options.logFile)) {
        LOG_WARN("Could not open log file {}", cl.options.logFile);
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(cl.options.projectRoot, ec)) {
        LOG_ERROR("Project directory '{}' does not exist or is not a directory", cl.options.projectRoot);
        return ExitCodes::UsageError;
    }

    Server server(cl.options);
    const int code = server.RunStdio();
    LOG_INFO("codebridge-mcp exiting with code {}", code);
    return code;
}
