//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Wires a transport, the dispatcher and the index provider into one server session
//==========================================================================================================

#pragma once

#include <memory>

#include "codebridge/Config.h"
#include "codebridge/Transport.h"
#include "codebridge/index/IndexProvider.h"

namespace codebridge {

//==========================================================================================================
// Server
// Purpose: Runs one MCP session to completion.
// Usage:
//   Server server(options);
//   return server.RunStdio();
// Notes:
//   Run/RunStdio block until shutdown, exit or end of input and return a process exit code (ExitCodes).
//==========================================================================================================
class Server {
public:
    explicit Server(ServerOptions options);
    Server(ServerOptions options, ProviderFactory providerFactory);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    int Run(std::unique_ptr<ITransport> transport);

    // Serves the session over this process's stdin/stdout.
    int RunStdio();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace codebridge
