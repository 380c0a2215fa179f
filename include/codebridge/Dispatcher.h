//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: Routes decoded JSON-RPC messages to handlers and writes exactly one response per request
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "codebridge/Lifecycle.h"
#include "codebridge/Transport.h"
#include "codebridge/index/IndexProvider.h"

namespace codebridge {

//==========================================================================================================
// ExitCodes
// Purpose: Process exit status reported by the server.
//==========================================================================================================
namespace ExitCodes {
    constexpr int Clean = 0;            // shutdown/exit, or end of input
    constexpr int TransportFailure = 1; // framing or I/O error on stdio
    constexpr int UsageError = 2;       // bad command line or unusable project directory
}

struct DispatcherOptions {
    std::string projectRoot{"."};   // used unless initialize names a root
    std::size_t workerThreads{4};
    std::string serverName{"codebridge-mcp"};
    std::string serverVersion;
};

//==========================================================================================================
// Dispatcher
// Purpose: Server side of one session. Binds itself to the transport's message and close handlers.
// Threading:
//   HandleMessage runs on the transport reader thread. initialize, shutdown, ping and list methods are
//   answered inline; index-backed requests run as coroutines on an internal Asio thread pool and may
//   complete in any order.
// Methods:
//   WaitForExit(): Blocks until shutdown/exit or transport closure, cancels pending work (late results are
//                  discarded) and returns the process exit code (ExitCodes). Call once.
// Notes:
//   The transport must outlive the Dispatcher and must be closed before the Dispatcher is destroyed.
//==========================================================================================================
class Dispatcher {
public:
    Dispatcher(ITransport& transport, ProviderFactory providerFactory, DispatcherOptions options = {});
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void HandleMessage(const std::string& payload);
    void HandleTransportClosed(CloseReason reason);

    int WaitForExit();

    LifecycleState State() const;
    std::size_t PendingCount() const;
    std::string ProjectRoot() const;
    bool IsSubscribed(const std::string& uri) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace codebridge
