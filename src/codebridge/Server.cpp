//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Server session runner
//==========================================================================================================

#include "codebridge/Server.h"

#include "logging/Logger.h"
#include "codebridge/Dispatcher.h"
#include "codebridge/StdioTransport.hpp"
#include "codebridge/index/SnapshotIndexProvider.h"
#include "codebridge/version.h"

namespace codebridge {

class Server::Impl {
public:
    ServerOptions options;
    ProviderFactory providerFactory;

    Impl(ServerOptions opts, ProviderFactory factory)
        : options(std::move(opts)), providerFactory(std::move(factory)) {}
};

Server::Server(ServerOptions options)
    : Server(options, MakeSnapshotProviderFactory(options.indexFile, options.providerThreads)) {}

Server::Server(ServerOptions options, ProviderFactory providerFactory)
    : pImpl(std::make_unique<Impl>(std::move(options), std::move(providerFactory))) {}

Server::~Server() = default;

int Server::Run(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    if (!transport) {
        LOG_ERROR("Server: no transport");
        return ExitCodes::TransportFailure;
    }

    DispatcherOptions dopts;
    dopts.projectRoot = pImpl->options.projectRoot;
    dopts.workerThreads = pImpl->options.workerThreads;
    dopts.serverVersion = getVersionString();

    int code = ExitCodes::Clean;
    {
        Dispatcher dispatcher(*transport, pImpl->providerFactory, dopts);
        try {
            transport->Start().get();
        } catch (const std::exception& e) {
            LOG_ERROR("Server: failed to start transport: {}", e.what());
            return ExitCodes::TransportFailure;
        }
        LOG_INFO("Server: codebridge-mcp {} serving {} on {}", dopts.serverVersion, dopts.projectRoot,
                 transport->GetSessionId());

        code = dispatcher.WaitForExit();

        // Flush queued responses before the dispatcher (and its handlers) go away.
        try {
            transport->Close().get();
        } catch (const std::exception& e) {
            LOG_WARN("Server: transport close failed: {}", e.what());
            if (code == ExitCodes::Clean) {
                code = ExitCodes::TransportFailure;
            }
        }
    }
    return code;
}

int Server::RunStdio() {
    const std::string config = StdioTransportConfig(pImpl->options);
    LOG_INFO("Server: stdio transport {}", config);
    StdioTransportFactory factory;
    return Run(factory.CreateTransport(config));
}

} // namespace codebridge
