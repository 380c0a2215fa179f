//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-process loopback transport used to drive the dispatcher without stdio
//==========================================================================================================
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "codebridge/Transport.h"

namespace codebridge {

//==========================================================================================================
// InMemoryTransport
// Purpose: ITransport whose inbound side is fed by Deliver() and whose outbound frames are captured.
// Notes:
//   Inbound events (messages, end of stream, framing errors) are processed in order on a dedicated
//   thread, mirroring the single reader thread of StdioTransport.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    virtual ~InMemoryTransport();

    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    bool Send(const std::string& payload) override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

    //==========================================================================================================
    // Inbound side
    //==========================================================================================================
    void Deliver(const std::string& payload);
    void SignalEndOfStream();
    void SignalFramingError(const std::string& detail = "injected framing error");

    //==========================================================================================================
    // Outbound side
    // NextOutbound: pops the oldest captured frame, waiting up to timeout.
    // WaitForOutbound: waits until at least count frames were captured in total.
    // TakeOutbound: removes and returns everything captured so far.
    //==========================================================================================================
    std::optional<std::string> NextOutbound(std::chrono::milliseconds timeout);
    bool WaitForOutbound(std::size_t count, std::chrono::milliseconds timeout);
    std::vector<std::string> TakeOutbound();
    std::size_t OutboundCount() const;

    // True once the close handler has fired (for any reason).
    bool WaitForClosed(std::chrono::milliseconds timeout);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace codebridge
