//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Concrete stdio-based transport
//==========================================================================================================
#pragma once

#include <cstdint>
#include <memory>
#include <unistd.h>

#include "codebridge/ContentFramer.h"
#include "codebridge/Transport.h"

namespace codebridge {

//==========================================================================================================
// StdioTransport
// Purpose: Framed message transport over a pair of file descriptors (stdin/stdout by default).
// Notes:
//   The descriptors are borrowed; Close() never closes them. Stdout must carry frames only.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    explicit StdioTransport(int inFd = STDIN_FILENO, int outFd = STDOUT_FILENO);
    virtual ~StdioTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the reader and writer threads.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the reader, drains the write queue (bounded by the write timeout) and joins the threads.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;
    bool Send(const std::string& payload) override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

    //==========================================================================================================
    // SetFraming
    // Purpose: Selects the frame format. Must be called before Start(); the mode holds for the session.
    //==========================================================================================================
    void SetFraming(FramingMode mode);

    //==========================================================================================================
    // SetMaxMessageBytes
    // Purpose: Largest accepted inbound payload; larger frames are a FramingError.
    //==========================================================================================================
    void SetMaxMessageBytes(std::size_t maxBytes);

    //==========================================================================================================
    // SetWriteQueueMaxBytes
    // Purpose: Backpressure clamp for pending write buffers.
    // Args:
    //   maxBytes: Maximum allowed bytes in write queue before emitting an error and closing.
    //==========================================================================================================
    void SetWriteQueueMaxBytes(std::size_t maxBytes);

    //==========================================================================================================
    // SetWriteTimeoutMs
    // Purpose: Per-frame write timeout while the peer is not draining stdout (0 disables).
    //==========================================================================================================
    void SetWriteTimeoutMs(uint64_t timeoutMs);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct StdioTransportTestHooks;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Creates stdio transports from "key=value;key=value" strings.
// Keys:
//   framing (newline|content-length), max_message_bytes, write_queue_max_bytes, write_timeout_ms.
//==========================================================================================================
class StdioTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

// White-box access for tests: run the frame extraction step on a caller-owned buffer.
struct StdioTransportTestHooks {
    static void drainFrames(StdioTransport& t, std::string& buffer);
    static void setConnected(StdioTransport& t, bool v);
    static bool isConnected(const StdioTransport& t);
    static FramingMode framing(const StdioTransport& t);
    static uint64_t writeTimeoutMs(const StdioTransport& t);
};

} // namespace codebridge
