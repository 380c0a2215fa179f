//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces - framed payload delivery and connection lifecycle
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace codebridge {

//==========================================================================================================
// CloseReason
// Purpose: Why a transport stopped delivering messages.
//   EndOfStream: peer closed its end cleanly (EOF on a frame boundary).
//   FramingError: the byte stream could not be split into frames (bad header, oversized or truncated frame).
//   IOError: a read or write failed, or the write queue overflowed.
//   Local: Close() was called by the owner.
//==========================================================================================================
enum class CloseReason {
    EndOfStream,
    FramingError,
    IOError,
    Local
};

const char* CloseReasonName(CloseReason reason);

//==========================================================================================================
// ITransport
// Purpose: Single-session, bidirectional payload channel. The transport owns framing; callers see whole
//          message payloads only.
// Threading:
//   MessageHandler is invoked sequentially on the transport's reader thread, in arrival order.
//   Send() may be called from any thread; frames are written by one writer and never interleave.
//   CloseHandler fires at most once.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loops.
    // Returns:
    //   A future that completes when the transport is running.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops reading, flushes frames already queued for writing and releases resources.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport is currently connected.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Queues one serialized message for writing.
    // Args:
    //   payload: Serialized JSON text; the transport adds the frame envelope.
    // Returns:
    //   true when queued; false when disconnected or when the write queue is over its limit (which closes
    //   the transport with CloseReason::IOError).
    //==========================================================================================================
    virtual bool Send(const std::string& payload) = 0;

    /////////////////////////////////////////// Inbound handling ///////////////////////////////////////////
    //==========================================================================================================
    // Registers the callback receiving each complete inbound payload.
    //==========================================================================================================
    using MessageHandler = std::function<void(const std::string& payload)>;
    virtual void SetMessageHandler(MessageHandler handler) = 0;

    //==========================================================================================================
    // Registers an error handler to receive transport diagnostics.
    // Args:
    //   handler: Callback with error string.
    //==========================================================================================================
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    //==========================================================================================================
    // Registers the callback fired once when the transport stops delivering messages.
    //==========================================================================================================
    using CloseHandler = std::function<void(CloseReason reason)>;
    virtual void SetCloseHandler(CloseHandler handler) = 0;
};

//==========================================================================================================
// Transport factory interface
// Purpose: Factory for creating transports from configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: Transport-specific configuration string (e.g. "framing=newline;write_timeout_ms=2000").
    // Returns:
    //   A unique_ptr to a newly created ITransport.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

} // namespace codebridge
