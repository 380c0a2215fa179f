//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for stdio message framing (newline-delimited or Content-Length)
//========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

namespace codebridge {

//========================================================================================================
// IContentFramer
// Purpose: Splits a byte buffer into complete message payloads and wraps outbound payloads in frames.
// Notes:
//   A framer is stateless with respect to the buffer; the caller owns the accumulation buffer and drops
//   bytesConsumed after every decode attempt (also for Incomplete, where skipped blank lines are counted).
//   InvalidHeader and BodyTooLarge are unrecoverable for the session: the stream position is unknown.
//========================================================================================================
class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
    virtual const char* name() const = 0;
};

enum class FramingMode {
    Newline,
    ContentLength
};

// "newline" | "ndjson" | "content-length" | "lsp"; nullopt for anything else.
std::optional<FramingMode> FramingModeFromString(const std::string& text);
const char* FramingModeName(FramingMode mode);

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 4 * 1024 * 1024);
std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength = 4 * 1024 * 1024);
std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode, std::size_t maxMessageBytes);

} // namespace codebridge
