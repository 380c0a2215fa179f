//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NewlineFramer.cpp
// Purpose: Newline-delimited JSON framer (the default MCP stdio framing)
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "codebridge/ContentFramer.h"

namespace codebridge {

namespace {

bool isBlank(const std::string& buffer, std::size_t begin, std::size_t end) {
    for (std::size_t k = begin; k < end; ++k) {
        const char c = buffer[k];
        if (c != ' ' && c != '\t' && c != '\r') return false;
    }
    return true;
}

//========================================================================================================
// NewlineFramer
// Purpose: One JSON text per line. A trailing '\r' is stripped, blank lines are skipped.
// Notes:
//   encode() relies on the serializer escaping control characters, so a payload never contains '\n'.
//========================================================================================================
class NewlineFramer : public IContentFramer {
public:
    explicit NewlineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t start = 0;
        while (true) {
            const std::size_t eol = buffer.find('\n', start);
            if (eol == std::string::npos) {
                if (buffer.size() - start > maxLineLength) {
                    LOG_WARN("Line exceeds {} bytes without terminator", maxLineLength);
                    return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
                }
                return { DecodeStatus::Incomplete, std::nullopt, start };
            }
            if (isBlank(buffer, start, eol)) {
                start = eol + 1;
                continue;
            }
            std::size_t end = eol;
            if (end > start && buffer[end - 1] == '\r') --end;
            if (end - start > maxLineLength) {
                LOG_WARN("Line of {} bytes exceeds limit {}", end - start, maxLineLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, eol + 1 };
            }
            return { DecodeStatus::Ok, buffer.substr(start, end - start), eol + 1 };
        }
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
        if (r.status == DecodeStatus::Ok) {
            return r.payload;
        }
        return std::nullopt;
    }

    const char* name() const override { return "newline"; }

private:
    std::size_t maxLineLength;
};

} // namespace

std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength) {
    return std::make_unique<NewlineFramer>(maxLineLength);
}

std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode, std::size_t maxMessageBytes) {
    switch (mode) {
        case FramingMode::ContentLength:
            return MakeContentLengthFramer(maxMessageBytes);
        case FramingMode::Newline:
        default:
            return MakeNewlineFramer(maxMessageBytes);
    }
}

std::optional<FramingMode> FramingModeFromString(const std::string& text) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (s == "newline" || s == "ndjson" || s == "line") return FramingMode::Newline;
    if (s == "content-length" || s == "lsp") return FramingMode::ContentLength;
    return std::nullopt;
}

const char* FramingModeName(FramingMode mode) {
    return mode == FramingMode::ContentLength ? "content-length" : "newline";
}

} // namespace codebridge
