//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length (LSP style) framer, opt-in via --framing=content-length
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "codebridge/ContentFramer.h"

namespace codebridge {

namespace {

constexpr const char* kHeaderSeparator = "\r\n\r\n";
constexpr std::size_t kMaxHeaderBytes = 8 * 1024;

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trimCopy(const std::string& s) {
    auto b = std::find_if(s.begin(), s.end(), [](unsigned char ch){ return !std::isspace(ch); });
    auto e = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base();
    return (b < e) ? std::string(b, e) : std::string();
}

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + kHeaderSeparator;
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::string sep = kHeaderSeparator;
        const std::size_t headerEnd = buffer.find(sep);
        if (headerEnd == std::string::npos) {
            if (buffer.size() > kMaxHeaderBytes) {
                LOG_WARN("Header block exceeds {} bytes without terminator", kMaxHeaderBytes);
                return { DecodeStatus::InvalidHeader, std::nullopt, buffer.size() };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerAndSep = headerEnd + sep.size();

        std::size_t pos = 0;
        std::size_t contentLength = 0;
        bool haveLength = false;
        while (pos < headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            const std::string line = buffer.substr(pos, eol - pos);
            const auto colon = line.find(':');
            if (colon == std::string::npos) {
                LOG_WARN("Malformed header line: {}", line);
                return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
            }
            const std::string name = lowerCopy(trimCopy(line.substr(0, colon)));
            const std::string value = trimCopy(line.substr(colon + 1));
            if (name == "content-length") {
                if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
                    LOG_WARN("Invalid Content-Length header: {}", value);
                    return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
                }
                unsigned long long v64 = 0;
                try {
                    v64 = std::stoull(value);
                } catch (const std::out_of_range&) {
                    v64 = std::numeric_limits<unsigned long long>::max();
                }
                if (v64 > maxContentLength || v64 > std::numeric_limits<std::size_t>::max() - headerAndSep) {
                    LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                    return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
                }
                contentLength = static_cast<std::size_t>(v64);
                haveLength = true;
            }
            // Content-Type and other headers are accepted and ignored.
            pos = eol + 2;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }

        const std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        return { DecodeStatus::Ok, buffer.substr(headerAndSep, contentLength), frameTotal };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
            return r.payload;
        }
        return std::nullopt;
    }

    const char* name() const override { return "content-length"; }

private:
    std::size_t maxContentLength;
};

} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

} // namespace codebridge
