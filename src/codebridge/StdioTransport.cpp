//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: stdio-based transport implementation
//==========================================================================================================

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "codebridge/StdioTransport.hpp"

namespace codebridge {

const char* CloseReasonName(CloseReason reason) {
    switch (reason) {
        case CloseReason::EndOfStream: return "end-of-stream";
        case CloseReason::FramingError: return "framing-error";
        case CloseReason::IOError: return "io-error";
        case CloseReason::Local: return "local";
    }
    return "unknown";
}

class StdioTransport::Impl {
public:
    int inFd;
    int outFd;
    int savedOutFlags{-1};

    // reading: the reader loop accepts input. writable: Send() accepts frames.
    // End of input clears reading only, so responses for in-flight requests can still be written.
    std::atomic<bool> reading{false};
    std::atomic<bool> writable{false};
    std::atomic<bool> started{false};
    std::atomic<bool> closeFired{false};
    std::atomic<bool> readerExited{false};
    std::atomic<bool> writerExited{false};
    std::string sessionId;
    ITransport::MessageHandler messageHandler;
    ITransport::ErrorHandler errorHandler;
    ITransport::CloseHandler closeHandler;
    std::thread readerThread;
    std::thread writerThread;

    int wakeEventFd{-1};

    FramingMode framingMode{FramingMode::Newline};
    std::size_t maxMessageBytes{4 * 1024 * 1024};
    std::unique_ptr<IContentFramer> framer;

    // Write queue/backpressure
    std::mutex writeMutex; // protects writeQueue, queuedBytes, stopWriter, abortWriter
    std::condition_variable cvWrite;
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};
    std::size_t writeQueueMaxBytes{8 * 1024 * 1024};
    std::chrono::milliseconds writeTimeout{5000};
    bool stopWriter{false};
    std::atomic<bool> abortWriter{false};

    static constexpr std::chrono::milliseconds FlushTimeout{5000};
    static constexpr int PollIntervalMs = 100;

    Impl(int in, int out) : inFd(in), outFd(out) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));
        framer = MakeFramer(framingMode, maxMessageBytes);

        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    void wakeReader() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            break;
        }
    }

    void fireClose(CloseReason reason) {
        if (closeFired.exchange(true)) {
            return;
        }
        LOG_INFO("StdioTransport: closed ({})", CloseReasonName(reason));
        if (closeHandler) {
            closeHandler(reason);
        }
    }

    void reportError(const std::string& message) {
        if (errorHandler) {
            errorHandler(message);
        }
    }

    // Transport-fatal condition: stop reading, refuse further writes for IO errors, notify owner.
    void fail(CloseReason reason, const std::string& message) {
        LOG_ERROR("StdioTransport: {}", message);
        reportError(message);
        reading = false;
        if (reason == CloseReason::IOError) {
            writable = false;
            abortWriter = true;
            cvWrite.notify_all();
        }
        wakeReader();
        fireClose(reason);
    }

    bool enqueueFrame(const std::string& payload) {
        if (!writable.load()) {
            LOG_DEBUG("StdioTransport: dropping frame while disconnected ({} bytes)", payload.size());
            return false;
        }
        std::string frame = framer->encode(payload);
        bool overflow = false;
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (queuedBytes + frame.size() > writeQueueMaxBytes) {
                LOG_ERROR("StdioTransport: write queue overflow (queued={} add={} max={})", queuedBytes, frame.size(), writeQueueMaxBytes);
                overflow = true;
            } else {
                queuedBytes += frame.size();
                writeQueue.emplace_back(std::move(frame));
            }
        }
        if (overflow) {
            fail(CloseReason::IOError, "write queue overflow");
            return false;
        }
        cvWrite.notify_one();
        return true;
    }

    void deliver(const std::string& payload) {
        LOG_DEBUG("StdioTransport: received frame ({} bytes)", payload.size());
        if (!messageHandler) {
            return;
        }
        try {
            messageHandler(payload);
        } catch (const std::exception& e) {
            LOG_ERROR("StdioTransport: message handler threw: {}", e.what());
            reportError(std::string("message handler exception: ") + e.what());
        }
    }

    // Extracts and delivers every complete frame. Returns false on a framing error.
    bool drainFrames(std::string& buffer) {
        while (reading.load()) {
            IContentFramer::DecodeResult r = framer->tryDecodeEx(buffer);
            buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
            switch (r.status) {
                case IContentFramer::DecodeStatus::Ok:
                    deliver(r.payload.value_or(std::string()));
                    break;
                case IContentFramer::DecodeStatus::Incomplete:
                    return true;
                case IContentFramer::DecodeStatus::InvalidHeader:
                    fail(CloseReason::FramingError, "invalid frame header");
                    return false;
                case IContentFramer::DecodeStatus::BodyTooLarge:
                    fail(CloseReason::FramingError, "frame exceeds maximum message size");
                    return false;
            }
        }
        return false;
    }

    void handleEndOfInput(const std::string& buffer) {
        const bool leftover = std::any_of(buffer.begin(), buffer.end(), [](char c) {
            return c != ' ' && c != '\t' && c != '\r' && c != '\n';
        });
        if (leftover) {
            fail(CloseReason::FramingError, "input ended inside a frame (" + std::to_string(buffer.size()) + " bytes pending)");
            return;
        }
        reading = false;
        fireClose(CloseReason::EndOfStream);
    }

    void startReader() {
        readerThread = std::thread([this]() {
            std::string buffer;
            std::array<char, 64 * 1024> chunk{};
            while (reading.load()) {
                std::array<pollfd, 2> fds{};
                fds[0].fd = inFd;
                fds[0].events = POLLIN;
                fds[1].fd = wakeEventFd;
                fds[1].events = POLLIN;
                const nfds_t count = (wakeEventFd >= 0) ? 2 : 1;
                int rc = ::poll(fds.data(), count, PollIntervalMs);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    fail(CloseReason::IOError, std::string("poll failed: ") + ::strerror(errno));
                    break;
                }
                if (!reading.load()) {
                    break;
                }
                if (rc == 0) {
                    continue;
                }
                if (count == 2 && (fds[1].revents & POLLIN)) {
                    uint64_t drained = 0;
                    while (::read(wakeEventFd, &drained, sizeof(drained)) > 0) {}
                    if (!reading.load()) {
                        break;
                    }
                }
                if (fds[0].revents & POLLNVAL) {
                    fail(CloseReason::IOError, "input descriptor is not open");
                    break;
                }
                // POLLHUP may arrive with unread data still in the pipe: keep reading until read() returns 0.
                if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                    ssize_t n = ::read(inFd, chunk.data(), chunk.size());
                    if (n > 0) {
                        buffer.append(chunk.data(), static_cast<std::size_t>(n));
                        if (!drainFrames(buffer)) {
                            break;
                        }
                        continue;
                    }
                    if (n == 0) {
                        handleEndOfInput(buffer);
                        break;
                    }
                    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                        continue;
                    }
                    fail(CloseReason::IOError, std::string("read failed: ") + ::strerror(errno));
                    break;
                }
            }
            readerExited.store(true);
        });
    }

    // Writes one frame completely. Returns false on error, timeout or abort.
    bool writeFrame(const std::string& frame) {
        std::size_t total = 0;
        auto start = std::chrono::steady_clock::now();
        while (total < frame.size()) {
            if (abortWriter.load()) {
                return false;
            }
            ssize_t w = ::write(outFd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
                start = std::chrono::steady_clock::now();
                continue;
            }
            if (w < 0 && errno == EINTR) {
                continue;
            }
            if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                if (writeTimeout.count() > 0 && (std::chrono::steady_clock::now() - start) >= writeTimeout) {
                    LOG_ERROR("StdioTransport: write timeout ({} ms)", static_cast<long long>(writeTimeout.count()));
                    return false;
                }
                pollfd pfd{outFd, POLLOUT, 0};
                (void)::poll(&pfd, 1, 10);
                continue;
            }
            if (w == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            LOG_ERROR("StdioTransport: write error (errno={} msg={})", errno, ::strerror(errno));
            return false;
        }
        return true;
    }

    void startWriter() {
        writerThread = std::thread([this]() {
            while (true) {
                std::string frame;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait(lk, [&]{ return stopWriter || abortWriter.load() || !writeQueue.empty(); });
                    if (abortWriter.load()) {
                        break;
                    }
                    if (writeQueue.empty()) {
                        break; // stopWriter with nothing left to flush
                    }
                    frame = std::move(writeQueue.front());
                    writeQueue.pop_front();
                }
                const bool ok = writeFrame(frame);
                {
                    std::lock_guard<std::mutex> lk(writeMutex);
                    queuedBytes = (queuedBytes >= frame.size()) ? queuedBytes - frame.size() : 0;
                }
                if (!ok) {
                    if (!abortWriter.load()) {
                        fail(CloseReason::IOError, "write to output failed");
                    }
                    break;
                }
            }
            {
                std::lock_guard<std::mutex> lk(writeMutex);
                if (!writeQueue.empty()) {
                    LOG_WARN("StdioTransport: discarding {} unwritten frame(s)", writeQueue.size());
                }
                writeQueue.clear();
                queuedBytes = 0;
            }
            writerExited.store(true);
        });
    }

    void shutdown() {
        reading = false;
        wakeReader();
        if (readerThread.joinable()) {
            if (readerThread.get_id() == std::this_thread::get_id()) {
                // Close() from inside the message handler: the loop exits once the handler returns.
                readerThread.detach();
            } else {
                readerThread.join();
            }
        }
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            stopWriter = true;
        }
        cvWrite.notify_all();
        if (writerThread.joinable()) {
            const auto deadline = std::chrono::steady_clock::now() + FlushTimeout;
            while (!writerExited.load() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            if (!writerExited.load()) {
                LOG_WARN("StdioTransport: output not drained within {} ms; aborting writer", static_cast<long long>(FlushTimeout.count()));
                abortWriter = true;
                cvWrite.notify_all();
            }
            writerThread.join();
        }
        writable = false;
        if (savedOutFlags >= 0) {
            (void)::fcntl(outFd, F_SETFL, savedOutFlags);
            savedOutFlags = -1;
        }
    }

    void rebuildFramer() {
        framer = MakeFramer(framingMode, maxMessageBytes);
    }
};

StdioTransport::StdioTransport(int inFd, int outFd) : pImpl(std::make_unique<Impl>(inFd, outFd)) { FUNC_SCOPE(); }

StdioTransport::~StdioTransport() {
    FUNC_SCOPE();
    if (pImpl->started.load()) {
        pImpl->shutdown();
    }
}

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting StdioTransport (framing={}, session={})", pImpl->framer->name(), pImpl->sessionId);
    if (!pImpl->started.exchange(true)) {
        pImpl->savedOutFlags = ::fcntl(pImpl->outFd, F_GETFL, 0);
        if (pImpl->savedOutFlags >= 0) {
            (void)::fcntl(pImpl->outFd, F_SETFL, pImpl->savedOutFlags | O_NONBLOCK);
        }
        pImpl->reading = true;
        pImpl->writable = true;
        pImpl->startReader();
        pImpl->startWriter();
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    LOG_INFO("Closing StdioTransport");
    if (pImpl->started.exchange(false)) {
        pImpl->shutdown();
    }
    pImpl->fireClose(CloseReason::Local);
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool StdioTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->writable.load(); }
std::string StdioTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

bool StdioTransport::Send(const std::string& payload) {
    FUNC_SCOPE();
    LOG_DEBUG("Sending frame ({} bytes)", payload.size());
    return pImpl->enqueueFrame(payload);
}

void StdioTransport::SetMessageHandler(MessageHandler handler) { FUNC_SCOPE(); pImpl->messageHandler = std::move(handler); }
void StdioTransport::SetErrorHandler(ErrorHandler handler) { FUNC_SCOPE(); pImpl->errorHandler = std::move(handler); }
void StdioTransport::SetCloseHandler(CloseHandler handler) { FUNC_SCOPE(); pImpl->closeHandler = std::move(handler); }

void StdioTransport::SetFraming(FramingMode mode) {
    FUNC_SCOPE();
    if (pImpl->started.load()) {
        LOG_WARN("StdioTransport: framing cannot change after Start()");
        return;
    }
    pImpl->framingMode = mode;
    pImpl->rebuildFramer();
}

void StdioTransport::SetMaxMessageBytes(std::size_t maxBytes) {
    FUNC_SCOPE();
    if (pImpl->started.load()) {
        LOG_WARN("StdioTransport: message limit cannot change after Start()");
        return;
    }
    pImpl->maxMessageBytes = (maxBytes == 0) ? 1 : maxBytes;
    pImpl->rebuildFramer();
}

void StdioTransport::SetWriteQueueMaxBytes(std::size_t maxBytes) {
    FUNC_SCOPE();
    if (maxBytes == 0) { maxBytes = 1; }
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    pImpl->writeQueueMaxBytes = maxBytes;
}

void StdioTransport::SetWriteTimeoutMs(uint64_t timeoutMs) {
    FUNC_SCOPE();
    pImpl->writeTimeout = std::chrono::milliseconds(timeoutMs);
}

void StdioTransportTestHooks::drainFrames(StdioTransport& t, std::string& buffer) {
    (void)t.pImpl->drainFrames(buffer);
}

void StdioTransportTestHooks::setConnected(StdioTransport& t, bool v) {
    t.pImpl->reading = v;
    t.pImpl->writable = v;
}

bool StdioTransportTestHooks::isConnected(const StdioTransport& t) {
    return t.pImpl->reading.load();
}

FramingMode StdioTransportTestHooks::framing(const StdioTransport& t) {
    return t.pImpl->framingMode;
}

uint64_t StdioTransportTestHooks::writeTimeoutMs(const StdioTransport& t) {
    return static_cast<uint64_t>(t.pImpl->writeTimeout.count());
}

std::unique_ptr<ITransport> StdioTransportFactory::CreateTransport(const std::string& config) {
    auto t = std::make_unique<StdioTransport>();
    auto parseUint = [](const std::string& s, uint64_t& out) -> bool {
        if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c){ return c >= '0' && c <= '9'; })) {
            return false;
        }
        try { out = static_cast<uint64_t>(std::stoull(s)); return true; } catch (const std::out_of_range&) { return false; }
    };
    // Parse key=value pairs separated by ';' or whitespace
    std::string token;
    for (std::size_t i = 0; i < config.size();) {
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("StdioTransportFactory: ignoring token without '=': {}", token);
            continue;
        }
        auto key = token.substr(0, eq);
        auto val = token.substr(eq + 1);
        uint64_t v = 0;
        if (key == "framing") {
            if (auto mode = FramingModeFromString(val)) {
                t->SetFraming(*mode);
            } else {
                LOG_WARN("StdioTransportFactory: unknown framing '{}'", val);
            }
        } else if (key == "max_message_bytes") {
            if (parseUint(val, v)) t->SetMaxMessageBytes(static_cast<std::size_t>(v));
        } else if (key == "write_queue_max_bytes") {
            if (parseUint(val, v)) t->SetWriteQueueMaxBytes(static_cast<std::size_t>(v));
        } else if (key == "write_timeout_ms") {
            if (parseUint(val, v)) t->SetWriteTimeoutMs(v);
        } else {
            LOG_WARN("StdioTransportFactory: unknown key '{}'", key);
        }
    }
    return t;
}

} // namespace codebridge
