//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <random>
#include <stop_token>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "codebridge/InMemoryTransport.hpp"

namespace codebridge {

class InMemoryTransport::Impl {
public:
    enum class EventKind { Message, EndOfStream, FramingError };
    struct Event {
        EventKind kind;
        std::string data;
    };

    std::atomic<bool> connected{false};
    std::atomic<bool> closeFired{false};
    std::string sessionId;
    ITransport::MessageHandler messageHandler;
    ITransport::ErrorHandler errorHandler;
    ITransport::CloseHandler closeHandler;

    std::deque<Event> inbound;
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::jthread processingThread;

    mutable std::mutex outMutex;
    std::condition_variable outCondition;
    std::deque<std::string> outbound;
    std::size_t outboundTotal{0};

    std::mutex closedMutex;
    std::condition_variable closedCondition;

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    ~Impl() {
        stopProcessing();
    }

    void stopProcessing() {
        if (processingThread.joinable()) {
            processingThread.request_stop();
            queueCondition.notify_all();
            if (processingThread.get_id() == std::this_thread::get_id()) {
                processingThread.detach();
            } else {
                processingThread.join();
            }
        }
    }

    void fireClose(CloseReason reason) {
        if (closeFired.exchange(true)) {
            return;
        }
        if (closeHandler) {
            closeHandler(reason);
        }
        {
            std::lock_guard<std::mutex> lk(closedMutex);
        }
        closedCondition.notify_all();
    }

    void push(Event ev) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            inbound.push_back(std::move(ev));
        }
        queueCondition.notify_one();
    }

    void startProcessing() {
        processingThread = std::jthread([this](std::stop_token st) {
            while (!st.stop_requested()) {
                Event ev;
                {
                    std::unique_lock<std::mutex> lock(queueMutex);
                    queueCondition.wait(lock, [this, &st]() { return !inbound.empty() || st.stop_requested(); });
                    if (st.stop_requested()) {
                        break;
                    }
                    ev = std::move(inbound.front());
                    inbound.pop_front();
                }
                switch (ev.kind) {
                    case EventKind::Message:
                        if (messageHandler) {
                            try {
                                messageHandler(ev.data);
                            } catch (const std::exception& e) {
                                LOG_ERROR("InMemoryTransport: message handler threw: {}", e.what());
                            }
                        }
                        break;
                    case EventKind::EndOfStream:
                        fireClose(CloseReason::EndOfStream);
                        return;
                    case EventKind::FramingError:
                        if (errorHandler) {
                            errorHandler(ev.data);
                        }
                        fireClose(CloseReason::FramingError);
                        return;
                }
            }
        });
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }
InMemoryTransport::~InMemoryTransport() { FUNC_SCOPE(); }

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    if (!pImpl->connected.exchange(true)) {
        pImpl->startProcessing();
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    pImpl->connected = false;
    pImpl->stopProcessing();
    pImpl->fireClose(CloseReason::Local);
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->connected.load(); }
std::string InMemoryTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

bool InMemoryTransport::Send(const std::string& payload) {
    FUNC_SCOPE();
    if (!pImpl->connected.load()) {
        LOG_DEBUG("InMemoryTransport: Send while disconnected ignored");
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(pImpl->outMutex);
        pImpl->outbound.push_back(payload);
        ++pImpl->outboundTotal;
    }
    pImpl->outCondition.notify_all();
    return true;
}

void InMemoryTransport::SetMessageHandler(MessageHandler handler) { FUNC_SCOPE(); pImpl->messageHandler = std::move(handler); }
void InMemoryTransport::SetErrorHandler(ErrorHandler handler) { FUNC_SCOPE(); pImpl->errorHandler = std::move(handler); }
void InMemoryTransport::SetCloseHandler(CloseHandler handler) { FUNC_SCOPE(); pImpl->closeHandler = std::move(handler); }

void InMemoryTransport::Deliver(const std::string& payload) {
    pImpl->push({Impl::EventKind::Message, payload});
}

void InMemoryTransport::SignalEndOfStream() {
    pImpl->push({Impl::EventKind::EndOfStream, std::string()});
}

void InMemoryTransport::SignalFramingError(const std::string& detail) {
    pImpl->push({Impl::EventKind::FramingError, detail});
}

std::optional<std::string> InMemoryTransport::NextOutbound(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(pImpl->outMutex);
    if (!pImpl->outCondition.wait_for(lk, timeout, [this]{ return !pImpl->outbound.empty(); })) {
        return std::nullopt;
    }
    std::string front = std::move(pImpl->outbound.front());
    pImpl->outbound.pop_front();
    return front;
}

bool InMemoryTransport::WaitForOutbound(std::size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(pImpl->outMutex);
    return pImpl->outCondition.wait_for(lk, timeout, [this, count]{ return pImpl->outboundTotal >= count; });
}

std::vector<std::string> InMemoryTransport::TakeOutbound() {
    std::lock_guard<std::mutex> lk(pImpl->outMutex);
    std::vector<std::string> out(pImpl->outbound.begin(), pImpl->outbound.end());
    pImpl->outbound.clear();
    return out;
}

std::size_t InMemoryTransport::OutboundCount() const {
    std::lock_guard<std::mutex> lk(pImpl->outMutex);
    return pImpl->outbound.size();
}

bool InMemoryTransport::WaitForClosed(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(pImpl->closedMutex);
    return pImpl->closedCondition.wait_for(lk, timeout, [this]{ return pImpl->closeFired.load(); });
}

} // namespace codebridge
