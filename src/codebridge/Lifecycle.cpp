//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Lifecycle.cpp
// Purpose: Session state machine
//==========================================================================================================

#include "logging/Logger.h"
#include "codebridge/Lifecycle.h"

namespace codebridge {

const char* LifecycleStateName(LifecycleState state) {
    switch (state) {
        case LifecycleState::Uninitialized: return "Uninitialized";
        case LifecycleState::Initializing: return "Initializing";
        case LifecycleState::Ready: return "Ready";
        case LifecycleState::ShuttingDown: return "ShuttingDown";
        case LifecycleState::Closed: return "Closed";
    }
    return "Unknown";
}

LifecycleState Lifecycle::State() const {
    std::lock_guard<std::mutex> lock(mutex);
    return state;
}

std::optional<errors::RpcError> Lifecycle::Admit(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex);
    return admitLocked(method);
}

std::optional<errors::RpcError> Lifecycle::admitLocked(const std::string& method) const {
    switch (state) {
        case LifecycleState::Uninitialized:
            if (method == "initialize") return std::nullopt;
            return errors::notInitialized();
        case LifecycleState::Initializing:
            if (method == "initialize") return errors::invalidRequest("Initialization already in progress");
            return errors::notInitialized();
        case LifecycleState::Ready:
            if (method == "initialize") return errors::invalidRequest("Server already initialized");
            return std::nullopt;
        case LifecycleState::ShuttingDown:
        case LifecycleState::Closed:
            break;
    }
    return errors::invalidRequest("Server is shutting down");
}

std::optional<errors::RpcError> Lifecycle::BeginInitialize() {
    std::lock_guard<std::mutex> lock(mutex);
    if (auto err = admitLocked("initialize")) {
        return err;
    }
    moveTo(LifecycleState::Initializing);
    return std::nullopt;
}

void Lifecycle::CompleteInitialize() {
    std::lock_guard<std::mutex> lock(mutex);
    if (state == LifecycleState::Initializing) {
        moveTo(LifecycleState::Ready);
    }
}

void Lifecycle::AbortInitialize() {
    std::lock_guard<std::mutex> lock(mutex);
    if (state == LifecycleState::Initializing) {
        moveTo(LifecycleState::Uninitialized);
    }
}

bool Lifecycle::BeginShutdown() {
    std::lock_guard<std::mutex> lock(mutex);
    if (state == LifecycleState::ShuttingDown || state == LifecycleState::Closed) {
        return false;
    }
    moveTo(LifecycleState::ShuttingDown);
    return true;
}

void Lifecycle::MarkClosed() {
    std::lock_guard<std::mutex> lock(mutex);
    if (state != LifecycleState::Closed) {
        moveTo(LifecycleState::Closed);
    }
}

void Lifecycle::moveTo(LifecycleState next) {
    LOG_DEBUG("Lifecycle: {} -> {}", LifecycleStateName(state), LifecycleStateName(next));
    state = next;
}

} // namespace codebridge
