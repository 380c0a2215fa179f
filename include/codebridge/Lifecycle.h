//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Lifecycle.h
// Purpose: Session state machine gating request admission (handshake and shutdown)
//==========================================================================================================

#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "codebridge/errors/Errors.h"

namespace codebridge {

enum class LifecycleState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Closed
};

const char* LifecycleStateName(LifecycleState state);

//==========================================================================================================
// Lifecycle
// Purpose: Uninitialized -> Initializing -> Ready -> ShuttingDown -> Closed. Transitions only move forward,
//          except AbortInitialize which returns a failed handshake to Uninitialized.
// Methods:
//   Admit(method): Error a request must be answered with instead of being dispatched, or std::nullopt.
//                  initialize is admitted only while Uninitialized; everything else only while Ready.
//   BeginInitialize(): Claims the handshake; fails like Admit("initialize").
//   BeginShutdown(): True for the caller that moved the session into ShuttingDown.
//==========================================================================================================
class Lifecycle {
public:
    LifecycleState State() const;

    std::optional<errors::RpcError> Admit(const std::string& method) const;

    std::optional<errors::RpcError> BeginInitialize();
    void CompleteInitialize();
    void AbortInitialize();

    bool BeginShutdown();
    void MarkClosed();

private:
    std::optional<errors::RpcError> admitLocked(const std::string& method) const;
    void moveTo(LifecycleState next);

    mutable std::mutex mutex;
    LifecycleState state{LifecycleState::Uninitialized};
};

} // namespace codebridge
