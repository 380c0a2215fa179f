//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingRequestTable.h
// Purpose: Registry of in-flight requests keyed by JSON-RPC id, with per-request cancellation
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>

#include "codebridge/JSONRPCTypes.h"

namespace codebridge {

//==========================================================================================================
// PendingRequestTable
// Purpose: Tracks requests between dispatch and response. Every operation is atomic with respect to the
//          others (one mutex). An entry leaves the table exactly once: via Complete, Cancel or CancelAll.
//          Leaving through Cancel/CancelAll requests stop on the entry's stop_source.
// Notes:
//   Keys are type-tagged ("s:" for string ids, "n:" for integer ids) so "1" and 1 never collide.
//   Complete only succeeds for the exact Entry returned by Register, so a late completion of a cancelled
//   request cannot remove a newer request that reused the same id.
//==========================================================================================================
class PendingRequestTable {
public:
    struct Entry {
        JSONRPCId id;
        std::stop_source stop;
        std::chrono::steady_clock::time_point start;
    };

    static std::string KeyFor(const JSONRPCId& id);

    // Returns nullptr when a request with the same id is already pending.
    std::shared_ptr<Entry> Register(const JSONRPCId& id);

    // Removes the entry when it is still the one registered under its id. True means the caller owns the
    // right (and duty) to send the response.
    bool Complete(const std::shared_ptr<Entry>& entry);

    // Removes and stops the entry registered under id. False when nothing was pending under that id.
    bool Cancel(const JSONRPCId& id);

    // Removes and stops every entry; returns how many were pending.
    std::size_t CancelAll();

    std::size_t Size() const;
    bool Contains(const JSONRPCId& id) const;

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries;
};

} // namespace codebridge
