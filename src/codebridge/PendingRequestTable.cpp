//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingRequestTable.cpp
// Purpose: In-flight request bookkeeping
//==========================================================================================================

#include <vector>

#include "logging/Logger.h"
#include "codebridge/PendingRequestTable.h"

namespace codebridge {

std::string PendingRequestTable::KeyFor(const JSONRPCId& id) {
    if (std::holds_alternative<std::string>(id)) {
        return "s:" + std::get<std::string>(id);
    }
    if (std::holds_alternative<int64_t>(id)) {
        return "n:" + std::to_string(std::get<int64_t>(id));
    }
    return "null";
}

std::shared_ptr<PendingRequestTable::Entry> PendingRequestTable::Register(const JSONRPCId& id) {
    auto entry = std::make_shared<Entry>();
    entry->id = id;
    entry->start = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex);
    auto [it, inserted] = entries.emplace(KeyFor(id), entry);
    if (!inserted) {
        return nullptr;
    }
    return entry;
}

bool PendingRequestTable::Complete(const std::shared_ptr<Entry>& entry) {
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find(KeyFor(entry->id));
    if (it == entries.end() || it->second != entry) {
        return false;
    }
    entries.erase(it);
    return true;
}

bool PendingRequestTable::Cancel(const JSONRPCId& id) {
    std::shared_ptr<Entry> victim;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = entries.find(KeyFor(id));
        if (it == entries.end()) {
            return false;
        }
        victim = std::move(it->second);
        entries.erase(it);
        }
    victim->stop.request_stop();
    return true;
}

std::size_t PendingRequestTable::CancelAll() {
    std::vector<std::shared_ptr<Entry>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex);
        victims.reserve(entries.size());
        for (auto& [key, entry] : entries) {
            victims.push_back(std::move(entry));
        }
        entries.clear();
    }
    for (auto& v : victims) {
        v->stop.request_stop();
    }
    if (!victims.empty()) {
        LOG_INFO("PendingRequestTable: cancelled {} pending request(s)", victims.size());
    }
    return victims.size();
}

std::size_t PendingRequestTable::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}

bool PendingRequestTable::Contains(const JSONRPCId& id) const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.find(KeyFor(id)) != entries.end();
}

} // namespace codebridge
