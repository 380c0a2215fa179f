//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager, self-destroying coroutine type for request handlers
//==========================================================================================================

#pragma once

#include <coroutine>

namespace codebridge {
namespace async {

//==========================================================================================================
// Task
// Purpose: Coroutine type that starts running immediately (no initial suspension) and destroys its own
//          frame on completion. The handler owns its outcome: results and errors are reported from inside
//          the body, so there is nothing to retrieve from the returned object.
// Usage:
//   Task handle(std::shared_ptr<Entry> entry) { auto v = co_await awaitable; respond(entry, v); }
// Notes:
//   Dropping a Task does not cancel or block on the coroutine; the frame lives until the body finishes.
//   An exception escaping the body is rethrown to whoever started or last resumed it.
//==========================================================================================================
class Task {
public:
    struct promise_type {
        Task get_return_object() noexcept { return Task{}; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { throw; }
        void return_void() noexcept {}
    };
};

} // namespace async
} // namespace codebridge
