//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: Stop-aware co_await on std::future driven by an Asio timer instead of a blocked thread
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <utility>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

namespace codebridge {
namespace async {

//==========================================================================================================
// StoppableFutureAwaitable<T>
// Purpose: Suspends a coroutine until either the future becomes ready or the stop token is triggered.
//          Readiness is polled on a steady_timer bound to the pool executor, so no pool thread is held
//          while a slow provider works.
// Returns (co_await):
//   The future's value when it became ready; std::nullopt when the wait ended because stop was requested.
//   An exception stored in the future is rethrown.
//==========================================================================================================
template <typename T>
class StoppableFutureAwaitable {
public:
    using Executor = boost::asio::thread_pool::executor_type;
    static constexpr std::chrono::milliseconds DefaultPollInterval{2};

    StoppableFutureAwaitable(Executor executor, std::future<T>&& f, std::stop_token stop,
                             std::chrono::milliseconds pollInterval = DefaultPollInterval)
        : executor(std::move(executor)), fut(std::move(f)), stop(std::move(stop)), pollInterval(pollInterval) {}

    bool await_ready() const { return stop.stop_requested() || isReady(); }

    void await_suspend(std::coroutine_handle<> h) {
        auto timer = std::make_shared<boost::asio::steady_timer>(executor);
        arm(std::move(timer), h);
    }

    std::optional<T> await_resume() {
        if (isReady()) {
            return fut.get();
        }
        return std::nullopt;
    }

private:
    bool isReady() const {
        return fut.valid() && fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void arm(std::shared_ptr<boost::asio::steady_timer> timer, std::coroutine_handle<> h) {
        timer->expires_after(pollInterval);
        timer->async_wait([this, timer, h](const boost::system::error_code& ec) {
            if (ec || stop.stop_requested() || isReady()) {
                h.resume();
                return;
            }
            arm(timer, h);
        });
    }

    Executor executor;
    std::future<T> fut;
    std::stop_token stop;
    std::chrono::milliseconds pollInterval;
};

} // namespace async
} // namespace codebridge
