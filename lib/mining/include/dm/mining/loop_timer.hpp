/*
Module Name:
- loop_timer.hpp

Abstract:
- Cancellable sleep used between loop iterations. The executor must be the
  strand the sleeping coroutine runs on; a cancelled timer stays cancelled.
- stop() cancels every session timer so shutdown waits for at most one
  in-flight network call.
*/
#pragma once

// C++ Standard Library
#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace drop_miner
{

    class LoopTimer : public std::enable_shared_from_this<LoopTimer>
    {
    public:
        explicit LoopTimer(boost::asio::any_io_executor executor) :
            timer_(std::move(executor))
        {
        }

        // false when the wait was cancelled, now or earlier.
        [[nodiscard]] auto sleep(std::chrono::steady_clock::duration d) -> boost::asio::awaitable<bool>
        {
            if (cancelled_.load(std::memory_order_acquire))
            {
                co_return false;
            }
            boost::system::error_code ec;
            timer_.expires_after(d);
            co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            co_return !ec;
        }

        // Thread safe; the cancel runs on the timer's executor.
        void cancel()
        {
            cancelled_.store(true, std::memory_order_release);
            boost::asio::post(timer_.get_executor(), [self = shared_from_this()] { self->timer_.cancel(); });
        }

    private:
        boost::asio::steady_timer timer_;
        std::atomic<bool> cancelled_{ false };
    };

} // namespace drop_miner
