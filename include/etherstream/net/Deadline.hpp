#pragma once
#include "etherstream/net/NetConfig.hpp"
#include "etherstream/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

/**
 * @brief Run an async operation with a deadline enforced by an Asio timer.
 *
 * Pattern:
 * - Start an async operation and an `asio::steady_timer` on the same executor.
 * - Whichever completes first cancels the other and signals a condition
 *   variable so this call can return synchronously with a timeout.
 *
 * Safety notes:
 * - Completion handlers capture a `shared_ptr<State>` so they cannot access
 *   destroyed synchronisation primitives even if they run after this function
 *   returns.
 * - The `cancel()` functor must cancel the same socket or timer that launched
 *   the operation.
 *
 * Requirements:
 * - The associated `asio::io_context` must already be running while we block.
 * - Must not be called from the thread running that executor.
 */
namespace etherstream::net {

template<typename StartAsync, typename Cancel>
std::error_code with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    struct State {
        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        std::error_code ec = asio::error::would_block;
    };

    auto st = std::make_shared<State>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    auto op_handler = [st, timer](const std::error_code& op_ec, auto&&... /*ignored*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) return;           // another path already won
            st->ec = op_ec;
            st->done = true;
        }
        st->cv.notify_one();
        timer->cancel();
    };

    start_async(op_handler);

    timer->expires_after(timeout);
    timer->async_wait([st, cancel, timer, timeout](const std::error_code& tec){
        if (tec == asio::error::operation_aborted) {
            return; // operation finished first
        }
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) {
                return;
            }
            st->ec = asio::error::timed_out;
            st->done = true;
        }
        logWarning("[with_deadline] timeout fired after ", timeout.count(), "ms\n");
        cancel();
        st->cv.notify_one();
    });

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->done; });
    return st->ec;
}

} // namespace etherstream::net
