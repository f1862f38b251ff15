#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

namespace etherstream::etherdream {

/**
 * @brief Splits an unframed inbound byte stream into per-request replies.
 *
 * The transport hands over bytes in whatever chunks the kernel produced;
 * requests register how many bytes their reply occupies. Replies are matched
 * strictly in registration order (the device answers in request order and
 * carries no message id), and only the head of the queue is ever satisfied.
 *
 * Thread model: feed() normally runs on the I/O thread while expect() runs on
 * the caller thread. Only one thread delivers at a time, so completions fire in
 * registration order; they are invoked without the internal lock held and may
 * call expect() themselves. An exception from a completion propagates out of
 * feed()/expect() after that slot has been consumed; later slots are served by
 * the next call.
 */
class ResponseDemux {
public:
    using Bytes = std::vector<std::uint8_t>;

    struct PendingResponse {
        char command = 0;            // opcode being answered, for diagnostics
        std::size_t size = 0;        // exact reply length in bytes
        std::function<void(Bytes&&)> complete;
    };

    /// Append inbound bytes and deliver any replies that are now complete.
    void feed(const std::uint8_t* data, std::size_t size);

    /// Queue a reply slot behind the ones already pending.
    void expect(PendingResponse pending);

    /**
     * @brief Queue a typed reply slot.
     *
     * @p decode turns the raw reply into the request's result type; the
     * returned future becomes ready once the reply has been decoded. If the
     * demux is reset first, the future reports std::future_errc::broken_promise.
     * An exception thrown by @p decode is rethrown from the future's get().
     */
    template <typename Decode>
    auto request(char command, std::size_t size, Decode decode)
        -> std::future<std::invoke_result_t<Decode&, const Bytes&>>
    {
        using Result = std::invoke_result_t<Decode&, const Bytes&>;
        auto promise = std::make_shared<std::promise<Result>>();
        auto future = promise->get_future();
        expect(PendingResponse{command, size,
            [promise, decode = std::move(decode)](Bytes&& bytes) mutable {
                try {
                    promise->set_value(decode(bytes));
                } catch (...) {
                    promise->set_exception(std::current_exception());
                }
            }});
        return future;
    }

    /// Drop buffered bytes and pending slots; dropped completions never run.
    void reset();

    std::size_t bufferedBytes() const;
    std::size_t pendingCount() const;

private:
    void deliver();

    mutable std::mutex mutex;
    std::deque<std::uint8_t> inbound;
    std::deque<PendingResponse> pending;
    bool delivering = false;
};

} // namespace etherstream::etherdream
