#pragma once
#include "etherstream/net/NetConfig.hpp"
#include "etherstream/net/Deadline.hpp"
#include "etherstream/net/TimeoutConfig.hpp"
#include "etherstream/net/NetService.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

namespace etherstream::net {
using duration = TimeoutConfig::duration;

/**
 * @brief `tcp::socket` wrapper with deadlines and a background receive loop.
 *
 * Highlights:
 * - `connect(...)` tries each endpoint in turn with a per-attempt timeout.
 * - `write_all(...)` blocks the caller while enforcing a deadline.
 * - `startReceiving(...)` arms a permanent read loop that hands every chunk
 *   the kernel delivers, of whatever size, to a callback on the I/O thread.
 * - All socket work is serialized by a strand executor, so the caller thread
 *   never touches the socket while a handler is running.
 *
 * The blocking calls must not be made from the I/O thread itself.
 */
class TcpClient {
public:
    using ReceiveHandler = std::function<void(const std::uint8_t* data, std::size_t size)>;
    using ReceiveErrorHandler = std::function<void(const error_code& ec)>;

    TcpClient();
    ~TcpClient();

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    void setDefaultTimeout(duration timeout) { defaultTimeout_ = TimeoutConfig::sanitize(timeout); }
    duration defaultTimeout() const { return defaultTimeout_; }

    void setConnectTimeout(duration timeout) { connectTimeout_ = TimeoutConfig::sanitize(timeout); }
    duration connectTimeout() const { return connectTimeout_; }

    error_code connect(const tcp::endpoint& endpoint, duration timeout);
    error_code connect(const tcp::endpoint& endpoint) { return connect(endpoint, connectTimeout_); }

    /// Try each endpoint in order; returns the last failure if none connect.
    error_code connect(const std::vector<tcp::endpoint>& endpoints, duration timeout);
    error_code connect(const std::vector<tcp::endpoint>& endpoints) {
        return connect(endpoints, connectTimeout_);
    }

    error_code write_all(const void* buf, std::size_t n, duration timeout);
    error_code write_all(const void* buf, std::size_t n) { return write_all(buf, n, defaultTimeout_); }

    /**
     * @brief Start the receive loop.
     *
     * @p onData runs on the I/O thread for every chunk received. @p onError
     * runs once if the peer closes the connection or a read fails; the loop
     * is finished after that. Neither runs after stopReceiving() returns.
     */
    void startReceiving(ReceiveHandler onData, ReceiveErrorHandler onError);

    /// Stop the receive loop and wait until no handler is in flight.
    void stopReceiving();

    /// Enable TCP_NODELAY and keepalive to reduce jitter.
    void setLowLatency();

    bool is_open() const { return open_.load(); }

    /// Stop receiving, then cancel -> shutdown -> close. Idempotent.
    void close();

private:
    struct Receiver {
        std::array<std::uint8_t, 4096> buffer{};
        ReceiveHandler onData;
        ReceiveErrorHandler onError;
        std::atomic<bool> active{true};
    };

    error_code connect_one(const tcp::endpoint& ep, duration timeout);
    void receiveNext(std::shared_ptr<Receiver> receiver);

    // Run fn on the strand and wait for it, or inline when already there.
    template <typename Fn>
    void runOnStrand(Fn&& fn) {
        if (strand_.running_in_this_thread()) {
            fn();
            return;
        }
        std::promise<void> done;
        auto finished = done.get_future();
        asio::dispatch(strand_, [&]{
            fn();
            done.set_value();
        });
        finished.wait();
    }

    std::shared_ptr<asio::io_context> io_;
    asio::strand<asio::io_context::executor_type> strand_;
    tcp::socket socket_;
    std::atomic<bool> open_{false};
    std::mutex receiverMutex_;
    std::shared_ptr<Receiver> receiver_;
    duration defaultTimeout_;
    duration connectTimeout_;
};

} // namespace etherstream::net
