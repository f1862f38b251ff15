#pragma once
#include "etherstream/net/NetConfig.hpp"
#include <memory>
#include <thread>

namespace etherstream::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * Every socket handler in the library (connect, writes, and the permanent
 * receive loop that feeds the response demultiplexer) runs on this thread,
 * so a session keeps draining inbound bytes while its caller is blocked
 * waiting for a reply.
 *
 * Lifetime notes:
 * - Destroy network clients before `NetService` so their handlers complete while
 *   the `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins the thread.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

/// The process-wide I/O context; its service thread starts on first use.
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace etherstream::net
