#pragma once

#include <asio.hpp>
#include <chrono>
#include <system_error>

namespace etherstream::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `etherstream::net::asio` as the standalone Asio namespace.
 * - `etherstream::net::tcp` as the protocol alias.
 * - `etherstream::net::error_code` (Asio standalone reports std::error_code).
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;
using error_code = std::error_code;
using milliseconds = std::chrono::milliseconds;

} // namespace etherstream::net
