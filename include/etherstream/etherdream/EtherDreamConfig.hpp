#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace etherstream::etherdream::config {

/**
 * @brief Constants that define EtherDream networking and streaming behaviour.
 *
 * Keeping the values here prevents magic numbers from drifting across
 * translation units and makes it easy to tune the integration in one place.
 */

// Networking ------------------------------------------------------------------
constexpr unsigned short ETHERDREAM_DAC_PORT_DEFAULT = 7765;
constexpr std::uint32_t ETHERDREAM_DEFAULT_POINT_RATE = 30000;

// Wire format -----------------------------------------------------------------
constexpr std::size_t ETHERDREAM_RESPONSE_SIZE = 22;      // response + command + 20-byte status
constexpr std::size_t ETHERDREAM_MAX_BATCH = 0xFFFF;      // data command count is a u16
constexpr std::uint16_t ETHERDREAM_LOW_WATER_MARK = 0;    // begin/update field, unused

// Streaming behaviour ---------------------------------------------------------
constexpr std::size_t ETHERDREAM_BUFFER_CAPACITY = 1799;  // device FIFO depth in points
constexpr std::size_t ETHERDREAM_THROTTLE_THRESHOLD = 100;
// Empirically tuned: after a short pause, assume this many points have drained.
constexpr std::size_t ETHERDREAM_THROTTLE_PADDING = 150;
constexpr std::chrono::milliseconds ETHERDREAM_THROTTLE_PAUSE{5};

} // namespace etherstream::etherdream::config
