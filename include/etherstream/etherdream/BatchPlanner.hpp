#pragma once

#include <cstddef>
#include <cstdint>

namespace etherstream::etherdream {

struct BatchPlan {
    /// Maximum number of samples to send on this pass.
    std::size_t capacity = 0;
    /// True when the spare space was below the throttle threshold; the
    /// caller pauses for ETHERDREAM_THROTTLE_PAUSE before sending.
    bool throttled = false;
};

/**
 * @brief Size the next data command from the last reported buffer fullness.
 *
 * Spare space is capacity minus fullness, floored at zero. Fullness is only
 * reported in replies, so it is always one round trip stale; when the spare
 * space looks small the plan assumes the device keeps draining during the
 * pause and pads the estimate instead of sending a tiny batch.
 */
BatchPlan planBatch(std::uint16_t bufferFullness);

} // namespace etherstream::etherdream
