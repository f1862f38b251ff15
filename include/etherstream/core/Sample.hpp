#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace etherstream::core {

// One point for the projector, in device units.
// - x, y : signed 16-bit deflection, full range
// - r, g, b : 16-bit colour channels
// - control, i, u1, u2 : protocol fields, zero unless the producer sets them

struct Sample {
    std::int16_t x = 0;
    std::int16_t y = 0;
    std::uint16_t r = 0;
    std::uint16_t g = 0;
    std::uint16_t b = 0;
    std::uint16_t control = 0;
    std::uint16_t i = 0;
    std::uint16_t u1 = 0;
    std::uint16_t u2 = 0;

    bool operator==(const Sample& other) const {
        return x == other.x && y == other.y
            && r == other.r && g == other.g && b == other.b
            && control == other.control && i == other.i
            && u1 == other.u1 && u2 == other.u2;
    }
    bool operator!=(const Sample& other) const { return !(*this == other); }
};

using Frame = std::vector<Sample>;

/**
 * @brief Pull source of samples.
 *
 * Called repeatedly by the streaming loop. Returns whatever work is available
 * right now; an empty frame means "nothing ready yet". Samples beyond what the
 * device can accept on this pass are dropped, and the source is asked again on
 * the next pass.
 */
using FrameSource = std::function<Frame()>;

} // namespace etherstream::core
