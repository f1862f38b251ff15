#include "etherstream/etherdream/EtherDreamDevice.hpp"
#include <iostream>
#include <chrono>
#include <thread>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

using namespace etherstream;

namespace {

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <host> [port] [points-per-second] [seconds]\n";
}

// One revolution of a circle at 20% brightness, a different colour per quadrant.
core::Frame makeCircle() {
    constexpr std::size_t kCirclePoints = 500;
    constexpr double kScale = 0.8 * 32767.0;
    constexpr double kBrightness = 0.2 * 65535.0;

    core::Frame points;
    points.reserve(kCirclePoints);
    const double tau = 2.0 * std::acos(-1.0);
    for (std::size_t i = 0; i < kCirclePoints; ++i) {
        const double angle = tau * static_cast<double>(i) / static_cast<double>(kCirclePoints);
        const double x = std::cos(angle);
        const double y = std::sin(angle);

        double r = 0.0;
        double g = 0.0;
        double b = 0.0;
        if (x >= 0.0 && y >= 0.0) {
            r = g = b = 1.0; // quadrant I: white
        } else if (x < 0.0 && y >= 0.0) {
            r = 1.0;         // quadrant II: red
        } else if (x < 0.0 && y < 0.0) {
            g = 1.0;         // quadrant III: green
        } else {
            b = 1.0;         // quadrant IV: blue
        }

        core::Sample s;
        s.x = static_cast<std::int16_t>(std::lround(x * kScale));
        s.y = static_cast<std::int16_t>(std::lround(y * kScale));
        s.r = static_cast<std::uint16_t>(r * kBrightness);
        s.g = static_cast<std::uint16_t>(g * kBrightness);
        s.b = static_cast<std::uint16_t>(b * kBrightness);
        points.push_back(s);
    }
    return points;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 2;
    }

    const std::string host = argv[1];
    unsigned short port = etherdream::config::ETHERDREAM_DAC_PORT_DEFAULT;
    std::uint32_t rate = etherdream::config::ETHERDREAM_DEFAULT_POINT_RATE;
    long seconds = 10;
    try {
        if (argc > 2) port = static_cast<unsigned short>(std::stoul(argv[2]));
        if (argc > 3) rate = static_cast<std::uint32_t>(std::stoul(argv[3]));
        if (argc > 4) seconds = std::stol(argv[4]);
    } catch (const std::exception& e) {
        std::cerr << "bad argument: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    const core::Frame circle = makeCircle();

    etherdream::EtherDreamDevice etherdream;
    etherdream.streamFrames(rate, [&circle] { return circle; });

    if (auto r = etherdream.connect(host, port); !r) {
        const auto err = r.error();
        std::cerr << "Connect failed: " << err.message()
                  << " (" << err.category().name() << ":" << err.value() << ")\n";
        return 1;
    }

    std::cout << "Streaming to " << host << ":" << port << " at " << rate
              << " pps for " << seconds << "s..." << std::endl;
    etherdream.start();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (etherdream.isRunning() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    etherdream.stop();
    const auto failure = etherdream.lastError();
    if (auto stopped = etherdream.getSession().stop(); !stopped && !failure) {
        std::cerr << "stop failed: " << stopped.error().message() << "\n";
    }
    etherdream.close();

    if (failure) {
        std::cerr << "Streaming stopped: " << failure->message() << "\n";
        return 1;
    }
    std::cout << "Done." << std::endl;
    return 0;
}
