#include "etherstream/core/LaserDeviceBase.hpp"
#include "etherstream/log/Log.hpp"

#include <utility>

namespace etherstream::core {

LaserDeviceBase::LaserDeviceBase() = default;

LaserDeviceBase::~LaserDeviceBase() {
    stop();
}

void LaserDeviceBase::setFrameSource(FrameSource source) {
    std::lock_guard lock(sourceMutex);
    frameSource = std::move(source);
}

bool LaserDeviceBase::hasFrameSource() const {
    std::lock_guard lock(sourceMutex);
    return static_cast<bool>(frameSource);
}

void LaserDeviceBase::setPointRate(std::uint32_t pointsPerSecond) {
    pointRate.store(pointsPerSecond, std::memory_order_relaxed);
}

std::uint32_t LaserDeviceBase::getPointRate() const {
    return pointRate.load(std::memory_order_relaxed);
}

void LaserDeviceBase::streamFrames(std::uint32_t pointsPerSecond, FrameSource source) {
    if (pointsPerSecond != 0) {
        setPointRate(pointsPerSecond);
    }
    if (source) {
        setFrameSource(std::move(source));
    }
}

bool LaserDeviceBase::pullFrame(Frame& out) {
    FrameSource source;
    {
        std::lock_guard lock(sourceMutex);
        source = frameSource;
    }
    if (!source) {
        return false;
    }
    // Run the user callback without holding the lock so it may swap sources.
    out = source();
    return true;
}

void LaserDeviceBase::start() {
    if (running) return; // Already running.
    if (worker.joinable()) {
        worker.join(); // reap a loop that exited on its own
    }
    running = true;
    worker = std::thread([this] {
        this->run(); // Calls the virtual run(), so subclass overrides execute.
        running = false;
    });
}

void LaserDeviceBase::stop() {
    running = false;
    if (worker.joinable()) {
        if (worker.get_id() == std::this_thread::get_id()) {
            // stop() from inside run(): the loop exits on its own.
            return;
        }
        logInfo("[LaserDeviceBase] stop()\n");
        worker.join();
    }
}

} // namespace etherstream::core
