#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>

#include "etherstream/core/Sample.hpp"

namespace etherstream::core {

/**
 * @brief Base class that owns the streaming worker thread and the sample source.
 *
 * Subclasses (e.g. EtherDreamDevice) implement `run()`, which is called once
 * on the worker thread after `start()` and must return promptly once
 * `running` becomes false. This base only handles:
 * - Storing the user-provided frame source and the target point rate.
 * - Pulling frames from that source via pullFrame().
 * - Worker thread lifecycle.
 *
 * Connection teardown leaves the source and rate alone, so
 * a device can be closed and reconnected without re-installing them.
 */
class LaserDeviceBase {
public:
    LaserDeviceBase();
    virtual ~LaserDeviceBase();

    LaserDeviceBase(const LaserDeviceBase&) = delete;
    LaserDeviceBase& operator=(const LaserDeviceBase&) = delete;

    /**
     * @brief Install or replace the frame source.
     * @param source Callable returning the currently available samples. May be
     *               empty to detach the source; the worker then idles.
     */
    void setFrameSource(FrameSource source);
    bool hasFrameSource() const;

    /// Target point rate in points per second. Zero means "not configured".
    void setPointRate(std::uint32_t pointsPerSecond);
    std::uint32_t getPointRate() const;

    /// Configure both at once; a zero rate leaves the current rate untouched.
    void streamFrames(std::uint32_t pointsPerSecond, FrameSource source);

    /// Start the worker thread.
    void start();

    /// Request the worker to stop and wait for it to finish.
    void stop();

    bool isRunning() const { return running.load(); }

protected:
    virtual void run() = 0; // the worker loop

    /**
     * @brief Invoke the installed source.
     * @param out Receives the frame; untouched when no source is installed.
     * @return false if no source is installed.
     */
    bool pullFrame(Frame& out);

    std::thread worker;
    std::atomic<bool> running{false};

private:
    mutable std::mutex sourceMutex;
    FrameSource frameSource{};
    std::atomic<std::uint32_t> pointRate{0};
};

} // namespace etherstream::core
