/**
 * @brief Implements the EtherDream streaming loop: prepare, batch, begin.
 */
#include "etherstream/etherdream/EtherDreamDevice.hpp"

#include "etherstream/etherdream/BatchPlanner.hpp"
#include "etherstream/log/Log.hpp"

#include <algorithm>
#include <thread>

namespace etherstream::etherdream {

EtherDreamDevice::EtherDreamDevice() {
    setPointRate(config::ETHERDREAM_DEFAULT_POINT_RATE);
}

EtherDreamDevice::~EtherDreamDevice() {
    // Wake the worker if it is blocked on a reply, then join it.
    running = false;
    session.close();
    stop();
}

expected<void>
EtherDreamDevice::connect(const std::string& host, unsigned short port) {
    auto result = session.connect(host, port);
    if (result) {
        clearError();
    }
    return result;
}

expected<void>
EtherDreamDevice::connect(const ip::address& address, unsigned short port) {
    auto result = session.connect(address, port);
    if (result) {
        clearError();
    }
    return result;
}

void EtherDreamDevice::close() {
    running = false;
    session.close();
    stop();
}

expected<void> EtherDreamDevice::reconnect() {
    const bool wasStreaming = isRunning();
    close();

    auto result = session.reconnect();
    if (!result) {
        return result;
    }
    clearError();

    if (wasStreaming) {
        logInfo("[EtherDreamDevice] resuming stream\n");
        start();
    }
    return {};
}

std::optional<std::error_code> EtherDreamDevice::lastError() const {
    std::lock_guard lock(errorMutex);
    return failure;
}

void EtherDreamDevice::clearError() {
    std::lock_guard lock(errorMutex);
    failure.reset();
}

void EtherDreamDevice::run() {
    if (!session.isConnected()) {
        handleFailure("run()", make_error_code(SessionErrc::NotConnected));
        return;
    }

    core::Frame frame;
    while (running) {
        if (!pullFrame(frame)) {
            std::this_thread::yield();
            continue;
        }

        if (session.state().playbackState() == PlaybackState::Idle) {
            if (!check("prepare command", session.prepare())) {
                return;
            }
        }

        const auto plan = planBatch(session.state().bufferFullness());
        if (plan.throttled) {
            std::this_thread::sleep_for(config::ETHERDREAM_THROTTLE_PAUSE);
        }

        // Samples beyond the spare space are dropped, not carried over.
        const std::size_t count = std::min(plan.capacity, frame.size());
        auto dataAck = session.writeSamples(frame.data(), count);
        if (!check("data command", dataAck)) {
            return;
        }

        if (dataAck && !session.state().beginSent()) {
            if (!check("begin command", session.begin(getPointRate()))) {
                return;
            }
        }
    }
}

bool EtherDreamDevice::check(std::string_view what,
                             const expected<EtherDreamSession::DacAck>& ack) {
    if (ack) {
        return true;
    }
    if (ack.error() == SessionErrorKind::DeviceInvalidResponse) {
        // Already logged by the session; keep streaming.
        return running.load();
    }
    handleFailure(what, ack.error());
    return false;
}

void EtherDreamDevice::handleFailure(std::string_view where, const std::error_code& ec) {
    if (!running.load(std::memory_order_relaxed)) {
        return; // close() or stop() got here first.
    }

    logError("[EtherDreamDevice] ", where, " failed: ", ec.message(), "\n");
    running = false;
    std::lock_guard lock(errorMutex);
    failure = ec;
}

} // namespace etherstream::etherdream
