#pragma once

#include <chrono>

namespace etherstream::net {

/**
 * @brief Process-wide default deadline for connect and write operations.
 *
 * Waiting for a device response is not covered here; sessions wait for
 * replies without a deadline unless one is set per session.
 */
class TimeoutConfig {
public:
    using duration = std::chrono::milliseconds;

    /** Set the process-wide default timeout (clamped to >= 0). */
    static void setDefault(duration timeout) {
        storage() = sanitize(timeout);
    }

    static duration defaultTimeout() {
        return storage();
    }

    /** RAII helper that temporarily overrides the default timeout. */
    class ScopedOverride {
    public:
        explicit ScopedOverride(duration timeout)
        : previous_(storage()) {
            storage() = sanitize(timeout);
        }

        ScopedOverride(const ScopedOverride&) = delete;
        ScopedOverride& operator=(const ScopedOverride&) = delete;

        ~ScopedOverride() {
            storage() = previous_;
        }

    private:
        duration previous_;
    };

    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

private:
    static duration& storage() {
        static duration timeout{duration{1000}}; // default = 1s
        return timeout;
    }
};

} // namespace etherstream::net
