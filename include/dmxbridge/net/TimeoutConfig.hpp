#pragma once

#include <atomic>
#include <chrono>

namespace dmxbridge::net {

/**
 * @brief Process-wide default deadline for blocking socket helpers.
 *
 * Read concurrently by every forwarding thread, so the value lives in an
 * atomic tick count rather than a plain duration.
 */
class TimeoutConfig {
public:
    using duration = std::chrono::milliseconds;

    /** Set the process-wide default timeout (clamped to >= 1 ms). */
    static void setDefault(duration timeout) {
        storage().store(sanitize(timeout).count(), std::memory_order_relaxed);
    }

    static duration defaultTimeout() {
        return duration{storage().load(std::memory_order_relaxed)};
    }

    /** RAII helper that temporarily overrides the default timeout. */
    class ScopedOverride {
    public:
        explicit ScopedOverride(duration timeout)
        : previous_(defaultTimeout()) {
            setDefault(timeout);
        }

        ScopedOverride(const ScopedOverride&) = delete;
        ScopedOverride& operator=(const ScopedOverride&) = delete;

        ~ScopedOverride() {
            setDefault(previous_);
        }

    private:
        duration previous_;
    };

private:
    static duration sanitize(duration timeout) {
        return timeout.count() < 1 ? duration{1} : timeout;
    }

    static std::atomic<duration::rep>& storage() {
        static std::atomic<duration::rep> timeout{1000}; // default = 1s
        return timeout;
    }
};

} // namespace dmxbridge::net
