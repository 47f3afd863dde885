#pragma once

#include "fieldsync/events/event_bus.hpp"
#include "fieldsync/events/events.hpp"
#include "fieldsync/model/types.hpp"

#include <functional>
#include <mutex>

namespace fieldsync::sync {

/**
 * @brief Raw reachability report from the platform network layer
 */
struct PlatformSignal {
    bool connected = false;
    bool internet_reachable = false;
    ConnectionKind kind = ConnectionKind::Unknown;
};

/**
 * @brief Tracks device reachability and publishes transitions
 *
 * STATE MACHINE:
 * Unknown -> {Offline, Online(kind)}, driven only by on_platform_signal().
 * Nothing is polled or guessed; until the first signal the state is
 * {reachable=false, kind=Unknown}.
 *
 * The monitor never starts a sync. Debounce and wifi-only policy belong to
 * the scheduler and the engine.
 */
class ConnectivityMonitor {
public:
    explicit ConnectivityMonitor(events::EventBus& bus);

    ConnectivityMonitor(const ConnectivityMonitor&) = delete;
    ConnectivityMonitor& operator=(const ConnectivityMonitor&) = delete;

    /**
     * @brief Feed a platform observation
     *
     * @return true when the observation changed the state (and was published)
     */
    bool on_platform_signal(const PlatformSignal& signal);

    ConnectivityState state() const;
    bool reachable() const { return state().reachable; }

    /**
     * @brief True once at least one platform signal was observed
     */
    bool observed() const;

    [[nodiscard]] events::Subscription subscribe(
        std::function<void(const events::ConnectivityChangedEvent&)> handler);

private:
    static ConnectivityState classify(const PlatformSignal& signal);

    events::EventBus& bus_;

    // Serializes signal handling so subscribers see transitions in order
    std::mutex signal_mutex_;

    mutable std::mutex state_mutex_;
    ConnectivityState state_;
    bool observed_ = false;
};

} // namespace fieldsync::sync
