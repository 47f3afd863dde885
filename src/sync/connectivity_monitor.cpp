#include "fieldsync/sync/connectivity_monitor.hpp"

#include <spdlog/spdlog.h>

namespace fieldsync::sync {

ConnectivityMonitor::ConnectivityMonitor(events::EventBus& bus) : bus_(bus) {}

ConnectivityState ConnectivityMonitor::classify(const PlatformSignal& signal) {
    ConnectivityState state;
    state.reachable = signal.connected && signal.internet_reachable;
    if (!signal.connected) {
        state.kind = ConnectionKind::None;
    } else {
        state.kind = signal.kind;
    }
    return state;
}

bool ConnectivityMonitor::on_platform_signal(const PlatformSignal& signal) {
    std::lock_guard signal_lock(signal_mutex_);

    const ConnectivityState next = classify(signal);
    ConnectivityState previous;
    {
        std::lock_guard lock(state_mutex_);
        if (observed_ && state_ == next) {
            return false;
        }
        previous = state_;
        state_ = next;
        observed_ = true;
    }

    spdlog::debug("Connectivity signal: connected={} internet={} kind={}",
                  signal.connected, signal.internet_reachable, TypeNames::to_string(signal.kind));

    events::ConnectivityChangedEvent event;
    event.previous = previous;
    event.current = next;
    bus_.emit(event);
    return true;
}

ConnectivityState ConnectivityMonitor::state() const {
    std::lock_guard lock(state_mutex_);
    return state_;
}

bool ConnectivityMonitor::observed() const {
    std::lock_guard lock(state_mutex_);
    return observed_;
}

events::Subscription ConnectivityMonitor::subscribe(
    std::function<void(const events::ConnectivityChangedEvent&)> handler) {
    return bus_.subscribe<events::ConnectivityChangedEvent>(std::move(handler));
}

} // namespace fieldsync::sync
