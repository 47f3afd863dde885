#include "fieldsync/sync/auto_sync_scheduler.hpp"

#include <spdlog/spdlog.h>

namespace fieldsync::sync {

AutoSyncScheduler::AutoSyncScheduler(SyncEngine& engine,
                                     events::EventBus& bus,
                                     std::chrono::milliseconds online_debounce)
    : engine_(engine)
    , bus_(bus)
    , online_debounce_(online_debounce)
    , strand_(asio::make_strand(io_))
    , interval_timer_(strand_)
    , debounce_timer_(strand_) {
}

AutoSyncScheduler::~AutoSyncScheduler() {
    stop();
}

void AutoSyncScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }

    // A previous stop() let run() return; the context must be reset before it runs again
    io_.restart();
    work_.emplace(asio::make_work_guard(io_));

    connectivity_sub_ = bus_.subscribe<events::ConnectivityChangedEvent>(
        [this](const events::ConnectivityChangedEvent& e) { on_connectivity_changed(e); });

    settings_sub_ = bus_.subscribe<events::SettingsChangedEvent>(
        [this](const events::SettingsChangedEvent&) {
            asio::post(strand_, [this]() { arm_interval(); });
        });

    asio::post(strand_, [this]() { arm_interval(); });

    for (std::size_t i = 0; i < kIoThreads; ++i) {
        threads_.emplace_back([this]() { io_.run(); });
    }
    spdlog::info("Auto-sync scheduler started");
}

void AutoSyncScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    connectivity_sub_.reset();
    settings_sub_.reset();

    asio::post(strand_, [this]() {
        interval_timer_.cancel();
        debounce_timer_.cancel();
    });
    work_.reset();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    spdlog::info("Auto-sync scheduler stopped");
}

void AutoSyncScheduler::arm_interval() {
    if (!running_.load()) {
        return;
    }

    const std::uint64_t generation = ++interval_generation_;
    const SyncSettings settings = engine_.settings();
    if (!settings.auto_sync) {
        interval_timer_.cancel();
        spdlog::debug("Auto-sync off, interval timer disarmed");
        return;
    }

    interval_timer_.expires_after(std::chrono::milliseconds(settings.sync_interval_ms));
    interval_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted || generation != interval_generation_) {
            return;
        }
        if (ec) {
            spdlog::warn("Interval timer error: {}", ec.message());
            return;
        }
        dispatch_sync(SyncTrigger::Timer);
        arm_interval();
    });
}

void AutoSyncScheduler::arm_debounce() {
    if (!running_.load()) {
        return;
    }

    const std::uint64_t generation = ++debounce_generation_;
    debounce_timer_.expires_after(online_debounce_);
    debounce_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted || generation != debounce_generation_) {
            return;
        }
        if (ec) {
            spdlog::warn("Debounce timer error: {}", ec.message());
            return;
        }
        dispatch_sync(SyncTrigger::Connectivity);
    });
}

void AutoSyncScheduler::on_connectivity_changed(const events::ConnectivityChangedEvent& event) {
    if (event.came_online()) {
        if (!engine_.settings().auto_sync) {
            return;
        }
        asio::post(strand_, [this]() { arm_debounce(); });
    } else if (!event.current.reachable) {
        asio::post(strand_, [this]() {
            ++debounce_generation_;
            debounce_timer_.cancel();
        });
    }
}

void AutoSyncScheduler::dispatch_sync(SyncTrigger trigger) {
    // Off the strand, so timers keep ticking while the cycle runs
    asio::post(io_, [this, trigger]() {
        requests_++;
        const CycleOutcome outcome = engine_.request_sync(trigger);
        spdlog::debug("Scheduled sync ({}) finished: {}",
                      TypeNames::to_string(trigger), TypeNames::to_string(outcome));
    });
}

} // namespace fieldsync::sync
