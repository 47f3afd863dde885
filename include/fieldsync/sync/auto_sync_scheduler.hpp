#pragma once

#include "fieldsync/events/event_bus.hpp"
#include "fieldsync/events/events.hpp"
#include "fieldsync/sync/sync_engine.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <thread>
#include <vector>

namespace fieldsync::sync {

namespace asio = boost::asio;

/**
 * @brief Drives SyncEngine from timers and connectivity transitions
 *
 * - Recurring tick every syncIntervalMs while autoSync is on
 * - One-shot sync online_debounce after the device comes online; another
 *   transition inside the window restarts the wait
 * - Settings are re-read whenever a timer is armed, and a
 *   SettingsChangedEvent re-arms the interval right away
 *
 * Timers live on a strand; cycles are posted to the io_context outside the
 * strand, so a tick that lands during a long cycle still fires and gets
 * CycleOutcome::Skipped from the engine.
 */
class AutoSyncScheduler {
public:
    AutoSyncScheduler(SyncEngine& engine,
                      events::EventBus& bus,
                      std::chrono::milliseconds online_debounce);
    ~AutoSyncScheduler();

    AutoSyncScheduler(const AutoSyncScheduler&) = delete;
    AutoSyncScheduler& operator=(const AutoSyncScheduler&) = delete;

    /**
     * @brief Arm the timers and start the io threads; may follow stop()
     */
    void start();

    /**
     * @brief Cancel timers and wait for the io threads; a running cycle finishes first
     */
    void stop();

    bool running() const noexcept { return running_.load(); }

    /**
     * @brief Number of sync requests handed to the engine so far
     */
    std::uint64_t requests_issued() const noexcept { return requests_.load(); }

private:
    static constexpr std::size_t kIoThreads = 2;

    // Strand only
    void arm_interval();
    void arm_debounce();

    void on_connectivity_changed(const events::ConnectivityChangedEvent& event);
    void dispatch_sync(SyncTrigger trigger);

    SyncEngine& engine_;
    events::EventBus& bus_;
    std::chrono::milliseconds online_debounce_;

    asio::io_context io_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;  // set while running
    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer interval_timer_;
    asio::steady_timer debounce_timer_;
    std::uint64_t interval_generation_ = 0;     // strand only
    std::uint64_t debounce_generation_ = 0;     // strand only

    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> requests_{0};

    events::Subscription connectivity_sub_;
    events::Subscription settings_sub_;
};

} // namespace fieldsync::sync
