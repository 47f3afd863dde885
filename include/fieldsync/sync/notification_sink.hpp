#pragma once

#include "fieldsync/core/error.hpp"
#include "fieldsync/model/types.hpp"

#include <optional>
#include <string>

namespace fieldsync::sync {

/**
 * @brief Terminal outcome of a cycle, shaped for a user-facing notification
 */
struct Notification {
    CycleOutcome outcome = CycleOutcome::Success;
    SyncStatus status = SyncStatus::Success;
    std::string title;
    std::string message;
    std::size_t issues = 0;
    std::optional<Error> error;
};

/**
 * @brief Receives the end-of-cycle notification (UI banner, OS notification)
 *
 * Called once per completed or aborted cycle, never for skipped or ineligible
 * requests. Called on the thread that ran the cycle; must not call back into
 * SyncEngine::force_sync().
 */
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void notify(const Notification& notification) = 0;
};

/**
 * @brief Sink that writes notifications to the log
 */
class LoggingNotificationSink : public NotificationSink {
public:
    void notify(const Notification& notification) override;
};

/**
 * @brief Builds the notification text for a finished or aborted cycle
 */
Notification make_notification(CycleOutcome outcome, std::size_t issues,
                                const std::optional<Error>& error);

} // namespace fieldsync::sync
