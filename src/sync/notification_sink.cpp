#include "fieldsync/sync/notification_sink.hpp"

#include <spdlog/spdlog.h>

namespace fieldsync::sync {

Notification make_notification(CycleOutcome outcome, std::size_t issues,
                               const std::optional<Error>& error) {
    Notification n;
    n.outcome = outcome;
    n.issues = issues;
    n.error = error;

    if (outcome == CycleOutcome::FatalError) {
        n.status = SyncStatus::Error;
        n.title = "Sync Failed";
        if (error && error->kind == ErrorKind::Authentication) {
            n.message = "The server rejected your credentials. Sign in again to resume syncing.";
        } else {
            n.message = "Failed to synchronize data. Will retry automatically.";
        }
        return n;
    }

    n.status = SyncStatus::Success;
    if (issues > 0) {
        n.title = "Sync Completed With Issues";
        n.message = "Synchronization completed with " + std::to_string(issues) +
                    (issues == 1 ? " issue." : " issues.");
    } else {
        n.title = "Sync Complete";
        n.message = "All data has been synchronized successfully.";
    }
    return n;
}

void LoggingNotificationSink::notify(const Notification& notification) {
    if (notification.status == SyncStatus::Error) {
        spdlog::error("{}: {}", notification.title, notification.message);
    } else if (notification.issues > 0) {
        spdlog::warn("{}: {}", notification.title, notification.message);
    } else {
        spdlog::info("{}: {}", notification.title, notification.message);
    }
}

} // namespace fieldsync::sync
