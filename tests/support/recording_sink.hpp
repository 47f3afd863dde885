#pragma once

#include "fieldsync/sync/notification_sink.hpp"

#include <mutex>
#include <vector>

namespace fieldsync::testing {

class RecordingSink : public sync::NotificationSink {
public:
    void notify(const sync::Notification& notification) override {
        std::lock_guard lock(mutex_);
        received_.push_back(notification);
    }

    std::vector<sync::Notification> received() const {
        std::lock_guard lock(mutex_);
        return received_;
    }

    std::size_t count() const {
        std::lock_guard lock(mutex_);
        return received_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<sync::Notification> received_;
};

} // namespace fieldsync::testing
