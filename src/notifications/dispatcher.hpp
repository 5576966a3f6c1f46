#pragma once

#include <cstddef>
#include <memory>
#include <vector>
#include "core/config/config.hpp"
#include "notifications/notification_event.hpp"
#include "notifications/sinks.hpp"

namespace orch::notifications {

enum class DispatchMode {
    Detached,  // one detached thread per matching sink
    Inline     // sinks run on the caller's thread
};

// Fans events out to the sinks that are enabled and subscribed. Send
// failures are logged and never reach the caller.
class Dispatcher {
public:
    explicit Dispatcher(bool enabled = true, DispatchMode mode = DispatchMode::Detached);

    // OS sink plus one webhook sink per configured entry with a URL.
    static std::unique_ptr<Dispatcher> from_config(const core::config::NotificationsConfig& config);

    void add_sink(std::shared_ptr<NotificationSink> sink);

    void notify(const NotificationEvent& event) const;
    // Sends on the caller's thread; returns the number of sinks that succeeded.
    std::size_t notify_sync(const NotificationEvent& event) const;

    bool enabled() const { return enabled_; }
    std::size_t sink_count() const { return sinks_.size(); }

private:
    bool enabled_;
    DispatchMode mode_;
    std::vector<std::shared_ptr<NotificationSink>> sinks_;
};

}  // namespace orch::notifications
