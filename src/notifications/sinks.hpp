#pragma once

#include <string>
#include <vector>
#include "core/config/config.hpp"
#include "core/errors/orch_errors.hpp"
#include "notifications/notification_event.hpp"

namespace orch::notifications {

// A notification destination with its own event filter.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual std::string name() const = 0;
    virtual bool enabled() const = 0;
    // An empty filter accepts every event.
    virtual bool handles_event(const NotificationEvent& event) const = 0;
    virtual core::errors::Status send(const NotificationEvent& event) const = 0;
};

bool filter_matches(const std::vector<std::string>& events, const NotificationEvent& event);

// Desktop notification through notify-send (Linux) or osascript (macOS).
class OsSink : public NotificationSink {
public:
    explicit OsSink(const core::config::OsNotificationConfig& config);

    std::string name() const override { return "os"; }
    bool enabled() const override { return enabled_; }
    bool handles_event(const NotificationEvent& event) const override;
    core::errors::Status send(const NotificationEvent& event) const override;

    // argv for the platform helper.
    std::vector<std::string> command_for(const NotificationEvent& event) const;

private:
    bool enabled_;
    bool sound_;
    std::vector<std::string> events_;
};

enum class WebhookAuth { None, Bearer, Basic };

// JSON POST of {event, timestamp, data}. Credentials are read from the
// environment once, at construction.
class WebhookSink : public NotificationSink {
public:
    static constexpr long kTimeoutSeconds = 10;

    explicit WebhookSink(const core::config::WebhookConfig& config);

    std::string name() const override { return name_; }
    bool enabled() const override { return enabled_ && !url_.empty(); }
    bool handles_event(const NotificationEvent& event) const override;
    core::errors::Status send(const NotificationEvent& event) const override;

    const std::string& url() const { return url_; }
    WebhookAuth auth() const { return auth_; }
    // "Authorization: Bearer ..." for bearer auth, empty otherwise. Basic
    // credentials go to curl as user:password.
    std::string authorization_header() const;

private:
    std::string name_;
    std::string url_;
    bool enabled_;
    WebhookAuth auth_ = WebhookAuth::None;
    std::string token_;
    std::string username_;
    std::string password_;
    std::vector<std::string> events_;
};

}  // namespace orch::notifications
