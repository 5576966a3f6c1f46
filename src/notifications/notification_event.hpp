#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace orch::notifications {

struct OsNotification {
    std::string title;
    std::string subtitle;
    std::string body;
};

// An event type ("agent.started", ...) and its payload.
struct NotificationEvent {
    std::string type;
    nlohmann::json data = nlohmann::json::object();

    static NotificationEvent agent_started(const std::string& project,
                                           const std::string& ticket_type,
                                           const std::string& ticket_id,
                                           const std::string& session_name,
                                           const std::optional<std::string>& launch_mode = std::nullopt);
    static NotificationEvent agent_completed(const std::string& project,
                                             const std::string& ticket_type,
                                             const std::string& ticket_id,
                                             std::optional<std::int64_t> duration_seconds = std::nullopt);
    static NotificationEvent agent_failed(const std::string& project, const std::string& ticket_id,
                                          const std::string& error);
    static NotificationEvent agent_awaiting_input(const std::string& project,
                                                  const std::string& ticket_type,
                                                  const std::string& ticket_id,
                                                  const std::string& reason);
    static NotificationEvent agent_review_pending(const std::string& project,
                                                  const std::string& ticket_id,
                                                  const std::string& step,
                                                  const std::string& summary);
    static NotificationEvent agent_session_lost(const std::string& session_name);
    static NotificationEvent ticket_returned(const std::string& project,
                                             const std::string& ticket_id,
                                             const std::string& summary);
    static NotificationEvent investigation_created(const std::string& source,
                                                   const std::string& severity,
                                                   const std::string& summary,
                                                   const std::string& ticket_id);

    OsNotification to_os_notification() const;

    // {"event", "timestamp", "data"} as posted to webhooks.
    nlohmann::json to_payload(std::int64_t epoch_seconds) const;
};

}  // namespace orch::notifications
