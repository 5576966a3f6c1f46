#include "notifications/notification_event.hpp"

#include "core/util/time.hpp"

namespace orch::notifications {

using nlohmann::json;

namespace {

std::string field(const json& data, const char* key) {
    return data.value(key, std::string());
}

}  // namespace

NotificationEvent NotificationEvent::agent_started(const std::string& project,
                                                   const std::string& ticket_type,
                                                   const std::string& ticket_id,
                                                   const std::string& session_name,
                                                   const std::optional<std::string>& launch_mode) {
    NotificationEvent event{"agent.started",
                            {{"project", project},
                             {"ticket_type", ticket_type},
                             {"ticket_id", ticket_id},
                             {"session_name", session_name}}};
    if (launch_mode) {
        event.data["launch_mode"] = *launch_mode;
    }
    return event;
}

NotificationEvent NotificationEvent::agent_completed(const std::string& project,
                                                     const std::string& ticket_type,
                                                     const std::string& ticket_id,
                                                     std::optional<std::int64_t> duration_seconds) {
    NotificationEvent event{
        "agent.completed",
        {{"project", project}, {"ticket_type", ticket_type}, {"ticket_id", ticket_id}}};
    if (duration_seconds) {
        event.data["duration_seconds"] = *duration_seconds;
    }
    return event;
}

NotificationEvent NotificationEvent::agent_failed(const std::string& project,
                                                  const std::string& ticket_id,
                                                  const std::string& error) {
    return {"agent.failed", {{"project", project}, {"ticket_id", ticket_id}, {"error", error}}};
}

NotificationEvent NotificationEvent::agent_awaiting_input(const std::string& project,
                                                          const std::string& ticket_type,
                                                          const std::string& ticket_id,
                                                          const std::string& reason) {
    return {"agent.awaiting_input",
            {{"project", project},
             {"ticket_type", ticket_type},
             {"ticket_id", ticket_id},
             {"reason", reason}}};
}

NotificationEvent NotificationEvent::agent_review_pending(const std::string& project,
                                                          const std::string& ticket_id,
                                                          const std::string& step,
                                                          const std::string& summary) {
    return {"agent.review_pending",
            {{"project", project}, {"ticket_id", ticket_id}, {"step", step}, {"summary", summary}}};
}

NotificationEvent NotificationEvent::agent_session_lost(const std::string& session_name) {
    return {"agent.session_lost", {{"session_name", session_name}}};
}

NotificationEvent NotificationEvent::ticket_returned(const std::string& project,
                                                     const std::string& ticket_id,
                                                     const std::string& summary) {
    return {"ticket.returned",
            {{"project", project}, {"ticket_id", ticket_id}, {"summary", summary}}};
}

NotificationEvent NotificationEvent::investigation_created(const std::string& source,
                                                           const std::string& severity,
                                                           const std::string& summary,
                                                           const std::string& ticket_id) {
    return {"investigation.created",
            {{"source", source},
             {"severity", severity},
             {"summary", summary},
             {"ticket_id", ticket_id}}};
}

OsNotification NotificationEvent::to_os_notification() const {
    const std::string project = field(data, "project");
    const std::string ticket_id = field(data, "ticket_id");
    const std::string ticket_type = field(data, "ticket_type");

    if (type == "agent.started") {
        const std::string mode =
            data.contains("launch_mode") ? " [" + field(data, "launch_mode") + "]" : "";
        return {"Agent Started",
                project + " - " + ticket_type + " (tmux: " + field(data, "session_name") + ")" + mode,
                ticket_id};
    }
    if (type == "agent.completed") {
        return {"Agent Complete", project + " - " + ticket_type, ticket_id + " complete"};
    }
    if (type == "agent.failed") {
        return {"Agent Failed", project + " - " + ticket_id, field(data, "error")};
    }
    if (type == "agent.awaiting_input") {
        return {"Agent Awaiting Input", project + " - " + ticket_type + " (" + ticket_id + ")",
                field(data, "reason")};
    }
    if (type == "agent.review_pending") {
        return {"Review Requested", project + " - " + ticket_id + " (" + field(data, "step") + ")",
                field(data, "summary")};
    }
    if (type == "agent.session_lost") {
        return {"Agent Session Lost", field(data, "session_name"),
                "The tmux session for this agent has terminated unexpectedly."};
    }
    if (type == "ticket.returned") {
        return {"Ticket Returned to Queue", project, ticket_id + " - " + field(data, "summary")};
    }
    if (type == "investigation.created") {
        return {"Investigation Created",
                ticket_id + " [" + field(data, "severity") + "] from " + field(data, "source"),
                field(data, "summary")};
    }
    return {type, project, ticket_id};
}

json NotificationEvent::to_payload(const std::int64_t epoch_seconds) const {
    return json{{"event", type},
                {"timestamp", core::util::format_iso8601(epoch_seconds)},
                {"data", data}};
}

}  // namespace orch::notifications
