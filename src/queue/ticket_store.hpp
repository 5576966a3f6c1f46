#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/orch_errors.hpp"
#include "issuetypes/registry.hpp"
#include "queue/ticket.hpp"

namespace orch::queue {

struct AgentTicketReport {
    std::vector<std::string> created;  // ticket ids
    std::vector<std::string> skipped;  // issue type keys whose agent file exists
    std::vector<std::pair<std::string, std::string>> errors;  // (issue type key, message)
};

// Filesystem-backed ticket directories: queue/, in-progress/, completed/.
// The directories are the source of truth; nothing is cached between calls.
class TicketStore {
public:
    explicit TicketStore(std::filesystem::path tickets_dir);

    const std::filesystem::path& tickets_dir() const { return tickets_dir_; }
    std::filesystem::path queue_dir() const { return tickets_dir_ / "queue"; }
    std::filesystem::path in_progress_dir() const { return tickets_dir_ / "in-progress"; }
    std::filesystem::path completed_dir() const { return tickets_dir_ / "completed"; }

    core::errors::Status ensure_directories() const;

    std::vector<Ticket> list_queue() const;
    std::vector<Ticket> list_in_progress() const;
    std::vector<Ticket> list_completed() const;

    // Queue sorted by (priority_index(type), timestamp); stable for equal keys.
    std::vector<Ticket> list_by_priority(const issuetypes::IssueTypeRegistry& registry) const;

    // First queued ticket by priority, skipping failed tickets and excluded ids.
    std::optional<Ticket> next_ticket(const issuetypes::IssueTypeRegistry& registry,
                                      const std::set<std::string>& exclude_ids = {}) const;

    // Searches queue then in-progress by id, then by filename substring.
    core::errors::Result<Ticket> find_ticket(const std::string& id) const;
    core::errors::Result<Ticket> find_in_progress(const std::string& id) const;

    // Renames queue -> in-progress. A concurrent second claimer gets already_claimed.
    core::errors::Result<Ticket> claim_ticket(const Ticket& ticket);
    core::errors::Result<Ticket> complete_ticket(const Ticket& ticket);
    // Status must be "queued" or "failed".
    core::errors::Result<Ticket> return_to_queue(const Ticket& ticket,
                                                 const std::string& status = "queued");
    core::errors::Result<Ticket> reload_ticket(const Ticket& ticket) const;

    // Writes <YYYYMMDD-HHMM>-<TYPE>-<project>-<slug>.md into queue/.
    core::errors::Result<Ticket> create_ticket(
        const issuetypes::IssueType& issue_type, const std::string& project,
        const std::string& summary,
        const std::map<std::string, std::string>& extra_fields = {});

    // INV ticket raised from an external alert.
    core::errors::Result<Ticket> create_investigation(
        const issuetypes::IssueType& issue_type, const std::string& source,
        const std::string& message, const std::string& severity,
        const std::string& project = "global");

    // One TASK ticket per issue type carrying an agent_prompt, asking for
    // <project_path>/.claude/agents/<key>-operator.md. Types whose file
    // already exists are skipped. NotFound when TASK is not registered.
    core::errors::Result<AgentTicketReport> create_agent_tickets(
        const issuetypes::IssueTypeRegistry& registry, const std::filesystem::path& project_path,
        const std::string& project);

    // Next free n for <TYPE>-<n> across all three directories.
    int next_ticket_number(const std::string& type_key) const;

private:
    std::vector<Ticket> list_directory(const std::filesystem::path& dir) const;
    core::errors::Result<Ticket> move_ticket(const Ticket& ticket,
                                             const std::filesystem::path& target_dir,
                                             const std::string& status);
    core::errors::Result<Ticket> create_from(const issuetypes::IssueType& issue_type,
                                             const std::string& project,
                                             const std::string& summary,
                                             const std::map<std::string, std::string>& fields,
                                             std::size_t slug_length,
                                             const std::string& details);

    std::filesystem::path tickets_dir_;
    mutable std::mutex mutex_;
};

// Maps an alert severity to a ticket priority.
std::string priority_for_severity(const std::string& severity);

}  // namespace orch::queue
