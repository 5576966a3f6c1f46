#include "queue/ticket_store.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include "core/logging/logger.hpp"
#include "core/util/text.hpp"
#include "core/util/time.hpp"

namespace orch::queue {

using core::errors::ErrorCategory;
using core::errors::OrchError;

namespace {

std::string sanitize_project(const std::string& project) {
    std::string cleaned;
    for (const unsigned char c : project) {
        if (std::isalnum(c) != 0) {
            cleaned.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return cleaned;
}

std::string auto_value(const issuetypes::AutoStrategy strategy, const std::string& id,
                       const std::string& date) {
    switch (strategy) {
        case issuetypes::AutoStrategy::Id: return id;
        case issuetypes::AutoStrategy::Date: return date;
        case issuetypes::AutoStrategy::Status: return "queued";
        case issuetypes::AutoStrategy::Branch: return "";
    }
    return "";
}

std::string render_body(const issuetypes::IssueType& issue_type, const std::string& summary,
                        const std::string& details, const std::string& created_at) {
    std::string body = "\n# " + issue_type.name + ": " + summary + "\n";
    if (!details.empty()) {
        body += "\n## Context\n\n" + details + "\n";
    }
    body += "\n## History\n\n- " + created_at + " - Created\n";
    return body;
}

}  // namespace

TicketStore::TicketStore(std::filesystem::path tickets_dir)
    : tickets_dir_(std::move(tickets_dir)) {}

core::errors::Status TicketStore::ensure_directories() const {
    for (const auto& dir : {queue_dir(), in_progress_dir(), completed_dir()}) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return OrchError{ErrorCategory::External,
                             "Failed to create " + dir.string() + ": " + ec.message(),
                             "directory_create_failed"};
        }
    }
    return core::errors::ok();
}

std::vector<Ticket> TicketStore::list_directory(const std::filesystem::path& dir) const {
    std::vector<Ticket> tickets;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return tickets;
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".md") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end(),
              [](const auto& a, const auto& b) { return a.filename() < b.filename(); });

    for (const auto& file : files) {
        auto ticket = Ticket::from_file(file);
        if (core::errors::is_error(ticket)) {
            LOG_WARN("Skipping ticket " + file.string() + ": " +
                     core::errors::get_error(ticket).message);
            continue;
        }
        tickets.push_back(core::errors::get_value(ticket));
    }
    return tickets;
}

std::vector<Ticket> TicketStore::list_queue() const { return list_directory(queue_dir()); }

std::vector<Ticket> TicketStore::list_in_progress() const {
    return list_directory(in_progress_dir());
}

std::vector<Ticket> TicketStore::list_completed() const {
    return list_directory(completed_dir());
}

std::vector<Ticket> TicketStore::list_by_priority(
    const issuetypes::IssueTypeRegistry& registry) const {
    std::vector<Ticket> tickets = list_queue();
    std::stable_sort(tickets.begin(), tickets.end(), [&registry](const Ticket& a, const Ticket& b) {
        const std::size_t pa = registry.priority_index(a.ticket_type);
        const std::size_t pb = registry.priority_index(b.ticket_type);
        if (pa != pb) return pa < pb;
        return a.timestamp < b.timestamp;
    });
    return tickets;
}

std::optional<Ticket> TicketStore::next_ticket(const issuetypes::IssueTypeRegistry& registry,
                                               const std::set<std::string>& exclude_ids) const {
    for (auto& ticket : list_by_priority(registry)) {
        if (ticket.status == "failed" || exclude_ids.count(ticket.id) > 0) {
            continue;
        }
        return ticket;
    }
    return std::nullopt;
}

core::errors::Result<Ticket> TicketStore::find_ticket(const std::string& id) const {
    std::vector<Ticket> candidates = list_queue();
    for (auto& ticket : list_in_progress()) {
        candidates.push_back(std::move(ticket));
    }
    for (const auto& ticket : candidates) {
        if (ticket.id == id) return ticket;
    }
    for (const auto& ticket : candidates) {
        if (ticket.filename.find(id) != std::string::npos) return ticket;
    }
    return OrchError{ErrorCategory::NotFound, "Ticket not found: " + id, "ticket_not_found"};
}

core::errors::Result<Ticket> TicketStore::find_in_progress(const std::string& id) const {
    const auto tickets = list_in_progress();
    // An exact id wins over a filename that merely contains it (TASK-1 vs TASK-12).
    for (const auto& ticket : tickets) {
        if (ticket.id == id) {
            return ticket;
        }
    }
    for (const auto& ticket : tickets) {
        if (ticket.filename.find(id) != std::string::npos) {
            return ticket;
        }
    }
    return OrchError{ErrorCategory::NotFound, "No in-progress ticket: " + id, "ticket_not_found"};
}

core::errors::Result<Ticket> TicketStore::move_ticket(const Ticket& ticket,
                                                      const std::filesystem::path& target_dir,
                                                      const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto target = target_dir / ticket.filename;
    std::filesystem::path source = ticket.filepath;
    std::error_code ec;
    if (source.empty() || !std::filesystem::exists(source, ec)) {
        // The caller may hold a stale path; look for the file in the other directories.
        source.clear();
        for (const auto& dir : {queue_dir(), in_progress_dir(), completed_dir()}) {
            if (std::filesystem::exists(dir / ticket.filename, ec)) {
                source = dir / ticket.filename;
                break;
            }
        }
        if (source.empty()) {
            return OrchError{ErrorCategory::NotFound, "Ticket file missing: " + ticket.filename,
                             "ticket_not_found"};
        }
    }

    if (source != target) {
        std::filesystem::create_directories(target_dir, ec);
        std::filesystem::rename(source, target, ec);
        if (ec) {
            return OrchError{ErrorCategory::External,
                             "Failed to move " + ticket.filename + ": " + ec.message(),
                             "ticket_move_failed"};
        }
    }

    auto moved = Ticket::from_file(target);
    if (core::errors::is_error(moved)) {
        return moved;
    }
    Ticket& result = core::errors::get_value(moved);
    if (result.status != status) {
        auto written = result.set_status(status);
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }
    }
    LOG_INFO("Ticket " + result.id + ": " + source.parent_path().filename().string() + " -> " +
             target_dir.filename().string());
    return moved;
}

core::errors::Result<Ticket> TicketStore::claim_ticket(const Ticket& ticket) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto source = queue_dir() / ticket.filename;
    const auto target = in_progress_dir() / ticket.filename;
    std::error_code ec;
    if (!std::filesystem::exists(source, ec)) {
        return OrchError{ErrorCategory::Conflict, "Ticket already claimed: " + ticket.id,
                         "already_claimed"};
    }
    std::filesystem::create_directories(in_progress_dir(), ec);
    std::filesystem::rename(source, target, ec);
    if (ec) {
        std::error_code exists_ec;
        if (!std::filesystem::exists(source, exists_ec)) {
            return OrchError{ErrorCategory::Conflict, "Ticket already claimed: " + ticket.id,
                             "already_claimed"};
        }
        return OrchError{ErrorCategory::External,
                         "Failed to claim " + ticket.filename + ": " + ec.message(),
                         "ticket_move_failed"};
    }
    lock.unlock();

    auto claimed = Ticket::from_file(target);
    if (core::errors::is_error(claimed)) {
        return claimed;
    }
    Ticket& result = core::errors::get_value(claimed);
    auto written = result.set_status("in-progress");
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    LOG_INFO("Ticket " + result.id + ": queue -> in-progress");
    return claimed;
}

core::errors::Result<Ticket> TicketStore::complete_ticket(const Ticket& ticket) {
    return move_ticket(ticket, completed_dir(), "completed");
}

core::errors::Result<Ticket> TicketStore::return_to_queue(const Ticket& ticket,
                                                          const std::string& status) {
    if (status != "queued" && status != "failed") {
        return OrchError{ErrorCategory::Input,
                         "Queue status must be queued or failed, got: " + status,
                         "invalid_status"};
    }
    return move_ticket(ticket, queue_dir(), status);
}

core::errors::Result<Ticket> TicketStore::reload_ticket(const Ticket& ticket) const {
    std::error_code ec;
    if (!ticket.filepath.empty() && std::filesystem::exists(ticket.filepath, ec)) {
        return Ticket::from_file(ticket.filepath);
    }
    for (const auto& dir : {queue_dir(), in_progress_dir(), completed_dir()}) {
        if (std::filesystem::exists(dir / ticket.filename, ec)) {
            return Ticket::from_file(dir / ticket.filename);
        }
    }
    return OrchError{ErrorCategory::NotFound, "Ticket file missing: " + ticket.filename,
                     "ticket_not_found"};
}

int TicketStore::next_ticket_number(const std::string& type_key) const {
    const std::string prefix = type_key + "-";
    int highest = 0;
    for (const auto& dir : {queue_dir(), in_progress_dir(), completed_dir()}) {
        for (const auto& ticket : list_directory(dir)) {
            if (!core::util::starts_with(ticket.id, prefix)) continue;
            const std::string rest = ticket.id.substr(prefix.size());
            int value = 0;
            const auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), value);
            if (ec == std::errc() && ptr == rest.data() + rest.size()) {
                highest = std::max(highest, value);
            }
        }
    }
    return highest + 1;
}

core::errors::Result<Ticket> TicketStore::create_from(
    const issuetypes::IssueType& issue_type, const std::string& project,
    const std::string& summary, const std::map<std::string, std::string>& fields,
    std::size_t slug_length, const std::string& details) {
    std::string project_slug = sanitize_project(project);
    if (project_slug.empty()) {
        if (issue_type.project_required && !project.empty()) {
            return OrchError{ErrorCategory::Input, "Invalid project name: " + project,
                             "invalid_project"};
        }
        project_slug = "global";
    }
    const std::string clean_summary = core::util::trim(summary);
    if (clean_summary.empty()) {
        return OrchError{ErrorCategory::Input, "Ticket summary is empty", "missing_summary"};
    }
    const issuetypes::StepSchema* first = issue_type.first_step();
    if (first == nullptr) {
        return OrchError{ErrorCategory::Validation, issue_type.key + " has no steps", "no_steps"};
    }

    auto ensured = ensure_directories();
    if (core::errors::is_error(ensured)) {
        return core::errors::get_error(ensured);
    }

    const std::int64_t now = core::util::now_epoch_seconds();
    const std::string date = core::util::format_local(now, "%Y-%m-%d");
    const std::string id = issue_type.key + "-" + std::to_string(next_ticket_number(issue_type.key));

    std::string slug = core::util::slugify(clean_summary, slug_length);
    if (slug.empty()) slug = "new-ticket";
    const std::string stem =
        core::util::ticket_timestamp(now) + "-" + issue_type.key + "-" + project_slug + "-" + slug;

    std::string filename = stem + ".md";
    std::error_code ec;
    for (int suffix = 2; std::filesystem::exists(queue_dir() / filename, ec); ++suffix) {
        filename = stem + "-" + std::to_string(suffix) + ".md";
    }

    Ticket ticket;
    ticket.filename = filename;
    ticket.filepath = queue_dir() / filename;
    ticket.has_frontmatter = true;
    for (const auto& field : issue_type.fields) {
        if (field.auto_strategy) {
            const std::string value = auto_value(*field.auto_strategy, id, date);
            if (!value.empty()) ticket.frontmatter[field.name] = value;
        } else if (field.default_value && !field.default_value->empty()) {
            ticket.frontmatter[field.name] = *field.default_value;
        }
    }
    ticket.frontmatter["project"] = project_slug;
    ticket.frontmatter["created"] = date;
    ticket.frontmatter["summary"] = clean_summary;
    for (const auto& [key, value] : fields) {
        ticket.frontmatter[key] = value;
    }

    ticket.id = id;
    ticket.summary = clean_summary;
    ticket.priority = ticket.frontmatter.count("priority") > 0 ? ticket.frontmatter["priority"]
                                                               : "P2-medium";
    ticket.status = "queued";
    ticket.step = first->name;
    ticket.body = render_body(issue_type, clean_summary, details,
                              core::util::format_local(now, "%Y-%m-%d %H:%M:%S"));
    ticket.content = ticket.to_markdown();

    auto written = ticket.write();
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    LOG_INFO("Created ticket " + id + " (" + filename + ")");
    return Ticket::from_file(ticket.filepath);
}

core::errors::Result<Ticket> TicketStore::create_ticket(
    const issuetypes::IssueType& issue_type, const std::string& project,
    const std::string& summary, const std::map<std::string, std::string>& extra_fields) {
    std::map<std::string, std::string> fields = extra_fields;
    std::string details;
    if (auto it = fields.find("context"); it != fields.end()) {
        details = it->second;
        fields.erase(it);
    }
    return create_from(issue_type, project, summary, fields, 50, details);
}

core::errors::Result<Ticket> TicketStore::create_investigation(
    const issuetypes::IssueType& issue_type, const std::string& source,
    const std::string& message, const std::string& severity, const std::string& project) {
    std::map<std::string, std::string> fields{
        {"source", source},
        {"severity", severity},
        {"priority", priority_for_severity(severity)},
    };
    const std::string first_line = core::util::trim(message.substr(0, message.find('\n')));
    const std::string summary = core::util::truncate_words(first_line, 120);
    const std::string details = "Source: " + source + "\nSeverity: " + severity + "\n\n" + message;
    return create_from(issue_type, project, summary, fields, 30, details);
}

core::errors::Result<AgentTicketReport> TicketStore::create_agent_tickets(
    const issuetypes::IssueTypeRegistry& registry, const std::filesystem::path& project_path,
    const std::string& project) {
    const auto task = registry.get("TASK");
    if (!task) {
        return OrchError{ErrorCategory::NotFound, "Issue type TASK is not registered",
                         "issuetype_not_found"};
    }
    const auto agents_dir = project_path / ".claude" / "agents";

    AgentTicketReport report;
    for (const auto& issue_type : registry.all_types()) {
        if (!issue_type.agent_prompt || issue_type.key == task->key) {
            continue;
        }
        const std::string agent_file = core::util::lowercase(issue_type.key) + "-operator.md";
        std::error_code ec;
        if (std::filesystem::exists(agents_dir / agent_file, ec)) {
            report.skipped.push_back(issue_type.key);
            continue;
        }
        const std::string context =
            *issue_type.agent_prompt + "\n\n## Acceptance Criteria\n\n"
            "- [ ] Agent file created at `.claude/agents/" + agent_file + "`\n"
            "- [ ] Agent has frontmatter with name, description and tools\n"
            "- [ ] Agent prompt follows the project's CLAUDE.md conventions";
        auto created = create_ticket(*task, project,
                                     "Create " + project + " " + issue_type.name + " operator agent",
                                     {{"context", context}, {"agent_type", issue_type.key}});
        if (core::errors::is_error(created)) {
            report.errors.emplace_back(issue_type.key, core::errors::get_error(created).message);
            continue;
        }
        report.created.push_back(core::errors::get_value(created).id);
    }
    LOG_INFO("Agent tickets for " + project + ": " + std::to_string(report.created.size()) +
             " created, " + std::to_string(report.skipped.size()) + " skipped");
    return report;
}

std::string priority_for_severity(const std::string& severity) {
    const std::string level = core::util::lowercase(severity);
    if (level == "critical") return "P0-critical";
    if (level == "high") return "P1-high";
    return "P2-medium";
}

}  // namespace orch::queue
