#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/orch_errors.hpp"
#include "issuetypes/issue_type.hpp"

namespace orch::queue {

// Delegate-mode task metadata kept in the llm_task frontmatter map.
struct LlmTask {
    std::optional<std::string> id;
    std::optional<std::string> status;
    std::vector<std::string> blocked_by;

    bool empty() const { return !id && !status && blocked_by.empty(); }
    bool operator==(const LlmTask& other) const {
        return id == other.id && status == other.status && blocked_by == other.blocked_by;
    }
};

struct FilenameParts {
    std::string timestamp;
    std::string ticket_type;
    std::string project;
};

// Matches ^(\d{8}-\d{4})-([A-Z]+)-([a-z0-9]+)-.*\.md$ only.
std::optional<FilenameParts> parse_filename_strict(const std::string& filename);
// Strict match, then a plain hyphen split with at least four parts.
core::errors::Result<FilenameParts> parse_filename(const std::string& filename);

// Summary from a "# Feature: X" style heading, a "## Summary" section or the
// first plain text line; "No summary" otherwise.
std::string extract_summary(const std::string& body);

// A markdown ticket file. Every mutation rewrites the whole file in place.
struct Ticket {
    std::string filename;
    std::filesystem::path filepath;
    std::string timestamp;
    std::string ticket_type;
    std::string project;
    std::string id;
    std::string summary;
    std::string priority = "P2-medium";
    std::string status = "queued";
    std::string step;
    std::string content;
    std::map<std::string, std::string> sessions;
    LlmTask llm_task;
    std::optional<std::string> worktree_path;
    std::optional<std::string> branch;
    std::optional<std::string> external_id;
    std::optional<std::string> external_url;
    std::optional<std::string> external_provider;

    // Scalar frontmatter as read from disk, unknown keys included.
    std::map<std::string, std::string> frontmatter;
    bool has_frontmatter = false;
    // Markdown after the closing '---', or the whole file without frontmatter.
    std::string body;

    static core::errors::Result<Ticket> from_file(const std::filesystem::path& path);
    static core::errors::Result<Ticket> parse(const std::string& filename,
                                              const std::string& text);

    // Renders frontmatter (sorted keys) and body from the current fields.
    std::string to_markdown() const;
    core::errors::Status write() const;

    std::string branch_name() const;
    std::optional<std::string> session_id(const std::string& step_name) const;

    core::errors::Status update_field(const std::string& key, const std::string& value);
    core::errors::Status append_history(const std::string& entry);
    core::errors::Status add_awaiting_entry(const std::string& step_display_name);
    core::errors::Status set_session_id(const std::string& step_name,
                                        const std::string& session_id);
    core::errors::Status set_step(const std::string& step_name);
    core::errors::Status set_status(const std::string& new_status);

    // Moves to the current step's next_step; nullopt when the step is terminal.
    core::errors::Result<std::optional<std::string>> advance_step(
        const issuetypes::IssueType& issue_type);
};

// "queue", "in-progress" or "completed" for a ticket status.
std::string directory_for_status(const std::string& status);

}  // namespace orch::queue
