#include "queue/ticket.hpp"

#include <cctype>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <yaml-cpp/yaml.h>
#include "core/logging/logger.hpp"
#include "core/util/text.hpp"
#include "core/util/time.hpp"

namespace orch::queue {

using core::errors::ErrorCategory;
using core::errors::OrchError;

namespace {

struct FrontmatterParse {
    std::map<std::string, std::string> scalars;
    std::map<std::string, std::string> sessions;
    LlmTask llm_task;
    std::string body;
};

std::optional<std::string> node_scalar(const YAML::Node& node) {
    if (node.IsNull()) return std::string();
    if (node.IsScalar()) return node.Scalar();
    return std::nullopt;
}

// Returns nullopt when there is no frontmatter or it is not valid YAML.
std::optional<FrontmatterParse> extract_frontmatter(const std::string& text) {
    const std::string content = core::util::trim_start(text);
    if (!core::util::starts_with(content, "---")) {
        return std::nullopt;
    }
    const std::string after_open = content.substr(3);
    const auto end = after_open.find("\n---");
    if (end == std::string::npos) {
        return std::nullopt;
    }

    FrontmatterParse parsed;
    parsed.body = after_open.substr(end + 4);
    const std::string yaml_text = core::util::trim(after_open.substr(0, end));
    try {
        const YAML::Node root = YAML::Load(yaml_text);
        if (!root.IsMap()) {
            return root.IsNull() ? std::optional<FrontmatterParse>(parsed) : std::nullopt;
        }
        for (const auto& entry : root) {
            const std::string key = entry.first.as<std::string>();
            const YAML::Node& value = entry.second;
            if (const auto scalar = node_scalar(value)) {
                parsed.scalars[key] = *scalar;
            } else if (key == "sessions" && value.IsMap()) {
                for (const auto& session : value) {
                    if (const auto id = node_scalar(session.second)) {
                        parsed.sessions[session.first.as<std::string>()] = *id;
                    }
                }
            } else if (key == "llm_task" && value.IsMap()) {
                if (value["id"] && value["id"].IsScalar()) {
                    parsed.llm_task.id = value["id"].Scalar();
                }
                if (value["status"] && value["status"].IsScalar()) {
                    parsed.llm_task.status = value["status"].Scalar();
                }
                if (value["blocked_by"] && value["blocked_by"].IsSequence()) {
                    for (const auto& blocker : value["blocked_by"]) {
                        if (blocker.IsScalar()) {
                            parsed.llm_task.blocked_by.push_back(blocker.Scalar());
                        }
                    }
                }
            }
        }
    } catch (const YAML::Exception& e) {
        LOG_DEBUG(std::string("Ticket frontmatter is not valid YAML: ") + e.what());
        return std::nullopt;
    }
    return parsed;
}

std::optional<std::string> extract_field(const std::string& content, const std::string& field) {
    const std::regex pattern("\\*\\*" + field + "\\*\\*:\\s*(.+)");
    std::smatch match;
    if (std::regex_search(content, match, pattern)) {
        return core::util::trim(match[1].str());
    }
    return std::nullopt;
}

std::optional<std::string> lookup(const std::map<std::string, std::string>& values,
                                  const std::string& key) {
    const auto it = values.find(key);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

// First max_chars characters without splitting a UTF-8 sequence.
std::string utf8_prefix(const std::string& value, std::size_t max_chars) {
    std::size_t chars = 0;
    std::size_t i = 0;
    while (i < value.size()) {
        if ((static_cast<unsigned char>(value[i]) & 0xC0) != 0x80) {
            if (chars == max_chars) break;
            ++chars;
        }
        ++i;
    }
    return value.substr(0, i);
}

core::errors::Status write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return OrchError{ErrorCategory::External, "Unable to open ticket file: " + path.string(),
                         "ticket_write_failed"};
    }
    out << text;
    if (!out.good()) {
        return OrchError{ErrorCategory::External, "Unable to write ticket file: " + path.string(),
                         "ticket_write_failed"};
    }
    return core::errors::ok();
}

void mirror_field(Ticket& ticket, const std::string& key, const std::string& value) {
    if (key == "id") ticket.id = value;
    else if (key == "step") ticket.step = value;
    else if (key == "status") ticket.status = value;
    else if (key == "priority") ticket.priority = value;
    else if (key == "summary") ticket.summary = value;
    else if (key == "worktree_path") ticket.worktree_path = value;
    else if (key == "branch") ticket.branch = value;
    else if (key == "external_id") ticket.external_id = value;
    else if (key == "external_url") ticket.external_url = value;
    else if (key == "external_provider") ticket.external_provider = value;
}

// Legacy tickets gain a frontmatter block carrying their parsed values.
void ensure_frontmatter(Ticket& ticket) {
    if (ticket.has_frontmatter) {
        return;
    }
    ticket.has_frontmatter = true;
    ticket.body = "\n" + ticket.body;
}

}  // namespace

std::optional<FilenameParts> parse_filename_strict(const std::string& filename) {
    static const std::regex pattern(R"(^(\d{8}-\d{4})-([A-Z]+)-([a-z0-9]+)-.*\.md$)");
    std::smatch match;
    if (!std::regex_match(filename, match, pattern)) {
        return std::nullopt;
    }
    return FilenameParts{match[1].str(), match[2].str(), match[3].str()};
}

core::errors::Result<FilenameParts> parse_filename(const std::string& filename) {
    if (auto strict = parse_filename_strict(filename)) {
        return *strict;
    }
    std::string stem = filename;
    if (core::util::ends_with(stem, ".md")) {
        stem = stem.substr(0, stem.size() - 3);
    }
    const auto parts = core::util::split(stem, '-');
    if (parts.size() >= 4) {
        return FilenameParts{parts[0] + "-" + parts[1], parts[2], parts[3]};
    }
    return OrchError{ErrorCategory::Malformed, "Could not parse filename: " + filename,
                     "invalid_ticket_filename"};
}

std::string extract_summary(const std::string& body) {
    static const std::regex type_header(
        R"(^#\s+(?:Feature|Fix|Spike|Investigation|Task):\s*(.+)$)");
    std::istringstream lines(body);
    std::string line;
    while (std::getline(lines, line)) {
        std::smatch match;
        const std::string trimmed = core::util::trim(line);
        if (std::regex_match(trimmed, match, type_header)) {
            const std::string text = core::util::trim(match[1].str());
            if (!text.empty()) {
                return text;
            }
        }
    }

    const auto section = body.find("## Summary");
    if (section != std::string::npos) {
        std::istringstream after(body.substr(section + 10));
        while (std::getline(after, line)) {
            const std::string trimmed = core::util::trim(line);
            if (trimmed.empty()) {
                continue;
            }
            if (trimmed[0] != '#' && trimmed[0] != '[') {
                return trimmed;
            }
            break;
        }
    }

    std::istringstream fallback(body);
    while (std::getline(fallback, line)) {
        const std::string trimmed = core::util::trim(line);
        if (trimmed.empty()) {
            continue;
        }
        const char first = trimmed[0];
        if (first != '#' && first != '-' && first != '*' && first != '|') {
            return utf8_prefix(trimmed, 100);
        }
    }
    return "No summary";
}

std::string directory_for_status(const std::string& status) {
    if (status == "queued" || status == "failed") return "queue";
    if (status == "completed") return "completed";
    return "in-progress";
}

core::errors::Result<Ticket> Ticket::from_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return OrchError{ErrorCategory::External, "Failed to read ticket file: " + path.string(),
                         "ticket_read_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parse(path.filename().string(), buffer.str());
    if (core::errors::is_error(parsed)) {
        return parsed;
    }
    Ticket ticket = core::errors::get_value(parsed);
    ticket.filepath = path;
    return ticket;
}

core::errors::Result<Ticket> Ticket::parse(const std::string& filename, const std::string& text) {
    auto parts = parse_filename(filename);
    if (core::errors::is_error(parts)) {
        return core::errors::get_error(parts);
    }
    const FilenameParts& name = core::errors::get_value(parts);

    Ticket ticket;
    ticket.filename = filename;
    ticket.timestamp = name.timestamp;
    ticket.ticket_type = name.ticket_type;
    ticket.project = name.project;
    ticket.content = text;
    const std::string default_id =
        name.ticket_type + "-" + core::util::replace_all(name.timestamp, "-", "");

    if (auto frontmatter = extract_frontmatter(text)) {
        ticket.has_frontmatter = true;
        ticket.frontmatter = frontmatter->scalars;
        ticket.sessions = frontmatter->sessions;
        ticket.llm_task = frontmatter->llm_task;
        ticket.body = frontmatter->body;

        const auto& fm = ticket.frontmatter;
        ticket.id = lookup(fm, "id").value_or(default_id);
        ticket.priority = lookup(fm, "priority").value_or("P2-medium");
        ticket.status = lookup(fm, "status").value_or("queued");
        ticket.step = lookup(fm, "step").value_or("");
        ticket.worktree_path = lookup(fm, "worktree_path");
        ticket.branch = lookup(fm, "branch");
        ticket.external_id = lookup(fm, "external_id");
        ticket.external_url = lookup(fm, "external_url");
        ticket.external_provider = lookup(fm, "external_provider");
        ticket.summary = lookup(fm, "summary").value_or(extract_summary(ticket.body));
    } else {
        ticket.body = text;
        ticket.id = extract_field(text, "ID").value_or(default_id);
        ticket.priority = extract_field(text, "Priority").value_or("P2-medium");
        ticket.status = extract_field(text, "Status").value_or("queued");
        ticket.step = extract_field(text, "Step").value_or("");
        ticket.summary = extract_summary(text);
    }
    return ticket;
}

std::string Ticket::to_markdown() const {
    if (!has_frontmatter) {
        return body;
    }

    std::map<std::string, std::string> scalars = frontmatter;
    scalars["id"] = id;
    scalars["priority"] = priority;
    scalars["status"] = status;
    scalars["step"] = step;
    if (worktree_path) scalars["worktree_path"] = *worktree_path;
    if (branch) scalars["branch"] = *branch;
    if (external_id) scalars["external_id"] = *external_id;
    if (external_url) scalars["external_url"] = *external_url;
    if (external_provider) scalars["external_provider"] = *external_provider;
    if (frontmatter.count("summary") > 0 || summary != extract_summary(body)) {
        scalars["summary"] = summary;
    }

    std::set<std::string> keys;
    for (const auto& [key, value] : scalars) {
        keys.insert(key);
    }
    if (!sessions.empty()) keys.insert("sessions");
    if (!llm_task.empty()) keys.insert("llm_task");

    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& key : keys) {
        out << YAML::Key << key << YAML::Value;
        if (key == "sessions" && !sessions.empty()) {
            out << YAML::BeginMap;
            for (const auto& [step_name, session] : sessions) {
                out << YAML::Key << step_name << YAML::Value << session;
            }
            out << YAML::EndMap;
        } else if (key == "llm_task" && !llm_task.empty()) {
            out << YAML::BeginMap;
            if (llm_task.blocked_by.size() > 0) {
                out << YAML::Key << "blocked_by" << YAML::Value << YAML::BeginSeq;
                for (const auto& blocker : llm_task.blocked_by) {
                    out << blocker;
                }
                out << YAML::EndSeq;
            }
            if (llm_task.id) out << YAML::Key << "id" << YAML::Value << *llm_task.id;
            if (llm_task.status) out << YAML::Key << "status" << YAML::Value << *llm_task.status;
            out << YAML::EndMap;
        } else {
            out << scalars.at(key);
        }
    }
    out << YAML::EndMap;
    return "---\n" + std::string(out.c_str()) + "\n---" + body;
}

core::errors::Status Ticket::write() const {
    return write_text(filepath, content);
}

std::string Ticket::branch_name() const {
    std::string prefix = "work";
    if (ticket_type == "FEAT") prefix = "feature";
    else if (ticket_type == "FIX") prefix = "fix";
    else if (ticket_type == "SPIKE") prefix = "spike";
    else if (ticket_type == "INV") prefix = "investigation";

    std::string mapped;
    for (const char c : core::util::lowercase(summary)) {
        mapped.push_back(std::isalnum(static_cast<unsigned char>(c)) ? c : '-');
    }
    std::vector<std::string> words;
    for (const auto& part : core::util::split(mapped, '-')) {
        if (!part.empty() && words.size() < 5) {
            words.push_back(part);
        }
    }
    return prefix + "/" + id + "-" + core::util::join(words, "-");
}

std::optional<std::string> Ticket::session_id(const std::string& step_name) const {
    const auto it = sessions.find(step_name);
    if (it == sessions.end()) {
        return std::nullopt;
    }
    return it->second;
}

core::errors::Status Ticket::update_field(const std::string& key, const std::string& value) {
    ensure_frontmatter(*this);
    frontmatter[key] = value;
    mirror_field(*this, key, value);
    content = to_markdown();
    return write();
}

core::errors::Status Ticket::append_history(const std::string& entry) {
    const std::string header = "## History";
    const std::string line = entry + "\n";
    const auto pos = body.find(header);
    if (pos != std::string::npos) {
        const auto next_section = body.find("\n## ", pos + header.size());
        auto insert_at = next_section == std::string::npos ? body.size() : next_section + 1;
        // Entries stay contiguous: step back over blank lines, keeping the one under the header.
        while (insert_at > pos + header.size() + 2 && body[insert_at - 1] == '\n' &&
               body[insert_at - 2] == '\n') {
            --insert_at;
        }
        const bool needs_newline = insert_at > 0 && body[insert_at - 1] != '\n';
        body.insert(insert_at, (needs_newline ? "\n" : "") + line);
    } else {
        if (!body.empty() && body.back() != '\n') {
            body += '\n';
        }
        body += "\n" + header + "\n\n" + line;
    }
    content = to_markdown();
    return write();
}

core::errors::Status Ticket::add_awaiting_entry(const std::string& step_display_name) {
    const std::string timestamp =
        core::util::format_local(core::util::now_epoch_seconds(), "%Y-%m-%d %H:%M:%S");
    return append_history("- **" + timestamp + "** - Moved to AWAITING during \"" +
                          step_display_name + "\" step");
}

core::errors::Status Ticket::set_session_id(const std::string& step_name,
                                            const std::string& session_id) {
    ensure_frontmatter(*this);
    sessions[step_name] = session_id;
    content = to_markdown();
    return write();
}

core::errors::Status Ticket::set_step(const std::string& step_name) {
    return update_field("step", step_name);
}

core::errors::Status Ticket::set_status(const std::string& new_status) {
    return update_field("status", new_status);
}

core::errors::Result<std::optional<std::string>> Ticket::advance_step(
    const issuetypes::IssueType& issue_type) {
    const issuetypes::StepSchema* current =
        step.empty() ? issue_type.first_step() : issue_type.find_step(step);
    if (current == nullptr) {
        return OrchError{ErrorCategory::Validation,
                         "Step '" + step + "' is not part of issue type " + issue_type.key,
                         "unknown_step"};
    }
    if (!current->next_step) {
        return std::optional<std::string>{};
    }
    const std::string next = *current->next_step;
    auto status = set_step(next);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    return std::optional<std::string>(next);
}

}  // namespace orch::queue
