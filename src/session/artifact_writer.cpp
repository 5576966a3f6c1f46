#include "session/artifact_writer.hpp"

#include <fstream>
#include <utility>

namespace orch::session {

using core::errors::ErrorCategory;
using core::errors::OrchError;

namespace {

// Ids become path components, so separators and dot segments are refused.
bool is_safe_component(const std::string& value) {
    if (value.empty() || value == "." || value == "..") {
        return false;
    }
    return value.find('/') == std::string::npos && value.find('\\') == std::string::npos;
}

}  // namespace

ArtifactWriter::ArtifactWriter(std::filesystem::path operator_dir)
    : operator_dir_(std::move(operator_dir)) {}

core::errors::Result<std::filesystem::path> ArtifactWriter::artifact_dir(
    const std::string& subdir) const {
    std::error_code ec;
    const auto dir = operator_dir_ / subdir;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return OrchError{ErrorCategory::External,
                         "Unable to create artifact directory: " + dir.string(),
                         "artifact_dir_create_failed"};
    }
    return dir;
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_text(
    const std::filesystem::path& path, const std::string& text) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return OrchError{ErrorCategory::External,
                         "Unable to open artifact file: " + path.string(),
                         "artifact_open_failed"};
    }
    out << text;
    if (!out.good()) {
        return OrchError{ErrorCategory::External,
                         "Unable to write artifact file: " + path.string(),
                         "artifact_write_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> ArtifactWriter::session_dir(
    const std::string& ticket_id) const {
    if (!is_safe_component(ticket_id)) {
        return OrchError{ErrorCategory::Input, "Invalid ticket id for session dir: " + ticket_id,
                         "invalid_ticket_id"};
    }
    auto sessions = artifact_dir("sessions");
    if (core::errors::is_error(sessions)) {
        return sessions;
    }
    const auto dir = core::errors::get_value(sessions) / ticket_id;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return OrchError{ErrorCategory::External, "Unable to create session dir: " + dir.string(),
                         "artifact_dir_create_failed"};
    }
    return dir;
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_session_file(
    const std::string& ticket_id, const std::string& filename, const std::string& content) const {
    if (!is_safe_component(filename)) {
        return OrchError{ErrorCategory::Input, "Invalid session file name: " + filename,
                         "invalid_artifact_name"};
    }
    auto dir = session_dir(ticket_id);
    if (core::errors::is_error(dir)) {
        return dir;
    }
    return write_text(core::errors::get_value(dir) / filename, content);
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_audit(
    const std::string& ticket_id, const nlohmann::json& record) const {
    return write_session_file(ticket_id, "audit.json", record.dump(2) + "\n");
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_prompt(
    const std::string& session_id, const std::string& prompt) const {
    if (!is_safe_component(session_id)) {
        return OrchError{ErrorCategory::Input, "Session ID cannot be empty.", "invalid_session_id"};
    }
    auto dir = artifact_dir("prompts");
    if (core::errors::is_error(dir)) {
        return dir;
    }
    return write_text(core::errors::get_value(dir) / (session_id + ".txt"), prompt);
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_script(
    const std::string& session_id, const std::string& script) const {
    if (!is_safe_component(session_id)) {
        return OrchError{ErrorCategory::Input, "Session ID cannot be empty.", "invalid_session_id"};
    }
    auto dir = artifact_dir("commands");
    if (core::errors::is_error(dir)) {
        return dir;
    }
    auto written = write_text(core::errors::get_value(dir) / (session_id + ".sh"), script);
    if (core::errors::is_error(written)) {
        return written;
    }

    const auto& path = core::errors::get_value(written);
    std::error_code ec;
    using std::filesystem::perms;
    std::filesystem::permissions(path,
                                 perms::owner_all | perms::group_read | perms::group_exec |
                                     perms::others_read | perms::others_exec,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        return OrchError{ErrorCategory::External,
                         "Unable to mark script executable: " + path.string(),
                         "artifact_chmod_failed"};
    }
    return written;
}

}  // namespace orch::session
