#include "core/config/paths.hpp"

#include <system_error>

namespace orch::core::config {

namespace {

std::filesystem::path anchor(const std::filesystem::path& root, const std::string& value) {
    const std::filesystem::path path(value);
    if (path.is_absolute()) {
        return path.lexically_normal();
    }
    return (root / path).lexically_normal();
}

}  // namespace

OperatorPaths OperatorPaths::resolve(const std::filesystem::path& workspace_root,
                                     const Config& config) {
    std::error_code ec;
    std::filesystem::path root = std::filesystem::absolute(workspace_root, ec);
    if (ec) {
        root = workspace_root;
    }

    OperatorPaths paths;
    paths.workspace_root = root.lexically_normal();
    paths.tickets = anchor(root, config.paths.tickets);
    paths.queue = paths.tickets / "queue";
    paths.in_progress = paths.tickets / "in-progress";
    paths.completed = paths.tickets / "completed";
    paths.operator_dir = anchor(root, config.paths.state);
    paths.state_file = paths.operator_dir / "state.json";
    paths.logs = paths.operator_dir / "logs";
    paths.prompts = paths.operator_dir / "prompts";
    paths.commands = paths.operator_dir / "commands";
    paths.sessions = paths.operator_dir / "sessions";
    paths.templates = paths.operator_dir / "templates";
    paths.issuetypes = paths.operator_dir / "issuetypes";
    paths.imports = paths.issuetypes / "imports";
    paths.collections_file = paths.issuetypes / "collections.toml";
    paths.api_session_file = paths.operator_dir / "api-session.json";
    paths.projects_root = anchor(root, config.paths.projects);
    paths.worktrees = config.git.worktrees_dir.empty()
                          ? paths.operator_dir / "worktrees"
                          : anchor(root, config.git.worktrees_dir);
    return paths;
}

core::errors::Status OperatorPaths::ensure_directories() const {
    for (const auto& dir : {queue, in_progress, completed, operator_dir, prompts, commands,
                            sessions}) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return core::errors::OrchError{core::errors::ErrorCategory::External,
                                           "Unable to create directory: " + dir.string(),
                                           "directory_create_failed", ec.message()};
        }
    }
    return core::errors::ok();
}

}  // namespace orch::core::config
