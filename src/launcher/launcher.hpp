#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/config.hpp"
#include "core/config/paths.hpp"
#include "core/errors/orch_errors.hpp"
#include "git/worktree_manager.hpp"
#include "issuetypes/registry.hpp"
#include "launcher/tmux_client.hpp"
#include "permissions/resolver.hpp"
#include "prompt/prompt_composer.hpp"
#include "queue/ticket.hpp"
#include "session/artifact_writer.hpp"

namespace orch::launcher {

struct LaunchOptions {
    std::optional<std::string> provider;
    std::optional<std::string> model;
    bool docker = false;
    bool yolo = false;
    std::optional<std::filesystem::path> project_override;
    bool use_worktree = false;
};

// Everything needed to start an agent session, with or without tmux.
struct PreparedLaunch {
    std::string agent_id;
    std::string ticket_id;
    std::filesystem::path working_directory;
    std::string command;
    std::string session_name;
    std::string session_id;
    std::string provider;
    std::string model;
    std::string step;
    std::filesystem::path prompt_file;
    std::filesystem::path script_file;
    bool worktree_created = false;
    std::optional<std::string> branch;
};

nlohmann::json prepared_launch_to_json(const PreparedLaunch& launch);

class Launcher {
public:
    Launcher(core::config::Config config, core::config::OperatorPaths paths,
             const issuetypes::IssueTypeRegistry& registry, TmuxClient& tmux,
             const git::WorktreeManager* worktrees = nullptr);

    // op-<ticket id> with the configured prefix.
    std::string session_name_for(const std::string& ticket_id) const;

    // Writes the prompt and launch script; does not touch tmux.
    core::errors::Result<PreparedLaunch> prepare(
        const queue::Ticket& ticket, const LaunchOptions& options,
        const std::optional<prompt::PreviousStepContext>& carry = std::nullopt) const;

    // prepare() plus a detached tmux session running the script. The session
    // id and any worktree are recorded in the ticket file.
    core::errors::Result<PreparedLaunch> launch(
        const queue::Ticket& ticket, const LaunchOptions& options,
        const std::optional<prompt::PreviousStepContext>& carry = std::nullopt);

    // Options filled from config defaults (docker, yolo, worktrees).
    LaunchOptions default_options() const;

    // Override, else <projects_root>/<project>; "global" tickets use the root.
    core::errors::Result<std::filesystem::path> project_directory(
        const queue::Ticket& ticket, const LaunchOptions& options) const;

private:
    core::config::Config config_;
    core::config::OperatorPaths paths_;
    const issuetypes::IssueTypeRegistry& registry_;
    TmuxClient& tmux_;
    const git::WorktreeManager* worktrees_;
    session::ArtifactWriter artifacts_;
    prompt::PromptComposer composer_;
    permissions::PermissionResolver resolver_;
};

}  // namespace orch::launcher
