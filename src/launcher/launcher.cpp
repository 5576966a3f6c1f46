#include "launcher/launcher.hpp"

#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "core/util/text.hpp"
#include "launcher/command_builder.hpp"
#include "launcher/llm_tools.hpp"

namespace orch::launcher {

using core::errors::ErrorCategory;
using core::errors::OrchError;
using nlohmann::json;

namespace {

// Writes the step's session id, and the worktree fields when one was used, into the ticket.
core::errors::Status record_launch(queue::Ticket ticket, const PreparedLaunch& launch) {
    auto stored = ticket.set_session_id(launch.step, launch.session_id);
    if (core::errors::is_error(stored)) {
        return stored;
    }
    if (launch.branch) {
        auto path_field = ticket.update_field("worktree_path", launch.working_directory.string());
        if (core::errors::is_error(path_field)) {
            return path_field;
        }
        return ticket.update_field("branch", *launch.branch);
    }
    return core::errors::ok();
}

}  // namespace

json prepared_launch_to_json(const PreparedLaunch& launch) {
    return json{{"agent_id", launch.agent_id},
                {"ticket_id", launch.ticket_id},
                {"working_directory", launch.working_directory.string()},
                {"command", launch.command},
                {"session_name", launch.session_name},
                {"session_id", launch.session_id},
                {"provider", launch.provider},
                {"model", launch.model},
                {"step", launch.step},
                {"prompt_file", launch.prompt_file.string()},
                {"script_file", launch.script_file.string()},
                {"worktree_created", launch.worktree_created},
                {"branch", launch.branch ? json(*launch.branch) : json(nullptr)}};
}

Launcher::Launcher(core::config::Config config, core::config::OperatorPaths paths,
                   const issuetypes::IssueTypeRegistry& registry, TmuxClient& tmux,
                   const git::WorktreeManager* worktrees)
    : config_(std::move(config)),
      paths_(std::move(paths)),
      registry_(registry),
      tmux_(tmux),
      worktrees_(worktrees),
      artifacts_(paths_.operator_dir),
      composer_(paths_.templates),
      resolver_(registry, paths_.tickets, artifacts_) {}

std::string Launcher::session_name_for(const std::string& ticket_id) const {
    return config_.tmux.session_prefix + sanitize_session_name(ticket_id);
}

LaunchOptions Launcher::default_options() const {
    LaunchOptions options;
    options.docker = config_.launch.docker.enabled;
    options.yolo = config_.launch.yolo.enabled;
    options.use_worktree = config_.git.use_worktrees;
    return options;
}

core::errors::Result<std::filesystem::path> Launcher::project_directory(
    const queue::Ticket& ticket, const LaunchOptions& options) const {
    std::filesystem::path dir;
    if (options.project_override) {
        dir = *options.project_override;
    } else if (ticket.project.empty() || ticket.project == "global") {
        dir = paths_.projects_root;
    } else {
        dir = paths_.projects_root / ticket.project;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return OrchError{ErrorCategory::Precondition, "Project path does not exist: " + dir.string(),
                         "project_not_found"};
    }
    return dir;
}

core::errors::Result<PreparedLaunch> Launcher::prepare(
    const queue::Ticket& ticket, const LaunchOptions& options,
    const std::optional<prompt::PreviousStepContext>& carry) const {
    const auto issue_type = registry_.get(ticket.ticket_type);
    if (!issue_type) {
        return OrchError{ErrorCategory::NotFound, "Unknown issue type: " + ticket.ticket_type,
                         "issuetype_not_found"};
    }
    const issuetypes::StepSchema* step =
        ticket.step.empty() ? issue_type->first_step() : issue_type->find_step(ticket.step);
    if (step == nullptr) {
        return OrchError{ErrorCategory::Validation,
                         "Step '" + ticket.step + "' is not part of issue type " + issue_type->key,
                         "unknown_step"};
    }

    PreparedLaunch prepared;
    prepared.agent_id = core::config::generate_agent_id();
    prepared.ticket_id = ticket.id;
    prepared.session_id = core::config::generate_uuid();
    prepared.session_name = session_name_for(ticket.id);
    prepared.step = step->name;

    auto project_dir = project_directory(ticket, options);
    if (core::errors::is_error(project_dir)) {
        return core::errors::get_error(project_dir);
    }
    prepared.working_directory = core::errors::get_value(project_dir);

    if (options.use_worktree && worktrees_ != nullptr &&
        worktrees_->git().is_repository(prepared.working_directory)) {
        const std::string branch = ticket.branch.value_or(ticket.branch_name());
        const auto target = worktrees_->worktree_path(ticket.project, ticket.id);
        std::error_code ec;
        const bool existed = std::filesystem::exists(target, ec);
        auto worktree = worktrees_->ensure_worktree_exists(
            prepared.working_directory, ticket.project, ticket.id, branch, config_.git.base_branch);
        if (core::errors::is_error(worktree)) {
            return core::errors::get_error(worktree);
        }
        prepared.working_directory = core::errors::get_value(worktree).path;
        prepared.branch = core::errors::get_value(worktree).branch;
        prepared.worktree_created = !existed;
    }

    prepared.provider = options.provider.value_or(config_.llm_tools.default_tool);
    auto tool = resolve_tool(config_, prepared.provider);
    if (core::errors::is_error(tool)) {
        return core::errors::get_error(tool);
    }
    prepared.model = resolve_model(config_, core::errors::get_value(tool), options.model);

    auto prompt_text = composer_.compose(ticket, *issue_type, prepared.working_directory, carry);
    if (core::errors::is_error(prompt_text)) {
        return core::errors::get_error(prompt_text);
    }
    auto prompt_file = artifacts_.write_prompt(prepared.session_id,
                                               core::errors::get_value(prompt_text));
    if (core::errors::is_error(prompt_file)) {
        return core::errors::get_error(prompt_file);
    }
    prepared.prompt_file = core::errors::get_value(prompt_file);

    auto generated = resolver_.generate_config(prepared.provider, prepared.working_directory,
                                               issue_type->key, step->name, ticket.id,
                                               prepared.session_id);
    if (core::errors::is_error(generated)) {
        return core::errors::get_error(generated);
    }

    CommandInputs inputs;
    inputs.config_flags = core::errors::get_value(generated).cli_flags;
    inputs.model = prepared.model;
    inputs.session_id = prepared.session_id;
    inputs.prompt_file = prepared.prompt_file;
    inputs.yolo = options.yolo;
    prepared.command = build_command(core::errors::get_value(tool), inputs);

    if (options.docker) {
        auto wrapped = wrap_docker(config_.launch.docker, prepared.command,
                                   prepared.working_directory);
        if (core::errors::is_error(wrapped)) {
            return core::errors::get_error(wrapped);
        }
        prepared.command = core::errors::get_value(wrapped);
    }

    auto script = artifacts_.write_script(
        prepared.session_id, build_launch_script(prepared.working_directory, prepared.command));
    if (core::errors::is_error(script)) {
        return core::errors::get_error(script);
    }
    prepared.script_file = core::errors::get_value(script);
    LOG_DEBUG("Prepared " + ticket.id + " step " + prepared.step + " with " + prepared.provider);
    return prepared;
}

core::errors::Result<PreparedLaunch> Launcher::launch(
    const queue::Ticket& ticket, const LaunchOptions& options,
    const std::optional<prompt::PreviousStepContext>& carry) {
    auto version = tmux_.check_available();
    if (core::errors::is_error(version)) {
        return core::errors::get_error(version);
    }

    const std::string session_name = session_name_for(ticket.id);
    auto exists = tmux_.session_exists(session_name);
    if (core::errors::is_error(exists)) {
        return core::errors::get_error(exists);
    }
    if (core::errors::get_value(exists)) {
        return OrchError{ErrorCategory::Conflict,
                         "Tmux session '" + session_name + "' already exists.", "session_exists",
                         "Attach with: tmux attach -t " + session_name};
    }

    auto prepared = prepare(ticket, options, carry);
    if (core::errors::is_error(prepared)) {
        return prepared;
    }
    const PreparedLaunch& launch = core::errors::get_value(prepared);

    auto created = tmux_.create_session(session_name, launch.working_directory.string(),
                                        "bash " + core::util::shell_word(launch.script_file.string()));
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }
    // The pane must outlive the agent so its final status block can be read.
    auto remain = tmux_.set_remain_on_exit(session_name, true);
    if (core::errors::is_error(remain)) {
        LOG_WARN("remain-on-exit not set for " + session_name + ": " +
                 core::errors::get_error(remain).message);
    }
    auto silence = tmux_.set_monitor_silence(
        session_name, static_cast<std::uint32_t>(config_.agents.silence_threshold));
    if (core::errors::is_error(silence)) {
        LOG_WARN("monitor-silence not set for " + session_name + ": " +
                 core::errors::get_error(silence).message);
    }

    auto recorded = record_launch(ticket, launch);
    if (core::errors::is_error(recorded)) {
        // An unrecorded session could never be resumed or reaped.
        auto killed = tmux_.kill_session(session_name);
        if (core::errors::is_error(killed)) {
            LOG_WARN("Could not kill " + session_name + " after failed launch: " +
                     core::errors::get_error(killed).message);
        }
        return core::errors::get_error(recorded);
    }
    LOG_INFO("Launched " + ticket.id + " (" + launch.step + ") in tmux session " + session_name);
    return prepared;
}

}  // namespace orch::launcher
