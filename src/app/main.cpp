#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "api/api_router.hpp"
#include "api/api_session.hpp"
#include "api/http_server.hpp"
#include "app/cli_parser.hpp"
#include "core/config/config.hpp"
#include "core/config/paths.hpp"
#include "core/errors/orch_errors.hpp"
#include "core/logging/logger.hpp"
#include "core/util/time.hpp"
#include "git/git_cli.hpp"
#include "git/pull_request.hpp"
#include "git/worktree_manager.hpp"
#include "issuetypes/registry.hpp"
#include "launcher/launcher.hpp"
#include "launcher/llm_tools.hpp"
#include "launcher/tmux_client.hpp"
#include "notifications/dispatcher.hpp"
#include "queue/queue_watcher.hpp"
#include "queue/ticket_store.hpp"
#include "session/state_store.hpp"
#include "supervisor/supervisor.hpp"

#ifndef ORCH_VERSION
#define ORCH_VERSION "0.1.0"
#endif

namespace {

using orch::app::cli::CliOptions;
using orch::app::cli::Command;
using orch::core::errors::get_error;
using orch::core::errors::get_value;
using orch::core::errors::is_error;
using orch::core::errors::OrchError;

std::atomic_bool g_stop{false};

void handle_signal(int) {
    g_stop.store(true);
}

void install_signal_handlers() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

void report(const std::string& what, const OrchError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

// Everything the commands share, wired once from the loaded config.
struct Runtime {
    orch::core::config::Config config;
    orch::core::config::OperatorPaths paths;
    orch::issuetypes::IssueTypeRegistry registry;
    std::unique_ptr<orch::queue::TicketStore> tickets;
    std::unique_ptr<orch::session::StateStore> state;
    std::unique_ptr<orch::launcher::SystemTmuxClient> tmux;
    std::unique_ptr<orch::git::WorktreeManager> worktrees;
    std::unique_ptr<orch::launcher::Launcher> launcher;
    std::unique_ptr<orch::notifications::Dispatcher> dispatcher;
    std::unique_ptr<orch::supervisor::Supervisor> supervisor;
    orch::git::PullRequestClient pull_requests;
};

// Approved when the ticket branch's pull request is merged, or open and approved.
bool pull_request_approved(Runtime& rt, const orch::queue::Ticket& ticket) {
    std::filesystem::path directory;
    if (ticket.worktree_path) {
        directory = *ticket.worktree_path;
    } else {
        auto project = rt.launcher->project_directory(ticket, orch::launcher::LaunchOptions{});
        if (is_error(project)) {
            LOG_DEBUG("No directory for PR lookup of " + ticket.id + ": " +
                      get_error(project).message);
            return false;
        }
        directory = get_value(project);
    }
    const std::string branch = ticket.branch.value_or(ticket.branch_name());
    auto status = rt.pull_requests.status(directory, branch);
    if (is_error(status)) {
        LOG_DEBUG("PR status of " + branch + " unavailable: " + get_error(status).message);
        return false;
    }
    return get_value(status).approved();
}

// Returns the process exit code on failure.
int bootstrap(const CliOptions& options, Runtime& rt) {
    const std::filesystem::path root = std::filesystem::current_path();

    orch::core::config::LoadOptions load;
    load.workspace_root = root;
    load.explicit_path = options.config_path;
    auto loaded = orch::core::config::load_config(load);
    if (is_error(loaded)) {
        report("Configuration error", get_error(loaded));
        return 1;
    }
    rt.config = get_value(loaded);

    auto& logger = orch::core::logging::Logger::get();
    logger.set_level(orch::core::logging::parse_level(rt.config.logging.level));
    logger.use_stderr(options.command != Command::Run);

    rt.paths = orch::core::config::OperatorPaths::resolve(root, rt.config);
    auto dirs = rt.paths.ensure_directories();
    if (is_error(dirs)) {
        report("Unable to prepare workspace", get_error(dirs));
        return 1;
    }
    if (rt.config.logging.to_file && !logger.open_file(rt.paths.logs / "operator.log")) {
        LOG_WARN("Unable to open log file under " + rt.paths.logs.string());
    }

    auto registry_loaded = rt.registry.load(rt.paths.issuetypes);
    if (is_error(registry_loaded)) {
        report("Unable to load issue types", get_error(registry_loaded));
        return 1;
    }
    auto activated = rt.registry.activate_collection(rt.config.templates.collection);
    if (is_error(activated)) {
        LOG_WARN("Collection '" + rt.config.templates.collection + "' unavailable, keeping '" +
                 rt.registry.active_collection_name() + "'");
    }

    rt.tickets = std::make_unique<orch::queue::TicketStore>(rt.paths.tickets);
    rt.state = std::make_unique<orch::session::StateStore>(rt.paths.state_file);
    auto state_loaded = rt.state->load();
    if (is_error(state_loaded)) {
        report("Unable to load state", get_error(state_loaded));
        return 1;
    }

    rt.tmux = std::make_unique<orch::launcher::SystemTmuxClient>(rt.config.tmux.binary);
    rt.worktrees = std::make_unique<orch::git::WorktreeManager>(rt.paths.worktrees,
                                                                orch::git::GitCli());
    rt.launcher = std::make_unique<orch::launcher::Launcher>(rt.config, rt.paths, rt.registry,
                                                             *rt.tmux, rt.worktrees.get());
    rt.dispatcher = orch::notifications::Dispatcher::from_config(rt.config.notifications);
    rt.supervisor = std::make_unique<orch::supervisor::Supervisor>(
        rt.config, rt.registry, *rt.tickets, *rt.state, *rt.launcher, *rt.tmux,
        rt.dispatcher.get(), rt.worktrees.get(), std::thread::hardware_concurrency());
    rt.supervisor->set_review_checker(
        [&rt](const orch::queue::Ticket& ticket, const orch::issuetypes::StepSchema&) {
            return pull_request_approved(rt, ticket);
        });
    return 0;
}

std::string age_of(std::int64_t since) {
    const std::int64_t seconds = orch::core::util::now_epoch_seconds() - since;
    if (seconds < 60) return std::to_string(seconds) + "s";
    if (seconds < 3600) return std::to_string(seconds / 60) + "m";
    return std::to_string(seconds / 3600) + "h" + std::to_string((seconds % 3600) / 60) + "m";
}

void print_tickets(const std::string& heading, const std::vector<orch::queue::Ticket>& tickets) {
    std::cout << heading << " (" << tickets.size() << ")\n";
    for (const auto& t : tickets) {
        std::cout << "  " << t.id << "  " << t.priority << "  " << t.project << "  "
                  << t.summary;
        if (t.status == "failed") std::cout << "  [failed]";
        std::cout << "\n";
    }
}

int cmd_queue(const CliOptions& options, Runtime& rt) {
    print_tickets("Queue", rt.tickets->list_by_priority(rt.registry));
    if (options.all) {
        print_tickets("In progress", rt.tickets->list_in_progress());
        print_tickets("Completed", rt.tickets->list_completed());
    }
    return 0;
}

bool confirm(const std::string& question) {
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return answer == "y" || answer == "Y" || answer == "yes";
}

int cmd_launch(const CliOptions& options, Runtime& rt) {
    auto launch_options = rt.launcher->default_options();
    launch_options.provider = options.provider;
    launch_options.model = options.model;
    if (options.yolo) launch_options.yolo = true;
    if (options.docker) launch_options.docker = true;

    if (!options.yes) {
        std::string target = options.ticket ? *options.ticket : "the next queued ticket";
        if (launch_options.yolo) target += " in autonomous mode";
        if (!confirm("Launch " + target + "?")) {
            std::cout << "Cancelled.\n";
            return 0;
        }
    }

    auto launched = rt.supervisor->launch_ticket(options.ticket, launch_options);
    if (is_error(launched)) {
        report("Launch failed", get_error(launched));
        return 1;
    }
    const auto& agent = get_value(launched);
    std::cout << "Launched " << agent.ticket_id << " as " << agent.id << " in tmux session "
              << agent.session_name << "\n"
              << "Attach with: " << rt.config.tmux.binary << " attach -t " << agent.session_name
              << "\n";
    return 0;
}

int cmd_agents(const CliOptions& options, Runtime& rt) {
    const auto snapshot = rt.state->snapshot();
    std::cout << "Agents (" << snapshot.agents.size() << ")"
              << (snapshot.paused ? "  [queue paused]" : "") << "\n";
    for (const auto& agent : snapshot.agents) {
        std::cout << "  " << agent.id << "  " << agent.ticket_id << "  "
                  << orch::session::to_string(agent.status) << "  step=" << agent.current_step
                  << "  " << age_of(agent.started_at) << "\n";
        if (options.verbose) {
            std::cout << "      session=" << agent.session_name << "  project=" << agent.project
                      << "  tool=" << agent.provider
                      << (agent.model.empty() ? "" : "/" + agent.model) << "\n";
            if (agent.last_message) {
                std::cout << "      last: " << *agent.last_message << "\n";
            }
        }
    }
    return 0;
}

int cmd_stalled(Runtime& rt) {
    const auto snapshot = rt.state->snapshot();
    std::size_t count = 0;
    for (const auto& agent : snapshot.agents) {
        if (agent.status != orch::session::AgentStatus::AwaitingInput) continue;
        ++count;
        std::cout << "  " << agent.id << "  " << agent.ticket_id << "  step=" << agent.current_step
                  << "  idle " << age_of(agent.last_content_change ? agent.last_content_change
                                                                   : agent.last_activity)
                  << (agent.review_pending ? "  [review pending]" : "") << "\n";
    }
    if (count == 0) {
        std::cout << "No agents awaiting input.\n";
    }
    return 0;
}

int cmd_toggle(bool pause, Runtime& rt) {
    auto result = pause ? rt.supervisor->pause() : rt.supervisor->resume();
    if (is_error(result)) {
        report(pause ? "Pause failed" : "Resume failed", get_error(result));
        return 1;
    }
    std::cout << (pause ? "Queue paused.\n" : "Queue resumed.\n");
    return 0;
}

int cmd_alert(const CliOptions& options, Runtime& rt) {
    auto issue_type = rt.registry.get("INV");
    if (!issue_type) {
        LOG_ERROR("Issue type INV is not registered");
        return 1;
    }
    auto created = rt.tickets->create_investigation(*issue_type, options.source, options.message,
                                                    options.severity,
                                                    options.project.value_or("global"));
    if (is_error(created)) {
        report("Unable to create investigation", get_error(created));
        return 1;
    }
    const auto& ticket = get_value(created);
    rt.dispatcher->notify_sync(orch::notifications::NotificationEvent::investigation_created(
        options.source, options.severity, ticket.summary, ticket.id));
    std::cout << "Created " << ticket.id << " (" << ticket.priority << ") at "
              << ticket.filepath.string() << "\n";
    return 0;
}

// Hands the terminal to $EDITOR and waits for it to exit.
void open_in_editor(const std::string& editor, const std::filesystem::path& file) {
    const pid_t pid = ::fork();
    if (pid < 0) {
        LOG_WARN("Unable to start editor " + editor);
        return;
    }
    if (pid == 0) {
        const std::string path = file.string();
        ::execlp("/bin/sh", "sh", "-c", "exec $0 \"$1\"", editor.c_str(), path.c_str(),
                 static_cast<char*>(nullptr));
        ::_exit(127);
    }
    int status = 0;
    ::waitpid(pid, &status, 0);
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        LOG_WARN("Editor " + editor + " exited abnormally");
    }
}

int cmd_create(const CliOptions& options, Runtime& rt) {
    auto issue_type = rt.registry.get(options.template_key);
    if (!issue_type) {
        LOG_ERROR("Unknown issue type: " + options.template_key);
        return 2;
    }
    const std::string summary = options.summary.value_or(issue_type->name);
    auto created = rt.tickets->create_ticket(*issue_type, options.project.value_or("global"),
                                             summary);
    if (is_error(created)) {
        report("Unable to create ticket", get_error(created));
        return 1;
    }
    const auto& ticket = get_value(created);
    std::cout << "Created " << ticket.id << " at " << ticket.filepath.string() << "\n";

    const char* editor = std::getenv("EDITOR");
    if (editor != nullptr && *editor != '\0' && ::isatty(STDIN_FILENO) == 1) {
        open_in_editor(editor, ticket.filepath);
    }
    return 0;
}

int cmd_generate_agents(const CliOptions& options, Runtime& rt) {
    orch::queue::Ticket scope;
    scope.project = options.project.value_or("global");
    auto project_path = rt.launcher->project_directory(scope, orch::launcher::LaunchOptions{});
    if (is_error(project_path)) {
        report("Unable to generate agent tickets", get_error(project_path));
        return 1;
    }
    auto generated = rt.tickets->create_agent_tickets(rt.registry, get_value(project_path),
                                                      scope.project);
    if (is_error(generated)) {
        report("Unable to generate agent tickets", get_error(generated));
        return 1;
    }
    const auto& result = get_value(generated);
    for (const auto& id : result.created) {
        std::cout << "Created " << id << "\n";
    }
    for (const auto& key : result.skipped) {
        std::cout << "Skipped " << key << " (agent file exists)\n";
    }
    for (const auto& [key, message] : result.errors) {
        LOG_ERROR("Agent ticket for " + key + " failed: " + message);
    }
    if (result.created.empty() && result.skipped.empty() && result.errors.empty()) {
        std::cout << "No issue type defines an agent_prompt\n";
    }
    return result.errors.empty() ? 0 : 1;
}

int cmd_api(const CliOptions& options, Runtime& rt) {
    const std::uint16_t port = options.port.value_or(rt.config.rest_api.port);
    orch::api::ApiRouter router(rt.registry, *rt.tickets, *rt.state, *rt.supervisor, *rt.launcher,
                                ORCH_VERSION);
    orch::api::HttpServer server(router, "127.0.0.1", port);
    auto bound = server.bind_and_listen();
    if (is_error(bound)) {
        report("API server failed", get_error(bound));
        return 1;
    }

    orch::api::ApiSessionFile session_file(rt.paths.api_session_file);
    orch::api::ApiSessionInfo info;
    info.port = server.port();
    info.pid = static_cast<std::int64_t>(::getpid());
    info.started_at = orch::core::util::format_iso8601(orch::core::util::now_epoch_seconds());
    info.version = ORCH_VERSION;
    auto written = session_file.write(info);
    if (is_error(written)) {
        report("Unable to record API session", get_error(written));
    }

    install_signal_handlers();
    LOG_INFO("REST API listening on http://127.0.0.1:" + std::to_string(server.port()) +
             orch::api::kApiPrefix);
    server.serve(g_stop);
    LOG_INFO("REST API stopped");
    return 0;
}

int cmd_run(Runtime& rt) {
    auto tmux_version = rt.tmux->check_available();
    if (is_error(tmux_version)) {
        report("tmux is required", get_error(tmux_version));
        return 1;
    }
    if (orch::launcher::available_tools(rt.config).empty()) {
        LOG_ERROR("No LLM tool found on PATH (claude, gemini or codex)");
        return 1;
    }

    auto reconciled = rt.supervisor->reconcile_on_startup();
    if (is_error(reconciled)) {
        report("Startup reconciliation failed", get_error(reconciled));
    }

    install_signal_handlers();

    orch::queue::QueueWatcher watcher(
        {rt.tickets->queue_dir(), rt.tickets->in_progress_dir()},
        [&rt](const orch::queue::WatchEvent&) { rt.supervisor->wake(); },
        std::chrono::milliseconds(rt.config.queue.poll_interval_ms));
    watcher.start();

    std::unique_ptr<orch::api::ApiRouter> router;
    std::unique_ptr<orch::api::HttpServer> server;
    std::thread server_thread;
    if (rt.config.rest_api.enabled) {
        router = std::make_unique<orch::api::ApiRouter>(rt.registry, *rt.tickets, *rt.state,
                                                        *rt.supervisor, *rt.launcher,
                                                        ORCH_VERSION);
        server = std::make_unique<orch::api::HttpServer>(*router, "127.0.0.1",
                                                         rt.config.rest_api.port);
        auto bound = server->bind_and_listen();
        if (is_error(bound)) {
            report("REST API disabled", get_error(bound));
            server.reset();
        } else {
            server_thread = std::thread([&server]() { server->serve(g_stop); });
        }
    }

    LOG_INFO("Supervising " + rt.tickets->tickets_dir().string() + " with up to " +
             std::to_string(rt.supervisor->effective_max_agents()) + " agents");
    rt.supervisor->run(g_stop);

    watcher.stop();
    if (server_thread.joinable()) {
        server_thread.join();
    }
    LOG_INFO("Supervisor stopped");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = orch::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        const auto& err = get_error(parsed);
        orch::core::logging::Logger::get().use_stderr(true);
        report("Input error", err);
        std::cerr << orch::app::cli::usage();
        return 2;
    }
    const CliOptions& options = get_value(parsed);
    if (options.command == Command::Help) {
        std::cout << orch::app::cli::usage();
        return 0;
    }

    Runtime rt;
    if (int code = bootstrap(options, rt); code != 0) {
        return code;
    }

    switch (options.command) {
        case Command::Queue:   return cmd_queue(options, rt);
        case Command::Launch:  return cmd_launch(options, rt);
        case Command::Agents:  return cmd_agents(options, rt);
        case Command::Pause:   return cmd_toggle(true, rt);
        case Command::Resume:  return cmd_toggle(false, rt);
        case Command::Stalled: return cmd_stalled(rt);
        case Command::Alert:   return cmd_alert(options, rt);
        case Command::Create:  return cmd_create(options, rt);
        case Command::GenerateAgents: return cmd_generate_agents(options, rt);
        case Command::Api:     return cmd_api(options, rt);
        case Command::Run:
        default:               return cmd_run(rt);
    }
}
