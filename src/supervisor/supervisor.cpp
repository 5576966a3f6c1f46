#include "supervisor/supervisor.hpp"

#include <chrono>
#include <iterator>
#include <thread>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "core/util/text.hpp"
#include "core/util/time.hpp"

namespace orch::supervisor {

using core::errors::ErrorCategory;
using core::errors::OrchError;
using core::logging::ScopedContext;
using notifications::NotificationEvent;
using session::AgentState;
using session::AgentStatus;

namespace {

std::string content_hash(const std::string& content) {
    return std::to_string(std::hash<std::string>{}(content));
}

std::optional<prompt::PreviousStepContext> carry_from_payload(const AgentState& agent) {
    if (!agent.review_payload || !agent.review_payload->is_object()) {
        return std::nullopt;
    }
    const auto& payload = *agent.review_payload;
    prompt::PreviousStepContext carry;
    carry.summary = payload.value("summary", "");
    if (payload.contains("recommendation") && payload["recommendation"].is_string()) {
        carry.recommendation = payload["recommendation"].get<std::string>();
    }
    return carry;
}

bool in_progress_dir(const queue::Ticket& ticket) {
    return ticket.filepath.parent_path().filename() == "in-progress";
}

}  // namespace

Supervisor::Supervisor(core::config::Config config, const issuetypes::IssueTypeRegistry& registry,
                       queue::TicketStore& tickets, session::StateStore& state,
                       launcher::Launcher& launcher,
                       launcher::TmuxClient& tmux, const notifications::Dispatcher* dispatcher,
                       const git::WorktreeManager* worktrees, const std::size_t cpu_count)
    : config_(std::move(config)),
      registry_(registry),
      tickets_(tickets),
      state_(state),
      launcher_(launcher),
      tmux_(tmux),
      dispatcher_(dispatcher),
      worktrees_(worktrees),
      cpu_count_(cpu_count != 0 ? cpu_count : std::thread::hardware_concurrency()),
      engine_(registry),
      clock_([]() { return core::util::now_epoch_seconds(); }) {}

void Supervisor::set_clock(Clock clock) {
    clock_ = std::move(clock);
}

void Supervisor::set_review_checker(workflow::ReviewChecker checker) {
    review_checker_ = std::move(checker);
}

std::size_t Supervisor::effective_max_agents() const {
    return config_.effective_max_agents(cpu_count_ == 0 ? 1 : cpu_count_);
}

IterationReport Supervisor::run_iteration() {
    std::lock_guard<std::mutex> lock(ops_mutex_);
    IterationReport report;

    if (!config_.queue.auto_assign || state_.paused()) {
        report.dispatch_skipped = true;
    } else {
        auto available = tmux_.check_available();
        if (core::errors::is_error(available)) {
            // Claiming now would fail every queued ticket.
            if (!tmux_warned_) {
                LOG_WARN("Dispatch skipped: " + core::errors::get_error(available).message);
                tmux_warned_ = true;
            }
            report.dispatch_skipped = true;
        } else {
            tmux_warned_ = false;
            report.launched = dispatch();
        }
    }

    std::set<std::string> live_agents;
    for (const auto& agent : state_.snapshot().agents) {
        check_agent(agent);
        ++report.checked;
        live_agents.insert(agent.id);
        const auto current = state_.find(agent.id);
        if (current && current->status == AgentStatus::AwaitingInput && current->review_pending) {
            poll_review(*current);
        }
    }
    for (auto it = review_polled_at_.begin(); it != review_polled_at_.end();) {
        it = live_agents.count(it->first) > 0 ? std::next(it) : review_polled_at_.erase(it);
    }

    const std::int64_t now = clock_();
    const auto sweep_interval = static_cast<std::int64_t>(config_.agents.health_check_interval);
    if (!last_sweep_) {
        last_sweep_ = now;
    } else if (sweep_interval > 0 && now - *last_sweep_ >= sweep_interval) {
        last_sweep_ = now;
        auto swept = reconcile_sessions("Session ended");
        if (core::errors::is_error(swept)) {
            LOG_DEBUG("Session sweep skipped: " + core::errors::get_error(swept).message);
        }
    }
    return report;
}

void Supervisor::run(const std::atomic_bool& stop) {
    LOG_INFO("Supervisor started (max agents " + std::to_string(effective_max_agents()) +
             ", poll " + std::to_string(config_.queue.poll_interval_ms) + "ms)");
    while (!stop.load()) {
        run_iteration();
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, std::chrono::milliseconds(config_.queue.poll_interval_ms),
                          [&]() { return wake_pending_ || stop.load(); });
        wake_pending_ = false;
    }
    LOG_INFO("Supervisor stopped; agent sessions keep running under tmux");
}

void Supervisor::wake() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_pending_ = true;
    }
    wake_cv_.notify_all();
}

std::size_t Supervisor::dispatch() {
    std::size_t launched = 0;
    auto exclude = owned_ticket_ids();
    const std::size_t cap = effective_max_agents();

    while (state_.running_count() < cap) {
        auto next = tickets_.next_ticket(registry_, exclude);
        if (!next) {
            break;
        }
        exclude.insert(next->id);
        ScopedContext context(next->id);

        auto claimed = tickets_.claim_ticket(*next);
        if (core::errors::is_error(claimed)) {
            const auto& err = core::errors::get_error(claimed);
            if (err.code == "already_claimed") {
                LOG_DEBUG("Skipping " + next->id + ": claimed elsewhere");
            } else {
                LOG_WARN("Claim of " + next->id + " failed: " + err.message);
            }
            continue;
        }
        auto started = start_agent(core::errors::get_value(claimed), launcher_.default_options());
        if (!core::errors::is_error(started)) {
            ++launched;
        }
    }
    return launched;
}

core::errors::Result<AgentState> Supervisor::launch_ticket(
    const std::optional<std::string>& ticket_id, const launcher::LaunchOptions& options) {
    std::lock_guard<std::mutex> lock(ops_mutex_);

    const std::size_t cap = effective_max_agents();
    if (state_.running_count() >= cap) {
        return OrchError{ErrorCategory::Precondition,
                         "All " + std::to_string(cap) + " agent slots are busy",
                         "agent_limit_reached",
                         "Wait for an agent to finish or raise agents.max_parallel"};
    }

    const auto owned = owned_ticket_ids();
    queue::Ticket ticket;
    if (ticket_id) {
        auto found = tickets_.find_ticket(*ticket_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        ticket = core::errors::get_value(found);
        if (owned.count(ticket.id) > 0) {
            return OrchError{ErrorCategory::Conflict, "Ticket " + ticket.id + " already has an agent",
                             "agent_exists"};
        }
    } else {
        auto next = tickets_.next_ticket(registry_, owned);
        if (!next) {
            return OrchError{ErrorCategory::NotFound, "No queued tickets to launch", "queue_empty"};
        }
        ticket = *next;
    }

    ScopedContext context(ticket.id);
    if (!in_progress_dir(ticket)) {
        auto claimed = tickets_.claim_ticket(ticket);
        if (core::errors::is_error(claimed)) {
            return core::errors::get_error(claimed);
        }
        ticket = core::errors::get_value(claimed);
    }
    return start_agent(ticket, options);
}

core::errors::Result<AgentState> Supervisor::start_agent(const queue::Ticket& ticket,
                                                         const launcher::LaunchOptions& options) {
    auto launched = launcher_.launch(ticket, options);
    if (core::errors::is_error(launched)) {
        const auto err = core::errors::get_error(launched);
        LOG_ERROR("Launch of " + ticket.id + " failed: " + err.message);
        return_failed_ticket(ticket, "Launch failed: " + err.message);
        notify(NotificationEvent::agent_failed(ticket.project, ticket.id, err.message));
        return err;
    }
    const auto& launch = core::errors::get_value(launched);

    const std::int64_t now = clock_();
    AgentState agent;
    agent.id = launch.agent_id;
    agent.ticket_id = ticket.id;
    agent.ticket_type = ticket.ticket_type;
    agent.project = ticket.project;
    agent.session_name = launch.session_name;
    agent.session_id = launch.session_id;
    agent.current_step = launch.step;
    agent.status = AgentStatus::Running;
    agent.started_at = now;
    agent.last_activity = now;
    agent.step_started_at = now;
    agent.last_content_change = now;
    agent.provider = launch.provider;
    agent.model = launch.model;

    auto added = state_.add_agent(agent);
    if (core::errors::is_error(added)) {
        const auto err = core::errors::get_error(added);
        LOG_ERROR("Unable to track agent for " + ticket.id + ": " + err.message);
        kill_if_present(launch.session_name);
        return_failed_ticket(ticket, "Launch failed: " + err.message);
        return err;
    }

    std::optional<std::string> mode;
    if (options.docker) {
        mode = "docker";
    } else if (options.yolo) {
        mode = "yolo";
    }
    notify(NotificationEvent::agent_started(agent.project, agent.ticket_type, agent.ticket_id,
                                            agent.session_name, mode));
    return agent;
}

void Supervisor::check_agent(const AgentState& snapshot_agent) {
    auto current = state_.find(snapshot_agent.id);
    if (!current) {
        return;
    }
    const AgentState& agent = *current;
    ScopedContext context(agent.ticket_id);
    const std::int64_t now = clock_();

    auto exists = tmux_.session_exists(agent.session_name);
    if (core::errors::is_error(exists)) {
        LOG_WARN("Health check of " + agent.session_name + " failed: " +
                 core::errors::get_error(exists).message);
        return;
    }
    if (!core::errors::get_value(exists)) {
        LOG_WARN("Session " + agent.session_name + " disappeared");
        fail_agent(agent, "Session lost", FailureNotice::SessionLost);
        return;
    }

    auto dead = tmux_.pane_dead(agent.session_name);
    if (core::errors::is_error(dead)) {
        LOG_WARN("Pane state of " + agent.session_name + " unavailable: " +
                 core::errors::get_error(dead).message);
        return;
    }
    if (core::errors::get_value(dead)) {
        // An exit already turned into a review or blocked wait stays put until a human acts.
        if (agent.status == AgentStatus::AwaitingInput && agent.review_payload) {
            return;
        }
        handle_exit(agent);
        return;
    }

    const auto step_timeout = static_cast<std::int64_t>(config_.agents.step_timeout);
    if (step_timeout > 0 && !agent.review_pending && now - agent.step_started_at >= step_timeout) {
        fail_agent(agent, "Step '" + agent.current_step + "' timed out after " +
                              std::to_string(step_timeout) + "s");
        return;
    }

    auto pane = tmux_.capture_pane(agent.session_name);
    if (core::errors::is_error(pane)) {
        LOG_WARN("Capture of " + agent.session_name + " failed: " +
                 core::errors::get_error(pane).message);
        return;
    }
    auto changed = state_.update_content_hash(agent.id, content_hash(core::errors::get_value(pane)),
                                              now);
    if (core::errors::is_error(changed)) {
        LOG_WARN("Unable to record pane activity: " + core::errors::get_error(changed).message);
        return;
    }

    if (core::errors::get_value(changed)) {
        if (agent.status == AgentStatus::AwaitingInput && !agent.review_pending) {
            auto resumed = state_.update_status(agent.id, AgentStatus::Running, now);
            if (core::errors::is_error(resumed)) {
                LOG_WARN(core::errors::get_error(resumed).message);
            }
        }
        return;
    }

    const auto threshold = static_cast<std::int64_t>(config_.agents.silence_threshold);
    if (agent.status == AgentStatus::Running && now - agent.last_content_change >= threshold) {
        auto ticket = tickets_.find_in_progress(agent.ticket_id);
        if (core::errors::is_error(ticket)) {
            LOG_WARN("Silent agent has no in-progress ticket: " +
                     core::errors::get_error(ticket).message);
            return;
        }
        enter_awaiting(agent, core::errors::get_value(ticket),
                       "No output for " + std::to_string(now - agent.last_content_change) + "s",
                       false, std::nullopt);
    }
}

void Supervisor::poll_review(const AgentState& agent) {
    if (!review_checker_) {
        return;
    }
    const std::int64_t now = clock_();
    const auto interval = static_cast<std::int64_t>(config_.api.pr_check_interval_secs);
    const auto polled = review_polled_at_.find(agent.id);
    if (polled != review_polled_at_.end() && now - polled->second < interval) {
        return;
    }
    review_polled_at_[agent.id] = now;

    auto found = tickets_.find_in_progress(agent.ticket_id);
    if (core::errors::is_error(found)) {
        return;
    }
    queue::Ticket ticket = core::errors::get_value(found);
    auto step = engine_.current_step(ticket);
    if (core::errors::is_error(step) || !core::errors::get_value(step).has_output("pr")) {
        return;
    }
    if (!review_checker_(ticket, core::errors::get_value(step))) {
        return;
    }

    ScopedContext context(agent.ticket_id);
    auto history = ticket.append_history("- " + history_timestamp() + " - Step " +
                                         agent.current_step + " approved via pull request");
    if (core::errors::is_error(history)) {
        LOG_WARN(core::errors::get_error(history).message);
        return;
    }
    LOG_INFO("Pull request for " + agent.ticket_id + " approved; advancing");
    review_polled_at_.erase(agent.id);
    advance(agent, ticket, carry_from_payload(agent));
}

void Supervisor::handle_exit(const AgentState& agent) {
    auto pane = tmux_.capture_pane(agent.session_name);
    if (core::errors::is_error(pane)) {
        fail_agent(agent, "Unable to read agent output: " + core::errors::get_error(pane).message);
        return;
    }
    auto parsed = find_last_status_block(core::errors::get_value(pane));
    if (core::errors::is_error(parsed)) {
        LOG_WARN("Agent " + agent.id + " exited without a usable status block: " +
                 core::errors::get_error(parsed).message);
        fail_agent(agent, "Malformed status block");
        return;
    }
    apply_status(agent, core::errors::get_value(parsed));
}

void Supervisor::apply_status(const AgentState& agent, const StatusBlock& block) {
    const std::int64_t now = clock_();
    LOG_INFO("Agent " + agent.id + " reported status=" + block.status +
             " exit_signal=" + (block.exit_signal ? "true" : "false"));

    auto completing = state_.update_status(agent.id, AgentStatus::Completing, now);
    if (core::errors::is_error(completing)) {
        LOG_WARN(core::errors::get_error(completing).message);
    }
    if (block.summary) {
        auto noted = state_.modify(agent.id, [&](AgentState& a) { a.last_message = block.summary; });
        if (core::errors::is_error(noted)) {
            LOG_WARN(core::errors::get_error(noted).message);
        }
    }

    auto found = tickets_.find_in_progress(agent.ticket_id);
    if (core::errors::is_error(found)) {
        fail_agent(agent, "Ticket is no longer in progress");
        return;
    }
    const queue::Ticket& ticket = core::errors::get_value(found);

    if (block.status == "failed") {
        fail_agent(agent, "Agent reported failure" +
                              (block.summary ? ": " + *block.summary : std::string()));
        return;
    }
    if (block.status == "blocked") {
        std::string reason = block.blockers.empty() ? block.summary.value_or("Agent is blocked")
                                                    : core::util::join(block.blockers, ", ");
        enter_awaiting(agent, ticket, reason, false, block);
        return;
    }

    auto proceed = engine_.can_proceed(ticket, review_checker_);
    if (core::errors::is_error(proceed)) {
        fail_agent(agent, core::errors::get_error(proceed).message);
        return;
    }
    if (!core::errors::get_value(proceed)) {
        enter_awaiting(agent, ticket, block.summary.value_or("Review requested"), true, block);
        return;
    }

    const prompt::PreviousStepContext carry{block.summary.value_or(""), block.recommendation};
    if (!block.exit_signal) {
        auto relaunched = relaunch(agent, ticket, carry);
        if (core::errors::is_error(relaunched)) {
            fail_agent(agent, "Relaunch failed: " + core::errors::get_error(relaunched).message);
        }
        return;
    }
    advance(agent, ticket, carry);
}

void Supervisor::advance(const AgentState& agent, queue::Ticket ticket,
                         const std::optional<prompt::PreviousStepContext>& carry) {
    const auto issue_type = registry_.get(ticket.ticket_type);
    if (!issue_type) {
        fail_agent(agent, "Unknown issue type " + ticket.ticket_type);
        return;
    }
    const std::string previous = ticket.step;
    auto next = ticket.advance_step(*issue_type);
    if (core::errors::is_error(next)) {
        fail_agent(agent, core::errors::get_error(next).message);
        return;
    }
    if (!core::errors::get_value(next)) {
        finish_ticket(agent, ticket);
        return;
    }

    LOG_INFO("Ticket " + ticket.id + " step " + (previous.empty() ? agent.current_step : previous) +
             " -> " + *core::errors::get_value(next));
    auto relaunched = relaunch(agent, ticket, carry);
    if (core::errors::is_error(relaunched)) {
        fail_agent(agent, "Launch of step " + ticket.step + " failed: " +
                              core::errors::get_error(relaunched).message);
    }
}

void Supervisor::finish_ticket(const AgentState& agent, const queue::Ticket& ticket) {
    const std::int64_t now = clock_();
    kill_if_present(agent.session_name);

    auto completed = tickets_.complete_ticket(ticket);
    if (core::errors::is_error(completed)) {
        fail_agent(agent, "Unable to complete ticket: " + core::errors::get_error(completed).message);
        return;
    }
    cleanup_worktree(core::errors::get_value(completed));

    auto recorded = state_.complete_agent(agent.id, "completed", now);
    if (core::errors::is_error(recorded)) {
        LOG_WARN(core::errors::get_error(recorded).message);
    }
    LOG_INFO("Ticket " + ticket.id + " completed");
    notify(NotificationEvent::agent_completed(agent.project, agent.ticket_type, agent.ticket_id,
                                              now - agent.started_at));
}

void Supervisor::enter_awaiting(const AgentState& agent, const queue::Ticket& ticket,
                                const std::string& reason, const bool review,
                                const std::optional<StatusBlock>& block) {
    const std::int64_t now = clock_();
    auto status = state_.update_status(agent.id, AgentStatus::AwaitingInput, now);
    if (core::errors::is_error(status)) {
        LOG_WARN(core::errors::get_error(status).message);
        return;
    }
    auto noted = state_.modify(agent.id, [&](AgentState& a) {
        a.review_pending = review;
        a.last_message = reason;
        if (block) {
            a.review_payload = block->to_json();
        }
    });
    if (core::errors::is_error(noted)) {
        LOG_WARN(core::errors::get_error(noted).message);
    }

    std::string step_display = agent.current_step;
    if (const auto issue_type = registry_.get(ticket.ticket_type)) {
        if (const auto* step = issue_type->find_step(agent.current_step)) {
            step_display = step->display();
        }
    }
    queue::Ticket updated = ticket;
    auto history = updated.add_awaiting_entry(step_display);
    if (core::errors::is_error(history)) {
        LOG_WARN("Unable to record awaiting entry: " + core::errors::get_error(history).message);
    }

    if (review) {
        notify(NotificationEvent::agent_review_pending(agent.project, agent.ticket_id,
                                                       agent.current_step, reason));
    } else {
        notify(NotificationEvent::agent_awaiting_input(agent.project, agent.ticket_type,
                                                       agent.ticket_id, reason));
    }
}

core::errors::Status Supervisor::relaunch(const AgentState& agent, const queue::Ticket& ticket,
                                          const std::optional<prompt::PreviousStepContext>& carry) {
    kill_if_present(agent.session_name);
    auto launched = launcher_.launch(ticket, options_for(agent), carry);
    if (core::errors::is_error(launched)) {
        return core::errors::get_error(launched);
    }
    const auto& launch = core::errors::get_value(launched);
    const std::int64_t now = clock_();

    auto updated = state_.modify(agent.id, [&](AgentState& a) {
        a.session_id = launch.session_id;
        a.current_step = launch.step;
        a.step_started_at = now;
        a.last_content_change = now;
        a.content_hash.clear();
        a.review_pending = false;
        a.review_payload.reset();
    });
    if (core::errors::is_error(updated)) {
        return updated;
    }
    auto status = state_.update_status(agent.id, AgentStatus::Running, now);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    LOG_INFO("Relaunched " + ticket.id + " at step " + launch.step);
    return core::errors::ok();
}

void Supervisor::fail_agent(const AgentState& agent, const std::string& reason,
                            const FailureNotice notice) {
    LOG_WARN("Agent " + agent.id + " failed: " + reason);
    kill_if_present(agent.session_name);

    auto ticket = tickets_.find_in_progress(agent.ticket_id);
    if (core::errors::is_error(ticket)) {
        LOG_WARN("No in-progress ticket for " + agent.ticket_id + ": " +
                 core::errors::get_error(ticket).message);
    } else {
        return_failed_ticket(core::errors::get_value(ticket), reason);
    }

    auto recorded = state_.complete_agent(agent.id, "failed", clock_());
    if (core::errors::is_error(recorded)) {
        LOG_WARN(core::errors::get_error(recorded).message);
    }

    if (notice == FailureNotice::SessionLost) {
        notify(NotificationEvent::agent_session_lost(agent.session_name));
        notify(NotificationEvent::ticket_returned(agent.project, agent.ticket_id, reason));
    } else {
        notify(NotificationEvent::agent_failed(agent.project, agent.ticket_id, reason));
    }
}

void Supervisor::return_failed_ticket(const queue::Ticket& ticket, const std::string& reason) {
    queue::Ticket updated = ticket;
    auto history = updated.append_history("- " + history_timestamp() + " - " + reason);
    if (core::errors::is_error(history)) {
        LOG_WARN("Unable to record history for " + ticket.id + ": " +
                 core::errors::get_error(history).message);
    }
    auto returned = tickets_.return_to_queue(updated, "failed");
    if (core::errors::is_error(returned)) {
        LOG_ERROR("Unable to return " + ticket.id + " to the queue: " +
                  core::errors::get_error(returned).message);
    }
}

core::errors::Status Supervisor::approve(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(ops_mutex_);
    auto found = state_.find(agent_id);
    if (!found) {
        return OrchError{ErrorCategory::NotFound, "Agent not found: " + agent_id, "agent_not_found"};
    }
    const AgentState agent = *found;
    if (agent.status != AgentStatus::AwaitingInput) {
        return OrchError{ErrorCategory::Conflict,
                         "Agent " + agent_id + " is " + session::to_string(agent.status) +
                             ", not awaiting input",
                         "agent_not_awaiting"};
    }
    auto ticket = tickets_.find_in_progress(agent.ticket_id);
    if (core::errors::is_error(ticket)) {
        return core::errors::get_error(ticket);
    }
    ScopedContext context(agent.ticket_id);
    const auto carry = carry_from_payload(agent);

    if (agent.review_pending) {
        queue::Ticket approved = core::errors::get_value(ticket);
        auto history = approved.append_history("- " + history_timestamp() + " - Step " +
                                               agent.current_step + " approved");
        if (core::errors::is_error(history)) {
            return history;
        }
        LOG_INFO("Review of " + agent.ticket_id + " (" + agent.current_step + ") approved");
        advance(agent, approved, carry);
        return core::errors::ok();
    }

    auto dead = tmux_.pane_dead(agent.session_name);
    if (!core::errors::is_error(dead) && !core::errors::get_value(dead)) {
        auto resumed = state_.update_status(agent.id, AgentStatus::Running, clock_());
        if (core::errors::is_error(resumed)) {
            return core::errors::get_error(resumed);
        }
        return core::errors::ok();
    }
    return relaunch(agent, core::errors::get_value(ticket), carry);
}

core::errors::Status Supervisor::reject(const std::string& agent_id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(ops_mutex_);
    if (core::util::trim(reason).empty()) {
        return OrchError{ErrorCategory::Input, "A rejection reason is required",
                         "rejection_reason_required"};
    }
    auto found = state_.find(agent_id);
    if (!found) {
        return OrchError{ErrorCategory::NotFound, "Agent not found: " + agent_id, "agent_not_found"};
    }
    const AgentState agent = *found;
    auto located = tickets_.find_in_progress(agent.ticket_id);
    if (core::errors::is_error(located)) {
        return core::errors::get_error(located);
    }
    queue::Ticket ticket = core::errors::get_value(located);
    ScopedContext context(agent.ticket_id);

    auto rejection = engine_.render_rejection_prompt(ticket, reason);
    if (core::errors::is_error(rejection)) {
        return core::errors::get_error(rejection);
    }
    const auto& target = core::errors::get_value(rejection);
    if (!target) {
        return OrchError{ErrorCategory::Precondition,
                         "Step '" + agent.current_step + "' has no rejection target",
                         "no_rejection_path"};
    }

    auto moved = ticket.set_step(target->goto_step);
    if (core::errors::is_error(moved)) {
        return moved;
    }
    auto history = ticket.append_history("- " + history_timestamp() + " - Rejected at " +
                                         agent.current_step + ": " + reason);
    if (core::errors::is_error(history)) {
        return history;
    }
    LOG_INFO("Ticket " + ticket.id + " rejected; step " + agent.current_step + " -> " +
             target->goto_step);

    auto relaunched = relaunch(agent, ticket, prompt::PreviousStepContext{target->prompt, std::nullopt});
    if (core::errors::is_error(relaunched)) {
        fail_agent(agent, "Relaunch after rejection failed: " +
                              core::errors::get_error(relaunched).message);
        return relaunched;
    }
    return core::errors::ok();
}

core::errors::Status Supervisor::complete_step(const std::string& ticket_id,
                                               const std::string& step) {
    std::lock_guard<std::mutex> lock(ops_mutex_);
    auto found = state_.find_by_ticket(ticket_id);
    if (!found) {
        return OrchError{ErrorCategory::NotFound, "No agent is working on " + ticket_id,
                         "agent_not_found"};
    }
    if (found->current_step != step) {
        return OrchError{ErrorCategory::Conflict,
                         "Ticket " + ticket_id + " is at step '" + found->current_step +
                             "', not '" + step + "'",
                         "step_mismatch"};
    }
    ScopedContext context(ticket_id);
    StatusBlock block;
    block.status = "complete";
    block.exit_signal = true;
    block.summary = "Step " + step + " reported complete";
    apply_status(*found, block);
    return core::errors::ok();
}

core::errors::Status Supervisor::reconcile_on_startup() {
    std::lock_guard<std::mutex> lock(ops_mutex_);
    last_sweep_ = clock_();
    return reconcile_sessions("Session ended while operator was not running");
}

core::errors::Status Supervisor::reconcile_sessions(const std::string& lost_reason) {
    auto available = tmux_.check_available();
    if (core::errors::is_error(available)) {
        return core::errors::get_error(available);
    }

    std::set<std::string> tracked;
    for (const auto& agent : state_.snapshot().agents) {
        ScopedContext context(agent.ticket_id);
        auto exists = tmux_.session_exists(agent.session_name);
        if (core::errors::is_error(exists)) {
            return core::errors::get_error(exists);
        }
        if (!core::errors::get_value(exists)) {
            fail_agent(agent, lost_reason);
            continue;
        }
        auto ticket = tickets_.find_in_progress(agent.ticket_id);
        if (core::errors::is_error(ticket)) {
            LOG_WARN("Dropping agent " + agent.id + ": ticket is no longer in progress");
            auto dropped = state_.complete_agent(agent.id, "failed", clock_());
            if (core::errors::is_error(dropped)) {
                LOG_WARN(core::errors::get_error(dropped).message);
            }
            continue;
        }
        tracked.insert(agent.session_name);
    }

    const std::string& prefix = config_.tmux.session_prefix;
    auto sessions = tmux_.list_sessions(prefix);
    if (core::errors::is_error(sessions)) {
        return core::errors::get_error(sessions);
    }
    for (const auto& live : core::errors::get_value(sessions)) {
        if (tracked.count(live.name) > 0 || live.name.size() <= prefix.size()) {
            continue;
        }
        const std::string ticket_id = live.name.substr(prefix.size());
        auto ticket = tickets_.find_in_progress(ticket_id);
        if (core::errors::is_error(ticket)) {
            LOG_DEBUG("Ignoring session " + live.name + ": no in-progress ticket " + ticket_id);
            continue;
        }
        const auto& t = core::errors::get_value(ticket);
        std::string step = t.step;
        if (step.empty()) {
            if (const auto issue_type = registry_.get(t.ticket_type)) {
                if (const auto* first = issue_type->first_step()) {
                    step = first->name;
                }
            }
        }

        const std::int64_t now = clock_();
        AgentState adopted;
        adopted.id = core::config::generate_agent_id();
        adopted.ticket_id = t.id;
        adopted.ticket_type = t.ticket_type;
        adopted.project = t.project;
        adopted.session_name = live.name;
        adopted.session_id = t.session_id(step).value_or("");
        adopted.current_step = step;
        adopted.started_at = now;
        adopted.last_activity = now;
        adopted.step_started_at = now;
        adopted.last_content_change = now;
        auto added = state_.add_agent(adopted);
        if (core::errors::is_error(added)) {
            LOG_WARN("Unable to adopt " + live.name + ": " + core::errors::get_error(added).message);
            continue;
        }
        LOG_INFO("Adopted orphan session " + live.name + " as " + adopted.id);
    }
    return core::errors::ok();
}

core::errors::Status Supervisor::pause() {
    return state_.set_paused(true);
}

core::errors::Status Supervisor::resume() {
    auto resumed = state_.set_paused(false);
    wake();
    return resumed;
}

void Supervisor::kill_if_present(const std::string& session_name) {
    auto exists = tmux_.session_exists(session_name);
    if (core::errors::is_error(exists) || !core::errors::get_value(exists)) {
        return;
    }
    auto killed = tmux_.kill_session(session_name);
    if (core::errors::is_error(killed)) {
        LOG_WARN("Unable to kill " + session_name + ": " + core::errors::get_error(killed).message);
    }
}

void Supervisor::cleanup_worktree(const queue::Ticket& ticket) {
    if (!config_.git.cleanup_on_complete || worktrees_ == nullptr || !ticket.worktree_path) {
        return;
    }
    auto repo = launcher_.project_directory(ticket, launcher::LaunchOptions{});
    if (core::errors::is_error(repo)) {
        LOG_WARN("Worktree kept: " + core::errors::get_error(repo).message);
        return;
    }
    git::WorktreeInfo info;
    info.path = *ticket.worktree_path;
    info.branch = ticket.branch.value_or("");
    info.repo_path = core::errors::get_value(repo);
    // The branch stays for the pull request.
    auto cleaned = worktrees_->cleanup_worktree(info, false, false);
    if (core::errors::is_error(cleaned)) {
        LOG_WARN("Worktree cleanup for " + ticket.id + " failed: " +
                 core::errors::get_error(cleaned).message);
    }
}

void Supervisor::notify(const NotificationEvent& event) const {
    if (dispatcher_ != nullptr) {
        dispatcher_->notify(event);
    }
}

std::string Supervisor::history_timestamp() const {
    return core::util::format_local(clock_(), "%Y-%m-%d %H:%M:%S");
}

std::set<std::string> Supervisor::owned_ticket_ids() const {
    std::set<std::string> ids;
    for (const auto& agent : state_.snapshot().agents) {
        ids.insert(agent.ticket_id);
    }
    return ids;
}

launcher::LaunchOptions Supervisor::options_for(const AgentState& agent) const {
    auto options = launcher_.default_options();
    if (!agent.provider.empty()) {
        options.provider = agent.provider;
    }
    if (!agent.model.empty()) {
        options.model = agent.model;
    }
    return options;
}

}  // namespace orch::supervisor
