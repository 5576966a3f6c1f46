#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include "core/config/config.hpp"
#include "core/errors/orch_errors.hpp"
#include "git/worktree_manager.hpp"
#include "issuetypes/registry.hpp"
#include "launcher/launcher.hpp"
#include "launcher/tmux_client.hpp"
#include "notifications/dispatcher.hpp"
#include "prompt/prompt_composer.hpp"
#include "queue/ticket_store.hpp"
#include "session/state_store.hpp"
#include "supervisor/status_parser.hpp"
#include "workflow/workflow_engine.hpp"

namespace orch::supervisor {

// Epoch seconds; replaced in tests.
using Clock = std::function<std::int64_t()>;

struct IterationReport {
    std::size_t launched = 0;
    std::size_t checked = 0;
    bool dispatch_skipped = false;
};

// Owns the agent set: claims queued tickets up to the parallelism cap,
// watches each tmux session and drives the ticket through its workflow
// when the agent exits. A failure is confined to its ticket.
class Supervisor {
public:
    Supervisor(core::config::Config config, const issuetypes::IssueTypeRegistry& registry,
               queue::TicketStore& tickets, session::StateStore& state, launcher::Launcher& launcher,
               launcher::TmuxClient& tmux, const notifications::Dispatcher* dispatcher = nullptr,
               const git::WorktreeManager* worktrees = nullptr, std::size_t cpu_count = 0);

    void set_clock(Clock clock);
    void set_review_checker(workflow::ReviewChecker checker);

    std::size_t effective_max_agents() const;

    // Dispatch (unless paused) followed by a health check of every agent.
    // Agents waiting on a pull request review poll the review checker every
    // api.pr_check_interval_secs; live untracked sessions are swept up every
    // agents.health_check_interval seconds (0 disables the sweep).
    IterationReport run_iteration();
    // Iterates every poll interval until stop is set; wake() cuts a wait short.
    void run(const std::atomic_bool& stop);
    void wake();

    // Launches the given ticket, or the next one by priority.
    core::errors::Result<session::AgentState> launch_ticket(
        const std::optional<std::string>& ticket_id, const launcher::LaunchOptions& options);

    core::errors::Status approve(const std::string& agent_id);
    core::errors::Status reject(const std::string& agent_id, const std::string& reason);
    // Out-of-band "step done" signal; behaves like a complete status block.
    core::errors::Status complete_step(const std::string& ticket_id, const std::string& step);

    // Fails agents whose session is gone and adopts live op-* sessions of
    // in-progress tickets nobody tracks.
    core::errors::Status reconcile_on_startup();

    core::errors::Status pause();
    core::errors::Status resume();
    bool paused() const { return state_.paused(); }

    session::StateSnapshot snapshot() const { return state_.snapshot(); }

private:
    std::size_t dispatch();
    void check_agent(const session::AgentState& agent);
    void poll_review(const session::AgentState& agent);
    void handle_exit(const session::AgentState& agent);
    void apply_status(const session::AgentState& agent, const StatusBlock& block);
    void advance(const session::AgentState& agent, queue::Ticket ticket,
                 const std::optional<prompt::PreviousStepContext>& carry);
    void finish_ticket(const session::AgentState& agent, const queue::Ticket& ticket);
    void enter_awaiting(const session::AgentState& agent, const queue::Ticket& ticket,
                        const std::string& reason, bool review,
                        const std::optional<StatusBlock>& block);
    core::errors::Status relaunch(const session::AgentState& agent, const queue::Ticket& ticket,
                                  const std::optional<prompt::PreviousStepContext>& carry);
    core::errors::Status reconcile_sessions(const std::string& lost_reason);
    core::errors::Result<session::AgentState> start_agent(
        const queue::Ticket& ticket, const launcher::LaunchOptions& options);

    enum class FailureNotice { AgentFailed, SessionLost };
    void fail_agent(const session::AgentState& agent, const std::string& reason,
                    FailureNotice notice = FailureNotice::AgentFailed);
    void return_failed_ticket(const queue::Ticket& ticket, const std::string& reason);

    void kill_if_present(const std::string& session_name);
    void cleanup_worktree(const queue::Ticket& ticket);
    void notify(const notifications::NotificationEvent& event) const;
    std::string history_timestamp() const;
    std::set<std::string> owned_ticket_ids() const;
    launcher::LaunchOptions options_for(const session::AgentState& agent) const;

    core::config::Config config_;
    const issuetypes::IssueTypeRegistry& registry_;
    queue::TicketStore& tickets_;
    session::StateStore& state_;
    launcher::Launcher& launcher_;
    launcher::TmuxClient& tmux_;
    const notifications::Dispatcher* dispatcher_;
    const git::WorktreeManager* worktrees_;
    std::size_t cpu_count_;
    workflow::WorkflowEngine engine_;
    workflow::ReviewChecker review_checker_;
    Clock clock_;
    std::map<std::string, std::int64_t> review_polled_at_;
    std::optional<std::int64_t> last_sweep_;

    std::mutex ops_mutex_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool wake_pending_ = false;
    bool tmux_warned_ = false;
};

}  // namespace orch::supervisor
