#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <regex>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/ids.hpp"
#include "core/config/paths.hpp"
#include "issuetypes/registry.hpp"
#include "launcher/launcher.hpp"
#include "mock_tmux_client.hpp"
#include "notifications/dispatcher.hpp"
#include "queue/ticket_store.hpp"
#include "session/state_store.hpp"
#include "supervisor/supervisor.hpp"

namespace {

using orch::core::config::Config;
using orch::core::config::LlmToolConfig;
using orch::core::config::OperatorPaths;
using orch::core::errors::get_error;
using orch::core::errors::get_value;
using orch::core::errors::is_error;
using orch::core::errors::Status;
using orch::issuetypes::IssueTypeRegistry;
using orch::launcher::Launcher;
using orch::notifications::DispatchMode;
using orch::notifications::Dispatcher;
using orch::notifications::NotificationEvent;
using orch::notifications::NotificationSink;
using orch::queue::Ticket;
using orch::queue::TicketStore;
using orch::session::AgentState;
using orch::session::AgentStatus;
using orch::session::StateStore;
using orch::supervisor::Supervisor;
using orch::test_support::MockTmuxClient;

const char* kCompleteBlock =
    "---OPERATOR_STATUS--- status: complete exit_signal: true ---END_OPERATOR_STATUS---";

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::temp_directory_path() /
                ("orch_supervisor_" + orch::core::config::generate_uuid());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

class RecordingSink : public NotificationSink {
public:
    std::string name() const override { return "recording"; }
    bool enabled() const override { return true; }
    bool handles_event(const NotificationEvent&) const override { return true; }
    Status send(const NotificationEvent& event) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event.type);
        return orch::core::errors::ok();
    }

    bool saw(const std::string& type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::find(events_.begin(), events_.end(), type) != events_.end();
    }

private:
    mutable std::mutex mutex_;
    mutable std::vector<std::string> events_;
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

class SupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.llm_tools.auto_detect = false;
        LlmToolConfig claude;
        claude.name = "claude";
        claude.path = "/usr/local/bin/claude";
        claude.model_flag = "";
        config_.llm_tools.detected.push_back(claude);
        config_.agents.max_parallel = 2;
        config_.agents.silence_threshold = 30;
        config_.agents.step_timeout = 1800;

        paths_ = OperatorPaths::resolve(workspace_.root(), config_);
        ASSERT_FALSE(is_error(paths_.ensure_directories()));
        std::filesystem::create_directories(workspace_.root() / "demo");

        store_ = std::make_unique<TicketStore>(paths_.tickets);
        state_ = std::make_unique<StateStore>(paths_.state_file);
        launcher_ = std::make_unique<Launcher>(config_, paths_, registry_, tmux_);
        recorder_ = std::make_shared<RecordingSink>();
        dispatcher_.add_sink(recorder_);
        supervisor_ = std::make_unique<Supervisor>(config_, registry_, *store_, *state_, *launcher_,
                                                   tmux_, &dispatcher_, nullptr, 4);
        supervisor_->set_clock([this]() { return now_; });
    }

    void write_ticket(const std::string& dir, const std::string& filename, const std::string& id,
                      const std::string& status, const std::string& step = "") {
        std::ofstream out(paths_.tickets / dir / filename);
        out << "---\n"
            << "id: " << id << "\n"
            << "priority: P2-medium\n"
            << "status: " << status << "\n";
        if (!step.empty()) {
            out << "step: " << step << "\n";
        }
        out << "---\n\n# " << id << ": demo work\n";
    }

    Ticket load(const std::string& dir, const std::string& filename) {
        auto ticket = Ticket::from_file(paths_.tickets / dir / filename);
        EXPECT_FALSE(is_error(ticket));
        return get_value(ticket);
    }

    std::string agent_id_for(const std::string& ticket_id) {
        auto agent = state_->find_by_ticket(ticket_id);
        return agent ? agent->id : "";
    }

    bool any_prompt_contains(const std::string& needle) {
        for (const auto& entry : std::filesystem::directory_iterator(paths_.prompts)) {
            if (read_file(entry.path()).find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    TempWorkspace workspace_;
    Config config_;
    OperatorPaths paths_;
    IssueTypeRegistry registry_;
    MockTmuxClient tmux_;
    std::unique_ptr<TicketStore> store_;
    std::unique_ptr<StateStore> state_;
    std::unique_ptr<Launcher> launcher_;
    Dispatcher dispatcher_{true, DispatchMode::Inline};
    std::shared_ptr<RecordingSink> recorder_;
    std::unique_ptr<Supervisor> supervisor_;
    std::int64_t now_ = 1000;
};

TEST_F(SupervisorTest, ClaimLaunchComplete) {
    write_ticket("queue", "20241221-1200-TASK-demo-x.md", "TASK-1", "queued");

    auto first = supervisor_->run_iteration();
    EXPECT_EQ(first.launched, 1u);
    EXPECT_TRUE(std::filesystem::exists(paths_.in_progress / "20241221-1200-TASK-demo-x.md"));
    ASSERT_TRUE(state_->find_by_ticket("TASK-1").has_value());
    ASSERT_TRUE(tmux_.session("op-TASK-1").has_value());
    EXPECT_TRUE(recorder_->saw("agent.started"));

    tmux_.finish("op-TASK-1", kCompleteBlock);
    supervisor_->run_iteration();

    const auto done = paths_.completed / "20241221-1200-TASK-demo-x.md";
    ASSERT_TRUE(std::filesystem::exists(done));
    EXPECT_EQ(load("completed", "20241221-1200-TASK-demo-x.md").status, "completed");
    EXPECT_FALSE(state_->find_by_ticket("TASK-1").has_value());
    EXPECT_FALSE(tmux_.session("op-TASK-1").has_value());
    EXPECT_TRUE(recorder_->saw("agent.completed"));
    ASSERT_EQ(state_->snapshot().completed.size(), 1u);
    EXPECT_EQ(state_->snapshot().completed[0].outcome, "completed");
}

TEST_F(SupervisorTest, ReviewGateHoldsUntilApproved) {
    write_ticket("queue", "20241221-1000-FEAT-demo-y.md", "FEAT-1", "queued", "plan");
    supervisor_->run_iteration();
    const std::string agent_id = agent_id_for("FEAT-1");
    ASSERT_FALSE(agent_id.empty());

    tmux_.finish("op-FEAT-1", kCompleteBlock);
    supervisor_->run_iteration();
    supervisor_->run_iteration();

    auto agent = state_->find(agent_id);
    ASSERT_TRUE(agent.has_value());
    EXPECT_EQ(agent->status, AgentStatus::AwaitingInput);
    EXPECT_TRUE(agent->review_pending);
    EXPECT_TRUE(recorder_->saw("agent.review_pending"));
    EXPECT_EQ(load("in-progress", "20241221-1000-FEAT-demo-y.md").step, "plan");
    EXPECT_EQ(tmux_.created().size(), 1u);

    ASSERT_FALSE(is_error(supervisor_->approve(agent_id)));
    EXPECT_EQ(load("in-progress", "20241221-1000-FEAT-demo-y.md").step, "implement");
    EXPECT_EQ(tmux_.created().size(), 2u);
    agent = state_->find(agent_id);
    ASSERT_TRUE(agent.has_value());
    EXPECT_EQ(agent->current_step, "implement");
    EXPECT_EQ(agent->status, AgentStatus::Running);
    EXPECT_FALSE(agent->review_pending);
}

TEST_F(SupervisorTest, RejectionRelaunchesWithReason) {
    write_ticket("queue", "20241221-1000-FEAT-demo-y.md", "FEAT-1", "queued", "plan");
    supervisor_->run_iteration();
    tmux_.finish("op-FEAT-1", kCompleteBlock);
    supervisor_->run_iteration();
    const std::string agent_id = agent_id_for("FEAT-1");

    ASSERT_FALSE(is_error(supervisor_->reject(agent_id, "scope too large")));

    const auto ticket = load("in-progress", "20241221-1000-FEAT-demo-y.md");
    EXPECT_EQ(ticket.step, "plan");
    EXPECT_NE(ticket.body.find("Rejected at plan: scope too large"), std::string::npos);
    EXPECT_EQ(tmux_.created().size(), 2u);
    EXPECT_TRUE(any_prompt_contains("The plan was rejected: scope too large"));
    EXPECT_EQ(state_->find(agent_id)->status, AgentStatus::Running);

    auto empty = supervisor_->reject(agent_id, "  ");
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "rejection_reason_required");
}

TEST_F(SupervisorTest, MalformedStatusBlockReturnsTicket) {
    write_ticket("queue", "20241221-1200-TASK-demo-x.md", "TASK-1", "queued");
    supervisor_->run_iteration();
    tmux_.finish("op-TASK-1",
                 "---OPERATOR_STATUS--- exit_signal: true ---END_OPERATOR_STATUS---");
    supervisor_->run_iteration();

    ASSERT_TRUE(std::filesystem::exists(paths_.queue / "20241221-1200-TASK-demo-x.md"));
    const auto ticket = load("queue", "20241221-1200-TASK-demo-x.md");
    EXPECT_EQ(ticket.status, "failed");
    const std::regex entry(R"(- \d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} - Malformed status block)");
    EXPECT_TRUE(std::regex_search(ticket.body, entry)) << ticket.body;
    EXPECT_TRUE(recorder_->saw("agent.failed"));
    EXPECT_FALSE(state_->find_by_ticket("TASK-1").has_value());

    // Failed tickets are not picked up again automatically.
    EXPECT_EQ(supervisor_->run_iteration().launched, 0u);
}

TEST_F(SupervisorTest, ReportedFailureRecordsSummary) {
    write_ticket("queue", "20241221-1200-TASK-demo-x.md", "TASK-1", "queued");
    supervisor_->run_iteration();
    tmux_.finish("op-TASK-1",
                 "---OPERATOR_STATUS---\nstatus: failed\nexit_signal: false\n"
                 "summary: tests broke\n---END_OPERATOR_STATUS---\n");
    supervisor_->run_iteration();

    const auto ticket = load("queue", "20241221-1200-TASK-demo-x.md");
    EXPECT_EQ(ticket.status, "failed");
    EXPECT_NE(ticket.body.find("Agent reported failure: tests broke"), std::string::npos);
}

TEST_F(SupervisorTest, UnfinishedStepRelaunchesWithCarry) {
    write_ticket("queue", "20241221-1200-FIX-demo-z.md", "FIX-1", "queued");
    supervisor_->run_iteration();
    tmux_.finish("op-FIX-1",
                 "---OPERATOR_STATUS---\nstatus: in_progress\nexit_signal: false\n"
                 "summary: found the null deref in parser\n---END_OPERATOR_STATUS---\n");
    supervisor_->run_iteration();

    EXPECT_EQ(tmux_.created().size(), 2u);
    EXPECT_EQ(tmux_.killed().size(), 1u);
    auto agent = state_->find_by_ticket("FIX-1");
    ASSERT_TRUE(agent.has_value());
    EXPECT_EQ(agent->current_step, "investigate");
    EXPECT_EQ(agent->status, AgentStatus::Running);
    EXPECT_TRUE(any_prompt_contains("found the null deref in parser"));
}

TEST_F(SupervisorTest, SilenceMovesToAwaitingAndBack) {
    write_ticket("queue", "20241221-1200-TASK-demo-x.md", "TASK-1", "queued");
    supervisor_->run_iteration();
    tmux_.set_content("op-TASK-1", "thinking...");

    now_ += 5;
    supervisor_->run_iteration();
    EXPECT_EQ(state_->find_by_ticket("TASK-1")->status, AgentStatus::Running);

    now_ += 31;
    supervisor_->run_iteration();
    EXPECT_EQ(state_->find_by_ticket("TASK-1")->status, AgentStatus::AwaitingInput);
    EXPECT_TRUE(recorder_->saw("agent.awaiting_input"));
    EXPECT_NE(load("in-progress", "20241221-1200-TASK-demo-x.md").body.find("Moved to AWAITING"),
              std::string::npos);

    tmux_.set_content("op-TASK-1", "thinking...\n> continue please");
    now_ += 1;
    supervisor_->run_iteration();
    EXPECT_EQ(state_->find_by_ticket("TASK-1")->status, AgentStatus::Running);
}

TEST_F(SupervisorTest, StepTimeoutFailsAgent) {
    write_ticket("queue", "20241221-1200-TASK-demo-x.md", "TASK-1", "queued");
    supervisor_->run_iteration();

    now_ += 1800;
    supervisor_->run_iteration();

    EXPECT_FALSE(state_->find_by_ticket("TASK-1").has_value());
    EXPECT_FALSE(tmux_.session("op-TASK-1").has_value());
    EXPECT_EQ(load("queue", "20241221-1200-TASK-demo-x.md").status, "failed");
    EXPECT_TRUE(recorder_->saw("agent.failed"));
}

TEST_F(SupervisorTest, LostSessionReturnsTicket) {
    write_ticket("queue", "20241221-1200-TASK-demo-x.md", "TASK-1", "queued");
    supervisor_->run_iteration();
    tmux_.drop("op-TASK-1");
    supervisor_->run_iteration();

    EXPECT_FALSE(state_->find_by_ticket("TASK-1").has_value());
    EXPECT_EQ(load("queue", "20241221-1200-TASK-demo-x.md").status, "failed");
    EXPECT_TRUE(recorder_->saw("agent.session_lost"));
    EXPECT_TRUE(recorder_->saw("ticket.returned"));
}

TEST_F(SupervisorTest, ParallelismCapLimitsDispatch) {
    write_ticket("queue", "20241221-1000-TASK-demo-a.md", "TASK-1", "queued");
    write_ticket("queue", "20241221-1100-TASK-demo-b.md", "TASK-2", "queued");
    write_ticket("queue", "20241221-1200-TASK-demo-c.md", "TASK-3", "queued");

    EXPECT_EQ(supervisor_->effective_max_agents(), 2u);
    EXPECT_EQ(supervisor_->run_iteration().launched, 2u);
    EXPECT_EQ(state_->running_count(), 2u);
    EXPECT_TRUE(std::filesystem::exists(paths_.queue / "20241221-1200-TASK-demo-c.md"));

    auto manual = supervisor_->launch_ticket(std::string("TASK-3"),
                                             launcher_->default_options());
    ASSERT_TRUE(is_error(manual));
    EXPECT_EQ(get_error(manual).code, "agent_limit_reached");
}

TEST_F(SupervisorTest, PauseAndMissingTmuxSkipDispatch) {
    write_ticket("queue", "20241221-1200-TASK-demo-x.md", "TASK-1", "queued");

    ASSERT_FALSE(is_error(supervisor_->pause()));
    auto paused = supervisor_->run_iteration();
    EXPECT_TRUE(paused.dispatch_skipped);
    EXPECT_EQ(paused.launched, 0u);

    ASSERT_FALSE(is_error(supervisor_->resume()));
    tmux_.installed = false;
    EXPECT_TRUE(supervisor_->run_iteration().dispatch_skipped);
    EXPECT_TRUE(std::filesystem::exists(paths_.queue / "20241221-1200-TASK-demo-x.md"));

    tmux_.installed = true;
    EXPECT_EQ(supervisor_->run_iteration().launched, 1u);
}

TEST_F(SupervisorTest, ManualLaunchAndOutOfBandCompletion) {
    write_ticket("queue", "20241221-1200-TASK-demo-x.md", "TASK-1", "queued");
    auto launched = supervisor_->launch_ticket(std::nullopt, launcher_->default_options());
    ASSERT_FALSE(is_error(launched));
    EXPECT_EQ(get_value(launched).ticket_id, "TASK-1");

    auto wrong = supervisor_->complete_step("TASK-1", "review");
    ASSERT_TRUE(is_error(wrong));
    EXPECT_EQ(get_error(wrong).code, "step_mismatch");

    ASSERT_FALSE(is_error(supervisor_->complete_step("TASK-1", "execute")));
    EXPECT_TRUE(std::filesystem::exists(paths_.completed / "20241221-1200-TASK-demo-x.md"));

    auto empty = supervisor_->launch_ticket(std::nullopt, launcher_->default_options());
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "queue_empty");
}

TEST_F(SupervisorTest, ReconcileFailsOrphansAndAdoptsSessions) {
    write_ticket("in-progress", "20241221-1200-TASK-demo-x.md", "TASK-1", "in-progress");
    write_ticket("in-progress", "20241221-1300-FIX-demo-z.md", "FIX-2", "in-progress");

    AgentState stale;
    stale.id = "agent-stale";
    stale.ticket_id = "TASK-1";
    stale.ticket_type = "TASK";
    stale.project = "demo";
    stale.session_name = "op-TASK-1";
    stale.current_step = "execute";
    ASSERT_FALSE(is_error(state_->add_agent(stale)));
    tmux_.add_session("op-FIX-2");
    tmux_.add_session("unrelated");

    ASSERT_FALSE(is_error(supervisor_->reconcile_on_startup()));

    EXPECT_FALSE(state_->find("agent-stale").has_value());
    EXPECT_EQ(load("queue", "20241221-1200-TASK-demo-x.md").status, "failed");
    auto adopted = state_->find_by_session("op-FIX-2");
    ASSERT_TRUE(adopted.has_value());
    EXPECT_EQ(adopted->ticket_id, "FIX-2");
    EXPECT_EQ(adopted->current_step, "investigate");
    EXPECT_EQ(state_->snapshot().agents.size(), 1u);
}

TEST_F(SupervisorTest, PullRequestApprovalAdvancesWaitingReview) {
    auto prrev = *registry_.get("FEAT");
    prrev.key = "PRREV";
    prrev.source = orch::issuetypes::IssueTypeSource::user();
    prrev.steps.back().requires_review = true;
    ASSERT_FALSE(is_error(registry_.register_type(prrev)));

    int checks = 0;
    bool approved = false;
    supervisor_->set_review_checker(
        [&](const Ticket& ticket, const orch::issuetypes::StepSchema& step) {
            ++checks;
            EXPECT_EQ(ticket.id, "PRREV-1");
            EXPECT_EQ(step.name, "pr");
            return approved;
        });

    write_ticket("queue", "20241221-1000-PRREV-demo-y.md", "PRREV-1", "queued", "pr");
    supervisor_->run_iteration();
    tmux_.finish("op-PRREV-1", kCompleteBlock);
    supervisor_->run_iteration();
    const auto agent = state_->find_by_ticket("PRREV-1");
    ASSERT_TRUE(agent.has_value());
    EXPECT_TRUE(agent->review_pending);
    const int after_exit = checks;
    EXPECT_GE(after_exit, 1);

    // Polls are spaced by pr_check_interval_secs.
    now_ += 10;
    supervisor_->run_iteration();
    EXPECT_EQ(checks, after_exit);

    approved = true;
    now_ += 60;
    supervisor_->run_iteration();
    EXPECT_EQ(checks, after_exit + 1);
    ASSERT_TRUE(std::filesystem::exists(paths_.completed / "20241221-1000-PRREV-demo-y.md"));
    EXPECT_NE(load("completed", "20241221-1000-PRREV-demo-y.md")
                  .body.find("Step pr approved via pull request"),
              std::string::npos);
    EXPECT_FALSE(state_->find_by_ticket("PRREV-1").has_value());
}

TEST_F(SupervisorTest, SweepAdoptsSessionsStartedElsewhere) {
    supervisor_->run_iteration();
    write_ticket("in-progress", "20241221-1300-FIX-demo-z.md", "FIX-2", "in-progress");
    tmux_.add_session("op-FIX-2");

    now_ += 10;
    supervisor_->run_iteration();
    EXPECT_FALSE(state_->find_by_session("op-FIX-2").has_value());

    now_ += 30;
    supervisor_->run_iteration();
    auto adopted = state_->find_by_session("op-FIX-2");
    ASSERT_TRUE(adopted.has_value());
    EXPECT_EQ(adopted->ticket_id, "FIX-2");
    EXPECT_EQ(adopted->status, AgentStatus::Running);
}

TEST(SupervisorCapTest, ReservedCoresFloorAtOne) {
    Config config;
    config.agents.max_parallel = 5;
    config.agents.cores_reserved = 4;
    EXPECT_EQ(config.effective_max_agents(2), 1u);
    EXPECT_EQ(config.effective_max_agents(8), 4u);
}

}  // namespace
