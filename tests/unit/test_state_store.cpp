#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/ids.hpp"
#include "session/state_store.hpp"

namespace {

using orch::core::errors::get_error;
using orch::core::errors::get_value;
using orch::core::errors::is_error;
using orch::session::AgentState;
using orch::session::AgentStatus;
using orch::session::StateStore;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::temp_directory_path() /
                ("orch_state_" + orch::core::config::generate_uuid());
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

AgentState make_agent(const std::string& id, const std::string& ticket_id) {
    AgentState agent;
    agent.id = id;
    agent.ticket_id = ticket_id;
    agent.ticket_type = "TASK";
    agent.project = "demo";
    agent.session_name = "op-" + ticket_id;
    agent.session_id = "0b8a8f1e-0000-4000-8000-000000000001";
    agent.current_step = "execute";
    agent.started_at = 100;
    agent.step_started_at = 100;
    agent.last_activity = 100;
    return agent;
}

TEST(StateStoreTest, MissingFileLoadsEmpty) {
    TempWorkspace ws;
    StateStore store(ws.root() / "state.json");
    ASSERT_FALSE(is_error(store.load()));
    EXPECT_EQ(store.running_count(), 0u);
    EXPECT_FALSE(store.paused());
}

TEST(StateStoreTest, MutationsPersistAcrossReload) {
    TempWorkspace ws;
    const auto path = ws.root() / "operator" / "state.json";
    {
        StateStore store(path);
        ASSERT_FALSE(is_error(store.add_agent(make_agent("agent-1", "TASK-1"))));
        ASSERT_FALSE(is_error(store.modify("agent-1", [](AgentState& agent) {
            agent.last_message = "waiting on review";
            agent.review_pending = true;
            agent.review_payload = nlohmann::json{{"summary", "Plan ready"}};
        })));
        ASSERT_FALSE(is_error(store.set_paused(true)));
    }

    StateStore reloaded(path);
    ASSERT_FALSE(is_error(reloaded.load()));
    EXPECT_TRUE(reloaded.paused());
    auto agent = reloaded.find_by_ticket("TASK-1");
    ASSERT_TRUE(agent.has_value());
    EXPECT_EQ(agent->id, "agent-1");
    EXPECT_EQ(agent->session_name, "op-TASK-1");
    EXPECT_EQ(agent->last_message.value_or(""), "waiting on review");
    EXPECT_TRUE(agent->review_pending);
    ASSERT_TRUE(agent->review_payload.has_value());
    EXPECT_EQ((*agent->review_payload)["summary"], "Plan ready");
}

TEST(StateStoreTest, SecondAgentForTicketConflicts) {
    TempWorkspace ws;
    StateStore store(ws.root() / "state.json");
    ASSERT_FALSE(is_error(store.add_agent(make_agent("agent-1", "TASK-1"))));
    auto dup = store.add_agent(make_agent("agent-2", "TASK-1"));
    ASSERT_TRUE(is_error(dup));
    EXPECT_EQ(get_error(dup).code, "agent_exists");
}

TEST(StateStoreTest, UpdateStatusAndLookups) {
    TempWorkspace ws;
    StateStore store(ws.root() / "state.json");
    ASSERT_FALSE(is_error(store.add_agent(make_agent("agent-1", "TASK-1"))));
    ASSERT_FALSE(is_error(store.add_agent(make_agent("agent-2", "FIX-2"))));

    auto status = store.update_status("agent-2", AgentStatus::AwaitingInput, 150);
    ASSERT_FALSE(is_error(status));
    EXPECT_EQ(get_value(status), AgentStatus::AwaitingInput);
    EXPECT_EQ(store.find("agent-2")->last_activity, 150);
    EXPECT_EQ(store.find_by_session("op-FIX-2")->id, "agent-2");

    ASSERT_FALSE(is_error(store.update_status("agent-1", AgentStatus::Failed, 160)));
    EXPECT_EQ(store.running_count(), 1u);

    auto missing = store.update_status("agent-9", AgentStatus::Running, 170);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "agent_not_found");
}

TEST(StateStoreTest, ContentHashReportsChangesOnly) {
    TempWorkspace ws;
    StateStore store(ws.root() / "state.json");
    ASSERT_FALSE(is_error(store.add_agent(make_agent("agent-1", "TASK-1"))));

    auto first = store.update_content_hash("agent-1", "abc", 110);
    ASSERT_FALSE(is_error(first));
    EXPECT_TRUE(get_value(first));
    auto same = store.update_content_hash("agent-1", "abc", 140);
    ASSERT_FALSE(is_error(same));
    EXPECT_FALSE(get_value(same));
    EXPECT_EQ(store.find("agent-1")->last_content_change, 110);
}

TEST(StateStoreTest, CompletedHistoryIsBounded) {
    TempWorkspace ws;
    StateStore store(ws.root() / "state.json");
    for (std::size_t i = 0; i < StateStore::kMaxCompleted + 5; ++i) {
        const std::string id = "agent-" + std::to_string(i);
        ASSERT_FALSE(is_error(store.add_agent(make_agent(id, "TASK-" + std::to_string(i)))));
        ASSERT_FALSE(is_error(store.complete_agent(id, "completed", 200)));
    }
    auto snapshot = store.snapshot();
    EXPECT_TRUE(snapshot.agents.empty());
    ASSERT_EQ(snapshot.completed.size(), StateStore::kMaxCompleted);
    EXPECT_EQ(snapshot.completed.front().id, "agent-5");
    EXPECT_EQ(snapshot.completed.back().outcome, "completed");
}

TEST(StateStoreTest, RemoveAgent) {
    TempWorkspace ws;
    StateStore store(ws.root() / "state.json");
    ASSERT_FALSE(is_error(store.add_agent(make_agent("agent-1", "TASK-1"))));
    ASSERT_FALSE(is_error(store.remove_agent("agent-1")));
    EXPECT_FALSE(store.find("agent-1").has_value());
    EXPECT_TRUE(is_error(store.remove_agent("agent-1")));
}

TEST(StateStoreTest, CorruptFileIsMalformed) {
    TempWorkspace ws;
    const auto path = ws.root() / "state.json";
    std::ofstream(path) << "{not json";
    StateStore store(path);
    auto loaded = store.load();
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "state_parse_failed");
}

}  // namespace
