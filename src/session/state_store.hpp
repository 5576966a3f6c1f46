#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/orch_errors.hpp"

namespace orch::session {

enum class AgentStatus {
    Running,
    AwaitingInput,
    Completing,
    Failed
};

std::string to_string(AgentStatus status);
std::optional<AgentStatus> parse_agent_status(const std::string& text);

// One live session per record. Timestamps are epoch seconds.
struct AgentState {
    std::string id;
    std::string ticket_id;
    std::string ticket_type;
    std::string project;
    std::string session_name;
    std::string session_id;
    std::string current_step;
    AgentStatus status = AgentStatus::Running;
    std::int64_t started_at = 0;
    std::int64_t last_activity = 0;
    std::int64_t step_started_at = 0;
    std::int64_t last_content_change = 0;
    std::string content_hash;
    bool paired = false;
    std::optional<std::string> last_message;
    bool review_pending = false;
    std::optional<nlohmann::json> review_payload;
    std::string provider;
    std::string model;
};

struct CompletedAgent {
    std::string id;
    std::string ticket_id;
    std::string ticket_type;
    std::string project;
    std::string outcome;  // "completed" or "failed"
    std::int64_t started_at = 0;
    std::int64_t finished_at = 0;
};

struct StateSnapshot {
    bool paused = false;
    std::vector<AgentState> agents;
    std::vector<CompletedAgent> completed;
};

nlohmann::json agent_to_json(const AgentState& agent);
core::errors::Result<AgentState> agent_from_json(const nlohmann::json& j);
nlohmann::json snapshot_to_json(const StateSnapshot& snapshot);

// The supervisor's agent set, persisted to state.json after every
// mutation. Readers get copies.
class StateStore {
public:
    static constexpr std::size_t kMaxCompleted = 100;

    explicit StateStore(std::filesystem::path state_file);

    // A missing file leaves the store empty.
    core::errors::Status load();
    core::errors::Status save() const;

    core::errors::Status add_agent(AgentState agent);
    core::errors::Result<AgentStatus> update_status(const std::string& agent_id,
                                                    AgentStatus next, std::int64_t now);
    // True when the hash differs from the stored one; the change time is
    // recorded only then.
    core::errors::Result<bool> update_content_hash(const std::string& agent_id,
                                                   const std::string& hash, std::int64_t now);
    core::errors::Status modify(const std::string& agent_id,
                                const std::function<void(AgentState&)>& mutate);
    core::errors::Status remove_agent(const std::string& agent_id);
    // Moves the record into the bounded history.
    core::errors::Status complete_agent(const std::string& agent_id, const std::string& outcome,
                                        std::int64_t now);

    std::optional<AgentState> find(const std::string& agent_id) const;
    std::optional<AgentState> find_by_ticket(const std::string& ticket_id) const;
    std::optional<AgentState> find_by_session(const std::string& session_name) const;

    // Agents holding a parallelism slot (everything but failed).
    std::size_t running_count() const;
    StateSnapshot snapshot() const;

    bool paused() const;
    core::errors::Status set_paused(bool paused);

    const std::filesystem::path& state_file() const { return state_file_; }

private:
    core::errors::Status save_locked() const;
    std::vector<AgentState>::iterator find_locked(const std::string& agent_id);

    std::filesystem::path state_file_;
    mutable std::mutex mutex_;
    bool paused_ = false;
    std::vector<AgentState> agents_;
    std::vector<CompletedAgent> completed_;
};

}  // namespace orch::session
