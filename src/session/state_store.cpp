#include "session/state_store.hpp"

#include <algorithm>
#include <fstream>
#include <utility>
#include "core/logging/logger.hpp"

namespace orch::session {

using core::errors::ErrorCategory;
using core::errors::OrchError;
using nlohmann::json;

namespace {

OrchError agent_not_found(const std::string& agent_id) {
    return OrchError{ErrorCategory::NotFound, "Agent not found: " + agent_id, "agent_not_found"};
}

json completed_to_json(const CompletedAgent& entry) {
    return json{{"id", entry.id},
                {"ticket_id", entry.ticket_id},
                {"ticket_type", entry.ticket_type},
                {"project", entry.project},
                {"outcome", entry.outcome},
                {"started_at", entry.started_at},
                {"finished_at", entry.finished_at}};
}

CompletedAgent completed_from_json(const json& j) {
    CompletedAgent entry;
    entry.id = j.value("id", "");
    entry.ticket_id = j.value("ticket_id", "");
    entry.ticket_type = j.value("ticket_type", "");
    entry.project = j.value("project", "");
    entry.outcome = j.value("outcome", "");
    entry.started_at = j.value("started_at", static_cast<std::int64_t>(0));
    entry.finished_at = j.value("finished_at", static_cast<std::int64_t>(0));
    return entry;
}

}  // namespace

std::string to_string(const AgentStatus status) {
    switch (status) {
        case AgentStatus::Running:
            return "running";
        case AgentStatus::AwaitingInput:
            return "awaiting_input";
        case AgentStatus::Completing:
            return "completing";
        case AgentStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

std::optional<AgentStatus> parse_agent_status(const std::string& text) {
    if (text == "running") return AgentStatus::Running;
    if (text == "awaiting_input") return AgentStatus::AwaitingInput;
    if (text == "completing") return AgentStatus::Completing;
    if (text == "failed") return AgentStatus::Failed;
    return std::nullopt;
}

json agent_to_json(const AgentState& agent) {
    json j{{"id", agent.id},
           {"ticket_id", agent.ticket_id},
           {"ticket_type", agent.ticket_type},
           {"project", agent.project},
           {"session_name", agent.session_name},
           {"session_id", agent.session_id},
           {"current_step", agent.current_step},
           {"status", to_string(agent.status)},
           {"started_at", agent.started_at},
           {"last_activity", agent.last_activity},
           {"step_started_at", agent.step_started_at},
           {"last_content_change", agent.last_content_change},
           {"content_hash", agent.content_hash},
           {"paired", agent.paired},
           {"review_pending", agent.review_pending},
           {"provider", agent.provider},
           {"model", agent.model}};
    j["last_message"] = agent.last_message ? json(*agent.last_message) : json(nullptr);
    j["review_payload"] = agent.review_payload ? *agent.review_payload : json(nullptr);
    return j;
}

core::errors::Result<AgentState> agent_from_json(const json& j) {
    if (!j.is_object() || !j.contains("id") || !j.contains("ticket_id")) {
        return OrchError{ErrorCategory::Malformed, "Agent record requires id and ticket_id",
                         "invalid_agent_record"};
    }
    AgentState agent;
    try {
        agent.id = j.at("id").get<std::string>();
        agent.ticket_id = j.at("ticket_id").get<std::string>();
        agent.ticket_type = j.value("ticket_type", "");
        agent.project = j.value("project", "");
        agent.session_name = j.value("session_name", "");
        agent.session_id = j.value("session_id", "");
        agent.current_step = j.value("current_step", "");
        const std::string status = j.value("status", "running");
        const auto parsed = parse_agent_status(status);
        if (!parsed) {
            return OrchError{ErrorCategory::Malformed,
                             "Unknown agent status '" + status + "' for " + agent.id,
                             "invalid_agent_record"};
        }
        agent.status = *parsed;
        agent.started_at = j.value("started_at", static_cast<std::int64_t>(0));
        agent.last_activity = j.value("last_activity", static_cast<std::int64_t>(0));
        agent.step_started_at = j.value("step_started_at", static_cast<std::int64_t>(0));
        agent.last_content_change = j.value("last_content_change", static_cast<std::int64_t>(0));
        agent.content_hash = j.value("content_hash", "");
        agent.paired = j.value("paired", false);
        agent.review_pending = j.value("review_pending", false);
        agent.provider = j.value("provider", "");
        agent.model = j.value("model", "");
        if (j.contains("last_message") && j["last_message"].is_string()) {
            agent.last_message = j["last_message"].get<std::string>();
        }
        if (j.contains("review_payload") && !j["review_payload"].is_null()) {
            agent.review_payload = j["review_payload"];
        }
    } catch (const json::exception& e) {
        return OrchError{ErrorCategory::Malformed,
                         "Invalid agent record: " + std::string(e.what()),
                         "invalid_agent_record"};
    }
    return agent;
}

json snapshot_to_json(const StateSnapshot& snapshot) {
    json agents = json::array();
    for (const auto& agent : snapshot.agents) {
        agents.push_back(agent_to_json(agent));
    }
    json completed = json::array();
    for (const auto& entry : snapshot.completed) {
        completed.push_back(completed_to_json(entry));
    }
    return json{{"paused", snapshot.paused}, {"agents", agents}, {"completed", completed}};
}

StateStore::StateStore(std::filesystem::path state_file) : state_file_(std::move(state_file)) {}

core::errors::Status StateStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!std::filesystem::exists(state_file_, ec)) {
        paused_ = false;
        agents_.clear();
        completed_.clear();
        return core::errors::ok();
    }

    std::ifstream in(state_file_);
    if (!in.is_open()) {
        return OrchError{ErrorCategory::External,
                         "Unable to open state file: " + state_file_.string(),
                         "state_open_failed"};
    }
    json doc;
    try {
        in >> doc;
    } catch (const json::exception& e) {
        return OrchError{ErrorCategory::Malformed,
                         "State file is not valid JSON: " + std::string(e.what()),
                         "state_parse_failed",
                         "Move " + state_file_.string() + " aside to start with an empty agent set"};
    }
    if (!doc.is_object()) {
        return OrchError{ErrorCategory::Malformed, "State file must contain a JSON object",
                         "state_parse_failed"};
    }

    std::vector<AgentState> agents;
    std::vector<CompletedAgent> completed;
    bool paused = false;
    try {
        for (const auto& entry : doc.value("agents", json::array())) {
            auto agent = agent_from_json(entry);
            if (core::errors::is_error(agent)) {
                return core::errors::get_error(agent);
            }
            agents.push_back(core::errors::get_value(agent));
        }
        for (const auto& entry : doc.value("completed", json::array())) {
            if (entry.is_object()) {
                completed.push_back(completed_from_json(entry));
            }
        }
        paused = doc.value("paused", false);
    } catch (const json::exception& e) {
        return OrchError{ErrorCategory::Malformed,
                         "Invalid state file: " + std::string(e.what()), "state_parse_failed"};
    }

    paused_ = paused;
    agents_ = std::move(agents);
    completed_ = std::move(completed);
    LOG_DEBUG("StateStore: loaded " + std::to_string(agents_.size()) + " agents from " +
              state_file_.string());
    return core::errors::ok();
}

core::errors::Status StateStore::save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_locked();
}

core::errors::Status StateStore::save_locked() const {
    std::error_code ec;
    std::filesystem::create_directories(state_file_.parent_path(), ec);
    if (ec) {
        return OrchError{ErrorCategory::External,
                         "Unable to create state directory: " + state_file_.parent_path().string(),
                         "state_write_failed"};
    }

    StateSnapshot snapshot{paused_, agents_, completed_};
    const auto tmp = state_file_.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return OrchError{ErrorCategory::External, "Unable to open state file: " + tmp,
                             "state_write_failed"};
        }
        out << snapshot_to_json(snapshot).dump(2) << "\n";
        if (!out.good()) {
            return OrchError{ErrorCategory::External, "Unable to write state file: " + tmp,
                             "state_write_failed"};
        }
    }
    std::filesystem::rename(tmp, state_file_, ec);
    if (ec) {
        return OrchError{ErrorCategory::External,
                         "Unable to replace state file: " + ec.message(), "state_write_failed"};
    }
    return core::errors::ok();
}

std::vector<AgentState>::iterator StateStore::find_locked(const std::string& agent_id) {
    return std::find_if(agents_.begin(), agents_.end(),
                        [&](const AgentState& agent) { return agent.id == agent_id; });
}

core::errors::Status StateStore::add_agent(AgentState agent) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& existing : agents_) {
        if (existing.id == agent.id || existing.ticket_id == agent.ticket_id) {
            return OrchError{ErrorCategory::Conflict,
                             "Ticket " + agent.ticket_id + " already has agent " + existing.id,
                             "agent_exists"};
        }
    }
    LOG_INFO("StateStore: agent " + agent.id + " added for " + agent.ticket_id + " (" +
             to_string(agent.status) + ")");
    agents_.push_back(std::move(agent));
    return save_locked();
}

core::errors::Result<AgentStatus> StateStore::update_status(const std::string& agent_id,
                                                            const AgentStatus next,
                                                            const std::int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(agent_id);
    if (it == agents_.end()) {
        return agent_not_found(agent_id);
    }
    const AgentStatus prev = it->status;
    if (prev == next) {
        return next;
    }
    it->status = next;
    it->last_activity = now;
    LOG_INFO("StateStore: agent " + agent_id + " transition " + to_string(prev) + " -> " +
             to_string(next));
    auto saved = save_locked();
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    return next;
}

core::errors::Result<bool> StateStore::update_content_hash(const std::string& agent_id,
                                                           const std::string& hash,
                                                           const std::int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(agent_id);
    if (it == agents_.end()) {
        return agent_not_found(agent_id);
    }
    if (it->content_hash == hash) {
        return false;
    }
    it->content_hash = hash;
    it->last_content_change = now;
    it->last_activity = now;
    auto saved = save_locked();
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    return true;
}

core::errors::Status StateStore::modify(const std::string& agent_id,
                                        const std::function<void(AgentState&)>& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(agent_id);
    if (it == agents_.end()) {
        return agent_not_found(agent_id);
    }
    mutate(*it);
    return save_locked();
}

core::errors::Status StateStore::remove_agent(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(agent_id);
    if (it == agents_.end()) {
        return agent_not_found(agent_id);
    }
    LOG_INFO("StateStore: agent " + agent_id + " removed");
    agents_.erase(it);
    return save_locked();
}

core::errors::Status StateStore::complete_agent(const std::string& agent_id,
                                                const std::string& outcome,
                                                const std::int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(agent_id);
    if (it == agents_.end()) {
        return agent_not_found(agent_id);
    }
    completed_.push_back(CompletedAgent{it->id, it->ticket_id, it->ticket_type, it->project,
                                        outcome, it->started_at, now});
    if (completed_.size() > kMaxCompleted) {
        completed_.erase(completed_.begin(),
                         completed_.begin() +
                             static_cast<std::ptrdiff_t>(completed_.size() - kMaxCompleted));
    }
    LOG_INFO("StateStore: agent " + agent_id + " transition " + to_string(it->status) + " -> " +
             outcome);
    agents_.erase(it);
    return save_locked();
}

std::optional<AgentState> StateStore::find(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& agent : agents_) {
        if (agent.id == agent_id) {
            return agent;
        }
    }
    return std::nullopt;
}

std::optional<AgentState> StateStore::find_by_ticket(const std::string& ticket_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& agent : agents_) {
        if (agent.ticket_id == ticket_id) {
            return agent;
        }
    }
    return std::nullopt;
}

std::optional<AgentState> StateStore::find_by_session(const std::string& session_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& agent : agents_) {
        if (agent.session_name == session_name) {
            return agent;
        }
    }
    return std::nullopt;
}

std::size_t StateStore::running_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(agents_.begin(), agents_.end(),
                      [](const AgentState& agent) { return agent.status != AgentStatus::Failed; }));
}

StateSnapshot StateStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return StateSnapshot{paused_, agents_, completed_};
}

bool StateStore::paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

core::errors::Status StateStore::set_paused(const bool paused) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (paused_ != paused) {
        LOG_INFO(std::string("StateStore: queue ") + (paused ? "paused" : "resumed"));
    }
    paused_ = paused;
    return save_locked();
}

}  // namespace orch::session
