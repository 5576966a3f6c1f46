#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "launcher/tmux_client.hpp"

namespace orch::test_support {

// In-memory tmux stand-in. Tests drive pane content and process exit.
class MockTmuxClient : public launcher::TmuxClient {
public:
    struct Session {
        std::string working_dir;
        std::string command;
        std::string content;
        bool dead = false;
        bool remain_on_exit = false;
        std::uint32_t monitor_silence = 0;
        std::vector<std::string> keys;
    };

    bool installed = true;
    launcher::TmuxVersion version{3, 4, "tmux 3.4"};

    core::errors::Result<launcher::TmuxVersion> check_available() const override {
        if (!installed) return launcher::tmux_not_installed();
        return version;
    }

    core::errors::Result<bool> session_exists(const std::string& name) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.count(name) > 0;
    }

    core::errors::Status create_session(const std::string& name, const std::string& working_dir,
                                        const std::string& command) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.count(name) > 0) {
            return core::errors::OrchError{core::errors::ErrorCategory::Conflict,
                                           "session exists: " + name, "session_exists"};
        }
        Session session;
        session.working_dir = working_dir;
        session.command = command;
        sessions_[name] = session;
        created_.push_back(name);
        return core::errors::ok();
    }

    core::errors::Status send_keys(const std::string& session, const std::string& keys,
                                   bool) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session);
        if (it == sessions_.end()) return not_found(session);
        it->second.keys.push_back(keys);
        return core::errors::ok();
    }

    core::errors::Status kill_session(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.erase(name) == 0) return not_found(name);
        killed_.push_back(name);
        return core::errors::ok();
    }

    core::errors::Result<std::vector<launcher::TmuxSession>> list_sessions(
        const std::string& prefix) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<launcher::TmuxSession> listed;
        for (const auto& entry : sessions_) {
            if (entry.first.compare(0, prefix.size(), prefix) == 0) {
                listed.push_back(launcher::TmuxSession{entry.first, std::nullopt, false});
            }
        }
        return listed;
    }

    core::errors::Result<std::string> capture_pane(const std::string& session) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session);
        if (it == sessions_.end()) return not_found(session);
        return it->second.content;
    }

    core::errors::Result<bool> pane_dead(const std::string& session) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session);
        if (it == sessions_.end()) return not_found(session);
        return it->second.dead;
    }

    core::errors::Status set_remain_on_exit(const std::string& session, bool enabled) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session);
        if (it == sessions_.end()) return not_found(session);
        it->second.remain_on_exit = enabled;
        return core::errors::ok();
    }

    core::errors::Status set_monitor_silence(const std::string& session,
                                             std::uint32_t seconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session);
        if (it == sessions_.end()) return not_found(session);
        it->second.monitor_silence = seconds;
        return core::errors::ok();
    }

    // Test controls.
    void add_session(const std::string& name, const std::string& working_dir = "/tmp") {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[name].working_dir = working_dir;
    }

    void set_content(const std::string& name, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[name].content = content;
    }

    // Agent process exited, leaving its final output in the pane.
    void finish(const std::string& name, const std::string& final_output) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& session = sessions_[name];
        session.content += final_output;
        session.dead = true;
    }

    void drop(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(name);
    }

    std::optional<Session> session(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(name);
        if (it == sessions_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<std::string> created() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_;
    }

    std::vector<std::string> killed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return killed_;
    }

private:
    static core::errors::OrchError not_found(const std::string& name) {
        return core::errors::OrchError{core::errors::ErrorCategory::NotFound,
                                       "Tmux session not found: " + name, "session_not_found"};
    }

    mutable std::mutex mutex_;
    std::map<std::string, Session> sessions_;
    std::vector<std::string> created_;
    std::vector<std::string> killed_;
};

}  // namespace orch::test_support
