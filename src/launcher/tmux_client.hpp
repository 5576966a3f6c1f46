#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/orch_errors.hpp"

namespace orch::launcher {

struct TmuxVersion {
    int major = 0;
    int minor = 0;
    std::string raw;

    // "tmux 3.4", "tmux 3.3a", "tmux next-3.5"
    static std::optional<TmuxVersion> parse(const std::string& text);
    bool meets_minimum(int min_major, int min_minor) const;
};

struct TmuxSession {
    std::string name;
    std::optional<std::int64_t> created;
    bool attached = false;
};

// Replaces everything outside [A-Za-z0-9_-] with '-'.
std::string sanitize_session_name(const std::string& name);

// Terminal multiplexer operations used by the launcher and supervisor.
class TmuxClient {
public:
    virtual ~TmuxClient() = default;

    // NotInstalled maps to Precondition tmux_not_installed.
    virtual core::errors::Result<TmuxVersion> check_available() const = 0;
    virtual core::errors::Result<bool> session_exists(const std::string& name) const = 0;
    // Detached session in working_dir; command is the session's initial process.
    virtual core::errors::Status create_session(const std::string& name,
                                                const std::string& working_dir,
                                                const std::string& command) = 0;
    virtual core::errors::Status send_keys(const std::string& session, const std::string& keys,
                                           bool press_enter) = 0;
    virtual core::errors::Status kill_session(const std::string& name) = 0;
    virtual core::errors::Result<std::vector<TmuxSession>> list_sessions(
        const std::string& prefix) const = 0;
    virtual core::errors::Result<std::string> capture_pane(const std::string& session) const = 0;
    // True once the pane's process has exited (requires remain-on-exit).
    virtual core::errors::Result<bool> pane_dead(const std::string& session) const = 0;
    virtual core::errors::Status set_remain_on_exit(const std::string& session, bool enabled) = 0;
    virtual core::errors::Status set_monitor_silence(const std::string& session,
                                                     std::uint32_t seconds) = 0;
};

// Runs the tmux binary through the process helper.
class SystemTmuxClient : public TmuxClient {
public:
    static constexpr int kMinMajor = 2;
    static constexpr int kMinMinor = 1;

    explicit SystemTmuxClient(std::string binary = "tmux");

    core::errors::Result<TmuxVersion> check_available() const override;
    core::errors::Result<bool> session_exists(const std::string& name) const override;
    core::errors::Status create_session(const std::string& name, const std::string& working_dir,
                                        const std::string& command) override;
    core::errors::Status send_keys(const std::string& session, const std::string& keys,
                                   bool press_enter) override;
    core::errors::Status kill_session(const std::string& name) override;
    core::errors::Result<std::vector<TmuxSession>> list_sessions(
        const std::string& prefix) const override;
    core::errors::Result<std::string> capture_pane(const std::string& session) const override;
    core::errors::Result<bool> pane_dead(const std::string& session) const override;
    core::errors::Status set_remain_on_exit(const std::string& session, bool enabled) override;
    core::errors::Status set_monitor_silence(const std::string& session,
                                             std::uint32_t seconds) override;

private:
    struct Output {
        int exit_code = -1;
        std::string stdout_text;
        std::string stderr_text;
    };
    core::errors::Result<Output> run_tmux(const std::vector<std::string>& args) const;
    core::errors::Status run_checked(const std::vector<std::string>& args,
                                     const std::string& code) const;

    std::string binary_;
};

// Error for a missing tmux binary, with install hints.
core::errors::OrchError tmux_not_installed();

}  // namespace orch::launcher
