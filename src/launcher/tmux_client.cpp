#include "launcher/tmux_client.hpp"

#include <cctype>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/process/process_runner.hpp"
#include "core/util/text.hpp"

namespace orch::launcher {

using core::errors::ErrorCategory;
using core::errors::OrchError;

std::optional<TmuxVersion> TmuxVersion::parse(const std::string& text) {
    std::istringstream words(core::util::trim(text));
    std::string name;
    std::string version;
    if (!(words >> name >> version)) {
        return std::nullopt;
    }
    // Development builds report "next-3.5".
    const auto dash = version.find('-');
    if (dash != std::string::npos) {
        version = version.substr(dash + 1);
    }

    std::string numeric;
    for (const char c : version) {
        if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.') break;
        numeric.push_back(c);
    }
    const auto parts = core::util::split(numeric, '.');
    if (parts.empty() || parts[0].empty()) {
        return std::nullopt;
    }

    TmuxVersion parsed;
    parsed.raw = core::util::trim(text);
    parsed.major = std::stoi(parts[0]);
    parsed.minor = parts.size() > 1 && !parts[1].empty() ? std::stoi(parts[1]) : 0;
    return parsed;
}

bool TmuxVersion::meets_minimum(const int min_major, const int min_minor) const {
    return major > min_major || (major == min_major && minor >= min_minor);
}

std::string sanitize_session_name(const std::string& name) {
    std::string sanitized;
    sanitized.reserve(name.size());
    for (const char c : name) {
        const bool keep = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
        sanitized.push_back(keep ? c : '-');
    }
    return sanitized;
}

OrchError tmux_not_installed() {
    return OrchError{ErrorCategory::Precondition, "tmux is not installed.", "tmux_not_installed",
                     "Install tmux (macOS: brew install tmux, Debian/Ubuntu: sudo apt install tmux)"};
}

SystemTmuxClient::SystemTmuxClient(std::string binary) : binary_(std::move(binary)) {}

core::errors::Result<SystemTmuxClient::Output> SystemTmuxClient::run_tmux(
    const std::vector<std::string>& args) const {
    if (!core::process::find_executable(binary_)) {
        return tmux_not_installed();
    }
    core::process::ProcessRequest request;
    request.argv.push_back(binary_);
    request.argv.insert(request.argv.end(), args.begin(), args.end());
    request.timeout_ms = 10000;

    auto capture = core::process::run_process(request);
    if (core::errors::is_error(capture)) {
        return core::errors::get_error(capture);
    }
    const auto& result = core::errors::get_value(capture);
    if (result.timed_out) {
        return OrchError{ErrorCategory::External, "tmux " + core::util::join(args, " ") + " timed out",
                         "tmux_timeout"};
    }
    return Output{result.exit_code, result.stdout_text, result.stderr_text};
}

core::errors::Status SystemTmuxClient::run_checked(const std::vector<std::string>& args,
                                                   const std::string& code) const {
    auto out = run_tmux(args);
    if (core::errors::is_error(out)) {
        return core::errors::get_error(out);
    }
    const auto& output = core::errors::get_value(out);
    if (output.exit_code != 0) {
        return OrchError{ErrorCategory::External,
                         "tmux " + args.front() + " failed: " + core::util::trim(output.stderr_text),
                         code};
    }
    return core::errors::ok();
}

core::errors::Result<TmuxVersion> SystemTmuxClient::check_available() const {
    auto out = run_tmux({"-V"});
    if (core::errors::is_error(out)) {
        return core::errors::get_error(out);
    }
    const auto& output = core::errors::get_value(out);
    if (output.exit_code != 0) {
        return tmux_not_installed();
    }
    auto version = TmuxVersion::parse(output.stdout_text);
    if (!version) {
        return OrchError{ErrorCategory::External,
                         "Could not parse tmux version: " + core::util::trim(output.stdout_text),
                         "tmux_version_unknown"};
    }
    if (!version->meets_minimum(kMinMajor, kMinMinor)) {
        return OrchError{ErrorCategory::Precondition,
                         "tmux " + std::to_string(version->major) + "." +
                             std::to_string(version->minor) + " is older than the required 2.1",
                         "tmux_too_old", "Upgrade tmux to 2.1 or newer"};
    }
    return *version;
}

core::errors::Result<bool> SystemTmuxClient::session_exists(const std::string& name) const {
    auto out = run_tmux({"has-session", "-t", "=" + name});
    if (core::errors::is_error(out)) {
        return core::errors::get_error(out);
    }
    // A server that is not running also exits non-zero.
    return core::errors::get_value(out).exit_code == 0;
}

core::errors::Status SystemTmuxClient::create_session(const std::string& name,
                                                      const std::string& working_dir,
                                                      const std::string& command) {
    auto exists = session_exists(name);
    if (core::errors::is_error(exists)) {
        return core::errors::get_error(exists);
    }
    if (core::errors::get_value(exists)) {
        return OrchError{ErrorCategory::Conflict, "Tmux session '" + name + "' already exists.",
                         "session_exists", "Attach with: tmux attach -t " + name};
    }
    std::vector<std::string> args{"new-session", "-d", "-s", name, "-c", working_dir};
    if (!command.empty()) {
        args.push_back(command);
    }
    return run_checked(args, "session_create_failed");
}

core::errors::Status SystemTmuxClient::send_keys(const std::string& session,
                                                 const std::string& keys,
                                                 const bool press_enter) {
    std::vector<std::string> args{"send-keys", "-t", session, keys};
    if (press_enter) {
        args.push_back("Enter");
    }
    return run_checked(args, "send_keys_failed");
}

core::errors::Status SystemTmuxClient::kill_session(const std::string& name) {
    auto out = run_tmux({"kill-session", "-t", "=" + name});
    if (core::errors::is_error(out)) {
        return core::errors::get_error(out);
    }
    if (core::errors::get_value(out).exit_code != 0) {
        return OrchError{ErrorCategory::NotFound, "Tmux session not found: " + name,
                         "session_not_found"};
    }
    return core::errors::ok();
}

core::errors::Result<std::vector<TmuxSession>> SystemTmuxClient::list_sessions(
    const std::string& prefix) const {
    auto out = run_tmux(
        {"list-sessions", "-F", "#{session_name}\t#{session_created}\t#{session_attached}"});
    if (core::errors::is_error(out)) {
        return core::errors::get_error(out);
    }
    std::vector<TmuxSession> sessions;
    const auto& output = core::errors::get_value(out);
    if (output.exit_code != 0) {
        return sessions;  // no server running
    }
    std::istringstream lines(output.stdout_text);
    std::string line;
    while (std::getline(lines, line)) {
        const auto parts = core::util::split(line, '\t');
        if (parts.empty() || parts[0].empty() || !core::util::starts_with(parts[0], prefix)) {
            continue;
        }
        TmuxSession session;
        session.name = parts[0];
        if (parts.size() > 1 && !parts[1].empty()) {
            try {
                session.created = std::stoll(parts[1]);
            } catch (const std::exception&) {
                LOG_DEBUG("Ignoring unparseable session_created for " + session.name);
            }
        }
        session.attached = parts.size() > 2 && parts[2] == "1";
        sessions.push_back(session);
    }
    return sessions;
}

core::errors::Result<std::string> SystemTmuxClient::capture_pane(const std::string& session) const {
    auto out = run_tmux({"capture-pane", "-p", "-J", "-S", "-200", "-t", session});
    if (core::errors::is_error(out)) {
        return core::errors::get_error(out);
    }
    const auto& output = core::errors::get_value(out);
    if (output.exit_code != 0) {
        return OrchError{ErrorCategory::NotFound, "Tmux session not found: " + session,
                         "session_not_found"};
    }
    return output.stdout_text;
}

core::errors::Result<bool> SystemTmuxClient::pane_dead(const std::string& session) const {
    auto out = run_tmux({"display-message", "-p", "-t", session, "#{pane_dead}"});
    if (core::errors::is_error(out)) {
        return core::errors::get_error(out);
    }
    const auto& output = core::errors::get_value(out);
    if (output.exit_code != 0) {
        return OrchError{ErrorCategory::NotFound, "Tmux session not found: " + session,
                         "session_not_found"};
    }
    return core::util::trim(output.stdout_text) == "1";
}

core::errors::Status SystemTmuxClient::set_remain_on_exit(const std::string& session,
                                                          const bool enabled) {
    return run_checked({"set-option", "-t", session, "remain-on-exit", enabled ? "on" : "off"},
                       "tmux_option_failed");
}

core::errors::Status SystemTmuxClient::set_monitor_silence(const std::string& session,
                                                           const std::uint32_t seconds) {
    return run_checked(
        {"set-option", "-t", session, "monitor-silence", std::to_string(seconds)},
        "tmux_option_failed");
}

}  // namespace orch::launcher
