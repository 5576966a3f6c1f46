#include "launcher/llm_tools.hpp"

#include <algorithm>
#include "core/logging/logger.hpp"
#include "core/process/process_runner.hpp"
#include "core/util/text.hpp"

namespace orch::launcher {

using core::config::LlmToolConfig;
using core::errors::ErrorCategory;
using core::errors::OrchError;

namespace {

LlmToolConfig make_profile(const std::string& name, const std::string& command_template,
                           const std::string& model_flag, std::vector<std::string> aliases,
                           std::vector<std::string> yolo_flags) {
    LlmToolConfig tool;
    tool.name = name;
    tool.command_template = command_template;
    tool.model_flag = model_flag;
    tool.model_aliases = std::move(aliases);
    tool.yolo_flags = std::move(yolo_flags);
    return tool;
}

std::string tool_version(const std::filesystem::path& binary) {
    core::process::ProcessRequest request;
    request.argv = {binary.string(), "--version"};
    request.timeout_ms = 5000;
    auto capture = core::process::run_process(request);
    if (core::errors::is_error(capture) || !core::errors::get_value(capture).success()) {
        return "";
    }
    const auto& text = core::errors::get_value(capture).stdout_text;
    return core::util::trim(text.substr(0, text.find('\n')));
}

// Empty fields of a configured entry fall back to the builtin profile.
LlmToolConfig with_builtin_defaults(LlmToolConfig tool) {
    const auto builtin = builtin_tool_profile(tool.name);
    if (!builtin) {
        return tool;
    }
    if (tool.command_template.empty()) tool.command_template = builtin->command_template;
    if (tool.model_flag.empty()) tool.model_flag = builtin->model_flag;
    if (tool.model_aliases.empty()) tool.model_aliases = builtin->model_aliases;
    if (tool.yolo_flags.empty()) tool.yolo_flags = builtin->yolo_flags;
    return tool;
}

}  // namespace

const std::vector<LlmToolConfig>& builtin_tool_profiles() {
    static const std::vector<LlmToolConfig> profiles = {
        make_profile("claude",
                     "claude {{yolo_flags}}{{config_flags}}{{model_flag}}--session-id "
                     "{{session_id}} \"$(cat {{prompt_file}})\"",
                     "--model", {"opus", "sonnet", "haiku"},
                     {"--dangerously-skip-permissions"}),
        make_profile("gemini",
                     "gemini {{yolo_flags}}{{config_flags}}{{model_flag}}"
                     "-i \"$(cat {{prompt_file}})\"",
                     "--model", {"gemini-2.5-pro", "gemini-2.5-flash"}, {"--yolo"}),
        make_profile("codex",
                     "codex {{yolo_flags}}{{config_flags}}{{model_flag}}"
                     "\"$(cat {{prompt_file}})\"",
                     "-m", {"gpt-5", "o3"}, {"--dangerously-bypass-approvals-and-sandbox"}),
    };
    return profiles;
}

std::optional<LlmToolConfig> builtin_tool_profile(const std::string& name) {
    for (const auto& profile : builtin_tool_profiles()) {
        if (profile.name == name) {
            return profile;
        }
    }
    return std::nullopt;
}

std::vector<LlmToolConfig> detect_tools() {
    std::vector<LlmToolConfig> detected;
    for (auto profile : builtin_tool_profiles()) {
        const auto path = core::process::find_executable(profile.name);
        if (!path) {
            continue;
        }
        profile.path = path->string();
        profile.version = tool_version(*path);
        LOG_DEBUG("Detected " + profile.name + " at " + profile.path +
                  (profile.version.empty() ? "" : " (" + profile.version + ")"));
        detected.push_back(profile);
    }
    return detected;
}

std::vector<LlmToolConfig> available_tools(const core::config::Config& config) {
    std::vector<LlmToolConfig> tools;
    for (const auto& entry : config.llm_tools.detected) {
        tools.push_back(with_builtin_defaults(entry));
    }
    if (config.llm_tools.auto_detect) {
        for (auto& found : detect_tools()) {
            const bool configured =
                std::any_of(tools.begin(), tools.end(),
                            [&found](const LlmToolConfig& t) { return t.name == found.name; });
            if (!configured) {
                tools.push_back(found);
            }
        }
    }
    return tools;
}

core::errors::Result<LlmToolConfig> resolve_tool(const core::config::Config& config,
                                                 const std::string& name) {
    for (auto& tool : available_tools(config)) {
        if (tool.name == name) {
            if (tool.command_template.empty()) {
                return OrchError{ErrorCategory::Validation,
                                 "LLM tool '" + name + "' has no command_template.",
                                 "llm_tool_misconfigured"};
            }
            return tool;
        }
    }
    return OrchError{ErrorCategory::Precondition,
                     "LLM tool '" + name + "' not detected. Install it or choose a different provider.",
                     "llm_tool_not_detected"};
}

std::string resolve_model(const core::config::Config& config, const LlmToolConfig& tool,
                          const std::optional<std::string>& requested) {
    if (requested && !requested->empty()) {
        return *requested;
    }
    if (!config.llm_tools.default_model.empty()) {
        return config.llm_tools.default_model;
    }
    return tool.model_aliases.empty() ? "" : tool.model_aliases.front();
}

}  // namespace orch::launcher
