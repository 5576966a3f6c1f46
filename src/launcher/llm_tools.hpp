#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/config/config.hpp"
#include "core/errors/orch_errors.hpp"

namespace orch::launcher {

// Builtin profiles for the supported LLM CLIs: claude, gemini, codex.
const std::vector<core::config::LlmToolConfig>& builtin_tool_profiles();
std::optional<core::config::LlmToolConfig> builtin_tool_profile(const std::string& name);

// Profiles whose binary is found on PATH, with path and version filled in.
std::vector<core::config::LlmToolConfig> detect_tools();

// Detected set for a config: llm_tools.detected entries override the
// builtin profile of the same name; auto_detect adds tools found on PATH.
std::vector<core::config::LlmToolConfig> available_tools(const core::config::Config& config);

// Precondition llm_tool_not_detected when the tool is not available.
core::errors::Result<core::config::LlmToolConfig> resolve_tool(
    const core::config::Config& config, const std::string& name);

// Model from options, else llm_tools.default_model, else the tool's first alias.
std::string resolve_model(const core::config::Config& config,
                          const core::config::LlmToolConfig& tool,
                          const std::optional<std::string>& requested);

}  // namespace orch::launcher
