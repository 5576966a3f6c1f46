#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/orch_errors.hpp"

namespace orch::permissions {

struct ToolPattern {
    std::string tool;
    std::optional<std::string> pattern;

    bool operator==(const ToolPattern& other) const {
        return tool == other.tool && pattern == other.pattern;
    }
};

// Provider name -> flag name -> value, passed through to one provider only.
using CustomFlags = std::map<std::string, std::map<std::string, nlohmann::json>>;

// Permission fragment as written in a step schema or a project's permissions.json.
struct StepPermissions {
    std::vector<ToolPattern> tools_allow;
    std::vector<ToolPattern> tools_deny;
    std::vector<std::string> directories_allow;
    std::vector<std::string> directories_deny;
    std::vector<std::string> mcp_enable;
    std::vector<std::string> mcp_disable;
    CustomFlags custom_flags;

    bool empty() const;
};

// Extra CLI arguments per provider ("claude", "gemini", "codex").
using ProviderCliArgs = std::map<std::string, std::vector<std::string>>;

// Merged, provider-agnostic envelope handed to a translator.
struct PermissionSet {
    std::vector<ToolPattern> tools_allow;
    std::vector<ToolPattern> tools_deny;
    std::vector<std::string> directories_allow;
    std::vector<std::string> directories_deny;
    std::vector<std::string> mcp_enable;
    std::vector<std::string> mcp_disable;
    CustomFlags custom_flags;
    ProviderCliArgs cli_args;

    static PermissionSet from_fragment(const StepPermissions& fragment);

    // Order-preserving union of every list; custom flags overlay key by key.
    static PermissionSet merge(const PermissionSet& a, const PermissionSet& b);

    void allow_tool(const ToolPattern& tool);
    void allow_directory(const std::string& directory);
};

nlohmann::json tool_pattern_to_json(const ToolPattern& pattern);
ToolPattern tool_pattern_from_json(const nlohmann::json& j);

nlohmann::json step_permissions_to_json(const StepPermissions& permissions);
core::errors::Result<StepPermissions> step_permissions_from_json(const nlohmann::json& j);

nlohmann::json cli_args_to_json(const ProviderCliArgs& args);
ProviderCliArgs cli_args_from_json(const nlohmann::json& j);

// "Bash" or "Bash(npm test:*)" for display and the claude flag vocabulary.
std::string format_tool_pattern(const ToolPattern& pattern);

}  // namespace orch::permissions
