#include "permissions/permission_set.hpp"

#include <algorithm>

namespace orch::permissions {

using core::errors::ErrorCategory;
using core::errors::OrchError;
using nlohmann::json;

namespace {

template <typename T>
void append_unique(std::vector<T>& target, const std::vector<T>& source) {
    for (const auto& item : source) {
        if (std::find(target.begin(), target.end(), item) == target.end()) {
            target.push_back(item);
        }
    }
}

std::vector<ToolPattern> tools_from_json(const json& j) {
    std::vector<ToolPattern> tools;
    if (!j.is_array()) {
        return tools;
    }
    for (const auto& entry : j) {
        tools.push_back(tool_pattern_from_json(entry));
    }
    return tools;
}

json tools_to_json(const std::vector<ToolPattern>& tools) {
    json out = json::array();
    for (const auto& tool : tools) {
        out.push_back(tool_pattern_to_json(tool));
    }
    return out;
}

}  // namespace

bool StepPermissions::empty() const {
    return tools_allow.empty() && tools_deny.empty() && directories_allow.empty() &&
           directories_deny.empty() && mcp_enable.empty() && mcp_disable.empty() &&
           custom_flags.empty();
}

PermissionSet PermissionSet::from_fragment(const StepPermissions& fragment) {
    PermissionSet set;
    append_unique(set.tools_allow, fragment.tools_allow);
    append_unique(set.tools_deny, fragment.tools_deny);
    append_unique(set.directories_allow, fragment.directories_allow);
    append_unique(set.directories_deny, fragment.directories_deny);
    append_unique(set.mcp_enable, fragment.mcp_enable);
    append_unique(set.mcp_disable, fragment.mcp_disable);
    set.custom_flags = fragment.custom_flags;
    return set;
}

PermissionSet PermissionSet::merge(const PermissionSet& a, const PermissionSet& b) {
    PermissionSet merged;
    for (const PermissionSet* source : {&a, &b}) {
        append_unique(merged.tools_allow, source->tools_allow);
        append_unique(merged.tools_deny, source->tools_deny);
        append_unique(merged.directories_allow, source->directories_allow);
        append_unique(merged.directories_deny, source->directories_deny);
        append_unique(merged.mcp_enable, source->mcp_enable);
        append_unique(merged.mcp_disable, source->mcp_disable);
        for (const auto& [provider, flags] : source->custom_flags) {
            for (const auto& [flag, value] : flags) {
                merged.custom_flags[provider][flag] = value;
            }
        }
        for (const auto& [provider, args] : source->cli_args) {
            append_unique(merged.cli_args[provider], args);
        }
    }
    return merged;
}

void PermissionSet::allow_tool(const ToolPattern& tool) {
    append_unique(tools_allow, std::vector<ToolPattern>{tool});
}

void PermissionSet::allow_directory(const std::string& directory) {
    append_unique(directories_allow, std::vector<std::string>{directory});
}

json tool_pattern_to_json(const ToolPattern& pattern) {
    json out = {{"tool", pattern.tool}};
    if (pattern.pattern.has_value()) {
        out["pattern"] = *pattern.pattern;
    }
    return out;
}

ToolPattern tool_pattern_from_json(const json& j) {
    if (j.is_string()) {
        return ToolPattern{j.get<std::string>(), std::nullopt};
    }
    ToolPattern pattern;
    pattern.tool = j.value("tool", "");
    if (j.contains("pattern") && j["pattern"].is_string()) {
        pattern.pattern = j["pattern"].get<std::string>();
    }
    return pattern;
}

json step_permissions_to_json(const StepPermissions& permissions) {
    json out = json::object();
    if (!permissions.tools_allow.empty() || !permissions.tools_deny.empty()) {
        out["tools"] = {{"allow", tools_to_json(permissions.tools_allow)},
                        {"deny", tools_to_json(permissions.tools_deny)}};
    }
    if (!permissions.directories_allow.empty() || !permissions.directories_deny.empty()) {
        out["directories"] = {{"allow", permissions.directories_allow},
                              {"deny", permissions.directories_deny}};
    }
    if (!permissions.mcp_enable.empty() || !permissions.mcp_disable.empty()) {
        out["mcp_servers"] = {{"enable", permissions.mcp_enable},
                              {"disable", permissions.mcp_disable}};
    }
    if (!permissions.custom_flags.empty()) {
        json flags = json::object();
        for (const auto& [provider, values] : permissions.custom_flags) {
            flags[provider] = json(values);
        }
        out["custom_flags"] = flags;
    }
    return out;
}

core::errors::Result<StepPermissions> step_permissions_from_json(const json& j) {
    StepPermissions permissions;
    if (j.is_null()) {
        return permissions;
    }
    if (!j.is_object()) {
        return OrchError{ErrorCategory::Malformed, "Permissions must be a JSON object.",
                         "invalid_permissions"};
    }
    try {
        if (j.contains("tools")) {
            permissions.tools_allow = tools_from_json(j["tools"].value("allow", json::array()));
            permissions.tools_deny = tools_from_json(j["tools"].value("deny", json::array()));
        }
        if (j.contains("directories")) {
            permissions.directories_allow =
                j["directories"].value("allow", std::vector<std::string>{});
            permissions.directories_deny =
                j["directories"].value("deny", std::vector<std::string>{});
        }
        if (j.contains("mcp_servers")) {
            permissions.mcp_enable = j["mcp_servers"].value("enable", std::vector<std::string>{});
            permissions.mcp_disable =
                j["mcp_servers"].value("disable", std::vector<std::string>{});
        }
        if (j.contains("custom_flags") && j["custom_flags"].is_object()) {
            for (auto it = j["custom_flags"].begin(); it != j["custom_flags"].end(); ++it) {
                if (!it.value().is_object()) {
                    continue;
                }
                for (auto flag = it.value().begin(); flag != it.value().end(); ++flag) {
                    permissions.custom_flags[it.key()][flag.key()] = flag.value();
                }
            }
        }
    } catch (const json::exception& e) {
        return OrchError{ErrorCategory::Malformed,
                         std::string("Invalid permissions: ") + e.what(),
                         "invalid_permissions"};
    }
    return permissions;
}

json cli_args_to_json(const ProviderCliArgs& args) {
    json out = json::object();
    for (const auto& [provider, values] : args) {
        if (!values.empty()) {
            out[provider] = values;
        }
    }
    return out;
}

ProviderCliArgs cli_args_from_json(const json& j) {
    ProviderCliArgs args;
    if (!j.is_object()) {
        return args;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_array()) {
            continue;
        }
        for (const auto& value : it.value()) {
            if (value.is_string()) {
                args[it.key()].push_back(value.get<std::string>());
            }
        }
    }
    return args;
}

std::string format_tool_pattern(const ToolPattern& pattern) {
    if (pattern.pattern.has_value()) {
        return pattern.tool + "(" + *pattern.pattern + ")";
    }
    return pattern.tool;
}

}  // namespace orch::permissions
