#include "permissions/translator.hpp"

#include <algorithm>
#include <map>
#include <nlohmann/json.hpp>
#include "core/config/toml_reader.hpp"

namespace orch::permissions {

using nlohmann::json;

namespace {

std::string flag_value(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

void append_custom_flags(std::vector<std::string>& flags, const CustomFlags& custom,
                         const std::string& provider) {
    const auto it = custom.find(provider);
    if (it == custom.end()) {
        return;
    }
    for (const auto& [name, value] : it->second) {
        if (value.is_boolean()) {
            if (value.get<bool>()) flags.push_back("--" + name);
            continue;
        }
        if (value.is_null()) continue;
        flags.push_back("--" + name);
        flags.push_back(flag_value(value));
    }
}

std::string toml_array(const std::vector<std::string>& values) {
    std::string out = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += core::config::toml_quote(values[i]);
    }
    return out + "]";
}

}  // namespace

std::vector<std::string> ClaudeTranslator::generate_cli_flags(const PermissionSet& set) const {
    std::vector<std::string> flags;
    for (const auto& tool : set.tools_allow) {
        flags.push_back("--allowedTools");
        flags.push_back(format_tool_pattern(tool));
    }
    for (const auto& tool : set.tools_deny) {
        flags.push_back("--disallowedTools");
        flags.push_back(format_tool_pattern(tool));
    }
    for (const auto& dir : set.directories_allow) {
        flags.push_back("--add-dir");
        flags.push_back(dir);
    }
    for (const auto& dir : set.directories_deny) {
        for (const char* tool : {"Read", "Write", "Edit"}) {
            flags.push_back("--disallowedTools");
            flags.push_back(std::string(tool) + "(" + dir + ")");
        }
    }
    append_custom_flags(flags, set.custom_flags, provider_name());
    return flags;
}

std::optional<std::string> ClaudeTranslator::generate_config(const PermissionSet&) const {
    return std::nullopt;
}

std::vector<std::string> GeminiTranslator::generate_cli_flags(const PermissionSet&) const {
    return {};
}

std::optional<std::string> GeminiTranslator::generate_config(const PermissionSet& set) const {
    json settings = json::object();
    json core_tools = json::array();
    for (const auto& tool : set.tools_allow) {
        core_tools.push_back(format_tool_pattern(tool));
    }
    json exclude_tools = json::array();
    for (const auto& tool : set.tools_deny) {
        exclude_tools.push_back(format_tool_pattern(tool));
    }
    settings["coreTools"] = core_tools;
    settings["excludeTools"] = exclude_tools;
    settings["includeDirectories"] = set.directories_allow;

    json servers = json::object();
    for (const auto& name : set.mcp_enable) {
        servers[name] = {{"enabled", true}};
    }
    for (const auto& name : set.mcp_disable) {
        servers[name] = {{"enabled", false}};
    }
    if (!servers.empty()) {
        settings["mcpServers"] = servers;
    }

    if (const auto it = set.custom_flags.find(provider_name()); it != set.custom_flags.end()) {
        for (const auto& [name, value] : it->second) {
            settings[name] = value;
        }
    }
    return settings.dump(2) + "\n";
}

std::string CodexTranslator::map_tool_name(const std::string& tool) {
    static const std::map<std::string, std::string> names = {
        {"Bash", "exec"},        {"Read", "read_file"}, {"Write", "write_file"},
        {"Edit", "apply_patch"}, {"Glob", "glob"},      {"Grep", "grep"},
    };
    const auto it = names.find(tool);
    return it == names.end() ? tool : it->second;
}

std::vector<std::string> CodexTranslator::generate_cli_flags(const PermissionSet& set) const {
    std::vector<std::string> flags;
    append_custom_flags(flags, set.custom_flags, provider_name());
    return flags;
}

std::optional<std::string> CodexTranslator::generate_config(const PermissionSet& set) const {
    struct ToolTable {
        std::string name;
        std::vector<std::string> patterns;
        bool enabled = true;
    };
    std::vector<ToolTable> tables;
    auto table_for = [&tables](const std::string& name) -> ToolTable& {
        auto it = std::find_if(tables.begin(), tables.end(),
                               [&name](const ToolTable& table) { return table.name == name; });
        if (it != tables.end()) return *it;
        tables.push_back(ToolTable{name, {}, true});
        return tables.back();
    };
    for (const auto& tool : set.tools_allow) {
        table_for(map_tool_name(tool.tool)).patterns.push_back(tool.pattern.value_or("*"));
    }
    for (const auto& tool : set.tools_deny) {
        table_for(map_tool_name(tool.tool)).enabled = false;
    }

    std::string out;
    if (!set.directories_allow.empty()) {
        out += "[sandbox_workspace_write]\nwritable_roots = " +
               toml_array(set.directories_allow) + "\n\n";
    }
    for (const auto& table : tables) {
        out += "[tools." + core::config::toml_quote(table.name) + "]\n";
        if (!table.patterns.empty()) {
            out += "allow_patterns = " + toml_array(table.patterns) + "\n";
        }
        if (!table.enabled) {
            out += "enabled = false\n";
        }
        out += "\n";
    }
    for (const auto& name : set.mcp_enable) {
        out += "[mcp_servers." + core::config::toml_quote(name) + "]\nenabled = true\n\n";
    }
    for (const auto& name : set.mcp_disable) {
        out += "[mcp_servers." + core::config::toml_quote(name) + "]\nenabled = false\n\n";
    }
    return out;
}

std::unique_ptr<ProviderTranslator> make_translator(const std::string& provider) {
    if (provider == "claude") return std::make_unique<ClaudeTranslator>();
    if (provider == "gemini") return std::make_unique<GeminiTranslator>();
    if (provider == "codex") return std::make_unique<CodexTranslator>();
    return nullptr;
}

}  // namespace orch::permissions
