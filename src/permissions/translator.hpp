#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "permissions/permission_set.hpp"

namespace orch::permissions {

// The only place that knows a provider's flag and config vocabulary.
class ProviderTranslator {
public:
    virtual ~ProviderTranslator() = default;

    virtual std::string provider_name() const = 0;
    virtual std::vector<std::string> generate_cli_flags(const PermissionSet& set) const = 0;
    // Contents of the provider's config file, nullopt when it takes flags only.
    virtual std::optional<std::string> generate_config(const PermissionSet& set) const = 0;
    virtual std::optional<std::string> config_filename() const = 0;
};

class ClaudeTranslator : public ProviderTranslator {
public:
    std::string provider_name() const override { return "claude"; }
    std::vector<std::string> generate_cli_flags(const PermissionSet& set) const override;
    std::optional<std::string> generate_config(const PermissionSet& set) const override;
    std::optional<std::string> config_filename() const override { return std::nullopt; }
};

class GeminiTranslator : public ProviderTranslator {
public:
    std::string provider_name() const override { return "gemini"; }
    std::vector<std::string> generate_cli_flags(const PermissionSet& set) const override;
    std::optional<std::string> generate_config(const PermissionSet& set) const override;
    std::optional<std::string> config_filename() const override { return "settings.json"; }
};

class CodexTranslator : public ProviderTranslator {
public:
    std::string provider_name() const override { return "codex"; }
    std::vector<std::string> generate_cli_flags(const PermissionSet& set) const override;
    std::optional<std::string> generate_config(const PermissionSet& set) const override;
    std::optional<std::string> config_filename() const override { return "config.toml"; }

    // Bash -> exec, Read -> read_file, Write -> write_file, Edit -> apply_patch.
    static std::string map_tool_name(const std::string& tool);
};

// nullptr for an unknown provider.
std::unique_ptr<ProviderTranslator> make_translator(const std::string& provider);

}  // namespace orch::permissions
