#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/orch_errors.hpp"
#include "issuetypes/registry.hpp"
#include "permissions/permission_set.hpp"
#include "session/artifact_writer.hpp"

namespace orch::permissions {

struct GeneratedConfig {
    std::vector<std::string> cli_flags;
    std::optional<std::filesystem::path> config_path;
};

// Reads <project>/.operator/permissions.json. Missing file yields an empty set.
core::errors::Result<StepPermissions> load_project_permissions(
    const std::filesystem::path& project_path);

// Combines project and step permissions and hands them to a provider translator.
// Additive only: nothing granted by either side is ever removed.
class PermissionResolver {
public:
    PermissionResolver(const issuetypes::IssueTypeRegistry& registry,
                       std::filesystem::path tickets_dir, session::ArtifactWriter artifacts);

    core::errors::Result<PermissionSet> resolve(const std::filesystem::path& project_path,
                                                const std::string& type_key,
                                                const std::string& step_name) const;

    // Writes aux config files and audit.json under sessions/<ticket_id>/.
    core::errors::Result<GeneratedConfig> generate_config(
        const std::string& provider, const std::filesystem::path& project_path,
        const std::string& type_key, const std::string& step_name,
        const std::string& ticket_id, const std::string& session_id) const;

private:
    core::errors::Result<issuetypes::StepSchema> find_step(const std::string& type_key,
                                                           const std::string& step_name) const;

    const issuetypes::IssueTypeRegistry& registry_;
    std::filesystem::path tickets_dir_;
    session::ArtifactWriter artifacts_;
};

}  // namespace orch::permissions
