#include "permissions/resolver.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "core/util/time.hpp"
#include "permissions/translator.hpp"

namespace orch::permissions {

using core::errors::ErrorCategory;
using core::errors::OrchError;
using nlohmann::json;

namespace {

// "Bash(npm test:*)" -> {Bash, "npm test:*"}.
ToolPattern parse_allowed_tool(const std::string& text) {
    const auto open = text.find('(');
    if (open != std::string::npos && !text.empty() && text.back() == ')') {
        return ToolPattern{text.substr(0, open), text.substr(open + 1, text.size() - open - 2)};
    }
    return ToolPattern{text, std::nullopt};
}

}  // namespace

core::errors::Result<StepPermissions> load_project_permissions(
    const std::filesystem::path& project_path) {
    const auto path = project_path / ".operator" / "permissions.json";
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return StepPermissions{};
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return OrchError{ErrorCategory::External, "Unable to read " + path.string(),
                         "permissions_read_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    json doc;
    try {
        doc = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return OrchError{ErrorCategory::Malformed,
                         "Invalid permissions file " + path.string() + ": " + e.what(),
                         "invalid_permissions"};
    }
    return step_permissions_from_json(doc);
}

PermissionResolver::PermissionResolver(const issuetypes::IssueTypeRegistry& registry,
                                       std::filesystem::path tickets_dir,
                                       session::ArtifactWriter artifacts)
    : registry_(registry), tickets_dir_(std::move(tickets_dir)), artifacts_(std::move(artifacts)) {}

core::errors::Result<issuetypes::StepSchema> PermissionResolver::find_step(
    const std::string& type_key, const std::string& step_name) const {
    const auto issue_type = registry_.get(type_key);
    if (!issue_type) {
        return OrchError{ErrorCategory::NotFound, "Unknown issue type: " + type_key,
                         "issuetype_not_found"};
    }
    const issuetypes::StepSchema* step =
        step_name.empty() ? issue_type->first_step() : issue_type->find_step(step_name);
    if (step == nullptr) {
        return OrchError{ErrorCategory::Validation,
                         "Step '" + step_name + "' is not part of issue type " + type_key,
                         "unknown_step"};
    }
    return *step;
}

core::errors::Result<PermissionSet> PermissionResolver::resolve(
    const std::filesystem::path& project_path, const std::string& type_key,
    const std::string& step_name) const {
    auto project = load_project_permissions(project_path);
    if (core::errors::is_error(project)) {
        return core::errors::get_error(project);
    }
    auto step = find_step(type_key, step_name);
    if (core::errors::is_error(step)) {
        return core::errors::get_error(step);
    }
    const issuetypes::StepSchema& schema = core::errors::get_value(step);

    PermissionSet step_set = PermissionSet::from_fragment(schema.permissions);
    step_set.cli_args = schema.cli_args;
    for (const auto& tool : schema.allowed_tools) {
        if (tool != "*") {
            step_set.allow_tool(parse_allowed_tool(tool));
        }
    }

    PermissionSet merged =
        PermissionSet::merge(PermissionSet::from_fragment(core::errors::get_value(project)), step_set);
    std::error_code ec;
    const auto tickets = std::filesystem::weakly_canonical(tickets_dir_, ec);
    merged.allow_directory(ec ? tickets_dir_.string() : tickets.string());
    return merged;
}

core::errors::Result<GeneratedConfig> PermissionResolver::generate_config(
    const std::string& provider, const std::filesystem::path& project_path,
    const std::string& type_key, const std::string& step_name, const std::string& ticket_id,
    const std::string& session_id) const {
    const auto translator = make_translator(provider);
    if (!translator) {
        return OrchError{ErrorCategory::Input, "No permission translator for provider: " + provider,
                         "unknown_provider"};
    }
    auto resolved = resolve(project_path, type_key, step_name);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const PermissionSet& set = core::errors::get_value(resolved);
    auto step = find_step(type_key, step_name);
    if (core::errors::is_error(step)) {
        return core::errors::get_error(step);
    }
    const issuetypes::StepSchema& schema = core::errors::get_value(step);

    auto session_dir = artifacts_.session_dir(ticket_id);
    if (core::errors::is_error(session_dir)) {
        return core::errors::get_error(session_dir);
    }
    const auto dir = core::errors::get_value(session_dir);

    GeneratedConfig generated;
    generated.cli_flags = translator->generate_cli_flags(set);

    if (const auto filename = translator->config_filename()) {
        const auto content = translator->generate_config(set);
        auto written = artifacts_.write_session_file(ticket_id, *filename, content.value_or(""));
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }
        generated.config_path = core::errors::get_value(written);
        generated.cli_flags.push_back("--config-dir");
        generated.cli_flags.push_back(dir.string());
    }

    if (provider == "claude" && schema.permission_mode != issuetypes::PermissionMode::Default) {
        generated.cli_flags.push_back("--permission-mode");
        generated.cli_flags.push_back(issuetypes::to_string(schema.permission_mode));
    }

    if (schema.json_schema) {
        auto written = artifacts_.write_session_file(ticket_id, "schema.json",
                                                     schema.json_schema->dump(2) + "\n");
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }
        generated.cli_flags.push_back("--json-schema");
        generated.cli_flags.push_back(core::errors::get_value(written).string());
    } else if (schema.json_schema_file) {
        std::filesystem::path schema_path = *schema.json_schema_file;
        if (schema_path.is_relative()) {
            schema_path = project_path / schema_path;
        }
        std::error_code ec;
        if (!std::filesystem::exists(schema_path, ec)) {
            return OrchError{ErrorCategory::Precondition,
                             "JSON schema file not found: " + schema_path.string(),
                             "json_schema_missing"};
        }
        generated.cli_flags.push_back("--json-schema");
        generated.cli_flags.push_back(schema_path.string());
    }

    if (const auto it = set.cli_args.find(provider); it != set.cli_args.end()) {
        generated.cli_flags.insert(generated.cli_flags.end(), it->second.begin(), it->second.end());
    }

    json audit = {
        {"session_id", session_id},
        {"ticket_id", ticket_id},
        {"step", schema.name},
        {"provider", provider},
        {"timestamp", core::util::format_iso8601(core::util::now_epoch_seconds())},
        {"flags", generated.cli_flags},
        {"config_path", generated.config_path ? json(generated.config_path->string()) : json()},
    };
    auto audited = artifacts_.write_audit(ticket_id, audit);
    if (core::errors::is_error(audited)) {
        return core::errors::get_error(audited);
    }
    LOG_DEBUG("Permissions for " + ticket_id + "/" + schema.name + " -> " +
              std::to_string(generated.cli_flags.size()) + " flags (" + provider + ")");
    return generated;
}

}  // namespace orch::permissions
