#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/orch_errors.hpp"
#include "permissions/permission_set.hpp"

namespace orch::issuetypes {

enum class FieldType { String, Enum, Bool, Date, Text };
enum class AutoStrategy { Id, Date, Branch, Status };
enum class ExecutionMode { Autonomous, Paired };
enum class PermissionMode { Default, Plan, AcceptEdits, Delegate };

// Kanban-style category of a step within its workflow.
enum class StatusCategory { Todo, Doing, Await, Done };

struct FieldSchema {
    std::string name;
    std::string description;
    FieldType type = FieldType::String;
    bool required = false;
    std::optional<std::string> default_value;
    std::optional<AutoStrategy> auto_strategy;
    std::vector<std::string> options;
    std::optional<std::string> placeholder;
    std::optional<std::size_t> max_length;
    std::optional<int> display_order;
    bool user_editable = true;
};

struct OnReject {
    std::string goto_step;
    std::string prompt;  // may reference {{ rejection_reason }}
};

struct StepSchema {
    std::string name;
    std::optional<std::string> display_name;
    std::vector<std::string> outputs;
    std::string prompt;
    std::vector<std::string> allowed_tools;
    bool requires_review = false;
    std::optional<OnReject> on_reject;
    std::optional<std::string> next_step;
    permissions::StepPermissions permissions;
    permissions::ProviderCliArgs cli_args;
    PermissionMode permission_mode = PermissionMode::Default;
    std::optional<nlohmann::json> json_schema;
    std::optional<std::string> json_schema_file;

    const std::string& display() const { return display_name ? *display_name : name; }
    bool has_output(const std::string& output) const;
    bool is_terminal() const { return !next_step.has_value(); }
};

struct IssueTypeSource {
    enum class Kind { Builtin, User, Import };
    Kind kind = Kind::User;
    std::string provider;
    std::string project;

    static IssueTypeSource builtin() { return {Kind::Builtin, "", ""}; }
    static IssueTypeSource user() { return {Kind::User, "", ""}; }
    static IssueTypeSource import(std::string provider, std::string project) {
        return {Kind::Import, std::move(provider), std::move(project)};
    }
    std::string label() const;
};

struct IssueType {
    std::string key;
    std::string name;
    std::string description;
    ExecutionMode mode = ExecutionMode::Autonomous;
    std::string glyph;
    std::optional<std::string> color;
    bool project_required = true;
    std::vector<FieldSchema> fields;
    std::vector<StepSchema> steps;
    std::string prompt;  // type-level template placed before the step prompt
    std::optional<std::string> agent_prompt;
    IssueTypeSource source;
    std::optional<std::string> external_id;

    const StepSchema* find_step(const std::string& step_name) const;
    const StepSchema* first_step() const;
    std::optional<std::size_t> step_index(const std::string& step_name) const;
    StatusCategory step_status(const std::string& step_name) const;
    std::vector<std::string> step_names() const;
    bool is_builtin() const { return source.kind == IssueTypeSource::Kind::Builtin; }

    // Type created for an external tracker: one "execute" step allowing every tool.
    static IssueType new_imported(const std::string& key, const std::string& name,
                                  const std::string& provider, const std::string& project,
                                  const std::string& external_id);
};

struct ValidationError {
    std::string code;  // invalid_key, key_length, invalid_glyph, missing_default,
                       // missing_enum_options, no_steps, invalid_step_ref
    std::string subject;
    std::string message;
};

std::vector<ValidationError> validate(const IssueType& issue_type);

// Joined messages of a validation run, for logs and error payloads.
std::string describe(const std::vector<ValidationError>& errors);

std::string to_string(FieldType type);
std::string to_string(ExecutionMode mode);
std::string to_string(PermissionMode mode);
std::string to_string(StatusCategory category);

nlohmann::json issue_type_to_json(const IssueType& issue_type);
core::errors::Result<IssueType> issue_type_from_json(const nlohmann::json& j);
core::errors::Result<IssueType> parse_issue_type(const std::string& text);

}  // namespace orch::issuetypes
