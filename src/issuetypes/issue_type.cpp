#include "issuetypes/issue_type.hpp"

#include <algorithm>
#include <set>
#include "core/util/text.hpp"

namespace orch::issuetypes {

using core::errors::ErrorCategory;
using core::errors::OrchError;
using nlohmann::json;

namespace {

std::size_t utf8_length(const std::string& value) {
    std::size_t count = 0;
    for (const unsigned char c : value) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::optional<FieldType> parse_field_type(const std::string& value) {
    if (value == "string") return FieldType::String;
    if (value == "enum") return FieldType::Enum;
    if (value == "bool") return FieldType::Bool;
    if (value == "date") return FieldType::Date;
    if (value == "text") return FieldType::Text;
    return std::nullopt;
}

std::optional<AutoStrategy> parse_auto(const std::string& value) {
    if (value == "id") return AutoStrategy::Id;
    if (value == "date") return AutoStrategy::Date;
    if (value == "branch") return AutoStrategy::Branch;
    if (value == "status") return AutoStrategy::Status;
    return std::nullopt;
}

std::string auto_to_string(const AutoStrategy strategy) {
    switch (strategy) {
        case AutoStrategy::Id: return "id";
        case AutoStrategy::Date: return "date";
        case AutoStrategy::Branch: return "branch";
        case AutoStrategy::Status: return "status";
    }
    return "id";
}

std::optional<PermissionMode> parse_permission_mode(const std::string& value) {
    if (value == "default" || value.empty()) return PermissionMode::Default;
    if (value == "plan") return PermissionMode::Plan;
    if (value == "acceptEdits" || value == "accept-edits" || value == "accept_edits") {
        return PermissionMode::AcceptEdits;
    }
    if (value == "delegate") return PermissionMode::Delegate;
    return std::nullopt;
}

// Accepts a JSON scalar and renders it as the string default of a field.
std::optional<std::string> scalar_to_string(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? std::string("true") : std::string("false");
    if (value.is_number()) return value.dump();
    return std::nullopt;
}

OrchError malformed(const std::string& message) {
    return OrchError{ErrorCategory::Malformed, message, "invalid_issue_type"};
}

json field_to_json(const FieldSchema& field) {
    json out = {{"name", field.name},
                {"description", field.description},
                {"type", to_string(field.type)},
                {"required", field.required},
                {"user_editable", field.user_editable}};
    if (field.default_value) out["default"] = *field.default_value;
    if (field.auto_strategy) out["auto"] = auto_to_string(*field.auto_strategy);
    if (!field.options.empty()) out["options"] = field.options;
    if (field.placeholder) out["placeholder"] = *field.placeholder;
    if (field.max_length) out["max_length"] = *field.max_length;
    if (field.display_order) out["display_order"] = *field.display_order;
    return out;
}

core::errors::Result<FieldSchema> field_from_json(const json& j) {
    FieldSchema field;
    field.name = j.value("name", "");
    field.description = j.value("description", "");
    const std::string type = j.value("type", "string");
    const auto parsed_type = parse_field_type(type);
    if (!parsed_type) {
        return malformed("Unknown field type '" + type + "' for field '" + field.name + "'");
    }
    field.type = *parsed_type;
    field.required = j.value("required", false);
    if (j.contains("default") && !j["default"].is_null()) {
        field.default_value = scalar_to_string(j["default"]);
    }
    if (j.contains("auto") && j["auto"].is_string()) {
        const auto strategy = parse_auto(j["auto"].get<std::string>());
        if (!strategy) {
            return malformed("Unknown auto strategy for field '" + field.name + "'");
        }
        field.auto_strategy = strategy;
    }
    field.options = j.value("options", std::vector<std::string>{});
    if (j.contains("placeholder") && j["placeholder"].is_string()) {
        field.placeholder = j["placeholder"].get<std::string>();
    }
    if (j.contains("max_length") && j["max_length"].is_number_unsigned()) {
        field.max_length = j["max_length"].get<std::size_t>();
    }
    if (j.contains("display_order") && j["display_order"].is_number_integer()) {
        field.display_order = j["display_order"].get<int>();
    }
    field.user_editable = j.value("user_editable", true);
    return field;
}

json step_to_json(const StepSchema& step) {
    json out = {{"name", step.name},
                {"outputs", step.outputs},
                {"prompt", step.prompt},
                {"allowed_tools", step.allowed_tools},
                {"requires_review", step.requires_review},
                {"permission_mode", to_string(step.permission_mode)}};
    if (step.display_name) out["display_name"] = *step.display_name;
    if (step.on_reject) {
        out["on_reject"] = {{"goto_step", step.on_reject->goto_step},
                            {"prompt", step.on_reject->prompt}};
    }
    if (step.next_step) out["next_step"] = *step.next_step;
    if (!step.permissions.empty()) {
        out["permissions"] = permissions::step_permissions_to_json(step.permissions);
    }
    if (!step.cli_args.empty()) out["cli_args"] = permissions::cli_args_to_json(step.cli_args);
    if (step.json_schema) out["json_schema"] = *step.json_schema;
    if (step.json_schema_file) out["json_schema_file"] = *step.json_schema_file;
    return out;
}

core::errors::Result<StepSchema> step_from_json(const json& j) {
    StepSchema step;
    step.name = j.value("name", "");
    if (step.name.empty()) {
        return malformed("Step is missing a name");
    }
    if (j.contains("display_name") && j["display_name"].is_string()) {
        step.display_name = j["display_name"].get<std::string>();
    }
    step.outputs = j.value("outputs", std::vector<std::string>{});
    step.prompt = j.value("prompt", "");
    step.allowed_tools = j.value("allowed_tools", std::vector<std::string>{});
    step.requires_review = j.value("requires_review", false);
    if (j.contains("on_reject") && j["on_reject"].is_object()) {
        step.on_reject = OnReject{j["on_reject"].value("goto_step", ""),
                                  j["on_reject"].value("prompt", "")};
    }
    if (j.contains("next_step") && j["next_step"].is_string() &&
        !j["next_step"].get<std::string>().empty()) {
        step.next_step = j["next_step"].get<std::string>();
    }
    if (j.contains("permissions")) {
        auto perms = permissions::step_permissions_from_json(j["permissions"]);
        if (core::errors::is_error(perms)) {
            return core::errors::get_error(perms);
        }
        step.permissions = core::errors::get_value(perms);
    }
    if (j.contains("cli_args")) {
        step.cli_args = permissions::cli_args_from_json(j["cli_args"]);
    }
    const std::string mode = j.value("permission_mode", "default");
    const auto parsed_mode = parse_permission_mode(mode);
    if (!parsed_mode) {
        return malformed("Unknown permission_mode '" + mode + "' on step '" + step.name + "'");
    }
    step.permission_mode = *parsed_mode;
    if (j.contains("json_schema") && !j["json_schema"].is_null()) {
        step.json_schema = j["json_schema"];
    }
    if (j.contains("json_schema_file") && j["json_schema_file"].is_string()) {
        step.json_schema_file = j["json_schema_file"].get<std::string>();
    }
    return step;
}

json source_to_json(const IssueTypeSource& source) {
    switch (source.kind) {
        case IssueTypeSource::Kind::Builtin: return "builtin";
        case IssueTypeSource::Kind::User: return "user";
        case IssueTypeSource::Kind::Import:
            return json{{"type", "import"},
                        {"provider", source.provider},
                        {"project", source.project}};
    }
    return "user";
}

IssueTypeSource source_from_json(const json& j) {
    if (j.is_string()) {
        return j.get<std::string>() == "builtin" ? IssueTypeSource::builtin()
                                                 : IssueTypeSource::user();
    }
    if (j.is_object() && j.value("type", "") == "import") {
        return IssueTypeSource::import(j.value("provider", ""), j.value("project", ""));
    }
    return IssueTypeSource::user();
}

}  // namespace

bool StepSchema::has_output(const std::string& output) const {
    return std::find(outputs.begin(), outputs.end(), output) != outputs.end();
}

std::string IssueTypeSource::label() const {
    switch (kind) {
        case Kind::Builtin: return "builtin";
        case Kind::User: return "user";
        case Kind::Import: return "import:" + provider + "/" + project;
    }
    return "user";
}

const StepSchema* IssueType::find_step(const std::string& step_name) const {
    for (const auto& step : steps) {
        if (step.name == step_name) {
            return &step;
        }
    }
    return nullptr;
}

const StepSchema* IssueType::first_step() const {
    return steps.empty() ? nullptr : &steps.front();
}

std::optional<std::size_t> IssueType::step_index(const std::string& step_name) const {
    for (std::size_t i = 0; i < steps.size(); ++i) {
        if (steps[i].name == step_name) {
            return i;
        }
    }
    return std::nullopt;
}

StatusCategory IssueType::step_status(const std::string& step_name) const {
    const StepSchema* step = find_step(step_name);
    if (step == nullptr) {
        return StatusCategory::Todo;
    }
    if (step->is_terminal()) {
        return StatusCategory::Done;
    }
    if (step->requires_review) {
        return StatusCategory::Await;
    }
    if (step == first_step()) {
        return StatusCategory::Todo;
    }
    return StatusCategory::Doing;
}

std::vector<std::string> IssueType::step_names() const {
    std::vector<std::string> names;
    names.reserve(steps.size());
    for (const auto& step : steps) {
        names.push_back(step.name);
    }
    return names;
}

IssueType IssueType::new_imported(const std::string& key, const std::string& name,
                                  const std::string& provider, const std::string& project,
                                  const std::string& external_id) {
    IssueType issue_type;
    issue_type.key = key;
    issue_type.name = name;
    issue_type.description = name + " imported from " + provider;
    issue_type.glyph = key.substr(0, 1);
    issue_type.source = IssueTypeSource::import(provider, project);
    issue_type.external_id = external_id;

    StepSchema execute;
    execute.name = "execute";
    execute.display_name = "Execute";
    execute.prompt = "Complete the work described in the ticket.";
    execute.allowed_tools = {"*"};
    issue_type.steps.push_back(execute);
    return issue_type;
}

std::vector<ValidationError> validate(const IssueType& issue_type) {
    std::vector<ValidationError> errors;
    const std::string& key = issue_type.key;

    const bool all_upper = !key.empty() &&
                           std::all_of(key.begin(), key.end(),
                                       [](const char c) { return c >= 'A' && c <= 'Z'; });
    if (!all_upper) {
        errors.push_back({"invalid_key", key,
                          "Key '" + key + "' must be uppercase letters only"});
    }
    if (key.size() < 2 || key.size() > 10) {
        errors.push_back({"key_length", key,
                          "Key '" + key + "' must be between 2 and 10 characters"});
    }

    const std::size_t glyph_length = utf8_length(issue_type.glyph);
    if (glyph_length < 1 || glyph_length > 4) {
        errors.push_back({"invalid_glyph", issue_type.glyph,
                          "Glyph '" + issue_type.glyph + "' must be 1-4 characters"});
    }

    if (issue_type.steps.empty()) {
        errors.push_back({"no_steps", "", "Issue type must have at least one step"});
    }

    for (const auto& field : issue_type.fields) {
        if (field.required && !field.auto_strategy && field.name != "id" &&
            !field.default_value) {
            errors.push_back({"missing_default", field.name,
                              "Required field '" + field.name +
                                  "' must have a default value"});
        }
        if (field.type == FieldType::Enum && field.options.empty()) {
            errors.push_back({"missing_enum_options", field.name,
                              "Enum field '" + field.name + "' must have options"});
        }
    }

    std::set<std::string> names;
    for (const auto& step : issue_type.steps) {
        names.insert(step.name);
    }
    for (const auto& step : issue_type.steps) {
        if (step.next_step && names.count(*step.next_step) == 0) {
            errors.push_back({"invalid_step_ref", *step.next_step,
                              "Step '" + step.name + "' references unknown step '" +
                                  *step.next_step + "'"});
        }
        if (step.on_reject && names.count(step.on_reject->goto_step) == 0) {
            errors.push_back({"invalid_step_ref", step.on_reject->goto_step,
                              "Step '" + step.name + "' rejects to unknown step '" +
                                  step.on_reject->goto_step + "'"});
        }
    }
    return errors;
}

std::string describe(const std::vector<ValidationError>& errors) {
    std::vector<std::string> messages;
    messages.reserve(errors.size());
    for (const auto& error : errors) {
        messages.push_back(error.message);
    }
    return core::util::join(messages, "; ");
}

std::string to_string(const FieldType type) {
    switch (type) {
        case FieldType::String: return "string";
        case FieldType::Enum: return "enum";
        case FieldType::Bool: return "bool";
        case FieldType::Date: return "date";
        case FieldType::Text: return "text";
    }
    return "string";
}

std::string to_string(const ExecutionMode mode) {
    return mode == ExecutionMode::Paired ? "paired" : "autonomous";
}

std::string to_string(const PermissionMode mode) {
    switch (mode) {
        case PermissionMode::Default: return "default";
        case PermissionMode::Plan: return "plan";
        case PermissionMode::AcceptEdits: return "acceptEdits";
        case PermissionMode::Delegate: return "delegate";
    }
    return "default";
}

std::string to_string(const StatusCategory category) {
    switch (category) {
        case StatusCategory::Todo: return "TODO";
        case StatusCategory::Doing: return "DOING";
        case StatusCategory::Await: return "AWAIT";
        case StatusCategory::Done: return "DONE";
    }
    return "TODO";
}

json issue_type_to_json(const IssueType& issue_type) {
    json fields = json::array();
    for (const auto& field : issue_type.fields) {
        fields.push_back(field_to_json(field));
    }
    json steps = json::array();
    for (const auto& step : issue_type.steps) {
        steps.push_back(step_to_json(step));
    }
    json out = {{"key", issue_type.key},
                {"name", issue_type.name},
                {"description", issue_type.description},
                {"mode", to_string(issue_type.mode)},
                {"glyph", issue_type.glyph},
                {"project_required", issue_type.project_required},
                {"fields", fields},
                {"steps", steps},
                {"source", source_to_json(issue_type.source)}};
    if (issue_type.color) out["color"] = *issue_type.color;
    if (!issue_type.prompt.empty()) out["prompt"] = issue_type.prompt;
    if (issue_type.agent_prompt) out["agent_prompt"] = *issue_type.agent_prompt;
    if (issue_type.external_id) out["external_id"] = *issue_type.external_id;
    return out;
}

core::errors::Result<IssueType> issue_type_from_json(const json& j) {
    if (!j.is_object()) {
        return malformed("Issue type must be a JSON object");
    }
    IssueType issue_type;
    try {
        issue_type.key = j.value("key", "");
        issue_type.name = j.value("name", issue_type.key);
        issue_type.description = j.value("description", "");
        const std::string mode = j.value("mode", "autonomous");
        if (mode != "autonomous" && mode != "paired") {
            return malformed("Unknown mode '" + mode + "'");
        }
        issue_type.mode = mode == "paired" ? ExecutionMode::Paired : ExecutionMode::Autonomous;
        issue_type.glyph = j.value("glyph", "");
        if (j.contains("color") && j["color"].is_string()) {
            issue_type.color = j["color"].get<std::string>();
        }
        issue_type.project_required = j.value("project_required", true);
        if (j.contains("fields") && j["fields"].is_array()) {
            for (const auto& entry : j["fields"]) {
                auto field = field_from_json(entry);
                if (core::errors::is_error(field)) {
                    return core::errors::get_error(field);
                }
                issue_type.fields.push_back(core::errors::get_value(field));
            }
        }
        if (j.contains("steps") && j["steps"].is_array()) {
            for (const auto& entry : j["steps"]) {
                auto step = step_from_json(entry);
                if (core::errors::is_error(step)) {
                    return core::errors::get_error(step);
                }
                issue_type.steps.push_back(core::errors::get_value(step));
            }
        }
        issue_type.prompt = j.value("prompt", "");
        if (j.contains("agent_prompt") && j["agent_prompt"].is_string()) {
            issue_type.agent_prompt = j["agent_prompt"].get<std::string>();
        }
        issue_type.source = source_from_json(j.value("source", json("user")));
        if (j.contains("external_id") && j["external_id"].is_string()) {
            issue_type.external_id = j["external_id"].get<std::string>();
        }
    } catch (const json::exception& e) {
        return malformed(std::string("Invalid issue type JSON: ") + e.what());
    }
    return issue_type;
}

core::errors::Result<IssueType> parse_issue_type(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return malformed(std::string("Issue type is not valid JSON: ") + e.what());
    }
    return issue_type_from_json(doc);
}

}  // namespace orch::issuetypes
