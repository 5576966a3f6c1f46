#include "issuetypes/builtins.hpp"

#include <string>
#include <utility>

namespace orch::issuetypes {

namespace {

FieldSchema id_field() {
    FieldSchema field;
    field.name = "id";
    field.description = "Ticket identifier";
    field.required = true;
    field.auto_strategy = AutoStrategy::Id;
    field.user_editable = false;
    field.display_order = 0;
    return field;
}

FieldSchema summary_field() {
    FieldSchema field;
    field.name = "summary";
    field.description = "One-line summary of the work";
    field.required = true;
    field.default_value = "";
    field.placeholder = "What needs to be done?";
    field.max_length = 120;
    field.display_order = 1;
    return field;
}

FieldSchema priority_field() {
    FieldSchema field;
    field.name = "priority";
    field.description = "Urgency of the ticket";
    field.type = FieldType::Enum;
    field.required = true;
    field.default_value = "P2-medium";
    field.options = {"P0-critical", "P1-high", "P2-medium", "P3-low"};
    field.display_order = 2;
    return field;
}

FieldSchema status_field() {
    FieldSchema field;
    field.name = "status";
    field.description = "Lifecycle status";
    field.required = true;
    field.auto_strategy = AutoStrategy::Status;
    field.user_editable = false;
    field.display_order = 3;
    return field;
}

FieldSchema created_field() {
    FieldSchema field;
    field.name = "created";
    field.description = "Creation date";
    field.type = FieldType::Date;
    field.auto_strategy = AutoStrategy::Date;
    field.user_editable = false;
    field.display_order = 4;
    return field;
}

FieldSchema context_field(const std::string& name, const std::string& description) {
    FieldSchema field;
    field.name = name;
    field.description = description;
    field.type = FieldType::Text;
    field.display_order = 10;
    return field;
}

std::vector<FieldSchema> common_fields() {
    return {id_field(), summary_field(), priority_field(), status_field(), created_field()};
}

StepSchema make_step(const std::string& name, const std::string& display_name,
                     std::vector<std::string> outputs, const std::string& prompt,
                     std::vector<std::string> allowed_tools) {
    StepSchema step;
    step.name = name;
    step.display_name = display_name;
    step.outputs = std::move(outputs);
    step.prompt = prompt;
    step.allowed_tools = std::move(allowed_tools);
    return step;
}

const std::vector<std::string> kReadTools = {"Read", "Glob", "Grep"};
const std::vector<std::string> kWriteTools = {"Read", "Write", "Edit", "Glob", "Grep",
                                              "Bash"};

IssueType task_type() {
    IssueType type;
    type.key = "TASK";
    type.name = "Task";
    type.description = "A self-contained unit of work completed in one pass";
    type.glyph = "*";
    type.color = "blue";
    type.fields = common_fields();
    type.prompt = "You are working on {{ id }} in project {{ project }}.";
    type.steps.push_back(make_step(
        "execute", "Execute", {"code"},
        "Complete the task described below: {{ summary }}\n\n"
        "{{#definition_of_done}}Definition of done:\n{{{ definition_of_done }}}{{/definition_of_done}}",
        {"*"}));
    type.source = IssueTypeSource::builtin();
    return type;
}

IssueType feat_type() {
    IssueType type;
    type.key = "FEAT";
    type.name = "Feature";
    type.description = "New functionality planned, reviewed and then built";
    type.glyph = "+";
    type.color = "green";
    type.fields = common_fields();
    type.fields.push_back(context_field("context", "Background and acceptance criteria"));
    type.prompt = "You are building feature {{ id }} for {{ project }} on branch {{ branch }}.";

    StepSchema plan = make_step(
        "plan", "Plan", {"plan"},
        "Write an implementation plan for: {{ summary }}\n"
        "Do not modify source files in this step.\n\n"
        "{{#acceptance_criteria}}Acceptance criteria:\n{{{ acceptance_criteria }}}{{/acceptance_criteria}}",
        kReadTools);
    plan.requires_review = true;
    plan.permission_mode = PermissionMode::Plan;
    plan.on_reject = OnReject{"plan",
                              "The plan was rejected: {{ rejection_reason }}\n"
                              "Revise the plan to address the feedback."};
    plan.next_step = "implement";
    type.steps.push_back(plan);

    StepSchema implement = make_step(
        "implement", "Implement", {"code", "test"},
        "Implement the approved plan for {{ summary }}. Add or update tests.",
        kWriteTools);
    implement.next_step = "pr";
    type.steps.push_back(implement);

    type.steps.push_back(make_step(
        "pr", "Pull Request", {"pr"},
        "Commit the work on {{ branch }} and open a pull request against the base branch.",
        {"Bash", "Read"}));
    type.source = IssueTypeSource::builtin();
    return type;
}

IssueType fix_type() {
    IssueType type;
    type.key = "FIX";
    type.name = "Fix";
    type.description = "Defect investigation and repair";
    type.glyph = "!";
    type.color = "red";
    type.fields = common_fields();
    type.fields.push_back(context_field("reproduction", "Steps to reproduce the defect"));
    type.prompt = "You are fixing {{ id }} in {{ project }}.";

    StepSchema investigate = make_step(
        "investigate", "Investigate", {"report"},
        "Reproduce and locate the root cause of: {{ summary }}", kReadTools);
    investigate.next_step = "fix";
    type.steps.push_back(investigate);

    StepSchema fix = make_step(
        "fix", "Fix", {"code", "test"},
        "Fix the defect and add a regression test.\n"
        "{{#previous_summary}}Findings so far: {{ previous_summary }}{{/previous_summary}}",
        kWriteTools);
    fix.next_step = "pr";
    type.steps.push_back(fix);

    type.steps.push_back(make_step(
        "pr", "Pull Request", {"pr"},
        "Commit the fix on {{ branch }} and open a pull request.", {"Bash", "Read"}));
    type.source = IssueTypeSource::builtin();
    return type;
}

IssueType spike_type() {
    IssueType type;
    type.key = "SPIKE";
    type.name = "Spike";
    type.description = "Time-boxed research producing a written report";
    type.glyph = "?";
    type.color = "magenta";
    type.mode = ExecutionMode::Paired;
    type.fields = common_fields();
    type.fields.push_back(context_field("questions", "Questions the spike should answer"));

    StepSchema research = make_step(
        "research", "Research", {"documentation"},
        "Research the question: {{ summary }}. Collect findings and trade-offs.", kReadTools);
    research.next_step = "report";
    type.steps.push_back(research);

    StepSchema report = make_step(
        "report", "Report", {"report"},
        "Write a report with a recommendation.\n"
        "{{#previous_summary}}Research notes: {{ previous_summary }}{{/previous_summary}}",
        {"Read", "Write"});
    report.requires_review = true;
    report.on_reject = OnReject{"research",
                                "The report was rejected: {{ rejection_reason }}\n"
                                "Continue the research to close the gaps."};
    type.steps.push_back(report);
    type.source = IssueTypeSource::builtin();
    return type;
}

IssueType inv_type() {
    IssueType type;
    type.key = "INV";
    type.name = "Investigation";
    type.description = "Incident triage raised from an external alert";
    type.glyph = "%";
    type.color = "yellow";
    type.project_required = false;
    type.fields = common_fields();
    type.fields.push_back(context_field("source", "System that raised the alert"));

    FieldSchema severity;
    severity.name = "severity";
    severity.description = "Alert severity";
    severity.type = FieldType::Enum;
    severity.default_value = "medium";
    severity.options = {"critical", "high", "medium", "low"};
    severity.display_order = 5;
    type.fields.push_back(severity);

    StepSchema triage = make_step(
        "triage", "Triage", {"report"},
        "Triage the incident: {{ summary }}. Identify impact and likely cause.", kReadTools);
    triage.next_step = "mitigate";
    type.steps.push_back(triage);

    type.steps.push_back(make_step(
        "mitigate", "Mitigate", {"code", "report"},
        "Mitigate the incident and document follow-up actions.\n"
        "{{#previous_summary}}Triage findings: {{ previous_summary }}{{/previous_summary}}",
        kWriteTools));
    type.source = IssueTypeSource::builtin();
    return type;
}

}  // namespace

std::vector<IssueType> builtin_issue_types() {
    return {task_type(), feat_type(), fix_type(), spike_type(), inv_type()};
}

}  // namespace orch::issuetypes
