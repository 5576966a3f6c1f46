#include "workflow/workflow_engine.hpp"

#include <nlohmann/json.hpp>
#include "prompt/mustache.hpp"

namespace orch::workflow {

using core::errors::ErrorCategory;
using core::errors::OrchError;

WorkflowEngine::WorkflowEngine(const issuetypes::IssueTypeRegistry& registry)
    : registry_(registry) {}

core::errors::Result<issuetypes::IssueType> WorkflowEngine::issue_type_for(
    const queue::Ticket& ticket) const {
    auto issue_type = registry_.get(ticket.ticket_type);
    if (!issue_type) {
        return OrchError{ErrorCategory::NotFound, "Unknown issue type: " + ticket.ticket_type,
                         "issuetype_not_found"};
    }
    return *issue_type;
}

core::errors::Result<issuetypes::StepSchema> WorkflowEngine::current_step(
    const queue::Ticket& ticket) const {
    auto issue_type = issue_type_for(ticket);
    if (core::errors::is_error(issue_type)) {
        return core::errors::get_error(issue_type);
    }
    return step_in(core::errors::get_value(issue_type), ticket);
}

core::errors::Result<issuetypes::StepSchema> WorkflowEngine::step_in(
    const issuetypes::IssueType& type, const queue::Ticket& ticket) const {
    const issuetypes::StepSchema* step =
        ticket.step.empty() ? type.first_step() : type.find_step(ticket.step);
    if (step == nullptr) {
        return OrchError{ErrorCategory::Validation,
                         "Step '" + ticket.step + "' is not part of issue type " + type.key,
                         "unknown_step"};
    }
    return *step;
}

core::errors::Result<std::optional<issuetypes::StepSchema>> WorkflowEngine::next_step(
    const queue::Ticket& ticket) const {
    auto issue_type = issue_type_for(ticket);
    if (core::errors::is_error(issue_type)) {
        return core::errors::get_error(issue_type);
    }
    const auto& type = core::errors::get_value(issue_type);
    auto current = step_in(type, ticket);
    if (core::errors::is_error(current)) {
        return core::errors::get_error(current);
    }
    const auto& step = core::errors::get_value(current);
    if (!step.next_step) {
        return std::optional<issuetypes::StepSchema>{};
    }
    const issuetypes::StepSchema* next = type.find_step(*step.next_step);
    if (next == nullptr) {
        return OrchError{ErrorCategory::Validation,
                         "Step '" + *step.next_step + "' is not part of issue type " + type.key,
                         "unknown_step"};
    }
    return std::optional<issuetypes::StepSchema>(*next);
}

core::errors::Result<bool> WorkflowEngine::can_proceed(const queue::Ticket& ticket,
                                                       const ReviewChecker& checker) const {
    auto current = current_step(ticket);
    if (core::errors::is_error(current)) {
        return core::errors::get_error(current);
    }
    const auto& step = core::errors::get_value(current);
    if (!step.requires_review) {
        return true;
    }
    if (step.has_output("pr") && checker) {
        return checker(ticket, step);
    }
    return false;
}

core::errors::Result<std::optional<RejectionStep>> WorkflowEngine::get_rejection_step(
    const queue::Ticket& ticket) const {
    auto current = current_step(ticket);
    if (core::errors::is_error(current)) {
        return core::errors::get_error(current);
    }
    const auto& step = core::errors::get_value(current);
    if (!step.on_reject) {
        return std::optional<RejectionStep>{};
    }
    return std::optional<RejectionStep>(
        RejectionStep{step.on_reject->goto_step, step.on_reject->prompt});
}

core::errors::Result<std::optional<RejectionStep>> WorkflowEngine::render_rejection_prompt(
    const queue::Ticket& ticket, const std::string& reason) const {
    auto rejection = get_rejection_step(ticket);
    if (core::errors::is_error(rejection)) {
        return rejection;
    }
    auto step = core::errors::get_value(rejection);
    if (!step) {
        return step;
    }
    const nlohmann::json context = {
        {"rejection_reason", reason},
        {"id", ticket.id},
        {"summary", ticket.summary},
        {"step", ticket.step},
        {"project", ticket.project},
    };
    auto rendered = prompt::render_template(step->prompt, context);
    if (core::errors::is_error(rendered)) {
        return core::errors::get_error(rendered);
    }
    step->prompt = core::errors::get_value(rendered);
    return step;
}

core::errors::Result<Progress> WorkflowEngine::format_progress(const queue::Ticket& ticket) const {
    auto issue_type = issue_type_for(ticket);
    if (core::errors::is_error(issue_type)) {
        return core::errors::get_error(issue_type);
    }
    const auto& type = core::errors::get_value(issue_type);
    auto current = step_in(type, ticket);
    if (core::errors::is_error(current)) {
        return core::errors::get_error(current);
    }
    const std::string& current_name = core::errors::get_value(current).name;

    Progress progress;
    progress.names = type.step_names();
    progress.total = progress.names.size();
    for (std::size_t i = 0; i < progress.names.size(); ++i) {
        if (i > 0) progress.display += " > ";
        if (progress.names[i] == current_name) {
            progress.index = i;
            progress.display += "[" + progress.names[i] + "]";
        } else {
            progress.display += progress.names[i];
        }
    }
    return progress;
}

core::errors::Result<issuetypes::StatusCategory> WorkflowEngine::step_status_category(
    const queue::Ticket& ticket) const {
    auto issue_type = issue_type_for(ticket);
    if (core::errors::is_error(issue_type)) {
        return core::errors::get_error(issue_type);
    }
    const auto& type = core::errors::get_value(issue_type);
    auto current = step_in(type, ticket);
    if (core::errors::is_error(current)) {
        return core::errors::get_error(current);
    }
    return type.step_status(core::errors::get_value(current).name);
}

}  // namespace orch::workflow
