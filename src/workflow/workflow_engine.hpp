#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/orch_errors.hpp"
#include "issuetypes/registry.hpp"
#include "queue/ticket.hpp"

namespace orch::workflow {

struct Progress {
    std::size_t index = 0;
    std::size_t total = 0;
    std::vector<std::string> names;
    std::string display;  // "plan > [implement] > pr"
};

struct RejectionStep {
    std::string goto_step;
    std::string prompt;
};

// External review lookup (e.g. PR approval) for steps that emit a pull request.
using ReviewChecker =
    std::function<bool(const queue::Ticket&, const issuetypes::StepSchema&)>;

// Read-only view of where a ticket stands in its issue type's workflow.
// Callers apply any resulting change through the ticket store.
class WorkflowEngine {
public:
    explicit WorkflowEngine(const issuetypes::IssueTypeRegistry& registry);

    // The step named by ticket.step, or the first step when it is empty.
    core::errors::Result<issuetypes::StepSchema> current_step(const queue::Ticket& ticket) const;
    core::errors::Result<std::optional<issuetypes::StepSchema>> next_step(
        const queue::Ticket& ticket) const;

    // True without review; PR steps defer to the checker; otherwise false.
    core::errors::Result<bool> can_proceed(const queue::Ticket& ticket,
                                           const ReviewChecker& checker = nullptr) const;

    core::errors::Result<std::optional<RejectionStep>> get_rejection_step(
        const queue::Ticket& ticket) const;
    // Rejection prompt with {{ rejection_reason }} filled in.
    core::errors::Result<std::optional<RejectionStep>> render_rejection_prompt(
        const queue::Ticket& ticket, const std::string& reason) const;

    core::errors::Result<Progress> format_progress(const queue::Ticket& ticket) const;
    core::errors::Result<issuetypes::StatusCategory> step_status_category(
        const queue::Ticket& ticket) const;

private:
    core::errors::Result<issuetypes::IssueType> issue_type_for(const queue::Ticket& ticket) const;
    // Resolves the ticket's step inside an already fetched type snapshot.
    core::errors::Result<issuetypes::StepSchema> step_in(const issuetypes::IssueType& type,
                                                         const queue::Ticket& ticket) const;

    const issuetypes::IssueTypeRegistry& registry_;
};

}  // namespace orch::workflow
