#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/orch_errors.hpp"
#include "issuetypes/issue_type.hpp"
#include "queue/ticket.hpp"

namespace orch::prompt {

// Carry-over from the previous step's status block (or a rejection prompt).
struct PreviousStepContext {
    std::string summary;
    std::optional<std::string> recommendation;
};

// The fixed trailer asking the agent to emit an OPERATOR_STATUS block.
const std::string& status_instructions();

class PromptComposer {
public:
    // templates_dir holds ACCEPTANCE_CRITERIA.md, DEFINITION_OF_DONE.md and
    // DEFINITION_OF_READY.md; any of them may be missing.
    explicit PromptComposer(std::filesystem::path templates_dir);

    nlohmann::json build_context(const queue::Ticket& ticket,
                                 const issuetypes::IssueType& issue_type,
                                 const std::filesystem::path& cwd,
                                 const std::optional<PreviousStepContext>& carry) const;

    // Type prompt, step prompt, ticket contents, previous step context and the
    // status trailer, joined by "\n\n---\n\n".
    core::errors::Result<std::string> compose(
        const queue::Ticket& ticket, const issuetypes::IssueType& issue_type,
        const std::filesystem::path& cwd,
        const std::optional<PreviousStepContext>& carry = std::nullopt) const;

private:
    std::string read_template(const std::string& filename) const;

    std::filesystem::path templates_dir_;
};

}  // namespace orch::prompt
