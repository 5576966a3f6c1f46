#include "prompt/prompt_composer.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <vector>
#include "core/util/text.hpp"
#include "prompt/mustache.hpp"

namespace orch::prompt {

using core::errors::ErrorCategory;
using core::errors::OrchError;
using nlohmann::json;

namespace {

const char* const kSeparator = "\n\n---\n\n";

std::string read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return "";
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return "";
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

const std::string& status_instructions() {
    static const std::string text =
        "## Status Reporting\n"
        "\n"
        "When you finish working on this step, print a status block exactly in this format:\n"
        "\n"
        "---OPERATOR_STATUS---\n"
        "status: complete | in_progress | blocked | failed\n"
        "exit_signal: true | false\n"
        "confidence: <0-100>\n"
        "files_modified: <number>\n"
        "tests_status: passing | failing | skipped | not_run\n"
        "error_count: <number>\n"
        "tasks_completed: <number>\n"
        "tasks_remaining: <number>\n"
        "summary: <one paragraph describing what was done>\n"
        "recommendation: <what should happen next>\n"
        "blockers: <comma-separated list, if any>\n"
        "---END_OPERATOR_STATUS---\n"
        "\n"
        "`status` and `exit_signal` are required. Set `exit_signal: true` only when this\n"
        "step's work is complete and the ticket can move on.";
    return text;
}

PromptComposer::PromptComposer(std::filesystem::path templates_dir)
    : templates_dir_(std::move(templates_dir)) {}

std::string PromptComposer::read_template(const std::string& filename) const {
    return read_file(templates_dir_ / filename);
}

json PromptComposer::build_context(const queue::Ticket& ticket,
                                   const issuetypes::IssueType& issue_type,
                                   const std::filesystem::path& cwd,
                                   const std::optional<PreviousStepContext>& carry) const {
    const std::string step =
        ticket.step.empty() && issue_type.first_step() != nullptr ? issue_type.first_step()->name
                                                                   : ticket.step;
    json context = {
        {"id", ticket.id},
        {"ticket_type", ticket.ticket_type},
        {"summary", ticket.summary},
        {"priority", ticket.priority},
        {"status", ticket.status},
        {"step", step},
        {"content", ticket.content},
        {"filename", ticket.filename},
        {"filepath", ticket.filepath.string()},
        {"timestamp", ticket.timestamp},
        {"project", ticket.project},
        {"branch", ticket.branch.value_or(ticket.branch_name())},
        {"ticket_path", "../.tickets/in-progress/" + ticket.filename},
        {"cwd", cwd.string()},
        {"step_count", issue_type.steps.size()},
        {"step_names", core::util::join(issue_type.step_names(), ", ")},
        {"acceptance_criteria", read_template("ACCEPTANCE_CRITERIA.md")},
        {"definition_of_done", read_template("DEFINITION_OF_DONE.md")},
        {"definition_of_ready", read_template("DEFINITION_OF_READY.md")},
        {"previous_summary", carry ? carry->summary : ""},
        {"previous_recommendation", carry ? carry->recommendation.value_or("") : ""},
        {"status_instructions", status_instructions()},
    };
    // Frontmatter fields are reachable too, without shadowing the keys above.
    for (const auto& [key, value] : ticket.frontmatter) {
        if (!context.contains(key)) {
            context[key] = value;
        }
    }
    return context;
}

core::errors::Result<std::string> PromptComposer::compose(
    const queue::Ticket& ticket, const issuetypes::IssueType& issue_type,
    const std::filesystem::path& cwd, const std::optional<PreviousStepContext>& carry) const {
    const issuetypes::StepSchema* step =
        ticket.step.empty() ? issue_type.first_step() : issue_type.find_step(ticket.step);
    if (step == nullptr) {
        return OrchError{ErrorCategory::Validation,
                         "Step '" + ticket.step + "' is not part of issue type " + issue_type.key,
                         "unknown_step"};
    }
    const json context = build_context(ticket, issue_type, cwd, carry);

    std::vector<std::string> parts;
    for (const std::string* source : {&issue_type.prompt, &step->prompt}) {
        if (source->empty()) continue;
        auto rendered = render_template(*source, context);
        if (core::errors::is_error(rendered)) {
            return core::errors::get_error(rendered);
        }
        const std::string text = core::util::trim(core::errors::get_value(rendered));
        if (!text.empty()) {
            parts.push_back(text);
        }
    }

    const std::string contents = read_file(ticket.filepath);
    if (!core::util::trim(contents).empty()) {
        parts.push_back("## Ticket Contents\n\n" + core::util::trim(contents));
    }

    if (carry) {
        std::string section = "## Previous Step Context\n\n**Summary:** " + carry->summary;
        if (carry->recommendation && !carry->recommendation->empty()) {
            section += "\n\n**Recommendation:** " + *carry->recommendation;
        }
        parts.push_back(section);
    }

    parts.push_back(status_instructions());
    return core::util::join(parts, kSeparator);
}

}  // namespace orch::prompt
