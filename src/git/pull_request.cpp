#include "git/pull_request.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "core/process/process_runner.hpp"
#include "core/util/text.hpp"

namespace orch::git {

using core::errors::ErrorCategory;
using core::errors::OrchError;
using nlohmann::json;

bool PullRequestStatus::approved() const {
    if (state == PullRequestState::Merged) {
        return true;
    }
    return state == PullRequestState::Open && !draft && review_decision == "APPROVED";
}

core::errors::Result<PullRequestStatus> parse_pr_view(const std::string& json_text) {
    json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return OrchError{ErrorCategory::Malformed, "Unreadable gh pr view output", "gh_output_invalid"};
    }

    PullRequestStatus status;
    const auto state_field = doc.find("state");
    if (state_field == doc.end() || !state_field->is_string()) {
        return OrchError{ErrorCategory::Malformed, "gh pr view output has no state",
                         "gh_output_invalid"};
    }
    const std::string state = core::util::uppercase(state_field->get<std::string>());
    if (state == "OPEN") {
        status.state = PullRequestState::Open;
    } else if (state == "MERGED") {
        status.state = PullRequestState::Merged;
    } else {
        status.state = PullRequestState::Closed;
    }
    const auto decision = doc.find("reviewDecision");
    if (decision != doc.end() && decision->is_string()) {
        status.review_decision = core::util::uppercase(decision->get<std::string>());
    }
    const auto draft = doc.find("isDraft");
    status.draft = draft != doc.end() && draft->is_boolean() && draft->get<bool>();
    const auto url = doc.find("url");
    if (url != doc.end() && url->is_string()) {
        status.url = url->get<std::string>();
    }
    return status;
}

PullRequestClient::PullRequestClient(std::string binary, std::uint32_t timeout_ms)
    : binary_(std::move(binary)), timeout_ms_(timeout_ms) {}

core::errors::Result<PullRequestStatus> PullRequestClient::status(
    const std::filesystem::path& directory, const std::string& branch) const {
    core::process::ProcessRequest request;
    request.argv = {binary_, "pr", "view", branch, "--json", "state,reviewDecision,isDraft,url"};
    request.working_directory = directory;
    request.timeout_ms = timeout_ms_;

    auto capture = core::process::run_process(request);
    if (core::errors::is_error(capture)) {
        return core::errors::get_error(capture);
    }
    const auto& result = core::errors::get_value(capture);
    if (result.timed_out) {
        return OrchError{ErrorCategory::External, "gh pr view " + branch + " timed out",
                         "gh_timeout"};
    }
    if (!result.success()) {
        OrchError error{ErrorCategory::External,
                        "gh pr view " + branch + " failed: " + core::util::trim(result.stderr_text),
                        "gh_failed"};
        LOG_DEBUG(error.message);
        return error;
    }
    return parse_pr_view(result.stdout_text);
}

}  // namespace orch::git
