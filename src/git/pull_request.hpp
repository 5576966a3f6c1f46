#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/orch_errors.hpp"

namespace orch::git {

enum class PullRequestState { Open, Merged, Closed };

struct PullRequestStatus {
    PullRequestState state = PullRequestState::Open;
    std::string review_decision;  // APPROVED, CHANGES_REQUESTED, REVIEW_REQUIRED or empty
    bool draft = false;
    std::string url;

    // Merged, or open, not a draft and approved by review.
    bool approved() const;
};

// Parses `gh pr view --json state,reviewDecision,isDraft,url` output.
core::errors::Result<PullRequestStatus> parse_pr_view(const std::string& json_text);

// Looks up the pull request of a branch through the GitHub CLI.
class PullRequestClient {
public:
    explicit PullRequestClient(std::string binary = "gh", std::uint32_t timeout_ms = 30000);

    // External gh_failed when gh is missing, unauthenticated or the branch has no PR.
    core::errors::Result<PullRequestStatus> status(const std::filesystem::path& directory,
                                                   const std::string& branch) const;

private:
    std::string binary_;
    std::uint32_t timeout_ms_;
};

}  // namespace orch::git
