#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/orch_errors.hpp"
#include "git/git_cli.hpp"

namespace orch::git {

struct WorktreeInfo {
    std::filesystem::path path;
    std::string branch;
    std::string base_commit;
    std::string target_branch;
    std::filesystem::path repo_path;
};

// Per-ticket git worktrees under <base>/<project>/<ticket_id lowercased>.
// Operations on different paths may run concurrently; callers must not
// target the same path from two threads.
class WorktreeManager {
public:
    explicit WorktreeManager(std::filesystem::path base_dir, GitCli git = GitCli());

    const std::filesystem::path& base_dir() const { return base_dir_; }
    std::filesystem::path worktree_path(const std::string& project,
                                        const std::string& ticket_id) const;

    core::errors::Result<WorktreeInfo> create_for_ticket(const std::filesystem::path& repo,
                                                         const std::string& project,
                                                         const std::string& ticket_id,
                                                         const std::string& branch,
                                                         const std::string& base_branch) const;

    // Returns the existing worktree when the path already is one.
    core::errors::Result<WorktreeInfo> ensure_worktree_exists(
        const std::filesystem::path& repo, const std::string& project,
        const std::string& ticket_id, const std::string& branch,
        const std::string& base_branch) const;

    std::vector<WorktreeInfo> list_project_worktrees(const std::string& project) const;

    core::errors::Status cleanup_worktree(const WorktreeInfo& info, bool delete_branch,
                                          bool force) const;
    core::errors::Status cleanup_project_worktrees(const std::string& project,
                                                   const std::filesystem::path& repo) const;

    core::errors::Result<bool> is_dirty(const WorktreeInfo& info) const;

    const GitCli& git() const { return git_; }

private:
    core::errors::Result<std::vector<WorktreeEntry>> repo_worktrees(
        const std::filesystem::path& repo) const;

    std::filesystem::path base_dir_;
    GitCli git_;
};

}  // namespace orch::git
