#include "git/worktree_manager.hpp"

#include <fstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/util/text.hpp"

namespace orch::git {

using core::errors::ErrorCategory;
using core::errors::OrchError;

namespace {

std::filesystem::path normalized(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    return ec ? path.lexically_normal() : canonical;
}

// A linked worktree has a .git file "gitdir: <repo>/.git/worktrees/<name>".
std::optional<std::filesystem::path> repo_from_gitfile(const std::filesystem::path& worktree) {
    std::ifstream in(worktree / ".git");
    std::string line;
    if (!in.is_open() || !std::getline(in, line) || !core::util::starts_with(line, "gitdir: ")) {
        return std::nullopt;
    }
    const std::filesystem::path gitdir = core::util::trim(line.substr(8));
    // <repo>/.git/worktrees/<name> -> <repo>
    return gitdir.parent_path().parent_path().parent_path();
}

}  // namespace

WorktreeManager::WorktreeManager(std::filesystem::path base_dir, GitCli git)
    : base_dir_(std::move(base_dir)), git_(std::move(git)) {}

std::filesystem::path WorktreeManager::worktree_path(const std::string& project,
                                                     const std::string& ticket_id) const {
    return base_dir_ / project / core::util::lowercase(ticket_id);
}

core::errors::Result<std::vector<WorktreeEntry>> WorktreeManager::repo_worktrees(
    const std::filesystem::path& repo) const {
    if (!git_.is_repository(repo)) {
        return OrchError{ErrorCategory::Precondition, "Not a git repository: " + repo.string(),
                         "not_a_git_repo"};
    }
    return git_.list_worktrees(repo);
}

core::errors::Result<WorktreeInfo> WorktreeManager::create_for_ticket(
    const std::filesystem::path& repo, const std::string& project, const std::string& ticket_id,
    const std::string& branch, const std::string& base_branch) const {
    auto entries = repo_worktrees(repo);
    if (core::errors::is_error(entries)) {
        return core::errors::get_error(entries);
    }

    const auto path = worktree_path(project, ticket_id);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return OrchError{ErrorCategory::Conflict,
                         "Path exists and is not a worktree of " + repo.string() + ": " +
                             path.string(),
                         "path_not_worktree"};
    }
    for (const auto& entry : core::errors::get_value(entries)) {
        if (entry.branch && *entry.branch == branch) {
            return OrchError{ErrorCategory::Conflict,
                             "Branch " + branch + " is already checked out at " +
                                 entry.path.string(),
                             "branch_checked_out"};
        }
    }

    auto base_commit = git_.rev_parse(repo, base_branch);
    std::string target_branch = base_branch;
    if (core::errors::is_error(base_commit)) {
        // Repos whose default branch is not base_branch fork from HEAD instead.
        auto head_branch = git_.current_branch(repo);
        base_commit = git_.rev_parse(repo, "HEAD");
        if (core::errors::is_error(base_commit)) {
            return core::errors::get_error(base_commit);
        }
        if (!core::errors::is_error(head_branch)) {
            target_branch = core::errors::get_value(head_branch);
        }
        LOG_WARN("Base branch " + base_branch + " not found, forking " + branch + " from " +
                 target_branch);
    }

    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return OrchError{ErrorCategory::External,
                         "Unable to create worktree parent: " + path.parent_path().string(),
                         "worktree_dir_create_failed"};
    }

    const bool reuse_branch = git_.branch_exists(repo, branch);
    auto added = git_.worktree_add(
        repo, path, branch,
        reuse_branch ? std::nullopt : std::optional<std::string>(core::errors::get_value(base_commit)));
    if (core::errors::is_error(added)) {
        return core::errors::get_error(added);
    }
    LOG_INFO("Worktree for " + ticket_id + " -> " + path.string() + " (" + branch + ")");
    return WorktreeInfo{path, branch, core::errors::get_value(base_commit), target_branch, repo};
}

core::errors::Result<WorktreeInfo> WorktreeManager::ensure_worktree_exists(
    const std::filesystem::path& repo, const std::string& project, const std::string& ticket_id,
    const std::string& branch, const std::string& base_branch) const {
    auto entries = repo_worktrees(repo);
    if (core::errors::is_error(entries)) {
        return core::errors::get_error(entries);
    }
    const auto path = worktree_path(project, ticket_id);
    const auto wanted = normalized(path);
    for (const auto& entry : core::errors::get_value(entries)) {
        if (normalized(entry.path) != wanted) continue;

        std::string base_commit;
        auto base = git_.rev_parse(repo, base_branch);
        if (!core::errors::is_error(base)) {
            auto merge_base = git_.run(path, {"merge-base", "HEAD", core::errors::get_value(base)});
            base_commit = core::errors::is_error(merge_base)
                              ? core::errors::get_value(base)
                              : core::util::trim(core::errors::get_value(merge_base));
        }
        return WorktreeInfo{path, entry.branch.value_or(branch), base_commit, base_branch, repo};
    }
    return create_for_ticket(repo, project, ticket_id, branch, base_branch);
}

std::vector<WorktreeInfo> WorktreeManager::list_project_worktrees(const std::string& project) const {
    std::vector<WorktreeInfo> worktrees;
    const auto dir = base_dir_ / project;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return worktrees;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_directory()) continue;
        const auto repo = repo_from_gitfile(entry.path());
        if (!repo) continue;

        WorktreeInfo info;
        info.path = entry.path();
        info.repo_path = *repo;
        auto branch = git_.current_branch(entry.path());
        if (!core::errors::is_error(branch)) {
            info.branch = core::errors::get_value(branch);
        }
        worktrees.push_back(info);
    }
    return worktrees;
}

core::errors::Status WorktreeManager::cleanup_worktree(const WorktreeInfo& info,
                                                       const bool delete_branch,
                                                       const bool force) const {
    auto removed = git_.worktree_remove(info.repo_path, info.path, force);
    if (core::errors::is_error(removed)) {
        if (!force) {
            return removed;
        }
        std::error_code ec;
        std::filesystem::remove_all(info.path, ec);
        auto pruned = git_.worktree_prune(info.repo_path);
        if (core::errors::is_error(pruned)) {
            return pruned;
        }
    }
    if (delete_branch && !info.branch.empty()) {
        auto deleted = git_.delete_branch(info.repo_path, info.branch, force);
        if (core::errors::is_error(deleted)) {
            return deleted;
        }
    }
    LOG_INFO("Removed worktree " + info.path.string());
    return core::errors::ok();
}

core::errors::Status WorktreeManager::cleanup_project_worktrees(
    const std::string& project, const std::filesystem::path& repo) const {
    for (auto info : list_project_worktrees(project)) {
        if (normalized(info.repo_path) != normalized(repo)) continue;
        auto cleaned = cleanup_worktree(info, false, true);
        if (core::errors::is_error(cleaned)) {
            return cleaned;
        }
    }
    return core::errors::ok();
}

core::errors::Result<bool> WorktreeManager::is_dirty(const WorktreeInfo& info) const {
    return git_.has_changes(info.path);
}

}  // namespace orch::git
