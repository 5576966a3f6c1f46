#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/orch_errors.hpp"

namespace orch::git {

// One entry of `git worktree list --porcelain`.
struct WorktreeEntry {
    std::filesystem::path path;
    std::string head;
    std::optional<std::string> branch;  // without refs/heads/
    bool bare = false;
    bool detached = false;
};

std::vector<WorktreeEntry> parse_worktree_list(const std::string& porcelain);

// Thin wrapper over the git binary. Every call runs in the given directory.
class GitCli {
public:
    explicit GitCli(std::string binary = "git", std::uint32_t timeout_ms = 60000);

    // stdout of a successful run; External git_failed with stderr otherwise.
    core::errors::Result<std::string> run(const std::filesystem::path& directory,
                                          const std::vector<std::string>& args) const;

    bool available() const;
    bool is_repository(const std::filesystem::path& directory) const;
    core::errors::Result<std::string> rev_parse(const std::filesystem::path& directory,
                                                const std::string& ref) const;
    core::errors::Result<std::string> current_branch(const std::filesystem::path& directory) const;
    bool branch_exists(const std::filesystem::path& repo, const std::string& branch) const;

    core::errors::Result<std::vector<WorktreeEntry>> list_worktrees(
        const std::filesystem::path& repo) const;
    core::errors::Status worktree_add(const std::filesystem::path& repo,
                                      const std::filesystem::path& path, const std::string& branch,
                                      const std::optional<std::string>& create_from) const;
    core::errors::Status worktree_remove(const std::filesystem::path& repo,
                                         const std::filesystem::path& path, bool force) const;
    core::errors::Status worktree_prune(const std::filesystem::path& repo) const;
    core::errors::Status delete_branch(const std::filesystem::path& repo, const std::string& branch,
                                       bool force) const;
    // True when `git status --porcelain` reports anything.
    core::errors::Result<bool> has_changes(const std::filesystem::path& directory) const;

private:
    std::string binary_;
    std::uint32_t timeout_ms_;
};

}  // namespace orch::git
