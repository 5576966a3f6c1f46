#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/ids.hpp"
#include "git/git_cli.hpp"
#include "git/worktree_manager.hpp"

namespace {

using orch::core::errors::get_error;
using orch::core::errors::get_value;
using orch::core::errors::is_error;
using orch::git::GitCli;
using orch::git::WorktreeInfo;
using orch::git::WorktreeManager;
using orch::git::parse_worktree_list;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::temp_directory_path() /
                ("orch_git_" + orch::core::config::generate_uuid());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

// Repository with one commit on main.
bool init_repo(const GitCli& git, const std::filesystem::path& repo) {
    std::filesystem::create_directories(repo);
    {
        std::ofstream out(repo / "README.md");
        out << "# demo\n";
    }
    const std::vector<std::vector<std::string>> steps = {
        {"init", "-q"},
        {"checkout", "-q", "-b", "main"},
        {"add", "README.md"},
        {"-c", "user.email=ops@example.com", "-c", "user.name=ops", "commit", "-q", "-m", "init"},
    };
    for (const auto& args : steps) {
        if (is_error(git.run(repo, args))) return false;
    }
    return true;
}

TEST(GitCliTest, ParsesPorcelainWorktreeList) {
    const std::string porcelain =
        "worktree /src/api\nHEAD 1111\nbranch refs/heads/main\n\n"
        "worktree /wt/api/feat-1\nHEAD 2222\nbranch refs/heads/feature/FEAT-1-x\n\n"
        "worktree /wt/api/fix-2\nHEAD 3333\ndetached\n";
    const auto entries = parse_worktree_list(porcelain);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].path, std::filesystem::path("/src/api"));
    EXPECT_EQ(entries[1].branch.value_or(""), "feature/FEAT-1-x");
    EXPECT_EQ(entries[1].head, "2222");
    EXPECT_TRUE(entries[2].detached);
    EXPECT_FALSE(entries[2].branch.has_value());
}

class WorktreeManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!git_.available()) {
            GTEST_SKIP() << "git not installed";
        }
        repo_ = workspace_.root() / "projects" / "api";
        ASSERT_TRUE(init_repo(git_, repo_));
    }

    TempWorkspace workspace_;
    GitCli git_;
    std::filesystem::path repo_;
};

TEST_F(WorktreeManagerTest, CreatesWorktreeOnNewBranch) {
    WorktreeManager manager(workspace_.root() / "worktrees", git_);
    auto created = manager.create_for_ticket(repo_, "api", "FEAT-1", "feature/FEAT-1-x", "main");
    ASSERT_FALSE(is_error(created)) << get_error(created).message;
    const WorktreeInfo& info = get_value(created);
    EXPECT_EQ(info.path, workspace_.root() / "worktrees" / "api" / "feat-1");
    EXPECT_TRUE(std::filesystem::exists(info.path / "README.md"));
    EXPECT_EQ(info.target_branch, "main");
    EXPECT_EQ(info.base_commit, get_value(git_.rev_parse(repo_, "main")));
    EXPECT_EQ(get_value(git_.current_branch(info.path)), "feature/FEAT-1-x");

    auto dirty = manager.is_dirty(info);
    ASSERT_FALSE(is_error(dirty));
    EXPECT_FALSE(get_value(dirty));
    std::ofstream(info.path / "new.txt") << "x";
    EXPECT_TRUE(get_value(manager.is_dirty(info)));
}

TEST_F(WorktreeManagerTest, EnsureIsIdempotent) {
    WorktreeManager manager(workspace_.root() / "worktrees", git_);
    auto first = manager.ensure_worktree_exists(repo_, "api", "FIX-2", "fix/FIX-2", "main");
    ASSERT_FALSE(is_error(first)) << get_error(first).message;
    auto second = manager.ensure_worktree_exists(repo_, "api", "FIX-2", "fix/FIX-2", "main");
    ASSERT_FALSE(is_error(second)) << get_error(second).message;
    EXPECT_EQ(get_value(first).path, get_value(second).path);
    EXPECT_EQ(get_value(second).branch, "fix/FIX-2");
    EXPECT_EQ(manager.list_project_worktrees("api").size(), 1u);
}

TEST_F(WorktreeManagerTest, RejectsPlainDirectoryAtTargetPath) {
    WorktreeManager manager(workspace_.root() / "worktrees", git_);
    std::filesystem::create_directories(manager.worktree_path("api", "FEAT-3"));
    auto created = manager.create_for_ticket(repo_, "api", "FEAT-3", "feature/FEAT-3", "main");
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).code, "path_not_worktree");
}

TEST_F(WorktreeManagerTest, RejectsBranchCheckedOutElsewhere) {
    WorktreeManager manager(workspace_.root() / "worktrees", git_);
    auto created = manager.create_for_ticket(repo_, "api", "FEAT-4", "main", "main");
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).code, "branch_checked_out");
}

TEST_F(WorktreeManagerTest, RejectsNonRepository) {
    WorktreeManager manager(workspace_.root() / "worktrees", git_);
    const auto plain = workspace_.root() / "plain";
    std::filesystem::create_directories(plain);
    auto created = manager.create_for_ticket(plain, "plain", "FEAT-5", "feature/FEAT-5", "main");
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).code, "not_a_git_repo");
}

TEST_F(WorktreeManagerTest, MissingBaseBranchForksFromHead) {
    WorktreeManager manager(workspace_.root() / "worktrees", git_);
    auto created = manager.create_for_ticket(repo_, "api", "FEAT-6", "feature/FEAT-6", "develop");
    ASSERT_FALSE(is_error(created)) << get_error(created).message;
    EXPECT_EQ(get_value(created).target_branch, "main");
}

TEST_F(WorktreeManagerTest, CleanupRemovesWorktreeAndBranch) {
    WorktreeManager manager(workspace_.root() / "worktrees", git_);
    auto created = manager.create_for_ticket(repo_, "api", "FEAT-7", "feature/FEAT-7", "main");
    ASSERT_FALSE(is_error(created));
    const WorktreeInfo info = get_value(created);

    ASSERT_FALSE(is_error(manager.cleanup_worktree(info, true, true)));
    EXPECT_FALSE(std::filesystem::exists(info.path));
    EXPECT_FALSE(git_.branch_exists(repo_, "feature/FEAT-7"));
    EXPECT_TRUE(manager.list_project_worktrees("api").empty());
}

TEST_F(WorktreeManagerTest, CleanupProjectRemovesEveryTicketWorktree) {
    WorktreeManager manager(workspace_.root() / "worktrees", git_);
    ASSERT_FALSE(is_error(manager.create_for_ticket(repo_, "api", "A-1", "a-1", "main")));
    ASSERT_FALSE(is_error(manager.create_for_ticket(repo_, "api", "A-2", "a-2", "main")));
    EXPECT_EQ(manager.list_project_worktrees("api").size(), 2u);

    ASSERT_FALSE(is_error(manager.cleanup_project_worktrees("api", repo_)));
    EXPECT_TRUE(manager.list_project_worktrees("api").empty());
    auto listed = git_.list_worktrees(repo_);
    ASSERT_FALSE(is_error(listed));
    EXPECT_EQ(get_value(listed).size(), 1u);
}

}  // namespace
