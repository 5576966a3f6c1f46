#include "git/git_cli.hpp"

#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/process/process_runner.hpp"
#include "core/util/text.hpp"

namespace orch::git {

using core::errors::ErrorCategory;
using core::errors::OrchError;

std::vector<WorktreeEntry> parse_worktree_list(const std::string& porcelain) {
    std::vector<WorktreeEntry> entries;
    std::istringstream lines(porcelain);
    std::string line;
    std::optional<WorktreeEntry> current;
    auto flush = [&]() {
        if (current) {
            entries.push_back(*current);
            current.reset();
        }
    };
    while (std::getline(lines, line)) {
        if (line.empty()) {
            flush();
            continue;
        }
        if (core::util::starts_with(line, "worktree ")) {
            flush();
            current = WorktreeEntry{};
            current->path = line.substr(9);
        } else if (!current) {
            continue;
        } else if (core::util::starts_with(line, "HEAD ")) {
            current->head = line.substr(5);
        } else if (core::util::starts_with(line, "branch ")) {
            std::string ref = line.substr(7);
            const std::string prefix = "refs/heads/";
            if (core::util::starts_with(ref, prefix)) ref = ref.substr(prefix.size());
            current->branch = ref;
        } else if (line == "bare") {
            current->bare = true;
        } else if (line == "detached") {
            current->detached = true;
        }
    }
    flush();
    return entries;
}

GitCli::GitCli(std::string binary, std::uint32_t timeout_ms)
    : binary_(std::move(binary)), timeout_ms_(timeout_ms) {}

core::errors::Result<std::string> GitCli::run(const std::filesystem::path& directory,
                                              const std::vector<std::string>& args) const {
    core::process::ProcessRequest request;
    request.argv.push_back(binary_);
    request.argv.insert(request.argv.end(), args.begin(), args.end());
    request.working_directory = directory;
    request.timeout_ms = timeout_ms_;

    auto capture = core::process::run_process(request);
    if (core::errors::is_error(capture)) {
        return core::errors::get_error(capture);
    }
    const auto& result = core::errors::get_value(capture);
    const std::string command = "git " + core::util::join(args, " ");
    if (result.timed_out) {
        return OrchError{ErrorCategory::External, command + " timed out", "git_timeout"};
    }
    if (!result.success()) {
        OrchError error{ErrorCategory::External,
                        command + " failed: " + core::util::trim(result.stderr_text),
                        "git_failed"};
        LOG_DEBUG(error.message);
        return error;
    }
    return result.stdout_text;
}

bool GitCli::available() const {
    return core::process::find_executable(binary_).has_value();
}

bool GitCli::is_repository(const std::filesystem::path& directory) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return false;
    }
    auto inside = run(directory, {"rev-parse", "--is-inside-work-tree"});
    return !core::errors::is_error(inside) &&
           core::util::trim(core::errors::get_value(inside)) == "true";
}

core::errors::Result<std::string> GitCli::rev_parse(const std::filesystem::path& directory,
                                                    const std::string& ref) const {
    auto out = run(directory, {"rev-parse", "--verify", "--quiet", ref + "^{commit}"});
    if (core::errors::is_error(out)) {
        return OrchError{ErrorCategory::NotFound, "Unknown git revision: " + ref,
                         "git_ref_not_found"};
    }
    return core::util::trim(core::errors::get_value(out));
}

core::errors::Result<std::string> GitCli::current_branch(
    const std::filesystem::path& directory) const {
    auto out = run(directory, {"rev-parse", "--abbrev-ref", "HEAD"});
    if (core::errors::is_error(out)) {
        return out;
    }
    return core::util::trim(core::errors::get_value(out));
}

bool GitCli::branch_exists(const std::filesystem::path& repo, const std::string& branch) const {
    return !core::errors::is_error(
        run(repo, {"show-ref", "--verify", "--quiet", "refs/heads/" + branch}));
}

core::errors::Result<std::vector<WorktreeEntry>> GitCli::list_worktrees(
    const std::filesystem::path& repo) const {
    auto out = run(repo, {"worktree", "list", "--porcelain"});
    if (core::errors::is_error(out)) {
        return core::errors::get_error(out);
    }
    return parse_worktree_list(core::errors::get_value(out));
}

core::errors::Status GitCli::worktree_add(const std::filesystem::path& repo,
                                          const std::filesystem::path& path,
                                          const std::string& branch,
                                          const std::optional<std::string>& create_from) const {
    std::vector<std::string> args{"worktree", "add"};
    if (create_from) {
        args.insert(args.end(), {"-b", branch, path.string(), *create_from});
    } else {
        args.insert(args.end(), {path.string(), branch});
    }
    auto out = run(repo, args);
    if (core::errors::is_error(out)) {
        return core::errors::get_error(out);
    }
    return core::errors::ok();
}

core::errors::Status GitCli::worktree_remove(const std::filesystem::path& repo,
                                             const std::filesystem::path& path,
                                             const bool force) const {
    std::vector<std::string> args{"worktree", "remove"};
    if (force) args.push_back("--force");
    args.push_back(path.string());
    auto out = run(repo, args);
    if (core::errors::is_error(out)) {
        return core::errors::get_error(out);
    }
    return core::errors::ok();
}

core::errors::Status GitCli::worktree_prune(const std::filesystem::path& repo) const {
    auto out = run(repo, {"worktree", "prune"});
    if (core::errors::is_error(out)) {
        return core::errors::get_error(out);
    }
    return core::errors::ok();
}

core::errors::Status GitCli::delete_branch(const std::filesystem::path& repo,
                                           const std::string& branch, const bool force) const {
    auto out = run(repo, {"branch", force ? "-D" : "-d", branch});
    if (core::errors::is_error(out)) {
        return core::errors::get_error(out);
    }
    return core::errors::ok();
}

core::errors::Result<bool> GitCli::has_changes(const std::filesystem::path& directory) const {
    auto out = run(directory, {"status", "--porcelain"});
    if (core::errors::is_error(out)) {
        return core::errors::get_error(out);
    }
    return !core::util::trim(core::errors::get_value(out)).empty();
}

}  // namespace orch::git
