#pragma once

#include <filesystem>
#include "core/config/config.hpp"

namespace orch::core::config {

// Resolved on-disk layout of a workspace.
struct OperatorPaths {
    std::filesystem::path workspace_root;
    std::filesystem::path tickets;
    std::filesystem::path queue;
    std::filesystem::path in_progress;
    std::filesystem::path completed;
    std::filesystem::path operator_dir;
    std::filesystem::path state_file;
    std::filesystem::path logs;
    std::filesystem::path prompts;
    std::filesystem::path commands;
    std::filesystem::path sessions;
    std::filesystem::path templates;
    std::filesystem::path issuetypes;
    std::filesystem::path imports;
    std::filesystem::path collections_file;
    std::filesystem::path api_session_file;
    std::filesystem::path projects_root;
    std::filesystem::path worktrees;

    static OperatorPaths resolve(const std::filesystem::path& workspace_root,
                                 const Config& config);

    // Creates the ticket and operator directories that do not exist yet.
    core::errors::Status ensure_directories() const;
};

}  // namespace orch::core::config
