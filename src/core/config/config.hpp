#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/orch_errors.hpp"

namespace orch::core::config {

struct AgentsConfig {
    std::size_t max_parallel = 5;
    std::size_t cores_reserved = 1;
    std::uint64_t health_check_interval = 30;
    std::uint64_t step_timeout = 1800;
    std::uint64_t silence_threshold = 30;
};

struct OsNotificationConfig {
    bool enabled = true;
    bool sound = false;
    std::vector<std::string> events;
};

struct WebhookConfig {
    std::string name = "webhook";
    bool enabled = true;
    std::string url;
    std::string auth_type;  // "", "bearer" or "basic"
    std::string token_env;
    std::string username;
    std::string password_env;
    std::vector<std::string> events;
};

struct NotificationsConfig {
    bool enabled = true;
    OsNotificationConfig os;
    std::vector<WebhookConfig> webhooks;
};

struct QueueConfig {
    bool auto_assign = true;
    std::uint64_t poll_interval_ms = 1000;
};

struct PathsConfig {
    std::string tickets = ".tickets";
    std::string projects = ".";
    std::string state = ".tickets/operator";
};

struct DockerConfig {
    bool enabled = false;
    std::string image;
    std::vector<std::string> extra_args;
    std::string mount_path = "/workspace";
    std::vector<std::string> env_vars;
};

struct YoloConfig {
    bool enabled = false;
};

struct LaunchConfig {
    bool confirm_autonomous = true;
    bool confirm_paired = true;
    std::uint64_t launch_delay_ms = 2000;
    DockerConfig docker;
    YoloConfig yolo;
};

struct LlmToolConfig {
    std::string name;
    std::string path;
    std::string version;
    std::vector<std::string> model_aliases;
    std::string command_template;
    std::string model_flag = "--model";
    std::vector<std::string> yolo_flags;
};

struct LlmToolsConfig {
    bool auto_detect = true;
    std::string default_tool = "claude";
    std::string default_model;
    std::vector<LlmToolConfig> detected;
};

struct LoggingConfig {
    std::string level = "info";
    bool to_file = true;
};

struct TmuxConfig {
    std::string binary = "tmux";
    std::string session_prefix = "op-";
};

struct GitConfig {
    bool use_worktrees = false;
    std::string worktrees_dir;  // empty: <state>/worktrees
    std::string base_branch = "main";
    bool cleanup_on_complete = true;
};

struct RestApiConfig {
    bool enabled = true;
    std::uint16_t port = 7008;
    std::vector<std::string> cors_origins;
};

struct TemplatesConfig {
    std::string collection = "devops";
    std::map<std::string, std::string> project_collections;
};

struct ApiConfig {
    std::uint64_t pr_check_interval_secs = 60;
};

struct Config {
    std::vector<std::string> projects;
    AgentsConfig agents;
    NotificationsConfig notifications;
    QueueConfig queue;
    PathsConfig paths;
    LaunchConfig launch;
    LlmToolsConfig llm_tools;
    LoggingConfig logging;
    TmuxConfig tmux;
    GitConfig git;
    RestApiConfig rest_api;
    TemplatesConfig templates;
    ApiConfig api;

    // min(max_parallel, cpu_count - cores_reserved), never below 1.
    std::size_t effective_max_agents(std::size_t cpu_count) const;
};

struct LoadOptions {
    std::filesystem::path workspace_root = ".";
    std::optional<std::filesystem::path> explicit_path;
    // Overrides $HOME for the ~/.config/operator/config.toml lookup.
    std::optional<std::filesystem::path> home_dir;
    // Overrides the process environment for the OPERATOR_ overlay.
    std::optional<std::map<std::string, std::string>> environment;
};

nlohmann::json config_to_json(const Config& config);
core::errors::Result<Config> config_from_json(const nlohmann::json& doc);

// Deep-merges overlay into base; objects merge, everything else replaces.
void merge_json(nlohmann::json& base, const nlohmann::json& overlay);

// Applies OPERATOR_<SECTION>__<KEY>=value entries onto the document.
void apply_env_overlay(nlohmann::json& doc,
                       const std::map<std::string, std::string>& environment);

core::errors::Result<Config> load_config(const LoadOptions& options);

std::map<std::string, std::string> current_environment();

}  // namespace orch::core::config
