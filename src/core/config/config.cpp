#include "core/config/config.hpp"

#include <algorithm>
#include <cstdlib>
#include "core/config/toml_reader.hpp"
#include "core/logging/logger.hpp"
#include "core/util/text.hpp"

extern char** environ;

namespace orch::core::config {

using core::errors::ErrorCategory;
using core::errors::OrchError;
using nlohmann::json;

namespace {

constexpr const char* kEnvPrefix = "OPERATOR_";

json webhook_to_json(const WebhookConfig& webhook) {
    return json{{"name", webhook.name},
                {"enabled", webhook.enabled},
                {"url", webhook.url},
                {"auth_type", webhook.auth_type},
                {"token_env", webhook.token_env},
                {"username", webhook.username},
                {"password_env", webhook.password_env},
                {"events", webhook.events}};
}

WebhookConfig webhook_from_json(const json& j) {
    WebhookConfig webhook;
    webhook.name = j.value("name", webhook.name);
    webhook.enabled = j.value("enabled", webhook.enabled);
    webhook.url = j.value("url", webhook.url);
    webhook.auth_type = j.value("auth_type", webhook.auth_type);
    webhook.token_env = j.value("token_env", webhook.token_env);
    webhook.username = j.value("username", webhook.username);
    webhook.password_env = j.value("password_env", webhook.password_env);
    webhook.events = j.value("events", webhook.events);
    return webhook;
}

json tool_to_json(const LlmToolConfig& tool) {
    return json{{"name", tool.name},
                {"path", tool.path},
                {"version", tool.version},
                {"model_aliases", tool.model_aliases},
                {"command_template", tool.command_template},
                {"model_flag", tool.model_flag},
                {"yolo_flags", tool.yolo_flags}};
}

LlmToolConfig tool_from_json(const json& j) {
    LlmToolConfig tool;
    tool.name = j.value("name", tool.name);
    tool.path = j.value("path", tool.path);
    tool.version = j.value("version", tool.version);
    tool.model_aliases = j.value("model_aliases", tool.model_aliases);
    tool.command_template = j.value("command_template", tool.command_template);
    tool.model_flag = j.value("model_flag", tool.model_flag);
    tool.yolo_flags = j.value("yolo_flags", tool.yolo_flags);
    return tool;
}

// Converts an environment string to the JSON type already present at the target.
json coerce_env_value(const std::string& raw, const json& existing) {
    const std::string trimmed = util::trim(raw);
    if (existing.is_boolean()) {
        const std::string lowered = util::lowercase(trimmed);
        return lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on";
    }
    if (existing.is_number_unsigned() || existing.is_number_integer()) {
        char* end = nullptr;
        const long long value = std::strtoll(trimmed.c_str(), &end, 10);
        if (end != nullptr && *end == '\0' && !trimmed.empty()) {
            if (existing.is_number_unsigned() && value >= 0) {
                return static_cast<std::uint64_t>(value);
            }
            return value;
        }
        return trimmed;
    }
    if (existing.is_number_float()) {
        char* end = nullptr;
        const double value = std::strtod(trimmed.c_str(), &end);
        if (end != nullptr && *end == '\0' && !trimmed.empty()) {
            return value;
        }
        return trimmed;
    }
    if (existing.is_array()) {
        return util::split_list(trimmed, ',');
    }
    return raw;
}

}  // namespace

std::size_t Config::effective_max_agents(const std::size_t cpu_count) const {
    const std::size_t available =
        cpu_count > agents.cores_reserved ? cpu_count - agents.cores_reserved : 0;
    const std::size_t capped = std::min(agents.max_parallel, available);
    return capped == 0 ? 1 : capped;
}

json config_to_json(const Config& config) {
    json doc;
    doc["projects"] = config.projects;
    doc["agents"] = {{"max_parallel", config.agents.max_parallel},
                     {"cores_reserved", config.agents.cores_reserved},
                     {"health_check_interval", config.agents.health_check_interval},
                     {"step_timeout", config.agents.step_timeout},
                     {"silence_threshold", config.agents.silence_threshold}};

    json webhooks = json::array();
    for (const auto& webhook : config.notifications.webhooks) {
        webhooks.push_back(webhook_to_json(webhook));
    }
    doc["notifications"] = {{"enabled", config.notifications.enabled},
                            {"os",
                             {{"enabled", config.notifications.os.enabled},
                              {"sound", config.notifications.os.sound},
                              {"events", config.notifications.os.events}}},
                            {"webhooks", webhooks}};

    doc["queue"] = {{"auto_assign", config.queue.auto_assign},
                    {"poll_interval_ms", config.queue.poll_interval_ms}};
    doc["paths"] = {{"tickets", config.paths.tickets},
                    {"projects", config.paths.projects},
                    {"state", config.paths.state}};
    doc["launch"] = {{"confirm_autonomous", config.launch.confirm_autonomous},
                     {"confirm_paired", config.launch.confirm_paired},
                     {"launch_delay_ms", config.launch.launch_delay_ms},
                     {"docker",
                      {{"enabled", config.launch.docker.enabled},
                       {"image", config.launch.docker.image},
                       {"extra_args", config.launch.docker.extra_args},
                       {"mount_path", config.launch.docker.mount_path},
                       {"env_vars", config.launch.docker.env_vars}}},
                     {"yolo", {{"enabled", config.launch.yolo.enabled}}}};

    json tools = json::array();
    for (const auto& tool : config.llm_tools.detected) {
        tools.push_back(tool_to_json(tool));
    }
    doc["llm_tools"] = {{"auto_detect", config.llm_tools.auto_detect},
                        {"default_tool", config.llm_tools.default_tool},
                        {"default_model", config.llm_tools.default_model},
                        {"detected", tools}};
    doc["logging"] = {{"level", config.logging.level},
                      {"to_file", config.logging.to_file}};
    doc["tmux"] = {{"binary", config.tmux.binary},
                   {"session_prefix", config.tmux.session_prefix}};
    doc["git"] = {{"use_worktrees", config.git.use_worktrees},
                  {"worktrees_dir", config.git.worktrees_dir},
                  {"base_branch", config.git.base_branch},
                  {"cleanup_on_complete", config.git.cleanup_on_complete}};
    doc["rest_api"] = {{"enabled", config.rest_api.enabled},
                       {"port", config.rest_api.port},
                       {"cors_origins", config.rest_api.cors_origins}};
    doc["templates"] = {{"collection", config.templates.collection},
                        {"project_collections", config.templates.project_collections}};
    doc["api"] = {{"pr_check_interval_secs", config.api.pr_check_interval_secs}};
    return doc;
}

core::errors::Result<Config> config_from_json(const json& doc) {
    Config config;
    try {
        config.projects = doc.value("projects", config.projects);

        const json agents = doc.value("agents", json::object());
        config.agents.max_parallel = agents.value("max_parallel", config.agents.max_parallel);
        config.agents.cores_reserved =
            agents.value("cores_reserved", config.agents.cores_reserved);
        config.agents.health_check_interval =
            agents.value("health_check_interval", config.agents.health_check_interval);
        config.agents.step_timeout = agents.value("step_timeout", config.agents.step_timeout);
        config.agents.silence_threshold =
            agents.value("silence_threshold", config.agents.silence_threshold);

        const json notifications = doc.value("notifications", json::object());
        config.notifications.enabled =
            notifications.value("enabled", config.notifications.enabled);
        const json os = notifications.value("os", json::object());
        config.notifications.os.enabled = os.value("enabled", config.notifications.os.enabled);
        config.notifications.os.sound = os.value("sound", config.notifications.os.sound);
        config.notifications.os.events = os.value("events", config.notifications.os.events);
        if (notifications.contains("webhook") && notifications["webhook"].is_object()) {
            config.notifications.webhooks.push_back(webhook_from_json(notifications["webhook"]));
        }
        if (notifications.contains("webhooks") && notifications["webhooks"].is_array()) {
            for (const auto& entry : notifications["webhooks"]) {
                config.notifications.webhooks.push_back(webhook_from_json(entry));
            }
        }

        const json queue = doc.value("queue", json::object());
        config.queue.auto_assign = queue.value("auto_assign", config.queue.auto_assign);
        config.queue.poll_interval_ms =
            queue.value("poll_interval_ms", config.queue.poll_interval_ms);

        const json paths = doc.value("paths", json::object());
        config.paths.tickets = paths.value("tickets", config.paths.tickets);
        config.paths.projects = paths.value("projects", config.paths.projects);
        config.paths.state = paths.value("state", config.paths.state);

        const json launch = doc.value("launch", json::object());
        config.launch.confirm_autonomous =
            launch.value("confirm_autonomous", config.launch.confirm_autonomous);
        config.launch.confirm_paired = launch.value("confirm_paired", config.launch.confirm_paired);
        config.launch.launch_delay_ms =
            launch.value("launch_delay_ms", config.launch.launch_delay_ms);
        const json docker = launch.value("docker", json::object());
        config.launch.docker.enabled = docker.value("enabled", config.launch.docker.enabled);
        config.launch.docker.image = docker.value("image", config.launch.docker.image);
        config.launch.docker.extra_args =
            docker.value("extra_args", config.launch.docker.extra_args);
        config.launch.docker.mount_path =
            docker.value("mount_path", config.launch.docker.mount_path);
        config.launch.docker.env_vars = docker.value("env_vars", config.launch.docker.env_vars);
        const json yolo = launch.value("yolo", json::object());
        config.launch.yolo.enabled = yolo.value("enabled", config.launch.yolo.enabled);

        const json llm = doc.value("llm_tools", json::object());
        config.llm_tools.auto_detect = llm.value("auto_detect", config.llm_tools.auto_detect);
        config.llm_tools.default_tool = llm.value("default_tool", config.llm_tools.default_tool);
        config.llm_tools.default_model =
            llm.value("default_model", config.llm_tools.default_model);
        if (llm.contains("detected") && llm["detected"].is_array()) {
            for (const auto& entry : llm["detected"]) {
                config.llm_tools.detected.push_back(tool_from_json(entry));
            }
        }

        const json logging = doc.value("logging", json::object());
        config.logging.level = logging.value("level", config.logging.level);
        config.logging.to_file = logging.value("to_file", config.logging.to_file);

        const json tmux = doc.value("tmux", json::object());
        config.tmux.binary = tmux.value("binary", config.tmux.binary);
        config.tmux.session_prefix = tmux.value("session_prefix", config.tmux.session_prefix);

        const json git = doc.value("git", json::object());
        config.git.use_worktrees = git.value("use_worktrees", config.git.use_worktrees);
        config.git.worktrees_dir = git.value("worktrees_dir", config.git.worktrees_dir);
        config.git.base_branch = git.value("base_branch", config.git.base_branch);
        config.git.cleanup_on_complete =
            git.value("cleanup_on_complete", config.git.cleanup_on_complete);

        const json rest = doc.value("rest_api", json::object());
        config.rest_api.enabled = rest.value("enabled", config.rest_api.enabled);
        config.rest_api.port = rest.value("port", config.rest_api.port);
        config.rest_api.cors_origins = rest.value("cors_origins", config.rest_api.cors_origins);

        const json templates = doc.value("templates", json::object());
        config.templates.collection = templates.value("collection", config.templates.collection);
        config.templates.project_collections =
            templates.value("project_collections", config.templates.project_collections);

        const json api = doc.value("api", json::object());
        config.api.pr_check_interval_secs =
            api.value("pr_check_interval_secs", config.api.pr_check_interval_secs);
    } catch (const json::exception& e) {
        return OrchError{ErrorCategory::Malformed,
                         std::string("Invalid configuration value: ") + e.what(),
                         "config_invalid",
                         "Check the types of the values in config.toml."};
    }
    return config;
}

void merge_json(json& base, const json& overlay) {
    if (!base.is_object() || !overlay.is_object()) {
        base = overlay;
        return;
    }
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (base.contains(it.key()) && base[it.key()].is_object() && it.value().is_object()) {
            merge_json(base[it.key()], it.value());
        } else {
            base[it.key()] = it.value();
        }
    }
}

void apply_env_overlay(json& doc, const std::map<std::string, std::string>& environment) {
    for (const auto& [name, value] : environment) {
        if (!util::starts_with(name, kEnvPrefix)) {
            continue;
        }
        const std::string rest = name.substr(std::string(kEnvPrefix).size());
        std::vector<std::string> segments;
        std::size_t start = 0;
        while (true) {
            const auto sep = rest.find("__", start);
            segments.push_back(util::lowercase(rest.substr(start, sep - start)));
            if (sep == std::string::npos) {
                break;
            }
            start = sep + 2;
        }
        if (segments.size() < 2 || !doc.contains(segments.front()) ||
            !doc[segments.front()].is_object()) {
            continue;
        }

        json* node = &doc;
        for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
            json& child = (*node)[segments[i]];
            if (child.is_null()) {
                child = json::object();
            }
            if (!child.is_object()) {
                node = nullptr;
                break;
            }
            node = &child;
        }
        if (node == nullptr) {
            LOG_WARN("Config: ignoring " + name + " (not a config section)");
            continue;
        }
        const std::string& key = segments.back();
        const json existing = node->contains(key) ? (*node)[key] : json();
        (*node)[key] = coerce_env_value(value, existing);
        LOG_DEBUG("Config: applied environment override " + name);
    }
}

std::map<std::string, std::string> current_environment() {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string pair = *entry;
        const auto eq = pair.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        env[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
    return env;
}

core::errors::Result<Config> load_config(const LoadOptions& options) {
    json doc = config_to_json(Config{});

    std::vector<std::filesystem::path> files;
    files.push_back(options.workspace_root / ".tickets" / "operator" / "config.toml");
    std::optional<std::filesystem::path> home = options.home_dir;
    if (!home.has_value()) {
        if (const char* env_home = std::getenv("HOME")) {
            home = std::filesystem::path(env_home);
        }
    }
    if (home.has_value()) {
        files.push_back(*home / ".config" / "operator" / "config.toml");
    }

    std::error_code ec;
    for (const auto& file : files) {
        if (!std::filesystem::exists(file, ec)) {
            continue;
        }
        auto parsed = read_toml_file(file);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        merge_json(doc, core::errors::get_value(parsed));
        LOG_DEBUG("Config: loaded " + file.string());
    }

    if (options.explicit_path.has_value()) {
        if (!std::filesystem::exists(*options.explicit_path, ec)) {
            return OrchError{ErrorCategory::NotFound,
                             "Config file not found: " + options.explicit_path->string(),
                             "config_not_found"};
        }
        auto parsed = read_toml_file(*options.explicit_path);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        merge_json(doc, core::errors::get_value(parsed));
    }

    apply_env_overlay(doc, options.environment.has_value() ? *options.environment
                                                           : current_environment());
    return config_from_json(doc);
}

}  // namespace orch::core::config
