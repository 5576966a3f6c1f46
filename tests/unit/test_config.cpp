#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "core/config/config.hpp"
#include "core/config/ids.hpp"
#include "core/config/paths.hpp"
#include "core/config/toml_reader.hpp"
#include "launcher/llm_tools.hpp"

namespace {

using orch::core::config::Config;
using orch::core::config::LoadOptions;
using orch::core::config::load_config;
using orch::core::config::OperatorPaths;
using orch::core::config::parse_toml;
using orch::core::errors::ErrorCategory;
using orch::core::errors::get_error;
using orch::core::errors::get_value;
using orch::core::errors::is_error;

class TempWorkspace {
public:
    TempWorkspace()
        : root_(std::filesystem::temp_directory_path() /
                ("orch-config-" + orch::core::config::generate_uuid())) {
        std::filesystem::create_directories(root_);
    }
    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }
    const std::filesystem::path& root() const { return root_; }

    void write(const std::filesystem::path& relative, const std::string& text) const {
        const auto path = root_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path) << text;
    }

private:
    std::filesystem::path root_;
};

LoadOptions options_for(const TempWorkspace& ws) {
    LoadOptions options;
    options.workspace_root = ws.root();
    options.home_dir = ws.root() / "home";
    options.environment = std::map<std::string, std::string>{};
    return options;
}

TEST(ConfigTest, DefaultsWithoutFiles) {
    TempWorkspace ws;
    auto loaded = load_config(options_for(ws));
    ASSERT_FALSE(is_error(loaded));
    const Config& config = get_value(loaded);
    EXPECT_EQ(config.agents.max_parallel, 5u);
    EXPECT_EQ(config.agents.silence_threshold, 30u);
    EXPECT_EQ(config.queue.poll_interval_ms, 1000u);
    EXPECT_EQ(config.paths.tickets, ".tickets");
    EXPECT_EQ(config.tmux.session_prefix, "op-");
    EXPECT_TRUE(config.rest_api.enabled);
    EXPECT_EQ(config.rest_api.port, 7008);
    EXPECT_EQ(config.templates.collection, "devops");
}

TEST(ConfigTest, HomeFileOverridesWorkspaceFile) {
    TempWorkspace ws;
    ws.write("home/.config/operator/config.toml",
             "[agents]\nmax_parallel = 2\nstep_timeout = 60\n");
    ws.write(".tickets/operator/config.toml", "[agents]\nmax_parallel = 3\n");

    auto loaded = load_config(options_for(ws));
    ASSERT_FALSE(is_error(loaded));
    // The user file is merged after the workspace file.
    EXPECT_EQ(get_value(loaded).agents.max_parallel, 2u);
    EXPECT_EQ(get_value(loaded).agents.step_timeout, 60u);
}

TEST(ConfigTest, ExplicitFileMergesLast) {
    TempWorkspace ws;
    ws.write(".tickets/operator/config.toml", "[tmux]\nsession_prefix = \"ws-\"\n");
    ws.write("custom.toml", "[tmux]\nsession_prefix = \"x-\"\n\n[rest_api]\nport = 9000\n");

    auto options = options_for(ws);
    options.explicit_path = ws.root() / "custom.toml";
    auto loaded = load_config(options);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).tmux.session_prefix, "x-");
    EXPECT_EQ(get_value(loaded).rest_api.port, 9000);
}

TEST(ConfigTest, MissingExplicitFileIsNotFound) {
    TempWorkspace ws;
    auto options = options_for(ws);
    options.explicit_path = ws.root() / "absent.toml";
    auto loaded = load_config(options);
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).category, ErrorCategory::NotFound);
    EXPECT_EQ(get_error(loaded).code, "config_not_found");
}

TEST(ConfigTest, MalformedTomlIsReported) {
    TempWorkspace ws;
    ws.write(".tickets/operator/config.toml", "[agents\nmax_parallel = 2\n");
    auto loaded = load_config(options_for(ws));
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "toml_parse_error");
}

TEST(ConfigTest, EnvironmentOverridesAreCoerced) {
    TempWorkspace ws;
    auto options = options_for(ws);
    options.environment = std::map<std::string, std::string>{
        {"OPERATOR_AGENTS__MAX_PARALLEL", "7"},
        {"OPERATOR_REST_API__ENABLED", "false"},
        {"OPERATOR_LLM_TOOLS__DEFAULT_TOOL", "gemini"},
        {"OPERATOR_NOPE__KEY", "ignored"},
        {"HOME", "/elsewhere"}};
    auto loaded = load_config(options);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).agents.max_parallel, 7u);
    EXPECT_FALSE(get_value(loaded).rest_api.enabled);
    EXPECT_EQ(get_value(loaded).llm_tools.default_tool, "gemini");
}

TEST(ConfigTest, EffectiveMaxAgents) {
    Config config;
    config.agents.max_parallel = 4;
    config.agents.cores_reserved = 2;
    EXPECT_EQ(config.effective_max_agents(16), 4u);
    EXPECT_EQ(config.effective_max_agents(4), 2u);
    EXPECT_EQ(config.effective_max_agents(2), 1u);
    EXPECT_EQ(config.effective_max_agents(0), 1u);
}

TEST(ConfigTest, PathsResolveUnderWorkspace) {
    TempWorkspace ws;
    Config config;
    const auto paths = OperatorPaths::resolve(ws.root(), config);
    EXPECT_EQ(paths.queue, paths.tickets / "queue");
    EXPECT_EQ(paths.in_progress, paths.tickets / "in-progress");
    EXPECT_EQ(paths.state_file, paths.operator_dir / "state.json");
    EXPECT_EQ(paths.api_session_file, paths.operator_dir / "api-session.json");
    EXPECT_EQ(paths.worktrees, paths.operator_dir / "worktrees");

    ASSERT_FALSE(is_error(paths.ensure_directories()));
    EXPECT_TRUE(std::filesystem::is_directory(paths.queue));
    EXPECT_TRUE(std::filesystem::is_directory(paths.completed));
}

TEST(TomlReaderTest, TablesArraysAndInlineTables) {
    auto parsed = parse_toml(
        "title = 'ops'\n"
        "[server]\n"
        "port = 8080\n"
        "tags = [\"a\", \"b\"]\n"
        "limits = { cpu = 2, strict = true }\n"
        "[[hooks]]\n"
        "name = \"first\"\n"
        "[[hooks]]\n"
        "name = \"second\"\n");
    ASSERT_FALSE(is_error(parsed));
    const auto& doc = get_value(parsed);
    EXPECT_EQ(doc["title"], "ops");
    EXPECT_EQ(doc["server"]["port"], 8080);
    EXPECT_EQ(doc["server"]["tags"].size(), 2u);
    EXPECT_EQ(doc["server"]["limits"]["strict"], true);
    ASSERT_EQ(doc["hooks"].size(), 2u);
    EXPECT_EQ(doc["hooks"][1]["name"], "second");
}

TEST(LlmToolsTest, ConfiguredToolGetsBuiltinDefaults) {
    Config config;
    config.llm_tools.auto_detect = false;
    orch::core::config::LlmToolConfig claude;
    claude.name = "claude";
    claude.model_aliases.clear();
    config.llm_tools.detected.push_back(claude);

    auto tool = orch::launcher::resolve_tool(config, "claude");
    ASSERT_FALSE(is_error(tool));
    EXPECT_FALSE(get_value(tool).command_template.empty());
    EXPECT_EQ(orch::launcher::resolve_model(config, get_value(tool), std::nullopt), "opus");
    EXPECT_EQ(orch::launcher::resolve_model(config, get_value(tool), std::string("haiku")),
              "haiku");

    config.llm_tools.default_model = "sonnet";
    EXPECT_EQ(orch::launcher::resolve_model(config, get_value(tool), std::nullopt), "sonnet");
}

TEST(LlmToolsTest, UndetectedToolIsPrecondition) {
    Config config;
    config.llm_tools.auto_detect = false;
    auto tool = orch::launcher::resolve_tool(config, "codex");
    ASSERT_TRUE(is_error(tool));
    EXPECT_EQ(get_error(tool).category, ErrorCategory::Precondition);
    EXPECT_EQ(get_error(tool).code, "llm_tool_not_detected");
}

}  // namespace
