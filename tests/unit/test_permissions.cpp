#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/ids.hpp"
#include "core/config/toml_reader.hpp"
#include "issuetypes/registry.hpp"
#include "permissions/resolver.hpp"
#include "permissions/translator.hpp"

namespace {

using orch::core::errors::get_error;
using orch::core::errors::get_value;
using orch::core::errors::is_error;
using orch::issuetypes::IssueType;
using orch::issuetypes::IssueTypeRegistry;
using orch::issuetypes::StepSchema;
using orch::permissions::ClaudeTranslator;
using orch::permissions::CodexTranslator;
using orch::permissions::GeminiTranslator;
using orch::permissions::PermissionResolver;
using orch::permissions::PermissionSet;
using orch::permissions::ToolPattern;
using orch::session::ArtifactWriter;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::temp_directory_path() /
                ("orch_permissions_" + orch::core::config::generate_uuid());
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

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool contains_pair(const std::vector<std::string>& flags, const std::string& flag,
                   const std::string& value) {
    for (std::size_t i = 0; i + 1 < flags.size(); ++i) {
        if (flags[i] == flag && flags[i + 1] == value) return true;
    }
    return false;
}

PermissionSet sample_a() {
    PermissionSet set;
    set.tools_allow = {ToolPattern{"Read", std::nullopt}, ToolPattern{"Bash", "npm test:*"}};
    set.directories_allow = {"/srv/a"};
    set.mcp_enable = {"github"};
    return set;
}

PermissionSet sample_b() {
    PermissionSet set;
    set.tools_allow = {ToolPattern{"Bash", "npm test:*"}, ToolPattern{"Write", std::nullopt}};
    set.tools_deny = {ToolPattern{"WebFetch", std::nullopt}};
    set.directories_allow = {"/srv/b"};
    return set;
}

template <typename T>
std::set<T> as_set(const std::vector<T>& values) {
    return std::set<T>(values.begin(), values.end());
}

std::set<std::string> tool_names(const std::vector<ToolPattern>& tools) {
    std::set<std::string> names;
    for (const auto& tool : tools) names.insert(orch::permissions::format_tool_pattern(tool));
    return names;
}

TEST(PermissionSetTest, MergeIsCommutativeAsSets) {
    const auto ab = PermissionSet::merge(sample_a(), sample_b());
    const auto ba = PermissionSet::merge(sample_b(), sample_a());
    EXPECT_EQ(tool_names(ab.tools_allow), tool_names(ba.tools_allow));
    EXPECT_EQ(tool_names(ab.tools_deny), tool_names(ba.tools_deny));
    EXPECT_EQ(as_set(ab.directories_allow), as_set(ba.directories_allow));
    EXPECT_EQ(as_set(ab.mcp_enable), as_set(ba.mcp_enable));
    EXPECT_EQ(ab.tools_allow.size(), 3u);
}

TEST(PermissionSetTest, MergeIsIdempotent) {
    const auto a = sample_a();
    const auto aa = PermissionSet::merge(a, a);
    EXPECT_EQ(aa.tools_allow, a.tools_allow);
    EXPECT_EQ(aa.directories_allow, a.directories_allow);
    EXPECT_EQ(aa.mcp_enable, a.mcp_enable);
}

TEST(TranslatorTest, ClaudeEmitsFlagVocabulary) {
    PermissionSet set = sample_b();
    set.directories_deny = {"/etc"};
    set.custom_flags["claude"]["verbose"] = true;
    set.custom_flags["claude"]["max-turns"] = 5;

    const auto flags = ClaudeTranslator().generate_cli_flags(set);
    EXPECT_TRUE(contains_pair(flags, "--allowedTools", "Bash(npm test:*)"));
    EXPECT_TRUE(contains_pair(flags, "--allowedTools", "Write"));
    EXPECT_TRUE(contains_pair(flags, "--disallowedTools", "WebFetch"));
    EXPECT_TRUE(contains_pair(flags, "--add-dir", "/srv/b"));
    EXPECT_TRUE(contains_pair(flags, "--disallowedTools", "Read(/etc)"));
    EXPECT_TRUE(contains_pair(flags, "--disallowedTools", "Edit(/etc)"));
    EXPECT_TRUE(contains_pair(flags, "--max-turns", "5"));
    EXPECT_NE(std::find(flags.begin(), flags.end(), "--verbose"), flags.end());
    EXPECT_FALSE(ClaudeTranslator().config_filename().has_value());
}

TEST(TranslatorTest, GeminiWritesSettingsOnly) {
    GeminiTranslator gemini;
    EXPECT_TRUE(gemini.generate_cli_flags(sample_a()).empty());
    const auto config = gemini.generate_config(sample_a());
    ASSERT_TRUE(config.has_value());
    const json settings = json::parse(*config);
    EXPECT_EQ(settings["coreTools"], json::array({"Read", "Bash(npm test:*)"}));
    EXPECT_EQ(settings["includeDirectories"], json::array({"/srv/a"}));
    EXPECT_TRUE(settings["mcpServers"]["github"]["enabled"].get<bool>());
    EXPECT_EQ(gemini.config_filename(), std::optional<std::string>("settings.json"));
}

TEST(TranslatorTest, CodexConfigIsValidTomlWithMappedNames) {
    PermissionSet set = PermissionSet::merge(sample_a(), sample_b());
    set.tools_deny.push_back(ToolPattern{"Bash", std::nullopt});
    const auto config = CodexTranslator().generate_config(set);
    ASSERT_TRUE(config.has_value());

    auto parsed = orch::core::config::parse_toml(*config);
    ASSERT_FALSE(is_error(parsed)) << *config;
    const json& doc = get_value(parsed);
    EXPECT_EQ(doc["tools"]["read_file"]["allow_patterns"], json::array({"*"}));
    EXPECT_EQ(doc["tools"]["exec"]["allow_patterns"], json::array({"npm test:*"}));
    EXPECT_FALSE(doc["tools"]["exec"]["enabled"].get<bool>());
    EXPECT_TRUE(doc["mcp_servers"]["github"]["enabled"].get<bool>());
    EXPECT_EQ(CodexTranslator::map_tool_name("Edit"), "apply_patch");
    EXPECT_EQ(CodexTranslator::map_tool_name("Custom"), "Custom");
}

TEST(TranslatorTest, UnknownProviderHasNoTranslator) {
    EXPECT_TRUE(orch::permissions::make_translator("cursor") == nullptr);
    const auto codex = orch::permissions::make_translator("codex");
    ASSERT_TRUE(codex != nullptr);
    EXPECT_EQ(codex->provider_name(), "codex");
}

class ResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        project_ = workspace_.root() / "project";
        tickets_ = workspace_.root() / ".tickets";
        std::filesystem::create_directories(project_);
        std::filesystem::create_directories(tickets_);
    }

    TempWorkspace workspace_;
    std::filesystem::path project_;
    std::filesystem::path tickets_;
    IssueTypeRegistry registry_;
};

TEST_F(ResolverTest, MergesProjectAndStepPermissions) {
    write_file(project_ / ".operator" / "permissions.json",
               R"({"tools":{"allow":[{"tool":"Bash","pattern":"make:*"}]},
                   "directories":{"allow":["/opt/shared"]}})");
    PermissionResolver resolver(registry_, tickets_, ArtifactWriter(tickets_ / "operator"));

    auto resolved = resolver.resolve(project_, "FEAT", "plan");
    ASSERT_FALSE(is_error(resolved));
    const auto& set = get_value(resolved);
    const auto names = tool_names(set.tools_allow);
    EXPECT_TRUE(names.count("Bash(make:*)"));
    EXPECT_TRUE(names.count("Read"));
    EXPECT_TRUE(names.count("Grep"));
    const auto dirs = as_set(set.directories_allow);
    EXPECT_TRUE(dirs.count("/opt/shared"));
    EXPECT_TRUE(dirs.count(std::filesystem::weakly_canonical(tickets_).string()));
}

TEST_F(ResolverTest, WildcardToolsAreNotBridged) {
    PermissionResolver resolver(registry_, tickets_, ArtifactWriter(tickets_ / "operator"));
    auto resolved = resolver.resolve(project_, "TASK", "execute");
    ASSERT_FALSE(is_error(resolved));
    EXPECT_TRUE(get_value(resolved).tools_allow.empty());
}

TEST_F(ResolverTest, MalformedProjectFileIsReported) {
    write_file(project_ / ".operator" / "permissions.json", "{not json");
    PermissionResolver resolver(registry_, tickets_, ArtifactWriter(tickets_ / "operator"));
    auto resolved = resolver.resolve(project_, "TASK", "execute");
    ASSERT_TRUE(is_error(resolved));
    EXPECT_EQ(get_error(resolved).code, "invalid_permissions");
}

TEST_F(ResolverTest, GeneratesClaudeFlagsWithModeAndAudit) {
    PermissionResolver resolver(registry_, tickets_, ArtifactWriter(tickets_ / "operator"));
    auto generated =
        resolver.generate_config("claude", project_, "FEAT", "plan", "FEAT-1", "session-1");
    ASSERT_FALSE(is_error(generated));
    const auto& flags = get_value(generated).cli_flags;
    EXPECT_TRUE(contains_pair(flags, "--permission-mode", "plan"));
    EXPECT_TRUE(contains_pair(flags, "--allowedTools", "Read"));
    EXPECT_FALSE(get_value(generated).config_path.has_value());

    const auto audit_path = tickets_ / "operator" / "sessions" / "FEAT-1" / "audit.json";
    ASSERT_TRUE(std::filesystem::exists(audit_path));
    const json audit = json::parse(read_file(audit_path));
    EXPECT_EQ(audit["session_id"], "session-1");
    EXPECT_EQ(audit["ticket_id"], "FEAT-1");
    EXPECT_EQ(audit["provider"], "claude");
    EXPECT_EQ(audit["flags"].size(), flags.size());
}

TEST_F(ResolverTest, FileProvidersGetConfigDir) {
    PermissionResolver resolver(registry_, tickets_, ArtifactWriter(tickets_ / "operator"));
    auto generated =
        resolver.generate_config("gemini", project_, "FEAT", "plan", "FEAT-2", "session-2");
    ASSERT_FALSE(is_error(generated));
    const auto& config = get_value(generated);
    ASSERT_TRUE(config.config_path.has_value());
    EXPECT_EQ(config.config_path->filename(), "settings.json");
    EXPECT_TRUE(contains_pair(config.cli_flags, "--config-dir",
                              config.config_path->parent_path().string()));
    EXPECT_FALSE(contains_pair(config.cli_flags, "--permission-mode", "plan"));
}

TEST_F(ResolverTest, InlineSchemaWinsAndMissingFileFails) {
    IssueType docs;
    docs.key = "DOCS";
    docs.name = "Docs";
    docs.glyph = "D";
    StepSchema write;
    write.name = "write";
    write.json_schema = json{{"type", "object"}};
    write.json_schema_file = "missing.json";
    write.cli_args["claude"] = {"--verbose"};
    StepSchema check;
    check.name = "check";
    check.json_schema_file = "missing.json";
    write.next_step = "check";
    docs.steps = {write, check};
    ASSERT_FALSE(is_error(registry_.register_type(docs)));

    PermissionResolver resolver(registry_, tickets_, ArtifactWriter(tickets_ / "operator"));
    auto inline_schema =
        resolver.generate_config("claude", project_, "DOCS", "write", "DOCS-1", "s1");
    ASSERT_FALSE(is_error(inline_schema));
    const auto& flags = get_value(inline_schema).cli_flags;
    EXPECT_TRUE(contains_pair(flags, "--json-schema",
                              (tickets_ / "operator" / "sessions" / "DOCS-1" / "schema.json").string()));
    EXPECT_EQ(flags.back(), "--verbose");

    auto missing = resolver.generate_config("claude", project_, "DOCS", "check", "DOCS-1", "s2");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "json_schema_missing");
}

TEST_F(ResolverTest, UnknownProviderAndStep) {
    PermissionResolver resolver(registry_, tickets_, ArtifactWriter(tickets_ / "operator"));
    auto provider = resolver.generate_config("cursor", project_, "TASK", "execute", "T-1", "s");
    ASSERT_TRUE(is_error(provider));
    EXPECT_EQ(get_error(provider).code, "unknown_provider");

    auto step = resolver.resolve(project_, "TASK", "deploy");
    ASSERT_TRUE(is_error(step));
    EXPECT_EQ(get_error(step).code, "unknown_step");
}

}  // namespace
