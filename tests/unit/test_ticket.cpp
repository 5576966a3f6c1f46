#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <gtest/gtest.h>
#include "core/config/ids.hpp"
#include "issuetypes/builtins.hpp"
#include "queue/ticket.hpp"

namespace {

using orch::core::errors::get_error;
using orch::core::errors::get_value;
using orch::core::errors::is_error;
using orch::queue::Ticket;
using orch::queue::extract_summary;
using orch::queue::parse_filename;
using orch::queue::parse_filename_strict;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::temp_directory_path() /
                ("orch_ticket_" + orch::core::config::generate_uuid());
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

std::filesystem::path write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
    return path;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

const orch::issuetypes::IssueType& feature_type() {
    static const auto types = orch::issuetypes::builtin_issue_types();
    for (const auto& type : types) {
        if (type.key == "FEAT") return type;
    }
    throw std::runtime_error("FEAT builtin missing");
}

const char* kFeatureTicket =
    "---\n"
    "id: FEAT-1234\n"
    "priority: P1-high\n"
    "status: queued\n"
    "step: plan\n"
    "---\n"
    "\n"
    "# Feature: Add pagination\n"
    "\n"
    "## History\n"
    "\n"
    "- 2024-12-21 14:30:00 - Created\n";

TEST(TicketFilenameTest, StrictPatternRequiresLowercaseProject) {
    const auto parts = parse_filename_strict("20241221-1430-FEAT-gamesvc-add-feature.md");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->timestamp, "20241221-1430");
    EXPECT_EQ(parts->ticket_type, "FEAT");
    EXPECT_EQ(parts->project, "gamesvc");

    EXPECT_FALSE(parse_filename_strict("2024-12-21-1430-FEAT-gamesvc-x.md").has_value());
    EXPECT_FALSE(parse_filename_strict("20241221-1430-FEAT-GameSvc-x.md").has_value());
    EXPECT_FALSE(parse_filename_strict("20241221-1430-FEAT-gamesvc-x.txt").has_value());
}

TEST(TicketFilenameTest, FallbackSplitNeedsFourParts) {
    auto parts = parse_filename("20241221-1430-TASK-Global.md");
    ASSERT_FALSE(is_error(parts));
    EXPECT_EQ(get_value(parts).ticket_type, "TASK");
    EXPECT_EQ(get_value(parts).project, "Global");

    auto bad = parse_filename("notes.md");
    ASSERT_TRUE(is_error(bad));
    EXPECT_EQ(get_error(bad).code, "invalid_ticket_filename");
}

TEST(TicketSummaryTest, PrefersHeadingThenSectionThenFirstLine) {
    EXPECT_EQ(extract_summary("# Fix: Broken login\n\nDetails"), "Broken login");
    EXPECT_EQ(extract_summary("# Title\n\n## Summary\n\nShort text\n"), "Short text");
    EXPECT_EQ(extract_summary("# Title\n- bullet\nPlain line here\n"), "Plain line here");
    EXPECT_EQ(extract_summary("# Only a heading\n"), "No summary");
}

TEST(TicketTest, ParsesFrontmatterFields) {
    auto parsed = Ticket::parse("20241221-1430-FEAT-gamesvc-add-pagination.md", kFeatureTicket);
    ASSERT_FALSE(is_error(parsed));
    const Ticket& ticket = get_value(parsed);
    EXPECT_TRUE(ticket.has_frontmatter);
    EXPECT_EQ(ticket.id, "FEAT-1234");
    EXPECT_EQ(ticket.priority, "P1-high");
    EXPECT_EQ(ticket.step, "plan");
    EXPECT_EQ(ticket.summary, "Add pagination");
    EXPECT_EQ(ticket.project, "gamesvc");
    EXPECT_EQ(ticket.branch_name(), "feature/FEAT-1234-add-pagination");
}

TEST(TicketTest, LegacyTicketUsesBoldFieldsAndDefaultId) {
    auto parsed = Ticket::parse("20241221-1430-FIX-api-crash.md",
                                "# Fix: Crash on start\n\n**Priority**: P0-critical\n");
    ASSERT_FALSE(is_error(parsed));
    const Ticket& ticket = get_value(parsed);
    EXPECT_FALSE(ticket.has_frontmatter);
    EXPECT_EQ(ticket.id, "FIX-202412211430");
    EXPECT_EQ(ticket.priority, "P0-critical");
    EXPECT_EQ(ticket.status, "queued");
}

TEST(TicketTest, InvalidYamlFallsBackToLegacyParsing) {
    auto parsed = Ticket::parse("20241221-1430-TASK-api-x.md",
                                "---\nid: [unclosed\n---\n# Task: Something\n");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_FALSE(get_value(parsed).has_frontmatter);
    EXPECT_EQ(get_value(parsed).id, "TASK-202412211430");
}

TEST(TicketTest, UnchangedTicketRendersEquivalentContent) {
    auto parsed = Ticket::parse("20241221-1430-FEAT-gamesvc-add-pagination.md", kFeatureTicket);
    ASSERT_FALSE(is_error(parsed));
    auto reparsed = Ticket::parse("20241221-1430-FEAT-gamesvc-add-pagination.md",
                                  get_value(parsed).to_markdown());
    ASSERT_FALSE(is_error(reparsed));
    const Ticket& a = get_value(parsed);
    const Ticket& b = get_value(reparsed);
    EXPECT_EQ(a.id, b.id);
    EXPECT_EQ(a.priority, b.priority);
    EXPECT_EQ(a.status, b.status);
    EXPECT_EQ(a.step, b.step);
    EXPECT_EQ(a.summary, b.summary);
    EXPECT_EQ(a.body, b.body);
    EXPECT_EQ(b.frontmatter.count("summary"), 0u);
}

TEST(TicketTest, SetStepRewritesFileAndPreservesBody) {
    TempWorkspace workspace;
    const auto path = write_file(
        workspace.root() / "20241221-1430-FEAT-gamesvc-add-pagination.md", kFeatureTicket);
    auto loaded = Ticket::from_file(path);
    ASSERT_FALSE(is_error(loaded));
    Ticket ticket = get_value(loaded);

    ASSERT_FALSE(is_error(ticket.set_step("implement")));
    auto reloaded = Ticket::from_file(path);
    ASSERT_FALSE(is_error(reloaded));
    EXPECT_EQ(get_value(reloaded).step, "implement");
    EXPECT_EQ(get_value(reloaded).body, ticket.body);
}

TEST(TicketTest, LegacyTicketGainsFrontmatterOnFirstMutation) {
    TempWorkspace workspace;
    const auto path = write_file(workspace.root() / "20241221-1430-TASK-api-cleanup.md",
                                 "# Task: Cleanup\n\n**Priority**: P3-low\n");
    auto loaded = Ticket::from_file(path);
    ASSERT_FALSE(is_error(loaded));
    Ticket ticket = get_value(loaded);

    ASSERT_FALSE(is_error(ticket.set_status("in-progress")));
    const std::string text = read_file(path);
    EXPECT_EQ(text.rfind("---\n", 0), 0u);

    auto reloaded = Ticket::from_file(path);
    ASSERT_FALSE(is_error(reloaded));
    EXPECT_TRUE(get_value(reloaded).has_frontmatter);
    EXPECT_EQ(get_value(reloaded).status, "in-progress");
    EXPECT_EQ(get_value(reloaded).priority, "P3-low");
    EXPECT_EQ(get_value(reloaded).summary, "Cleanup");
}

TEST(TicketTest, SessionsPersistAsNestedMap) {
    TempWorkspace workspace;
    const auto path = write_file(
        workspace.root() / "20241221-1430-FEAT-gamesvc-add-pagination.md", kFeatureTicket);
    Ticket ticket = get_value(Ticket::from_file(path));
    ASSERT_FALSE(is_error(ticket.set_session_id("plan", "abc-123")));

    auto reloaded = Ticket::from_file(path);
    ASSERT_FALSE(is_error(reloaded));
    EXPECT_EQ(get_value(reloaded).session_id("plan"), std::optional<std::string>("abc-123"));
    EXPECT_FALSE(get_value(reloaded).session_id("implement").has_value());
}

TEST(TicketTest, AwaitingEntryLandsInHistorySection) {
    TempWorkspace workspace;
    const auto path = write_file(
        workspace.root() / "20241221-1430-FEAT-gamesvc-add-pagination.md", kFeatureTicket);
    Ticket ticket = get_value(Ticket::from_file(path));
    ASSERT_FALSE(is_error(ticket.add_awaiting_entry("Planning")));

    const std::string text = read_file(path);
    EXPECT_NE(text.find("Moved to AWAITING during \"Planning\" step"), std::string::npos);
    EXPECT_GT(text.find("Moved to AWAITING"), text.find("## History"));
}

TEST(TicketTest, HistoryEntriesStartOnTheirOwnLine) {
    TempWorkspace workspace;
    const auto with_history = write_file(
        workspace.root() / "20241221-1430-TASK-api-a.md",
        "---\nid: TASK-1\nstatus: queued\nstep: \"\"\n---\n\n# Task: A\n\n## History\n\n- first");
    Ticket ticket = get_value(Ticket::from_file(with_history));
    ASSERT_FALSE(is_error(ticket.append_history("- second")));
    EXPECT_NE(read_file(with_history).find("\n- first\n- second\n"), std::string::npos);

    const auto followed = write_file(
        workspace.root() / "20241221-1430-TASK-api-b.md",
        "---\nid: TASK-2\nstatus: queued\nstep: \"\"\n---\n\n# Task: B\n\n## History\n\n- first\n\n"
        "## Notes\n\nkeep");
    ticket = get_value(Ticket::from_file(followed));
    ASSERT_FALSE(is_error(ticket.append_history("- second")));
    EXPECT_NE(read_file(followed).find("\n- first\n- second\n\n## Notes\n"), std::string::npos);

    const auto without_history = write_file(
        workspace.root() / "20241221-1430-TASK-api-c.md",
        "---\nid: TASK-3\nstatus: queued\nstep: \"\"\n---\n\n# Task: C\n\nno trailing newline");
    ticket = get_value(Ticket::from_file(without_history));
    ASSERT_FALSE(is_error(ticket.append_history("- entry")));
    EXPECT_NE(read_file(without_history).find("no trailing newline\n\n## History\n\n- entry\n"),
              std::string::npos);
}

TEST(TicketTest, AdvanceStepFollowsWorkflow) {
    TempWorkspace workspace;
    const auto path = write_file(
        workspace.root() / "20241221-1430-FEAT-gamesvc-add-pagination.md", kFeatureTicket);
    Ticket ticket = get_value(Ticket::from_file(path));

    auto next = ticket.advance_step(feature_type());
    ASSERT_FALSE(is_error(next));
    EXPECT_EQ(get_value(next), std::optional<std::string>("implement"));
    EXPECT_EQ(ticket.step, "implement");

    ASSERT_FALSE(is_error(ticket.set_step("pr")));
    auto terminal = ticket.advance_step(feature_type());
    ASSERT_FALSE(is_error(terminal));
    EXPECT_FALSE(get_value(terminal).has_value());

    ASSERT_FALSE(is_error(ticket.set_step("deploy")));
    auto unknown = ticket.advance_step(feature_type());
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_step");
}

}  // namespace
