#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/ids.hpp"
#include "issuetypes/registry.hpp"
#include "queue/ticket_store.hpp"

namespace {

using orch::core::errors::get_error;
using orch::core::errors::get_value;
using orch::core::errors::is_error;
using orch::issuetypes::IssueTypeRegistry;
using orch::queue::Ticket;
using orch::queue::TicketStore;
using orch::queue::priority_for_severity;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::temp_directory_path() /
                ("orch_store_" + orch::core::config::generate_uuid());
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

void write_ticket(const std::filesystem::path& dir, const std::string& filename,
                  const std::string& id, const std::string& status = "queued") {
    std::filesystem::create_directories(dir);
    std::ofstream out(dir / filename);
    out << "---\nid: " << id << "\nstatus: " << status << "\nstep: \"\"\n---\n\n# Task: "
        << id << "\n";
}

TEST(TicketStoreTest, QueueOrdersByCollectionPriorityThenTimestamp) {
    TempWorkspace workspace;
    TicketStore store(workspace.root() / "tickets");
    ASSERT_FALSE(is_error(store.ensure_directories()));
    write_ticket(store.queue_dir(), "20241221-0900-TASK-api-a.md", "TASK-1");
    write_ticket(store.queue_dir(), "20241221-1000-FEAT-api-b.md", "FEAT-1");
    write_ticket(store.queue_dir(), "20241221-1100-INV-api-c.md", "INV-1");
    write_ticket(store.queue_dir(), "20241221-0800-FEAT-api-d.md", "FEAT-2");

    IssueTypeRegistry registry;
    const auto ordered = store.list_by_priority(registry);
    ASSERT_EQ(ordered.size(), 4u);
    EXPECT_EQ(ordered[0].id, "INV-1");
    EXPECT_EQ(ordered[1].id, "FEAT-2");
    EXPECT_EQ(ordered[2].id, "FEAT-1");
    EXPECT_EQ(ordered[3].id, "TASK-1");
}

TEST(TicketStoreTest, UnparseableFilesAreSkipped) {
    TempWorkspace workspace;
    TicketStore store(workspace.root() / "tickets");
    write_ticket(store.queue_dir(), "20241221-0900-TASK-api-a.md", "TASK-1");
    write_ticket(store.queue_dir(), "notes.md", "TASK-2");
    write_ticket(store.queue_dir(), "20241221-0900-TASK-api-b.txt", "TASK-3");

    EXPECT_EQ(store.list_queue().size(), 1u);
}

TEST(TicketStoreTest, NextTicketSkipsFailedAndExcluded) {
    TempWorkspace workspace;
    TicketStore store(workspace.root() / "tickets");
    write_ticket(store.queue_dir(), "20241221-0900-FIX-api-a.md", "FIX-1", "failed");
    write_ticket(store.queue_dir(), "20241221-1000-FIX-api-b.md", "FIX-2");
    write_ticket(store.queue_dir(), "20241221-1100-FIX-api-c.md", "FIX-3");

    IssueTypeRegistry registry;
    auto next = store.next_ticket(registry);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->id, "FIX-2");

    next = store.next_ticket(registry, std::set<std::string>{"FIX-2"});
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->id, "FIX-3");
}

TEST(TicketStoreTest, SecondClaimIsConflict) {
    TempWorkspace workspace;
    TicketStore store(workspace.root() / "tickets");
    ASSERT_FALSE(is_error(store.ensure_directories()));
    write_ticket(store.queue_dir(), "20241221-0900-TASK-api-a.md", "TASK-1");
    const Ticket ticket = store.list_queue().front();

    auto first = store.claim_ticket(ticket);
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first).status, "in-progress");
    EXPECT_TRUE(std::filesystem::exists(store.in_progress_dir() / ticket.filename));
    EXPECT_FALSE(std::filesystem::exists(store.queue_dir() / ticket.filename));

    auto second = store.claim_ticket(ticket);
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).code, "already_claimed");
}

TEST(TicketStoreTest, ConcurrentClaimsHaveOneWinner) {
    TempWorkspace workspace;
    // Two stores over one directory stand in for two operator processes.
    TicketStore first_store(workspace.root() / "tickets");
    TicketStore second_store(workspace.root() / "tickets");
    ASSERT_FALSE(is_error(first_store.ensure_directories()));
    write_ticket(first_store.queue_dir(), "20241221-0900-TASK-api-a.md", "TASK-1");
    const Ticket ticket = first_store.list_queue().front();

    constexpr int kClaimers = 8;
    std::vector<std::string> outcomes(kClaimers);
    std::vector<std::thread> claimers;
    for (int i = 0; i < kClaimers; ++i) {
        TicketStore& store = i % 2 == 0 ? first_store : second_store;
        claimers.emplace_back([&store, &ticket, &outcomes, i] {
            auto claimed = store.claim_ticket(ticket);
            outcomes[i] = is_error(claimed) ? get_error(claimed).code : "ok";
        });
    }
    for (auto& claimer : claimers) {
        claimer.join();
    }

    int winners = 0;
    for (const auto& outcome : outcomes) {
        if (outcome == "ok") {
            ++winners;
        } else {
            EXPECT_EQ(outcome, "already_claimed");
        }
    }
    EXPECT_EQ(winners, 1);
    EXPECT_TRUE(std::filesystem::exists(first_store.in_progress_dir() / ticket.filename));
    EXPECT_TRUE(first_store.list_queue().empty());
}

TEST(TicketStoreTest, InProgressLookupPrefersExactId) {
    TempWorkspace workspace;
    TicketStore store(workspace.root() / "tickets");
    write_ticket(store.in_progress_dir(), "20241221-0900-TASK-12-api-a.md", "TASK-12",
                 "in-progress");
    write_ticket(store.in_progress_dir(), "20241221-1000-TASK-1-api-b.md", "TASK-1",
                 "in-progress");

    auto exact = store.find_in_progress("TASK-1");
    ASSERT_FALSE(is_error(exact));
    EXPECT_EQ(get_value(exact).filename, "20241221-1000-TASK-1-api-b.md");

    auto by_name = store.find_in_progress("api-a");
    ASSERT_FALSE(is_error(by_name));
    EXPECT_EQ(get_value(by_name).id, "TASK-12");
}

TEST(TicketStoreTest, CompleteAndReturnMoveFiles) {
    TempWorkspace workspace;
    TicketStore store(workspace.root() / "tickets");
    ASSERT_FALSE(is_error(store.ensure_directories()));
    write_ticket(store.queue_dir(), "20241221-0900-TASK-api-a.md", "TASK-1");
    write_ticket(store.queue_dir(), "20241221-0900-TASK-api-b.md", "TASK-2");

    auto claimed = store.claim_ticket(store.list_queue().front());
    ASSERT_FALSE(is_error(claimed));
    auto completed = store.complete_ticket(get_value(claimed));
    ASSERT_FALSE(is_error(completed));
    EXPECT_EQ(get_value(completed).status, "completed");
    EXPECT_EQ(store.list_completed().size(), 1u);

    auto other = store.claim_ticket(store.list_queue().front());
    ASSERT_FALSE(is_error(other));
    auto failed = store.return_to_queue(get_value(other), "failed");
    ASSERT_FALSE(is_error(failed));
    EXPECT_EQ(get_value(failed).status, "failed");
    EXPECT_TRUE(store.list_in_progress().empty());

    auto invalid = store.return_to_queue(get_value(failed), "in-progress");
    ASSERT_TRUE(is_error(invalid));
    EXPECT_EQ(get_error(invalid).code, "invalid_status");
}

TEST(TicketStoreTest, FindTicketByIdOrFilename) {
    TempWorkspace workspace;
    TicketStore store(workspace.root() / "tickets");
    write_ticket(store.queue_dir(), "20241221-0900-TASK-api-cleanup.md", "TASK-7");
    write_ticket(store.in_progress_dir(), "20241221-1000-FIX-api-crash.md", "FIX-3",
                 "in-progress");

    auto by_id = store.find_ticket("FIX-3");
    ASSERT_FALSE(is_error(by_id));
    EXPECT_EQ(get_value(by_id).filename, "20241221-1000-FIX-api-crash.md");

    auto by_name = store.find_ticket("cleanup");
    ASSERT_FALSE(is_error(by_name));
    EXPECT_EQ(get_value(by_name).id, "TASK-7");

    auto missing = store.find_ticket("SPIKE-1");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "ticket_not_found");
}

TEST(TicketStoreTest, CreateTicketWritesFrontmatterAndNumbersIds) {
    TempWorkspace workspace;
    TicketStore store(workspace.root() / "tickets");
    write_ticket(store.completed_dir(), "20241201-0900-FEAT-api-old.md", "FEAT-4", "completed");

    IssueTypeRegistry registry;
    const auto feat = registry.get("FEAT");
    ASSERT_TRUE(feat.has_value());

    auto created = store.create_ticket(*feat, "Game Svc", "Add pagination to list API");
    ASSERT_FALSE(is_error(created));
    const Ticket& ticket = get_value(created);
    EXPECT_EQ(ticket.id, "FEAT-5");
    EXPECT_EQ(ticket.project, "gamesvc");
    EXPECT_EQ(ticket.step, "plan");
    EXPECT_EQ(ticket.status, "queued");
    EXPECT_EQ(ticket.summary, "Add pagination to list API");
    EXPECT_EQ(ticket.priority, "P2-medium");
    EXPECT_NE(ticket.filename.find("-FEAT-gamesvc-add-pagination-to-list-api.md"),
              std::string::npos);
    EXPECT_TRUE(orch::queue::parse_filename_strict(ticket.filename).has_value());

    auto again = store.create_ticket(*feat, "gamesvc", "Add pagination to list API");
    ASSERT_FALSE(is_error(again));
    EXPECT_EQ(get_value(again).id, "FEAT-6");
    EXPECT_NE(get_value(again).filename, ticket.filename);
}

TEST(TicketStoreTest, AgentTicketsForTypesWithAgentPrompt) {
    TempWorkspace workspace;
    TicketStore store(workspace.root() / "tickets");
    const auto project_path = workspace.root() / "api";
    std::filesystem::create_directories(project_path / ".claude" / "agents");
    std::ofstream(project_path / ".claude" / "agents" / "revw-operator.md") << "existing";

    IssueTypeRegistry registry;
    for (const std::string key : {"DOCS", "REVW"}) {
        auto type = *registry.get("FEAT");
        type.key = key;
        type.name = key == "DOCS" ? "Documentation" : "Review";
        type.source = orch::issuetypes::IssueTypeSource::user();
        type.agent_prompt = "You write " + type.name + " for this project.";
        ASSERT_FALSE(is_error(registry.register_type(type)));
    }

    auto report = store.create_agent_tickets(registry, project_path, "api");
    ASSERT_FALSE(is_error(report));
    ASSERT_EQ(get_value(report).created.size(), 1u);
    EXPECT_EQ(get_value(report).skipped, std::vector<std::string>{"REVW"});
    EXPECT_TRUE(get_value(report).errors.empty());

    const auto queued = store.list_queue();
    ASSERT_EQ(queued.size(), 1u);
    EXPECT_EQ(queued.front().id, get_value(report).created.front());
    EXPECT_EQ(queued.front().ticket_type, "TASK");
    EXPECT_EQ(queued.front().summary, "Create api Documentation operator agent");
    EXPECT_NE(queued.front().content.find("You write Documentation for this project."),
              std::string::npos);
    EXPECT_NE(queued.front().content.find(".claude/agents/docs-operator.md"), std::string::npos);
}

TEST(TicketStoreTest, CreateTicketRejectsEmptySummary) {
    TempWorkspace workspace;
    TicketStore store(workspace.root() / "tickets");
    IssueTypeRegistry registry;
    auto created = store.create_ticket(*registry.get("TASK"), "api", "   ");
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).code, "missing_summary");
}

TEST(TicketStoreTest, InvestigationFromAlert) {
    TempWorkspace workspace;
    TicketStore store(workspace.root() / "tickets");
    IssueTypeRegistry registry;

    auto created = store.create_investigation(*registry.get("INV"), "prometheus",
                                              "Disk usage above ninety percent on db-1\nmore",
                                              "critical");
    ASSERT_FALSE(is_error(created));
    const Ticket& ticket = get_value(created);
    EXPECT_EQ(ticket.priority, "P0-critical");
    EXPECT_EQ(ticket.project, "global");
    EXPECT_EQ(ticket.frontmatter.at("source"), "prometheus");
    EXPECT_EQ(ticket.frontmatter.at("severity"), "critical");
    EXPECT_EQ(store.list_queue().size(), 1u);
}

TEST(TicketStoreTest, SeverityMapsToPriority) {
    EXPECT_EQ(priority_for_severity("critical"), "P0-critical");
    EXPECT_EQ(priority_for_severity("HIGH"), "P1-high");
    EXPECT_EQ(priority_for_severity("low"), "P2-medium");
}

}  // namespace
