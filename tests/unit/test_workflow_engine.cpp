#include <atomic>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "issuetypes/registry.hpp"
#include "queue/ticket.hpp"
#include "workflow/workflow_engine.hpp"

namespace {

using orch::core::errors::get_error;
using orch::core::errors::get_value;
using orch::core::errors::is_error;
using orch::issuetypes::IssueTypeRegistry;
using orch::issuetypes::StatusCategory;
using orch::issuetypes::StepSchema;
using orch::queue::Ticket;
using orch::workflow::WorkflowEngine;

Ticket make_ticket(const std::string& type, const std::string& step) {
    Ticket ticket;
    ticket.filename = "20241221-1430-" + type + "-api-x.md";
    ticket.ticket_type = type;
    ticket.id = type + "-1";
    ticket.summary = "Add pagination";
    ticket.project = "api";
    ticket.step = step;
    return ticket;
}

TEST(WorkflowEngineTest, CurrentStepDefaultsToFirst) {
    IssueTypeRegistry registry;
    WorkflowEngine engine(registry);
    auto step = engine.current_step(make_ticket("FEAT", ""));
    ASSERT_FALSE(is_error(step));
    EXPECT_EQ(get_value(step).name, "plan");

    auto unknown = engine.current_step(make_ticket("FEAT", "deploy"));
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_step");

    auto missing_type = engine.current_step(make_ticket("NOPE", ""));
    ASSERT_TRUE(is_error(missing_type));
    EXPECT_EQ(get_error(missing_type).code, "issuetype_not_found");
}

TEST(WorkflowEngineTest, NextStepFollowsChainToTerminal) {
    IssueTypeRegistry registry;
    WorkflowEngine engine(registry);
    auto next = engine.next_step(make_ticket("FEAT", "plan"));
    ASSERT_FALSE(is_error(next));
    ASSERT_TRUE(get_value(next).has_value());
    EXPECT_EQ(get_value(next)->name, "implement");

    auto terminal = engine.next_step(make_ticket("FEAT", "pr"));
    ASSERT_FALSE(is_error(terminal));
    EXPECT_FALSE(get_value(terminal).has_value());
}

TEST(WorkflowEngineTest, ReviewStepsCannotProceedWithoutApproval) {
    IssueTypeRegistry registry;
    WorkflowEngine engine(registry);

    auto plan = engine.can_proceed(make_ticket("FEAT", "plan"));
    ASSERT_FALSE(is_error(plan));
    EXPECT_FALSE(get_value(plan));

    auto implement = engine.can_proceed(make_ticket("FEAT", "implement"));
    ASSERT_FALSE(is_error(implement));
    EXPECT_TRUE(get_value(implement));
}

TEST(WorkflowEngineTest, PullRequestReviewDefersToChecker) {
    IssueTypeRegistry registry;
    auto feat = *registry.get("FEAT");
    feat.key = "PRREV";
    feat.source = orch::issuetypes::IssueTypeSource::user();
    feat.steps.back().requires_review = true;
    ASSERT_FALSE(is_error(registry.register_type(feat)));

    WorkflowEngine engine(registry);
    Ticket ticket = make_ticket("PRREV", "pr");
    bool called = false;
    auto approved = engine.can_proceed(ticket, [&called](const Ticket&, const StepSchema& step) {
        called = true;
        return step.name == "pr";
    });
    ASSERT_FALSE(is_error(approved));
    EXPECT_TRUE(called);
    EXPECT_TRUE(get_value(approved));

    auto without_checker = engine.can_proceed(ticket);
    ASSERT_FALSE(is_error(without_checker));
    EXPECT_FALSE(get_value(without_checker));
}

TEST(WorkflowEngineTest, RejectionPromptSubstitutesReason) {
    IssueTypeRegistry registry;
    WorkflowEngine engine(registry);
    auto rejection = engine.render_rejection_prompt(make_ticket("FEAT", "plan"), "scope too large");
    ASSERT_FALSE(is_error(rejection));
    ASSERT_TRUE(get_value(rejection).has_value());
    EXPECT_EQ(get_value(rejection)->goto_step, "plan");
    EXPECT_NE(get_value(rejection)->prompt.find("rejected: scope too large"), std::string::npos);
    EXPECT_EQ(get_value(rejection)->prompt.find("{{"), std::string::npos);

    auto none = engine.get_rejection_step(make_ticket("FEAT", "implement"));
    ASSERT_FALSE(is_error(none));
    EXPECT_FALSE(get_value(none).has_value());
}

TEST(WorkflowEngineTest, ProgressBracketsCurrentStep) {
    IssueTypeRegistry registry;
    WorkflowEngine engine(registry);
    auto progress = engine.format_progress(make_ticket("FEAT", "implement"));
    ASSERT_FALSE(is_error(progress));
    EXPECT_EQ(get_value(progress).display, "plan > [implement] > pr");
    EXPECT_EQ(get_value(progress).index, 1u);
    EXPECT_EQ(get_value(progress).total, 3u);
}

TEST(WorkflowEngineTest, StatusCategoryFromStepShape) {
    IssueTypeRegistry registry;
    WorkflowEngine engine(registry);
    EXPECT_EQ(get_value(engine.step_status_category(make_ticket("FEAT", "plan"))),
              StatusCategory::Await);
    EXPECT_EQ(get_value(engine.step_status_category(make_ticket("FEAT", "implement"))),
              StatusCategory::Doing);
    EXPECT_EQ(get_value(engine.step_status_category(make_ticket("FEAT", "pr"))),
              StatusCategory::Done);
}

TEST(WorkflowEngineTest, TypeRemovedMidQueryIsNotFound) {
    IssueTypeRegistry registry;
    auto copy = *registry.get("FEAT");
    copy.key = "FLIP";
    copy.source = orch::issuetypes::IssueTypeSource::user();
    ASSERT_FALSE(is_error(registry.register_type(copy)));

    std::atomic_bool done{false};
    std::thread flipper([&registry, &copy, &done] {
        while (!done.load()) {
            (void)registry.remove_type("FLIP");
            (void)registry.register_type(copy);
        }
    });

    WorkflowEngine engine(registry);
    const Ticket ticket = make_ticket("FLIP", "implement");
    for (int i = 0; i < 2000; ++i) {
        auto next = engine.next_step(ticket);
        if (is_error(next)) {
            EXPECT_EQ(get_error(next).code, "issuetype_not_found");
        } else {
            EXPECT_EQ(get_value(next)->name, "pr");
        }
        auto progress = engine.format_progress(ticket);
        if (is_error(progress)) {
            EXPECT_EQ(get_error(progress).code, "issuetype_not_found");
        } else {
            EXPECT_EQ(get_value(progress).index, 1u);
        }
        auto category = engine.step_status_category(ticket);
        if (is_error(category)) {
            EXPECT_EQ(get_error(category).code, "issuetype_not_found");
        } else {
            EXPECT_EQ(get_value(category), StatusCategory::Doing);
        }
    }
    done = true;
    flipper.join();
}

}  // namespace
