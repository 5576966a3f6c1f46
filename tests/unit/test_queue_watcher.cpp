#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "core/config/ids.hpp"
#include "queue/queue_watcher.hpp"

namespace {

using orch::queue::QueueWatcher;
using orch::queue::WatchEvent;
using orch::queue::WatchEventKind;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::temp_directory_path() /
                ("orch_watch_" + orch::core::config::generate_uuid());
        std::filesystem::create_directories(root_ / "queue");
        std::filesystem::create_directories(root_ / "in-progress");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

TEST(QueueWatcherTest, FirstPollIsBaseline) {
    TempWorkspace ws;
    write(ws.root() / "queue" / "a.md", "x");
    QueueWatcher watcher({ws.root() / "queue"}, nullptr);
    EXPECT_TRUE(watcher.poll_once().empty());
    EXPECT_TRUE(watcher.poll_once().empty());
}

TEST(QueueWatcherTest, ReportsAddModifyRemove) {
    TempWorkspace ws;
    std::vector<WatchEvent> seen;
    QueueWatcher watcher({ws.root() / "queue", ws.root() / "in-progress"},
                         [&](const WatchEvent& event) { seen.push_back(event); });
    watcher.poll_once();

    const auto ticket = ws.root() / "queue" / "20241221-1200-TASK-demo-x.md";
    write(ticket, "---\nid: TASK-1\n---\n");
    auto added = watcher.poll_once();
    ASSERT_EQ(added.size(), 1u);
    EXPECT_EQ(added[0].kind, WatchEventKind::Added);
    EXPECT_EQ(added[0].path, ticket);

    write(ticket, "---\nid: TASK-1\nstatus: queued\n---\n");
    auto modified = watcher.poll_once();
    ASSERT_EQ(modified.size(), 1u);
    EXPECT_EQ(modified[0].kind, WatchEventKind::Modified);

    const auto claimed = ws.root() / "in-progress" / ticket.filename();
    std::filesystem::rename(ticket, claimed);
    auto moved = watcher.poll_once();
    ASSERT_EQ(moved.size(), 2u);
    bool saw_added = false;
    bool saw_removed = false;
    for (const auto& event : moved) {
        saw_added = saw_added || (event.kind == WatchEventKind::Added && event.path == claimed);
        saw_removed = saw_removed || (event.kind == WatchEventKind::Removed && event.path == ticket);
    }
    EXPECT_TRUE(saw_added);
    EXPECT_TRUE(saw_removed);
    EXPECT_EQ(seen.size(), 4u);
}

TEST(QueueWatcherTest, IgnoresNonMarkdownAndSubdirectories) {
    TempWorkspace ws;
    QueueWatcher watcher({ws.root() / "queue"}, nullptr);
    watcher.poll_once();

    write(ws.root() / "queue" / "notes.txt", "x");
    std::filesystem::create_directories(ws.root() / "queue" / "nested");
    write(ws.root() / "queue" / "nested" / "deep.md", "x");
    EXPECT_TRUE(watcher.poll_once().empty());
}

TEST(QueueWatcherTest, BackgroundThreadDeliversEvents) {
    TempWorkspace ws;
    std::atomic<int> count{0};
    QueueWatcher watcher({ws.root() / "queue"}, [&](const WatchEvent&) { ++count; },
                         std::chrono::milliseconds(10));
    watcher.start();
    EXPECT_TRUE(watcher.running());
    write(ws.root() / "queue" / "b.md", "x");

    for (int i = 0; i < 200 && count.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    watcher.stop();
    EXPECT_FALSE(watcher.running());
    EXPECT_GE(count.load(), 1);
}

TEST(QueueWatcherTest, StopWakesIdleLoopPromptly) {
    TempWorkspace ws;
    QueueWatcher watcher({ws.root() / "queue"}, nullptr, std::chrono::hours(1));
    for (int round = 0; round < 20; ++round) {
        watcher.start();
        const auto began = std::chrono::steady_clock::now();
        watcher.stop();
        EXPECT_LT(std::chrono::steady_clock::now() - began, std::chrono::seconds(5));
        EXPECT_FALSE(watcher.running());
    }
}

}  // namespace
