#include "queue/queue_watcher.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace orch::queue {

std::string to_string(const WatchEventKind kind) {
    switch (kind) {
        case WatchEventKind::Added:
            return "added";
        case WatchEventKind::Modified:
            return "modified";
        case WatchEventKind::Removed:
            return "removed";
    }
    return "unknown";
}

QueueWatcher::QueueWatcher(std::vector<std::filesystem::path> directories, WatchCallback callback,
                           const std::chrono::milliseconds interval)
    : directories_(std::move(directories)), callback_(std::move(callback)), interval_(interval) {}

QueueWatcher::~QueueWatcher() {
    stop();
}

QueueWatcher::Snapshot QueueWatcher::scan() const {
    Snapshot snapshot;
    for (const auto& dir : directories_) {
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            continue;
        }
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            if (!entry.is_regular_file(ec) || entry.path().extension() != ".md") {
                continue;
            }
            FileStamp stamp;
            stamp.mtime = entry.last_write_time(ec);
            if (ec) {
                continue;
            }
            stamp.size = entry.file_size(ec);
            snapshot[entry.path()] = stamp;
        }
        if (ec) {
            LOG_WARN("Queue watcher: unable to scan " + dir.string() + ": " + ec.message());
        }
    }
    return snapshot;
}

std::vector<WatchEvent> QueueWatcher::poll_once() {
    std::lock_guard<std::mutex> lock(poll_mutex_);
    Snapshot current = scan();
    std::vector<WatchEvent> events;

    if (primed_) {
        for (const auto& entry : current) {
            auto previous = known_.find(entry.first);
            if (previous == known_.end()) {
                events.push_back({WatchEventKind::Added, entry.first});
            } else if (previous->second.mtime != entry.second.mtime ||
                       previous->second.size != entry.second.size) {
                events.push_back({WatchEventKind::Modified, entry.first});
            }
        }
        for (const auto& entry : known_) {
            if (current.count(entry.first) == 0) {
                events.push_back({WatchEventKind::Removed, entry.first});
            }
        }
    }
    known_ = std::move(current);
    primed_ = true;

    for (const auto& event : events) {
        LOG_DEBUG("Queue watcher: " + to_string(event.kind) + " " + event.path.filename().string());
        if (callback_) {
            callback_(event);
        }
    }
    return events;
}

void QueueWatcher::start() {
    if (running_.exchange(true)) {
        return;
    }
    poll_once();
    thread_ = std::thread([this]() { loop(); });
}

void QueueWatcher::stop() {
    {
        // Flipped under the lock so the loop cannot miss the wakeup between its check and wait.
        std::lock_guard<std::mutex> lock(stop_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    stop_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void QueueWatcher::loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(stop_mutex_);
            stop_cv_.wait_for(lock, interval_, [this]() { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }
        poll_once();
    }
}

}  // namespace orch::queue
