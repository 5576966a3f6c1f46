#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace orch::queue {

enum class WatchEventKind { Added, Modified, Removed };

std::string to_string(WatchEventKind kind);

struct WatchEvent {
    WatchEventKind kind;
    std::filesystem::path path;
};

using WatchCallback = std::function<void(const WatchEvent&)>;

// Polls the given directories (non-recursive, *.md only) and reports changes.
// The first poll records a baseline without emitting events.
class QueueWatcher {
public:
    QueueWatcher(std::vector<std::filesystem::path> directories, WatchCallback callback,
                 std::chrono::milliseconds interval = std::chrono::milliseconds(1000));
    ~QueueWatcher();

    QueueWatcher(const QueueWatcher&) = delete;
    QueueWatcher& operator=(const QueueWatcher&) = delete;

    // Scans once and invokes the callback for each change since the previous scan.
    std::vector<WatchEvent> poll_once();

    void start();
    void stop();
    bool running() const { return running_.load(); }

private:
    struct FileStamp {
        std::filesystem::file_time_type mtime;
        std::uintmax_t size = 0;
    };
    using Snapshot = std::map<std::filesystem::path, FileStamp>;

    Snapshot scan() const;
    void loop();

    std::vector<std::filesystem::path> directories_;
    WatchCallback callback_;
    std::chrono::milliseconds interval_;

    std::mutex poll_mutex_;
    Snapshot known_;
    bool primed_ = false;

    std::atomic_bool running_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::thread thread_;
};

}  // namespace orch::queue
