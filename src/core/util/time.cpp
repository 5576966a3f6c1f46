#include "core/util/time.hpp"

#include <chrono>
#include <ctime>

namespace orch::core::util {

std::int64_t now_epoch_seconds() {
    const auto now = std::chrono::system_clock::now();
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch())
            .count());
}

std::string format_iso8601(const std::int64_t epoch_seconds) {
    const std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

std::optional<std::int64_t> parse_iso8601(const std::string& text) {
    std::tm tm{};
    const char* end = strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
    if (end == nullptr) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(timegm(&tm));
}

std::string format_local(const std::int64_t epoch_seconds, const char* format) {
    const std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), format, &tm);
    return buffer;
}

std::string ticket_timestamp(const std::int64_t epoch_seconds) {
    return format_local(epoch_seconds, "%Y%m%d-%H%M");
}

}  // namespace orch::core::util
