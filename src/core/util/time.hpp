#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace orch::core::util {

std::int64_t now_epoch_seconds();

// 2024-12-21T12:00:00Z
std::string format_iso8601(std::int64_t epoch_seconds);
std::optional<std::int64_t> parse_iso8601(const std::string& text);

// strftime over local time, e.g. "%Y-%m-%d %H:%M:%S".
std::string format_local(std::int64_t epoch_seconds, const char* format);

// YYYYMMDD-HHMM, the ticket filename timestamp.
std::string ticket_timestamp(std::int64_t epoch_seconds);

}  // namespace orch::core::util
