#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/orch_errors.hpp"

namespace orch::supervisor {

inline constexpr const char* kStatusStartMarker = "---OPERATOR_STATUS---";
inline constexpr const char* kStatusEndMarker = "---END_OPERATOR_STATUS---";
inline constexpr std::size_t kMaxSummaryLength = 500;
inline constexpr std::size_t kMaxRecommendationLength = 200;

// The block an agent prints when it stops working on a step.
struct StatusBlock {
    std::string status;  // complete, in_progress, blocked or failed
    bool exit_signal = false;
    std::optional<int> confidence;
    std::optional<int> files_modified;
    std::optional<std::string> tests_status;
    std::optional<int> error_count;
    std::optional<int> tasks_completed;
    std::optional<int> tasks_remaining;
    std::optional<std::string> summary;
    std::optional<std::string> recommendation;
    std::vector<std::string> blockers;

    nlohmann::json to_json() const;
};

bool is_valid_status(const std::string& status);
bool parse_bool_value(const std::string& value);

// Parses the text between the markers. Missing or invalid status, or a
// missing exit_signal, is Malformed.
core::errors::Result<StatusBlock> parse_status_block(const std::string& body);

// The last well-formed block in the output. Malformed when no block
// parses, including when there are no markers at all.
core::errors::Result<StatusBlock> find_last_status_block(const std::string& output);

}  // namespace orch::supervisor
