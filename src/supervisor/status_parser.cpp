#include "supervisor/status_parser.hpp"

#include <charconv>
#include <regex>
#include "core/util/text.hpp"

namespace orch::supervisor {

using core::errors::ErrorCategory;
using core::errors::OrchError;

namespace {

std::string normalize_key(const std::string& key) {
    std::string out;
    for (const char c : core::util::lowercase(core::util::trim(key))) {
        if (c != '_' && c != '-') {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<int> parse_int(const std::string& value) {
    int parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    const auto result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return parsed;
}

// A block whose keys all landed on one line ("status: complete exit_signal: true")
// is split back into lines at each known key.
std::string expand_collapsed(const std::string& body) {
    const std::string trimmed = core::util::trim(body);
    if (trimmed.find('\n') != std::string::npos) {
        return body;
    }
    static const std::regex known_key(
        R"((^|\s+)(status|exit[_-]?signal|confidence|files[_-]?modified|tests[_-]?status|)"
        R"(error[_-]?count|tasks[_-]?completed|tasks[_-]?remaining|summary|recommendation|)"
        R"(blockers)\s*:)",
        std::regex::icase);
    return std::regex_replace(trimmed, known_key, "\n$2:");
}

}  // namespace

nlohmann::json StatusBlock::to_json() const {
    nlohmann::json j{{"status", status}, {"exit_signal", exit_signal}, {"blockers", blockers}};
    if (confidence) j["confidence"] = *confidence;
    if (files_modified) j["files_modified"] = *files_modified;
    if (tests_status) j["tests_status"] = *tests_status;
    if (error_count) j["error_count"] = *error_count;
    if (tasks_completed) j["tasks_completed"] = *tasks_completed;
    if (tasks_remaining) j["tasks_remaining"] = *tasks_remaining;
    if (summary) j["summary"] = *summary;
    if (recommendation) j["recommendation"] = *recommendation;
    return j;
}

bool is_valid_status(const std::string& status) {
    return status == "complete" || status == "in_progress" || status == "blocked" ||
           status == "failed";
}

bool parse_bool_value(const std::string& value) {
    const std::string v = core::util::lowercase(core::util::trim(value));
    return v == "true" || v == "yes" || v == "1" || v == "on" || v == "y";
}

core::errors::Result<StatusBlock> parse_status_block(const std::string& body) {
    StatusBlock block;
    bool saw_status = false;
    bool saw_exit_signal = false;

    for (const auto& raw_line : core::util::split(expand_collapsed(body), '\n')) {
        const std::string line = core::util::trim(raw_line);
        const auto colon = line.find(':');
        if (line.empty() || colon == std::string::npos) {
            continue;
        }
        const std::string key = normalize_key(line.substr(0, colon));
        const std::string value = core::util::trim(line.substr(colon + 1));

        if (key == "status") {
            block.status = core::util::lowercase(value);
            saw_status = true;
        } else if (key == "exitsignal") {
            block.exit_signal = parse_bool_value(value);
            saw_exit_signal = true;
        } else if (key == "confidence") {
            block.confidence = parse_int(value);
        } else if (key == "filesmodified") {
            block.files_modified = parse_int(value);
        } else if (key == "testsstatus") {
            block.tests_status = value;
        } else if (key == "errorcount") {
            block.error_count = parse_int(value);
        } else if (key == "taskscompleted") {
            block.tasks_completed = parse_int(value);
        } else if (key == "tasksremaining") {
            block.tasks_remaining = parse_int(value);
        } else if (key == "summary") {
            block.summary = core::util::truncate_words(value, kMaxSummaryLength);
        } else if (key == "recommendation") {
            block.recommendation = core::util::truncate_words(value, kMaxRecommendationLength);
        } else if (key == "blockers") {
            block.blockers = core::util::split_list(value, ',');
        }
    }

    if (!saw_status) {
        return OrchError{ErrorCategory::Malformed, "Status block is missing 'status'",
                         "status_block_malformed"};
    }
    if (!is_valid_status(block.status)) {
        return OrchError{ErrorCategory::Malformed,
                         "Status block has unknown status '" + block.status + "'",
                         "status_block_malformed"};
    }
    if (!saw_exit_signal) {
        return OrchError{ErrorCategory::Malformed, "Status block is missing 'exit_signal'",
                         "status_block_malformed"};
    }
    return block;
}

core::errors::Result<StatusBlock> find_last_status_block(const std::string& output) {
    const std::string start_marker = kStatusStartMarker;
    const std::string end_marker = kStatusEndMarker;

    std::optional<StatusBlock> last;
    std::optional<OrchError> last_error;
    std::size_t pos = 0;
    while (true) {
        const auto start = output.find(start_marker, pos);
        if (start == std::string::npos) {
            break;
        }
        const auto body_start = start + start_marker.size();
        const auto end = output.find(end_marker, body_start);
        if (end == std::string::npos) {
            break;
        }
        auto parsed = parse_status_block(output.substr(body_start, end - body_start));
        if (core::errors::is_error(parsed)) {
            last_error = core::errors::get_error(parsed);
        } else {
            last = core::errors::get_value(parsed);
        }
        pos = end + end_marker.size();
    }

    if (last) {
        return *last;
    }
    if (last_error) {
        return *last_error;
    }
    return OrchError{ErrorCategory::Malformed, "No status block found in agent output",
                     "status_block_missing"};
}

}  // namespace orch::supervisor
