#include "api/api_session.hpp"

#include <fstream>
#include <utility>
#include "core/logging/logger.hpp"

namespace orch::api {

using core::errors::ErrorCategory;
using core::errors::OrchError;
using nlohmann::json;

json api_session_to_json(const ApiSessionInfo& info) {
    return json{{"port", info.port},
                {"pid", info.pid},
                {"started_at", info.started_at},
                {"version", info.version}};
}

core::errors::Result<ApiSessionInfo> read_api_session(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return OrchError{ErrorCategory::NotFound, "No API session file at " + path.string(),
                         "api_session_missing"};
    }
    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return OrchError{ErrorCategory::Malformed, "API session file is not valid JSON",
                         "api_session_malformed"};
    }
    try {
        ApiSessionInfo info;
        info.port = doc.at("port").get<std::uint16_t>();
        info.pid = doc.at("pid").get<std::int64_t>();
        info.started_at = doc.value("started_at", "");
        info.version = doc.value("version", "");
        return info;
    } catch (const json::exception& e) {
        return OrchError{ErrorCategory::Malformed,
                         std::string("API session file is incomplete: ") + e.what(),
                         "api_session_malformed"};
    }
}

ApiSessionFile::ApiSessionFile(std::filesystem::path path) : path_(std::move(path)) {}

ApiSessionFile::~ApiSessionFile() {
    remove();
}

core::errors::Status ApiSessionFile::write(const ApiSessionInfo& info) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    std::ofstream out(path_, std::ios::trunc);
    if (!out.is_open()) {
        return OrchError{ErrorCategory::External, "Unable to write " + path_.string(),
                         "api_session_write_failed"};
    }
    out << api_session_to_json(info).dump(2) << "\n";
    written_ = true;
    LOG_DEBUG("API session recorded at " + path_.string());
    return core::errors::ok();
}

void ApiSessionFile::remove() {
    if (!written_) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        LOG_WARN("Unable to remove " + path_.string() + ": " + ec.message());
    }
    written_ = false;
}

}  // namespace orch::api
