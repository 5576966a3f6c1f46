#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/orch_errors.hpp"

namespace orch::api {

// Discovery record for clients of a standalone API server.
struct ApiSessionInfo {
    std::uint16_t port = 0;
    std::int64_t pid = 0;
    std::string started_at;  // ISO-8601 UTC
    std::string version;
};

nlohmann::json api_session_to_json(const ApiSessionInfo& info);
core::errors::Result<ApiSessionInfo> read_api_session(const std::filesystem::path& path);

// write() creates the record; it is deleted again on destruction.
class ApiSessionFile {
public:
    explicit ApiSessionFile(std::filesystem::path path);
    ~ApiSessionFile();

    ApiSessionFile(const ApiSessionFile&) = delete;
    ApiSessionFile& operator=(const ApiSessionFile&) = delete;

    core::errors::Status write(const ApiSessionInfo& info);
    void remove();

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    bool written_ = false;
};

}  // namespace orch::api
