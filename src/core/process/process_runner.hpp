#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/orch_errors.hpp"

namespace orch::core::process {

struct ProcessRequest {
    std::vector<std::string> argv;
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 30000;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;

    bool success() const { return exit_code == 0 && !timed_out && !cancelled; }
};

// Runs argv[0] (looked up on PATH) and captures both output streams.
// An error is returned only when the process could not be started.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

// Absolute path of an executable found on PATH.
std::optional<std::filesystem::path> find_executable(const std::string& name);

}  // namespace orch::core::process
