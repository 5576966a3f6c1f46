#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/orch_errors.hpp"

namespace orch::app::cli {

    enum class Command {
        Run, Queue, Launch, Agents, Pause, Resume, Stalled, Alert, Create, GenerateAgents, Api, Help
    };

    std::string to_string(Command command);

    struct CliOptions {
        Command command = Command::Run;
        std::optional<std::filesystem::path> config_path;

        // queue
        bool all = false;
        // launch
        std::optional<std::string> ticket;
        bool yes = false;
        std::optional<std::string> provider;
        std::optional<std::string> model;
        bool yolo = false;
        bool docker = false;
        // agents
        bool verbose = false;
        // alert
        std::string source;
        std::string message;
        std::string severity = "medium";
        std::optional<std::string> project;
        // create
        std::string template_key;
        std::optional<std::string> summary;
        // api
        std::optional<std::uint16_t> port;
    };

    std::string usage();

    orch::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}
