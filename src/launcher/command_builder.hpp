#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/config/config.hpp"
#include "core/errors/orch_errors.hpp"

namespace orch::launcher {

struct CommandInputs {
    std::vector<std::string> config_flags;
    std::string model;
    std::string session_id;
    std::filesystem::path prompt_file;
    bool yolo = false;
};

// Fills {{config_flags}}, {{model_flag}}, {{model}}, {{session_id}},
// {{prompt_file}} and {{yolo_flags}}. Flag placeholders expand to the
// flags plus a trailing space, or to nothing. Every substituted value is
// already a quoted shell word, so templates must not quote placeholders.
std::string build_command(const core::config::LlmToolConfig& tool, const CommandInputs& inputs);

// Wraps the command for docker run. Precondition docker_image_missing
// when no image is configured.
core::errors::Result<std::string> wrap_docker(const core::config::DockerConfig& docker,
                                              const std::string& inner_command,
                                              const std::filesystem::path& project_path);

// "#!/bin/bash\ncd '<dir>'\nexec <command>\n"
std::string build_launch_script(const std::filesystem::path& working_directory,
                                const std::string& command);

}  // namespace orch::launcher
