#include "launcher/command_builder.hpp"

#include "core/util/text.hpp"

namespace orch::launcher {

using core::errors::ErrorCategory;
using core::errors::OrchError;

namespace {

// Each flag is one shell word; the launch script runs the command through bash.
std::string flag_text(const std::vector<std::string>& flags) {
    std::vector<std::string> words;
    words.reserve(flags.size());
    for (const auto& flag : flags) {
        words.push_back(core::util::shell_word(flag));
    }
    return words.empty() ? "" : core::util::join(words, " ") + " ";
}

}  // namespace

std::string build_command(const core::config::LlmToolConfig& tool, const CommandInputs& inputs) {
    const bool has_yolo_placeholder =
        tool.command_template.find("{{yolo_flags}}") != std::string::npos;
    const std::string yolo = inputs.yolo ? flag_text(tool.yolo_flags) : "";
    const std::string model = inputs.model.empty() ? "" : core::util::shell_word(inputs.model);
    const std::string model_flag =
        model.empty() || tool.model_flag.empty() ? "" : tool.model_flag + " " + model + " ";

    std::string command = tool.command_template;
    command = core::util::replace_all(command, "{{yolo_flags}}", yolo);
    command = core::util::replace_all(command, "{{config_flags}}", flag_text(inputs.config_flags));
    command = core::util::replace_all(command, "{{model_flag}}", model_flag);
    command = core::util::replace_all(command, "{{model}}", model);
    command = core::util::replace_all(command, "{{session_id}}",
                                      core::util::shell_word(inputs.session_id));
    command = core::util::replace_all(command, "{{prompt_file}}",
                                      core::util::shell_word(inputs.prompt_file.string()));

    // Older templates have no placeholder; the flags go right after the tool name.
    if (!has_yolo_placeholder && !yolo.empty()) {
        const auto space = command.find(' ');
        if (space == std::string::npos) {
            command += " " + core::util::trim(yolo);
        } else {
            command.insert(space + 1, yolo);
        }
    }
    return core::util::trim(command);
}

core::errors::Result<std::string> wrap_docker(const core::config::DockerConfig& docker,
                                              const std::string& inner_command,
                                              const std::filesystem::path& project_path) {
    if (docker.image.empty()) {
        return OrchError{ErrorCategory::Precondition,
                         "Docker mode is enabled but no image is configured.",
                         "docker_image_missing", "Set launch.docker.image in your config"};
    }
    using core::util::shell_word;
    std::vector<std::string> args{"docker", "run", "--rm", "-it", "-v",
                                  shell_word(project_path.string() + ":" + docker.mount_path + ":rw"),
                                  "-w", shell_word(docker.mount_path)};
    for (const auto& env : docker.env_vars) {
        args.push_back("-e");
        args.push_back(shell_word(env));
    }
    for (const auto& extra : docker.extra_args) {
        args.push_back(shell_word(extra));
    }
    args.push_back(shell_word(docker.image));
    args.push_back("sh");
    args.push_back("-c");
    args.push_back(core::util::shell_escape(inner_command));
    return core::util::join(args, " ");
}

std::string build_launch_script(const std::filesystem::path& working_directory,
                                const std::string& command) {
    return "#!/bin/bash\ncd " + core::util::shell_escape(working_directory.string()) +
           "\nexec " + command + "\n";
}

}  // namespace orch::launcher
