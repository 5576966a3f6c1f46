#include "app/cli_parser.hpp"
#include <charconv>
#include <map>
#include <system_error>
#include <vector>

namespace orch::app::cli {

    using namespace orch::core::errors;

    namespace {

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> command;
            std::vector<std::string> positionals;
            std::map<std::string, std::string> values;
            std::map<std::string, bool> switches;
        };

        const std::map<std::string, Command>& command_table() {
            static const std::map<std::string, Command> table{
                {"run", Command::Run},         {"queue", Command::Queue},
                {"launch", Command::Launch},   {"agents", Command::Agents},
                {"pause", Command::Pause},     {"resume", Command::Resume},
                {"stalled", Command::Stalled}, {"alert", Command::Alert},
                {"create", Command::Create},   {"api", Command::Api},
                {"generate-agents", Command::GenerateAgents},
                {"help", Command::Help}};
            return table;
        }

        bool takes_value(const std::string& flag) {
            return flag == "--config" || flag == "--provider" || flag == "--model" ||
                   flag == "--source" || flag == "--message" || flag == "--severity" ||
                   flag == "--project" || flag == "--template" || flag == "--summary" ||
                   flag == "--port";
        }

        bool is_switch(const std::string& flag) {
            return flag == "--all" || flag == "--yes" || flag == "-y" || flag == "--yolo" ||
                   flag == "--docker" || flag == "--verbose" || flag == "-v" ||
                   flag == "--help" || flag == "-h";
        }

        // Flags each command accepts besides the global --config and --help.
        bool allowed_for(Command command, const std::string& flag) {
            switch (command) {
                case Command::Queue:
                    return flag == "--all";
                case Command::Launch:
                    return flag == "--yes" || flag == "-y" || flag == "--provider" ||
                           flag == "--model" || flag == "--yolo" || flag == "--docker";
                case Command::Agents:
                    return flag == "--verbose" || flag == "-v";
                case Command::Alert:
                    return flag == "--source" || flag == "--message" || flag == "--severity" ||
                           flag == "--project";
                case Command::Create:
                    return flag == "--template" || flag == "--project" || flag == "--summary";
                case Command::GenerateAgents:
                    return flag == "--project";
                case Command::Api:
                    return flag == "--port";
                default:
                    return false;
            }
        }

        std::optional<std::string> value_of(const RawCliOptions& raw, const std::string& flag) {
            const auto it = raw.values.find(flag);
            if (it == raw.values.end()) return std::nullopt;
            return it->second;
        }

        bool switch_on(const RawCliOptions& raw, const std::string& flag) {
            return raw.switches.count(flag) > 0;
        }

    }  // namespace

    std::string to_string(Command command) {
        for (const auto& entry : command_table()) {
            if (entry.second == command) return entry.first;
        }
        return "run";
    }

    std::string usage() {
        return "Usage: operator [--config PATH] <command> [options]\n"
               "\n"
               "Commands:\n"
               "  run                         Supervise the queue (default)\n"
               "  queue [--all]               List queued tickets\n"
               "  launch [TICKET] [--yes] [--provider P] [--model M] [--yolo] [--docker]\n"
               "                              Launch the given or next ticket\n"
               "  agents [--verbose]          List running agents\n"
               "  pause | resume              Toggle queue processing\n"
               "  stalled                     List agents awaiting input\n"
               "  alert --source S --message M [--severity S] [--project P]\n"
               "                              Create an investigation ticket\n"
               "  create --template T --project P [--summary S]\n"
               "                              Create a ticket from an issue type\n"
               "  generate-agents --project P Queue tickets for missing operator agent files\n"
               "  api [--port N]              Serve the REST API alone\n";
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (takes_value(arg)) {
                if (i + 1 < args.size()) raw.values[arg] = args[++i];
                else return OrchError{ErrorCategory::Input, "Missing value for " + arg, "missing_value"};
            } else if (is_switch(arg)) {
                raw.switches[arg] = true;
            } else if (!arg.empty() && arg[0] == '-') {
                return OrchError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument"};
            } else if (!raw.command) {
                raw.command = arg;
            } else {
                raw.positionals.push_back(arg);
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliOptions options;
        if (raw.command) {
            const auto found = command_table().find(*raw.command);
            if (found == command_table().end()) {
                return OrchError{ErrorCategory::Input, "Unknown command: " + *raw.command, "unknown_command",
                                 "Run 'operator help' for the list of commands."};
            }
            options.command = found->second;
        }
        if (switch_on(raw, "--help") || switch_on(raw, "-h")) {
            options.command = Command::Help;
            return options;
        }
        if (auto config = value_of(raw, "--config")) {
            options.config_path = std::filesystem::path(*config);
        }

        for (const auto& entry : raw.values) {
            if (entry.first != "--config" && !allowed_for(options.command, entry.first)) {
                return OrchError{ErrorCategory::Input,
                                 entry.first + " is not valid for '" + to_string(options.command) + "'",
                                 "unknown_argument"};
            }
        }
        for (const auto& entry : raw.switches) {
            if (!allowed_for(options.command, entry.first)) {
                return OrchError{ErrorCategory::Input,
                                 entry.first + " is not valid for '" + to_string(options.command) + "'",
                                 "unknown_argument"};
            }
        }

        const std::size_t max_positionals = options.command == Command::Launch ? 1 : 0;
        if (raw.positionals.size() > max_positionals) {
            return OrchError{ErrorCategory::Input, "Unexpected argument: " + raw.positionals[max_positionals],
                             "unexpected_argument"};
        }

        switch (options.command) {
            case Command::Queue:
                options.all = switch_on(raw, "--all");
                break;
            case Command::Launch:
                if (!raw.positionals.empty()) options.ticket = raw.positionals.front();
                options.yes = switch_on(raw, "--yes") || switch_on(raw, "-y");
                options.provider = value_of(raw, "--provider");
                options.model = value_of(raw, "--model");
                options.yolo = switch_on(raw, "--yolo");
                options.docker = switch_on(raw, "--docker");
                break;
            case Command::Agents:
                options.verbose = switch_on(raw, "--verbose") || switch_on(raw, "-v");
                break;
            case Command::Alert: {
                const auto source = value_of(raw, "--source");
                const auto message = value_of(raw, "--message");
                if (!source || !message) {
                    return OrchError{ErrorCategory::Input, "alert requires --source and --message",
                                     "missing_required_flag"};
                }
                options.source = *source;
                options.message = *message;
                options.severity = value_of(raw, "--severity").value_or("medium");
                options.project = value_of(raw, "--project");
                break;
            }
            case Command::Create: {
                const auto template_key = value_of(raw, "--template");
                const auto project = value_of(raw, "--project");
                if (!template_key || !project) {
                    return OrchError{ErrorCategory::Input, "create requires --template and --project",
                                     "missing_required_flag"};
                }
                options.template_key = *template_key;
                options.project = *project;
                options.summary = value_of(raw, "--summary");
                break;
            }
            case Command::GenerateAgents: {
                const auto project = value_of(raw, "--project");
                if (!project) {
                    return OrchError{ErrorCategory::Input, "generate-agents requires --project",
                                     "missing_required_flag"};
                }
                options.project = *project;
                break;
            }
            case Command::Api:
                // Exception-free integer parsing
                if (auto port_text = value_of(raw, "--port")) {
                    unsigned int port = 0;
                    const char* begin = port_text->data();
                    const char* end = port_text->data() + port_text->size();
                    auto [ptr, ec] = std::from_chars(begin, end, port);
                    if (ec != std::errc() || ptr != end) {
                        return OrchError{ErrorCategory::Input, "Invalid number for --port", "invalid_integer",
                                         "Provide a port between 1 and 65535."};
                    }
                    if (port == 0 || port > 65535) {
                        return OrchError{ErrorCategory::Input, "--port out of bounds", "bounds_error",
                                         "Must be between 1 and 65535."};
                    }
                    options.port = static_cast<std::uint16_t>(port);
                }
                break;
            default:
                break;
        }

        return options;
    }

}  // namespace orch::app::cli
