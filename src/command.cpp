#include "minhypr/command.hpp"

#include <array>
#include <utility>

namespace minhypr {

    namespace {

        constexpr std::array<std::pair<std::string_view, CommandKind>, 12> kCommands = {{
            {"minimize", CommandKind::kMinimize},
            {"restore", CommandKind::kRestore},
            {"restore-all", CommandKind::kRestoreAll},
            {"restore-last", CommandKind::kRestoreLast},
            {"show", CommandKind::kShow},
            {"list", CommandKind::kList},
            {"show-rofi", CommandKind::kShowRofi},
            {"reap", CommandKind::kReap},
            {"setup-rofi", CommandKind::kSetupRofi},
            {"setup-hyprland", CommandKind::kSetupHyprland},
            {"help", CommandKind::kHelp},
            {"version", CommandKind::kVersion},
        }};

        std::optional<CommandKind> lookup(std::string_view name) {
            for (const auto& [key, kind] : kCommands) {
                if (key == name) {
                    return kind;
                }
            }
            return std::nullopt;
        }

        bool takes_target(CommandKind kind) {
            return kind == CommandKind::kMinimize || kind == CommandKind::kRestore;
        }

    } // namespace

    std::variant<Command, ParseError> parse_command(const std::vector<std::string>& args) {
        std::optional<std::string> config_path;
        bool                       debug = false;
        bool                       json  = false;
        std::vector<std::string>   positional;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& arg = args[i];
            if (arg == "--debug") {
                debug = true;
            } else if (arg == "--json") {
                json = true;
            } else if (arg == "--config") {
                if (i + 1 >= args.size()) {
                    return ParseError{"--config requires a path"};
                }
                config_path = args[++i];
            } else if (arg.starts_with("--config=")) {
                config_path = arg.substr(9);
                if (config_path->empty()) {
                    return ParseError{"--config requires a path"};
                }
            } else if (arg == "-h" || arg == "--help") {
                positional.insert(positional.begin(), "help");
            } else if (arg == "-V" || arg == "--version") {
                positional.insert(positional.begin(), "version");
            } else if (arg.starts_with("--")) {
                return ParseError{"unknown option " + arg};
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.empty()) {
            return ParseError{"missing command"};
        }
        const auto kind = lookup(positional.front());
        if (!kind) {
            return ParseError{"unknown command " + positional.front()};
        }
        if (*kind == CommandKind::kHelp || *kind == CommandKind::kVersion) {
            return Command{.kind = *kind, .config_path = config_path, .debug = debug};
        }

        Command command{.kind = *kind, .json = json, .config_path = config_path, .debug = debug};
        if (positional.size() > 2 || (positional.size() == 2 && !takes_target(*kind))) {
            return ParseError{"unexpected argument " + positional.back() + " for " + positional.front()};
        }
        if (positional.size() == 2) {
            command.target = positional[1];
        }
        if (json && *kind != CommandKind::kList) {
            return ParseError{"--json is only valid for list"};
        }
        return command;
    }

    std::string command_name(CommandKind kind) {
        for (const auto& [key, value] : kCommands) {
            if (value == kind) {
                return std::string(key);
            }
        }
        return "command";
    }

    std::string usage_text() {
        return "usage: minhypr [--config <path>] [--debug] <command> [args]\n"
               "\n"
               "commands:\n"
               "  minimize [address]        minimize the focused (or given) window\n"
               "  restore [id|address]      restore one window; without an argument open the picker\n"
               "  restore-all               restore every minimized window\n"
               "  restore-last              restore the most recently minimized window\n"
               "  show                      print the waybar status line\n"
               "  list [--json]             list minimized windows\n"
               "  show-rofi                 print rows for rofi script mode\n"
               "  reap                      drop entries for windows that are gone\n"
               "  setup-rofi                write the rofi theme and helper scripts\n"
               "  setup-hyprland            write keybinds and source them from hyprland.conf\n"
               "  help, version\n";
    }

} // namespace minhypr
