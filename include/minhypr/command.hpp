#ifndef MINHYPR_COMMAND_HPP
#define MINHYPR_COMMAND_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace minhypr {

    enum class CommandKind {
        kMinimize,
        kRestore,
        kRestoreAll,
        kRestoreLast,
        kShow,
        kList,
        kShowRofi,
        kReap,
        kSetupRofi,
        kSetupHyprland,
        kHelp,
        kVersion,
    };

    struct Command {
        CommandKind                kind;
        std::optional<std::string> target      = std::nullopt;
        bool                       json        = false;
        std::optional<std::string> config_path = std::nullopt;
        bool                       debug       = false;
    };

    struct ParseError {
        std::string message;
    };

    // argv without the program name.
    std::variant<Command, ParseError> parse_command(const std::vector<std::string>& args);

    std::string                       command_name(CommandKind kind);
    std::string                       usage_text();

} // namespace minhypr

#endif // MINHYPR_COMMAND_HPP
