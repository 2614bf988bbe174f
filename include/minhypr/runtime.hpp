#ifndef MINHYPR_RUNTIME_HPP
#define MINHYPR_RUNTIME_HPP

#include <optional>
#include <string>

#include "minhypr/command.hpp"
#include "minhypr/config.hpp"
#include "minhypr/engine.hpp"
#include "minhypr/errors.hpp"
#include "minhypr/paths.hpp"
#include "minhypr/picker.hpp"
#include "minhypr/process.hpp"
#include "minhypr/state_store.hpp"

namespace minhypr {

    struct RuntimeConfig {
        Paths  paths;
        Config config;
    };

    // Collaborators for one invocation. Commands that need a missing one fail cleanly.
    struct RuntimeServices {
        MinimizeEngine*            engine    = nullptr;
        const StateStore*          store     = nullptr;
        Picker*                    picker    = nullptr;
        ProcessRunner              runner    = {};
        // Set by rofi when a script-mode row is chosen.
        std::optional<std::string> rofi_info = std::nullopt;
    };

    struct CommandOutput {
        bool        success;
        std::string output;
        int         exit_code = 0;
    };

    int           exit_code_for(const Error& error);

    // Never fails: unreadable state renders the neutral payload.
    std::string   render_show(const StateStore* store);

    CommandOutput run_command(const Command& command, const RuntimeConfig& runtime_config, RuntimeServices& services);

} // namespace minhypr

#endif // MINHYPR_RUNTIME_HPP
