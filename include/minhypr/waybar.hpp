#pragma once

#include <optional>
#include <string>

#include "minhypr/minimized_set.hpp"
#include "minhypr/process.hpp"

namespace minhypr {

    struct StatusPayload {
        size_t      count = 0;
        std::string text;
        std::string tooltip;
        std::string css_class;
    };

    StatusPayload              build_status_payload(const MinimizedSet& set);
    // Shown when the state cannot be read; identical to the empty set.
    StatusPayload              neutral_status_payload();
    std::string                render_waybar_json(const StatusPayload& payload);

    // pkill -RTMIN+<signal> waybar; signal 0 disables. pkill exiting 1 (no waybar) is fine.
    std::optional<std::string> signal_waybar(int signal, const ProcessRunner& runner);

}
