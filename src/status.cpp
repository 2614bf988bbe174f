#include "minhypr/status.hpp"

#include <nlohmann/json.hpp>

#include "minhypr/compositor.hpp"
#include "minhypr/menu.hpp"

namespace minhypr {

    std::string render_window_list(const MinimizedSet& set) {
        if (set.empty()) {
            return "No minimized windows\n";
        }
        std::string output;
        for (const auto& window : set.entries()) {
            output += std::to_string(window.id);
            output += "\t";
            output += display_label(window);
            output += "\t";
            output += window.source_workspace ? workspace_argument(*window.source_workspace) : std::string("-");
            output += "\n";
        }
        return output;
    }

    std::string render_window_list_json(const MinimizedSet& set) {
        nlohmann::json windows = nlohmann::json::array();
        for (const auto& window : set.entries()) {
            nlohmann::json json = {
                {"id", window.id},
                {"address", window.address},
                {"title", window.title},
                {"class", window.class_name},
                {"label", display_label(window)},
                {"minimized_at", window.minimized_at},
                {"thumbnail", window.thumbnail ? nlohmann::json(window.thumbnail->string()) : nlohmann::json(nullptr)},
                {"workspace", window.source_workspace ? nlohmann::json(workspace_argument(*window.source_workspace)) : nlohmann::json(nullptr)},
            };
            windows.push_back(std::move(json));
        }
        return windows.dump(-1, ' ', true) + "\n";
    }

} // namespace minhypr
