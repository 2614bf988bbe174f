#include "minhypr/waybar.hpp"

#include <nlohmann/json.hpp>

#include "minhypr/menu.hpp"

namespace minhypr {

    namespace {

        constexpr std::string_view kStatusGlyph = "\U000f0638";

    } // namespace

    StatusPayload build_status_payload(const MinimizedSet& set) {
        if (set.empty()) {
            return neutral_status_payload();
        }
        const auto  count   = set.size();
        std::string tooltip = std::to_string(count) + (count == 1 ? " minimized window" : " minimized windows");
        for (const auto& entry : menu_entries(set)) {
            tooltip += "\n";
            tooltip += entry.label;
        }
        return StatusPayload{
            .count     = count,
            .text      = std::string(kStatusGlyph) + " " + std::to_string(count),
            .tooltip   = std::move(tooltip),
            .css_class = "has-windows",
        };
    }

    StatusPayload neutral_status_payload() {
        return StatusPayload{
            .count     = 0,
            .text      = std::string(kStatusGlyph),
            .tooltip   = "No minimized windows",
            .css_class = "empty",
        };
    }

    std::string render_waybar_json(const StatusPayload& payload) {
        const auto  text_json    = nlohmann::json(payload.text).dump(-1, ' ', true);
        const auto  tooltip_json = nlohmann::json(payload.tooltip).dump(-1, ' ', true);
        const auto  class_json   = nlohmann::json(payload.css_class).dump(-1, ' ', true);
        std::string output;
        output.reserve(text_json.size() + tooltip_json.size() + class_json.size() + 64);
        output.append("{\"text\": ");
        output.append(text_json);
        output.append(", \"tooltip\": ");
        output.append(tooltip_json);
        output.append(", \"class\": ");
        output.append(class_json);
        output.append(", \"count\": ");
        output.append(std::to_string(payload.count));
        output.append("}");
        output.push_back('\n');
        return output;
    }

    std::optional<std::string> signal_waybar(int signal, const ProcessRunner& runner) {
        if (signal <= 0) {
            return std::nullopt;
        }
        if (!runner) {
            return "no process runner";
        }
        const auto result = runner({"pkill", "-RTMIN+" + std::to_string(signal), "waybar"}, {});
        if (!result) {
            return "pkill: " + result.error();
        }
        if (result->exit_code != 0 && result->exit_code != 1) {
            return "pkill exited with code " + std::to_string(result->exit_code);
        }
        return std::nullopt;
    }

}
