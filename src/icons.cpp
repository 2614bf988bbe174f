#include "minhypr/icons.hpp"

#include <array>
#include <utility>

#include "minhypr/strings.hpp"

namespace minhypr {

    namespace {

        constexpr std::array<std::pair<std::string_view, std::string_view>, 9> kIcons = {{
            {"firefox", ""},
            {"alacritty", ""},
            {"kitty", ""},
            {"discord", "\U000f066f"},
            {"steam", ""},
            {"chromium", ""},
            {"chrome", ""},
            {"code", "\U000f0a1e"},
            {"spotify", ""},
        }};

        constexpr std::string_view kDefaultIcon = "\U000f05b2";

    } // namespace

    std::string app_icon(std::string_view class_name) {
        const auto lowered = to_lower(class_name);
        for (const auto& [name, icon] : kIcons) {
            if (lowered.contains(name)) {
                return std::string(icon);
            }
        }
        return std::string(kDefaultIcon);
    }

}
