#ifndef MINHYPR_CONFIG_HPP
#define MINHYPR_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace minhypr {

    enum class RestoreTarget {
        kSourceWorkspace,
        kActiveWorkspace,
    };

    struct ThumbnailSize {
        int width;
        int height;
    };

    struct Config {
        std::string              special_workspace  = "minimized";
        RestoreTarget            restore_target     = RestoreTarget::kSourceWorkspace;
        bool                     capture_thumbnails = true;
        ThumbnailSize            thumbnail_size     = {.width = 200, .height = 150};
        int                      icon_size          = 64;
        int                      lock_timeout_ms    = 3000;
        int                      waybar_signal      = 8;
        std::vector<std::string> excluded_classes   = {"rofi", "wofi"};
        std::string              picker_command     = "rofi";
        bool                     notify_errors      = false;
        bool                     debug_logging      = false;
    };

    struct ConfigOverrides {
        std::optional<std::string>              special_workspace;
        std::optional<RestoreTarget>            restore_target;
        std::optional<bool>                     capture_thumbnails;
        std::optional<ThumbnailSize>            thumbnail_size;
        std::optional<int>                      icon_size;
        std::optional<int>                      lock_timeout_ms;
        std::optional<int>                      waybar_signal;
        std::optional<std::vector<std::string>> excluded_classes;
        std::optional<std::string>              picker_command;
        std::optional<bool>                     notify_errors;
        std::optional<bool>                     debug_logging;
    };

    struct ConfigParseResult {
        ConfigOverrides          overrides;
        std::vector<std::string> warnings;
    };

    std::optional<RestoreTarget> parse_restore_target(std::string_view value);
    std::optional<ThumbnailSize> parse_thumbnail_size(std::string_view value);
    ConfigParseResult            parse_config_text(std::string_view text);
    Config                       apply_overrides(const Config& base, const ConfigOverrides& overrides);
    std::optional<std::string>   normalize_override_string(std::string_view value);

    // Missing file yields defaults; unreadable or malformed lines are reported in warnings.
    Config                       load_config(const std::filesystem::path& path, std::vector<std::string>* warnings);

    std::string                  special_workspace_name(const Config& config);

} // namespace minhypr

#endif // MINHYPR_CONFIG_HPP
