#ifndef MINHYPR_SETUP_HPP
#define MINHYPR_SETUP_HPP

#include <filesystem>
#include <optional>
#include <string>

#include "minhypr/paths.hpp"

namespace minhypr {

    std::string                render_minhypr_conf();
    std::string                render_rofi_theme();
    std::string                render_launch_script();
    std::string                render_restore_all_script();
    std::string                render_hyprland_snippet(const std::filesystem::path& config_dir);

    bool                       ensure_minhypr_conf(const std::filesystem::path& config_path);
    // Appends `source = <include_path>` unless hyprland.conf already sources it.
    bool                       ensure_hyprland_conf_source(const std::filesystem::path& hyprland_conf_path, const std::filesystem::path& include_path);

    // minhypr.rasi, launch-menu.sh and restore-all.sh in the config dir.
    std::optional<std::string> install_rofi_assets(const Paths& paths);
    // Keybind snippet plus the source line; an existing snippet is left alone.
    std::optional<std::string> install_hyprland_snippet(const Paths& paths);

} // namespace minhypr

#endif // MINHYPR_SETUP_HPP
