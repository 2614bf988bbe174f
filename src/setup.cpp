#include "minhypr/setup.hpp"

#include <fstream>
#include <sstream>

#include "minhypr/strings.hpp"

namespace minhypr {

    namespace {

        constexpr std::string_view kMinhyprConf =
            R"(# minhypr.conf

# Name of the special workspace that holds minimized windows.
# special_workspace = minimized

# Where restored windows go: source (their old workspace) or active.
# restore_target = source

# capture_thumbnails = true
# thumbnail_size = 200x150
# icon_size = 64

# lock_timeout_ms = 3000

# RTMIN offset sent to waybar after a change; 0 disables.
# waybar_signal = 8

# excluded_classes = rofi, wofi
# picker_command = rofi
# notify_errors = false
# debug_logging = false
)";

        constexpr std::string_view kRofiTheme =
            R"(/* minhypr picker theme */

configuration {
    show-icons: true;
}

* {
    background:     #2E3440;
    background-alt: #3B4252;
    foreground:     #ECEFF4;
    selected:       #88C0D0;
    border:         #4C566A;
}

window {
    width: 650px;
    border: 2px;
    border-color: @border;
    border-radius: 6px;
    padding: 12px;
    background-color: @background;
}

inputbar {
    children: [ prompt, entry ];
    padding: 12px;
}

prompt {
    text-color: @selected;
    margin: 0px 8px 0px 0px;
}

entry {
    text-color: @foreground;
}

listview {
    fixed-height: false;
    lines: 8;
    border: 2px 0px 0px;
    border-color: @border;
    spacing: 4px;
    padding: 10px 5px 0px;
}

element {
    border-radius: 4px;
    padding: 8px 12px;
}

element normal.normal {
    background-color: inherit;
    text-color: @foreground;
}

element selected.normal {
    background-color: @background-alt;
    text-color: @selected;
}

element-icon {
    size: 42px;
    margin: 0 8px 0 0;
}

element-text {
    background-color: inherit;
    text-color: inherit;
    vertical-align: 0.5;
}
)";

        constexpr std::string_view kFindMinhypr =
            R"(if [ -x "$HOME/.local/bin/minhypr" ]; then
    MINHYPR="$HOME/.local/bin/minhypr"
elif command -v minhypr > /dev/null 2>&1; then
    MINHYPR="minhypr"
else
    notify-send "minhypr" "Unable to find the minhypr executable"
    exit 1
fi
)";

        std::optional<std::string> write_file(const std::filesystem::path& path, std::string_view contents) {
            std::ofstream output(path, std::ios::trunc);
            if (!output.good()) {
                return "unable to write " + path.string();
            }
            output << contents;
            output.flush();
            if (!output.good()) {
                return "unable to write " + path.string();
            }
            return std::nullopt;
        }

        std::optional<std::string> write_script(const std::filesystem::path& path, std::string_view contents) {
            if (auto error = write_file(path, contents)) {
                return error;
            }
            std::error_code ec;
            std::filesystem::permissions(path, std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec | std::filesystem::perms::others_exec,
                                         std::filesystem::perm_options::add, ec);
            if (ec) {
                return "unable to make " + path.string() + " executable";
            }
            return std::nullopt;
        }

        std::string read_file_contents(const std::filesystem::path& path) {
            std::ifstream      input(path);
            std::ostringstream buffer;
            buffer << input.rdbuf();
            return buffer.str();
        }

        bool sources_include(const std::string& contents, const std::filesystem::path& include_path) {
            const auto         suffix = (include_path.parent_path().filename() / include_path.filename()).string();
            std::istringstream input(contents);
            std::string        line;
            while (std::getline(input, line)) {
                const auto trimmed = trim_view(line);
                if (trimmed.empty() || trimmed.front() == '#' || !trimmed.starts_with("source")) {
                    continue;
                }
                if (trimmed.ends_with(suffix) || trimmed.contains(include_path.string())) {
                    return true;
                }
            }
            return false;
        }

        std::optional<std::string> ensure_directory(const std::filesystem::path& dir) {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                return "unable to create " + dir.string() + ": " + ec.message();
            }
            return std::nullopt;
        }

    } // namespace

    std::string render_minhypr_conf() {
        return std::string(kMinhyprConf);
    }

    std::string render_rofi_theme() {
        return std::string(kRofiTheme);
    }

    std::string render_launch_script() {
        std::string script = "#!/bin/sh\n# Opens the picker over minimized windows.\n\n";
        script += kFindMinhypr;
        script += "\nexec \"$MINHYPR\" restore\n";
        return script;
    }

    std::string render_restore_all_script() {
        std::string script = "#!/bin/sh\n# Restores every minimized window.\n\n";
        script += kFindMinhypr;
        script += "\nexec \"$MINHYPR\" restore-all\n";
        return script;
    }

    std::string render_hyprland_snippet(const std::filesystem::path& config_dir) {
        const auto dir = config_dir.string();
        return "# minhypr keybinds\n"
               "bind = ALT, M, exec, minhypr minimize\n"
               "bind = ALT SHIFT, M, exec, " +
            dir + "/launch-menu.sh\n" + "bind = ALT SHIFT, R, exec, " + dir + "/restore-all.sh\n";
    }

    bool ensure_minhypr_conf(const std::filesystem::path& config_path) {
        std::error_code ec;
        if (std::filesystem::exists(config_path, ec)) {
            return false;
        }
        if (const auto parent = config_path.parent_path(); !parent.empty() && ensure_directory(parent)) {
            return false;
        }
        return !write_file(config_path, render_minhypr_conf());
    }

    bool ensure_hyprland_conf_source(const std::filesystem::path& hyprland_conf_path, const std::filesystem::path& include_path) {
        std::string     contents;
        std::error_code ec;
        if (std::filesystem::exists(hyprland_conf_path, ec)) {
            if (!std::filesystem::is_regular_file(hyprland_conf_path, ec) || ec) {
                return false;
            }
            contents = read_file_contents(hyprland_conf_path);
            if (sources_include(contents, include_path)) {
                return false;
            }
        }

        if (const auto parent = hyprland_conf_path.parent_path(); !parent.empty() && ensure_directory(parent)) {
            return false;
        }

        std::ofstream output(hyprland_conf_path, std::ios::app);
        if (!output.good()) {
            return false;
        }
        if (!contents.empty() && contents.back() != '\n') {
            output << '\n';
        }
        output << "source = " << include_path.string() << '\n';
        output.flush();
        return output.good();
    }

    std::optional<std::string> install_rofi_assets(const Paths& paths) {
        if (auto error = ensure_directory(paths.config_dir)) {
            return error;
        }
        if (auto error = write_file(paths.rofi_theme_path, render_rofi_theme())) {
            return error;
        }
        if (auto error = write_script(paths.config_dir / "launch-menu.sh", render_launch_script())) {
            return error;
        }
        return write_script(paths.config_dir / "restore-all.sh", render_restore_all_script());
    }

    std::optional<std::string> install_hyprland_snippet(const Paths& paths) {
        if (auto error = install_rofi_assets(paths)) {
            return error;
        }
        std::error_code ec;
        if (!std::filesystem::exists(paths.hyprland_snippet_path, ec)) {
            if (auto error = write_file(paths.hyprland_snippet_path, render_hyprland_snippet(paths.config_dir))) {
                return error;
            }
        }
        if (!std::filesystem::exists(paths.hyprland_conf_path, ec)) {
            return "hyprland.conf not found at " + paths.hyprland_conf_path.string();
        }
        if (!ensure_hyprland_conf_source(paths.hyprland_conf_path, paths.hyprland_snippet_path) &&
            !sources_include(read_file_contents(paths.hyprland_conf_path), paths.hyprland_snippet_path)) {
            return "unable to add source line to " + paths.hyprland_conf_path.string();
        }
        return std::nullopt;
    }

} // namespace minhypr
