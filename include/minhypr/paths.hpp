#ifndef MINHYPR_PATHS_HPP
#define MINHYPR_PATHS_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace minhypr {

    struct EnvConfig {
        std::optional<std::string> home;
        std::optional<std::string> xdg_config_home;
        std::optional<std::string> xdg_state_home;
        std::optional<std::string> xdg_cache_home;
        std::optional<std::string> xdg_runtime_dir;
        std::optional<std::string> hyprland_instance;
    };

    struct Paths {
        std::filesystem::path                config_dir;
        std::filesystem::path                config_path;
        std::filesystem::path                hyprland_conf_path;
        std::filesystem::path                hyprland_snippet_path;
        std::filesystem::path                rofi_theme_path;
        std::filesystem::path                proc_root;
        std::filesystem::path                state_dir;
        std::filesystem::path                store_path;
        std::filesystem::path                lock_path;
        std::filesystem::path                thumbnail_dir;
        std::optional<std::filesystem::path> hyprland_socket;
    };

    EnvConfig            env_config_from_environment();
    Paths                resolve_paths(const EnvConfig& env);
    Paths                resolve_paths_from_env();
    std::optional<Paths> try_resolve_paths(const EnvConfig& env);
    std::optional<Paths> try_resolve_paths_from_env();

} // namespace minhypr

#endif // MINHYPR_PATHS_HPP
