#include "minhypr/paths.hpp"

#include <cstdlib>
#include <stdexcept>

namespace minhypr {

    namespace {

        std::optional<std::string> get_env(const char* name) {
            if (const char* value = std::getenv(name)) {
                if (*value != '\0') {
                    return std::string(value);
                }
            }
            return std::nullopt;
        }

        std::filesystem::path xdg_root(const std::optional<std::string>& xdg, const std::optional<std::string>& home, const std::filesystem::path& fallback, const char* label) {
            if (xdg) {
                return std::filesystem::path(*xdg);
            }
            if (home) {
                return std::filesystem::path(*home) / fallback;
            }
            throw std::runtime_error(std::string("missing HOME for ") + label);
        }

        std::optional<std::filesystem::path> hyprland_socket_path(const EnvConfig& env) {
            if (!env.hyprland_instance) {
                return std::nullopt;
            }
            const std::filesystem::path runtime = env.xdg_runtime_dir ? std::filesystem::path(*env.xdg_runtime_dir) : std::filesystem::path("/tmp");
            return runtime / "hypr" / *env.hyprland_instance / ".socket.sock";
        }

    } // namespace

    EnvConfig env_config_from_environment() {
        return EnvConfig{
            .home              = get_env("HOME"),
            .xdg_config_home   = get_env("XDG_CONFIG_HOME"),
            .xdg_state_home    = get_env("XDG_STATE_HOME"),
            .xdg_cache_home    = get_env("XDG_CACHE_HOME"),
            .xdg_runtime_dir   = get_env("XDG_RUNTIME_DIR"),
            .hyprland_instance = get_env("HYPRLAND_INSTANCE_SIGNATURE"),
        };
    }

    Paths resolve_paths(const EnvConfig& env) {
        const auto config_root = xdg_root(env.xdg_config_home, env.home, ".config", "config root");
        const auto state_base  = xdg_root(env.xdg_state_home, env.home, std::filesystem::path(".local") / "state", "state root") / "minhypr";
        const auto cache_base  = xdg_root(env.xdg_cache_home, env.home, ".cache", "cache root") / "minhypr";
        const auto config_dir  = config_root / "minhypr";
        return Paths{
            .config_dir            = config_dir,
            .config_path           = config_dir / "minhypr.conf",
            .hyprland_conf_path    = config_root / "hypr" / "hyprland.conf",
            .hyprland_snippet_path = config_dir / "hyprland.conf",
            .rofi_theme_path       = config_dir / "minhypr.rasi",
            .proc_root             = "/proc",
            .state_dir             = state_base,
            .store_path            = state_base / "windows.json",
            .lock_path             = state_base / "windows.lock",
            .thumbnail_dir         = cache_base / "thumbnails",
            .hyprland_socket       = hyprland_socket_path(env),
        };
    }

    Paths resolve_paths_from_env() {
        return resolve_paths(env_config_from_environment());
    }

    std::optional<Paths> try_resolve_paths(const EnvConfig& env) {
        if (!env.home && !(env.xdg_config_home && env.xdg_state_home && env.xdg_cache_home)) {
            return std::nullopt;
        }
        return resolve_paths(env);
    }

    std::optional<Paths> try_resolve_paths_from_env() {
        return try_resolve_paths(env_config_from_environment());
    }

} // namespace minhypr
