#include "minhypr/config.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

#include "minhypr/strings.hpp"

namespace minhypr {

    namespace {

        std::optional<int> parse_int(std::string_view value) {
            const auto trimmed = trim_view(value);
            int        parsed  = 0;
            const auto result  = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), parsed);
            if (result.ec != std::errc{} || result.ptr != trimmed.data() + trimmed.size()) {
                return std::nullopt;
            }
            return parsed;
        }

        std::optional<bool> parse_bool(std::string_view value) {
            const auto lowered = to_lower(trim_view(value));
            if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
                return true;
            }
            if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
                return false;
            }
            return std::nullopt;
        }

        std::string line_warning(size_t line_number, std::string_view message) {
            return "line " + std::to_string(line_number) + ": " + std::string(message);
        }

    } // namespace

    std::optional<RestoreTarget> parse_restore_target(std::string_view value) {
        const auto lowered = to_lower(trim_view(value));
        if (lowered == "source") {
            return RestoreTarget::kSourceWorkspace;
        }
        if (lowered == "active") {
            return RestoreTarget::kActiveWorkspace;
        }
        return std::nullopt;
    }

    std::optional<ThumbnailSize> parse_thumbnail_size(std::string_view value) {
        const auto trimmed = trim_view(value);
        const auto cross   = trimmed.find('x');
        if (cross == std::string_view::npos) {
            return std::nullopt;
        }
        const auto width  = parse_int(trimmed.substr(0, cross));
        const auto height = parse_int(trimmed.substr(cross + 1));
        if (!width || !height || *width <= 0 || *height <= 0) {
            return std::nullopt;
        }
        return ThumbnailSize{.width = *width, .height = *height};
    }

    ConfigParseResult parse_config_text(std::string_view text) {
        ConfigParseResult  result;
        auto&              overrides = result.overrides;
        std::istringstream input{std::string(text)};
        std::string        raw_line;
        size_t             line_number = 0;
        while (std::getline(input, raw_line)) {
            ++line_number;
            auto line = trim_view(raw_line);
            if (const auto hash = line.find('#'); hash != std::string_view::npos) {
                line = trim_view(line.substr(0, hash));
            }
            if (line.empty()) {
                continue;
            }
            const auto equals = line.find('=');
            if (equals == std::string_view::npos) {
                result.warnings.push_back(line_warning(line_number, "expected key = value"));
                continue;
            }
            const auto key   = to_lower(trim_view(line.substr(0, equals)));
            const auto value = trim_view(line.substr(equals + 1));

            if (key == "special_workspace") {
                auto name = normalize_override_string(value);
                if (name && name->starts_with("special:")) {
                    name = name->substr(8);
                }
                if (!name || name->empty()) {
                    result.warnings.push_back(line_warning(line_number, "special_workspace must not be empty"));
                    continue;
                }
                overrides.special_workspace = *name;
            } else if (key == "restore_target") {
                const auto parsed = parse_restore_target(value);
                if (!parsed) {
                    result.warnings.push_back(line_warning(line_number, "restore_target must be source or active"));
                    continue;
                }
                overrides.restore_target = *parsed;
            } else if (key == "capture_thumbnails" || key == "notify_errors" || key == "debug_logging") {
                const auto parsed = parse_bool(value);
                if (!parsed) {
                    result.warnings.push_back(line_warning(line_number, key + " must be a boolean"));
                    continue;
                }
                if (key == "capture_thumbnails") {
                    overrides.capture_thumbnails = *parsed;
                } else if (key == "notify_errors") {
                    overrides.notify_errors = *parsed;
                } else {
                    overrides.debug_logging = *parsed;
                }
            } else if (key == "thumbnail_size") {
                const auto parsed = parse_thumbnail_size(value);
                if (!parsed) {
                    result.warnings.push_back(line_warning(line_number, "thumbnail_size must look like 200x150"));
                    continue;
                }
                overrides.thumbnail_size = *parsed;
            } else if (key == "icon_size" || key == "lock_timeout_ms") {
                const auto parsed = parse_int(value);
                if (!parsed || *parsed <= 0) {
                    result.warnings.push_back(line_warning(line_number, key + " must be a positive integer"));
                    continue;
                }
                if (key == "icon_size") {
                    overrides.icon_size = *parsed;
                } else {
                    overrides.lock_timeout_ms = *parsed;
                }
            } else if (key == "waybar_signal") {
                const auto parsed = parse_int(value);
                if (!parsed || *parsed < 0) {
                    result.warnings.push_back(line_warning(line_number, "waybar_signal must be a non-negative integer"));
                    continue;
                }
                overrides.waybar_signal = *parsed;
            } else if (key == "excluded_classes") {
                overrides.excluded_classes = split_list(value, ',');
            } else if (key == "picker_command") {
                const auto command = normalize_override_string(value);
                if (!command) {
                    result.warnings.push_back(line_warning(line_number, "picker_command must not be empty"));
                    continue;
                }
                overrides.picker_command = *command;
            } else {
                result.warnings.push_back(line_warning(line_number, "unknown key " + key));
            }
        }
        return result;
    }

    Config apply_overrides(const Config& base, const ConfigOverrides& overrides) {
        Config merged = base;
        if (overrides.special_workspace) {
            merged.special_workspace = *overrides.special_workspace;
        }
        if (overrides.restore_target) {
            merged.restore_target = *overrides.restore_target;
        }
        if (overrides.capture_thumbnails) {
            merged.capture_thumbnails = *overrides.capture_thumbnails;
        }
        if (overrides.thumbnail_size) {
            merged.thumbnail_size = *overrides.thumbnail_size;
        }
        if (overrides.icon_size) {
            merged.icon_size = *overrides.icon_size;
        }
        if (overrides.lock_timeout_ms) {
            merged.lock_timeout_ms = *overrides.lock_timeout_ms;
        }
        if (overrides.waybar_signal) {
            merged.waybar_signal = *overrides.waybar_signal;
        }
        if (overrides.excluded_classes) {
            merged.excluded_classes = *overrides.excluded_classes;
        }
        if (overrides.picker_command) {
            merged.picker_command = *overrides.picker_command;
        }
        if (overrides.notify_errors) {
            merged.notify_errors = *overrides.notify_errors;
        }
        if (overrides.debug_logging) {
            merged.debug_logging = *overrides.debug_logging;
        }
        return merged;
    }

    std::optional<std::string> normalize_override_string(std::string_view value) {
        const auto trimmed = trim_copy(value);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        return trimmed;
    }

    Config load_config(const std::filesystem::path& path, std::vector<std::string>* warnings) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec) || ec) {
            return Config{};
        }
        std::ifstream input(path);
        if (!input.good()) {
            if (warnings) {
                warnings->push_back("unable to read " + path.string());
            }
            return Config{};
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        auto parsed = parse_config_text(buffer.str());
        if (warnings) {
            for (auto& warning : parsed.warnings) {
                warnings->push_back(path.filename().string() + " " + warning);
            }
        }
        return apply_overrides(Config{}, parsed.overrides);
    }

    std::string special_workspace_name(const Config& config) {
        return "special:" + config.special_workspace;
    }

} // namespace minhypr
