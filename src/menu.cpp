#include "minhypr/menu.hpp"

#include <charconv>
#include <system_error>

#include "minhypr/capture.hpp"
#include "minhypr/strings.hpp"

namespace minhypr {

    namespace {

        // Rofi treats these as row and metadata separators.
        std::string sanitize(std::string_view value) {
            std::string out;
            out.reserve(value.size());
            for (const char ch : value) {
                out.push_back(ch == '\n' || ch == '\r' || ch == '\0' || ch == '\x1f' ? ' ' : ch);
            }
            return out;
        }

        std::string row_icon(const MinimizedWindow& window) {
            if (window.thumbnail) {
                std::error_code ec;
                const auto      icon = icon_path_for(*window.thumbnail);
                if (std::filesystem::exists(icon, ec)) {
                    return icon.string();
                }
                return window.thumbnail->string();
            }
            return window.class_name;
        }

    } // namespace

    std::string display_label(const MinimizedWindow& window) {
        const auto& address = window.address;
        const auto  tail    = address.size() > 4 ? address.substr(address.size() - 4) : address;
        return window.icon + " " + window.class_name + " - " + window.title + " [" + tail + "]";
    }

    MenuEntry make_menu_entry(const MinimizedWindow& window) {
        return MenuEntry{.label = display_label(window), .thumbnail = window.thumbnail, .id = window.id};
    }

    std::string render_rofi_rows(const MinimizedSet& set) {
        std::string rows;
        for (const auto& window : set.entries()) {
            rows += sanitize(display_label(window));
            rows.push_back('\0');
            rows += "icon\x1f";
            rows += sanitize(row_icon(window));
            rows.push_back('\n');
        }
        return rows;
    }

    std::string render_script_rows(const MinimizedSet& set) {
        std::string rows;
        for (const auto& window : set.entries()) {
            rows += sanitize(display_label(window));
            rows.push_back('\0');
            rows += "icon\x1f";
            rows += sanitize(row_icon(window));
            rows += "\x1finfo\x1f";
            rows += std::to_string(window.id);
            rows.push_back('\n');
        }
        return rows;
    }

    std::optional<WindowId> id_for_row(const MinimizedSet& set, std::string_view selection) {
        const auto trimmed = trim_view(selection);
        size_t     index   = 0;
        const auto result  = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), index);
        if (trimmed.empty() || result.ec != std::errc() || result.ptr != trimmed.data() + trimmed.size()) {
            return std::nullopt;
        }
        size_t row = 0;
        for (const auto& entry : menu_entries(set)) {
            if (row++ == index) {
                return entry.id;
            }
        }
        return std::nullopt;
    }

} // namespace minhypr
