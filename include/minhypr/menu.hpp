#ifndef MINHYPR_MENU_HPP
#define MINHYPR_MENU_HPP

#include <filesystem>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

#include "minhypr/minimized_set.hpp"

namespace minhypr {

    struct MenuEntry {
        std::string                          label;
        std::optional<std::filesystem::path> thumbnail;
        WindowId                             id;
    };

    // "<icon> <class> - <title> [<last 4 of address>]"
    std::string display_label(const MinimizedWindow& window);
    MenuEntry   make_menu_entry(const MinimizedWindow& window);

    // Lazy, insertion ordered. The set must outlive the view.
    inline auto menu_entries(const MinimizedSet& set) {
        return set.entries() | std::views::transform(make_menu_entry);
    }

    // dmenu rows with rofi's icon metadata: label\0icon\x1f<thumbnail or class>\n
    std::string             render_rofi_rows(const MinimizedSet& set);
    // Script-mode rows; the selected row's info field carries the id back to `restore`.
    std::string             render_script_rows(const MinimizedSet& set);
    // Maps a zero-based row index from `rofi -format i` back to an id.
    std::optional<WindowId> id_for_row(const MinimizedSet& set, std::string_view selection);

} // namespace minhypr

#endif // MINHYPR_MENU_HPP
