#ifndef MINHYPR_MINIMIZED_SET_HPP
#define MINHYPR_MINIMIZED_SET_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "minhypr/types.hpp"

namespace minhypr {

    using WindowId = std::uint64_t;

    struct MinimizedWindow {
        WindowId                             id = 0;
        std::string                          address;
        std::string                          title;
        std::string                          class_name;
        std::string                          icon;
        std::optional<std::filesystem::path> thumbnail;
        std::int64_t                         minimized_at = 0;
        std::optional<WorkspaceRef>          source_workspace;

        bool                                 operator==(const MinimizedWindow&) const = default;
    };

    // Entries in insertion order plus the id counter. Every mutation bumps revision(),
    // which is how the store decides whether a transaction needs to be persisted.
    class MinimizedSet {
      public:
        MinimizedSet() = default;
        explicit MinimizedSet(WindowId next_id);

        // Assigns the next id. Fails when the address is already present.
        std::optional<WindowId>             add(MinimizedWindow window);
        // Keeps the id already on `window`; used when loading. Fails on duplicate id or address.
        bool                                insert_existing(MinimizedWindow window);
        std::optional<MinimizedWindow>      remove(WindowId id);

        const MinimizedWindow*              find(WindowId id) const;
        const MinimizedWindow*              find_by_address(std::string_view address) const;
        bool                                contains_address(std::string_view address) const;

        // Greatest minimized_at, ties broken by the greater id.
        std::optional<WindowId>             latest() const;
        std::vector<WindowId>               ids_oldest_first() const;

        const std::vector<MinimizedWindow>& entries() const {
            return entries_;
        }
        size_t size() const {
            return entries_.size();
        }
        bool empty() const {
            return entries_.empty();
        }
        WindowId next_id() const {
            return next_id_;
        }
        std::uint64_t revision() const {
            return revision_;
        }

      private:
        std::vector<MinimizedWindow> entries_;
        WindowId                     next_id_  = 1;
        std::uint64_t                revision_ = 0;
    };

} // namespace minhypr

#endif // MINHYPR_MINIMIZED_SET_HPP
