#include "minhypr/minimized_set.hpp"

#include <algorithm>

namespace minhypr {

    MinimizedSet::MinimizedSet(WindowId next_id) : next_id_(next_id == 0 ? 1 : next_id) {}

    std::optional<WindowId> MinimizedSet::add(MinimizedWindow window) {
        if (window.address.empty() || contains_address(window.address)) {
            return std::nullopt;
        }
        window.id = next_id_++;
        entries_.push_back(std::move(window));
        ++revision_;
        return entries_.back().id;
    }

    bool MinimizedSet::insert_existing(MinimizedWindow window) {
        if (window.id == 0 || window.address.empty() || find(window.id) || contains_address(window.address)) {
            return false;
        }
        next_id_ = std::max(next_id_, window.id + 1);
        entries_.push_back(std::move(window));
        ++revision_;
        return true;
    }

    std::optional<MinimizedWindow> MinimizedSet::remove(WindowId id) {
        const auto it = std::ranges::find(entries_, id, &MinimizedWindow::id);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        auto removed = std::move(*it);
        entries_.erase(it);
        ++revision_;
        return removed;
    }

    const MinimizedWindow* MinimizedSet::find(WindowId id) const {
        const auto it = std::ranges::find(entries_, id, &MinimizedWindow::id);
        return it == entries_.end() ? nullptr : &*it;
    }

    const MinimizedWindow* MinimizedSet::find_by_address(std::string_view address) const {
        const auto it = std::ranges::find(entries_, address, &MinimizedWindow::address);
        return it == entries_.end() ? nullptr : &*it;
    }

    bool MinimizedSet::contains_address(std::string_view address) const {
        return find_by_address(address) != nullptr;
    }

    std::optional<WindowId> MinimizedSet::latest() const {
        if (entries_.empty()) {
            return std::nullopt;
        }
        const auto it = std::ranges::max_element(entries_, [](const MinimizedWindow& lhs, const MinimizedWindow& rhs) {
            if (lhs.minimized_at != rhs.minimized_at) {
                return lhs.minimized_at < rhs.minimized_at;
            }
            return lhs.id < rhs.id;
        });
        return it->id;
    }

    std::vector<WindowId> MinimizedSet::ids_oldest_first() const {
        std::vector<const MinimizedWindow*> ordered;
        ordered.reserve(entries_.size());
        for (const auto& entry : entries_) {
            ordered.push_back(&entry);
        }
        std::ranges::stable_sort(ordered, [](const MinimizedWindow* lhs, const MinimizedWindow* rhs) {
            if (lhs->minimized_at != rhs->minimized_at) {
                return lhs->minimized_at < rhs->minimized_at;
            }
            return lhs->id < rhs->id;
        });
        std::vector<WindowId> ids;
        ids.reserve(ordered.size());
        for (const auto* entry : ordered) {
            ids.push_back(entry->id);
        }
        return ids;
    }

} // namespace minhypr
