#include "minhypr/engine.hpp"

#include <algorithm>
#include <charconv>

#include "minhypr/icons.hpp"
#include "minhypr/logging.hpp"
#include "minhypr/strings.hpp"

namespace minhypr {

    namespace {

        bool in_workspace(const ClientInfo& client, std::string_view special_name) {
            return client.workspace.name && *client.workspace.name == special_name;
        }

        const ClientInfo* find_client(const std::vector<ClientInfo>& clients, std::string_view address) {
            const auto it = std::ranges::find(clients, address, &ClientInfo::address);
            return it == clients.end() ? nullptr : &*it;
        }

        bool workspace_exists(const std::vector<WorkspaceInfo>& workspaces, const WorkspaceRef& ref) {
            return std::ranges::any_of(workspaces, [&](const WorkspaceInfo& workspace) {
                if (ref.name && workspace.name) {
                    return *ref.name == *workspace.name;
                }
                return workspace.id == ref.id;
            });
        }

    } // namespace

    std::optional<RestoreTargetArg> parse_restore_argument(std::string_view value) {
        const auto trimmed = trim_view(value);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        if (trimmed.starts_with("0x") || trimmed.starts_with("0X")) {
            if (trimmed.size() == 2) {
                return std::nullopt;
            }
            return RestoreTargetArg{.id = std::nullopt, .address = std::string(trimmed)};
        }
        WindowId   id     = 0;
        const auto result = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), id);
        if (result.ec != std::errc() || result.ptr != trimmed.data() + trimmed.size() || id == 0) {
            return std::nullopt;
        }
        return RestoreTargetArg{.id = id, .address = std::nullopt};
    }

    MinimizeEngine::MinimizeEngine(const StateStore& store, Compositor& compositor, Capturer* capturer, Config config, Clock clock) :
        store_(store), compositor_(compositor), capturer_(capturer), config_(std::move(config)), clock_(std::move(clock)),
        special_name_(special_workspace_name(config_)) {}

    bool MinimizeEngine::excluded(const ClientInfo& client) const {
        if (!client.class_name) {
            return false;
        }
        const auto lowered = to_lower(*client.class_name);
        return std::ranges::any_of(config_.excluded_classes, [&](const std::string& name) { return to_lower(name) == lowered; });
    }

    Result<ReapReport> MinimizeEngine::reap_locked(MinimizedSet& set, std::vector<ClientInfo>* clients_out) {
        auto clients = compositor_.list_windows();
        if (!clients) {
            return std::unexpected(clients.error());
        }

        ReapReport            report;
        std::vector<WindowId> stale;
        for (const auto& entry : set.entries()) {
            const auto* client = find_client(*clients, entry.address);
            if (!client || !in_workspace(*client, special_name_)) {
                stale.push_back(entry.id);
            }
        }
        for (const auto id : stale) {
            if (auto removed = set.remove(id)) {
                debug_log(config_.debug_logging, "reap", "dropping stale entry " + std::to_string(id) + " (" + removed->address + ")");
                remove_thumbnail_files(removed->thumbnail);
                report.removed.push_back(std::move(*removed));
            }
        }

        for (const auto& client : *clients) {
            if (!in_workspace(client, special_name_) || set.contains_address(client.address)) {
                continue;
            }
            const auto class_name = client.class_name.value_or("");
            const auto id         = set.add(MinimizedWindow{
                        .address          = client.address,
                        .title            = client.title.value_or(""),
                        .class_name       = class_name,
                        .icon             = app_icon(class_name),
                        .thumbnail        = std::nullopt,
                        .minimized_at     = clock_(),
                        .source_workspace = std::nullopt,
            });
            if (id) {
                debug_log(config_.debug_logging, "reap", "adopted orphan " + client.address + " as " + std::to_string(*id));
                report.adopted.push_back(*id);
            }
        }

        if (clients_out) {
            *clients_out = std::move(*clients);
        }
        return report;
    }

    Result<MinimizedWindow> MinimizeEngine::minimize(const std::optional<std::string>& address) {
        return store_.with_lock([&](MinimizedSet& set) -> Result<MinimizedWindow> {
            std::vector<ClientInfo> clients;
            if (auto reaped = reap_locked(set, &clients); !reaped) {
                return std::unexpected(reaped.error());
            }

            std::optional<ClientInfo> window;
            if (address) {
                const auto* client = find_client(clients, *address);
                if (!client) {
                    return make_error(ErrorKind::kNoActiveWindow, "no window with address " + *address);
                }
                window = *client;
            } else {
                auto active = compositor_.active_window();
                if (!active) {
                    return std::unexpected(active.error());
                }
                window = std::move(*active);
            }
            if (!window || window->address.empty()) {
                return make_error(ErrorKind::kNoActiveWindow, "no focused window");
            }
            if (excluded(*window)) {
                return make_error(ErrorKind::kNoActiveWindow, "window class " + window->class_name.value_or("") + " is excluded");
            }
            if (const auto* existing = set.find_by_address(window->address)) {
                return make_error(ErrorKind::kAlreadyMinimized, window->address + " is entry " + std::to_string(existing->id));
            }
            if (in_workspace(*window, special_name_)) {
                return make_error(ErrorKind::kAlreadyMinimized, window->address + " is already in " + special_name_);
            }

            std::optional<std::filesystem::path> thumbnail;
            if (capturer_ && window->geometry) {
                auto captured = capturer_->capture(window->address, *window->geometry);
                if (captured) {
                    thumbnail = std::move(*captured);
                } else {
                    error_log("capture", window->address + ": " + captured.error());
                }
            }

            if (auto moved = compositor_.move_window(window->address, special_name_, true); !moved) {
                remove_thumbnail_files(thumbnail);
                return std::unexpected(moved.error());
            }

            const auto      class_name = window->class_name.value_or("");
            MinimizedWindow entry{
                .address          = window->address,
                .title            = window->title.value_or(""),
                .class_name       = class_name,
                .icon             = app_icon(class_name),
                .thumbnail        = thumbnail,
                .minimized_at     = clock_(),
                .source_workspace = window->workspace,
            };
            const auto id = set.add(entry);
            if (!id) {
                return make_error(ErrorKind::kAlreadyMinimized, window->address);
            }
            entry.id = *id;
            debug_log(config_.debug_logging, "minimize", window->address + " -> entry " + std::to_string(*id));
            return entry;
        });
    }

    Result<std::string> MinimizeEngine::restore_destination(const MinimizedWindow& window) {
        if (config_.restore_target == RestoreTarget::kSourceWorkspace && window.source_workspace) {
            const auto& source = *window.source_workspace;
            if (!(source.name && *source.name == special_name_)) {
                // Regular workspaces are recreated on demand; only special ones can vanish.
                if (source.id > 0) {
                    return workspace_argument(source);
                }
                auto workspaces = compositor_.list_workspaces();
                if (!workspaces) {
                    return std::unexpected(workspaces.error());
                }
                if (workspace_exists(*workspaces, source)) {
                    return workspace_argument(source);
                }
                debug_log(config_.debug_logging, "restore", "source workspace " + workspace_argument(source) + " is gone; using the active workspace");
            }
        }
        auto active = compositor_.active_workspace();
        if (!active) {
            return std::unexpected(active.error());
        }
        return workspace_argument(*active);
    }

    Result<MinimizedWindow> MinimizeEngine::restore_locked(MinimizedSet& set, WindowId id) {
        const auto* entry = set.find(id);
        if (!entry) {
            return make_error(ErrorKind::kNotFound, "no minimized window with id " + std::to_string(id));
        }
        const auto destination = restore_destination(*entry);
        if (!destination) {
            return std::unexpected(destination.error());
        }
        if (auto moved = compositor_.move_window(entry->address, *destination, false); !moved) {
            return std::unexpected(moved.error());
        }
        if (auto focused = compositor_.focus_window(entry->address); !focused) {
            error_log("restore", "unable to focus " + entry->address + ": " + focused.error().message);
        }
        auto removed = set.remove(id);
        if (!removed) {
            return make_error(ErrorKind::kNotFound, "no minimized window with id " + std::to_string(id));
        }
        remove_thumbnail_files(removed->thumbnail);
        debug_log(config_.debug_logging, "restore", removed->address + " -> " + *destination);
        return std::move(*removed);
    }

    Result<MinimizedWindow> MinimizeEngine::restore(WindowId id) {
        return store_.with_lock([&](MinimizedSet& set) -> Result<MinimizedWindow> {
            if (auto reaped = reap_locked(set, nullptr); !reaped) {
                return std::unexpected(reaped.error());
            }
            return restore_locked(set, id);
        });
    }

    Result<MinimizedWindow> MinimizeEngine::restore_address(std::string_view address) {
        return store_.with_lock([&](MinimizedSet& set) -> Result<MinimizedWindow> {
            if (auto reaped = reap_locked(set, nullptr); !reaped) {
                return std::unexpected(reaped.error());
            }
            const auto* entry = set.find_by_address(address);
            if (!entry) {
                return make_error(ErrorKind::kNotFound, "no minimized window with address " + std::string(address));
            }
            return restore_locked(set, entry->id);
        });
    }

    Result<MinimizedWindow> MinimizeEngine::restore_last() {
        return store_.with_lock([&](MinimizedSet& set) -> Result<MinimizedWindow> {
            if (auto reaped = reap_locked(set, nullptr); !reaped) {
                return std::unexpected(reaped.error());
            }
            const auto latest = set.latest();
            if (!latest) {
                return make_error(ErrorKind::kEmptySet, "nothing to restore");
            }
            return restore_locked(set, *latest);
        });
    }

    Result<RestoreAllReport> MinimizeEngine::restore_all() {
        const auto ids = store_.with_lock([&](MinimizedSet& set) -> Result<std::vector<WindowId>> {
            if (auto reaped = reap_locked(set, nullptr); !reaped) {
                return std::unexpected(reaped.error());
            }
            return set.ids_oldest_first();
        });
        if (!ids) {
            return std::unexpected(ids.error());
        }

        RestoreAllReport report;
        for (const auto id : *ids) {
            auto restored = store_.with_lock([&](MinimizedSet& set) -> Result<std::optional<MinimizedWindow>> {
                // Another invocation got there first.
                if (!set.find(id)) {
                    return std::optional<MinimizedWindow>{};
                }
                auto window = restore_locked(set, id);
                if (!window) {
                    return std::unexpected(window.error());
                }
                return std::optional<MinimizedWindow>(std::move(*window));
            });
            if (!restored) {
                error_log("restore-all", "entry " + std::to_string(id) + ": " + format_error(restored.error()));
                report.failures.push_back(RestoreFailure{.id = id, .error = restored.error()});
                continue;
            }
            if (*restored) {
                report.restored.push_back(std::move(**restored));
            }
        }
        return report;
    }

    Result<ReapReport> MinimizeEngine::reap_stale() {
        return store_.with_lock([&](MinimizedSet& set) { return reap_locked(set, nullptr); });
    }

    Result<MinimizedSet> MinimizeEngine::list() {
        return store_.with_lock([&](MinimizedSet& set) -> Result<MinimizedSet> {
            if (auto reaped = reap_locked(set, nullptr); !reaped) {
                return std::unexpected(reaped.error());
            }
            return set;
        });
    }

} // namespace minhypr
