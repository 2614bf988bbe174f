#include "minhypr/compositor.hpp"

#include <algorithm>

#include "minhypr/strings.hpp"

namespace minhypr {

    namespace {

        Error adapter_error(const HyprctlErrorInfo& error) {
            return Error{.kind = ErrorKind::kAdapterFailure, .message = format_hyprctl_error(error)};
        }

        Result<void> check_dispatch(std::string_view what, const std::string& output) {
            if (is_ok_response(output)) {
                return {};
            }
            const auto reply = trim_view(output);
            return make_error(ErrorKind::kAdapterFailure, std::string(what) + ": " + (reply.empty() ? std::string("no response") : std::string(reply)));
        }

    } // namespace

    Result<bool> Compositor::window_exists(std::string_view address) {
        const auto windows = list_windows();
        if (!windows) {
            return std::unexpected(windows.error());
        }
        return std::ranges::any_of(*windows, [&](const ClientInfo& client) { return client.address == address; });
    }

    std::string workspace_argument(const WorkspaceRef& workspace) {
        const auto id = std::to_string(workspace.id);
        if (workspace.name && !workspace.name->empty() && *workspace.name != id) {
            if (workspace.name->starts_with("special:")) {
                return *workspace.name;
            }
            return "name:" + *workspace.name;
        }
        return id;
    }

    HyprctlCompositor::HyprctlCompositor(HyprctlClient& client) : client_(client) {}

    Result<std::optional<ClientInfo>> HyprctlCompositor::active_window() {
        auto window = client_.active_window();
        if (!window) {
            return std::unexpected(adapter_error(window.error()));
        }
        return std::move(*window);
    }

    Result<WorkspaceRef> HyprctlCompositor::active_workspace() {
        auto workspace = client_.active_workspace();
        if (!workspace) {
            return std::unexpected(adapter_error(workspace.error()));
        }
        return std::move(*workspace);
    }

    Result<std::vector<ClientInfo>> HyprctlCompositor::list_windows() {
        auto clients = client_.clients();
        if (!clients) {
            return std::unexpected(adapter_error(clients.error()));
        }
        return std::move(*clients);
    }

    Result<std::vector<WorkspaceInfo>> HyprctlCompositor::list_workspaces() {
        auto workspaces = client_.workspaces();
        if (!workspaces) {
            return std::unexpected(adapter_error(workspaces.error()));
        }
        return std::move(*workspaces);
    }

    Result<void> HyprctlCompositor::move_window(std::string_view address, std::string_view workspace, bool silent) {
        const std::string dispatcher = silent ? "movetoworkspacesilent" : "movetoworkspace";
        const std::string argument   = std::string(workspace) + ",address:" + std::string(address);
        return check_dispatch(dispatcher, client_.dispatch(dispatcher, argument));
    }

    Result<void> HyprctlCompositor::focus_window(std::string_view address) {
        return check_dispatch("focuswindow", client_.dispatch("focuswindow", "address:" + std::string(address)));
    }

} // namespace minhypr
