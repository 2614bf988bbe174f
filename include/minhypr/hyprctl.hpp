#ifndef MINHYPR_HYPRCTL_HPP
#define MINHYPR_HYPRCTL_HPP

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "minhypr/types.hpp"

namespace minhypr {

    // `context` names the request ("clients", "activewindow", ...).
    struct HyprctlErrorInfo {
        std::string context;
        std::string message;
    };

    std::string format_hyprctl_error(const HyprctlErrorInfo& error);

    template <typename T>
    using HyprctlResult = std::expected<T, HyprctlErrorInfo>;

    // Transport for compositor requests. `format` is "j" for JSON replies and empty for dispatches.
    // An empty reply means the request could not be delivered.
    class HyprctlInvoker {
      public:
        virtual ~HyprctlInvoker() = default;
        virtual std::string invoke(std::string_view call, std::string_view args, std::string_view format) = 0;
    };

    HyprctlResult<std::optional<ClientInfo>>  parse_active_window(std::string_view json_text);
    HyprctlResult<WorkspaceRef>               parse_active_workspace(std::string_view json_text);
    HyprctlResult<std::vector<WorkspaceInfo>> parse_workspaces(std::string_view json_text);
    HyprctlResult<std::vector<ClientInfo>>    parse_clients(std::string_view json_text);

    // Dispatch replies are "ok" on success and an error sentence otherwise.
    bool                                      is_ok_response(std::string_view output);

    class HyprctlClient {
      public:
        explicit HyprctlClient(HyprctlInvoker& invoker);

        // nullopt when no window has focus.
        HyprctlResult<std::optional<ClientInfo>>  active_window();
        HyprctlResult<WorkspaceRef>               active_workspace();
        HyprctlResult<std::vector<WorkspaceInfo>> workspaces();
        HyprctlResult<std::vector<ClientInfo>>    clients();

        std::string                               dispatch(std::string_view dispatcher, std::string_view argument);

      private:
        std::string     query(std::string_view call);

        HyprctlInvoker& invoker_;
    };

} // namespace minhypr

#endif // MINHYPR_HYPRCTL_HPP
