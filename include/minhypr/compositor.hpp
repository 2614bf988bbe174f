#ifndef MINHYPR_COMPOSITOR_HPP
#define MINHYPR_COMPOSITOR_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "minhypr/errors.hpp"
#include "minhypr/hyprctl.hpp"
#include "minhypr/types.hpp"

namespace minhypr {

    // Everything the engine needs from the window manager.
    class Compositor {
      public:
        virtual ~Compositor()                                                                                      = default;

        virtual Result<std::optional<ClientInfo>>  active_window()                                                  = 0;
        virtual Result<WorkspaceRef>               active_workspace()                                               = 0;
        virtual Result<std::vector<ClientInfo>>    list_windows()                                                   = 0;
        virtual Result<std::vector<WorkspaceInfo>> list_workspaces()                                                = 0;
        // `silent` keeps focus and the visible workspace where they are.
        virtual Result<void>                       move_window(std::string_view address, std::string_view workspace, bool silent) = 0;
        virtual Result<void>                       focus_window(std::string_view address)                           = 0;

        virtual Result<bool>                       window_exists(std::string_view address);
    };

    // Argument for movetoworkspace: "name:<name>" for named workspaces, the id otherwise.
    std::string workspace_argument(const WorkspaceRef& workspace);

    class HyprctlCompositor : public Compositor {
      public:
        explicit HyprctlCompositor(HyprctlClient& client);

        Result<std::optional<ClientInfo>>  active_window() override;
        Result<WorkspaceRef>               active_workspace() override;
        Result<std::vector<ClientInfo>>    list_windows() override;
        Result<std::vector<WorkspaceInfo>> list_workspaces() override;
        Result<void>                       move_window(std::string_view address, std::string_view workspace, bool silent) override;
        Result<void>                       focus_window(std::string_view address) override;

      private:
        HyprctlClient& client_;
    };

} // namespace minhypr

#endif // MINHYPR_COMPOSITOR_HPP
