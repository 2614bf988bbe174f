#ifndef MINHYPR_TYPES_HPP
#define MINHYPR_TYPES_HPP

#include <optional>
#include <string>

namespace minhypr {

    struct WindowGeometry {
        int x;
        int y;
        int width;
        int height;
    };

    struct WorkspaceRef {
        int                        id;
        std::optional<std::string> name;

        bool                       operator==(const WorkspaceRef&) const = default;
    };

    struct WorkspaceInfo {
        int                        id;
        int                        windows;
        std::optional<std::string> name;
        std::optional<std::string> monitor;
    };

    struct ClientInfo {
        std::string                   address;
        WorkspaceRef                  workspace;
        std::optional<std::string>    class_name;
        std::optional<std::string>    title;
        std::optional<int>            pid;
        std::optional<WindowGeometry> geometry;
    };

} // namespace minhypr

#endif // MINHYPR_TYPES_HPP
