#ifndef MINHYPR_HYPR_SOCKET_HPP
#define MINHYPR_HYPR_SOCKET_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "minhypr/hyprctl.hpp"

namespace minhypr {

    // Builds the request line Hyprland expects on .socket.sock, e.g. "j/clients".
    std::string format_socket_request(std::string_view call, std::string_view args, std::string_view format);

    // Talks to the compositor's request socket directly, one connection per call.
    // Connection failures are logged and yield an empty reply.
    class SocketInvoker : public HyprctlInvoker {
      public:
        explicit SocketInvoker(std::optional<std::filesystem::path> socket_path, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

        std::string invoke(std::string_view call, std::string_view args, std::string_view format) override;

      private:
        std::optional<std::filesystem::path> socket_path_;
        std::chrono::milliseconds            timeout_;
    };

} // namespace minhypr

#endif // MINHYPR_HYPR_SOCKET_HPP
