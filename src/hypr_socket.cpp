#include "minhypr/hypr_socket.hpp"

#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include "minhypr/file_descriptor.hpp"
#include "minhypr/logging.hpp"

namespace minhypr {

    namespace {

        bool set_timeouts(int fd, std::chrono::milliseconds timeout) {
            timeval tv{};
            tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
            tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
            return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 && ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
        }

        bool send_all(int fd, std::string_view data) {
            size_t sent = 0;
            while (sent < data.size()) {
                const ssize_t result = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
                if (result > 0) {
                    sent += static_cast<size_t>(result);
                    continue;
                }
                if (result < 0 && errno == EINTR) {
                    continue;
                }
                return false;
            }
            return true;
        }

        std::optional<std::string> receive_all(int fd) {
            std::string reply;
            char        buffer[8192];
            while (true) {
                const ssize_t result = ::recv(fd, buffer, sizeof(buffer), 0);
                if (result > 0) {
                    reply.append(buffer, static_cast<size_t>(result));
                    continue;
                }
                if (result == 0) {
                    return reply;
                }
                if (errno == EINTR) {
                    continue;
                }
                return std::nullopt;
            }
        }

    } // namespace

    std::string format_socket_request(std::string_view call, std::string_view args, std::string_view format) {
        std::string request(format);
        request.push_back('/');
        request.append(call);
        if (!args.empty()) {
            request.push_back(' ');
            request.append(args);
        }
        return request;
    }

    SocketInvoker::SocketInvoker(std::optional<std::filesystem::path> socket_path, std::chrono::milliseconds timeout) :
        socket_path_(std::move(socket_path)), timeout_(timeout) {}

    std::string SocketInvoker::invoke(std::string_view call, std::string_view args, std::string_view format) {
        if (!socket_path_) {
            error_log("hyprland", "HYPRLAND_INSTANCE_SIGNATURE not set; is Hyprland running?");
            return {};
        }

        FileDescriptor fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
        if (!fd) {
            error_log("hyprland", std::string("socket() failed: ") + std::strerror(errno));
            return {};
        }
        if (!set_timeouts(fd.get(), timeout_)) {
            error_log("hyprland", "unable to configure socket timeouts");
            return {};
        }

        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        const auto path = socket_path_->string();
        if (path.size() >= sizeof(addr.sun_path)) {
            error_log("hyprland", "socket path too long: " + path);
            return {};
        }
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            error_log("hyprland", "unable to connect to " + path + ": " + std::strerror(errno));
            return {};
        }

        if (!send_all(fd.get(), format_socket_request(call, args, format))) {
            error_log("hyprland", std::string("unable to send request: ") + std::strerror(errno));
            return {};
        }
        auto reply = receive_all(fd.get());
        if (!reply) {
            error_log("hyprland", std::string("unable to read reply: ") + std::strerror(errno));
            return {};
        }
        return std::move(*reply);
    }

} // namespace minhypr
