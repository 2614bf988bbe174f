#include <cstring>
#include <filesystem>
#include <string>
#include <thread>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "minhypr/file_descriptor.hpp"
#include "minhypr/hypr_socket.hpp"

namespace {

    minhypr::FileDescriptor listen_on(const std::filesystem::path& path) {
        minhypr::FileDescriptor fd(::socket(AF_UNIX, SOCK_STREAM, 0));
        sockaddr_un             addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd.get(), 1) != 0) {
            fd.reset();
        }
        return fd;
    }

    // Accepts one connection, records the request and answers with `reply`.
    void serve_once(int server_fd, std::string* request, const std::string& reply) {
        minhypr::FileDescriptor client(::accept(server_fd, nullptr, nullptr));
        if (!client) {
            return;
        }
        char          buffer[256];
        const ssize_t n = ::recv(client.get(), buffer, sizeof(buffer), 0);
        if (n > 0) {
            request->assign(buffer, static_cast<size_t>(n));
        }
        ::send(client.get(), reply.data(), reply.size(), MSG_NOSIGNAL);
    }

} // namespace

TEST(HyprSocket, FormatsRequests) {
    EXPECT_EQ(minhypr::format_socket_request("clients", "", "j"), "j/clients");
    EXPECT_EQ(minhypr::format_socket_request("dispatch", "focuswindow address:0x1", ""), "/dispatch focuswindow address:0x1");
}

TEST(HyprSocket, SendsRequestAndReadsReplyUntilClose) {
    const auto dir    = minhypr_test::make_temp_dir("sock");
    const auto path   = dir / ".socket.sock";
    auto       server = listen_on(path);
    ASSERT_TRUE(static_cast<bool>(server));

    std::string request;
    std::thread thread(serve_once, server.get(), &request, std::string(R"([{"address":"0x1"}])"));

    minhypr::SocketInvoker invoker(path, std::chrono::milliseconds(2000));
    const auto             reply = invoker.invoke("clients", "", "j");
    thread.join();

    EXPECT_EQ(request, "j/clients");
    EXPECT_EQ(reply, R"([{"address":"0x1"}])");
    std::filesystem::remove_all(dir);
}

TEST(HyprSocket, MissingSocketYieldsEmptyReply) {
    const auto             dir = minhypr_test::make_temp_dir("sock");
    minhypr::SocketInvoker invoker(dir / "absent.sock");

    EXPECT_EQ(invoker.invoke("clients", "", "j"), "");

    minhypr::SocketInvoker no_instance(std::nullopt);
    EXPECT_EQ(no_instance.invoke("clients", "", "j"), "");
    std::filesystem::remove_all(dir);
}
