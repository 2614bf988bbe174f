#include <gtest/gtest.h>

#include "minhypr/compositor.hpp"

namespace {

    struct ScriptedInvoker : public minhypr::HyprctlInvoker {
        std::vector<std::string> requests;
        std::vector<std::string> responses;

        std::string              invoke(std::string_view call, std::string_view args, std::string_view format) override {
            requests.push_back(std::string(format) + "|" + std::string(call) + "|" + std::string(args));
            if (responses.empty()) {
                return {};
            }
            auto response = responses.front();
            responses.erase(responses.begin());
            return response;
        }
    };

} // namespace

TEST(HyprctlCompositor, MovesSilentlyWithAddressSelector) {
    ScriptedInvoker invoker;
    invoker.responses.push_back("ok");
    minhypr::HyprctlClient     client(invoker);
    minhypr::HyprctlCompositor compositor(client);

    const auto                 moved = compositor.move_window("0xabc", "special:minimized", true);

    ASSERT_TRUE(moved.has_value());
    ASSERT_EQ(invoker.requests.size(), 1u);
    EXPECT_EQ(invoker.requests[0], "|dispatch|movetoworkspacesilent special:minimized,address:0xabc");
}

TEST(HyprctlCompositor, RestoreMoveFollowsTheWindow) {
    ScriptedInvoker invoker;
    invoker.responses.push_back("ok");
    invoker.responses.push_back("ok");
    minhypr::HyprctlClient     client(invoker);
    minhypr::HyprctlCompositor compositor(client);

    ASSERT_TRUE(compositor.move_window("0xabc", "3", false).has_value());
    ASSERT_TRUE(compositor.focus_window("0xabc").has_value());

    EXPECT_EQ(invoker.requests[0], "|dispatch|movetoworkspace 3,address:0xabc");
    EXPECT_EQ(invoker.requests[1], "|dispatch|focuswindow address:0xabc");
}

TEST(HyprctlCompositor, DispatchErrorsBecomeAdapterFailures) {
    ScriptedInvoker invoker;
    invoker.responses.push_back("No such window found");
    minhypr::HyprctlClient     client(invoker);
    minhypr::HyprctlCompositor compositor(client);

    const auto                 moved = compositor.move_window("0xabc", "3", false);

    ASSERT_FALSE(moved.has_value());
    EXPECT_EQ(moved.error().kind, minhypr::ErrorKind::kAdapterFailure);
    EXPECT_EQ(moved.error().message, "movetoworkspace: No such window found");
}

TEST(HyprctlCompositor, QueryErrorsBecomeAdapterFailures) {
    ScriptedInvoker            invoker;
    minhypr::HyprctlClient     client(invoker);
    minhypr::HyprctlCompositor compositor(client);

    const auto                 windows = compositor.list_windows();

    ASSERT_FALSE(windows.has_value());
    EXPECT_EQ(windows.error().kind, minhypr::ErrorKind::kAdapterFailure);
    EXPECT_EQ(windows.error().message, "clients: no response");
}

TEST(HyprctlCompositor, WindowExistsUsesClientList) {
    ScriptedInvoker invoker;
    invoker.responses.push_back(R"([{"address":"0x1","workspace":{"id":1,"name":"1"}}])");
    invoker.responses.push_back(R"([{"address":"0x1","workspace":{"id":1,"name":"1"}}])");
    minhypr::HyprctlClient     client(invoker);
    minhypr::HyprctlCompositor compositor(client);

    const auto                 present = compositor.window_exists("0x1");
    const auto                 absent  = compositor.window_exists("0x2");

    ASSERT_TRUE(present.has_value());
    EXPECT_TRUE(*present);
    ASSERT_TRUE(absent.has_value());
    EXPECT_FALSE(*absent);
}

TEST(WorkspaceArgument, UsesIdForNumberedAndNameOtherwise) {
    EXPECT_EQ(minhypr::workspace_argument({.id = 3, .name = "3"}), "3");
    EXPECT_EQ(minhypr::workspace_argument({.id = 3, .name = std::nullopt}), "3");
    EXPECT_EQ(minhypr::workspace_argument({.id = 11, .name = "web"}), "name:web");
    EXPECT_EQ(minhypr::workspace_argument({.id = -97, .name = "special:scratch"}), "special:scratch");
}
