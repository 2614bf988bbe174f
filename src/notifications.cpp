#include "minhypr/notifications.hpp"

namespace minhypr {

    std::string failure_notification_text(std::string_view command, std::string_view detail) {
        std::string message = "[minhypr] ";
        message += command.empty() ? std::string_view("command") : command;
        message += " failed";
        if (!detail.empty()) {
            message += ": ";
            message += detail;
        }
        return message;
    }

    std::optional<std::string> send_notification(const ProcessRunner& runner, std::string_view text) {
        const auto sent = run_checked(runner, {"notify-send", "-a", "minhypr", "MinHypr", std::string(text)});
        if (!sent) {
            return sent.error();
        }
        return std::nullopt;
    }

} // namespace minhypr
