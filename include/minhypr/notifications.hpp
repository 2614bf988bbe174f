#ifndef MINHYPR_NOTIFICATIONS_HPP
#define MINHYPR_NOTIFICATIONS_HPP

#include <optional>
#include <string>
#include <string_view>

#include "minhypr/process.hpp"

namespace minhypr {

    std::string                failure_notification_text(std::string_view command, std::string_view detail);
    std::optional<std::string> send_notification(const ProcessRunner& runner, std::string_view text);

} // namespace minhypr

#endif // MINHYPR_NOTIFICATIONS_HPP
