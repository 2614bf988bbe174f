#pragma once

#include <string>
#include <string_view>

namespace minhypr {

    // Nerd Font glyph for a window class; case-insensitive substring match.
    std::string app_icon(std::string_view class_name);

}
