#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace minhypr {

    std::string_view         trim_view(std::string_view value);
    std::string              trim_copy(std::string_view value);
    std::string              to_lower(std::string_view value);
    std::vector<std::string> split_list(std::string_view value, char delim);

}
