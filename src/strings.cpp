#include "minhypr/strings.hpp"

#include <algorithm>
#include <cctype>

namespace minhypr {

    namespace {

        constexpr std::string_view kWhitespace = " \t\n\r\f\v";

    } // namespace

    std::string_view trim_view(std::string_view value) {
        const auto first = value.find_first_not_of(kWhitespace);
        if (first == std::string_view::npos) {
            return {};
        }
        const auto last = value.find_last_not_of(kWhitespace);
        return value.substr(first, last - first + 1);
    }

    std::string trim_copy(std::string_view value) {
        return std::string(trim_view(value));
    }

    std::string to_lower(std::string_view value) {
        std::string out(value);
        std::ranges::transform(out, out.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        return out;
    }

    std::vector<std::string> split_list(std::string_view value, char delim) {
        std::vector<std::string> parts;
        for (size_t start = 0; start <= value.size();) {
            const auto end  = std::min(value.find(delim, start), value.size());
            const auto part = trim_view(value.substr(start, end - start));
            if (!part.empty()) {
                parts.emplace_back(part);
            }
            start = end + 1;
        }
        return parts;
    }

}
