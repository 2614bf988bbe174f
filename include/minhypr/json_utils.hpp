#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace minhypr {

    // Non-empty string or nullopt; null and other types read as absent.
    std::optional<std::string>  optional_string(const nlohmann::json& value);

    // Field readers return nullopt when `obj` is not an object, the key is missing or the type differs.
    std::optional<std::string>  optional_string_field(const nlohmann::json& obj, const char* key);
    std::optional<int>          optional_int_field(const nlohmann::json& obj, const char* key);
    std::optional<std::int64_t> optional_int64_field(const nlohmann::json& obj, const char* key);

}
