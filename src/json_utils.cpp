#include "minhypr/json_utils.hpp"

namespace minhypr {

    namespace {

        const nlohmann::json* field(const nlohmann::json& obj, const char* key) {
            if (!obj.is_object()) {
                return nullptr;
            }
            const auto it = obj.find(key);
            return it == obj.end() ? nullptr : &*it;
        }

        template <typename T>
        std::optional<T> integer_field(const nlohmann::json& obj, const char* key) {
            const auto* value = field(obj, key);
            if (!value || !value->is_number_integer()) {
                return std::nullopt;
            }
            return value->get<T>();
        }

    } // namespace

    std::optional<std::string> optional_string(const nlohmann::json& value) {
        if (!value.is_string() || value.get_ref<const std::string&>().empty()) {
            return std::nullopt;
        }
        return value.get<std::string>();
    }

    std::optional<std::string> optional_string_field(const nlohmann::json& obj, const char* key) {
        const auto* value = field(obj, key);
        return value ? optional_string(*value) : std::nullopt;
    }

    std::optional<int> optional_int_field(const nlohmann::json& obj, const char* key) {
        return integer_field<int>(obj, key);
    }

    std::optional<std::int64_t> optional_int64_field(const nlohmann::json& obj, const char* key) {
        return integer_field<std::int64_t>(obj, key);
    }

}
