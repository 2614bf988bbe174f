#include "minhypr/hyprctl.hpp"

#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

#include "minhypr/json_utils.hpp"
#include "minhypr/strings.hpp"

namespace minhypr {

    namespace {

        std::unexpected<HyprctlErrorInfo> fail(std::string_view context, std::string message) {
            return std::unexpected(HyprctlErrorInfo{.context = std::string(context), .message = std::move(message)});
        }

        HyprctlResult<nlohmann::json> parse_reply(std::string_view reply, std::string_view context) {
            if (trim_view(reply).empty()) {
                return fail(context, "no response");
            }
            auto json = nlohmann::json::parse(reply.begin(), reply.end(), nullptr, false);
            if (json.is_discarded()) {
                return fail(context, "invalid json");
            }
            return json;
        }

        template <typename T>
        HyprctlResult<T> required(const nlohmann::json& obj, const char* key, std::string_view context) {
            const auto it = obj.is_object() ? obj.find(key) : obj.end();
            if (!obj.is_object() || it == obj.end()) {
                return fail(context, std::string(key) + " missing");
            }
            const bool matches = std::is_same_v<T, std::string> ? it->is_string() : it->is_number_integer();
            if (!matches) {
                return fail(context, std::string(key) + " invalid");
            }
            return it->template get<T>();
        }

        HyprctlResult<WorkspaceRef> parse_workspace_ref(const nlohmann::json& obj, std::string_view context) {
            const auto id = required<int>(obj, "id", context);
            if (!id) {
                return std::unexpected(id.error());
            }
            return WorkspaceRef{.id = *id, .name = optional_string_field(obj, "name")};
        }

        // "at": [x, y], "size": [w, h]; anything else leaves the geometry unknown.
        std::optional<WindowGeometry> parse_geometry(const nlohmann::json& client) {
            const auto pair = [&](const char* key) -> std::optional<std::pair<int, int>> {
                const auto it = client.find(key);
                if (it == client.end() || !it->is_array() || it->size() < 2 || !(*it)[0].is_number_integer() || !(*it)[1].is_number_integer()) {
                    return std::nullopt;
                }
                return std::pair{(*it)[0].get<int>(), (*it)[1].get<int>()};
            };
            const auto at   = pair("at");
            const auto size = pair("size");
            if (!at || !size) {
                return std::nullopt;
            }
            return WindowGeometry{.x = at->first, .y = at->second, .width = size->first, .height = size->second};
        }

        HyprctlResult<ClientInfo> parse_client(const nlohmann::json& client, std::string_view context) {
            auto address = required<std::string>(client, "address", context);
            if (!address) {
                return std::unexpected(address.error());
            }
            const auto workspace = client.find("workspace");
            if (workspace == client.end()) {
                return fail(context, "workspace missing");
            }
            if (!workspace->is_object()) {
                return fail(context, "workspace invalid");
            }
            auto ref = parse_workspace_ref(*workspace, context);
            if (!ref) {
                return std::unexpected(ref.error());
            }
            return ClientInfo{
                .address    = std::move(*address),
                .workspace  = std::move(*ref),
                .class_name = optional_string_field(client, "class"),
                .title      = optional_string_field(client, "title"),
                .pid        = optional_int_field(client, "pid"),
                .geometry   = parse_geometry(client),
            };
        }

        HyprctlResult<WorkspaceInfo> parse_workspace_info(const nlohmann::json& workspace, std::string_view context) {
            const auto id = required<int>(workspace, "id", context);
            if (!id) {
                return std::unexpected(id.error());
            }
            return WorkspaceInfo{
                .id      = *id,
                .windows = optional_int_field(workspace, "windows").value_or(0),
                .name    = optional_string_field(workspace, "name"),
                .monitor = optional_string_field(workspace, "monitor"),
            };
        }

        template <typename T, typename ParseElement>
        HyprctlResult<std::vector<T>> parse_array(std::string_view reply, std::string_view context, ParseElement parse_element) {
            const auto json = parse_reply(reply, context);
            if (!json) {
                return std::unexpected(json.error());
            }
            if (!json->is_array()) {
                return fail(context, "not array");
            }
            std::vector<T> items;
            items.reserve(json->size());
            for (const auto& element : *json) {
                auto item = parse_element(element, context);
                if (!item) {
                    return std::unexpected(item.error());
                }
                items.push_back(std::move(*item));
            }
            return items;
        }

    } // namespace

    std::string format_hyprctl_error(const HyprctlErrorInfo& error) {
        if (error.context.empty() || error.message.empty()) {
            return error.context + error.message;
        }
        return error.context + ": " + error.message;
    }

    HyprctlResult<std::optional<ClientInfo>> parse_active_window(std::string_view json_text) {
        constexpr std::string_view kContext = "activewindow";
        const auto                 json     = parse_reply(json_text, kContext);
        if (!json) {
            return std::unexpected(json.error());
        }
        if (!json->is_object()) {
            return fail(kContext, "not object");
        }
        // Hyprland answers {} when nothing has focus.
        if (json->empty()) {
            return std::optional<ClientInfo>{};
        }
        auto client = parse_client(*json, kContext);
        if (!client) {
            return std::unexpected(client.error());
        }
        return std::optional<ClientInfo>(std::move(*client));
    }

    HyprctlResult<WorkspaceRef> parse_active_workspace(std::string_view json_text) {
        const auto json = parse_reply(json_text, "activeworkspace");
        if (!json) {
            return std::unexpected(json.error());
        }
        return parse_workspace_ref(*json, "activeworkspace");
    }

    HyprctlResult<std::vector<WorkspaceInfo>> parse_workspaces(std::string_view json_text) {
        return parse_array<WorkspaceInfo>(json_text, "workspaces", parse_workspace_info);
    }

    HyprctlResult<std::vector<ClientInfo>> parse_clients(std::string_view json_text) {
        return parse_array<ClientInfo>(json_text, "clients", parse_client);
    }

    bool is_ok_response(std::string_view output) {
        return trim_view(output) == "ok";
    }

    HyprctlClient::HyprctlClient(HyprctlInvoker& invoker) : invoker_(invoker) {}

    std::string HyprctlClient::query(std::string_view call) {
        return invoker_.invoke(call, "", "j");
    }

    HyprctlResult<std::optional<ClientInfo>> HyprctlClient::active_window() {
        return parse_active_window(query("activewindow"));
    }

    HyprctlResult<WorkspaceRef> HyprctlClient::active_workspace() {
        return parse_active_workspace(query("activeworkspace"));
    }

    HyprctlResult<std::vector<WorkspaceInfo>> HyprctlClient::workspaces() {
        return parse_workspaces(query("workspaces"));
    }

    HyprctlResult<std::vector<ClientInfo>> HyprctlClient::clients() {
        return parse_clients(query("clients"));
    }

    std::string HyprctlClient::dispatch(std::string_view dispatcher, std::string_view argument) {
        std::string args(dispatcher);
        if (!argument.empty()) {
            args += ' ';
            args += argument;
        }
        return invoker_.invoke("dispatch", args, "");
    }

} // namespace minhypr
