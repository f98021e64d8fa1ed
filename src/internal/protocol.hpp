#pragma once

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace decaf::internal::protocol {

    inline constexpr std::string_view protocol_version{"2024-11-05"};
    inline constexpr std::string_view server_name{"cfr-decompiler"};
    inline constexpr std::string_view server_version{DECAF_VERSION};

    // ── MCP protocol types ──────────────────────────────────────────

    struct client_info {
        std::string name{};
        std::string version{};
        struct glaze {
            using T = client_info;
            static constexpr auto value = glz::object(&T::name, &T::version);
        };
    };

    struct initialize_params {
        std::string protocolVersion{};
        client_info clientInfo{};
        struct glaze {
            using T = initialize_params;
            static constexpr auto value =
                    glz::object("protocolVersion", &T::protocolVersion, "clientInfo", &T::clientInfo);
        };
    };

    struct server_info {
        std::string name{};
        std::string version{};
        struct glaze {
            using T = server_info;
            static constexpr auto value = glz::object(&T::name, &T::version);
        };
    };

    struct empty_object {
        struct glaze {
            using T = empty_object;
            static constexpr auto value = glz::object();
        };
    };

    struct server_capabilities {
        empty_object tools{};
        struct glaze {
            using T = server_capabilities;
            static constexpr auto value = glz::object(&T::tools);
        };
    };

    struct initialize_result {
        std::string protocolVersion{};
        server_capabilities capabilities{};
        server_info serverInfo{};
        struct glaze {
            using T = initialize_result;
            static constexpr auto value = glz::object(
                    "protocolVersion",
                    &T::protocolVersion,
                    "capabilities",
                    &T::capabilities,
                    "serverInfo",
                    &T::serverInfo);
        };
    };

    struct tool_definition {
        std::string name{};
        std::string description{};
        glz::raw_json inputSchema{};
        struct glaze {
            using T = tool_definition;
            static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
        };
    };

    struct tools_list_result {
        std::vector<tool_definition> tools{};
        struct glaze {
            using T = tools_list_result;
            static constexpr auto value = glz::object(&T::tools);
        };
    };

    struct tool_call_params {
        std::string name{};
        glz::raw_json arguments{};
        struct glaze {
            using T = tool_call_params;
            static constexpr auto value = glz::object(&T::name, &T::arguments);
        };
    };

    struct text_content {
        std::string type{"text"};
        std::string text{};
        struct glaze {
            using T = text_content;
            static constexpr auto value = glz::object(&T::type, &T::text);
        };
    };

    struct tool_call_result {
        std::vector<text_content> content{};
        struct glaze {
            using T = tool_call_result;
            static constexpr auto value = glz::object(&T::content);
        };
    };

    // ── Response helpers ────────────────────────────────────────────

    template <typename T>
    inline std::string make_response(const glz::rpc::id_t& id, T&& result) {
        glz::rpc::response_t<std::decay_t<T>> resp{};
        resp.id = id;
        resp.result = std::forward<T>(result);
        std::string json{};
        (void)glz::write_json(resp, json);
        return json;
    }

    inline std::string make_error_response(
            const glz::rpc::id_t& id,
            glz::rpc::error_e code,
            const std::string& message,
            std::optional<std::string> data = std::nullopt) {
        glz::rpc::response_t<glz::raw_json> resp{};
        resp.id = id;
        resp.error = glz::rpc::error{code, std::move(data), message};
        std::string json{};
        (void)glz::write_json(resp, json);
        return json;
    }

    inline std::string make_text_response(const glz::rpc::id_t& id, std::string text) {
        tool_call_result result{};
        result.content.push_back(text_content{.text = std::move(text)});
        return make_response(id, std::move(result));
    }

}  // namespace decaf::internal::protocol
