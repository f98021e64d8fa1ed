#pragma once

#include "config.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace decaf {

    enum class argument_error_code : uint8_t { missing_argument, invalid_arguments, unknown_tool };

    inline constexpr std::string_view to_string(argument_error_code code) {
        switch (code) {
            case argument_error_code::missing_argument:
                return "missing_argument"sv;
            case argument_error_code::invalid_arguments:
                return "invalid_arguments"sv;
            case argument_error_code::unknown_tool:
                return "unknown_tool"sv;
        }
        return "invalid_arguments"sv;
    }

    // Raised for malformed tool calls; surfaced to the client as a JSON-RPC error, never as tool text.
    class argument_error : public std::invalid_argument {
      public:
        argument_error(argument_error_code code, const std::string& message)
                : std::invalid_argument{message}, code_{code} {}

        argument_error_code code() const noexcept { return code_; }

      private:
        argument_error_code code_{};
    };

    struct decompile_args {
        std::optional<std::string> file_path{};
        std::optional<std::string> method_name{};
        std::optional<bool> ignore_exceptions{};
        std::optional<bool> hide_utf{};
        std::map<std::string, glz::raw_json> options{};

        struct glaze {
            using T = decompile_args;
            static constexpr auto value = glz::object(
                    &T::file_path, &T::method_name, &T::ignore_exceptions, &T::hide_utf, &T::options);
        };
    };

    // argv of the decompiler process: launcher, target, then flag/value pairs
    using command_spec = std::vector<std::string>;

    decompile_args parse_decompile_args(std::string_view raw_arguments);

    // Returns the non-empty file_path or throws argument_error{missing_argument}.
    const std::string& require_file_path(const decompile_args& args);

    // Absolute, normalized form of a client-supplied path. The target does not need to exist.
    std::filesystem::path resolve_target(std::string_view file_path);

    // Option keys become flag names, so only [A-Za-z0-9]+ is accepted.
    bool is_allowed_option_key(std::string_view key);

    // Integral numbers keep their exact digits; other values render as CFR expects them.
    std::string render_option_value(const glz::raw_json& value);

    // `java -jar <cfr>` for jar artifacts, otherwise the artifact itself
    command_spec launcher_prefix(const server_config& cfg);

    command_spec build_command(const decompile_args& args, const server_config& cfg);

    std::string command_line(const command_spec& cmd);

}  // namespace decaf
