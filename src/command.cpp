#include "decaf/command.hpp"

#include "decaf/format.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

using namespace decaf::literals;
namespace fs = std::filesystem;

namespace decaf {

    namespace detail {

        static constexpr auto cfr_methodname_flag = "--methodname"sv;
        static constexpr auto cfr_ignoreexceptions_flag = "--ignoreexceptions"sv;
        static constexpr auto cfr_hideutf_flag = "--hideutf"sv;

        static void append_flag(command_spec& cmd, std::string_view flag, std::string value) {
            cmd.emplace_back(flag);
            cmd.push_back(std::move(value));
        }

        static bool is_null_arguments(std::string_view raw) {
            auto trimmed = utils::trim_view(raw);
            return trimmed.empty() || trimmed == "null"sv || trimmed == R"("")"sv;
        }

        static bool is_integer_token(std::string_view token) {
            if (token.starts_with('-')) {
                token.remove_prefix(1);
            }
            return !token.empty() &&
                   std::ranges::all_of(token, [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
        }

    }  // namespace detail

    decompile_args parse_decompile_args(std::string_view raw_arguments) {
        decompile_args args{};
        if (detail::is_null_arguments(raw_arguments)) {
            return args;
        }

        std::string buffer{raw_arguments};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(args, buffer);
        if (ec) {
            throw argument_error{
                    argument_error_code::invalid_arguments,
                    "Failed to parse decompile arguments: {}"_format(glz::format_error(ec, buffer))};
        }
        return args;
    }

    const std::string& require_file_path(const decompile_args& args) {
        if (!args.file_path || args.file_path->empty()) {
            throw argument_error{argument_error_code::missing_argument, "file_path is required"};
        }
        return *args.file_path;
    }

    fs::path resolve_target(std::string_view file_path) {
        fs::path path{file_path};
        std::error_code ec{};
        auto absolute = fs::absolute(path, ec);
        if (ec) {
            return path.lexically_normal();
        }
        auto resolved = fs::weakly_canonical(absolute, ec);
        if (ec) {
            return absolute.lexically_normal();
        }
        return resolved;
    }

    bool is_allowed_option_key(std::string_view key) {
        return !key.empty() &&
               std::ranges::all_of(key, [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; });
    }

    std::string render_option_value(const glz::raw_json& raw) {
        auto token = utils::trim_view(raw.str);
        glz::generic value{};
        std::string buffer{token};
        if (glz::read_json(value, buffer)) {
            return std::string{token};
        }

        if (value.is_boolean()) {
            return value.get_boolean() ? "true" : "false";
        }
        if (value.is_string()) {
            return value.get_string();
        }
        if (value.is_number()) {
            if (detail::is_integer_token(token)) {
                return std::string{token};
            }
            // shortest round-trip form, so 3.0 renders as "3"
            return "{}"_format(value.get_number());
        }
        std::string json{};
        (void)glz::write_json(value, json);
        return json;
    }

    command_spec launcher_prefix(const server_config& cfg) {
        auto cfr = cfg.cfr_path.string();
        if (utils::ends_with_case(cfr, ".jar"sv)) {
            return {cfg.java_path.string(), "-jar", std::move(cfr)};
        }
        return {std::move(cfr)};
    }

    command_spec build_command(const decompile_args& args, const server_config& cfg) {
        const auto& file_path = require_file_path(args);

        auto cmd = launcher_prefix(cfg);
        cmd.push_back(resolve_target(file_path).string());

        if (args.method_name && !args.method_name->empty()) {
            detail::append_flag(cmd, detail::cfr_methodname_flag, *args.method_name);
        }
        if (args.ignore_exceptions.value_or(false)) {
            detail::append_flag(cmd, detail::cfr_ignoreexceptions_flag, "true");
        }
        if (args.hide_utf.value_or(false)) {
            detail::append_flag(cmd, detail::cfr_hideutf_flag, "true");
        }

        // header comments and version banner are always suppressed
        detail::append_flag(cmd, "--comments"sv, "false");
        detail::append_flag(cmd, "--showversion"sv, "false");

        for (const auto& [key, value] : args.options) {
            if (!is_allowed_option_key(key)) {
                log_warn("Ignored invalid option key: ", key);
                continue;
            }
            detail::append_flag(cmd, "--{}"_format(key), render_option_value(value));
        }

        return cmd;
    }

    std::string command_line(const command_spec& cmd) {
        return utils::join_with_separator(cmd, " "sv);
    }

}  // namespace decaf
