#pragma once

#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace decaf {

    using namespace std::string_view_literals;

    /*
     * Decaf Server Config Options
     *
     * Transport
     * - mode: Which transports to serve: stdio, sse (HTTP event stream), or both at once.
     * - host: Bind address for the HTTP transport.
     * - port: Bind port for the HTTP transport.
     *
     * Decompiler
     * - cfr_path: CFR artifact. A path ending in .jar is launched through java_path; anything else
     *   is executed directly.
     * - java_path: Java launcher used for .jar artifacts.
     * - exec_timeout_ms: Wall-clock budget for a single decompiler run; the process group is killed
     *   once it elapses.
     * - workers: Size of the worker pool that runs decompiler processes off the event loop.
     *
     * Logging and one-shot actions
     * - log: Minimum level written to stderr.
     * - quiet/verbose: Shorthands for log=error and log=debug.
     * - print_config: Print resolved config and exit.
     *
     * The config is resolved once at startup and handed to every component by const reference.
     */

    enum class transport_mode : uint8_t { stdio, sse, both };

    inline constexpr std::string_view to_string(transport_mode mode) {
        switch (mode) {
            case transport_mode::stdio:
                return "stdio"sv;
            case transport_mode::sse:
                return "sse"sv;
            case transport_mode::both:
                return "both"sv;
        }
        return "stdio"sv;
    }

    inline constexpr bool try_parse_transport_mode(std::string_view text, transport_mode& out) {
        if (utils::str_case_eq(text, "stdio"sv)) {
            out = transport_mode::stdio;
            return true;
        }
        if (utils::str_case_eq(text, "sse"sv) || utils::str_case_eq(text, "http"sv)) {
            out = transport_mode::sse;
            return true;
        }
        if (utils::str_case_eq(text, "both"sv)) {
            out = transport_mode::both;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::debug:
                return "debug"sv;
            case log_level::info:
                return "info"sv;
            case log_level::warn:
                return "warn"sv;
            case log_level::error:
                return "error"sv;
        }
        return "info"sv;
    }

    inline constexpr bool try_parse_log_level(std::string_view text, log_level& out) {
        if (utils::str_case_eq(text, "debug"sv)) {
            out = log_level::debug;
            return true;
        }
        if (utils::str_case_eq(text, "info"sv)) {
            out = log_level::info;
            return true;
        }
        if (utils::str_case_eq(text, "warn"sv) || utils::str_case_eq(text, "warning"sv)) {
            out = log_level::warn;
            return true;
        }
        if (utils::str_case_eq(text, "error"sv)) {
            out = log_level::error;
            return true;
        }
        return false;
    }

    inline constexpr bool serves_stdio(transport_mode mode) {
        return mode == transport_mode::stdio || mode == transport_mode::both;
    }

    inline constexpr bool serves_sse(transport_mode mode) {
        return mode == transport_mode::sse || mode == transport_mode::both;
    }

    struct server_config {
        transport_mode mode{transport_mode::stdio};
        std::string host{"0.0.0.0"};
        uint16_t port{8000};

        std::filesystem::path cfr_path{"cfr.jar"};
        std::filesystem::path java_path{"java"};
        int exec_timeout_ms{60'000};
        unsigned workers{4U};

        log_level log{log_level::info};
        bool quiet{false};
        bool verbose{false};
        bool print_config{false};
    };

}  // namespace decaf
