#include "utils.hpp"

namespace decaf::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: transport mode parsing", "[001][config]") {
        transport_mode mode = transport_mode::stdio;

        REQUIRE(try_parse_transport_mode("sse"sv, mode));
        CHECK(mode == transport_mode::sse);
        REQUIRE(try_parse_transport_mode("BOTH"sv, mode));
        CHECK(mode == transport_mode::both);
        REQUIRE(try_parse_transport_mode("Stdio"sv, mode));
        CHECK(mode == transport_mode::stdio);
        REQUIRE(try_parse_transport_mode("http"sv, mode));
        CHECK(mode == transport_mode::sse);

        CHECK_FALSE(try_parse_transport_mode("websocket"sv, mode));
        CHECK(mode == transport_mode::sse);

        CHECK(serves_stdio(transport_mode::stdio));
        CHECK_FALSE(serves_sse(transport_mode::stdio));
        CHECK(serves_sse(transport_mode::sse));
        CHECK_FALSE(serves_stdio(transport_mode::sse));
        CHECK(serves_stdio(transport_mode::both));
        CHECK(serves_sse(transport_mode::both));
    }

    TEST_CASE("001: log level parsing and names", "[001][config]") {
        log_level level = log_level::info;

        REQUIRE(try_parse_log_level("debug"sv, level));
        CHECK(level == log_level::debug);
        REQUIRE(try_parse_log_level("WARNING"sv, level));
        CHECK(level == log_level::warn);
        REQUIRE(try_parse_log_level("error"sv, level));
        CHECK(level == log_level::error);
        CHECK_FALSE(try_parse_log_level("trace"sv, level));

        CHECK(to_string(log_level::debug) == "debug"sv);
        CHECK(to_string(log_level::info) == "info"sv);
        CHECK(to_string(log_level::warn) == "warn"sv);
        CHECK(to_string(log_level::error) == "error"sv);

        auto previous = current_log_level();
        set_log_level(log_level::error);
        CHECK(current_log_level() == log_level::error);
        set_log_level(previous);
    }

    TEST_CASE("001: logging recovers after a failed stderr write", "[001][logging]") {
        auto previous = current_log_level();
        set_log_level(log_level::info);

        std::string logged{};
        {
            detail::captured_stderr capture{};
            std::cerr.setstate(std::ios::badbit);
            log_info("written after ", 1, " failure");
            logged = capture.text();
            CHECK(std::cerr.good());
        }
        set_log_level(previous);

        CHECK(detail::contains(logged, " - INFO - ["));
        CHECK(detail::contains(logged, "written after 1 failure\n"));
    }

    TEST_CASE("001: server config defaults", "[001][config]") {
        server_config cfg{};
        CHECK(cfg.mode == transport_mode::stdio);
        CHECK(cfg.host == "0.0.0.0");
        CHECK(cfg.port == 8000U);
        CHECK(cfg.cfr_path == "cfr.jar");
        CHECK(cfg.java_path == "java");
        CHECK(cfg.exec_timeout_ms == 60'000);
        CHECK(cfg.workers >= 1U);
        CHECK(cfg.log == log_level::info);
    }

    TEST_CASE("001: string helpers", "[001][utils]") {
        CHECK(utils::str_case_eq("Cfr.JAR"sv, "cfr.jar"sv));
        CHECK_FALSE(utils::str_case_eq("cfr.jar"sv, "cfr.ja"sv));

        CHECK(utils::ends_with_case("/opt/cfr/CFR-0.152.JAR"sv, ".jar"sv));
        CHECK_FALSE(utils::ends_with_case("/usr/bin/cfr"sv, ".jar"sv));
        CHECK_FALSE(utils::ends_with_case("ar"sv, ".jar"sv));

        CHECK(utils::is_blank(""sv));
        CHECK(utils::is_blank(" \n\t\r "sv));
        CHECK_FALSE(utils::is_blank("  x "sv));

        CHECK(utils::trim_view("  hello \n"sv) == "hello"sv);
        CHECK(utils::trim_view("\r\n"sv).empty());

        CHECK(utils::join_with_separator({"java", "-jar", "cfr.jar"}, " "sv) == "java -jar cfr.jar");
        CHECK(utils::join_with_separator({}, ","sv).empty());
    }

}  // namespace decaf::test
