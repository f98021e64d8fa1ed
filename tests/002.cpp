#include "utils.hpp"

namespace decaf::test {
    using namespace std::string_view_literals;

    namespace {
        server_config direct_cfg() {
            server_config cfg{};
            cfg.cfr_path = "/opt/tools/cfr";
            return cfg;
        }

        argument_error_code error_code_of(std::string_view raw) {
            try {
                auto args = parse_decompile_args(raw);
                (void)build_command(args, direct_cfg());
            } catch (const argument_error& e) {
                return e.code();
            }
            FAIL("expected argument_error for " << raw);
            return argument_error_code::invalid_arguments;
        }

        glz::raw_json json_value(std::string_view text) {
            glz::raw_json value{};
            value.str = std::string{text};
            return value;
        }
    }  // namespace

    TEST_CASE("002: minimal call produces target plus fixed flags", "[002][command]") {
        auto args = parse_decompile_args(R"({"file_path":"/tmp/A.class"})"sv);
        auto cmd = build_command(args, direct_cfg());

        command_spec expected{"/opt/tools/cfr", "/tmp/A.class", "--comments", "false", "--showversion", "false"};
        CHECK(cmd == expected);
    }

    TEST_CASE("002: jar artifacts are launched through java", "[002][command]") {
        server_config cfg{};
        cfg.cfr_path = "/opt/cfr/CFR-0.152.JAR";
        cfg.java_path = "/usr/lib/jvm/bin/java";

        auto prefix = launcher_prefix(cfg);
        command_spec expected{"/usr/lib/jvm/bin/java", "-jar", "/opt/cfr/CFR-0.152.JAR"};
        CHECK(prefix == expected);

        cfg.cfr_path = "cfr-wrapper";
        CHECK(launcher_prefix(cfg) == command_spec{"cfr-wrapper"});
    }

    TEST_CASE("002: method filter and boolean switches", "[002][command]") {
        auto args = parse_decompile_args(
                R"({"file_path":"/tmp/A.class","method_name":"run","ignore_exceptions":true,"hide_utf":false})"sv);
        auto cmd = build_command(args, direct_cfg());

        command_spec expected{
                "/opt/tools/cfr",
                "/tmp/A.class",
                "--methodname",
                "run",
                "--ignoreexceptions",
                "true",
                "--comments",
                "false",
                "--showversion",
                "false"};
        CHECK(cmd == expected);

        SECTION("empty method name adds no filter") {
            auto empty = parse_decompile_args(R"({"file_path":"/tmp/A.class","method_name":""})"sv);
            auto line = command_line(build_command(empty, direct_cfg()));
            CHECK_FALSE(detail::contains(line, "--methodname"));
        }

        SECTION("hide_utf true") {
            auto utf = parse_decompile_args(R"({"file_path":"/tmp/A.class","hide_utf":true})"sv);
            auto line = command_line(build_command(utf, direct_cfg()));
            CHECK(detail::contains(line, "/tmp/A.class --hideutf true --comments false"));
        }
    }

    TEST_CASE("002: options are rendered after the fixed flags in key order", "[002][command]") {
        auto args = parse_decompile_args(
                R"({"file_path":"/tmp/A.class","options":{"sugarboxing":false,"renamedupmembers":true,"jarfilter":"com.example","recover":3}})"sv);
        auto cmd = build_command(args, direct_cfg());

        command_spec expected{
                "/opt/tools/cfr",
                "/tmp/A.class",
                "--comments",
                "false",
                "--showversion",
                "false",
                "--jarfilter",
                "com.example",
                "--recover",
                "3",
                "--renamedupmembers",
                "true",
                "--sugarboxing",
                "false"};
        CHECK(cmd == expected);
    }

    TEST_CASE("002: option keys outside [A-Za-z0-9] are dropped", "[002][command]") {
        CHECK(is_allowed_option_key("sugarboxing"sv));
        CHECK(is_allowed_option_key("Java9"sv));
        CHECK_FALSE(is_allowed_option_key(""sv));
        CHECK_FALSE(is_allowed_option_key("a b"sv));
        CHECK_FALSE(is_allowed_option_key("outputdir;rm"sv));
        CHECK_FALSE(is_allowed_option_key("-x"sv));
        CHECK_FALSE(is_allowed_option_key("über"sv));

        auto args = parse_decompile_args(
                R"({"file_path":"/tmp/A.class","options":{"x; rm -rf /":"1","--outputdir":"/etc","decodelambdas":false}})"sv);
        auto cmd = build_command(args, direct_cfg());

        CHECK(cmd.size() == 8U);
        CHECK(cmd[6] == "--decodelambdas");
        CHECK(cmd[7] == "false");
        CHECK_FALSE(detail::contains(command_line(cmd), "outputdir"));
        CHECK_FALSE(detail::contains(command_line(cmd), "rm"));
    }

    TEST_CASE("002: injected flag separators in a key are dropped with the whole entry", "[002][command]") {
        auto args = parse_decompile_args(
                R"({"file_path":"/tmp/A.class","method_name":"run","options":{"ignoreexceptions;rm -rf":true}})"sv);
        auto cmd = build_command(args, direct_cfg());

        command_spec expected{
                "/opt/tools/cfr", "/tmp/A.class", "--methodname", "run", "--comments", "false", "--showversion", "false"};
        CHECK(cmd == expected);
    }

    TEST_CASE("002: option value rendering", "[002][command]") {
        CHECK(render_option_value(json_value("true"sv)) == "true");
        CHECK(render_option_value(json_value("false"sv)) == "false");
        CHECK(render_option_value(json_value(R"("com.example")"sv)) == "com.example");
        CHECK(render_option_value(json_value("3.0"sv)) == "3");
        CHECK(render_option_value(json_value("0.5"sv)) == "0.5");
        CHECK(render_option_value(json_value("[1,2]"sv)) == "[1,2]");
        CHECK(render_option_value(json_value("-12"sv)) == "-12");
    }

    TEST_CASE("002: integer options beyond double precision keep their digits", "[002][command]") {
        auto args = parse_decompile_args(
                R"({"file_path":"/tmp/A.class","options":{"aggressivesizethreshold":9007199254740993}})"sv);
        auto cmd = build_command(args, direct_cfg());

        REQUIRE(cmd.size() == 8U);
        CHECK(cmd[6] == "--aggressivesizethreshold");
        CHECK(cmd[7] == "9007199254740993");
    }

    TEST_CASE("002: malformed arguments are rejected with a code", "[002][command]") {
        CHECK(error_code_of("{}"sv) == argument_error_code::missing_argument);
        CHECK(error_code_of(R"({"file_path":""})"sv) == argument_error_code::missing_argument);
        CHECK(error_code_of("null"sv) == argument_error_code::missing_argument);
        CHECK(error_code_of(R"({"file_path":42})"sv) == argument_error_code::invalid_arguments);
        CHECK(error_code_of(R"({"file_path":"/tmp/A.class","hide_utf":"yes"})"sv) ==
              argument_error_code::invalid_arguments);

        auto tolerant = parse_decompile_args(R"({"file_path":"/tmp/A.class","unexpected":1})"sv);
        REQUIRE(tolerant.file_path);
        CHECK(*tolerant.file_path == "/tmp/A.class");
    }

    TEST_CASE("002: relative targets are resolved to absolute paths", "[002][command]") {
        auto resolved = resolve_target("some/dir/../Foo.class"sv);
        CHECK(resolved.is_absolute());
        CHECK(resolved.filename() == "Foo.class");
        CHECK_FALSE(detail::contains(resolved.string(), ".."));

        CHECK(resolve_target("/tmp/A.class"sv) == std::filesystem::path{"/tmp/A.class"});
    }

}  // namespace decaf::test
