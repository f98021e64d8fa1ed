#include "cli.hpp"

#include "decaf/server.hpp"

#include <CLI/CLI.hpp>

#include <csignal>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace decaf::cli {

    namespace detail {

        static void print_config(const server_config& cfg, std::ostream& os) {
            os << "mode=" << to_string(cfg.mode) << '\n';
            os << "host=" << cfg.host << '\n';
            os << "port=" << cfg.port << '\n';
            os << "cfr=" << cfg.cfr_path.string() << '\n';
            os << "java=" << cfg.java_path.string() << '\n';
            os << "timeout_ms=" << cfg.exec_timeout_ms << '\n';
            os << "workers=" << cfg.workers << '\n';
            os << "log_level=" << to_string(cfg.log) << '\n';
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, server_config& cfg) {
        CLI::App app{"decaf - CFR Java decompiler MCP server"};
        bool show_version = false;
        std::string mode_arg{std::string{to_string(cfg.mode)}};
        std::string log_arg{std::string{to_string(cfg.log)}};
        std::string cfr_arg{cfg.cfr_path.string()};
        std::string java_arg{cfg.java_path.string()};
        int port_arg{cfg.port};
        int timeout_arg{cfg.exec_timeout_ms / 1000};
        unsigned workers_arg{cfg.workers};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("-m,--mode", mode_arg, "Transport: stdio|sse|both");
        app.add_option("--host", cfg.host, "Bind address for the SSE transport");
        app.add_option("-p,--port", port_arg, "Bind port for the SSE transport");
        app.add_option("--cfr", cfr_arg, "CFR jar (or executable) path");
        app.add_option("--java", java_arg, "java executable used to launch a CFR jar");
        app.add_option("--timeout", timeout_arg, "Decompilation timeout in seconds");
        app.add_option("--workers", workers_arg, "Concurrent decompiler processes");
        app.add_option("--log-level", log_arg, "Log level: debug|info|warn|error");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Only log errors");
        app.add_flag("--verbose", cfg.verbose, "Log decompiler command lines and protocol traffic");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (!try_parse_transport_mode(mode_arg, cfg.mode)) {
            std::cerr << "invalid --mode value: " << mode_arg << " (expected stdio|sse|both)\n";
            return std::optional<int>{2};
        }
        if (!try_parse_log_level(log_arg, cfg.log)) {
            std::cerr << "invalid --log-level value: " << log_arg << " (expected debug|info|warn|error)\n";
            return std::optional<int>{2};
        }
        if (port_arg < 0 || port_arg > std::numeric_limits<uint16_t>::max()) {
            std::cerr << "invalid --port value: " << port_arg << " (expected 0-65535)\n";
            return std::optional<int>{2};
        }
        if (timeout_arg <= 0 || timeout_arg > std::numeric_limits<int>::max() / 1000) {
            std::cerr << "invalid --timeout value: " << timeout_arg << " (expected a positive number of seconds)\n";
            return std::optional<int>{2};
        }
        if (workers_arg == 0U) {
            std::cerr << "invalid --workers value: 0 (expected at least 1)\n";
            return std::optional<int>{2};
        }
        if (cfr_arg.empty()) {
            std::cerr << "--cfr must not be empty\n";
            return std::optional<int>{2};
        }

        cfg.port = static_cast<uint16_t>(port_arg);
        cfg.exec_timeout_ms = timeout_arg * 1000;
        cfg.workers = workers_arg;
        cfg.cfr_path = cfr_arg;
        cfg.java_path = java_arg.empty() ? std::string{"java"} : java_arg;
        if (cfg.quiet) {
            cfg.log = log_level::error;
        }
        else if (cfg.verbose) {
            cfg.log = log_level::debug;
        }

        if (show_version) {
            std::cout << "decaf " << DECAF_VERSION << '\n';
            return std::optional<int>{0};
        }
        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }
        return std::nullopt;
    }

    int run_server(const server_config& cfg) {
        set_log_level(cfg.log);

        // peer disconnects surface as EPIPE write errors
        std::signal(SIGPIPE, SIG_IGN);

        server srv{cfg};
        srv.run();
        return 0;
    }

}  // namespace decaf::cli
