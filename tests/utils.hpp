#pragma once

#include "decaf/decaf.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace decaf::test::detail {
    namespace fs = std::filesystem;
    namespace asio = boost::asio;

    // Redirects std::cerr, where the loggers write, for the lifetime of the object.
    struct captured_stderr {
        std::ostringstream sink{};
        std::streambuf* previous{nullptr};

        captured_stderr() : previous{std::cerr.rdbuf(sink.rdbuf())} {}
        ~captured_stderr() { std::cerr.rdbuf(previous); }

        captured_stderr(const captured_stderr&) = delete;
        captured_stderr& operator=(const captured_stderr&) = delete;

        std::string text() const { return sink.str(); }
    };

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
    }

    inline std::string read_file(const fs::path& p) {
        std::ifstream in{p};
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    // Writes a /bin/sh script and marks it executable; stands in for the decompiler.
    inline fs::path write_script(const fs::path& p, std::string_view body) {
        write_file(p, "#!/bin/sh\n" + std::string{body} + "\n");
        fs::permissions(
                p,
                fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read |
                        fs::perms::others_exec);
        return p;
    }

    // Decompiler stand-in that echoes its argv, one argument per line after an ARGS header.
    inline fs::path write_echo_decompiler(const fs::path& dir) {
        return write_script(dir / "fake-cfr", "echo ARGS\nfor a in \"$@\"; do echo \"$a\"; done");
    }

    // False once `pid` has exited, including while it lingers as a zombie.
    inline bool process_running(pid_t pid) {
        std::ifstream stat{"/proc/" + std::to_string(pid) + "/stat"};
        if (!stat.good()) {
            return false;
        }
        std::string line{};
        std::getline(stat, line);
        auto close_paren = line.rfind(')');
        return close_paren == std::string::npos || close_paren + 2U >= line.size() || line[close_paren + 2U] != 'Z';
    }

    inline bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

    struct text_reply {
        struct content_item {
            std::string type{};
            std::string text{};
        };
        struct result_body {
            std::vector<content_item> content{};
        };
        result_body result{};
    };

    // Text of the first content item of a tools/call response.
    inline std::string tool_text(const std::string& response) {
        text_reply reply{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(reply, response);
        REQUIRE_FALSE(ec);
        REQUIRE(reply.result.content.size() == 1U);
        CHECK(reply.result.content.front().type == "text");
        return reply.result.content.front().text;
    }

    inline std::string call_request(int id, std::string_view arguments, std::string_view tool = "decompile") {
        return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) +
               R"(,"method":"tools/call","params":{"name":")" + std::string{tool} +
               R"(","arguments":)" + std::string{arguments} + "}}";
    }

    inline std::string quoted(const fs::path& p) {
        std::string out{"\""};
        for (char c : p.string()) {
            if (c == '"' || c == '\\') {
                out.push_back('\\');
            }
            out.push_back(c);
        }
        out.push_back('"');
        return out;
    }

    /*
     * Event loop on a background thread plus a small worker pool, so session coroutines can be
     * driven from a test body. Sessions must only be touched through `run`.
     */
    struct engine {
        asio::io_context io{1};
        asio::executor_work_guard<asio::io_context::executor_type> guard{io.get_executor()};
        asio::thread_pool pool{4};
        std::thread runner{};

        engine() : runner{[this] { io.run(); }} {}

        ~engine() {
            guard.reset();
            io.stop();
            runner.join();
            pool.stop();
            pool.join();
        }

        engine(const engine&) = delete;
        engine& operator=(const engine&) = delete;

        template <typename T>
        T run(asio::awaitable<T> work) {
            return asio::co_spawn(io, std::move(work), asio::use_future).get();
        }

        std::shared_ptr<session> open_session(const server_config& cfg, const tool_registry& registry) {
            auto sess = std::make_shared<session>("test-session", cfg, registry, pool, io.get_executor());
            run([](std::shared_ptr<session> s) -> asio::awaitable<bool> {
                s->open();
                co_return true;
            }(sess));
            return sess;
        }
    };

}  // namespace decaf::test::detail
