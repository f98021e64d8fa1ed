#pragma once

#include "command.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace decaf {

    enum class exec_status : uint8_t { success, timeout, execution_error };

    inline constexpr std::string_view to_string(exec_status status) {
        switch (status) {
            case exec_status::success:
                return "success"sv;
            case exec_status::timeout:
                return "timeout"sv;
            case exec_status::execution_error:
                return "execution_error"sv;
        }
        return "execution_error"sv;
    }

    inline constexpr auto timeout_message = "/* Error: Decompilation timed out. */"sv;
    inline constexpr auto stderr_marker = "[CFR STDERR]"sv;

    struct exec_result {
        exec_status status{exec_status::success};
        int exit_code{};
        std::string stdout_output{};
        std::string stderr_output{};

        // single text blob handed back to the client
        std::string text{};
    };

    // stdout followed by a comment block holding stderr, if stderr has any non-whitespace content
    std::string merge_output(std::string_view stdout_text, std::string_view stderr_text);

    std::string spawn_error_message(std::string_view description);

    /*
     * Runs `cmd` as a child process (argv passed directly, no shell) and blocks until it exits or
     * `timeout` elapses. The child gets its own process group and /dev/null as stdin; on timeout
     * the whole group is killed and reaped. Never throws: every failure is reported through the
     * result's status and text.
     */
    exec_result execute(const command_spec& cmd, std::chrono::milliseconds timeout) noexcept;

    // Runs execute() on `pool` and resumes the awaiting coroutine on its own executor.
    boost::asio::awaitable<exec_result> execute_async(
            boost::asio::thread_pool& pool, command_spec cmd, std::chrono::milliseconds timeout);

}  // namespace decaf
