#include "decaf/executor.hpp"

#include "decaf/format.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <exception>
#include <thread>
#include <vector>

using namespace decaf::literals;
namespace asio = boost::asio;

namespace decaf {

    namespace detail {

        struct pipe_pair {
            int read_fd{-1};
            int write_fd{-1};
        };

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        static void close_pipe(pipe_pair& p) {
            close_fd(p.read_fd);
            close_fd(p.write_fd);
        }

        // both ends close-on-exec
        static bool make_pipe(pipe_pair& out) {
            int fds[2]{};
#if defined(__linux__)
            if (::pipe2(fds, O_CLOEXEC) != 0) {
                return false;
            }
#else
            if (::pipe(fds) != 0) {
                return false;
            }
            ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
            ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
            out.read_fd = fds[0];
            out.write_fd = fds[1];
            return true;
        }

        static std::string errno_description(int err) {
            return std::error_code{err, std::generic_category()}.message();
        }

        static exec_result spawn_failure(std::string description) {
            exec_result result{};
            result.status = exec_status::execution_error;
            result.exit_code = -1;
            result.text = spawn_error_message(description);
            log_error("Decompiler execution error: ", description);
            return result;
        }

        // reads the exec-status pipe: EOF means execvp succeeded, otherwise the child sent errno
        static int read_exec_errno(int fd) {
            int child_errno = 0;
            for (;;) {
                auto n = ::read(fd, &child_errno, sizeof(child_errno));
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n == static_cast<ssize_t>(sizeof(child_errno))) {
                    return child_errno;
                }
                return 0;
            }
        }

        static void kill_group(pid_t pid) {
            if (::kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
                // group kill failed; fall back to the direct child so at least it is reaped
                if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
                    log_error(
                            "Failed to kill decompiler process ",
                            pid,
                            " after timeout: ",
                            errno_description(errno),
                            "; it may be left running");
                }
            }
        }

        static bool wait_blocking(pid_t pid, int& status) {
            for (;;) {
                if (::waitpid(pid, &status, 0) == pid) {
                    return true;
                }
                if (errno != EINTR) {
                    log_error("Failed to reap decompiler process ", pid, ": ", errno_description(errno));
                    return false;
                }
            }
        }

        // Waits for `pid` until `deadline`. Returns false if the deadline passed first.
        static bool wait_until(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline) {
            for (;;) {
                auto ret = ::waitpid(pid, &status, WNOHANG);
                if (ret == pid) {
                    return true;
                }
                if (ret < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    log_error("Failed to wait for decompiler process ", pid, ": ", errno_description(errno));
                    return true;
                }
                if (std::chrono::steady_clock::now() >= deadline) {
                    return false;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{5});
            }
        }

        static exec_result run_subprocess(const command_spec& cmd, std::chrono::milliseconds timeout) {
            if (cmd.empty() || cmd.front().empty()) {
                return spawn_failure("empty command");
            }

            // argv is built before fork; the child only makes async-signal-safe calls
            std::vector<char*> argv{};
            argv.reserve(cmd.size() + 1);
            for (const auto& arg : cmd) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            pipe_pair out_pipe{};
            pipe_pair err_pipe{};
            pipe_pair exec_pipe{};
            if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(exec_pipe)) {
                auto description = "pipe() failed: {}"_format(errno_description(errno));
                close_pipe(out_pipe);
                close_pipe(err_pipe);
                close_pipe(exec_pipe);
                return spawn_failure(std::move(description));
            }

            auto deadline = std::chrono::steady_clock::now() + timeout;

            auto pid = ::fork();
            if (pid < 0) {
                auto description = "fork() failed: {}"_format(errno_description(errno));
                close_pipe(out_pipe);
                close_pipe(err_pipe);
                close_pipe(exec_pipe);
                return spawn_failure(std::move(description));
            }

            if (pid == 0) {
                ::setpgid(0, 0);
                int null_fd = ::open("/dev/null", O_RDONLY);
                if (null_fd >= 0) {
                    ::dup2(null_fd, STDIN_FILENO);
                    ::close(null_fd);
                }
                ::dup2(out_pipe.write_fd, STDOUT_FILENO);
                ::dup2(err_pipe.write_fd, STDERR_FILENO);
                ::execvp(argv[0], argv.data());

                int err = errno;
                auto ignored = ::write(exec_pipe.write_fd, &err, sizeof(err));
                (void)ignored;
                _exit(127);
            }

            // parent; also set the group here so a kill before the child's setpgid still lands
            ::setpgid(pid, pid);
            close_fd(out_pipe.write_fd);
            close_fd(err_pipe.write_fd);
            close_fd(exec_pipe.write_fd);

            if (auto child_errno = read_exec_errno(exec_pipe.read_fd); child_errno != 0) {
                close_pipe(exec_pipe);
                close_pipe(out_pipe);
                close_pipe(err_pipe);
                int status = 0;
                wait_blocking(pid, status);
                return spawn_failure("{}: {}"_format(cmd.front(), errno_description(child_errno)));
            }
            close_pipe(exec_pipe);

            std::string out_buf{};
            std::string err_buf{};
            bool timed_out = false;
            int fds_open = 2;

            pollfd fds[2]{};
            fds[0] = {.fd = out_pipe.read_fd, .events = POLLIN, .revents = 0};
            fds[1] = {.fd = err_pipe.read_fd, .events = POLLIN, .revents = 0};

            while (fds_open > 0) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                         deadline - std::chrono::steady_clock::now())
                                         .count();
                if (remaining <= 0) {
                    timed_out = true;
                    break;
                }

                int ret = ::poll(fds, 2, static_cast<int>(remaining));
                if (ret < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    log_error("poll() failed while reading decompiler output: ", errno_description(errno));
                    break;
                }
                if (ret == 0) {
                    timed_out = true;
                    break;
                }

                char chunk[4096]{};
                for (int i = 0; i < 2; ++i) {
                    if (fds[i].fd < 0) {
                        continue;
                    }
                    if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                        auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                        if (n > 0) {
                            (i == 0 ? out_buf : err_buf).append(chunk, static_cast<size_t>(n));
                        }
                        else if (n < 0 && errno == EINTR) {
                            continue;
                        }
                        else {
                            ::close(fds[i].fd);
                            fds[i].fd = -1;
                            --fds_open;
                        }
                    }
                }
            }

            int status = 0;
            if (!timed_out && !wait_until(pid, status, deadline)) {
                // closed its output but kept running past the deadline
                timed_out = true;
            }

            if (timed_out) {
                kill_group(pid);
                wait_blocking(pid, status);
            }

            for (auto& pfd : fds) {
                close_fd(pfd.fd);
            }

            if (timed_out) {
                log_error("Decompiler timed out after ", timeout.count(), "ms: ", cmd.front());
                exec_result result{};
                result.status = exec_status::timeout;
                result.exit_code = -1;
                result.stdout_output = std::move(out_buf);
                result.stderr_output = std::move(err_buf);
                result.text = std::string{timeout_message};
                return result;
            }

            exec_result result{};
            result.status = exec_status::success;
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            }
            else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
            result.text = merge_output(out_buf, err_buf);
            result.stdout_output = std::move(out_buf);
            result.stderr_output = std::move(err_buf);
            log_debug("Decompiler finished, exit code ", result.exit_code, ", output: ", result.text.size(), " bytes");
            return result;
        }

    }  // namespace detail

    std::string merge_output(std::string_view stdout_text, std::string_view stderr_text) {
        std::string output{stdout_text};
        if (!utils::is_blank(stderr_text)) {
            output += "\n\n/*\n{}\n{}\n*/"_format(stderr_marker, stderr_text);
        }
        return output;
    }

    std::string spawn_error_message(std::string_view description) {
        return "/* Error executing CFR: {} */"_format(description);
    }

    exec_result execute(const command_spec& cmd, std::chrono::milliseconds timeout) noexcept {
        try {
            return detail::run_subprocess(cmd, timeout);
        } catch (const std::exception& e) {
            return detail::spawn_failure(e.what());
        }
    }

    asio::awaitable<exec_result> execute_async(
            asio::thread_pool& pool, command_spec cmd, std::chrono::milliseconds timeout) {
        co_return co_await asio::co_spawn(
                pool.get_executor(),
                [cmd = std::move(cmd), timeout]() -> asio::awaitable<exec_result> {
                    co_return execute(cmd, timeout);
                },
                asio::use_awaitable);
    }

}  // namespace decaf
