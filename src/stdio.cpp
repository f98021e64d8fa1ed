#include "internal/stdio.hpp"

#include "decaf/format.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

using namespace decaf::literals;
namespace asio = boost::asio;

namespace decaf::internal {

    namespace detail {

        // responses are only ever pushed, so the writer just needs an occasional wakeup
        static constexpr std::chrono::milliseconds stdio_idle_interval{std::chrono::hours{1}};

        // Pipes and terminals are reopened through /proc for an open file description of their own, which
        // keeps the O_NONBLOCK asio sets off fd 0/1 and off a stderr sharing them. Anything else (sockets,
        // regular files keeping their offset) is duplicated and `shared_flags` records the flags to restore.
        static int reopen_fd(int fd, int access, std::string_view name, int& shared_flags) {
            struct stat st{};
            if (::fstat(fd, &st) == 0 && (S_ISFIFO(st.st_mode) || S_ISCHR(st.st_mode))) {
                auto proc_path = "/proc/self/fd/{}"_format(fd);
                if (int own = ::open(proc_path.c_str(), access | O_CLOEXEC); own >= 0) {
                    return own;
                }
            }

            log_debug("sharing the open file description of ", name);
            shared_flags = ::fcntl(fd, F_GETFL);
            int copy = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
            if (copy < 0) {
                throw std::runtime_error("failed to duplicate {}: {}"_format(
                        name, std::error_code{errno, std::generic_category()}.message()));
            }
            return copy;
        }

        static asio::posix::stream_descriptor open_descriptor(
                asio::io_context& io, int fd, int access, std::string_view name, int& shared_flags) {
            int own = reopen_fd(fd, access, name, shared_flags);
            asio::posix::stream_descriptor desc{io};
            boost::system::error_code ec{};
            desc.assign(own, ec);
            if (ec) {
                ::close(own);
                throw std::runtime_error("{} cannot be used for the stdio transport: {}"_format(name, ec.message()));
            }
            return desc;
        }

        static void restore_flags(int fd, int flags, std::string_view name) {
            if (flags < 0) {
                return;
            }
            if (::fcntl(fd, F_SETFL, flags) != 0) {
                log_warn("failed to restore flags of ", name, ": ",
                         std::error_code{errno, std::generic_category()}.message());
            }
        }

    }  // namespace detail

    stdio_transport::stdio_transport(
            asio::io_context& io,
            const server_config& cfg,
            const tool_registry& registry,
            asio::thread_pool& pool,
            std::function<void()> on_closed)
            : io_{io},
              in_{detail::open_descriptor(io, STDIN_FILENO, O_RDONLY, "stdin", stdin_flags_)},
              out_{detail::open_descriptor(io, STDOUT_FILENO, O_WRONLY, "stdout", stdout_flags_)},
              session_{std::make_shared<session>("stdio", cfg, registry, pool, io.get_executor())},
              on_closed_{std::move(on_closed)} {}

    stdio_transport::~stdio_transport() {
        boost::system::error_code ec{};
        in_.close(ec);
        out_.close(ec);
        detail::restore_flags(STDIN_FILENO, stdin_flags_, "stdin");
        detail::restore_flags(STDOUT_FILENO, stdout_flags_, "stdout");
    }

    void stdio_transport::start() {
        log_info("CFR MCP Server starting (stdio mode)");
        session_->open();
        asio::co_spawn(io_, read_loop(), asio::detached);
        asio::co_spawn(io_, write_loop(), asio::detached);
    }

    void stdio_transport::stop() {
        boost::system::error_code ec{};
        in_.cancel(ec);
        session_->close();
    }

    asio::awaitable<void> stdio_transport::read_loop() {
        std::string buffer{};
        for (;;) {
            boost::system::error_code ec{};
            auto n = co_await asio::async_read_until(
                    in_, asio::dynamic_buffer(buffer), '\n', asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                if (ec == asio::error::operation_aborted) {
                    co_return;
                }
                if (ec != asio::error::eof) {
                    log_warn("stdin read failed: ", ec.message());
                }
                // unterminated final line
                if (auto tail = utils::trim_view(buffer); !tail.empty() && !session_->submit(std::string{tail})) {
                    log_warn("stdio session closed, dropping final message");
                }
                break;
            }

            auto line = std::string{utils::trim_view(std::string_view{buffer}.substr(0, n))};
            buffer.erase(0, n);
            if (line.empty()) {
                continue;
            }
            if (!session_->submit(std::move(line))) {
                log_warn("stdio session closed, dropping message");
                break;
            }
        }

        log_info("stdin closed, finishing pending requests");
        session_->close_when_idle();
    }

    asio::awaitable<void> stdio_transport::write_loop() {
        for (;;) {
            auto event = co_await session_->next_outbound(detail::stdio_idle_interval);
            if (event.type == outbound_event::kind::closed) {
                break;
            }
            if (event.type == outbound_event::kind::idle) {
                continue;
            }

            event.text.push_back('\n');
            boost::system::error_code ec{};
            co_await asio::async_write(out_, asio::buffer(event.text), asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                log_error("stdout write failed: ", ec.message());
                session_->close();
                break;
            }
        }

        if (on_closed_) {
            on_closed_();
        }
    }

}  // namespace decaf::internal
