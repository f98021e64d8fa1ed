#pragma once

#include "decaf/config.hpp"
#include "decaf/registry.hpp"
#include "decaf/session.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/thread_pool.hpp>

#include <functional>
#include <memory>

namespace decaf::internal {

    // Newline-delimited JSON-RPC on stdin/stdout, served as a single session.
    class stdio_transport {
      public:
        // `on_closed` runs once stdin has hit EOF and every pending response has been written.
        stdio_transport(
                boost::asio::io_context& io,
                const server_config& cfg,
                const tool_registry& registry,
                boost::asio::thread_pool& pool,
                std::function<void()> on_closed);

        ~stdio_transport();

        stdio_transport(const stdio_transport&) = delete;
        stdio_transport& operator=(const stdio_transport&) = delete;

        void start();
        void stop();

      private:
        boost::asio::awaitable<void> read_loop();
        boost::asio::awaitable<void> write_loop();

        boost::asio::io_context& io_;
        // file status flags of fd 0/1 to restore, -1 when the transport has its own open file description
        int stdin_flags_{-1};
        int stdout_flags_{-1};
        boost::asio::posix::stream_descriptor in_;
        boost::asio::posix::stream_descriptor out_;
        std::shared_ptr<session> session_;
        std::function<void()> on_closed_;
    };

}  // namespace decaf::internal
