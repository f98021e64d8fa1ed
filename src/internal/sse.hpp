#pragma once

#include "decaf/config.hpp"
#include "decaf/registry.hpp"
#include "decaf/session.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/uuid/random_generator.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace decaf::internal {

    namespace http = boost::beast::http;

    inline constexpr std::string_view sse_stream_path{"/sse"};
    inline constexpr std::string_view sse_message_path{"/messages/"};
    inline constexpr std::size_t max_message_bytes{4U << 20U};
    inline constexpr std::chrono::milliseconds sse_ping_interval{15'000};
    inline constexpr std::chrono::seconds request_read_timeout{30};

    struct request_target {
        std::string_view path{};
        std::string_view query{};
    };

    request_target split_target(std::string_view target);

    // Value of `key` in an application/x-www-form-urlencoded query string, percent-decoded.
    std::optional<std::string> query_param(std::string_view query, std::string_view key);

    bool is_session_id(std::string_view text);

    /*
     * HTTP side of the server: GET /sse opens a session and streams its responses as server-sent
     * events, POST /messages/?session_id=<id> feeds one JSON-RPC message into that session. The
     * POST is acknowledged with 202 as soon as the message is queued; the JSON-RPC response
     * arrives on the event stream.
     */
    class sse_transport {
      public:
        // Resolves and binds cfg.host:cfg.port immediately; throws std::runtime_error on failure.
        sse_transport(
                boost::asio::io_context& io,
                const server_config& cfg,
                const tool_registry& registry,
                boost::asio::thread_pool& pool);

        sse_transport(const sse_transport&) = delete;
        sse_transport& operator=(const sse_transport&) = delete;

        uint16_t port() const;
        size_t session_count() const noexcept { return sessions_.size(); }

        void start();
        void stop();

      private:
        boost::asio::awaitable<void> accept_loop();
        boost::asio::awaitable<void> serve(boost::asio::ip::tcp::socket socket);
        boost::asio::awaitable<void> stream_events(boost::beast::tcp_stream& stream, unsigned version);
        http::response<http::string_body> handle_post(
                const http::request<http::string_body>& req, std::string_view query);
        std::string new_session_id();

        boost::asio::io_context& io_;
        const server_config& cfg_;
        const tool_registry& registry_;
        boost::asio::thread_pool& pool_;
        boost::asio::ip::tcp::acceptor acceptor_;
        boost::uuids::random_generator uuid_gen_{};
        std::unordered_map<std::string, std::shared_ptr<session>> sessions_{};
    };

}  // namespace decaf::internal
