#pragma once

#include "config.hpp"
#include "registry.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace decaf {

    enum class session_state : uint8_t { connecting, open, closed };

    inline constexpr std::string_view to_string(session_state state) {
        switch (state) {
            case session_state::connecting:
                return "connecting"sv;
            case session_state::open:
                return "open"sv;
            case session_state::closed:
                return "closed"sv;
        }
        return "closed"sv;
    }

    struct outbound_event {
        enum class kind : uint8_t { message, idle, closed };

        kind type{kind::closed};
        std::string text{};
    };

    /*
     * One client's logical channel. Inbound JSON-RPC messages are dispatched independently, so a
     * slow tools/call never holds up another request; each response carries its request's id and
     * is queued for the transport's writer in completion order. Decompiler runs are handed to the
     * worker pool, the session itself only ever runs on the I/O executor.
     *
     * Not thread-safe: every member must be called from the I/O executor.
     */
    class session : public std::enable_shared_from_this<session> {
      public:
        session(std::string id,
                const server_config& cfg,
                const tool_registry& registry,
                boost::asio::thread_pool& pool,
                boost::asio::any_io_executor io);

        session(const session&) = delete;
        session& operator=(const session&) = delete;

        const std::string& id() const noexcept { return id_; }
        session_state state() const noexcept { return state_; }
        size_t in_flight() const noexcept { return in_flight_; }

        // connecting -> open; a closed session never reopens
        void open();
        void close();

        // Closes once every in-flight request has been answered and its response drained.
        void close_when_idle();

        // Handles one inbound message. Returns the serialized response, or nothing for notifications.
        boost::asio::awaitable<std::optional<std::string>> handle_message(std::string message);

        // Dispatches a message in the background and queues its response. False unless open.
        bool submit(std::string message);

        // Next message for the downstream channel; `idle` after `idle_timeout` with nothing queued,
        // `closed` once the session is closed and the queue drained.
        boost::asio::awaitable<outbound_event> next_outbound(std::chrono::milliseconds idle_timeout);

      private:
        void enqueue(std::string message);
        void wake_writer();
        bool drained() const noexcept;

        std::string id_;
        const server_config& cfg_;
        const tool_registry& registry_;
        boost::asio::thread_pool& pool_;
        boost::asio::any_io_executor io_;

        session_state state_{session_state::connecting};
        bool closing_{false};
        size_t in_flight_{0U};
        std::deque<std::string> outbox_{};
        boost::asio::steady_timer wakeup_;
    };

}  // namespace decaf
