#include "internal/sse.hpp"

#include "decaf/format.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/http/chunk_encode.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

using namespace decaf::literals;
namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

namespace decaf::internal {

    namespace detail {

        static constexpr std::string_view to_std(beast::string_view sv) {
            return {sv.data(), sv.size()};
        }

        static int hex_value(char c) {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            return -1;
        }

        static std::string percent_decode(std::string_view text) {
            std::string out{};
            out.reserve(text.size());
            for (size_t i = 0; i < text.size(); ++i) {
                auto c = text[i];
                if (c == '+') {
                    out.push_back(' ');
                }
                else if (c == '%' && i + 2 < text.size() && hex_value(text[i + 1]) >= 0 &&
                         hex_value(text[i + 2]) >= 0) {
                    out.push_back(static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2])));
                    i += 2;
                }
                else {
                    out.push_back(c);
                }
            }
            return out;
        }

        static http::response<http::string_body> make_reply(
                const http::request<http::string_body>& req, http::status status, std::string_view body) {
            http::response<http::string_body> res{status, req.version()};
            res.set(http::field::server, "decaf/{}"_format(DECAF_VERSION));
            res.set(http::field::content_type, "text/plain; charset=utf-8");
            res.keep_alive(req.keep_alive());
            res.body() = std::string{body};
            res.prepare_payload();
            return res;
        }

        static asio::awaitable<bool> write_chunk(beast::tcp_stream& stream, std::string_view payload) {
            boost::system::error_code ec{};
            co_await asio::async_write(
                    stream,
                    http::make_chunk(asio::const_buffer{payload.data(), payload.size()}),
                    asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                log_debug("event stream write failed: ", ec.message());
                co_return false;
            }
            co_return true;
        }

        static std::string peer_name(const tcp::socket& socket) {
            boost::system::error_code ec{};
            auto ep = socket.remote_endpoint(ec);
            if (ec) {
                return "unknown";
            }
            return "{}:{}"_format(ep.address().to_string(), ep.port());
        }

    }  // namespace detail

    request_target split_target(std::string_view target) {
        auto q = target.find('?');
        if (q == std::string_view::npos) {
            return {.path = target, .query = {}};
        }
        return {.path = target.substr(0, q), .query = target.substr(q + 1U)};
    }

    std::optional<std::string> query_param(std::string_view query, std::string_view key) {
        while (!query.empty()) {
            auto amp = query.find('&');
            auto pair = query.substr(0, amp);
            query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1U);

            auto eq = pair.find('=');
            auto name = pair.substr(0, eq);
            if (detail::percent_decode(name) != key) {
                continue;
            }
            if (eq == std::string_view::npos) {
                return std::string{};
            }
            return detail::percent_decode(pair.substr(eq + 1U));
        }
        return std::nullopt;
    }

    bool is_session_id(std::string_view text) {
        return text.size() == 32U && std::ranges::all_of(text, [](char c) { return detail::hex_value(c) >= 0; });
    }

    sse_transport::sse_transport(
            asio::io_context& io, const server_config& cfg, const tool_registry& registry, asio::thread_pool& pool)
            : io_{io}, cfg_{cfg}, registry_{registry}, pool_{pool}, acceptor_{io} {
        try {
            tcp::resolver resolver{io_};
            auto results = resolver.resolve(cfg_.host, std::to_string(cfg_.port), tcp::resolver::passive);
            if (results.empty()) {
                throw std::runtime_error("no address for host: {}"_format(cfg_.host));
            }
            auto endpoint = results.begin()->endpoint();

            acceptor_.open(endpoint.protocol());
            acceptor_.set_option(asio::socket_base::reuse_address(true));
            acceptor_.bind(endpoint);
            acceptor_.listen(asio::socket_base::max_listen_connections);
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error("failed to listen on {}:{}: {}"_format(cfg_.host, cfg_.port, e.code().message()));
        }
    }

    uint16_t sse_transport::port() const {
        boost::system::error_code ec{};
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0U : ep.port();
    }

    void sse_transport::start() {
        log_info("SSE endpoint: http://{}:{}{}"_format(cfg_.host, port(), sse_stream_path));
        log_info("Messages endpoint: http://{}:{}{}"_format(cfg_.host, port(), sse_message_path));
        asio::co_spawn(io_, accept_loop(), asio::detached);
    }

    void sse_transport::stop() {
        boost::system::error_code ec{};
        acceptor_.close(ec);

        // closing wakes each stream's writer, which then unregisters the session
        std::vector<std::shared_ptr<session>> open_sessions{};
        for (auto& [id, sess] : sessions_) {
            open_sessions.push_back(sess);
        }
        for (auto& sess : open_sessions) {
            sess->close();
        }
    }

    asio::awaitable<void> sse_transport::accept_loop() {
        for (;;) {
            boost::system::error_code ec{};
            auto socket = co_await acceptor_.async_accept(asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    log_error("accept failed: ", ec.message());
                }
                if (!acceptor_.is_open()) {
                    co_return;
                }
                continue;
            }
            asio::co_spawn(io_, serve(std::move(socket)), asio::detached);
        }
    }

    asio::awaitable<void> sse_transport::serve(tcp::socket socket) {
        auto peer = detail::peer_name(socket);
        beast::tcp_stream stream{std::move(socket)};
        beast::flat_buffer buffer{};

        for (;;) {
            http::request_parser<http::string_body> parser{};
            parser.body_limit(max_message_bytes);

            boost::system::error_code ec{};
            stream.expires_after(request_read_timeout);
            co_await http::async_read(stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                if (ec != http::error::end_of_stream) {
                    log_debug("request from ", peer, " not read: ", ec.message());
                }
                break;
            }

            auto req = parser.release();
            auto target = split_target(detail::to_std(req.target()));
            log_debug(detail::to_std(req.method_string()), " ", detail::to_std(req.target()), " from ", peer);

            http::response<http::string_body> res{};
            if (target.path == sse_stream_path) {
                if (req.method() != http::verb::get) {
                    res = detail::make_reply(req, http::status::method_not_allowed, "Method Not Allowed");
                }
                else {
                    log_info("SSE connection opened from: ", peer);
                    co_await stream_events(stream, req.version());
                    log_info("SSE connection closed for: ", peer);
                    break;
                }
            }
            else if (target.path == sse_message_path || target.path == "/messages"sv) {
                if (req.method() != http::verb::post) {
                    res = detail::make_reply(req, http::status::method_not_allowed, "Method Not Allowed");
                }
                else {
                    res = handle_post(req, target.query);
                }
            }
            else {
                res = detail::make_reply(req, http::status::not_found, "Not Found");
            }

            bool keep_alive = res.keep_alive();
            co_await http::async_write(stream, res, asio::redirect_error(asio::use_awaitable, ec));
            if (ec || !keep_alive) {
                break;
            }
        }

        boost::system::error_code ignored{};
        stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
    }

    asio::awaitable<void> sse_transport::stream_events(beast::tcp_stream& stream, unsigned version) {
        auto sess = std::make_shared<session>(new_session_id(), cfg_, registry_, pool_, io_.get_executor());
        stream.expires_never();

        http::response<http::empty_body> res{http::status::ok, version};
        res.set(http::field::server, "decaf/{}"_format(DECAF_VERSION));
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-store");
        res.keep_alive(true);
        res.chunked(true);

        boost::system::error_code ec{};
        http::response_serializer<http::empty_body> sr{res};
        co_await http::async_write_header(stream, sr, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            log_debug("event stream header write failed: ", ec.message());
            co_return;
        }

        auto endpoint_event = "event: endpoint\r\ndata: {}?session_id={}\r\n\r\n"_format(sse_message_path, sess->id());
        if (!co_await detail::write_chunk(stream, endpoint_event)) {
            co_return;
        }

        sess->open();
        sessions_.emplace(sess->id(), sess);

        for (;;) {
            auto event = co_await sess->next_outbound(sse_ping_interval);
            if (event.type == outbound_event::kind::closed) {
                break;
            }

            auto frame = event.type == outbound_event::kind::idle
                               ? std::string{": ping\r\n\r\n"}
                               : "event: message\r\ndata: {}\r\n\r\n"_format(event.text);
            if (!co_await detail::write_chunk(stream, frame)) {
                break;
            }
        }

        sess->close();
        sessions_.erase(sess->id());

        co_await asio::async_write(stream, http::make_chunk_last(), asio::redirect_error(asio::use_awaitable, ec));
    }

    http::response<http::string_body> sse_transport::handle_post(
            const http::request<http::string_body>& req, std::string_view query) {
        auto session_id = query_param(query, "session_id"sv);
        if (!session_id) {
            return detail::make_reply(req, http::status::bad_request, "session_id is required");
        }
        if (!is_session_id(*session_id)) {
            return detail::make_reply(req, http::status::bad_request, "Invalid session ID");
        }

        auto it = sessions_.find(*session_id);
        if (it == sessions_.end()) {
            log_warn("Could not find session for ID: ", *session_id);
            return detail::make_reply(req, http::status::not_found, "Could not find session");
        }

        std::string body{req.body()};
        glz::rpc::generic_request_t probe{};
        if (auto ec = glz::read_json(probe, body)) {
            log_warn("Failed to parse message for session ", *session_id);
            return detail::make_reply(req, http::status::bad_request, "Could not parse message");
        }

        if (!it->second->submit(std::move(body))) {
            return detail::make_reply(req, http::status::not_found, "Could not find session");
        }
        return detail::make_reply(req, http::status::accepted, "Accepted");
    }

    std::string sse_transport::new_session_id() {
        auto text = boost::uuids::to_string(uuid_gen_());
        std::erase(text, '-');
        return text;
    }

}  // namespace decaf::internal
