#include "decaf/session.hpp"

#include "decaf/command.hpp"
#include "decaf/executor.hpp"
#include "decaf/format.hpp"

#include "internal/protocol.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>
#include <variant>

using namespace decaf::literals;
namespace asio = boost::asio;
namespace fs = std::filesystem;

namespace decaf {

    namespace detail {

        namespace proto = internal::protocol;

        static constexpr auto json_opts = glz::opts{.error_on_unknown_keys = false};

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(const glz::rpc::id_t& id, glz::raw_json_view raw_params) {
            proto::initialize_params params{};
            if (auto ec = glz::read<json_opts>(params, raw_params.str)) {
                log_debug("initialize params not understood, continuing with defaults");
            }
            else if (!params.clientInfo.name.empty()) {
                log_info("Client: ", params.clientInfo.name, " ", params.clientInfo.version);
            }

            proto::initialize_result result{};
            result.protocolVersion = std::string{proto::protocol_version};
            result.serverInfo =
                    proto::server_info{.name = std::string{proto::server_name}, .version = std::string{proto::server_version}};

            return proto::make_response(id, std::move(result));
        }

        static std::string handle_tools_list(const glz::rpc::id_t& id, const tool_registry& registry) {
            proto::tools_list_result result{};
            for (const auto& tool : registry.list_tools()) {
                result.tools.push_back(
                        proto::tool_definition{
                                .name = tool.name,
                                .description = tool.description,
                                .inputSchema = glz::raw_json{tool.input_schema},
                        });
            }
            return proto::make_response(id, std::move(result));
        }

        // Pre-checks and runs the decompiler. Missing files come back as text, not as faults.
        static asio::awaitable<std::string> run_decompile(
                const decompile_args& args, const server_config& cfg, asio::thread_pool& pool) {
            auto target = resolve_target(require_file_path(args));

            std::error_code ec{};
            if (!fs::exists(target, ec)) {
                co_return "Error: File not found: {}"_format(target.string());
            }
            if (!fs::exists(cfg.cfr_path, ec)) {
                co_return "Error: CFR jar not found at: {}"_format(cfg.cfr_path.string());
            }

            auto cmd = build_command(args, cfg);
            log_debug("Exec: ", command_line(cmd));

            auto result = co_await execute_async(pool, std::move(cmd), std::chrono::milliseconds{cfg.exec_timeout_ms});
            if (result.status != exec_status::success) {
                log_warn("Decompilation of ", target.string(), " ended with status ", to_string(result.status));
            }
            co_return std::move(result.text);
        }

        static asio::awaitable<std::string> handle_tools_call(
                const glz::rpc::id_t& id,
                glz::raw_json_view raw_params,
                const server_config& cfg,
                const tool_registry& registry,
                asio::thread_pool& pool) {
            proto::tool_call_params params{};
            if (auto ec = glz::read<json_opts>(params, raw_params.str)) {
                co_return proto::make_error_response(
                        id,
                        glz::rpc::error_e::invalid_params,
                        "Failed to parse tool call params",
                        std::string{to_string(argument_error_code::invalid_arguments)});
            }

            log_info("call_tool: ", params.name, ", args: ", params.arguments.str);

            try {
                if (registry.find(params.name) == nullptr) {
                    throw argument_error{argument_error_code::unknown_tool, "Unknown tool: {}"_format(params.name)};
                }

                auto args = parse_decompile_args(params.arguments.str);
                auto text = co_await run_decompile(args, cfg, pool);
                log_debug("Returning result: ", text.size(), " bytes");
                co_return proto::make_text_response(id, std::move(text));
            } catch (const argument_error& e) {
                log_warn("Rejected tool call: ", e.what());
                co_return proto::make_error_response(
                        id, glz::rpc::error_e::invalid_params, e.what(), std::string{to_string(e.code())});
            }
        }

        static asio::awaitable<std::optional<std::string>> dispatch(
                glz::rpc::generic_request_t& request,
                const server_config& cfg,
                const tool_registry& registry,
                asio::thread_pool& pool) {
            auto method = std::string_view{request.method};

            if (std::holds_alternative<glz::generic::null_t>(request.id)) {
                // notifications (including notifications/initialized) never get a response
                log_debug("notification: ", method);
                co_return std::nullopt;
            }

            if (method == "initialize"sv) {
                co_return handle_initialize(request.id, request.params);
            }
            if (method == "ping"sv) {
                co_return proto::make_response(request.id, proto::empty_object{});
            }
            if (method == "tools/list"sv) {
                co_return handle_tools_list(request.id, registry);
            }
            if (method == "tools/call"sv) {
                co_return co_await handle_tools_call(request.id, request.params, cfg, registry, pool);
            }

            co_return proto::make_error_response(
                    request.id, glz::rpc::error_e::method_not_found, "Unknown method: {}"_format(method));
        }

    }  // namespace detail

    session::session(
            std::string id,
            const server_config& cfg,
            const tool_registry& registry,
            asio::thread_pool& pool,
            asio::any_io_executor io)
            : id_{std::move(id)}, cfg_{cfg}, registry_{registry}, pool_{pool}, io_{io}, wakeup_{io} {}

    void session::open() {
        if (state_ != session_state::connecting) {
            return;
        }
        state_ = session_state::open;
        log_info("Session opened: ", id_);
    }

    void session::close() {
        if (state_ == session_state::closed) {
            return;
        }
        state_ = session_state::closed;
        if (!outbox_.empty()) {
            log_warn("Session ", id_, " closed with ", outbox_.size(), " undelivered message(s)");
        }
        outbox_.clear();
        wake_writer();
        log_info("Session closed: ", id_);
    }

    void session::close_when_idle() {
        closing_ = true;
        wake_writer();
    }

    asio::awaitable<std::optional<std::string>> session::handle_message(std::string message) {
        if (state_ == session_state::closed) {
            co_return std::nullopt;
        }

        glz::rpc::generic_request_t request{};
        if (auto ec = glz::read_json(request, message)) {
            log_warn("Session ", id_, ": JSON parse error");
            co_return detail::proto::make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error");
        }

        try {
            co_return co_await detail::dispatch(request, cfg_, registry_, pool_);
        } catch (const std::exception& e) {
            log_error("Session ", id_, ": failed to handle ", std::string_view{request.method}, ": ", e.what());
            co_return detail::proto::make_error_response(
                    request.id, glz::rpc::error_e::internal, "Internal error: {}"_format(e.what()));
        }
    }

    bool session::submit(std::string message) {
        if (state_ != session_state::open || closing_) {
            return false;
        }

        ++in_flight_;
        asio::co_spawn(
                io_,
                [self = shared_from_this(), message = std::move(message)]() mutable -> asio::awaitable<void> {
                    auto response = co_await self->handle_message(std::move(message));
                    --self->in_flight_;
                    if (response) {
                        self->enqueue(std::move(*response));
                    }
                    else {
                        self->wake_writer();
                    }
                },
                asio::detached);
        return true;
    }

    asio::awaitable<outbound_event> session::next_outbound(std::chrono::milliseconds idle_timeout) {
        for (;;) {
            if (!outbox_.empty()) {
                auto text = std::move(outbox_.front());
                outbox_.pop_front();
                co_return outbound_event{.type = outbound_event::kind::message, .text = std::move(text)};
            }
            if (state_ == session_state::closed) {
                co_return outbound_event{.type = outbound_event::kind::closed};
            }
            if (closing_ && drained()) {
                close();
                co_return outbound_event{.type = outbound_event::kind::closed};
            }

            wakeup_.expires_after(idle_timeout);
            boost::system::error_code ec{};
            co_await wakeup_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            if (!ec && outbox_.empty() && state_ == session_state::open && !closing_) {
                co_return outbound_event{.type = outbound_event::kind::idle};
            }
        }
    }

    void session::enqueue(std::string message) {
        if (state_ == session_state::closed) {
            log_warn("Session ", id_, " is closed, dropping response");
            return;
        }
        outbox_.push_back(std::move(message));
        wake_writer();
    }

    void session::wake_writer() {
        wakeup_.cancel();
    }

    bool session::drained() const noexcept {
        return outbox_.empty() && in_flight_ == 0U;
    }

}  // namespace decaf
