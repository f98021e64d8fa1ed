#include "decaf/server.hpp"

#include "decaf/registry.hpp"

#include "internal/sse.hpp"
#include "internal/stdio.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include <csignal>
#include <utility>

namespace asio = boost::asio;

namespace decaf {

    struct server::impl {
        server_config cfg;
        tool_registry registry{};
        asio::io_context io{1};
        asio::thread_pool pool;
        asio::signal_set signals{io};
        std::unique_ptr<internal::sse_transport> sse{};
        std::unique_ptr<internal::stdio_transport> stdio{};
        bool stopped{false};

        explicit impl(server_config c) : cfg{std::move(c)}, pool{cfg.workers == 0U ? 1U : cfg.workers} {
            if (serves_sse(cfg.mode)) {
                sse = std::make_unique<internal::sse_transport>(io, cfg, registry, pool);
            }
            if (serves_stdio(cfg.mode)) {
                stdio = std::make_unique<internal::stdio_transport>(io, cfg, registry, pool, [this] {
                    log_info("stdio transport finished, shutting down");
                    shutdown();
                });
            }
        }

        void shutdown() {
            if (stopped) {
                return;
            }
            stopped = true;

            boost::system::error_code ec{};
            signals.cancel(ec);
            if (sse) {
                sse->stop();
            }
            if (stdio) {
                stdio->stop();
            }
            io.stop();
        }
    };

    server::server(server_config cfg) : impl_{std::make_unique<impl>(std::move(cfg))} {}

    server::~server() = default;

    uint16_t server::port() const noexcept {
        return impl_->sse ? impl_->sse->port() : uint16_t{0};
    }

    void server::run() {
        auto& d = *impl_;

        d.signals.add(SIGINT);
        d.signals.add(SIGTERM);
        d.signals.async_wait([&d](const boost::system::error_code& ec, int signo) {
            if (ec) {
                return;
            }
            log_info("received signal ", signo, ", shutting down");
            d.shutdown();
        });

        log_info("CFR path: ", d.cfg.cfr_path.string());
        log_info("Transport mode: ", to_string(d.cfg.mode));

        if (d.sse) {
            d.sse->start();
        }
        if (d.stdio) {
            d.stdio->start();
        }

        d.io.run();

        // decompiler runs already executing finish, queued ones are discarded
        d.pool.stop();
        d.pool.join();
        log_info("server stopped");
    }

    void server::stop() {
        asio::post(impl_->io, [d = impl_.get()] { d->shutdown(); });
    }

}  // namespace decaf
