#pragma once

#include "config.hpp"

#include <cstdint>
#include <memory>

namespace decaf {

    /*
     * Owns the event loop, the decompiler worker pool, and whichever transports `cfg.mode`
     * selects. The HTTP listener is bound by the constructor, so a bad host or a taken port
     * surfaces before `run()`.
     *
     * `run()` blocks until SIGINT/SIGTERM, `stop()`, or stdin EOF once every pending stdio
     * response has been written. Work already handed to the pool is allowed to finish.
     */
    class server {
      public:
        explicit server(server_config cfg);
        ~server();

        server(const server&) = delete;
        server& operator=(const server&) = delete;

        // Bound HTTP port, 0 when the SSE transport is not enabled.
        uint16_t port() const noexcept;

        void run();

        // Safe to call from any thread.
        void stop();

      private:
        struct impl;
        std::unique_ptr<impl> impl_;
    };

}  // namespace decaf
