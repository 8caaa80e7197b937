#pragma once
#include <atomic>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>

#include "httplib.h"

#include "cors_config.h"

namespace corsserve {

    // The listening socket could not be bound (typically: port already in use).
    class BindError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /*
    CorsServer
    ==========

    Static file server for one root directory. Every response, error pages and
    preflights included, carries the fixed CORS header set.

    Lifecycle:
      CorsServer s(cfg);   // resolves root, installs handlers (ConfigError)
      s.bind();            // BindError if the port is taken
      s.serve();           // blocks until stop()
      s.stop();            // from any thread, idempotent

    stop() may come before serve() has reached the accept loop: serve() then
    returns at once. A listener that was bound but never served is closed by
    stop(), which the destructor calls.

    The root is resolved once in the constructor and passed to the file handler
    explicitly; the process working directory is never touched, so several
    instances can coexist in one process.
    */
    class CorsServer {
    public:
        explicit CorsServer(ServerConfig cfg);
        ~CorsServer();

        CorsServer(const CorsServer&) = delete;
        CorsServer& operator=(const CorsServer&) = delete;

        void bind();

        // Returns false if the accept loop could not run.
        // Throws std::logic_error before bind() or on a second call.
        bool serve();

        void stop();

        // Blocks until serve() is accepting (or the server was stopped).
        void wait_until_ready() const;

        bool is_running() const;

        // Bound port (the ephemeral one when configured with 0), -1 before bind().
        int port() const { return bound_port_; }

        const std::filesystem::path& root() const { return root_; }
        const ServerConfig& config() const { return cfg_; }

    private:
        void install_handlers();

        // Runs the accept loop only long enough to close the bound socket
        // (httplib has no other way to drop a bound, unserved listener).
        void release_listener();

        ServerConfig cfg_;
        std::filesystem::path root_;
        httplib::Server srv_;
        int bound_port_ = -1;

        std::mutex state_mu_;
        bool stop_requested_ = false;
        bool serving_ = false;          // serve() owns the listener
        bool released_ = false;         // stop() closed the unserved listener
        std::atomic<bool> serve_returned_{false};
    };

} // namespace corsserve
