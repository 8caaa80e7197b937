/*
cors_serve
==========

Serves a frontend's static files over http:// with permissive CORS headers so the
page can call a separate API backend (a file:// page cannot).

Defaults: 0.0.0.0:8000, root = directory holding this executable.
Optional overrides (all unset by default):
  CORSSERVE_LISTEN_PORT, CORSSERVE_BIND_HOST, CORSSERVE_ROOT,
  CORSSERVE_WORKERS, CORSSERVE_ACCESS_LOG

Exit codes:
  0  stopped by SIGINT/SIGTERM
  1  listener could not be bound, or the accept loop failed
  2  invalid configuration
*/

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

#include "cors_config.h"
#include "cors_server.h"
#include "signals.h"

int main()
{
    corsserve::ServerConfig cfg;
    try {
        cfg = corsserve::config_from_env();
    } catch (const corsserve::ConfigError& e) {
        std::cerr << "[config] FATAL: " << e.what() << std::endl;
        return 2;
    }

    // Before any thread exists, so every thread inherits the mask.
    if (!corsserve::block_termination_signals()) {
        std::cerr << "[signals] WARNING: Ctrl+C will terminate without a clean stop" << std::endl;
    }

    std::unique_ptr<corsserve::CorsServer> server;
    try {
        server = std::make_unique<corsserve::CorsServer>(cfg);
    } catch (const corsserve::ConfigError& e) {
        std::cerr << "[config] FATAL: " << e.what() << std::endl;
        return 2;
    }

    try {
        server->bind();
    } catch (const corsserve::BindError& e) {
        std::cerr << "[server] FATAL: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Starting frontend server on http://localhost:" << server->port() << std::endl;
    std::cout << "Serving files from: " << server->root().string() << std::endl;
    std::cout << "Press Ctrl+C to stop the server" << std::endl;

    std::atomic<bool> stopping{false};
    std::atomic<bool> loop_failed{false};

    std::thread loop([&] {
        const bool ok = server->serve();
        if (!stopping.load()) {
            // Accept loop ended on its own: wake the signal wait below.
            loop_failed.store(!ok);
            ::kill(::getpid(), SIGTERM);
        }
    });

    const int sig = corsserve::wait_for_termination_signal();
    stopping.store(true);
    server->stop();
    loop.join();

    if (loop_failed.load()) {
        std::cerr << "[server] FATAL: accept loop failed on port " << server->port() << std::endl;
        return 1;
    }
    if (sig < 0) return 1;

    std::cout << "\nServer stopped." << std::endl;
    return 0;
}
