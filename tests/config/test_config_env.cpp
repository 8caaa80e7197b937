// tests/config/test_config_env.cpp
//
// With no CORSSERVE_* variables the config must equal the fixed defaults
// (0.0.0.0:8000, executable directory); malformed overrides must be fatal.

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "cors_config.h"

namespace fs = std::filesystem;

static int failures = 0;

static void check(bool ok, const std::string& what) {
    if (!ok) {
        std::cerr << "FAIL: " << what << "\n";
        failures++;
    }
}

static void clear_env() {
    for (const char* k : {"CORSSERVE_LISTEN_PORT", "CORSSERVE_BIND_HOST", "CORSSERVE_ROOT",
                          "CORSSERVE_WORKERS", "CORSSERVE_ACCESS_LOG"}) {
        ::unsetenv(k);
    }
}

static bool throws_config_error() {
    try {
        (void)corsserve::config_from_env();
    } catch (const corsserve::ConfigError&) {
        return true;
    }
    return false;
}

int main() {
    clear_env();

    // Defaults
    {
        const corsserve::ServerConfig cfg = corsserve::config_from_env();
        check(cfg.host == "0.0.0.0", "default host");
        check(cfg.port == 8000, "default port 8000");
        check(cfg.root.empty(), "default root is the executable directory");
        check(cfg.worker_threads == 1, "default single worker");
        check(cfg.access_log, "default access log on");

        const fs::path root = corsserve::resolve_root(cfg);
        check(root == fs::canonical(corsserve::exe_dir()), "empty root resolves to exe_dir()");
    }

    // Overrides
    {
        const fs::path dir = fs::temp_directory_path() /
                             ("cors_serve_cfg_" + std::to_string(::getpid()));
        fs::create_directories(dir);

        ::setenv("CORSSERVE_LISTEN_PORT", "8123", 1);
        ::setenv("CORSSERVE_BIND_HOST", "127.0.0.1", 1);
        ::setenv("CORSSERVE_ROOT", dir.c_str(), 1);
        ::setenv("CORSSERVE_WORKERS", "4", 1);
        ::setenv("CORSSERVE_ACCESS_LOG", "off", 1);

        const corsserve::ServerConfig cfg = corsserve::config_from_env();
        check(cfg.port == 8123, "port override");
        check(cfg.host == "127.0.0.1", "host override");
        check(cfg.root == dir, "root override");
        check(cfg.worker_threads == 4, "workers override");
        check(!cfg.access_log, "access log override");
        check(corsserve::resolve_root(cfg) == fs::canonical(dir), "root override resolves");

        clear_env();
        fs::remove_all(dir);
    }

    // Malformed values
    {
        ::setenv("CORSSERVE_LISTEN_PORT", "80x", 1);
        check(throws_config_error(), "non-numeric port rejected");
        ::setenv("CORSSERVE_LISTEN_PORT", "70000", 1);
        check(throws_config_error(), "port above 65535 rejected");
        clear_env();

        ::setenv("CORSSERVE_WORKERS", "0", 1);
        check(throws_config_error(), "zero workers rejected");
        clear_env();

        ::setenv("CORSSERVE_ACCESS_LOG", "maybe", 1);
        check(throws_config_error(), "bad boolean rejected");
        clear_env();
    }

    // Root that is missing or not a directory
    {
        corsserve::ServerConfig cfg;
        cfg.root = "/nonexistent/cors_serve/root";
        bool threw = false;
        try {
            (void)corsserve::resolve_root(cfg);
        } catch (const corsserve::ConfigError&) {
            threw = true;
        }
        check(threw, "missing root rejected");

        cfg.root = "/proc/self/exe";
        threw = false;
        try {
            (void)corsserve::resolve_root(cfg);
        } catch (const corsserve::ConfigError&) {
            threw = true;
        }
        check(threw, "file as root rejected");
    }

    if (failures) {
        std::cerr << failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "OK: config tests passed\n";
    return 0;
}
