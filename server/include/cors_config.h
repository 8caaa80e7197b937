#pragma once
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace corsserve {

    // Invalid configuration value or unusable root directory.
    class ConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct ServerConfig {
        std::string host = "0.0.0.0";
        int port = 8000;               // 0 = ephemeral, see CorsServer::port()

        // Empty means the directory holding the running executable.
        std::filesystem::path root;

        std::size_t worker_threads = 1;
        bool access_log = true;
    };

    // Directory of /proc/self/exe, "." if it cannot be read.
    std::string exe_dir();

    // Defaults overridden by CORSSERVE_* environment variables.
    // Throws ConfigError on a malformed value.
    ServerConfig config_from_env();

    // Canonical absolute root for cfg (exe_dir() when cfg.root is empty).
    // Throws ConfigError when it is not an existing directory.
    std::filesystem::path resolve_root(const ServerConfig& cfg);

} // namespace corsserve
