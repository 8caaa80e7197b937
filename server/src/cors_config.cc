#include "cors_config.h"

#include <cerrno>
#include <limits.h>
#include <cstdlib>
#include <system_error>
#include <unistd.h>

#include "cors_util.h"

namespace corsserve {

std::string exe_dir() {
    char buf[PATH_MAX] = {0};
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return ".";
    std::string p(buf, (size_t)n);
    return std::filesystem::path(p).parent_path().string();
}

static long parse_long(const char* name, const std::string& v, long lo, long hi) {
    if (v.empty()) throw ConfigError(std::string(name) + " is empty");
    errno = 0;
    char* end = nullptr;
    long n = std::strtol(v.c_str(), &end, 10);
    if (errno != 0 || end == v.c_str() || *end != '\0')
        throw ConfigError(std::string(name) + " is not a number: '" + v + "'");
    if (n < lo || n > hi)
        throw ConfigError(std::string(name) + " out of range [" + std::to_string(lo) +
                          ", " + std::to_string(hi) + "]: " + v);
    return n;
}

static bool parse_flag(const char* name, const std::string& v) {
    const std::string s = lower_ascii(v);
    if (s == "1" || s == "true" || s == "on" || s == "yes") return true;
    if (s == "0" || s == "false" || s == "off" || s == "no") return false;
    throw ConfigError(std::string(name) + " is not a boolean: '" + v + "'");
}

ServerConfig config_from_env() {
    ServerConfig cfg;

    if (const char* v = std::getenv("CORSSERVE_LISTEN_PORT"))
        cfg.port = (int)parse_long("CORSSERVE_LISTEN_PORT", v, 0, 65535);
    if (const char* v = std::getenv("CORSSERVE_BIND_HOST")) {
        if (!*v) throw ConfigError("CORSSERVE_BIND_HOST is empty");
        cfg.host = v;
    }
    if (const char* v = std::getenv("CORSSERVE_ROOT")) {
        if (!*v) throw ConfigError("CORSSERVE_ROOT is empty");
        cfg.root = v;
    }
    if (const char* v = std::getenv("CORSSERVE_WORKERS"))
        cfg.worker_threads = (std::size_t)parse_long("CORSSERVE_WORKERS", v, 1, 256);
    if (const char* v = std::getenv("CORSSERVE_ACCESS_LOG"))
        cfg.access_log = parse_flag("CORSSERVE_ACCESS_LOG", v);

    return cfg;
}

std::filesystem::path resolve_root(const ServerConfig& cfg) {
    std::filesystem::path p = cfg.root.empty() ? std::filesystem::path(exe_dir()) : cfg.root;

    std::error_code ec;
    std::filesystem::path abs = std::filesystem::canonical(p, ec);
    if (ec) throw ConfigError("root " + p.string() + ": " + ec.message());
    if (!std::filesystem::is_directory(abs, ec))
        throw ConfigError("root is not a directory: " + abs.string());
    return abs;
}

} // namespace corsserve
