#include "cors_server.h"

#include <sys/socket.h>

#include <chrono>
#include <thread>
#include <utility>

#include "access_log.h"
#include "cors_headers.h"
#include "http_errors.h"
#include "static_serve.h"

namespace corsserve {

CorsServer::CorsServer(ServerConfig cfg)
    : cfg_(std::move(cfg)), root_(resolve_root(cfg_)) {
    if (cfg_.worker_threads == 0) throw ConfigError("worker_threads must be at least 1");
    install_handlers();
}

CorsServer::~CorsServer() {
    stop();
}

void CorsServer::install_handlers() {
    const std::size_t workers = cfg_.worker_threads;
    srv_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    // One exchange per connection: a held-open socket must not starve the single worker.
    srv_.set_keep_alive_max_count(1);

    // Plain SO_REUSEADDR: a second listener on the same port has to fail.
    srv_.set_socket_options([](socket_t sock) {
        int yes = 1;
        ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR,
                     reinterpret_cast<const void*>(&yes), sizeof(yes));
    });

    const std::filesystem::path root = root_;

    srv_.Options(R"(.*)", [](const httplib::Request& req, httplib::Response& res) {
        handle_preflight(req, res);
    });

    // HEAD is routed here too; httplib drops the body.
    srv_.Get(R"(.*)", [root](const httplib::Request& req, httplib::Response& res) {
        serve_static(root, req, res);
    });

    // Routed verbs go through their handler so a request body is read first.
    const httplib::Server::Handler unsupported =
        [](const httplib::Request& req, httplib::Response& res) {
            reject_unsupported_method(req, res);
        };
    srv_.Post(R"(.*)", unsupported);
    srv_.Put(R"(.*)", unsupported);
    srv_.Patch(R"(.*)", unsupported);
    srv_.Delete(R"(.*)", unsupported);

    // TRACE, CONNECT and the like have no route in httplib and would become 400s.
    srv_.set_pre_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        if (is_routed_method(req.method)) return httplib::Server::HandlerResponse::Unhandled;
        reject_unsupported_method(req, res);
        return httplib::Server::HandlerResponse::Handled;
    });

    srv_.set_error_handler(httplib::Server::Handler(fill_error_body));

    // Runs for every response, including library-generated 400s.
    srv_.set_post_routing_handler(compose_finalizers({cors_finalizer()}));

    if (cfg_.access_log) srv_.set_logger(log_access);
}

void CorsServer::bind() {
    if (bound_port_ >= 0) return;

    if (cfg_.port == 0) {
        const int p = srv_.bind_to_any_port(cfg_.host);
        if (p < 0) throw BindError("cannot bind " + cfg_.host + " on an ephemeral port");
        bound_port_ = p;
        return;
    }

    if (!srv_.bind_to_port(cfg_.host, cfg_.port)) {
        throw BindError("cannot bind " + cfg_.host + ":" + std::to_string(cfg_.port) +
                        " (address already in use?)");
    }
    bound_port_ = cfg_.port;
}

bool CorsServer::serve() {
    if (bound_port_ < 0) throw std::logic_error("CorsServer::serve() before bind()");

    {
        std::lock_guard<std::mutex> lk(state_mu_);
        if (serving_) throw std::logic_error("CorsServer::serve() called twice");
        // stop() already came and closed the listener.
        if (stop_requested_) return true;
        serving_ = true;
    }

    const bool ok = srv_.listen_after_bind();
    serve_returned_.store(true);
    return ok;
}

void CorsServer::stop() {
    bool serving = false;
    bool release = false;
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        stop_requested_ = true;
        serving = serving_;
        // Bound, never served, and nobody else will: close the socket here.
        release = !serving_ && !released_ && bound_port_ >= 0;
        if (release) released_ = true;
    }

    if (release) {
        release_listener();
        return;
    }
    if (!serving) return;

    // httplib ignores stop() until the accept loop is up.
    while (!srv_.is_running() && !serve_returned_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    srv_.stop();
}

void CorsServer::release_listener() {
    std::atomic<bool> done{false};
    std::thread closer([this, &done] {
        while (!srv_.is_running() && !done.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        srv_.stop();
    });
    srv_.listen_after_bind();
    done.store(true);
    closer.join();
}

void CorsServer::wait_until_ready() const {
    srv_.wait_until_ready();
}

bool CorsServer::is_running() const {
    return srv_.is_running();
}

} // namespace corsserve
