#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "httplib.h"

namespace corsserve {

    // Runs on every response right before its headers go out.
    using ResponseFinalizer = std::function<void(const httplib::Request&, httplib::Response&)>;

    constexpr const char* kAllowOrigin  = "*";
    constexpr const char* kAllowMethods = "GET, POST, OPTIONS";
    constexpr const char* kAllowHeaders = "Authorization, Content-Type, Accept";

    // The fixed header set, in emission order.
    const std::vector<std::pair<std::string, std::string>>& cors_headers();

    // Sets (never duplicates) the CORS headers on res.
    void apply_cors_headers(httplib::Response& res);

    ResponseFinalizer cors_finalizer();

    // Runs each finalizer in order.
    ResponseFinalizer compose_finalizers(std::vector<ResponseFinalizer> chain);

    // OPTIONS on any path: 200, empty body. Headers come from the finalizer.
    void handle_preflight(const httplib::Request& req, httplib::Response& res);

} // namespace corsserve
