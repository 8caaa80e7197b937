// tests/cors/test_cors_headers.cpp
//
// The CORS finalizer must put exactly one copy of each header, with the fixed
// values, on any response it sees, and preflight must stay an empty 200.

#include <iostream>
#include <string>
#include <vector>

#include "httplib.h"
#include "cors_headers.h"

static int failures = 0;

static void check(bool ok, const std::string& what) {
    if (!ok) {
        std::cerr << "FAIL: " << what << "\n";
        failures++;
    }
}

static void check_triple(const httplib::Response& res, const std::string& ctx) {
    check(res.get_header_value("Access-Control-Allow-Origin") == "*",
          ctx + ": Access-Control-Allow-Origin");
    check(res.get_header_value("Access-Control-Allow-Methods") == "GET, POST, OPTIONS",
          ctx + ": Access-Control-Allow-Methods");
    check(res.get_header_value("Access-Control-Allow-Headers") == "Authorization, Content-Type, Accept",
          ctx + ": Access-Control-Allow-Headers");
    for (const auto& kv : corsserve::cors_headers()) {
        check(res.headers.count(kv.first) == 1, ctx + ": exactly one " + kv.first);
    }
}

int main() {
    httplib::Request req;
    req.method = "GET";
    req.path = "/";

    // Plain 200
    {
        httplib::Response res;
        res.status = 200;
        res.set_content("<html>ok</html>", "text/html");
        corsserve::apply_cors_headers(res);
        check_triple(res, "200");
        check(res.body == "<html>ok</html>", "200: body untouched");
        check(res.get_header_value("Content-Type") == "text/html", "200: content type untouched");
    }

    // Error responses get the same set
    {
        httplib::Response res;
        res.status = 404;
        corsserve::cors_finalizer()(req, res);
        check_triple(res, "404");
        check(res.status == 404, "404: status untouched");
    }

    // Applying twice (or over a stale value) never duplicates
    {
        httplib::Response res;
        res.status = 200;
        res.set_header("Access-Control-Allow-Origin", "https://elsewhere.example");
        corsserve::apply_cors_headers(res);
        corsserve::apply_cors_headers(res);
        check_triple(res, "reapply");
    }

    // Finalizers run in order, and an empty slot is skipped
    {
        std::vector<std::string> seen;
        auto chain = corsserve::compose_finalizers({
            corsserve::cors_finalizer(),
            corsserve::ResponseFinalizer(),
            [&](const httplib::Request&, httplib::Response& res) {
                seen.push_back(res.get_header_value("Access-Control-Allow-Origin"));
            },
        });
        httplib::Response res;
        res.status = 301;
        chain(req, res);
        check(seen.size() == 1 && seen[0] == "*", "compose: later finalizer sees CORS headers");
        check_triple(res, "compose");
    }

    // Preflight
    {
        httplib::Request opt;
        opt.method = "OPTIONS";
        opt.path = "/anything";
        httplib::Response res;
        res.body = "leftover";
        corsserve::handle_preflight(opt, res);
        corsserve::apply_cors_headers(res);
        check(res.status == 200, "preflight: status 200");
        check(res.body.empty(), "preflight: empty body");
        check_triple(res, "preflight");
    }

    if (failures) {
        std::cerr << failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "OK: cors header tests passed\n";
    return 0;
}
