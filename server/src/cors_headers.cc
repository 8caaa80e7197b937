#include "cors_headers.h"

namespace corsserve {

const std::vector<std::pair<std::string, std::string>>& cors_headers() {
    static const std::vector<std::pair<std::string, std::string>> h = {
        {"Access-Control-Allow-Origin",  kAllowOrigin},
        {"Access-Control-Allow-Methods", kAllowMethods},
        {"Access-Control-Allow-Headers", kAllowHeaders},
    };
    return h;
}

void apply_cors_headers(httplib::Response& res) {
    for (const auto& kv : cors_headers()) {
        // Headers is a multimap; set_header would append a second copy.
        res.headers.erase(kv.first);
        res.set_header(kv.first, kv.second);
    }
}

ResponseFinalizer cors_finalizer() {
    return [](const httplib::Request&, httplib::Response& res) {
        apply_cors_headers(res);
    };
}

ResponseFinalizer compose_finalizers(std::vector<ResponseFinalizer> chain) {
    return [chain = std::move(chain)](const httplib::Request& req, httplib::Response& res) {
        for (const auto& f : chain) {
            if (f) f(req, res);
        }
    };
}

void handle_preflight(const httplib::Request& /*req*/, httplib::Response& res) {
    res.status = 200;
    res.body.clear();
}

} // namespace corsserve
