#pragma once
#include <string>

#include "httplib.h"

namespace corsserve {

    // Reason phrase for a status code ("Unknown" if not in the table).
    const char* reason_phrase(int status);

    // Sets res.status and an HTML error document describing it.
    // An empty message uses the reason phrase.
    void send_error(httplib::Response& res, int status, const std::string& message = "");

    // Error handler: gives any >= 400 response that still has no body a standard page.
    void fill_error_body(const httplib::Request& req, httplib::Response& res);

} // namespace corsserve
