#pragma once
#include <ctime>
#include <string>

#include "httplib.h"

namespace corsserve {

    // One line per request, in the common "host - - [date] "request" status size" shape.
    std::string format_access_line(const httplib::Request& req,
                                   const httplib::Response& res,
                                   std::time_t when);

    // httplib logger writing format_access_line() to stderr.
    void log_access(const httplib::Request& req, const httplib::Response& res);

} // namespace corsserve
