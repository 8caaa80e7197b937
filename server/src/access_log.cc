#include "access_log.h"

#include <iostream>
#include <mutex>

#include "cors_util.h"

namespace corsserve {

static std::mutex g_log_mu;

std::string format_access_line(const httplib::Request& req,
                               const httplib::Response& res,
                               std::time_t when) {
    const std::string addr = req.remote_addr.empty() ? "-" : req.remote_addr;
    const std::string target = req.target.empty() ? req.path : req.target;
    // Size column is always "-", like the stock request log.
    return addr + " - - [" + log_date_time(when) + "] \"" +
           req.method + " " + target + " " + req.version + "\" " +
           std::to_string(res.status) + " -";
}

void log_access(const httplib::Request& req, const httplib::Response& res) {
    const std::string line = format_access_line(req, res, std::time(nullptr));
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::cerr << line << std::endl;
}

} // namespace corsserve
