#pragma once
#include <ctime>
#include <string>

namespace corsserve {

    std::string lower_ascii(std::string s);

    // RFC 7231 IMF-fixdate, e.g. "Sun, 18 Oct 2026 09:30:00 GMT".
    std::string http_date(std::time_t t);

    // Parses IMF-fixdate (and the RFC 850 / asctime forms). false on failure.
    bool parse_http_date(const std::string& s, std::time_t& out);

    // "18/Oct/2026 09:30:00" in local time, for access log lines.
    std::string log_date_time(std::time_t t);

    std::string html_escape(const std::string& s);

    // Percent-encodes everything except unreserved characters and '/'.
    std::string url_quote(const std::string& s);

} // namespace corsserve
