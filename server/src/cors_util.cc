#include "cors_util.h"

#include <cctype>
#include <cstring>
#include <time.h>

namespace corsserve {

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string http_date(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    // strftime %a/%b follow the C locale, which is what HTTP expects.
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return buf;
}

bool parse_http_date(const std::string& s, std::time_t& out) {
    static const char* const formats[] = {
        "%a, %d %b %Y %H:%M:%S GMT",   // IMF-fixdate
        "%A, %d-%b-%y %H:%M:%S GMT",   // RFC 850
        "%a %b %d %H:%M:%S %Y",        // asctime
    };

    for (const char* fmt : formats) {
        std::tm tm{};
        const char* end = ::strptime(s.c_str(), fmt, &tm);
        if (!end) continue;
        while (*end == ' ') ++end;
        if (*end != '\0') continue;
        out = ::timegm(&tm);
        return out != (std::time_t)-1;
    }
    return false;
}

std::string log_date_time(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%d/%b/%Y %H:%M:%S", &tm);
    return buf;
}

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default:   out.push_back(c);
        }
    }
    return out;
}

std::string url_quote(const std::string& s) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out.push_back((char)c);
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace corsserve
