#include "http_errors.h"

#include "cors_util.h"

namespace corsserve {

namespace {

struct StatusInfo {
    int code;
    const char* phrase;
    const char* explain;
};

const StatusInfo kStatuses[] = {
    {200, "OK",                     "Request fulfilled, document follows"},
    {204, "No Content",             "Request fulfilled, nothing follows"},
    {206, "Partial Content",        "Partial content follows"},
    {301, "Moved Permanently",      "Object moved permanently -- see URI list"},
    {304, "Not Modified",           "Document has not changed since given time"},
    {400, "Bad Request",            "Bad request syntax or unsupported method"},
    {403, "Forbidden",              "Request forbidden -- authorization will not help"},
    {404, "Not Found",              "Nothing matches the given URI"},
    {405, "Method Not Allowed",     "Specified method is invalid for this resource"},
    {408, "Request Timeout",        "Request timed out; try again later"},
    {413, "Payload Too Large",      "Request entity is too large"},
    {414, "URI Too Long",           "URI is too long"},
    {416, "Range Not Satisfiable",  "Cannot satisfy request range"},
    {431, "Request Header Fields Too Large", "The server refused this request because the request header fields are too large"},
    {500, "Internal Server Error",  "Server got itself in trouble"},
    {501, "Not Implemented",        "Server does not support this operation"},
    {503, "Service Unavailable",    "The server cannot process the request due to a high load"},
};

const StatusInfo* find_status(int status) {
    for (const auto& s : kStatuses) {
        if (s.code == status) return &s;
    }
    return nullptr;
}

std::string error_page(int status, const std::string& message) {
    const StatusInfo* info = find_status(status);
    const std::string explain = info ? info->explain : "";

    std::string html;
    html += "<!DOCTYPE HTML>\n";
    html += "<html lang=\"en\">\n";
    html += "    <head>\n";
    html += "        <meta charset=\"utf-8\">\n";
    html += "        <title>Error response</title>\n";
    html += "    </head>\n";
    html += "    <body>\n";
    html += "        <h1>Error response</h1>\n";
    html += "        <p>Error code: " + std::to_string(status) + "</p>\n";
    html += "        <p>Message: " + html_escape(message) + ".</p>\n";
    html += "        <p>Error code explanation: " + std::to_string(status) + " - " +
            html_escape(explain) + ".</p>\n";
    html += "    </body>\n";
    html += "</html>\n";
    return html;
}

} // namespace

const char* reason_phrase(int status) {
    const StatusInfo* info = find_status(status);
    return info ? info->phrase : "Unknown";
}

void send_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(error_page(status, message.empty() ? reason_phrase(status) : message),
                    "text/html;charset=utf-8");
}

void fill_error_body(const httplib::Request& /*req*/, httplib::Response& res) {
    if (res.status < 400 || !res.body.empty()) return;
    send_error(res, res.status);
}

} // namespace corsserve
