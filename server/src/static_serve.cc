#include "static_serve.h"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <system_error>
#include <vector>

#include "cors_util.h"
#include "http_errors.h"
#include "mime_types.h"

namespace fs = std::filesystem;

namespace corsserve {

static const char* const kIndexFiles[] = {"index.html", "index.htm"};

static bool slurp_file(const fs::path& path, std::string& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) return false;
    out = ss.str();
    return true;
}

static std::string strip_fragment(const std::string& p) {
    const std::size_t hash = p.find('#');
    return hash == std::string::npos ? p : p.substr(0, hash);
}

fs::path translate_path(const fs::path& root, const std::string& url_path) {
    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i <= url_path.size()) {
        std::size_t j = url_path.find('/', i);
        if (j == std::string::npos) j = url_path.size();
        std::string seg = url_path.substr(i, j - i);
        i = j + 1;

        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!parts.empty()) parts.pop_back();
            continue;
        }
        parts.push_back(std::move(seg));
    }

    fs::path out = root;
    for (const auto& p : parts) out /= p;
    return out;
}

bool render_directory_listing(const fs::path& dir,
                              const std::string& display_path,
                              std::string& out_html) {
    struct Entry {
        std::string name;
        bool is_dir = false;
        bool is_link = false;
    };

    std::vector<Entry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return false;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return false;
        Entry e;
        e.name = it->path().filename().string();
        std::error_code sec;
        e.is_dir = fs::is_directory(it->path(), sec);
        e.is_link = fs::is_symlink(it->symlink_status(sec));
        entries.push_back(std::move(e));
    }
    if (ec) return false;

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return lower_ascii(a.name) < lower_ascii(b.name);
    });

    const std::string title = "Directory listing for " + html_escape(display_path);

    std::string r;
    r += "<!DOCTYPE HTML>\n";
    r += "<html lang=\"en\">\n";
    r += "<head>\n";
    r += "<meta charset=\"utf-8\">\n";
    r += "<title>" + title + "</title>\n";
    r += "</head>\n";
    r += "<body>\n";
    r += "<h1>" + title + "</h1>\n";
    r += "<hr>\n<ul>\n";
    for (const auto& e : entries) {
        std::string display = e.name;
        std::string link = e.name;
        if (e.is_dir) {
            display += "/";
            link += "/";
        }
        if (e.is_link) display = e.name + "@";
        r += "<li><a href=\"" + url_quote(link) + "\">" + html_escape(display) + "</a></li>\n";
    }
    r += "</ul>\n<hr>\n</body>\n</html>\n";

    out_html = std::move(r);
    return true;
}

// true if the client copy (If-Modified-Since) is still current.
static bool not_modified_since(const httplib::Request& req, std::time_t mtime) {
    if (!req.has_header("If-Modified-Since") || req.has_header("If-None-Match")) return false;
    std::time_t ims = 0;
    if (!parse_http_date(req.get_header_value("If-Modified-Since"), ims)) return false;
    return mtime <= ims;
}

static bool send_file(const fs::path& path, const httplib::Request& req, httplib::Response& res) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        send_error(res, 404, "File not found");
        return false;
    }

    if (not_modified_since(req, st.st_mtime)) {
        res.status = 304;
        return true;
    }

    std::string body;
    if (!slurp_file(path, body)) {
        send_error(res, 404, "File not found");
        return false;
    }

    res.set_header("Last-Modified", http_date(st.st_mtime));
    res.set_content(std::move(body), guess_content_type(path.filename().string()));
    res.status = 200;
    return true;
}

bool serve_static(const fs::path& root, const httplib::Request& req, httplib::Response& res) {
    const std::string url_path = strip_fragment(req.path);

    // A decoded %00 would cut the name short at the syscall boundary.
    if (url_path.find('\0') != std::string::npos) {
        send_error(res, 404, "File not found");
        return false;
    }

    const bool trailing_slash = !url_path.empty() && url_path.back() == '/';
    const fs::path target = translate_path(root, url_path);

    std::error_code ec;
    if (fs::is_directory(target, ec)) {
        if (!trailing_slash) {
            // Relative links in the listing/index need the slash.
            std::string raw = req.target.empty() ? url_quote(url_path) : req.target;
            std::string query;
            const std::size_t q = raw.find('?');
            if (q != std::string::npos) {
                query = raw.substr(q);
                raw.erase(q);
            }
            res.status = 301;
            res.set_header("Location", raw + "/" + query);
            return true;
        }

        for (const char* index : kIndexFiles) {
            const fs::path candidate = target / index;
            if (fs::is_regular_file(candidate, ec)) return send_file(candidate, req, res);
        }

        std::string html;
        if (!render_directory_listing(target, url_path, html)) {
            send_error(res, 404, "No permission to list directory");
            return false;
        }
        res.set_content(std::move(html), "text/html; charset=utf-8");
        res.status = 200;
        return true;
    }

    if (trailing_slash) {
        send_error(res, 404, "File not found");
        return false;
    }
    return send_file(target, req, res);
}

bool is_routed_method(const std::string& method) {
    return method == "GET" || method == "HEAD" || method == "OPTIONS" ||
           method == "POST" || method == "PUT" || method == "PATCH" || method == "DELETE";
}

void reject_unsupported_method(const httplib::Request& req, httplib::Response& res) {
    send_error(res, 501, "Unsupported method ('" + req.method + "')");
}

} // namespace corsserve
