#pragma once
#include <filesystem>
#include <string>

#include "httplib.h"

namespace corsserve {

    // Maps a decoded URL path onto root. Empty and "." segments are dropped and
    // ".." never climbs above root. Query and fragment must already be stripped.
    std::filesystem::path translate_path(const std::filesystem::path& root,
                                         const std::string& url_path);

    // HTML index of dir. false if the directory cannot be read.
    bool render_directory_listing(const std::filesystem::path& dir,
                                  const std::string& display_path,
                                  std::string& out_html);

    // GET/HEAD against root: file, index file, listing, redirect, 304 or 404.
    // Returns true when a 2xx/3xx response was produced.
    bool serve_static(const std::filesystem::path& root,
                      const httplib::Request& req,
                      httplib::Response& res);

    // Methods httplib dispatches to registered handlers.
    bool is_routed_method(const std::string& method);

    // 501 Unsupported method ('<METHOD>').
    void reject_unsupported_method(const httplib::Request& req, httplib::Response& res);

} // namespace corsserve
