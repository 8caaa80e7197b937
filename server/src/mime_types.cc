#include "mime_types.h"

#include <unordered_map>

#include "cors_util.h"

namespace corsserve {

static const std::unordered_map<std::string, std::string>& mime_table() {
    static const std::unordered_map<std::string, std::string> m = {
        // documents
        {"html",  "text/html"},
        {"htm",   "text/html"},
        {"css",   "text/css"},
        {"js",    "text/javascript"},
        {"mjs",   "text/javascript"},
        {"json",  "application/json"},
        {"map",   "application/json"},
        {"txt",   "text/plain"},
        {"csv",   "text/csv"},
        {"xml",   "text/xml"},
        {"pdf",   "application/pdf"},
        {"wasm",  "application/wasm"},

        // images
        {"svg",   "image/svg+xml"},
        {"png",   "image/png"},
        {"jpg",   "image/jpeg"},
        {"jpeg",  "image/jpeg"},
        {"gif",   "image/gif"},
        {"webp",  "image/webp"},
        {"ico",   "image/vnd.microsoft.icon"},
        {"bmp",   "image/bmp"},
        {"avif",  "image/avif"},

        // fonts
        {"woff",  "font/woff"},
        {"woff2", "font/woff2"},
        {"ttf",   "font/ttf"},
        {"otf",   "font/otf"},

        // media
        {"mp3",   "audio/mpeg"},
        {"wav",   "audio/x-wav"},
        {"ogg",   "audio/ogg"},
        {"mp4",   "video/mp4"},
        {"webm",  "video/webm"},

        // archives
        {"zip",   "application/zip"},
        {"gz",    "application/gzip"},
        {"tar",   "application/x-tar"},
        {"bz2",   "application/x-bzip2"},
        {"xz",    "application/x-xz"},
    };
    return m;
}

std::string guess_content_type(const std::string& path) {
    const std::size_t slash = path.find_last_of('/');
    const std::size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
        return "application/octet-stream";

    const auto& m = mime_table();
    auto it = m.find(lower_ascii(path.substr(dot + 1)));
    if (it == m.end()) return "application/octet-stream";
    return it->second;
}

} // namespace corsserve
