#pragma once
#include <string>

namespace corsserve {

    // Content-Type for a file name, chosen by its (case-insensitive) extension.
    // Unknown or missing extensions map to application/octet-stream.
    std::string guess_content_type(const std::string& path);

} // namespace corsserve
