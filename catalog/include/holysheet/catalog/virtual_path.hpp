#pragma once

#include <string>
#include <string_view>

namespace holysheet::catalog
{

    inline constexpr std::string_view kRootPath = "/";

    /**
     * A virtual path is "/" or one or two segments of [A-Za-z0-9_-] wrapped in
     * slashes, e.g. "/photos/" or "/photos/2019/".
     */
    bool is_valid_virtual_path(std::string_view path) noexcept;

    // Blank or invalid paths collapse to the root path.
    std::string normalize_virtual_path(std::string_view path);

} // namespace holysheet::catalog
