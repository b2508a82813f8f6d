#include "holysheet/catalog/virtual_path.hpp"

#include <cctype>
#include <cstddef>

namespace holysheet::catalog
{

    namespace
    {

        constexpr std::size_t kMaxSegments = 2;

        bool is_segment_char(char ch) noexcept
        {
            const auto c = static_cast<unsigned char>(ch);
            return std::isalnum(c) != 0 || ch == '_' || ch == '-';
        }

    } // namespace

    bool is_valid_virtual_path(std::string_view path) noexcept
    {
        if (path.empty() || path.front() != '/' || path.back() != '/')
        {
            return false;
        }
        if (path.size() == 1)
        {
            return true;
        }

        std::size_t segments = 0;
        std::size_t segment_length = 0;
        for (std::size_t i = 1; i < path.size(); ++i)
        {
            const char ch = path[i];
            if (ch == '/')
            {
                if (segment_length == 0)
                {
                    return false;
                }
                ++segments;
                segment_length = 0;
                continue;
            }
            if (!is_segment_char(ch))
            {
                return false;
            }
            ++segment_length;
        }
        return segments <= kMaxSegments;
    }

    std::string normalize_virtual_path(std::string_view path)
    {
        if (!is_valid_virtual_path(path))
        {
            return std::string(kRootPath);
        }
        return std::string(path);
    }

} // namespace holysheet::catalog
