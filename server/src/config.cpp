#include "holysheet/server/config.hpp"

#include <limits>
#include <stdexcept>

namespace holysheet::server
{

    std::uint16_t parse_port(const std::string &value)
    {
        std::size_t consumed = 0;
        const auto port = std::stol(value, &consumed);
        if (consumed != value.size() || port < 0 || port > std::numeric_limits<std::uint16_t>::max())
        {
            throw std::out_of_range("Invalid port: " + value);
        }
        return static_cast<std::uint16_t>(port);
    }

} // namespace holysheet::server
