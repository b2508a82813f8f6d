#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace holysheet::client
{

    struct ClientConfig
    {
        std::string host{"127.0.0.1"};
        std::uint16_t port{4567};
        std::string query{"/"};
        std::optional<std::string> state;
        std::optional<std::filesystem::path> log_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace holysheet::client
