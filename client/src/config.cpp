#include "holysheet/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace holysheet::client
{

    namespace
    {

        std::uint16_t parse_port(const std::string &value)
        {
            std::size_t consumed = 0;
            const auto port = std::stoi(value, &consumed);
            if (consumed != value.size() || port <= 0 || port > 65535)
            {
                throw std::runtime_error("Invalid port: " + value);
            }
            return static_cast<std::uint16_t>(port);
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error("Usage: holysheet-cli [host:]<port> [--query <path>] [--state <token>] [--log <file>]");
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos)
        {
            config.port = parse_port(endpoint);
        }
        else
        {
            if (colon_pos > 0)
            {
                config.host = endpoint.substr(0, colon_pos);
            }
            config.port = parse_port(endpoint.substr(colon_pos + 1));
        }

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--query")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--query requires a virtual path");
                }
                config.query = argv[index++];
            }
            else if (arg == "--state")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--state requires a value");
                }
                config.state = std::string(argv[index++]);
            }
            else if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

} // namespace holysheet::client
