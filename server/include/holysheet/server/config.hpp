#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace holysheet::server
{

    enum class StoreBackend
    {
        Memory,
        Drive
    };

    struct ServerConfig
    {
        std::string address{"127.0.0.1"};
        std::uint16_t port{4567};
        std::size_t worker_threads{0};
        std::size_t dispatch_threads{4};
        std::size_t max_line_bytes{1024 * 1024};
        bool handle_signals{true};

        StoreBackend store{StoreBackend::Memory};
        std::optional<std::filesystem::path> token_file;
        std::string api_base{"https://www.googleapis.com"};
        std::string root_name{"sheetStore"};
        std::size_t page_size{50};

        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
    };

    // Listening port from text, 0 asks for an ephemeral port. Throws std::invalid_argument or std::out_of_range.
    std::uint16_t parse_port(const std::string &value);

} // namespace holysheet::server
