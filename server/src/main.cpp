#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "holysheet/catalog/catalog.hpp"
#include "holysheet/catalog/drive_store.hpp"
#include "holysheet/catalog/memory_store.hpp"
#include "holysheet/server/server.hpp"
#include "holysheet/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    constexpr const char *kTokenEnvironment = "HOLYSHEET_ACCESS_TOKEN";

    void print_usage(const char *program_name)
    {
        std::cout << "HolySheet server " << holysheet::version() << "\n"
                  << "Usage: " << program_name
                  << " [--address <ADDRESS>] [--port <PORT>] [--threads <N>] [--dispatch-threads <N>]\n"
                     "       [--max-line-bytes <N>] [--store memory|drive] [--token-file <FILE>] [--api-base <URL>]\n"
                     "       [--root-name <NAME>] [--page-size <N>] [--log <FILE>] [--log-level <LEVEL>]\n"
                     "The drive store reads its bearer token from --token-file or "
                  << kTokenEnvironment << ".\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::string trim(std::string value)
    {
        const auto first = value.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
        {
            return {};
        }
        const auto last = value.find_last_not_of(" \t\r\n");
        return value.substr(first, last - first + 1);
    }

    std::string load_access_token(const holysheet::server::ServerConfig &config)
    {
        if (config.token_file)
        {
            std::ifstream in(*config.token_file);
            if (!in)
            {
                throw std::runtime_error("Unable to read token file " + config.token_file->string());
            }
            std::string token((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            return trim(std::move(token));
        }
        if (const char *token = std::getenv(kTokenEnvironment))
        {
            return trim(token);
        }
        return {};
    }

    std::unique_ptr<holysheet::catalog::RemoteStore> make_store(const holysheet::server::ServerConfig &config)
    {
        if (config.store == holysheet::server::StoreBackend::Memory)
        {
            spdlog::warn("Using the in-memory store, nothing will be persisted");
            return std::make_unique<holysheet::catalog::MemoryStore>();
        }
        holysheet::catalog::DriveConfig drive;
        drive.api_base = config.api_base;
        drive.access_token = load_access_token(config);
        return std::make_unique<holysheet::catalog::DriveStore>(std::move(drive));
    }

} // namespace

int main(int argc, char *argv[])
{
    using holysheet::server::Server;
    using holysheet::server::ServerConfig;
    using holysheet::server::StoreBackend;

    ServerConfig config;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }

            const bool takes_value = arg == "--address" || arg == "--port" || arg == "--threads" ||
                                     arg == "--dispatch-threads" || arg == "--max-line-bytes" ||
                                     arg == "--store" || arg == "--token-file" || arg == "--api-base" ||
                                     arg == "--root-name" || arg == "--page-size" || arg == "--log" ||
                                     arg == "--log-level";
            if (!takes_value)
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--port")
            {
                config.port = holysheet::server::parse_port(*value);
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--dispatch-threads")
            {
                config.dispatch_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--max-line-bytes")
            {
                config.max_line_bytes = static_cast<std::size_t>(std::stoull(*value));
            }
            else if (arg == "--store")
            {
                if (*value == "memory")
                {
                    config.store = StoreBackend::Memory;
                }
                else if (*value == "drive")
                {
                    config.store = StoreBackend::Drive;
                }
                else
                {
                    std::cerr << "Unknown store backend: " << *value << std::endl;
                    print_usage(argv[0]);
                    return EXIT_FAILURE;
                }
            }
            else if (arg == "--token-file")
            {
                config.token_file = std::filesystem::path(*value);
            }
            else if (arg == "--api-base")
            {
                config.api_base = *value;
            }
            else if (arg == "--root-name")
            {
                config.root_name = *value;
            }
            else if (arg == "--page-size")
            {
                config.page_size = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else
            {
                config.log_level = *value;
            }
        }
    }
    catch (const std::logic_error &ex)
    {
        // std::stoi and friends report malformed numbers as invalid_argument or out_of_range.
        std::cerr << "Invalid numeric argument: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.max_line_bytes == 0 || config.page_size == 0)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting HolySheet server {} on {}:{}", holysheet::version(), config.address, config.port);

        auto store = make_store(config);
        holysheet::catalog::CatalogOptions options;
        options.root_name = config.root_name;
        options.page_size = config.page_size;
        holysheet::catalog::Catalog catalog(*store, options);

        const auto root = catalog.root_container();
        spdlog::info("Root container is {} ({})", root.name, root.id);

        Server server(std::move(config), catalog);
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
