#include <exception>
#include <iostream>
#include <utility>

#include "holysheet/client/config.hpp"
#include "holysheet/client/exchange_log.hpp"
#include "holysheet/client/session.hpp"

int main(int argc, char *argv[])
{
    using namespace holysheet::client;

    try
    {
        auto config = parse_arguments(argc, argv);
        ExchangeLog log(config.log_path);
        ClientSession session(std::move(config), std::move(log));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
