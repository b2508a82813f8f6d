#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/thread_pool.hpp>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "holysheet/catalog/catalog.hpp"
#include "holysheet/server/config.hpp"
#include "holysheet/server/dispatcher.hpp"
#include "holysheet/server/receiver_registry.hpp"

namespace holysheet::server
{

    class Session;

    class Server
    {
    public:
        // Binds and listens immediately; throws std::system_error when the address is unavailable.
        Server(ServerConfig config, catalog::Catalog &catalog);
        ~Server();

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        // Blocks until stop() is called or a termination signal arrives.
        void run();

        void stop();

        void add_receiver(LineReceiver receiver);

        // Actual listening port, useful when the configured port was 0.
        std::uint16_t port() const noexcept { return port_; }

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal(int signal);
        void close_listener();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::thread_pool dispatch_pool_;
        ReceiverRegistry receivers_;
        Dispatcher dispatcher_;
        std::uint16_t port_{0};

        std::vector<std::thread> workers_;
    };

} // namespace holysheet::server
