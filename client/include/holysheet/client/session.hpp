#pragma once

#include <asio.hpp>

#include <cstdint>
#include <string>

#include "holysheet/client/config.hpp"
#include "holysheet/client/exchange_log.hpp"
#include "holysheet/protocol.hpp"

namespace holysheet::client
{

    /**
     * Blocking line client for the socket protocol. Responses are matched to
     * requests by their state token, lines carrying another state are skipped.
     */
    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, ExchangeLog log);

        // Connects, lists the configured path and prints the result. Returns the process exit code.
        int run();

        void connect();
        void close();

        const ExchangeLog &exchange_log() const noexcept { return log_; }

        void send_line(const std::string &line);
        void send(const protocol::Message &message);

        // Blocks for the next complete line. Throws asio::system_error when the server closes the connection.
        std::string read_line();
        protocol::Message read_message();

        // Sends `request` and waits for the response carrying the same state.
        protocol::Message exchange(const protocol::Message &request);

        protocol::Message list(const std::string &query, const std::string &state);
        protocol::Message list(const std::string &query);

    private:
        void print_listing(const protocol::Message &response) const;
        std::string next_state();

        ClientConfig config_;
        ExchangeLog log_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::string read_buffer_;
        std::uint64_t request_counter_{0};
    };

} // namespace holysheet::client
