#pragma once

#include <asio/ip/tcp.hpp>
#include <asio/thread_pool.hpp>
#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>

#include "holysheet/protocol.hpp"
#include "holysheet/server/dispatcher.hpp"
#include "holysheet/server/receiver_registry.hpp"

namespace holysheet::server
{

    struct ServerServices
    {
        Dispatcher &dispatcher;
        ReceiverRegistry &receivers;
        asio::thread_pool &dispatch_pool;
        std::size_t max_line_bytes;
    };

    /**
     * One accepted connection. The socket is bound to a strand, so reads, queued
     * writes and shutdown never run concurrently. Each complete line is shown to
     * the line receivers and then dispatched on the worker pool; responses may
     * therefore leave in a different order than the requests arrived.
     */
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

        void stop();

        // Both overloads may be called from any thread. Throws std::system_error once the session is closed.
        void send(const protocol::Message &message);
        void send(std::string line);

        bool is_open() const noexcept;

        const std::string &remote_endpoint() const noexcept { return remote_endpoint_; }

    private:
        void read_line();
        void deliver(std::string line);
        void dispatch(const std::string &line);
        void write_next();

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        std::string remote_endpoint_;
        std::string read_buffer_;
        std::deque<std::string> write_queue_;
        std::atomic<bool> open_{true};
    };

} // namespace holysheet::server
