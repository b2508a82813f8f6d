#include "holysheet/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>
#include <asio/strand.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "holysheet/server/session.hpp"

namespace holysheet::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        std::size_t resolve_dispatch_threads(std::size_t requested)
        {
            return requested > 0 ? requested : ServerConfig{}.dispatch_threads;
        }

    } // namespace

    Server::Server(ServerConfig config, catalog::Catalog &catalog)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          dispatch_pool_(resolve_dispatch_threads(config_.dispatch_threads)),
          dispatcher_(catalog)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();

        spdlog::info("Listening on {}:{}", config_.address, port_);

        if (config_.handle_signals)
        {
            signals_.add(SIGINT);
            signals_.add(SIGTERM);
            signals_.async_wait([this](const std::error_code &ec, int signal)
                                {
            if (!ec) {
                handle_signal(signal);
            } });
        }
    }

    Server::~Server()
    {
        stop();
        dispatch_pool_.join();
    }

    void Server::run()
    {
        accept_next();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads, {} dispatch threads", worker_count,
                     resolve_dispatch_threads(config_.dispatch_threads));
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
        spdlog::info("Server event loop stopped");
    }

    // Always runs on the event loop, so the acceptor is never touched from the calling thread.
    // A stop requested before run() takes effect as soon as run() starts.
    void Server::stop()
    {
        asio::post(io_context_, [this]
                   {
            close_listener();
            io_context_.stop(); });
    }

    void Server::add_receiver(LineReceiver receiver)
    {
        receivers_.add(std::move(receiver));
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{dispatcher_, receivers_, dispatch_pool_, config_.max_line_bytes};
            auto session = std::make_shared<Session>(std::move(socket), services);
            session->start();
            spdlog::debug("Accepted new connection");
        }
        if (!acceptor_.is_open() || ec == asio::error::operation_aborted)
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Accept error: {}", ec.message());
        }
        accept_next();
    }

    void Server::handle_signal(int signal)
    {
        spdlog::info("Signal {} received, shutting down", signal);
        close_listener();
        io_context_.stop();
    }

    void Server::close_listener()
    {
        std::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
    }

} // namespace holysheet::server
