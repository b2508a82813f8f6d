#include "holysheet/server/session.hpp"

#include <asio/post.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "holysheet/framing.hpp"

namespace holysheet::server
{

    namespace
    {

        std::string describe_endpoint(const asio::ip::tcp::socket &socket)
        {
            std::error_code ec;
            const auto endpoint = socket.remote_endpoint(ec);
            if (ec)
            {
                return "unknown";
            }
            return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }

        bool is_blank(const std::string &line)
        {
            return line.find_first_not_of(" \t\r") == std::string::npos;
        }

    } // namespace

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)),
          services_(services),
          remote_endpoint_(describe_endpoint(socket_)) {}

    Session::~Session()
    {
        spdlog::debug("Session for {} released", remote_endpoint_);
    }

    void Session::start()
    {
        spdlog::info("Got client {}", remote_endpoint_);
        read_line();
    }

    void Session::stop()
    {
        if (!open_.exchange(false))
        {
            return;
        }
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint_);
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::send(const protocol::Message &message)
    {
        send(protocol::encode_line(nlohmann::json(message)));
    }

    void Session::send(std::string line)
    {
        if (!is_open())
        {
            throw std::system_error(asio::error::make_error_code(asio::error::not_connected),
                                    "Connection to " + remote_endpoint_ + " is closed");
        }
        if (line.empty() || line.back() != '\n')
        {
            line.push_back('\n');
        }
        auto self = shared_from_this();
        asio::post(socket_.get_executor(), [this, self, line = std::move(line)]() mutable
                   {
            if (!is_open())
            {
                spdlog::warn("Dropping response for closed connection {}", remote_endpoint_);
                return;
            }
            const bool idle = write_queue_.empty();
            write_queue_.push_back(std::move(line));
            if (idle)
            {
                write_next();
            } });
    }

    bool Session::is_open() const noexcept
    {
        return open_.load();
    }

    void Session::read_line()
    {
        auto self = shared_from_this();
        asio::async_read_until(socket_, asio::dynamic_buffer(read_buffer_, services_.max_line_bytes), '\n',
                               [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                               {
                                   if (ec)
                                   {
                                       if (ec == asio::error::eof)
                                       {
                                           // The peer may still be waiting for responses to earlier lines,
                                           // so the socket stays open until the session is released.
                                           if (!is_blank(read_buffer_))
                                           {
                                               deliver(std::exchange(read_buffer_, std::string{}));
                                           }
                                           spdlog::info("Client {} finished sending", remote_endpoint_);
                                           return;
                                       }
                                       if (ec == asio::error::not_found)
                                       {
                                           spdlog::error("Line from {} exceeds {} bytes", remote_endpoint_,
                                                         services_.max_line_bytes);
                                       }
                                       else if (ec != asio::error::operation_aborted)
                                       {
                                           spdlog::error("An error occurred while reading from {}: {}",
                                                         remote_endpoint_, ec.message());
                                       }
                                       stop();
                                       return;
                                   }
                                   while (auto line = protocol::try_extract_line(read_buffer_))
                                   {
                                       deliver(std::move(*line));
                                   }
                                   read_line();
                               });
    }

    void Session::deliver(std::string line)
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (is_blank(line))
        {
            return;
        }
        services_.receivers.notify(*this, line);

        auto self = shared_from_this();
        asio::post(services_.dispatch_pool, [self, line = std::move(line)]()
                   { self->dispatch(line); });
    }

    void Session::dispatch(const std::string &line)
    {
        try
        {
            auto response = services_.dispatcher.dispatch(line);
            if (response)
            {
                send(*response);
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Exception while handling data from {}: {}", remote_endpoint_, ex.what());
        }
    }

    void Session::write_next()
    {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(write_queue_.front()),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  spdlog::error("An error occurred while writing to {}: {}", remote_endpoint_,
                                                ec.message());
                                  write_queue_.clear();
                                  stop();
                                  return;
                              }
                              write_queue_.pop_front();
                              if (!write_queue_.empty())
                              {
                                  write_next();
                              }
                          });
    }

} // namespace holysheet::server
