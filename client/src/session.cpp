#include "holysheet/client/session.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include "holysheet/framing.hpp"

namespace holysheet::client
{

    namespace
    {

        std::string_view kind_label(int kind_code)
        {
            switch (kind_code)
            {
            case 1:
                return "folder";
            case 2:
                return "sheet";
            default:
                return "other";
            }
        }

    } // namespace

    ClientSession::ClientSession(ClientConfig config, ExchangeLog log)
        : config_(std::move(config)), log_(std::move(log)), socket_(io_context_) {}

    int ClientSession::run()
    {
        connect();
        const auto response = config_.state ? list(config_.query, *config_.state) : list(config_.query);
        if (protocol::type_of(response) == protocol::PayloadType::Error)
        {
            const auto &detail = std::get<protocol::ErrorDetail>(response.body);
            std::cerr << "ERROR: " << response.message << std::endl;
            if (!detail.stack_trace.empty())
            {
                std::cerr << detail.stack_trace << std::endl;
            }
            return 1;
        }
        print_listing(response);
        close();
        return 0;
    }

    void ClientSession::connect()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(config_.host, std::to_string(config_.port));
        asio::connect(socket_, results);
        log_.connected(config_.host, config_.port);
    }

    void ClientSession::close()
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        log_.disconnected(ec ? ec.message() : "closed by client");
        log_.flush();
    }

    void ClientSession::send_line(const std::string &line)
    {
        auto framed = line;
        if (framed.empty() || framed.back() != '\n')
        {
            framed.push_back('\n');
        }
        asio::write(socket_, asio::buffer(framed));
        log_.line_sent(framed.substr(0, framed.size() - 1));
    }

    void ClientSession::send(const protocol::Message &message)
    {
        log_.request_sent(message);
        send_line(protocol::encode_line(nlohmann::json(message)));
    }

    std::string ClientSession::read_line()
    {
        while (true)
        {
            if (auto line = protocol::try_extract_line(read_buffer_))
            {
                log_.line_received(*line);
                return *line;
            }
            asio::read_until(socket_, asio::dynamic_buffer(read_buffer_), '\n');
        }
    }

    protocol::Message ClientSession::read_message()
    {
        const auto line = read_line();
        protocol::Message message;
        try
        {
            message = nlohmann::json::parse(line).get<protocol::Message>();
        }
        catch (const std::exception &ex)
        {
            log_.decode_failed(ex.what());
            throw std::runtime_error("Failed to decode server response");
        }
        log_.response_received(message);
        return message;
    }

    protocol::Message ClientSession::exchange(const protocol::Message &request)
    {
        send(request);
        while (true)
        {
            auto response = read_message();
            if (response.state == request.state)
            {
                return response;
            }
            log_.response_skipped(response, request.state);
        }
    }

    protocol::Message ClientSession::list(const std::string &query, const std::string &state)
    {
        return exchange(protocol::make_list_request(query, state));
    }

    protocol::Message ClientSession::list(const std::string &query)
    {
        return list(query, next_state());
    }

    void ClientSession::print_listing(const protocol::Message &response) const
    {
        const auto *listing = std::get_if<protocol::ListResponse>(&response.body);
        if (listing == nullptr || listing->items.empty())
        {
            std::cout << "(no uploads)" << std::endl;
            return;
        }
        for (const auto &item : listing->items)
        {
            std::cout << std::left << std::setw(8) << kind_label(item.kind_code) << std::right << std::setw(12)
                      << item.size << "  " << item.modified_at_millis << "  " << item.name << std::endl;
        }
    }

    std::string ClientSession::next_state()
    {
        std::ostringstream oss;
        oss << "req-" << (++request_counter_);
        return oss.str();
    }

} // namespace holysheet::client
