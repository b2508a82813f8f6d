#include "holysheet/client/exchange_log.hpp"

#include <spdlog/sinks/basic_file_sink.h>

#include <iostream>
#include <variant>

namespace holysheet::client
{

    namespace
    {

        std::string describe(const protocol::Message &message)
        {
            if (const auto *request = std::get_if<protocol::ListRequest>(&message.body))
            {
                return "query='" + request->query + "'";
            }
            if (const auto *listing = std::get_if<protocol::ListResponse>(&message.body))
            {
                return "items=" + std::to_string(listing->items.size());
            }
            return "error='" + message.message + "'";
        }

    } // namespace

    ExchangeLog::ExchangeLog(const std::optional<std::filesystem::path> &path)
    {
        if (!path)
        {
            return;
        }
        try
        {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), true);
            logger_ = std::make_shared<spdlog::logger>("exchange", std::move(sink));
            logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
            logger_->set_level(spdlog::level::debug);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "Exchange log disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

    void ExchangeLog::connected(const std::string &host, std::uint16_t port)
    {
        if (logger_)
        {
            logger_->info("connected to {}:{}", host, port);
        }
    }

    void ExchangeLog::disconnected(const std::string &reason)
    {
        if (logger_)
        {
            logger_->info("disconnected, {} request(s) unanswered: {}", sent_at_.size(), reason);
        }
    }

    void ExchangeLog::line_sent(const std::string &line)
    {
        if (logger_)
        {
            logger_->debug("send {}", line);
        }
    }

    void ExchangeLog::line_received(const std::string &line)
    {
        if (logger_)
        {
            logger_->debug("recv {}", line);
        }
    }

    void ExchangeLog::request_sent(const protocol::Message &request)
    {
        sent_at_[request.state] = std::chrono::steady_clock::now();
        if (logger_)
        {
            logger_->info("state={} sent {} {}", request.state, protocol::to_string(protocol::type_of(request)),
                          describe(request));
        }
    }

    void ExchangeLog::response_received(const protocol::Message &response)
    {
        const auto it = sent_at_.find(response.state);
        if (it == sent_at_.end())
        {
            if (logger_)
            {
                logger_->warn("state={} unsolicited {} code={} {}", response.state,
                              protocol::to_string(protocol::type_of(response)), response.code, describe(response));
            }
            return;
        }
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - it->second);
        sent_at_.erase(it);
        if (logger_)
        {
            logger_->info("state={} received {} code={} {} after {}ms", response.state,
                          protocol::to_string(protocol::type_of(response)), response.code, describe(response),
                          elapsed.count());
        }
    }

    void ExchangeLog::response_skipped(const protocol::Message &response, const std::string &expected_state)
    {
        if (logger_)
        {
            logger_->info("state={} skipped while waiting for state={}", response.state, expected_state);
        }
    }

    void ExchangeLog::decode_failed(const std::string &reason)
    {
        if (logger_)
        {
            logger_->error("undecodable response: {}", reason);
        }
    }

    void ExchangeLog::flush()
    {
        if (logger_)
        {
            logger_->flush();
        }
    }

} // namespace holysheet::client
