#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/logger.h>

#include "holysheet/protocol.hpp"

namespace holysheet::client
{

    /**
     * Request/response journal of the CLI. It only ever writes to a file because
     * stdout carries the listing. Requests are remembered by state until their
     * response arrives, so each response line records its round trip time.
     */
    class ExchangeLog
    {
    public:
        // Without a path nothing is written. An unopenable file disables logging with a note on stderr.
        explicit ExchangeLog(const std::optional<std::filesystem::path> &path);

        void connected(const std::string &host, std::uint16_t port);
        void disconnected(const std::string &reason);

        void line_sent(const std::string &line);
        void line_received(const std::string &line);

        void request_sent(const protocol::Message &request);
        void response_received(const protocol::Message &response);
        void response_skipped(const protocol::Message &response, const std::string &expected_state);
        void decode_failed(const std::string &reason);

        // Requests sent whose state has not been answered yet.
        std::size_t outstanding() const noexcept { return sent_at_.size(); }

        void flush();

    private:
        std::shared_ptr<spdlog::logger> logger_;
        std::map<std::string, std::chrono::steady_clock::time_point> sent_at_;
    };

} // namespace holysheet::client
