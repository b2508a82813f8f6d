#pragma once

#include <optional>
#include <string>

#include "holysheet/catalog/catalog.hpp"
#include "holysheet/protocol.hpp"
#include "holysheet/result.hpp"

namespace holysheet::server
{

    /**
     * Turns one inbound line into at most one outbound message.
     *
     * Every line goes RECEIVED -> VALIDATED -> DISPATCHED and ends RESPONDED,
     * DROPPED (code < 1, nullopt is returned) or ERROR-RESPONDED. Failures of
     * the individual stages travel as Result values and only become ERROR
     * payloads here, with the request state echoed when it could be read.
     */
    class Dispatcher
    {
    public:
        explicit Dispatcher(catalog::Catalog &catalog);

        std::optional<protocol::Message> dispatch(const std::string &line);

    private:
        Result<protocol::Message> route(const protocol::Message &request);
        Result<protocol::Message> handle_list(const protocol::Message &request);

        catalog::Catalog &catalog_;
    };

    protocol::ListItem to_list_item(const catalog::RemoteItem &item);

    protocol::Message to_error_message(const Failure &failure, std::string state);

} // namespace holysheet::server
