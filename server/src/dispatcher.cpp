#include "holysheet/server/dispatcher.hpp"

#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "holysheet/crypto.hpp"

namespace holysheet::server
{

    namespace
    {

        Result<nlohmann::json> parse_line(const std::string &line)
        {
            try
            {
                return nlohmann::json::parse(line);
            }
            catch (const nlohmann::json::parse_error &ex)
            {
                return make_failure(ErrorCode::InvalidPayload, std::string("Malformed JSON: ") + ex.what(),
                                    "dispatch.parse");
            }
        }

        Result<protocol::Header> decode_header(const nlohmann::json &json)
        {
            try
            {
                return protocol::read_header(json);
            }
            catch (const protocol::ProtocolError &ex)
            {
                return make_failure(ex.code(), ex.what(), "dispatch.header");
            }
        }

        Result<protocol::Message> decode_message(const nlohmann::json &json)
        {
            try
            {
                return json.get<protocol::Message>();
            }
            catch (const protocol::ProtocolError &ex)
            {
                return make_failure(ex.code(), ex.what(), "dispatch.decode");
            }
            catch (const nlohmann::json::exception &ex)
            {
                return make_failure(ErrorCode::InvalidPayload, ex.what(), "dispatch.decode");
            }
        }

    } // namespace

    protocol::ListItem to_list_item(const catalog::RemoteItem &item)
    {
        protocol::ListItem entry;
        entry.name = item.name;
        entry.size = item.size;
        entry.kind_code = catalog::kind_code(item.kind);
        entry.modified_at_millis = item.modified_time_ms;
        entry.content_hash = item.content_hash ? *item.content_hash : crypto::hash_string(item.id);
        return entry;
    }

    protocol::Message to_error_message(const Failure &failure, std::string state)
    {
        auto message = failure.message.empty() ? std::string(to_string(failure.code)) : failure.message;
        return protocol::make_error(std::move(message), std::move(state), failure.trace);
    }

    Dispatcher::Dispatcher(catalog::Catalog &catalog) : catalog_(catalog) {}

    std::optional<protocol::Message> Dispatcher::dispatch(const std::string &line)
    {
        auto parsed = parse_line(line);
        if (!parsed)
        {
            spdlog::error("Exception while parsing client data: {}", parsed.failure().message);
            return to_error_message(parsed.failure(), {});
        }
        const auto &json = parsed.value();
        auto state = protocol::read_state(json);

        if (protocol::has_unsuccessful_code(json))
        {
            spdlog::error("Unsuccessful request, dropping it (json: {})", line);
            return std::nullopt;
        }

        auto header = decode_header(json);
        if (!header)
        {
            spdlog::error("Rejected envelope: {}", header.failure().message);
            return to_error_message(header.failure(), std::move(state));
        }

        const auto &envelope = header.value();
        if (!envelope.type)
        {
            spdlog::error("Received unknown payload type: '{}'", envelope.type_label);
            return to_error_message(make_failure(ErrorCode::UnknownType,
                                                 "Unknown payload type: '" + envelope.type_label + "'",
                                                 "dispatch.validate"),
                                    std::move(state));
        }
        if (!protocol::is_receivable(*envelope.type))
        {
            const auto label = std::string(protocol::to_string(*envelope.type));
            spdlog::error("Received unreceivable payload type: {}", label);
            return to_error_message(make_failure(ErrorCode::NotReceivable,
                                                 "Received unreceivable payload type: " + label,
                                                 "dispatch.validate"),
                                    std::move(state));
        }

        auto request = decode_message(json);
        if (!request)
        {
            return to_error_message(request.failure(), std::move(state));
        }

        auto response = route(request.value());
        if (!response)
        {
            spdlog::error("Request {} failed: {}", protocol::to_string(*envelope.type), response.failure().message);
            return to_error_message(response.failure(), std::move(state));
        }
        return std::move(response).value();
    }

    Result<protocol::Message> Dispatcher::route(const protocol::Message &request)
    {
        const auto type = protocol::type_of(request);
        switch (type)
        {
        case protocol::PayloadType::ListRequest:
            return handle_list(request);
        default:
            break;
        }
        spdlog::error("Unsupported type: {}", protocol::to_string(type));
        return make_failure(ErrorCode::Unsupported,
                            "Unsupported payload type: " + std::string(protocol::to_string(type)), "dispatch.route");
    }

    Result<protocol::Message> Dispatcher::handle_list(const protocol::Message &request)
    {
        const auto &list_request = std::get<protocol::ListRequest>(request.body);
        spdlog::info("Got list request. Query: {}", list_request.query);
        try
        {
            const auto uploads = catalog_.list_uploads(list_request.query);
            std::vector<protocol::ListItem> items;
            items.reserve(uploads.size());
            for (const auto &upload : uploads)
            {
                items.push_back(to_list_item(upload));
            }
            return protocol::make_list_response(request.state, std::move(items));
        }
        catch (const catalog::StoreError &ex)
        {
            return make_failure(ex.code(), ex.what(), "dispatch.list");
        }
        catch (const std::exception &ex)
        {
            return make_failure(ErrorCode::InternalError, ex.what(), "dispatch.list");
        }
    }

} // namespace holysheet::server
