#include "holysheet/protocol.hpp"

#include <array>
#include <cstdint>
#include <limits>

namespace holysheet::protocol
{

    namespace
    {

        struct PayloadTypeMapping
        {
            PayloadType type;
            std::string_view label;
            bool receivable;
        };

        constexpr std::array<PayloadTypeMapping, 3> kPayloadTypeMappings{{
            {PayloadType::ListRequest, "LIST_REQUEST", true},
            {PayloadType::ListResponse, "LIST_RESPONSE", false},
            {PayloadType::Error, "ERROR", false},
        }};

        template <typename T>
        T optional_field(const nlohmann::json &json, const char *key, T fallback)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return fallback;
            }
            return it->template get<T>();
        }

        int clamp_code(std::int64_t value) noexcept
        {
            if (value < std::numeric_limits<int>::min())
            {
                return std::numeric_limits<int>::min();
            }
            if (value > std::numeric_limits<int>::max())
            {
                return std::numeric_limits<int>::max();
            }
            return static_cast<int>(value);
        }

    } // namespace

    std::string_view to_string(PayloadType type) noexcept
    {
        for (const auto &mapping : kPayloadTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<PayloadType> payload_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kPayloadTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    bool is_receivable(PayloadType type) noexcept
    {
        for (const auto &mapping : kPayloadTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.receivable;
            }
        }
        return false;
    }

    ProtocolError::ProtocolError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

    bool has_unsuccessful_code(const nlohmann::json &json) noexcept
    {
        if (!json.is_object())
        {
            return false;
        }
        const auto it = json.find("code");
        if (it == json.end() || it->is_null())
        {
            return true;
        }
        if (it->is_number_unsigned())
        {
            return false;
        }
        if (it->is_number_integer())
        {
            return it->get<std::int64_t>() < kSuccessCode;
        }
        if (it->is_number_float())
        {
            // Compared as a double, never narrowed.
            return it->get<double>() < static_cast<double>(kSuccessCode);
        }
        return false;
    }

    int read_code(const nlohmann::json &json)
    {
        const auto it = json.find("code");
        if (it == json.end() || it->is_null())
        {
            return 0;
        }
        if (it->is_number_unsigned())
        {
            const auto value = it->get<std::uint64_t>();
            return value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                       ? std::numeric_limits<int>::max()
                       : static_cast<int>(value);
        }
        if (!it->is_number_integer())
        {
            throw ProtocolError(ErrorCode::InvalidPayload, "Envelope code must be an integer");
        }
        return clamp_code(it->get<std::int64_t>());
    }

    Header read_header(const nlohmann::json &json)
    {
        if (!json.is_object())
        {
            throw ProtocolError(ErrorCode::InvalidPayload, "Payload must be a JSON object");
        }
        try
        {
            Header header;
            header.code = read_code(json);
            header.message = optional_field<std::string>(json, "message", {});
            header.state = optional_field<std::string>(json, "state", {});
            header.type_label = optional_field<std::string>(json, "type", {});
            header.type = payload_type_from_string(header.type_label);
            return header;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ProtocolError(ErrorCode::InvalidPayload, std::string("Malformed envelope: ") + ex.what());
        }
    }

    std::string read_state(const nlohmann::json &json) noexcept
    {
        if (!json.is_object())
        {
            return {};
        }
        const auto it = json.find("state");
        if (it == json.end() || !it->is_string())
        {
            return {};
        }
        return it->get<std::string>();
    }

    void to_json(nlohmann::json &json, const ListRequest &request)
    {
        json = {{"query", request.query}};
    }

    void from_json(const nlohmann::json &json, ListRequest &request)
    {
        request.query = optional_field<std::string>(json, "query", {});
    }

    void to_json(nlohmann::json &json, const ListItem &item)
    {
        json = {
            {"name", item.name},
            {"size", item.size},
            {"kindCode", item.kind_code},
            {"modifiedAtMillis", item.modified_at_millis},
            {"contentHash", item.content_hash},
        };
    }

    void from_json(const nlohmann::json &json, ListItem &item)
    {
        item.name = json.at("name").get<std::string>();
        item.size = json.value("size", std::uint64_t{0});
        item.kind_code = json.value("kindCode", 0);
        item.modified_at_millis = json.value("modifiedAtMillis", std::int64_t{0});
        item.content_hash = json.value("contentHash", std::string{});
    }

    void to_json(nlohmann::json &json, const ListResponse &response)
    {
        json = {{"items", response.items}};
    }

    void from_json(const nlohmann::json &json, ListResponse &response)
    {
        response.items = json.value("items", std::vector<ListItem>{});
    }

    void to_json(nlohmann::json &json, const ErrorDetail &detail)
    {
        json = {{"stackTrace", detail.stack_trace}};
    }

    void from_json(const nlohmann::json &json, ErrorDetail &detail)
    {
        detail.stack_trace = optional_field<std::string>(json, "stackTrace", {});
    }

    PayloadType type_of(const Message &message) noexcept
    {
        return static_cast<PayloadType>(message.body.index());
    }

    void to_json(nlohmann::json &json, const Message &message)
    {
        std::visit([&json](const auto &body)
                   { json = body; },
                   message.body);
        json["code"] = message.code;
        json["message"] = message.message;
        json["type"] = to_string(type_of(message));
        json["state"] = message.state;
    }

    void from_json(const nlohmann::json &json, Message &message)
    {
        const auto header = read_header(json);
        if (!header.type)
        {
            throw ProtocolError(ErrorCode::UnknownType, "Unknown payload type: '" + header.type_label + "'");
        }
        message.code = header.code;
        message.message = header.message;
        message.state = header.state;
        switch (*header.type)
        {
        case PayloadType::ListRequest:
            message.body = json.get<ListRequest>();
            break;
        case PayloadType::ListResponse:
            message.body = json.get<ListResponse>();
            break;
        case PayloadType::Error:
            message.body = json.get<ErrorDetail>();
            break;
        }
    }

    Message make_list_request(std::string query, std::string state)
    {
        Message message;
        message.code = kSuccessCode;
        message.state = std::move(state);
        message.body = ListRequest{std::move(query)};
        return message;
    }

    Message make_list_response(std::string state, std::vector<ListItem> items)
    {
        Message message;
        message.code = kSuccessCode;
        message.message = "Success";
        message.state = std::move(state);
        message.body = ListResponse{std::move(items)};
        return message;
    }

    Message make_error(std::string message, std::string state, std::string stack_trace)
    {
        Message error;
        error.code = kFailureCode;
        error.message = std::move(message);
        error.state = std::move(state);
        error.body = ErrorDetail{std::move(stack_trace)};
        return error;
    }

} // namespace holysheet::protocol
