/**
 * HolySheet - Socket payload schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "holysheet/error_codes.hpp"

namespace holysheet::protocol
{

    enum class PayloadType : std::uint8_t
    {
        ListRequest,
        ListResponse,
        Error
    };

    std::string_view to_string(PayloadType type) noexcept;
    std::optional<PayloadType> payload_type_from_string(std::string_view value) noexcept;

    // Whether a client may send this type to the server.
    bool is_receivable(PayloadType type) noexcept;

    inline constexpr int kSuccessCode = 1;
    inline constexpr int kFailureCode = 0;

    class ProtocolError : public std::runtime_error
    {
    public:
        ProtocolError(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    /**
     * Envelope fields read ahead of the payload variant. `type` is empty when the
     * label is not one of the known payload types.
     */
    struct Header
    {
        int code{};
        std::string message;
        std::string type_label;
        std::optional<PayloadType> type;
        std::string state;
    };

    /**
     * True for an object whose `code` is missing, null or a number below kSuccessCode.
     * Looks at nothing else, so mistyped envelopes with such a code are still recognised.
     */
    bool has_unsuccessful_code(const nlohmann::json &json) noexcept;

    // Integer `code` clamped to the int range, 0 when absent. Throws ProtocolError on any other JSON type.
    int read_code(const nlohmann::json &json);

    // Throws ProtocolError when the value is not an object or a field has the wrong JSON type.
    Header read_header(const nlohmann::json &json);

    // Best-effort state extraction, used to correlate errors for malformed envelopes.
    std::string read_state(const nlohmann::json &json) noexcept;

    struct ListRequest
    {
        std::string query;
    };

    void to_json(nlohmann::json &json, const ListRequest &request);
    void from_json(const nlohmann::json &json, ListRequest &request);

    struct ListItem
    {
        std::string name;
        std::uint64_t size{};
        int kind_code{};
        std::int64_t modified_at_millis{};
        std::string content_hash;
    };

    void to_json(nlohmann::json &json, const ListItem &item);
    void from_json(const nlohmann::json &json, ListItem &item);

    struct ListResponse
    {
        std::vector<ListItem> items;
    };

    void to_json(nlohmann::json &json, const ListResponse &response);
    void from_json(const nlohmann::json &json, ListResponse &response);

    struct ErrorDetail
    {
        std::string stack_trace;
    };

    void to_json(nlohmann::json &json, const ErrorDetail &detail);
    void from_json(const nlohmann::json &json, ErrorDetail &detail);

    // Alternative order follows PayloadType.
    using Body = std::variant<ListRequest, ListResponse, ErrorDetail>;

    struct Message
    {
        int code{kSuccessCode};
        std::string message;
        std::string state;
        Body body{ListRequest{}};
    };

    PayloadType type_of(const Message &message) noexcept;

    // Envelope and variant fields are written side by side in one flat object.
    void to_json(nlohmann::json &json, const Message &message);
    void from_json(const nlohmann::json &json, Message &message);

    Message make_list_request(std::string query, std::string state);
    Message make_list_response(std::string state, std::vector<ListItem> items);
    Message make_error(std::string message, std::string state, std::string stack_trace);

} // namespace holysheet::protocol
