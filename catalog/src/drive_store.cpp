#include "holysheet/catalog/drive_store.hpp"

#include <chrono>
#include <cstdio>
#include <string>
#include <vector>
#include <utility>

#include <spdlog/spdlog.h>

namespace holysheet::catalog
{

    namespace
    {

        constexpr std::string_view kFilesPath = "/drive/v3/files";

        std::string error_message_of(const HttpResponse &response)
        {
            try
            {
                const auto json = nlohmann::json::parse(response.body);
                if (const auto error = json.find("error"); error != json.end() && error->is_object())
                {
                    return error->value("message", std::string{});
                }
            }
            catch (const nlohmann::json::exception &)
            {
                // Non-JSON error bodies are reported by status only.
            }
            return {};
        }

        std::uint64_t parse_size(const nlohmann::json &value)
        {
            if (value.is_number_unsigned() || value.is_number_integer())
            {
                return value.get<std::uint64_t>();
            }
            if (value.is_string())
            {
                try
                {
                    return std::stoull(value.get<std::string>());
                }
                catch (const std::exception &)
                {
                    return 0;
                }
            }
            return 0;
        }

    } // namespace

    std::int64_t parse_rfc3339_millis(std::string_view text)
    {
        int year = 0;
        unsigned month = 0;
        unsigned day = 0;
        int hour = 0;
        int minute = 0;
        int second = 0;
        int consumed = 0;
        const std::string buffer(text);
        if (std::sscanf(buffer.c_str(), "%4d-%2u-%2uT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second,
                        &consumed) != 6)
        {
            return 0;
        }

        std::int64_t millis = 0;
        std::size_t pos = static_cast<std::size_t>(consumed);
        if (pos < buffer.size() && buffer[pos] == '.')
        {
            ++pos;
            int digits = 0;
            while (pos < buffer.size() && buffer[pos] >= '0' && buffer[pos] <= '9')
            {
                if (digits < 3)
                {
                    millis = millis * 10 + (buffer[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            for (; digits < 3; ++digits)
            {
                millis *= 10;
            }
        }

        std::int64_t offset_seconds = 0;
        if (pos < buffer.size() && (buffer[pos] == '+' || buffer[pos] == '-'))
        {
            int offset_hours = 0;
            int offset_minutes = 0;
            if (std::sscanf(buffer.c_str() + pos + 1, "%2d:%2d", &offset_hours, &offset_minutes) != 2)
            {
                return 0;
            }
            offset_seconds = (offset_hours * 3600 + offset_minutes * 60) * (buffer[pos] == '+' ? 1 : -1);
        }
        else if (pos >= buffer.size() || (buffer[pos] != 'Z' && buffer[pos] != 'z'))
        {
            return 0;
        }

        using namespace std::chrono;
        const year_month_day date{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
        if (!date.ok())
        {
            return 0;
        }
        const auto midnight = sys_days{date};
        const auto seconds_since_epoch =
            duration_cast<seconds>(midnight.time_since_epoch()).count() + hour * 3600 + minute * 60 + second -
            offset_seconds;
        return seconds_since_epoch * 1000 + millis;
    }

    RemoteItem parse_drive_file(const nlohmann::json &json)
    {
        RemoteItem item;
        item.id = json.value("id", std::string{});
        item.name = json.value("name", std::string{});
        item.mime_type = json.value("mimeType", std::string{});
        item.kind = kind_from_mime_type(item.mime_type);
        item.parents = json.value("parents", std::vector<std::string>{});
        item.trashed = json.value("trashed", false);
        if (const auto properties = json.find("properties"); properties != json.end() && properties->is_object())
        {
            for (const auto &[key, value] : properties->items())
            {
                if (value.is_string())
                {
                    item.properties.emplace(key, value.get<std::string>());
                }
            }
        }
        if (const auto size = json.find("size"); size != json.end())
        {
            item.size = parse_size(*size);
        }
        if (const auto modified = json.find("modifiedTime"); modified != json.end() && modified->is_string())
        {
            item.modified_time_ms = parse_rfc3339_millis(modified->get<std::string>());
        }
        if (const auto checksum = json.find("md5Checksum"); checksum != json.end() && checksum->is_string())
        {
            item.content_hash = checksum->get<std::string>();
        }
        return item;
    }

    std::string build_list_request(const ListQuery &query)
    {
        std::string request(kFilesPath);
        request += "?pageSize=" + std::to_string(query.page_size);
        request += "&fields=" + url_encode("nextPageToken, files(" + query.fields + ")");
        if (!query.query.empty())
        {
            request += "&q=" + url_encode(query.query);
        }
        if (query.page_token && !query.page_token->empty())
        {
            request += "&pageToken=" + url_encode(*query.page_token);
        }
        return request;
    }

    DriveStore::DriveStore(DriveConfig config)
        : config_(std::move(config)),
          http_(config_.connect_timeout)
    {
        if (config_.access_token.empty())
        {
            throw StoreError(ErrorCode::Transport, "Drive access token is empty");
        }
    }

    RemoteItem DriveStore::get(const std::string &id, const std::string &fields)
    {
        const auto json = call("GET", std::string(kFilesPath) + "/" + url_encode(id) + "?fields=" + url_encode(fields));
        return parse_drive_file(json);
    }

    ListPage DriveStore::list(const ListQuery &query)
    {
        const auto json = call("GET", build_list_request(query));
        ListPage page;
        if (const auto files = json.find("files"); files != json.end() && files->is_array())
        {
            page.items.reserve(files->size());
            for (const auto &file : *files)
            {
                page.items.push_back(parse_drive_file(file));
            }
        }
        if (const auto token = json.find("nextPageToken"); token != json.end() && token->is_string())
        {
            page.next_page_token = token->get<std::string>();
        }
        return page;
    }

    RemoteItem DriveStore::create(const NewItem &item, const std::string &fields)
    {
        nlohmann::json body = {
            {"name", item.name},
            {"mimeType", item.mime_type},
        };
        if (!item.parents.empty())
        {
            body["parents"] = item.parents;
        }
        if (!item.properties.empty())
        {
            body["properties"] = item.properties;
        }
        const auto json = call("POST", std::string(kFilesPath) + "?fields=" + url_encode(fields), body);
        return parse_drive_file(json);
    }

    void DriveStore::replace_properties(const std::string &id, const Properties &properties)
    {
        // Drive merges property updates, so keys to drop are sent as null.
        const auto current = get(id, "id, properties");
        nlohmann::json patch = nlohmann::json::object();
        for (const auto &[key, value] : current.properties)
        {
            if (properties.find(key) == properties.end())
            {
                patch[key] = nullptr;
            }
        }
        for (const auto &[key, value] : properties)
        {
            patch[key] = value;
        }
        call("PATCH", std::string(kFilesPath) + "/" + url_encode(id) + "?fields=" + url_encode("id, properties"),
             nlohmann::json{{"properties", patch}});
    }

    nlohmann::json DriveStore::call(std::string_view method, const std::string &path_and_query,
                                    const std::optional<nlohmann::json> &body)
    {
        std::vector<std::string> headers{"Authorization: Bearer " + config_.access_token,
                                         "Accept: application/json"};
        std::optional<std::string> payload;
        if (body)
        {
            headers.emplace_back("Content-Type: application/json; charset=UTF-8");
            payload = body->dump();
        }

        const auto response = http_.request(method, config_.api_base + path_and_query, headers, payload);
        if (response.status == 404)
        {
            throw StoreError(ErrorCode::NotFound, "Drive item not found: " + path_and_query);
        }
        if (response.status < 200 || response.status >= 300)
        {
            auto detail = error_message_of(response);
            spdlog::error("Drive {} {} returned {}: {}", method, path_and_query, response.status, detail);
            throw StoreError(ErrorCode::Service,
                             "Drive request failed with HTTP " + std::to_string(response.status) +
                                 (detail.empty() ? std::string{} : ": " + detail));
        }
        if (response.body.empty())
        {
            return nlohmann::json::object();
        }
        try
        {
            return nlohmann::json::parse(response.body);
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw StoreError(ErrorCode::Service, std::string("Malformed Drive response: ") + ex.what());
        }
    }

} // namespace holysheet::catalog
