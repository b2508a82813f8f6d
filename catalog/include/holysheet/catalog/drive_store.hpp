/**
 * HolySheet - RemoteStore backed by the Google Drive v3 REST API.
 *
 * The access token is obtained elsewhere and handed over ready to use; token
 * refresh is not handled here.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "holysheet/catalog/http_client.hpp"
#include "holysheet/catalog/remote_store.hpp"

namespace holysheet::catalog
{

    struct DriveConfig
    {
        std::string api_base{"https://www.googleapis.com"};
        std::string access_token;
        std::chrono::milliseconds connect_timeout{std::chrono::seconds{10}};
    };

    class DriveStore : public RemoteStore
    {
    public:
        explicit DriveStore(DriveConfig config);

        RemoteItem get(const std::string &id, const std::string &fields) override;
        ListPage list(const ListQuery &query) override;
        RemoteItem create(const NewItem &item, const std::string &fields) override;
        void replace_properties(const std::string &id, const Properties &properties) override;

    private:
        nlohmann::json call(std::string_view method, const std::string &path_and_query,
                            const std::optional<nlohmann::json> &body = std::nullopt);

        DriveConfig config_;
        HttpClient http_;
    };

    // Maps a Drive `files` resource to a RemoteItem; absent fields keep their defaults.
    RemoteItem parse_drive_file(const nlohmann::json &json);

    // Epoch milliseconds of an RFC 3339 UTC timestamp such as "2020-03-01T10:15:30.250Z"; 0 when unparsable.
    std::int64_t parse_rfc3339_millis(std::string_view text);

    // Drive `files.list` path and query string for one page.
    std::string build_list_request(const ListQuery &query);

} // namespace holysheet::catalog
