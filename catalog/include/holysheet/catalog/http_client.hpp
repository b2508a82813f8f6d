/**
 * HolySheet - Minimal blocking HTTP client on the libcurl easy API.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace holysheet::catalog
{

    struct HttpResponse
    {
        long status{};
        std::string body;
    };

    class HttpClient
    {
    public:
        explicit HttpClient(std::chrono::milliseconds connect_timeout = std::chrono::seconds{10});

        // Throws StoreError(Transport) when the request could not be performed; any HTTP status is returned.
        HttpResponse request(std::string_view method, const std::string &url, const std::vector<std::string> &headers,
                             const std::optional<std::string> &body = std::nullopt) const;

    private:
        std::chrono::milliseconds connect_timeout_;
    };

    // Percent-encodes everything outside the RFC 3986 unreserved set.
    std::string url_encode(std::string_view value);

} // namespace holysheet::catalog
