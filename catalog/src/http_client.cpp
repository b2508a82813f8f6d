#include "holysheet/catalog/http_client.hpp"

#include <memory>
#include <mutex>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "holysheet/catalog/remote_store.hpp"

namespace holysheet::catalog
{

    namespace
    {

        struct CurlEasyDeleter
        {
            void operator()(CURL *handle) const noexcept { curl_easy_cleanup(handle); }
        };

        struct CurlListDeleter
        {
            void operator()(curl_slist *list) const noexcept { curl_slist_free_all(list); }
        };

        using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;
        using CurlList = std::unique_ptr<curl_slist, CurlListDeleter>;

        void ensure_global_init()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                {
                    throw StoreError(ErrorCode::Transport, "curl_global_init failed");
                } });
        }

        size_t write_cb(char *ptr, size_t size, size_t nmemb, void *userdata)
        {
            const size_t total = size * nmemb;
            auto *body = static_cast<std::string *>(userdata);
            body->append(ptr, total);
            return total;
        }

    } // namespace

    HttpClient::HttpClient(std::chrono::milliseconds connect_timeout)
        : connect_timeout_(connect_timeout)
    {
        ensure_global_init();
    }

    HttpResponse HttpClient::request(std::string_view method, const std::string &url,
                                     const std::vector<std::string> &headers,
                                     const std::optional<std::string> &body) const
    {
        CurlEasy curl(curl_easy_init());
        if (!curl)
        {
            throw StoreError(ErrorCode::Transport, "curl_easy_init failed");
        }

        CurlList header_list;
        for (const auto &header : headers)
        {
            auto *appended = curl_slist_append(header_list.get(), header.c_str());
            if (appended == nullptr)
            {
                throw StoreError(ErrorCode::Transport, "curl_slist_append failed");
            }
            header_list.release();
            header_list.reset(appended);
        }

        HttpResponse response;
        const std::string method_string(method);
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method_string.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_.count()));
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
        if (body)
        {
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
        }

        const CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK)
        {
            spdlog::error("HTTP {} {} failed: {}", method_string, url, curl_easy_strerror(rc));
            throw StoreError(ErrorCode::Transport, std::string("HTTP request failed: ") + curl_easy_strerror(rc));
        }
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        spdlog::debug("HTTP {} {} -> {}", method_string, url, response.status);
        return response;
    }

    std::string url_encode(std::string_view value)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string encoded;
        encoded.reserve(value.size() * 3);
        for (const char ch : value)
        {
            const auto c = static_cast<unsigned char>(ch);
            if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
                c == '_' || c == '.' || c == '~')
            {
                encoded.push_back(ch);
                continue;
            }
            encoded.push_back('%');
            encoded.push_back(kHexDigits[(c >> 4) & 0x0F]);
            encoded.push_back(kHexDigits[c & 0x0F]);
        }
        return encoded;
    }

} // namespace holysheet::catalog
