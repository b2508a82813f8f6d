#include "holysheet/catalog/memory_store.hpp"

#include <algorithm>
#include <charconv>
#include <set>
#include <string_view>
#include <thread>

#include <spdlog/spdlog.h>

#include "holysheet/catalog/store_query.hpp"
#include "holysheet/crypto.hpp"

namespace holysheet::catalog
{

    namespace
    {

        std::string trim(std::string_view input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return std::string(input.substr(begin, end - begin + 1));
        }

        std::set<std::string> split_fields(const std::string &fields)
        {
            std::set<std::string> names;
            std::size_t start = 0;
            while (start <= fields.size())
            {
                const auto comma = fields.find(',', start);
                const auto end = comma == std::string::npos ? fields.size() : comma;
                auto name = trim(std::string_view(fields).substr(start, end - start));
                if (!name.empty())
                {
                    names.insert(std::move(name));
                }
                if (comma == std::string::npos)
                {
                    break;
                }
                start = comma + 1;
            }
            return names;
        }

        std::size_t parse_page_token(const std::optional<std::string> &token)
        {
            if (!token || token->empty())
            {
                return 0;
            }
            std::size_t offset = 0;
            const auto *begin = token->data();
            const auto *end = token->data() + token->size();
            const auto [ptr, ec] = std::from_chars(begin, end, offset);
            if (ec != std::errc() || ptr != end)
            {
                throw StoreError(ErrorCode::Service, "Invalid page token: " + *token);
            }
            return offset;
        }

    } // namespace

    RemoteItem project_fields(const RemoteItem &item, const std::string &fields)
    {
        const auto names = split_fields(fields);
        if (names.empty() || names.count("*") > 0)
        {
            return item;
        }
        RemoteItem projected;
        if (names.count("id") > 0)
        {
            projected.id = item.id;
        }
        if (names.count("name") > 0)
        {
            projected.name = item.name;
        }
        if (names.count("mimeType") > 0)
        {
            projected.mime_type = item.mime_type;
            projected.kind = item.kind;
        }
        if (names.count("parents") > 0)
        {
            projected.parents = item.parents;
        }
        if (names.count("properties") > 0)
        {
            projected.properties = item.properties;
        }
        if (names.count("trashed") > 0)
        {
            projected.trashed = item.trashed;
        }
        if (names.count("size") > 0)
        {
            projected.size = item.size;
        }
        if (names.count("modifiedTime") > 0)
        {
            projected.modified_time_ms = item.modified_time_ms;
        }
        if (names.count("md5Checksum") > 0)
        {
            projected.content_hash = item.content_hash;
        }
        return projected;
    }

    RemoteItem MemoryStore::get(const std::string &id, const std::string &fields)
    {
        before_request();
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = find_locked(id);
        if (it == items_.end())
        {
            throw StoreError(ErrorCode::NotFound, "File not found: " + id);
        }
        return project_fields(*it, fields);
    }

    ListPage MemoryStore::list(const ListQuery &query)
    {
        before_request();
        const auto parsed = query::Query::parse(query.query);
        const auto page_size = std::max<std::size_t>(query.page_size, 1);

        std::lock_guard<std::mutex> lock(mutex_);
        ++list_calls_;
        std::vector<const RemoteItem *> matches;
        for (const auto &item : items_)
        {
            if (parsed.matches(item))
            {
                matches.push_back(&item);
            }
        }

        const auto offset = std::min(parse_page_token(query.page_token), matches.size());
        const auto end = std::min(offset + page_size, matches.size());
        ListPage page;
        page.items.reserve(end - offset);
        for (std::size_t i = offset; i < end; ++i)
        {
            page.items.push_back(project_fields(*matches[i], query.fields));
        }
        if (end < matches.size())
        {
            page.next_page_token = std::to_string(end);
        }
        spdlog::debug("memory store: '{}' matched {} items, page {}..{}", query.query, matches.size(), offset, end);
        return page;
    }

    RemoteItem MemoryStore::create(const NewItem &item, const std::string &fields)
    {
        before_request();
        RemoteItem created;
        created.id = crypto::random_id();
        created.name = item.name;
        created.mime_type = item.mime_type;
        created.kind = kind_from_mime_type(item.mime_type);
        created.parents = item.parents;
        created.properties = item.properties;

        std::lock_guard<std::mutex> lock(mutex_);
        ++create_calls_;
        created.modified_time_ms = ++clock_ms_;
        items_.push_back(created);
        return project_fields(created, fields);
    }

    void MemoryStore::replace_properties(const std::string &id, const Properties &properties)
    {
        before_request();
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = find_locked(id);
        if (it == items_.end())
        {
            throw StoreError(ErrorCode::NotFound, "File not found: " + id);
        }
        it->properties = properties;
        it->modified_time_ms = ++clock_ms_;
    }

    RemoteItem MemoryStore::insert(RemoteItem item)
    {
        if (item.id.empty())
        {
            item.id = crypto::random_id();
        }
        if (item.kind == ItemKind::Other && !item.mime_type.empty())
        {
            item.kind = kind_from_mime_type(item.mime_type);
        }
        else if (item.mime_type.empty())
        {
            item.mime_type = std::string(mime_type_of(item.kind));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (item.modified_time_ms == 0)
        {
            item.modified_time_ms = ++clock_ms_;
        }
        items_.push_back(item);
        return item;
    }

    void MemoryStore::fail_requests(std::optional<ErrorCode> code)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = code;
    }

    void MemoryStore::set_latency(std::chrono::milliseconds latency)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latency_ = latency;
    }

    std::size_t MemoryStore::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    std::size_t MemoryStore::list_calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return list_calls_;
    }

    std::size_t MemoryStore::create_calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return create_calls_;
    }

    void MemoryStore::before_request()
    {
        std::chrono::milliseconds latency{0};
        std::optional<ErrorCode> failure;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            latency = latency_;
            failure = failure_;
        }
        if (latency.count() > 0)
        {
            std::this_thread::sleep_for(latency);
        }
        if (failure)
        {
            throw StoreError(*failure, "Simulated store failure: " + std::string(to_string(*failure)));
        }
    }

    std::vector<RemoteItem>::iterator MemoryStore::find_locked(const std::string &id)
    {
        return std::find_if(items_.begin(), items_.end(), [&id](const RemoteItem &item)
                            { return item.id == id; });
    }

} // namespace holysheet::catalog
