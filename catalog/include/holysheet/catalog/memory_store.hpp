/**
 * HolySheet - In-process RemoteStore.
 *
 * Items live in creation order and queries are evaluated with the store query
 * grammar, so paging and filtering behave like the remote service. Used by the
 * offline server mode and by the tests.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "holysheet/catalog/remote_store.hpp"

namespace holysheet::catalog
{

    class MemoryStore : public RemoteStore
    {
    public:
        MemoryStore() = default;

        RemoteItem get(const std::string &id, const std::string &fields) override;
        ListPage list(const ListQuery &query) override;
        RemoteItem create(const NewItem &item, const std::string &fields) override;
        void replace_properties(const std::string &id, const Properties &properties) override;

        // Inserts an item as-is; an empty id is replaced with a generated one.
        RemoteItem insert(RemoteItem item);

        // While set, every request fails with this code (Transport, Service, ...).
        void fail_requests(std::optional<ErrorCode> code);

        // Delay applied to every request, outside the store lock.
        void set_latency(std::chrono::milliseconds latency);

        std::size_t size() const;
        std::size_t list_calls() const;
        std::size_t create_calls() const;

    private:
        void before_request();
        std::vector<RemoteItem>::iterator find_locked(const std::string &id);

        mutable std::mutex mutex_;
        std::vector<RemoteItem> items_;
        std::optional<ErrorCode> failure_;
        std::chrono::milliseconds latency_{0};
        std::size_t list_calls_{0};
        std::size_t create_calls_{0};
        std::int64_t clock_ms_{1'600'000'000'000};
    };

    // Copy of `item` holding only the requested fields ("*" or blank keeps everything).
    RemoteItem project_fields(const RemoteItem &item, const std::string &fields);

} // namespace holysheet::catalog
