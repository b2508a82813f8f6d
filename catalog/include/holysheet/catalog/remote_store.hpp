/**
 * HolySheet - Boundary to the remote hierarchical store.
 *
 * The catalog only needs four primitives from a store: fetch one item, list a
 * page of items matching a query, create an item and replace an item's
 * properties. Queries use the store query grammar (see store_query.hpp).
 */
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "holysheet/catalog/remote_item.hpp"
#include "holysheet/error_codes.hpp"

namespace holysheet::catalog
{

    // NotFound is the only condition callers branch on; everything else is Transport,
    // Service or InvalidQuery.
    class StoreError : public std::runtime_error
    {
    public:
        StoreError(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    struct ListQuery
    {
        std::string query;
        std::size_t page_size{50};
        std::optional<std::string> page_token;
        std::string fields{kDefaultFields};
    };

    struct ListPage
    {
        std::vector<RemoteItem> items;
        std::optional<std::string> next_page_token;
    };

    struct NewItem
    {
        std::string name;
        std::string mime_type;
        std::vector<std::string> parents;
        Properties properties;
    };

    class RemoteStore
    {
    public:
        virtual ~RemoteStore() = default;

        virtual RemoteItem get(const std::string &id, const std::string &fields) = 0;

        virtual ListPage list(const ListQuery &query) = 0;

        virtual RemoteItem create(const NewItem &item, const std::string &fields) = 0;

        // Afterwards the item carries exactly `properties`.
        virtual void replace_properties(const std::string &id, const Properties &properties) = 0;
    };

} // namespace holysheet::catalog
