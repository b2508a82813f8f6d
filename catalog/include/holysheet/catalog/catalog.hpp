/**
 * HolySheet - Catalog operations over a RemoteStore.
 *
 * Uploads are folders tagged `directParent = "true"` and grouped by the
 * virtual `path` property. All catalog items live under a single root
 * container folder that is found or created on first use.
 */
#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "holysheet/catalog/remote_item.hpp"
#include "holysheet/catalog/remote_store.hpp"

namespace holysheet::catalog
{

    struct CatalogOptions
    {
        std::string root_name{"sheetStore"};
        std::size_t page_size{50};
    };

    class Catalog
    {
    public:
        explicit Catalog(RemoteStore &store, CatalogOptions options = {});

        // A NotFound from the store yields nullopt; other store errors propagate.
        std::optional<RemoteItem> get_file(const std::string &id);

        // Every store error propagates, including NotFound.
        RemoteItem get_file(const std::string &id, const std::string &fields);

        /**
         * Id of the first folder whose name contains `name`. Single quotes are
         * removed from `name`. When `in_root_container` is set the folder must be
         * a child of the root container. Lookup failures read as "none found".
         */
        std::optional<std::string> get_id_of_name(const std::string &name, bool in_root_container = true);

        /**
         * Upload folders at `path`, or every starred upload when `starred` is
         * set (the path is then ignored). An invalid path lists "/". Store
         * failures are logged and produce an empty list.
         */
        std::vector<RemoteItem> list_uploads(const std::string &path = "/", bool starred = false,
                                             bool trashed = false);

        std::vector<RemoteItem> get_all_sheets();
        std::vector<RemoteItem> get_all_sheets(const std::string &parent_id);

        RemoteItem create_folder(const std::string &name, const std::optional<std::string> &parent_id = std::nullopt,
                                 const std::optional<Properties> &properties = std::nullopt);

        // Merge: keys in `properties` override, every other existing key is kept.
        void add_properties(const RemoteItem &item, const Properties &properties);
        void add_properties(const std::string &id, const Properties &properties);

        // Replace: keys missing from `properties` are cleared.
        void set_properties(const RemoteItem &item, const Properties &properties);
        void set_properties(const std::string &id, const Properties &properties);

        /**
         * Pages through the store collecting items of the given kinds (any kind
         * when `kinds` is empty) that match `filter`. Stops after `limit` items;
         * a limit of -1 walks every page, so use it sparingly.
         */
        std::vector<RemoteItem> get_files(int limit, const std::optional<std::string> &filter, const std::string &fields,
                                          const std::vector<ItemKind> &kinds);
        std::vector<RemoteItem> get_files(int limit, const std::optional<std::string> &filter,
                                          const std::vector<ItemKind> &kinds);
        std::vector<RemoteItem> get_files(int limit, const std::vector<ItemKind> &kinds);

        // Finds or creates the root container once per process; a failed lookup is retried on the next call.
        RemoteItem root_container();

    private:
        RemoteItem find_or_create_root();

        RemoteStore &store_;
        CatalogOptions options_;
        std::mutex root_mutex_;
        std::optional<RemoteItem> root_container_;
    };

} // namespace holysheet::catalog
