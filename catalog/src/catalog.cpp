#include "holysheet/catalog/catalog.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "holysheet/catalog/store_query.hpp"
#include "holysheet/catalog/virtual_path.hpp"

namespace holysheet::catalog
{

    namespace
    {

        constexpr std::string_view kTrue = "true";

        std::string with_mime_type_field(const std::string &fields)
        {
            if (fields.find('*') != std::string::npos || fields.find("mimeType") != std::string::npos)
            {
                return fields;
            }
            return fields.empty() ? std::string("mimeType") : fields + ", mimeType";
        }

        std::string strip_quotes(std::string value)
        {
            value.erase(std::remove(value.begin(), value.end(), '\''), value.end());
            return value;
        }

    } // namespace

    Catalog::Catalog(RemoteStore &store, CatalogOptions options)
        : store_(store), options_(std::move(options))
    {
        if (options_.page_size == 0)
        {
            options_.page_size = CatalogOptions{}.page_size;
        }
    }

    std::optional<RemoteItem> Catalog::get_file(const std::string &id)
    {
        try
        {
            return store_.get(id, std::string(kDefaultFields));
        }
        catch (const StoreError &ex)
        {
            if (ex.code() == ErrorCode::NotFound)
            {
                return std::nullopt;
            }
            throw;
        }
    }

    RemoteItem Catalog::get_file(const std::string &id, const std::string &fields)
    {
        return store_.get(id, fields);
    }

    std::optional<std::string> Catalog::get_id_of_name(const std::string &name, bool in_root_container)
    {
        try
        {
            std::vector<std::string> clauses;
            if (in_root_container)
            {
                clauses.push_back(query::in_parents(root_container().id));
            }
            clauses.push_back(query::name_contains(strip_quotes(name)));

            const auto files = get_files(1, query::all_of(clauses), {ItemKind::Folder});
            if (files.empty())
            {
                return std::nullopt;
            }
            return files.front().id;
        }
        catch (const std::exception &ex)
        {
            spdlog::debug("Lookup of folder '{}' failed: {}", name, ex.what());
            return std::nullopt;
        }
    }

    std::vector<RemoteItem> Catalog::list_uploads(const std::string &path, bool starred, bool trashed)
    {
        const auto normalized = normalize_virtual_path(path);
        std::vector<std::string> clauses{query::property_equals(kDirectParentProperty, kTrue)};
        if (starred)
        {
            clauses.push_back(query::property_equals(kStarredProperty, kTrue));
        }
        else
        {
            clauses.push_back(query::property_equals(kPathProperty, normalized));
        }
        clauses.push_back(query::trashed_equals(trashed));

        try
        {
            return get_files(-1, query::all_of(clauses), {ItemKind::Folder});
        }
        catch (const std::exception &ex)
        {
            spdlog::error("An error occurred while listing uploads at {}: {}", normalized, ex.what());
            return {};
        }
    }

    std::vector<RemoteItem> Catalog::get_all_sheets()
    {
        return get_files(-1, query::property_equals(kDirectParentProperty, kTrue), {ItemKind::Document});
    }

    std::vector<RemoteItem> Catalog::get_all_sheets(const std::string &parent_id)
    {
        return get_files(-1, query::in_parents(parent_id), {ItemKind::Document});
    }

    RemoteItem Catalog::create_folder(const std::string &name, const std::optional<std::string> &parent_id,
                                      const std::optional<Properties> &properties)
    {
        NewItem item;
        item.name = name;
        item.mime_type = std::string(kFolderMimeType);
        if (parent_id)
        {
            item.parents.push_back(*parent_id);
        }
        if (properties)
        {
            item.properties = *properties;
        }
        auto created = store_.create(item, std::string(kDefaultFields));
        spdlog::info("Created folder '{}' ({})", created.name, created.id);
        return created;
    }

    void Catalog::add_properties(const RemoteItem &item, const Properties &properties)
    {
        auto combined = item.properties;
        for (const auto &[key, value] : properties)
        {
            combined[key] = value;
        }
        set_properties(item.id, combined);
    }

    void Catalog::add_properties(const std::string &id, const Properties &properties)
    {
        add_properties(get_file(id, "id, properties"), properties);
    }

    void Catalog::set_properties(const RemoteItem &item, const Properties &properties)
    {
        set_properties(item.id, properties);
    }

    void Catalog::set_properties(const std::string &id, const Properties &properties)
    {
        store_.replace_properties(id, properties);
    }

    std::vector<RemoteItem> Catalog::get_files(int limit, const std::optional<std::string> &filter,
                                               const std::string &fields, const std::vector<ItemKind> &kinds)
    {
        if (limit == 0)
        {
            return {};
        }

        std::vector<std::string> kind_clauses;
        kind_clauses.reserve(kinds.size());
        for (const auto kind : kinds)
        {
            kind_clauses.push_back(query::mime_type_equals(mime_type_of(kind)));
        }

        ListQuery request;
        request.query = query::all_of({query::any_of(kind_clauses), filter.value_or(std::string{})});
        request.page_size = options_.page_size;
        request.fields = with_mime_type_field(fields);

        std::vector<RemoteItem> found;
        do
        {
            auto page = store_.list(request);
            request.page_token = std::move(page.next_page_token);
            if (page.items.empty())
            {
                break;
            }

            for (auto &item : page.items)
            {
                if (!kinds.empty() && std::find(kinds.begin(), kinds.end(), item.kind) == kinds.end())
                {
                    spdlog::debug("Skipping {} '{}' outside the requested kinds", to_string(item.kind), item.name);
                    continue;
                }
                found.push_back(std::move(item));
                if (limit >= 0 && found.size() >= static_cast<std::size_t>(limit))
                {
                    return found;
                }
            }
        } while (request.page_token);

        return found;
    }

    std::vector<RemoteItem> Catalog::get_files(int limit, const std::optional<std::string> &filter,
                                               const std::vector<ItemKind> &kinds)
    {
        return get_files(limit, filter, std::string(kDefaultFields), kinds);
    }

    std::vector<RemoteItem> Catalog::get_files(int limit, const std::vector<ItemKind> &kinds)
    {
        return get_files(limit, std::nullopt, kinds);
    }

    RemoteItem Catalog::root_container()
    {
        std::lock_guard<std::mutex> lock(root_mutex_);
        if (!root_container_)
        {
            root_container_ = find_or_create_root();
        }
        return *root_container_;
    }

    RemoteItem Catalog::find_or_create_root()
    {
        const auto existing = get_files(1, query::name_equals(options_.root_name), {ItemKind::Folder});
        if (!existing.empty())
        {
            spdlog::info("Using root container '{}' ({})", existing.front().name, existing.front().id);
            return existing.front();
        }
        return create_folder(options_.root_name);
    }

} // namespace holysheet::catalog
