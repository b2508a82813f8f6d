#include <algorithm>
#include <cassert>
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "holysheet/catalog/catalog.hpp"
#include "holysheet/catalog/memory_store.hpp"

using namespace holysheet;
using namespace holysheet::catalog;

namespace
{

    RemoteItem seed(MemoryStore &store, std::string name, ItemKind kind, Properties properties = {},
                    std::vector<std::string> parents = {}, bool trashed = false)
    {
        RemoteItem item;
        item.name = std::move(name);
        item.kind = kind;
        item.mime_type = std::string(mime_type_of(kind));
        item.properties = std::move(properties);
        item.parents = std::move(parents);
        item.trashed = trashed;
        return store.insert(std::move(item));
    }

    RemoteItem seed_upload(MemoryStore &store, std::string name, std::string path, bool starred = false,
                           bool trashed = false)
    {
        Properties properties{{"directParent", "true"}, {"path", std::move(path)}};
        if (starred)
        {
            properties.emplace("starred", "true");
        }
        return seed(store, std::move(name), ItemKind::Folder, std::move(properties), {}, trashed);
    }

    std::set<std::string> names_of(const std::vector<RemoteItem> &items)
    {
        std::set<std::string> names;
        for (const auto &item : items)
        {
            names.insert(item.name);
        }
        return names;
    }

    void test_list_uploads_by_path()
    {
        MemoryStore store;
        Catalog catalog(store);
        seed_upload(store, "root-a", "/");
        seed_upload(store, "root-b", "/");
        seed_upload(store, "photos", "/photos/");
        seed_upload(store, "binned", "/", false, true);
        seed(store, "untagged", ItemKind::Folder, {{"path", "/"}});
        seed(store, "sheet", ItemKind::Document, {{"directParent", "true"}, {"path", "/"}});

        assert(names_of(catalog.list_uploads()) == (std::set<std::string>{"root-a", "root-b"}));
        assert(names_of(catalog.list_uploads("/photos/")) == std::set<std::string>{"photos"});
        assert(names_of(catalog.list_uploads("/", false, true)) == std::set<std::string>{"binned"});

        // Invalid or blank paths list the root.
        assert(names_of(catalog.list_uploads("not-a-path", false, false)) ==
               names_of(catalog.list_uploads("/", false, false)));
        assert(names_of(catalog.list_uploads("", false, false)) == names_of(catalog.list_uploads()));
        assert(catalog.list_uploads("/nothing-here/").empty());
    }

    void test_list_uploads_starred_ignores_path()
    {
        MemoryStore store;
        Catalog catalog(store);
        seed_upload(store, "fav-root", "/", true);
        seed_upload(store, "fav-deep", "/a/b/", true);
        seed_upload(store, "plain", "/");
        seed_upload(store, "fav-binned", "/", true, true);

        const auto expected = std::set<std::string>{"fav-root", "fav-deep"};
        assert(names_of(catalog.list_uploads("/", true, false)) == expected);
        assert(names_of(catalog.list_uploads("/a/b/", true, false)) == expected);
        assert(names_of(catalog.list_uploads("garbage", true, false)) == expected);
        assert(names_of(catalog.list_uploads("/", true, true)) == std::set<std::string>{"fav-binned"});
    }

    void test_list_uploads_degrades_on_failure()
    {
        MemoryStore store;
        Catalog catalog(store);
        seed_upload(store, "root-a", "/");

        store.fail_requests(ErrorCode::Transport);
        assert(catalog.list_uploads().empty());
        store.fail_requests(std::nullopt);
        assert(catalog.list_uploads().size() == 1);
    }

    void test_properties_set_and_add()
    {
        MemoryStore store;
        Catalog catalog(store);
        const auto item = seed(store, "folder", ItemKind::Folder, {{"a", "1"}, {"b", "2"}});

        catalog.add_properties(item.id, {{"b", "20"}, {"c", "3"}});
        auto fetched = catalog.get_file(item.id);
        assert(fetched.has_value());
        assert(fetched->properties == (Properties{{"a", "1"}, {"b", "20"}, {"c", "3"}}));

        catalog.set_properties(item.id, {{"z", "26"}});
        fetched = catalog.get_file(item.id);
        assert(fetched->properties == (Properties{{"z", "26"}}));

        // The item overload merges over the properties carried by the passed item.
        catalog.add_properties(*fetched, {{"y", "25"}});
        assert(catalog.get_file(item.id)->properties == (Properties{{"y", "25"}, {"z", "26"}}));

        catalog.set_properties(*fetched, {});
        assert(catalog.get_file(item.id)->properties.empty());
    }

    void test_get_file_not_found()
    {
        MemoryStore store;
        Catalog catalog(store);
        const auto item = seed(store, "present", ItemKind::Document);

        assert(catalog.get_file(item.id)->name == "present");
        assert(!catalog.get_file("missing").has_value());

        bool threw = false;
        try
        {
            (void)catalog.get_file("missing", "id, name");
        }
        catch (const StoreError &ex)
        {
            threw = ex.code() == ErrorCode::NotFound;
        }
        assert(threw);

        const auto projected = catalog.get_file(item.id, "id, name");
        assert(projected.name == "present");
        assert(projected.mime_type.empty());

        store.fail_requests(ErrorCode::Service);
        threw = false;
        try
        {
            (void)catalog.get_file(item.id);
        }
        catch (const StoreError &ex)
        {
            threw = ex.code() == ErrorCode::Service;
        }
        assert(threw);
    }

    void test_get_files_limits_across_pages()
    {
        MemoryStore store;
        Catalog catalog(store, CatalogOptions{.root_name = "sheetStore", .page_size = 50});
        for (int i = 0; i < 120; ++i)
        {
            seed(store, "sheet-" + std::to_string(i), ItemKind::Document);
        }
        for (int i = 0; i < 7; ++i)
        {
            seed(store, "folder-" + std::to_string(i), ItemKind::Folder);
        }

        assert(catalog.get_files(-1, {ItemKind::Document}).size() == 120);
        assert(catalog.get_files(-1, {ItemKind::Folder}).size() == 7);
        assert(catalog.get_files(-1, {ItemKind::Document, ItemKind::Folder}).size() == 127);
        assert(catalog.get_files(-1, {}).size() == 127);

        const auto before = store.list_calls();
        const auto limited = catalog.get_files(75, {ItemKind::Document});
        assert(limited.size() == 75);
        assert(store.list_calls() - before == 2);
        assert(limited.front().name == "sheet-0");
        assert(limited.back().name == "sheet-74");

        assert(catalog.get_files(0, {ItemKind::Document}).empty());
        assert(catalog.get_files(500, {ItemKind::Document}).size() == 120);

        const auto filtered = catalog.get_files(-1, std::string("name contains 'sheet-11'"), {ItemKind::Document});
        assert(names_of(filtered) == (std::set<std::string>{"sheet-11", "sheet-110", "sheet-111", "sheet-112",
                                                            "sheet-113", "sheet-114", "sheet-115", "sheet-116",
                                                            "sheet-117", "sheet-118", "sheet-119"}));
    }

    void test_get_files_keeps_kind_visible()
    {
        MemoryStore store;
        Catalog catalog(store);
        seed(store, "doc", ItemKind::Document);
        seed(store, "dir", ItemKind::Folder);

        // Even a narrow projection must carry the mime type for the kind filter.
        const auto folders = catalog.get_files(-1, std::nullopt, "id", {ItemKind::Folder});
        assert(folders.size() == 1);
        assert(folders.front().kind == ItemKind::Folder);
        assert(folders.front().name.empty());

        assert(to_string(ItemKind::Folder) == "FOLDER");
        assert(to_string(ItemKind::Document) == "DOCUMENT");
        assert(to_string(ItemKind::Other) == "OTHER");
    }

    void test_get_id_of_name()
    {
        MemoryStore store;
        Catalog catalog(store);
        const auto root = catalog.root_container();
        const auto inside = seed(store, "Bobs Folder", ItemKind::Folder, {}, {root.id});
        const auto outside = seed(store, "Stray Folder", ItemKind::Folder);
        seed(store, "Bobs Sheet", ItemKind::Document, {}, {root.id});

        assert(catalog.get_id_of_name("Bobs") == inside.id);
        assert(catalog.get_id_of_name("Bob's") == inside.id);
        assert(!catalog.get_id_of_name("Stray").has_value());
        assert(catalog.get_id_of_name("Stray", false) == outside.id);
        assert(!catalog.get_id_of_name("Sheet").has_value());
        assert(!catalog.get_id_of_name("nothing", false).has_value());

        store.fail_requests(ErrorCode::Transport);
        assert(!catalog.get_id_of_name("Bobs").has_value());
        store.fail_requests(std::nullopt);
    }

    void test_get_all_sheets()
    {
        MemoryStore store;
        Catalog catalog(store);
        const auto parent = seed(store, "parent", ItemKind::Folder);
        seed(store, "tagged-sheet", ItemKind::Document, {{"directParent", "true"}});
        seed(store, "child-sheet", ItemKind::Document, {}, {parent.id});
        seed(store, "tagged-folder", ItemKind::Folder, {{"directParent", "true"}});

        assert(names_of(catalog.get_all_sheets()) == std::set<std::string>{"tagged-sheet"});
        assert(names_of(catalog.get_all_sheets(parent.id)) == std::set<std::string>{"child-sheet"});
        assert(catalog.get_all_sheets("unknown-parent").empty());
    }

    void test_create_folder()
    {
        MemoryStore store;
        Catalog catalog(store);
        const auto parent = catalog.create_folder("parent");
        assert(!parent.id.empty());
        assert(parent.kind == ItemKind::Folder);
        assert(parent.parents.empty());

        const auto child = catalog.create_folder("child", parent.id, Properties{{"directParent", "true"}, {"path", "/"}});
        assert(child.id != parent.id);
        assert(child.parents == std::vector<std::string>{parent.id});
        assert(child.has_property("directParent", "true"));
        assert(names_of(catalog.list_uploads()) == std::set<std::string>{"child"});
    }

    void test_root_container_reuses_existing()
    {
        MemoryStore store;
        const auto existing = seed(store, "sheetStore", ItemKind::Folder);
        Catalog catalog(store);

        assert(catalog.root_container().id == existing.id);
        assert(catalog.root_container().id == existing.id);
        assert(store.create_calls() == 0);

        MemoryStore other;
        Catalog custom(other, CatalogOptions{.root_name = "customRoot", .page_size = 10});
        const auto created = custom.root_container();
        assert(created.name == "customRoot");
        assert(created.kind == ItemKind::Folder);
        assert(other.create_calls() == 1);
    }

    void test_root_container_retries_after_failure()
    {
        MemoryStore store;
        Catalog catalog(store);

        store.fail_requests(ErrorCode::Transport);
        bool threw = false;
        try
        {
            (void)catalog.root_container();
        }
        catch (const StoreError &ex)
        {
            threw = ex.code() == ErrorCode::Transport;
        }
        assert(threw);

        store.fail_requests(std::nullopt);
        const auto root = catalog.root_container();
        assert(root.name == "sheetStore");
        assert(store.create_calls() == 1);
    }

    void test_root_container_concurrent_first_use()
    {
        MemoryStore store;
        store.set_latency(std::chrono::milliseconds(20));
        Catalog catalog(store);

        constexpr int kCallers = 8;
        std::vector<std::string> ids(kCallers);
        std::vector<std::thread> threads;
        threads.reserve(kCallers);
        for (int i = 0; i < kCallers; ++i)
        {
            threads.emplace_back([&catalog, &ids, i]
                                 { ids[i] = catalog.root_container().id; });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }

        assert(store.create_calls() == 1);
        assert(store.size() == 1);
        assert(std::all_of(ids.begin(), ids.end(), [&ids](const std::string &id)
                           { return id == ids.front(); }));
    }

} // namespace

void run_catalog_tests()
{
    test_list_uploads_by_path();
    test_list_uploads_starred_ignores_path();
    test_list_uploads_degrades_on_failure();
    test_properties_set_and_add();
    test_get_file_not_found();
    test_get_files_limits_across_pages();
    test_get_files_keeps_kind_visible();
    test_get_id_of_name();
    test_get_all_sheets();
    test_create_folder();
    test_root_container_reuses_existing();
    test_root_container_retries_after_failure();
    test_root_container_concurrent_first_use();
}
