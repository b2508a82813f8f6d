/**
 * HolySheet - Items of the remote store as seen by the catalog.
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace holysheet::catalog
{

    using Properties = std::map<std::string, std::string>;

    enum class ItemKind : std::uint8_t
    {
        Other = 0,
        Folder = 1,
        Document = 2
    };

    inline constexpr std::string_view kFolderMimeType = "application/vnd.google-apps.folder";
    inline constexpr std::string_view kDocumentMimeType = "application/vnd.google-apps.spreadsheet";

    inline constexpr std::string_view kPathProperty = "path";
    inline constexpr std::string_view kDirectParentProperty = "directParent";
    inline constexpr std::string_view kStarredProperty = "starred";

    // Field projection that covers everything the catalog reads from an item.
    inline constexpr std::string_view kDefaultFields =
        "id, name, mimeType, parents, properties, trashed, size, modifiedTime, md5Checksum";

    std::string_view to_string(ItemKind kind) noexcept;

    // Only meaningful for Folder and Document; Other has no single native type.
    std::string_view mime_type_of(ItemKind kind) noexcept;

    ItemKind kind_from_mime_type(std::string_view mime_type) noexcept;

    // Numeric kind reported to socket clients.
    constexpr int kind_code(ItemKind kind) noexcept
    {
        return static_cast<int>(kind);
    }

    struct RemoteItem
    {
        std::string id;
        std::string name;
        ItemKind kind{ItemKind::Other};
        std::string mime_type;
        std::vector<std::string> parents;
        Properties properties;
        bool trashed{};
        std::uint64_t size{};
        std::int64_t modified_time_ms{};
        std::optional<std::string> content_hash;

        bool has_property(std::string_view key, std::string_view value) const;
    };

} // namespace holysheet::catalog
