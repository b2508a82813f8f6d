#include "holysheet/catalog/remote_item.hpp"

namespace holysheet::catalog
{

    std::string_view to_string(ItemKind kind) noexcept
    {
        switch (kind)
        {
        case ItemKind::Folder:
            return "FOLDER";
        case ItemKind::Document:
            return "DOCUMENT";
        case ItemKind::Other:
            break;
        }
        return "OTHER";
    }

    std::string_view mime_type_of(ItemKind kind) noexcept
    {
        switch (kind)
        {
        case ItemKind::Folder:
            return kFolderMimeType;
        case ItemKind::Document:
            return kDocumentMimeType;
        case ItemKind::Other:
            break;
        }
        return {};
    }

    ItemKind kind_from_mime_type(std::string_view mime_type) noexcept
    {
        if (mime_type == kFolderMimeType)
        {
            return ItemKind::Folder;
        }
        if (mime_type == kDocumentMimeType)
        {
            return ItemKind::Document;
        }
        return ItemKind::Other;
    }

    bool RemoteItem::has_property(std::string_view key, std::string_view value) const
    {
        const auto it = properties.find(std::string(key));
        return it != properties.end() && it->second == value;
    }

} // namespace holysheet::catalog
