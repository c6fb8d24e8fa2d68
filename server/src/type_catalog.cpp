#include "chatdrop/server/type_catalog.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace chatdrop::server
{

    namespace
    {

        struct CategoryMapping
        {
            Category category;
            std::string_view label;
        };

        constexpr std::array<CategoryMapping, 4> kCategoryMappings{{
            {Category::Images, "images"},
            {Category::Documents, "documents"},
            {Category::Video, "video"},
            {Category::Other, "other"},
        }};

        constexpr std::array<std::string_view, 3> kGenericContentTypes{
            "application/octet-stream",
            "binary/octet-stream",
            "application/unknown",
        };

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(),
                           [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return result;
        }

        std::string trim(std::string_view value)
        {
            const auto begin = value.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = value.find_last_not_of(" \t\r\n");
            return std::string(value.substr(begin, end - begin + 1));
        }

    } // namespace

    std::string_view to_string(Category category) noexcept
    {
        for (const auto &mapping : kCategoryMappings)
        {
            if (mapping.category == category)
            {
                return mapping.label;
            }
        }
        return "other";
    }

    std::optional<Category> category_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCategoryMappings)
        {
            if (mapping.label == value)
            {
                return mapping.category;
            }
        }
        return std::nullopt;
    }

    TypeTable default_type_table()
    {
        TypeTable table;
        table[Category::Images] = CategoryTypes{
            .content_types = {"image/jpeg", "image/png", "image/gif", "image/webp", "image/bmp", "image/tiff"},
            .extensions = {
                {".jpg", "image/jpeg"},
                {".jpeg", "image/jpeg"},
                {".png", "image/png"},
                {".gif", "image/gif"},
                {".webp", "image/webp"},
                {".bmp", "image/bmp"},
                {".tif", "image/tiff"},
                {".tiff", "image/tiff"},
            },
        };
        table[Category::Documents] = CategoryTypes{
            .content_types = {
                "application/pdf",
                "application/msword",
                "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
                "application/vnd.ms-excel",
                "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
                "application/vnd.ms-powerpoint",
                "application/vnd.openxmlformats-officedocument.presentationml.presentation",
                "text/plain",
            },
            .extensions = {
                {".pdf", "application/pdf"},
                {".doc", "application/msword"},
                {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
                {".xls", "application/vnd.ms-excel"},
                {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
                {".ppt", "application/vnd.ms-powerpoint"},
                {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
                {".txt", "text/plain"},
            },
        };
        table[Category::Video] = CategoryTypes{
            .content_types = {"video/mp4", "video/mpeg", "video/webm", "video/quicktime", "video/x-msvideo",
                              "video/x-matroska", "video/3gpp"},
            .extensions = {
                {".mp4", "video/mp4"},
                {".mpeg", "video/mpeg"},
                {".mpg", "video/mpeg"},
                {".webm", "video/webm"},
                {".mov", "video/quicktime"},
                {".avi", "video/x-msvideo"},
                {".mkv", "video/x-matroska"},
                {".3gp", "video/3gpp"},
            },
        };
        table[Category::Other] = CategoryTypes{
            .content_types = {"audio/mpeg", "audio/wav", "audio/ogg", "application/zip"},
            .extensions = {
                {".mp3", "audio/mpeg"},
                {".wav", "audio/wav"},
                {".ogg", "audio/ogg"},
                {".zip", "application/zip"},
            },
        };
        return table;
    }

    TypeCatalog::TypeCatalog(const TypeTable &table)
    {
        for (const auto &[category, types] : table)
        {
            for (const auto &content_type : types.content_types)
            {
                content_types_[normalize_content_type(content_type)] = category;
            }
            for (const auto &[extension, content_type] : types.extensions)
            {
                auto key = to_lower(extension);
                if (!key.empty() && key.front() != '.')
                {
                    key.insert(key.begin(), '.');
                }
                const auto normalized = normalize_content_type(content_type);
                extensions_[key] = ExtensionEntry{.category = category, .content_type = normalized};
                // First extension listed for a type (in key order) is the one used for naming.
                preferred_extensions_.try_emplace(normalized, key);
            }
        }
    }

    std::optional<Category> TypeCatalog::category_for_content_type(std::string_view content_type) const
    {
        const auto it = content_types_.find(normalize_content_type(content_type));
        if (it == content_types_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<TypeCatalog::ExtensionEntry> TypeCatalog::lookup_extension(std::string_view extension) const
    {
        const auto it = extensions_.find(to_lower(extension));
        if (it == extensions_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::string> TypeCatalog::extension_for(std::string_view content_type) const
    {
        const auto it = preferred_extensions_.find(normalize_content_type(content_type));
        if (it == preferred_extensions_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<ReconciledType> TypeCatalog::reconcile(std::string_view declared_content_type,
                                                         std::string_view file_name) const
    {
        const auto declared = normalize_content_type(declared_content_type);
        if (!declared.empty() && !is_generic_content_type(declared))
        {
            if (const auto category = category_for_content_type(declared))
            {
                return ReconciledType{.category = *category, .content_type = declared, .signal = TypeSignal::ContentType};
            }
        }

        // Declared type absent, generic or not allow-listed: fall back to the extension.
        if (const auto entry = lookup_extension(extension_of(file_name)))
        {
            return ReconciledType{
                .category = entry->category,
                .content_type = entry->content_type,
                .signal = TypeSignal::Extension,
            };
        }
        return std::nullopt;
    }

    std::string TypeCatalog::normalize_content_type(std::string_view content_type)
    {
        const auto separator = content_type.find(';');
        if (separator != std::string_view::npos)
        {
            content_type = content_type.substr(0, separator);
        }
        return to_lower(trim(content_type));
    }

    bool TypeCatalog::is_generic_content_type(std::string_view normalized)
    {
        return std::find(kGenericContentTypes.begin(), kGenericContentTypes.end(), normalized) !=
               kGenericContentTypes.end();
    }

    std::string TypeCatalog::extension_of(std::string_view file_name)
    {
        const auto slash = file_name.find_last_of("/\\");
        if (slash != std::string_view::npos)
        {
            file_name = file_name.substr(slash + 1);
        }
        const auto dot = file_name.find_last_of('.');
        if (dot == std::string_view::npos || dot == 0 || dot + 1 == file_name.size())
        {
            return {};
        }
        return to_lower(file_name.substr(dot));
    }

} // namespace chatdrop::server
