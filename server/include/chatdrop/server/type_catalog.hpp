#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chatdrop::server
{

    enum class Category : std::uint8_t
    {
        Images,
        Documents,
        Video,
        Other
    };

    std::string_view to_string(Category category) noexcept;
    std::optional<Category> category_from_string(std::string_view value) noexcept;

    struct CategoryTypes
    {
        std::vector<std::string> content_types;
        // ".jpg" -> "image/jpeg"
        std::map<std::string, std::string> extensions;
    };

    using TypeTable = std::map<Category, CategoryTypes>;

    TypeTable default_type_table();

    enum class TypeSignal : std::uint8_t
    {
        ContentType,
        Extension
    };

    struct ReconciledType
    {
        Category category{Category::Other};
        std::string content_type;
        TypeSignal signal{TypeSignal::ContentType};
    };

    /**
     * Allow-list of content types and file name extensions per storage category.
     *
     * reconcile() is the single place where a client declaration is turned into a trusted
     * category: an allow-listed, non-generic declared content type wins; otherwise the file
     * name extension is consulted. A declaration that matches neither is refused.
     */
    class TypeCatalog
    {
    public:
        struct ExtensionEntry
        {
            Category category{Category::Other};
            std::string content_type;
        };

        explicit TypeCatalog(const TypeTable &table);

        std::optional<Category> category_for_content_type(std::string_view content_type) const;
        std::optional<ExtensionEntry> lookup_extension(std::string_view extension) const;
        std::optional<std::string> extension_for(std::string_view content_type) const;

        std::optional<ReconciledType> reconcile(std::string_view declared_content_type,
                                                std::string_view file_name) const;

        // Lowercased, parameters ("; charset=...") and surrounding blanks removed.
        static std::string normalize_content_type(std::string_view content_type);
        static bool is_generic_content_type(std::string_view normalized);
        // Lowercased extension including the dot, or empty when the name has none.
        static std::string extension_of(std::string_view file_name);

    private:
        std::unordered_map<std::string, Category> content_types_;
        std::unordered_map<std::string, ExtensionEntry> extensions_;
        std::unordered_map<std::string, std::string> preferred_extensions_;
    };

} // namespace chatdrop::server
