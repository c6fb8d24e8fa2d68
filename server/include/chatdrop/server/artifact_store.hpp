#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "chatdrop/error_codes.hpp"
#include "chatdrop/server/type_catalog.hpp"

namespace chatdrop::server
{

    class UploadError : public std::runtime_error
    {
    public:
        UploadError(chatdrop::ErrorCode code, std::string message);

        chatdrop::ErrorCode code() const noexcept { return code_; }

    private:
        chatdrop::ErrorCode code_;
    };

    struct Artifact
    {
        std::string storage_key;
        Category category{Category::Other};
        std::uint64_t size_bytes{};
        std::string content_type;
        std::string original_file_name;
        std::string public_reference;
        std::string checksum;
        std::string uploader_id;
        std::string room_id;
        std::uint64_t created_at{};
    };

    struct ArtifactLocation
    {
        Category category{Category::Other};
        std::string storage_key;
    };

    /**
     * Durable artifact storage under one root:
     *
     *   <root>/<category>/<storage_key>                       artifact bytes
     *   <root>/temp/                                          in-progress writes
     *   <root>/.chatdrop/artifacts/<category>/<key>.json      metadata sidecar
     *
     * An artifact is visible to find() only once both the bytes and the sidecar are in place.
     * Artifacts with the same checksum share their bytes through a hard link; each keeps its own key and sidecar.
     */
    class ArtifactStore
    {
    public:
        explicit ArtifactStore(std::filesystem::path root);

        // Throws UploadError(StorageWriteFailed); nothing is left behind on failure.
        void store(const Artifact &artifact, std::span<const std::byte> bytes);

        std::optional<Artifact> find(std::string_view reference) const;

        // Throws UploadError(NotFound) when the bytes are gone, InvalidPayload for an offset past the end.
        std::vector<std::byte> read_range(const Artifact &artifact, std::uint64_t offset, std::uint64_t max_bytes) const;

        static std::string make_reference(Category category, std::string_view storage_key);
        static std::optional<ArtifactLocation> parse_reference(std::string_view reference);

    private:
        std::filesystem::path artifact_path(Category category, std::string_view storage_key) const;
        std::filesystem::path metadata_path(Category category, std::string_view storage_key) const;

        void load_checksum_index();
        bool link_existing(const Artifact &artifact, std::uint64_t size, const std::filesystem::path &final_path);

        std::filesystem::path base_;
        std::mutex index_mutex_;
        std::unordered_map<std::string, std::filesystem::path> by_checksum_;
    };

} // namespace chatdrop::server
