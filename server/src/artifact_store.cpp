#include "chatdrop/server/artifact_store.hpp"

#include <algorithm>
#include <array>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chatdrop/crypto.hpp"

namespace chatdrop::server
{

    UploadError::UploadError(chatdrop::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        constexpr auto kTempDir = "temp";
        constexpr auto kMetadataDir = ".chatdrop/artifacts";
        constexpr std::array<Category, 4> kCategories{Category::Images, Category::Documents, Category::Video,
                                                      Category::Other};

        nlohmann::json to_json(const Artifact &artifact)
        {
            return {
                {"storage_key", artifact.storage_key},
                {"category", to_string(artifact.category)},
                {"size_bytes", artifact.size_bytes},
                {"content_type", artifact.content_type},
                {"original_file_name", artifact.original_file_name},
                {"public_reference", artifact.public_reference},
                {"checksum", artifact.checksum},
                {"uploader_id", artifact.uploader_id},
                {"room_id", artifact.room_id},
                {"created_at", artifact.created_at},
            };
        }

        Artifact artifact_from_json(const nlohmann::json &json, Category category)
        {
            Artifact artifact{};
            artifact.storage_key = json.at("storage_key").get<std::string>();
            artifact.category = category;
            artifact.size_bytes = json.value("size_bytes", 0ULL);
            artifact.content_type = json.value("content_type", std::string{});
            artifact.original_file_name = json.value("original_file_name", std::string{});
            artifact.public_reference = json.value("public_reference", std::string{});
            artifact.checksum = json.value("checksum", std::string{});
            artifact.uploader_id = json.value("uploader_id", std::string{});
            artifact.room_id = json.value("room_id", std::string{});
            artifact.created_at = json.value("created_at", 0ULL);
            return artifact;
        }

        void write_new(const std::filesystem::path &temp_path, const std::filesystem::path &final_path,
                       std::span<const std::byte> bytes)
        {
            std::filesystem::create_directories(temp_path.parent_path());
            {
                std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
                if (!out.is_open())
                {
                    throw UploadError(chatdrop::ErrorCode::StorageWriteFailed, "Unable to open temporary file");
                }
                out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
                out.flush();
                if (!out)
                {
                    throw UploadError(chatdrop::ErrorCode::StorageWriteFailed, "Unable to write temporary file");
                }
            }
            std::filesystem::rename(temp_path, final_path);
        }

        bool is_plain_key(std::string_view key)
        {
            if (key.empty() || key == "." || key == "..")
            {
                return false;
            }
            return key.find_first_of("/\\") == std::string_view::npos && key.find('\0') == std::string_view::npos;
        }

    } // namespace

    ArtifactStore::ArtifactStore(std::filesystem::path root) : base_(std::move(root))
    {
        std::filesystem::create_directories(base_);
        std::filesystem::create_directories(base_ / kTempDir);
        for (const auto category : kCategories)
        {
            std::filesystem::create_directories(base_ / std::string(to_string(category)));
        }
        load_checksum_index();
    }

    void ArtifactStore::load_checksum_index()
    {
        for (const auto category : kCategories)
        {
            const auto dir = base_ / kMetadataDir / std::string(to_string(category));
            std::error_code ec;
            if (!std::filesystem::is_directory(dir, ec))
            {
                continue;
            }
            for (const auto &entry : std::filesystem::directory_iterator(dir, ec))
            {
                if (!entry.is_regular_file() || entry.path().extension() != ".json")
                {
                    continue;
                }
                std::ifstream in(entry.path());
                const auto json = nlohmann::json::parse(in, nullptr, false);
                if (json.is_discarded() || !json.is_object() || !json.contains("storage_key"))
                {
                    continue;
                }
                const auto artifact = artifact_from_json(json, category);
                if (!artifact.checksum.empty() && is_plain_key(artifact.storage_key))
                {
                    by_checksum_.emplace(artifact.checksum, artifact_path(category, artifact.storage_key));
                }
            }
        }
    }

    bool ArtifactStore::link_existing(const Artifact &artifact, std::uint64_t size,
                                      const std::filesystem::path &final_path)
    {
        std::filesystem::path existing;
        {
            std::lock_guard lock(index_mutex_);
            const auto it = by_checksum_.find(artifact.checksum);
            if (it == by_checksum_.end())
            {
                return false;
            }
            existing = it->second;
        }
        std::error_code ec;
        if (!std::filesystem::is_regular_file(existing, ec) || std::filesystem::file_size(existing, ec) != size || ec)
        {
            return false;
        }
        try
        {
            if (crypto::hash_file(existing) != artifact.checksum)
            {
                return false;
            }
        }
        catch (const std::runtime_error &ex)
        {
            spdlog::warn("Could not verify {}: {}", existing.string(), ex.what());
            return false;
        }
        std::filesystem::create_hard_link(existing, final_path, ec);
        if (ec)
        {
            spdlog::warn("Could not link {} to {}: {}", final_path.string(), existing.string(), ec.message());
            return false;
        }
        spdlog::debug("Reusing stored bytes of {} for {}", existing.filename().string(), artifact.storage_key);
        return true;
    }

    void ArtifactStore::store(const Artifact &artifact, std::span<const std::byte> bytes)
    {
        if (!is_plain_key(artifact.storage_key))
        {
            throw UploadError(chatdrop::ErrorCode::StorageWriteFailed, "Invalid storage key");
        }
        const auto temp_path = base_ / kTempDir / (artifact.storage_key + ".part");
        const auto final_path = artifact_path(artifact.category, artifact.storage_key);
        const auto sidecar_path = metadata_path(artifact.category, artifact.storage_key);
        bool placed = false;

        const auto cleanup = [&]
        {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            if (placed)
            {
                std::filesystem::remove(final_path, ec);
                std::filesystem::remove(sidecar_path, ec);
            }
        };

        try
        {
            std::filesystem::create_directories(final_path.parent_path());
            if (std::filesystem::exists(final_path))
            {
                throw UploadError(chatdrop::ErrorCode::StorageWriteFailed, "Storage key already in use");
            }
            const bool linked = !artifact.checksum.empty() && link_existing(artifact, bytes.size(), final_path);
            if (!linked)
            {
                write_new(temp_path, final_path, bytes);
            }
            placed = true;

            std::filesystem::create_directories(sidecar_path.parent_path());
            std::ofstream meta(sidecar_path, std::ios::trunc);
            if (!meta.is_open())
            {
                throw UploadError(chatdrop::ErrorCode::StorageWriteFailed, "Unable to write artifact metadata");
            }
            meta << to_json(artifact).dump(2);
            meta.flush();
            if (!meta)
            {
                throw UploadError(chatdrop::ErrorCode::StorageWriteFailed, "Unable to write artifact metadata");
            }
            meta.close();

            if (!artifact.checksum.empty() && !linked)
            {
                std::lock_guard lock(index_mutex_);
                by_checksum_.insert_or_assign(artifact.checksum, final_path);
            }
        }
        catch (const UploadError &)
        {
            cleanup();
            throw;
        }
        catch (const std::exception &ex)
        {
            cleanup();
            throw UploadError(chatdrop::ErrorCode::StorageWriteFailed, ex.what());
        }
    }

    std::optional<Artifact> ArtifactStore::find(std::string_view reference) const
    {
        const auto location = parse_reference(reference);
        if (!location)
        {
            return std::nullopt;
        }
        const auto sidecar_path = metadata_path(location->category, location->storage_key);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(sidecar_path, ec) ||
            !std::filesystem::is_regular_file(artifact_path(location->category, location->storage_key), ec))
        {
            return std::nullopt;
        }
        std::ifstream in(sidecar_path);
        if (!in.is_open())
        {
            return std::nullopt;
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_object() || !json.contains("storage_key"))
        {
            return std::nullopt;
        }
        return artifact_from_json(json, location->category);
    }

    std::vector<std::byte> ArtifactStore::read_range(const Artifact &artifact, std::uint64_t offset,
                                                     std::uint64_t max_bytes) const
    {
        const auto path = artifact_path(artifact.category, artifact.storage_key);
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw UploadError(chatdrop::ErrorCode::NotFound, "Artifact content missing");
        }
        const auto size = static_cast<std::uint64_t>(std::filesystem::file_size(path));
        if (offset > size)
        {
            throw UploadError(chatdrop::ErrorCode::InvalidPayload, "Offset beyond end of artifact");
        }
        const auto length = std::min<std::uint64_t>(max_bytes, size - offset);
        std::vector<std::byte> data(static_cast<std::size_t>(length));
        in.seekg(static_cast<std::streamoff>(offset));
        in.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(length));
        data.resize(static_cast<std::size_t>(in.gcount()));
        return data;
    }

    std::string ArtifactStore::make_reference(Category category, std::string_view storage_key)
    {
        std::string reference(to_string(category));
        reference.push_back('/');
        reference.append(storage_key);
        return reference;
    }

    std::optional<ArtifactLocation> ArtifactStore::parse_reference(std::string_view reference)
    {
        const auto slash = reference.find('/');
        if (slash == std::string_view::npos)
        {
            return std::nullopt;
        }
        const auto category = category_from_string(reference.substr(0, slash));
        const auto key = reference.substr(slash + 1);
        if (!category || !is_plain_key(key))
        {
            return std::nullopt;
        }
        return ArtifactLocation{.category = *category, .storage_key = std::string(key)};
    }

    std::filesystem::path ArtifactStore::artifact_path(Category category, std::string_view storage_key) const
    {
        return base_ / std::string(to_string(category)) / std::string(storage_key);
    }

    std::filesystem::path ArtifactStore::metadata_path(Category category, std::string_view storage_key) const
    {
        return base_ / kMetadataDir / std::string(to_string(category)) / (std::string(storage_key) + ".json");
    }

} // namespace chatdrop::server
