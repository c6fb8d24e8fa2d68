#include "chatdrop/server/artifact_finalizer.hpp"

#include <cctype>
#include <ctime>
#include <span>

#include <spdlog/fmt/chrono.h>
#include <spdlog/spdlog.h>

#include "chatdrop/crypto.hpp"

namespace chatdrop::server
{

    namespace
    {
        constexpr std::size_t kMaxBaseNameLength = 40;
        constexpr std::size_t kKeySuffixBytes = 4;

        std::string utc_timestamp(std::chrono::system_clock::time_point now)
        {
            return fmt::format("{:%Y%m%d-%H%M%S}", fmt::gmtime(std::chrono::system_clock::to_time_t(now)));
        }

        bool is_key_char(unsigned char ch)
        {
            return std::isalnum(ch) || ch == '.' || ch == '_' || ch == '-';
        }

    } // namespace

    ArtifactFinalizer::ArtifactFinalizer(ArtifactStore &store, const TypeCatalog &catalog)
        : store_(store), catalog_(catalog) {}

    Artifact ArtifactFinalizer::finalize(const FinalizeRequest &request, std::vector<std::byte> bytes)
    {
        const auto &declaration = request.declaration;
        const auto type = catalog_.reconcile(declaration.content_type, declaration.file_name);
        if (!type)
        {
            throw UploadError(chatdrop::ErrorCode::UnsupportedType,
                              "Unsupported file type: " + declaration.content_type + " / " + declaration.file_name);
        }

        const auto now = std::chrono::system_clock::now();
        Artifact artifact{};
        artifact.storage_key = make_storage_key(declaration.file_name, *type, now);
        artifact.category = type->category;
        artifact.size_bytes = static_cast<std::uint64_t>(bytes.size());
        artifact.content_type = type->content_type;
        artifact.original_file_name = declaration.file_name;
        artifact.public_reference = ArtifactStore::make_reference(type->category, artifact.storage_key);
        artifact.checksum = crypto::hash_bytes(std::span<const std::byte>(bytes));
        artifact.uploader_id = request.uploader_id;
        artifact.room_id = request.room_id;
        artifact.created_at = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());

        store_.store(artifact, bytes);
        spdlog::info("Upload {} stored as {} ({}, {} bytes, via {})", request.upload_id, artifact.public_reference,
                     artifact.content_type, artifact.size_bytes,
                     type->signal == TypeSignal::ContentType ? "content type" : "extension");
        return artifact;
    }

    std::string ArtifactFinalizer::make_storage_key(std::string_view file_name, const ReconciledType &type,
                                                    std::chrono::system_clock::time_point now) const
    {
        const auto sanitized = sanitize_file_name(file_name);
        auto extension = TypeCatalog::extension_of(sanitized);
        std::string base = sanitized.substr(0, sanitized.size() - extension.size());

        // Keep the client's extension only when it agrees with the reconciled type.
        const auto entry = catalog_.lookup_extension(extension);
        if (!entry || entry->content_type != type.content_type)
        {
            extension = catalog_.extension_for(type.content_type).value_or("");
        }

        while (!base.empty() && (base.back() == '.' || base.back() == '-'))
        {
            base.pop_back();
        }
        if (base.size() > kMaxBaseNameLength)
        {
            base.resize(kMaxBaseNameLength);
        }
        if (base.empty())
        {
            base = "file";
        }
        return utc_timestamp(now) + "-" + base + "-" + crypto::random_hex(kKeySuffixBytes) + extension;
    }

    std::string ArtifactFinalizer::sanitize_file_name(std::string_view file_name)
    {
        const auto slash = file_name.find_last_of("/\\");
        if (slash != std::string_view::npos)
        {
            file_name = file_name.substr(slash + 1);
        }
        std::string result;
        result.reserve(file_name.size());
        for (const char ch : file_name)
        {
            if (is_key_char(static_cast<unsigned char>(ch)))
            {
                result.push_back(ch);
            }
        }
        const auto first = result.find_first_not_of('.');
        if (first == std::string::npos)
        {
            return {};
        }
        return result.substr(first);
    }

} // namespace chatdrop::server
