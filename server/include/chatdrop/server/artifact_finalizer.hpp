#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "chatdrop/server/artifact_store.hpp"
#include "chatdrop/server/type_catalog.hpp"
#include "chatdrop/server/upload_session.hpp"

namespace chatdrop::server
{

    struct FinalizeRequest
    {
        std::string upload_id;
        std::string uploader_id;
        std::string room_id;
        UploadDeclaration declaration;
    };

    // Turns the assembled bytes of a completing upload into a stored Artifact.
    class ArtifactFinalizer
    {
    public:
        ArtifactFinalizer(ArtifactStore &store, const TypeCatalog &catalog);

        // Throws UploadError with UnsupportedType or StorageWriteFailed.
        Artifact finalize(const FinalizeRequest &request, std::vector<std::byte> bytes);

        std::string make_storage_key(std::string_view file_name, const ReconciledType &type,
                                     std::chrono::system_clock::time_point now) const;

        // Path prefix, control characters and anything outside [A-Za-z0-9._-] removed, no leading dots.
        static std::string sanitize_file_name(std::string_view file_name);

    private:
        ArtifactStore &store_;
        const TypeCatalog &catalog_;
    };

} // namespace chatdrop::server
