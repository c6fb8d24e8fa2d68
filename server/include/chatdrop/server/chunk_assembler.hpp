#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chatdrop/error_codes.hpp"
#include "chatdrop/server/artifact_finalizer.hpp"
#include "chatdrop/server/config.hpp"
#include "chatdrop/server/upload_session_store.hpp"

namespace chatdrop::server
{

    struct UploadContext
    {
        std::string uploader_id;
        std::string room_id;
        std::weak_ptr<FrameSink> owner;
    };

    enum class AssemblyStatus : std::uint8_t
    {
        Accepted,
        DuplicateIgnored,
        Completed,
        Rejected
    };

    std::string_view to_string(AssemblyStatus status) noexcept;

    struct AssemblyOutcome
    {
        AssemblyStatus status{AssemblyStatus::Rejected};
        std::string upload_id;
        ProgressSnapshot progress{};
        std::optional<Artifact> artifact;
        std::optional<Rejection> rejection;
    };

    /**
     * Applies chunks to sessions. The call that stores the last missing chunk claims the
     * session (Open -> Completing) and runs the finalizer on its own thread with the session
     * lock released; every other caller racing on the same session sees DuplicateIgnored.
     */
    class ChunkAssembler
    {
    public:
        using Clock = UploadSession::Clock;

        ChunkAssembler(UploadSessionStore &store, ArtifactFinalizer &finalizer, const TypeCatalog &catalog,
                       const UploadLimits &limits);

        AssemblyOutcome begin(const UploadContext &context, const UploadDeclaration &declaration);

        // repeated is the declaration carried by the chunk frame itself, when it has one.
        AssemblyOutcome accept(const std::string &uploader_id, const std::string &upload_id, std::int64_t sequence,
                               std::vector<std::byte> payload, const std::optional<UploadDeclaration> &repeated = {});

        AssemblyOutcome cancel(const std::string &uploader_id, const std::string &upload_id);

        // Cancels the open sessions started through owner; returns their notices.
        std::vector<SessionNotice> cancel_all(const std::weak_ptr<FrameSink> &owner);

    private:
        AssemblyOutcome complete(SessionHandle &handle, std::vector<std::byte> bytes);

        UploadSessionStore &store_;
        ArtifactFinalizer &finalizer_;
        const TypeCatalog &catalog_;
        UploadLimits limits_;
    };

} // namespace chatdrop::server
