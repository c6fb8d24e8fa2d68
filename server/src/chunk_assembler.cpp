#include "chatdrop/server/chunk_assembler.hpp"

#include <array>

#include <spdlog/spdlog.h>

#include "chatdrop/server/chunk_validator.hpp"

namespace chatdrop::server
{

    namespace
    {

        struct StatusMapping
        {
            AssemblyStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 4> kStatusMappings{{
            {AssemblyStatus::Accepted, "accepted"},
            {AssemblyStatus::DuplicateIgnored, "duplicate_ignored"},
            {AssemblyStatus::Completed, "completed"},
            {AssemblyStatus::Rejected, "rejected"},
        }};

        AssemblyOutcome make_outcome(AssemblyStatus status, const UploadSession &session)
        {
            return AssemblyOutcome{
                .status = status,
                .upload_id = session.upload_id,
                .progress = session.progress(),
            };
        }

        AssemblyOutcome make_rejection(std::string upload_id, ProgressSnapshot progress, Rejection rejection)
        {
            return AssemblyOutcome{
                .status = AssemblyStatus::Rejected,
                .upload_id = std::move(upload_id),
                .progress = progress,
                .rejection = std::move(rejection),
            };
        }

        // A session owned by someone else is reported exactly like an unknown one.
        Rejection reject_unavailable(const UploadSessionStore &store, const SessionHandle &handle,
                                     const std::string &uploader_id, const std::string &upload_id)
        {
            std::optional<SessionState> closed;
            if (!handle)
            {
                closed = store.closed_state(upload_id);
            }
            else if (handle->uploader_id == uploader_id)
            {
                closed = handle->state;
            }
            return chunk_validator::check_stray_chunk(upload_id, closed)
                .value_or(Rejection{ErrorCode::UnknownOrClosedSession, "Unknown upload"});
        }

    } // namespace

    std::string_view to_string(AssemblyStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    ChunkAssembler::ChunkAssembler(UploadSessionStore &store, ArtifactFinalizer &finalizer, const TypeCatalog &catalog,
                                   const UploadLimits &limits)
        : store_(store), finalizer_(finalizer), catalog_(catalog), limits_(limits) {}

    AssemblyOutcome ChunkAssembler::begin(const UploadContext &context, const UploadDeclaration &declaration)
    {
        if (auto rejection = chunk_validator::check_declaration(declaration, context.room_id, limits_))
        {
            return make_rejection({}, {}, std::move(*rejection));
        }
        if (!catalog_.reconcile(declaration.content_type, declaration.file_name))
        {
            return make_rejection({}, {},
                                  Rejection{ErrorCode::UnsupportedType,
                                            "Unsupported file type: " + declaration.content_type + " / " +
                                                declaration.file_name});
        }
        auto handle = store_.open(context.uploader_id, context.room_id, declaration, context.owner, Clock::now());
        if (!handle)
        {
            return make_rejection({}, {}, Rejection{ErrorCode::Cancelled, "Server shutting down"});
        }
        return make_outcome(AssemblyStatus::Accepted, *handle);
    }

    AssemblyOutcome ChunkAssembler::accept(const std::string &uploader_id, const std::string &upload_id,
                                           std::int64_t sequence, std::vector<std::byte> payload,
                                           const std::optional<UploadDeclaration> &repeated)
    {
        auto handle = store_.acquire(upload_id);
        if (!handle || handle->uploader_id != uploader_id || is_terminal(handle->state))
        {
            return make_rejection(upload_id, {}, reject_unavailable(store_, handle, uploader_id, upload_id));
        }

        auto &session = *handle;
        const auto now = Clock::now();
        auto rejection = chunk_validator::check_sequence(session.declaration, sequence);
        if (!rejection && repeated)
        {
            rejection = chunk_validator::check_consistency(session.declaration, *repeated);
        }
        if (rejection)
        {
            if (session.state == SessionState::Completing)
            {
                return make_rejection(upload_id, session.progress(), std::move(*rejection));
            }
            store_.mark_failed(handle, *rejection);
            return make_rejection(upload_id, session.progress(), std::move(*rejection));
        }

        const auto index = *chunk_validator::chunk_index(session.declaration, sequence);
        if (session.state == SessionState::Completing || session.buffer.contains(index))
        {
            if (session.state == SessionState::Open)
            {
                store_.touch(handle, now);
            }
            spdlog::debug("Upload {} ignored duplicate chunk {}", upload_id, sequence);
            return make_outcome(AssemblyStatus::DuplicateIgnored, session);
        }

        if (auto rejection = chunk_validator::check_chunk(session.declaration, session.buffer.byte_count(),
                                                          payload.size(), limits_))
        {
            store_.mark_failed(handle, *rejection);
            return make_rejection(upload_id, session.progress(), std::move(*rejection));
        }

        store_.record_chunk(handle, index, std::move(payload), now);
        if (session.buffer.chunk_count() < session.declaration.total_chunks)
        {
            return make_outcome(AssemblyStatus::Accepted, session);
        }

        const auto received = session.buffer.byte_count();
        if (received != session.declaration.total_size)
        {
            const Rejection rejection{
                ErrorCode::InvalidChunk,
                "Received " + std::to_string(received) + " bytes, declared " +
                    std::to_string(session.declaration.total_size),
            };
            store_.mark_failed(handle, rejection);
            return make_rejection(upload_id, session.progress(), rejection);
        }

        auto bytes = store_.begin_completing(handle);
        if (!bytes)
        {
            return make_outcome(AssemblyStatus::DuplicateIgnored, session);
        }
        return complete(handle, std::move(*bytes));
    }

    AssemblyOutcome ChunkAssembler::complete(SessionHandle &handle, std::vector<std::byte> bytes)
    {
        auto &session = *handle;
        const FinalizeRequest request{
            .upload_id = session.upload_id,
            .uploader_id = session.uploader_id,
            .room_id = session.room_id,
            .declaration = session.declaration,
        };
        const auto progress = session.progress();

        std::optional<Artifact> artifact;
        std::optional<Rejection> failure;
        handle.unlock();
        try
        {
            artifact = finalizer_.finalize(request, std::move(bytes));
        }
        catch (const UploadError &error)
        {
            failure = Rejection{error.code(), error.what()};
        }
        catch (const std::exception &ex)
        {
            failure = Rejection{ErrorCode::InternalError, ex.what()};
        }
        handle.lock();

        if (failure)
        {
            store_.mark_failed(handle, *failure);
            return make_rejection(request.upload_id, progress, std::move(*failure));
        }
        store_.mark_completed(handle);
        return AssemblyOutcome{
            .status = AssemblyStatus::Completed,
            .upload_id = request.upload_id,
            .progress = progress,
            .artifact = std::move(artifact),
        };
    }

    AssemblyOutcome ChunkAssembler::cancel(const std::string &uploader_id, const std::string &upload_id)
    {
        auto handle = store_.acquire(upload_id);
        if (!handle || handle->uploader_id != uploader_id || handle->state != SessionState::Open)
        {
            if (handle && handle->uploader_id == uploader_id && handle->state == SessionState::Completing)
            {
                return make_rejection(upload_id, handle->progress(),
                                      Rejection{ErrorCode::UnknownOrClosedSession, "Upload is already completing"});
            }
            return make_rejection(upload_id, {}, reject_unavailable(store_, handle, uploader_id, upload_id));
        }
        const Rejection reason{ErrorCode::Cancelled, "Upload cancelled by client"};
        store_.mark_failed(handle, reason);
        return make_rejection(upload_id, handle->progress(), reason);
    }

    std::vector<SessionNotice> ChunkAssembler::cancel_all(const std::weak_ptr<FrameSink> &owner)
    {
        std::vector<SessionNotice> notices;
        const Rejection reason{ErrorCode::Cancelled, "Connection closed"};
        for (const auto &upload_id : store_.owned_by(owner))
        {
            auto handle = store_.acquire(upload_id);
            if (handle && handle->state == SessionState::Open)
            {
                notices.push_back(store_.mark_failed(handle, reason));
            }
        }
        return notices;
    }

} // namespace chatdrop::server
