#include "chatdrop/server/upload_session_store.hpp"

#include <spdlog/spdlog.h>

#include "chatdrop/crypto.hpp"

namespace chatdrop::server
{

    namespace
    {
        constexpr std::size_t kUploadIdBytes = 16;

        bool same_owner(const std::weak_ptr<FrameSink> &lhs, const std::weak_ptr<FrameSink> &rhs)
        {
            return !lhs.owner_before(rhs) && !rhs.owner_before(lhs);
        }

    } // namespace

    SessionHandle::SessionHandle(std::shared_ptr<UploadSession> session)
        : session_(std::move(session))
    {
        if (session_)
        {
            lock_ = std::unique_lock<std::mutex>(session_->mutex);
        }
    }

    void SessionHandle::lock()
    {
        if (lock_.mutex() && !lock_.owns_lock())
        {
            lock_.lock();
        }
    }

    void SessionHandle::unlock()
    {
        if (lock_.owns_lock())
        {
            lock_.unlock();
        }
    }

    SessionHandle UploadSessionStore::open(const std::string &uploader_id, const std::string &room_id,
                                           UploadDeclaration declaration, std::weak_ptr<FrameSink> owner,
                                           Clock::time_point now)
    {
        auto session = std::make_shared<UploadSession>();
        session->uploader_id = uploader_id;
        session->room_id = room_id;
        session->declaration = std::move(declaration);
        session->created_at = now;
        session->last_activity_at = now;
        session->owner = std::move(owner);
        {
            std::lock_guard lock(mutex_);
            if (draining_)
            {
                return {};
            }
            session->upload_id = generate_upload_id();
            sessions_[session->upload_id] = session;
        }
        spdlog::debug("Upload {} opened by {} in room {} ({} bytes, {} chunks)", session->upload_id, uploader_id,
                      room_id, session->declaration.total_size, session->declaration.total_chunks);
        return SessionHandle(std::move(session));
    }

    SessionHandle UploadSessionStore::acquire(const std::string &upload_id)
    {
        std::shared_ptr<UploadSession> session;
        {
            std::lock_guard lock(mutex_);
            const auto it = sessions_.find(upload_id);
            if (it == sessions_.end())
            {
                return {};
            }
            session = it->second;
        }
        return SessionHandle(std::move(session));
    }

    std::optional<SessionState> UploadSessionStore::closed_state(const std::string &upload_id) const
    {
        std::lock_guard lock(mutex_);
        const auto it = tombstones_.find(upload_id);
        if (it == tombstones_.end())
        {
            return std::nullopt;
        }
        return it->second.state;
    }

    void UploadSessionStore::record_chunk(SessionHandle &handle, std::uint32_t index, std::vector<std::byte> payload,
                                          Clock::time_point now)
    {
        handle->buffer.store(index, std::move(payload));
        handle->last_activity_at = now;
    }

    void UploadSessionStore::touch(SessionHandle &handle, Clock::time_point now)
    {
        handle->last_activity_at = now;
    }

    std::optional<std::vector<std::byte>> UploadSessionStore::begin_completing(SessionHandle &handle)
    {
        if (handle->state != SessionState::Open)
        {
            return std::nullopt;
        }
        handle->state = SessionState::Completing;
        auto bytes = handle->buffer.assemble();
        handle->buffer.release();
        return bytes;
    }

    void UploadSessionStore::mark_completed(SessionHandle &handle)
    {
        auto &session = *handle;
        session.state = SessionState::Completed;
        session.buffer.release();
        retire(session, Clock::now());
        spdlog::info("Upload {} completed for {} ({} bytes)", session.upload_id, session.uploader_id,
                     session.buffer.byte_count());
    }

    SessionNotice UploadSessionStore::mark_failed(SessionHandle &handle, const Rejection &reason)
    {
        return close_failed(*handle, SessionState::Failed, reason, Clock::now());
    }

    std::vector<SessionNotice> UploadSessionStore::expire_stale(Clock::time_point now,
                                                                std::chrono::seconds idle_timeout,
                                                                std::chrono::seconds overall_timeout)
    {
        std::vector<SessionNotice> notices;
        for (auto &session : snapshot())
        {
            SessionHandle handle(session);
            // Completing sessions are owned by their finalizer and are left alone.
            if (session->state != SessionState::Open)
            {
                continue;
            }
            const bool idle = now - session->last_activity_at >= idle_timeout;
            const bool overdue = now - session->created_at >= overall_timeout;
            if (!idle && !overdue)
            {
                continue;
            }
            const Rejection reason{
                .code = ErrorCode::SessionExpired,
                .message = idle ? "Upload idle for too long" : "Upload exceeded its time limit",
            };
            notices.push_back(close_failed(*session, SessionState::Expired, reason, now));
        }
        return notices;
    }

    std::vector<SessionNotice> UploadSessionStore::drain(const Rejection &reason)
    {
        {
            std::lock_guard lock(mutex_);
            draining_ = true;
        }
        std::vector<SessionNotice> notices;
        for (auto &session : snapshot())
        {
            SessionHandle handle(session);
            if (session->state == SessionState::Open)
            {
                notices.push_back(close_failed(*session, SessionState::Failed, reason, Clock::now()));
            }
        }
        return notices;
    }

    std::vector<std::string> UploadSessionStore::owned_by(const std::weak_ptr<FrameSink> &owner) const
    {
        std::vector<std::string> ids;
        for (const auto &session : snapshot())
        {
            std::lock_guard session_lock(session->mutex);
            if (session->state == SessionState::Open && same_owner(session->owner, owner))
            {
                ids.push_back(session->upload_id);
            }
        }
        return ids;
    }

    std::size_t UploadSessionStore::purge_tombstones(Clock::time_point now, std::chrono::seconds retention)
    {
        std::lock_guard lock(mutex_);
        return std::erase_if(tombstones_, [&](const auto &item)
                             { return now - item.second.closed_at >= retention; });
    }

    std::size_t UploadSessionStore::live_count() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    void UploadSessionStore::retire(UploadSession &session, Clock::time_point now)
    {
        std::lock_guard lock(mutex_);
        sessions_.erase(session.upload_id);
        tombstones_[session.upload_id] = Tombstone{.state = session.state, .closed_at = now};
    }

    SessionNotice UploadSessionStore::close_failed(UploadSession &session, SessionState state,
                                                   const Rejection &reason, Clock::time_point now)
    {
        session.state = state;
        session.buffer.release();
        retire(session, now);
        spdlog::warn("Upload {} from {} {}: {} ({}) after {} of {} bytes", session.upload_id, session.uploader_id,
                     to_string(state), chatdrop::to_string(reason.code), reason.message, session.buffer.byte_count(),
                     session.declaration.total_size);
        return SessionNotice{
            .upload_id = session.upload_id,
            .uploader_id = session.uploader_id,
            .reason = reason,
            .bytes_received = session.buffer.byte_count(),
            .total_size = session.declaration.total_size,
            .owner = session.owner,
        };
    }

    std::vector<std::shared_ptr<UploadSession>> UploadSessionStore::snapshot() const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::shared_ptr<UploadSession>> sessions;
        sessions.reserve(sessions_.size());
        for (const auto &[id, session] : sessions_)
        {
            sessions.push_back(session);
        }
        return sessions;
    }

    std::string UploadSessionStore::generate_upload_id()
    {
        while (true)
        {
            auto id = crypto::random_hex(kUploadIdBytes);
            if (!sessions_.contains(id) && !tombstones_.contains(id))
            {
                return id;
            }
        }
    }

} // namespace chatdrop::server
