#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "chatdrop/error_codes.hpp"
#include "chatdrop/server/upload_session.hpp"

namespace chatdrop::server
{

    // Exclusive access to one session; the session mutex is held for the handle's lifetime.
    class SessionHandle
    {
    public:
        SessionHandle() = default;
        explicit SessionHandle(std::shared_ptr<UploadSession> session);

        explicit operator bool() const noexcept { return session_ != nullptr; }

        UploadSession &operator*() const { return *session_; }
        UploadSession *operator->() const { return session_.get(); }

        void lock();
        void unlock();

    private:
        std::shared_ptr<UploadSession> session_;
        std::unique_lock<std::mutex> lock_;
    };

    // Outcome of a session that ended without the client's involvement, routed back to its owner.
    struct SessionNotice
    {
        std::string upload_id;
        std::string uploader_id;
        Rejection reason;
        std::uint64_t bytes_received{};
        std::uint64_t total_size{};
        std::weak_ptr<FrameSink> owner;
    };

    /**
     * Registry of live upload sessions plus tombstones of recently closed ones.
     *
     * A session leaves the live map as soon as it reaches a terminal state. Its tombstone keeps
     * the final state around for tombstone_retention so a late chunk can be told apart from a
     * chunk for an id that never existed.
     *
     * Lock order: a session mutex may be held while taking the store mutex, never the reverse.
     */
    class UploadSessionStore
    {
    public:
        using Clock = UploadSession::Clock;

        // Empty handle once drain() has run.
        SessionHandle open(const std::string &uploader_id, const std::string &room_id, UploadDeclaration declaration,
                           std::weak_ptr<FrameSink> owner, Clock::time_point now);

        // Empty handle when the id is not live. The returned session may have been retired
        // between lookup and locking; callers re-check the state.
        SessionHandle acquire(const std::string &upload_id);

        std::optional<SessionState> closed_state(const std::string &upload_id) const;

        void record_chunk(SessionHandle &handle, std::uint32_t index, std::vector<std::byte> payload,
                          Clock::time_point now);

        void touch(SessionHandle &handle, Clock::time_point now);

        // Open -> Completing. Returns the assembled bytes, or nullopt when another caller won.
        std::optional<std::vector<std::byte>> begin_completing(SessionHandle &handle);

        void mark_completed(SessionHandle &handle);

        SessionNotice mark_failed(SessionHandle &handle, const Rejection &reason);

        std::vector<SessionNotice> expire_stale(Clock::time_point now, std::chrono::seconds idle_timeout,
                                                std::chrono::seconds overall_timeout);

        // Fails every open session and refuses new ones; used at shutdown.
        std::vector<SessionNotice> drain(const Rejection &reason);

        std::vector<std::string> owned_by(const std::weak_ptr<FrameSink> &owner) const;

        std::size_t purge_tombstones(Clock::time_point now, std::chrono::seconds retention);

        std::size_t live_count() const;

    private:
        struct Tombstone
        {
            SessionState state{SessionState::Failed};
            Clock::time_point closed_at{};
        };

        void retire(UploadSession &session, Clock::time_point now);
        SessionNotice close_failed(UploadSession &session, SessionState state, const Rejection &reason,
                                   Clock::time_point now);
        std::vector<std::shared_ptr<UploadSession>> snapshot() const;
        std::string generate_upload_id();

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<UploadSession>> sessions_;
        std::unordered_map<std::string, Tombstone> tombstones_;
        bool draining_{false};
    };

} // namespace chatdrop::server
