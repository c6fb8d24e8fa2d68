#pragma once

#include <atomic>
#include <cstddef>
#include <functional>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include "chatdrop/server/config.hpp"
#include "chatdrop/server/upload_session_store.hpp"

namespace chatdrop::server
{

    // Periodically expires idle or overdue uploads and forgets old tombstones.
    class SessionReaper
    {
    public:
        using NoticeHandler = std::function<void(const SessionNotice &)>;

        SessionReaper(asio::io_context &io_context, UploadSessionStore &store, const UploadLimits &limits,
                      NoticeHandler handler);

        void start();
        void stop();

        // Returns the number of sessions expired by this sweep.
        std::size_t sweep(UploadSession::Clock::time_point now);

    private:
        void schedule_next();

        asio::steady_timer timer_;
        UploadSessionStore &store_;
        UploadLimits limits_;
        NoticeHandler handler_;
        std::atomic<bool> running_{false};
    };

} // namespace chatdrop::server
