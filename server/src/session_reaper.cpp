#include "chatdrop/server/session_reaper.hpp"

#include <spdlog/spdlog.h>

namespace chatdrop::server
{

    SessionReaper::SessionReaper(asio::io_context &io_context, UploadSessionStore &store, const UploadLimits &limits,
                                 NoticeHandler handler)
        : timer_(io_context), store_(store), limits_(limits), handler_(std::move(handler)) {}

    void SessionReaper::start()
    {
        running_ = true;
        schedule_next();
    }

    void SessionReaper::stop()
    {
        running_ = false;
        timer_.cancel();
    }

    std::size_t SessionReaper::sweep(UploadSession::Clock::time_point now)
    {
        const auto notices = store_.expire_stale(now, limits_.idle_timeout, limits_.overall_timeout);
        const auto purged = store_.purge_tombstones(now, limits_.tombstone_retention);
        if (!notices.empty() || purged > 0)
        {
            spdlog::debug("Reaper expired {} upload(s), purged {} tombstone(s), {} live", notices.size(), purged,
                          store_.live_count());
        }
        if (handler_)
        {
            for (const auto &notice : notices)
            {
                handler_(notice);
            }
        }
        return notices.size();
    }

    void SessionReaper::schedule_next()
    {
        if (!running_)
        {
            return;
        }
        timer_.expires_after(limits_.sweep_interval);
        timer_.async_wait([this](const std::error_code &ec)
                          {
                              if (ec || !running_)
                              {
                                  return;
                              }
                              sweep(UploadSession::Clock::now());
                              schedule_next(); });
    }

} // namespace chatdrop::server
