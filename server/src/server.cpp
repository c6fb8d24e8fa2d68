#include "chatdrop/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "chatdrop/server/connection.hpp"

namespace chatdrop::server
{

    namespace
    {

        constexpr auto kShutdownGrace = std::chrono::seconds{5};
        constexpr auto kShutdownPoll = std::chrono::milliseconds{100};

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          catalog_(config_.types),
          artifact_store_(config_.storage_root),
          finalizer_(artifact_store_, catalog_),
          assembler_(session_store_, finalizer_, catalog_, config_.limits),
          gateway_(assembler_, artifact_store_, message_board_, config_.limits),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          shutdown_timer_(io_context_),
          intake_pool_(resolve_worker_threads(config_.worker_threads)),
          reaper_(io_context_, session_store_, config_.limits,
                  [this](const SessionNotice &notice)
                  { gateway_.notify(notice); })
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with storage root {}", config_.address, config_.port,
                     config_.storage_root.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        reaper_.start();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        intake_pool_.join();
    }

    void Server::shutdown()
    {
        asio::post(io_context_, [this]
                   { handle_signal(); });
    }

    std::uint16_t Server::port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            auto connection = std::make_shared<Connection>(std::move(socket), gateway_, intake_pool_, config_.limits);
            {
                std::lock_guard lock(connections_mutex_);
                std::erase_if(connections_, [](const auto &entry)
                              { return entry.expired(); });
                connections_.push_back(connection);
            }
            connection->start();
            spdlog::debug("Accepted new connection");
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::handle_signal()
    {
        spdlog::info("Signal received, shutting down");
        reaper_.stop();
        std::error_code ec;
        signals_.cancel(ec);
        acceptor_.close(ec);

        // From here on no upload can be opened; frames still queued on the intake pool are refused.
        const auto notices = session_store_.drain(Rejection{ErrorCode::Cancelled, "Server shutting down"});
        for (const auto &notice : notices)
        {
            gateway_.notify(notice);
        }
        if (!notices.empty())
        {
            spdlog::info("Cancelled {} open upload(s)", notices.size());
        }

        std::vector<std::shared_ptr<Connection>> live;
        {
            std::lock_guard lock(connections_mutex_);
            for (const auto &entry : connections_)
            {
                if (auto connection = entry.lock())
                {
                    live.push_back(std::move(connection));
                }
            }
        }
        for (const auto &connection : live)
        {
            connection->shutdown();
        }
        wait_for_connections(std::chrono::steady_clock::now() + kShutdownGrace);
    }

    std::size_t Server::live_connections()
    {
        std::lock_guard lock(connections_mutex_);
        std::erase_if(connections_, [](const auto &entry)
                      { return entry.expired(); });
        return connections_.size();
    }

    void Server::wait_for_connections(std::chrono::steady_clock::time_point deadline)
    {
        shutdown_timer_.expires_after(kShutdownPoll);
        shutdown_timer_.async_wait([this, deadline](const std::error_code &ec)
                                   {
                                       if (ec)
                                       {
                                           return;
                                       }
                                       const auto remaining = live_connections();
                                       if (remaining == 0)
                                       {
                                           return;
                                       }
                                       if (std::chrono::steady_clock::now() >= deadline)
                                       {
                                           spdlog::warn("{} connection(s) still open after the grace period, stopping",
                                                        remaining);
                                           io_context_.stop();
                                           return;
                                       }
                                       wait_for_connections(deadline); });
    }

} // namespace chatdrop::server
