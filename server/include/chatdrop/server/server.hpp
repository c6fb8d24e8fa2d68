#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <asio/thread_pool.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "chatdrop/server/artifact_finalizer.hpp"
#include "chatdrop/server/artifact_store.hpp"
#include "chatdrop/server/chunk_assembler.hpp"
#include "chatdrop/server/config.hpp"
#include "chatdrop/server/message_board.hpp"
#include "chatdrop/server/session_reaper.hpp"
#include "chatdrop/server/type_catalog.hpp"
#include "chatdrop/server/upload_gateway.hpp"
#include "chatdrop/server/upload_session_store.hpp"

namespace chatdrop::server
{

    class Connection;

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

        // Same path as SIGINT/SIGTERM: fail open uploads, flush and close connections, let run() return.
        void shutdown();

        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();
        void wait_for_connections(std::chrono::steady_clock::time_point deadline);
        std::size_t live_connections();

        ServerConfig config_;

        // Declared before the io_context so that handlers destroyed with it still find them alive.
        TypeCatalog catalog_;
        ArtifactStore artifact_store_;
        UploadSessionStore session_store_;
        ArtifactFinalizer finalizer_;
        ChunkAssembler assembler_;
        MessageBoard message_board_;
        UploadGateway gateway_;

        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer shutdown_timer_;
        asio::thread_pool intake_pool_;
        SessionReaper reaper_;

        std::mutex connections_mutex_;
        std::vector<std::weak_ptr<Connection>> connections_;
        std::vector<std::thread> workers_;
    };

} // namespace chatdrop::server
