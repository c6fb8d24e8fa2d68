#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/strand.hpp>
#include <asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include "chatdrop/framing.hpp"
#include "chatdrop/protocol.hpp"
#include "chatdrop/server/config.hpp"
#include "chatdrop/server/frame_sink.hpp"
#include "chatdrop/server/upload_gateway.hpp"

namespace chatdrop::server
{

    /**
     * One client socket. Reads, writes and bookkeeping run on the connection's strand; request
     * handling (other than HELLO) runs on the shared intake pool so a slow finalize never holds
     * up the read loop. Reading pauses while max_inflight_frames requests are outstanding.
     */
    class Connection : public FrameSink, public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(asio::ip::tcp::socket socket, UploadGateway &gateway, asio::thread_pool &intake,
                   const UploadLimits &limits);
        ~Connection() override;

        void start();

        void stop();

        // Writes out the frames already queued, then closes.
        void shutdown();

        void send(protocol::ResponseEnvelope envelope) override;

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void dispatch(const nlohmann::json &json);
        void on_request_finished();
        void write_next();
        void on_disconnect();
        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        asio::strand<asio::any_io_executor> strand_;
        UploadGateway &gateway_;
        asio::thread_pool &intake_;
        std::size_t max_frame_bytes_;
        std::size_t max_inflight_;
        std::string peer_;

        std::array<std::uint8_t, protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        ClientContext context_;

        std::deque<std::shared_ptr<std::vector<std::uint8_t>>> write_queue_;
        bool writing_{false};
        bool close_after_write_{false};
        bool read_paused_{false};
        std::size_t inflight_{0};
        std::atomic<bool> closed_{false};
        std::atomic<bool> disconnected_{false};
    };

} // namespace chatdrop::server
