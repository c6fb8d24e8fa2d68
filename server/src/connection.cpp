#include "chatdrop/server/connection.hpp"

#include <algorithm>
#include <optional>

#include <asio/bind_executor.hpp>
#include <asio/post.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <spdlog/spdlog.h>

namespace chatdrop::server
{

    Connection::Connection(asio::ip::tcp::socket socket, UploadGateway &gateway, asio::thread_pool &intake,
                           const UploadLimits &limits)
        : socket_(std::move(socket)),
          strand_(asio::make_strand(socket_.get_executor())),
          gateway_(gateway),
          intake_(intake),
          max_frame_bytes_(limits.max_frame_bytes),
          max_inflight_(limits.max_inflight_frames),
          peer_(remote_endpoint()) {}

    Connection::~Connection()
    {
        on_disconnect();
    }

    void Connection::start()
    {
        spdlog::info("Client connected from {}", peer_);
        context_.attach(weak_from_this());
        asio::post(strand_, [self = shared_from_this()]
                   { self->read_frame_header(); });
    }

    void Connection::stop()
    {
        if (closed_.exchange(true))
        {
            return;
        }
        std::error_code ec;
        spdlog::info("Closing connection for {}", peer_);
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        write_queue_.clear();
        on_disconnect();
    }

    void Connection::shutdown()
    {
        asio::post(strand_, [this, self = shared_from_this()]
                   {
                       if (closed_)
                       {
                           return;
                       }
                       close_after_write_ = true;
                       if (!writing_)
                       {
                           stop();
                       } });
    }

    void Connection::send(protocol::ResponseEnvelope envelope)
    {
        std::shared_ptr<std::vector<std::uint8_t>> frame;
        try
        {
            frame = std::make_shared<std::vector<std::uint8_t>>(
                protocol::encode_frame(nlohmann::json(envelope), max_frame_bytes_));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Dropping {} frame for {}: {}", protocol::to_string(envelope.kind), peer_, ex.what());
            return;
        }
        asio::post(strand_, [this, self = shared_from_this(), frame]
                   {
                       if (closed_)
                       {
                           return;
                       }
                       write_queue_.push_back(frame);
                       if (!writing_)
                       {
                           write_next();
                       } });
    }

    void Connection::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         asio::bind_executor(strand_, [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                                             {
                                                 if (ec)
                                                 {
                                                     stop();
                                                     return;
                                                 }
                                                 const std::uint32_t payload_size = protocol::read_frame_length(header_buffer_);
                                                 if (payload_size == 0)
                                                 {
                                                     read_frame_header();
                                                     return;
                                                 }
                                                 if (payload_size > max_frame_bytes_)
                                                 {
                                                     spdlog::warn("{} sent a {} byte frame, limit is {}", peer_, payload_size,
                                                                  max_frame_bytes_);
                                                     close_after_write_ = true;
                                                     gateway_.reject_malformed(context_, "Frame too large");
                                                     return;
                                                 }
                                                 buffer_.resize(protocol::kFrameHeaderSize + payload_size);
                                                 std::copy(header_buffer_.begin(), header_buffer_.end(), buffer_.begin());
                                                 read_frame_payload(payload_size); }));
    }

    void Connection::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data() + protocol::kFrameHeaderSize, size),
                         asio::bind_executor(strand_, [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                                             {
                                                 if (ec)
                                                 {
                                                     stop();
                                                     return;
                                                 }
                                                 std::optional<protocol::DecodedFrame> frame;
                                                 try
                                                 {
                                                     frame = protocol::try_decode_frame(buffer_, max_frame_bytes_);
                                                 }
                                                 catch (const protocol::FrameError &ex)
                                                 {
                                                     gateway_.reject_malformed(context_, ex.what());
                                                 }
                                                 if (frame)
                                                 {
                                                     dispatch(frame->message);
                                                 }
                                                 if (inflight_ < max_inflight_)
                                                 {
                                                     read_frame_header();
                                                 }
                                                 else
                                                 {
                                                     read_paused_ = true;
                                                 } }));
    }

    void Connection::dispatch(const nlohmann::json &json)
    {
        protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            gateway_.reject_malformed(context_, ex.what());
            return;
        }

        // Identity must be bound before any later frame of this connection is handled.
        if (envelope.command == protocol::Command::Hello)
        {
            gateway_.handle(context_, envelope);
            return;
        }

        ++inflight_;
        asio::post(intake_, [this, self = shared_from_this(), envelope = std::move(envelope)]
                   {
                       if (!closed_)
                       {
                           gateway_.handle(context_, envelope);
                       }
                       asio::post(strand_, [this, self]
                                  { on_request_finished(); }); });
    }

    void Connection::on_request_finished()
    {
        --inflight_;
        if (read_paused_ && !closed_ && inflight_ < max_inflight_)
        {
            read_paused_ = false;
            read_frame_header();
        }
    }

    void Connection::write_next()
    {
        if (write_queue_.empty())
        {
            writing_ = false;
            if (close_after_write_)
            {
                stop();
            }
            return;
        }
        writing_ = true;
        auto frame = write_queue_.front();
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          asio::bind_executor(strand_, [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                                              {
                                                  if (ec)
                                                  {
                                                      writing_ = false;
                                                      stop();
                                                      return;
                                                  }
                                                  if (!write_queue_.empty())
                                                  {
                                                      write_queue_.pop_front();
                                                  }
                                                  write_next(); }));
    }

    void Connection::on_disconnect()
    {
        if (disconnected_.exchange(true))
        {
            return;
        }
        gateway_.disconnect(context_);
    }

    std::string Connection::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        try
        {
            return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }
        catch (const std::exception &)
        {
            return "unknown";
        }
    }

} // namespace chatdrop::server
