#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "chatdrop/protocol.hpp"
#include "chatdrop/server/artifact_store.hpp"
#include "chatdrop/server/chunk_assembler.hpp"
#include "chatdrop/server/config.hpp"
#include "chatdrop/server/frame_sink.hpp"
#include "chatdrop/server/message_board.hpp"

namespace chatdrop::server
{

    // Per-connection state seen by the gateway. Frames of one connection may be handled on
    // several intake threads at once.
    class ClientContext
    {
    public:
        ClientContext() = default;
        explicit ClientContext(std::weak_ptr<FrameSink> sink);

        void attach(std::weak_ptr<FrameSink> sink);
        const std::weak_ptr<FrameSink> &sink() const noexcept { return sink_; }

        std::optional<std::string> uploader() const;
        // False when an identity is already bound.
        bool bind(const std::string &uploader);

    private:
        mutable std::mutex mutex_;
        std::optional<std::string> uploader_;
        std::weak_ptr<FrameSink> sink_;
    };

    /**
     * Command dispatcher between the wire and the upload core. It never touches a socket:
     * every reply, progress event and asynchronous notice goes out through the client's
     * FrameSink.
     */
    class UploadGateway
    {
    public:
        UploadGateway(ChunkAssembler &assembler, ArtifactStore &artifacts, RoomMessageSink &rooms,
                      const UploadLimits &limits);

        void handle(ClientContext &client, const protocol::RequestEnvelope &envelope);

        // Replies ERROR {InvalidPayload} to a frame that did not decode as a request envelope.
        void reject_malformed(ClientContext &client, std::string message);

        // FAILED frame for a session closed outside any request (expiry, shutdown).
        void notify(const SessionNotice &notice);

        // Cancels the open uploads started on this connection.
        void disconnect(ClientContext &client);

        // True for text that is really an upload smuggled through the message path.
        static bool looks_like_storage_path(std::string_view content);

    private:
        void handle_hello(ClientContext &client, FrameSink &sink, const protocol::RequestEnvelope &envelope);
        void handle_upload_begin(ClientContext &client, FrameSink &sink, const protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(ClientContext &client, FrameSink &sink, const protocol::RequestEnvelope &envelope);
        void handle_upload_cancel(ClientContext &client, FrameSink &sink, const protocol::RequestEnvelope &envelope);
        void handle_message_send(ClientContext &client, FrameSink &sink, const protocol::RequestEnvelope &envelope);
        void handle_artifact_fetch(ClientContext &client, FrameSink &sink, const protocol::RequestEnvelope &envelope);

        std::optional<std::string> require_uploader(ClientContext &client, FrameSink &sink,
                                                    const protocol::RequestEnvelope &envelope);
        void send_outcome(FrameSink &sink, const AssemblyOutcome &outcome,
                          const std::optional<std::string> &request_id);

        ChunkAssembler &assembler_;
        ArtifactStore &artifacts_;
        RoomMessageSink &rooms_;
        UploadLimits limits_;
    };

} // namespace chatdrop::server
