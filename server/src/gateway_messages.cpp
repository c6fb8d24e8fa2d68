#include "chatdrop/server/upload_gateway.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chatdrop/encoding/base64.hpp"
#include "gateway_common.hpp"

namespace chatdrop::server
{

    void UploadGateway::handle_message_send(ClientContext &client, FrameSink &sink,
                                            const protocol::RequestEnvelope &envelope)
    {
        const auto uploader = require_uploader(client, sink, envelope);
        if (!uploader)
        {
            return;
        }
        try
        {
            const auto request = envelope.payload.get<protocol::MessageSendRequest>();
            if (request.room.empty() || request.content.empty())
            {
                sink.send(gateway_common::make_error_response(ErrorCode::InvalidPayload, "Room and content are required",
                                                              envelope.request_id));
                return;
            }
            if (looks_like_storage_path(request.content))
            {
                spdlog::warn("Refused message from {} in room {}: content looks like a storage path", *uploader,
                             request.room);
                sink.send(gateway_common::make_error_response(
                    ErrorCode::MisusedTransport,
                    "Message content looks like a file path; send attachments with UPLOAD_CHUNK instead",
                    envelope.request_id));
                return;
            }
            const protocol::MessagePosted posted{
                .message_id = rooms_.post_text(request.room, *uploader, request.content),
                .room = request.room,
            };
            sink.send(gateway_common::make_ok_response(posted, envelope.request_id));
        }
        catch (const nlohmann::json::exception &ex)
        {
            sink.send(gateway_common::make_error_response(ErrorCode::InvalidPayload, ex.what(), envelope.request_id));
        }
        catch (const protocol::PayloadError &ex)
        {
            sink.send(gateway_common::make_error_response(ErrorCode::InvalidPayload, ex.what(), envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            sink.send(gateway_common::make_error_response(ErrorCode::InternalError, ex.what(), envelope.request_id));
        }
    }

    void UploadGateway::handle_artifact_fetch(ClientContext &client, FrameSink &sink,
                                              const protocol::RequestEnvelope &envelope)
    {
        if (!require_uploader(client, sink, envelope))
        {
            return;
        }
        try
        {
            const auto request = envelope.payload.get<protocol::ArtifactFetchRequest>();
            std::string reference;
            if (request.reference && !request.reference->empty())
            {
                reference = *request.reference;
            }
            else if (request.message_id)
            {
                const auto message = rooms_.find_message(*request.message_id);
                if (!message)
                {
                    sink.send(gateway_common::make_error_response(ErrorCode::NotFound, "Message not found",
                                                                  envelope.request_id));
                    return;
                }
                if (!message->attachment_reference)
                {
                    sink.send(gateway_common::make_error_response(ErrorCode::NoAttachment,
                                                                  "Message has no attachment", envelope.request_id));
                    return;
                }
                reference = *message->attachment_reference;
            }
            else
            {
                sink.send(gateway_common::make_error_response(ErrorCode::InvalidPayload,
                                                              "reference or message_id is required",
                                                              envelope.request_id));
                return;
            }

            const auto artifact = artifacts_.find(reference);
            if (!artifact)
            {
                sink.send(gateway_common::make_error_response(ErrorCode::NotFound, "Artifact not found",
                                                              envelope.request_id));
                return;
            }

            const auto max_bytes = request.max_bytes == 0 ? limits_.max_chunk_bytes
                                                          : std::min(request.max_bytes, limits_.max_chunk_bytes);
            const auto data = artifacts_.read_range(*artifact, request.offset, max_bytes);
            const protocol::ArtifactChunkResponse response{
                .reference = artifact->public_reference,
                .content_type = artifact->content_type,
                .total_size = artifact->size_bytes,
                .offset = request.offset,
                .bytes = static_cast<std::uint64_t>(data.size()),
                .done = request.offset + data.size() >= artifact->size_bytes,
                .data_base64 = encoding::encode_base64(data),
            };
            sink.send(gateway_common::make_ok_response(response, envelope.request_id));
        }
        catch (const UploadError &error)
        {
            sink.send(gateway_common::make_error_response(error.code(), error.what(), envelope.request_id));
        }
        catch (const nlohmann::json::exception &ex)
        {
            sink.send(gateway_common::make_error_response(ErrorCode::InvalidPayload, ex.what(), envelope.request_id));
        }
        catch (const protocol::PayloadError &ex)
        {
            sink.send(gateway_common::make_error_response(ErrorCode::InvalidPayload, ex.what(), envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            sink.send(gateway_common::make_error_response(ErrorCode::InternalError, ex.what(), envelope.request_id));
        }
    }

} // namespace chatdrop::server
