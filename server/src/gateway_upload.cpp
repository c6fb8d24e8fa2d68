#include "chatdrop/server/upload_gateway.hpp"

#include <nlohmann/json.hpp>

#include "chatdrop/encoding/base64.hpp"
#include "gateway_common.hpp"

namespace chatdrop::server
{

    void UploadGateway::handle_upload_begin(ClientContext &client, FrameSink &sink,
                                            const protocol::RequestEnvelope &envelope)
    {
        const auto uploader = require_uploader(client, sink, envelope);
        if (!uploader)
        {
            return;
        }
        try
        {
            const auto request = envelope.payload.get<protocol::UploadBeginRequest>();
            const UploadContext context{.uploader_id = *uploader, .room_id = request.room, .owner = client.sink()};
            const UploadDeclaration declaration{
                .file_name = request.file_name,
                .content_type = request.content_type,
                .total_size = request.total_size,
                .total_chunks = request.total_chunks,
            };
            const auto outcome = assembler_.begin(context, declaration);
            if (outcome.status == AssemblyStatus::Rejected)
            {
                const auto &reason = *outcome.rejection;
                sink.send(gateway_common::make_error_response(reason.code, reason.message, envelope.request_id));
                return;
            }
            const protocol::UploadStarted started{
                .upload_id = outcome.upload_id,
                .total_size = declaration.total_size,
                .total_chunks = declaration.total_chunks,
            };
            sink.send(gateway_common::make_ok_response(started, envelope.request_id));
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

    void UploadGateway::handle_upload_chunk(ClientContext &client, FrameSink &sink,
                                            const protocol::RequestEnvelope &envelope)
    {
        const auto uploader = require_uploader(client, sink, envelope);
        if (!uploader)
        {
            return;
        }
        try
        {
            const auto request = envelope.payload.get<protocol::UploadChunkRequest>();
            auto data = encoding::decode_base64(request.data_base64);
            if (!data)
            {
                sink.send(gateway_common::make_error_response(ErrorCode::InvalidPayload, "Invalid chunk data",
                                                              envelope.request_id));
                return;
            }

            const UploadDeclaration declared{
                .file_name = request.file_name,
                .content_type = request.content_type,
                .total_size = request.total_size,
                .total_chunks = request.total_chunks,
            };
            std::string upload_id;
            std::optional<UploadDeclaration> repeated;
            if (request.upload_id && !request.upload_id->empty())
            {
                upload_id = *request.upload_id;
                repeated = declared;
            }
            else
            {
                // First chunk without an id opens the session from the frame's own declaration.
                const UploadContext context{.uploader_id = *uploader, .room_id = request.room, .owner = client.sink()};
                const auto opened = assembler_.begin(context, declared);
                if (opened.status == AssemblyStatus::Rejected)
                {
                    send_outcome(sink, opened, envelope.request_id);
                    return;
                }
                upload_id = opened.upload_id;
            }

            const auto outcome = assembler_.accept(*uploader, upload_id, request.sequence, std::move(*data), repeated);
            send_outcome(sink, outcome, envelope.request_id);
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

    void UploadGateway::handle_upload_cancel(ClientContext &client, FrameSink &sink,
                                             const protocol::RequestEnvelope &envelope)
    {
        const auto uploader = require_uploader(client, sink, envelope);
        if (!uploader)
        {
            return;
        }
        try
        {
            const auto request = envelope.payload.get<protocol::UploadCancelRequest>();
            send_outcome(sink, assembler_.cancel(*uploader, request.upload_id), envelope.request_id);
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
