#include "chatdrop/server/upload_gateway.hpp"

#include <cctype>

#include <spdlog/spdlog.h>

#include "gateway_common.hpp"

namespace chatdrop::server
{

    namespace
    {

        std::string_view trim(std::string_view value)
        {
            const auto begin = value.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = value.find_last_not_of(" \t\r\n");
            return value.substr(begin, end - begin + 1);
        }

        bool all_digits(std::string_view value)
        {
            for (const char ch : value)
            {
                if (!std::isdigit(static_cast<unsigned char>(ch)))
                {
                    return false;
                }
            }
            return !value.empty();
        }

        // "<category>/YYYYMMDD-HHMMSS-..." as produced for stored artifacts.
        bool looks_like_reference(std::string_view content)
        {
            const auto slash = content.find('/');
            if (slash == std::string_view::npos || !category_from_string(content.substr(0, slash)))
            {
                return false;
            }
            const auto key = content.substr(slash + 1);
            return key.size() > 16 && all_digits(key.substr(0, 8)) && key[8] == '-' && all_digits(key.substr(9, 6)) &&
                   key[15] == '-';
        }

    } // namespace

    ClientContext::ClientContext(std::weak_ptr<FrameSink> sink) : sink_(std::move(sink)) {}

    void ClientContext::attach(std::weak_ptr<FrameSink> sink)
    {
        sink_ = std::move(sink);
    }

    std::optional<std::string> ClientContext::uploader() const
    {
        std::lock_guard lock(mutex_);
        return uploader_;
    }

    bool ClientContext::bind(const std::string &uploader)
    {
        std::lock_guard lock(mutex_);
        if (uploader_)
        {
            return false;
        }
        uploader_ = uploader;
        return true;
    }

    UploadGateway::UploadGateway(ChunkAssembler &assembler, ArtifactStore &artifacts, RoomMessageSink &rooms,
                                 const UploadLimits &limits)
        : assembler_(assembler), artifacts_(artifacts), rooms_(rooms), limits_(limits) {}

    void UploadGateway::handle(ClientContext &client, const protocol::RequestEnvelope &envelope)
    {
        const auto sink = client.sink().lock();
        if (!sink)
        {
            return;
        }

        spdlog::debug("{} -> command {}", client.uploader().value_or("<anonymous>"),
                      protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case protocol::Command::Hello:
            handle_hello(client, *sink, envelope);
            break;
        case protocol::Command::UploadBegin:
            handle_upload_begin(client, *sink, envelope);
            break;
        case protocol::Command::UploadChunk:
            handle_upload_chunk(client, *sink, envelope);
            break;
        case protocol::Command::UploadCancel:
            handle_upload_cancel(client, *sink, envelope);
            break;
        case protocol::Command::MessageSend:
            handle_message_send(client, *sink, envelope);
            break;
        case protocol::Command::ArtifactFetch:
            handle_artifact_fetch(client, *sink, envelope);
            break;
        case protocol::Command::Ping:
            sink->send(gateway_common::make_ok_response(nlohmann::json::object(), envelope.request_id));
            break;
        default:
            sink->send(gateway_common::make_error_response(ErrorCode::InvalidCommand, "Command not supported",
                                                           envelope.request_id));
            break;
        }
    }

    void UploadGateway::reject_malformed(ClientContext &client, std::string message)
    {
        if (const auto sink = client.sink().lock())
        {
            sink->send(gateway_common::make_error_response(ErrorCode::InvalidPayload, std::move(message), std::nullopt));
        }
    }

    void UploadGateway::notify(const SessionNotice &notice)
    {
        const auto sink = notice.owner.lock();
        if (!sink)
        {
            return;
        }
        sink->send(gateway_common::make_failure_event(notice.upload_id, notice.reason, notice.bytes_received,
                                                      std::nullopt));
    }

    void UploadGateway::disconnect(ClientContext &client)
    {
        const auto notices = assembler_.cancel_all(client.sink());
        if (!notices.empty())
        {
            spdlog::info("Cancelled {} open upload(s) of {} on disconnect", notices.size(),
                         client.uploader().value_or("<anonymous>"));
        }
    }

    bool UploadGateway::looks_like_storage_path(std::string_view content)
    {
        content = trim(content);
        return content.starts_with("uploads/") || content.find("auto_generated") != std::string_view::npos ||
               looks_like_reference(content);
    }

    void UploadGateway::handle_hello(ClientContext &client, FrameSink &sink, const protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<protocol::HelloRequest>();
            if (request.uploader.empty())
            {
                sink.send(gateway_common::make_error_response(ErrorCode::InvalidPayload, "Uploader is required",
                                                              envelope.request_id));
                return;
            }
            if (!client.bind(request.uploader))
            {
                sink.send(gateway_common::make_error_response(ErrorCode::InvalidCommand, "Already identified",
                                                              envelope.request_id));
                return;
            }
            spdlog::info("Connection identified as {}", request.uploader);
            nlohmann::json payload;
            payload["uploader"] = request.uploader;
            sink.send(gateway_common::make_ok_response(payload, envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            sink.send(gateway_common::make_error_response(ErrorCode::InvalidPayload, ex.what(), envelope.request_id));
        }
    }

    std::optional<std::string> UploadGateway::require_uploader(ClientContext &client, FrameSink &sink,
                                                               const protocol::RequestEnvelope &envelope)
    {
        auto uploader = client.uploader();
        if (!uploader)
        {
            sink.send(gateway_common::make_error_response(ErrorCode::AuthenticationRequired, "HELLO required",
                                                          envelope.request_id));
        }
        return uploader;
    }

    void UploadGateway::send_outcome(FrameSink &sink, const AssemblyOutcome &outcome,
                                     const std::optional<std::string> &request_id)
    {
        spdlog::debug("Upload {}: {}", outcome.upload_id.empty() ? "<none>" : outcome.upload_id,
                      to_string(outcome.status));
        switch (outcome.status)
        {
        case AssemblyStatus::Accepted:
        case AssemblyStatus::DuplicateIgnored:
            sink.send(gateway_common::make_progress_event(outcome.upload_id, outcome.progress, request_id));
            break;
        case AssemblyStatus::Completed:
        {
            const auto &artifact = *outcome.artifact;
            std::optional<std::uint64_t> message_id;
            try
            {
                message_id = rooms_.publish_attachment(AttachmentEvent{
                    .room_id = artifact.room_id,
                    .uploader_id = artifact.uploader_id,
                    .public_reference = artifact.public_reference,
                    .content_type = artifact.content_type,
                    .size_bytes = artifact.size_bytes,
                    .original_file_name = artifact.original_file_name,
                });
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Upload {} stored as {} but the room was not notified: {}", outcome.upload_id,
                              artifact.public_reference, ex.what());
            }
            protocol::ResponseEnvelope envelope;
            envelope.kind = protocol::ResponseKind::Completed;
            envelope.payload = protocol::CompletionFrame{
                .upload_id = outcome.upload_id,
                .public_reference = artifact.public_reference,
                .content_type = artifact.content_type,
                .size_bytes = artifact.size_bytes,
                .category = std::string(to_string(artifact.category)),
                .message_id = message_id,
            };
            envelope.request_id = request_id;
            sink.send(std::move(envelope));
            break;
        }
        case AssemblyStatus::Rejected:
        {
            const auto reason = outcome.rejection.value_or(Rejection{ErrorCode::InternalError, "Upload rejected"});
            sink.send(gateway_common::make_failure_event(outcome.upload_id, reason, outcome.progress.bytes_received,
                                                         request_id));
            break;
        }
        }
    }

} // namespace chatdrop::server
