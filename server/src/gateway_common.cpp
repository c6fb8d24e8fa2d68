#include "gateway_common.hpp"

namespace chatdrop::server::gateway_common
{

    protocol::ResponseEnvelope make_ok_response(nlohmann::json payload, const std::optional<std::string> &request_id)
    {
        protocol::ResponseEnvelope envelope;
        envelope.kind = protocol::ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.error = ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

    protocol::ResponseEnvelope make_error_response(ErrorCode code, std::string message,
                                                   const std::optional<std::string> &request_id)
    {
        protocol::ResponseEnvelope envelope;
        envelope.kind = protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = request_id;
        return envelope;
    }

    protocol::ResponseEnvelope make_progress_event(const std::string &upload_id, const ProgressSnapshot &progress,
                                                   const std::optional<std::string> &request_id)
    {
        protocol::ResponseEnvelope envelope;
        envelope.kind = protocol::ResponseKind::Progress;
        envelope.payload = protocol::ProgressFrame{
            .upload_id = upload_id,
            .bytes_received = progress.bytes_received,
            .total_size = progress.total_size,
            .chunks_received = progress.chunks_received,
            .total_chunks = progress.total_chunks,
        };
        envelope.request_id = request_id;
        return envelope;
    }

    protocol::ResponseEnvelope make_failure_event(const std::string &upload_id, const Rejection &reason,
                                                  std::uint64_t bytes_received,
                                                  const std::optional<std::string> &request_id)
    {
        protocol::ResponseEnvelope envelope;
        envelope.kind = protocol::ResponseKind::Failed;
        envelope.error = reason.code;
        envelope.message = reason.message;
        envelope.payload = protocol::FailureFrame{
            .upload_id = upload_id,
            .error_kind = reason.code,
            .message = reason.message,
            .bytes_received = bytes_received,
        };
        envelope.request_id = request_id;
        return envelope;
    }

} // namespace chatdrop::server::gateway_common
