#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chatdrop/error_codes.hpp"
#include "chatdrop/protocol.hpp"
#include "chatdrop/server/upload_session.hpp"

namespace chatdrop::server::gateway_common
{

    protocol::ResponseEnvelope make_ok_response(nlohmann::json payload, const std::optional<std::string> &request_id);

    protocol::ResponseEnvelope make_error_response(ErrorCode code, std::string message,
                                                   const std::optional<std::string> &request_id);

    protocol::ResponseEnvelope make_progress_event(const std::string &upload_id, const ProgressSnapshot &progress,
                                                   const std::optional<std::string> &request_id);

    protocol::ResponseEnvelope make_failure_event(const std::string &upload_id, const Rejection &reason,
                                                  std::uint64_t bytes_received,
                                                  const std::optional<std::string> &request_id);

} // namespace chatdrop::server::gateway_common
