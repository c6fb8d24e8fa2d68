#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "chatdrop/error_codes.hpp"
#include "chatdrop/server/config.hpp"
#include "chatdrop/server/upload_session.hpp"

// Stateless checks applied to upload declarations and chunks before they touch a session.
namespace chatdrop::server::chunk_validator
{

    std::optional<Rejection> check_declaration(const UploadDeclaration &declaration, std::string_view room_id,
                                               const UploadLimits &limits);

    // Sequence numbers on the wire are 1-based; index = sequence - 1.
    std::optional<std::uint32_t> chunk_index(const UploadDeclaration &declaration, std::int64_t sequence) noexcept;

    std::optional<Rejection> check_sequence(const UploadDeclaration &declaration, std::int64_t sequence);

    std::optional<Rejection> check_chunk(const UploadDeclaration &declaration, std::uint64_t bytes_received,
                                         std::size_t payload_size, const UploadLimits &limits);

    // A later chunk frame may repeat the declaration; fields it leaves empty or zero are not compared.
    std::optional<Rejection> check_consistency(const UploadDeclaration &declaration, const UploadDeclaration &repeated);

    // For a chunk whose upload id is not live. An empty id is a new upload and passes;
    // closed_state is the tombstone, if any.
    std::optional<Rejection> check_stray_chunk(std::string_view upload_id, std::optional<SessionState> closed_state);

} // namespace chatdrop::server::chunk_validator
