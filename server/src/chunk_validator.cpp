#include "chatdrop/server/chunk_validator.hpp"

#include <string>

#include <spdlog/fmt/fmt.h>

namespace chatdrop::server::chunk_validator
{

    std::optional<Rejection> check_declaration(const UploadDeclaration &declaration, std::string_view room_id,
                                               const UploadLimits &limits)
    {
        if (room_id.empty())
        {
            return Rejection{ErrorCode::InvalidPayload, "Room is required"};
        }
        if (declaration.file_name.empty())
        {
            return Rejection{ErrorCode::InvalidPayload, "File name is required"};
        }
        if (declaration.total_chunks == 0)
        {
            return Rejection{ErrorCode::InvalidChunk, "Total chunk count must be positive"};
        }
        if (declaration.total_chunks > limits.max_chunks_per_upload)
        {
            return Rejection{ErrorCode::InvalidChunk,
                             fmt::format("Total chunk count {} exceeds limit {}", declaration.total_chunks,
                                         limits.max_chunks_per_upload)};
        }
        if (declaration.total_size == 0)
        {
            return Rejection{ErrorCode::InvalidPayload, "Declared size must be positive"};
        }
        if (declaration.total_size > limits.max_artifact_bytes)
        {
            return Rejection{ErrorCode::SizeExceeded,
                             fmt::format("Declared size {} exceeds limit {}", declaration.total_size,
                                         limits.max_artifact_bytes)};
        }
        if (declaration.total_chunks > declaration.total_size)
        {
            return Rejection{ErrorCode::InvalidChunk, "More chunks than bytes declared"};
        }
        return std::nullopt;
    }

    std::optional<std::uint32_t> chunk_index(const UploadDeclaration &declaration, std::int64_t sequence) noexcept
    {
        if (sequence < 1 || sequence > static_cast<std::int64_t>(declaration.total_chunks))
        {
            return std::nullopt;
        }
        return static_cast<std::uint32_t>(sequence - 1);
    }

    std::optional<Rejection> check_sequence(const UploadDeclaration &declaration, std::int64_t sequence)
    {
        if (!chunk_index(declaration, sequence))
        {
            return Rejection{ErrorCode::InvalidChunk,
                             fmt::format("Sequence {} outside 1..{}", sequence, declaration.total_chunks)};
        }
        return std::nullopt;
    }

    std::optional<Rejection> check_chunk(const UploadDeclaration &declaration, std::uint64_t bytes_received,
                                         std::size_t payload_size, const UploadLimits &limits)
    {
        if (payload_size == 0)
        {
            return Rejection{ErrorCode::InvalidChunk, "Empty chunk"};
        }
        if (payload_size > limits.max_chunk_bytes)
        {
            return Rejection{ErrorCode::InvalidChunk,
                             fmt::format("Chunk of {} bytes exceeds limit {}", payload_size, limits.max_chunk_bytes)};
        }
        const auto total = bytes_received + static_cast<std::uint64_t>(payload_size);
        if (total > limits.max_artifact_bytes)
        {
            return Rejection{ErrorCode::SizeExceeded,
                             fmt::format("Upload would reach {} bytes, limit is {}", total, limits.max_artifact_bytes)};
        }
        if (total > declaration.total_size)
        {
            return Rejection{ErrorCode::SizeExceeded,
                             fmt::format("Upload would reach {} bytes, declared {}", total, declaration.total_size)};
        }
        return std::nullopt;
    }

    std::optional<Rejection> check_consistency(const UploadDeclaration &declaration, const UploadDeclaration &repeated)
    {
        const auto mismatch = [](std::string_view field)
        {
            return Rejection{ErrorCode::InvalidChunk, fmt::format("Chunk {} differs from the upload declaration", field)};
        };
        if (!repeated.file_name.empty() && repeated.file_name != declaration.file_name)
        {
            return mismatch("file_name");
        }
        if (!repeated.content_type.empty() && repeated.content_type != declaration.content_type)
        {
            return mismatch("content_type");
        }
        if (repeated.total_size != 0 && repeated.total_size != declaration.total_size)
        {
            return mismatch("total_size");
        }
        if (repeated.total_chunks != 0 && repeated.total_chunks != declaration.total_chunks)
        {
            return mismatch("total_chunks");
        }
        return std::nullopt;
    }

    std::optional<Rejection> check_stray_chunk(std::string_view upload_id, std::optional<SessionState> closed_state)
    {
        if (upload_id.empty())
        {
            return std::nullopt;
        }
        if (closed_state)
        {
            return Rejection{ErrorCode::UnknownOrClosedSession,
                             fmt::format("Upload {} is already {}", upload_id, to_string(*closed_state))};
        }
        return Rejection{ErrorCode::UnknownOrClosedSession, fmt::format("Unknown upload {}", upload_id)};
    }

} // namespace chatdrop::server::chunk_validator
