#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "chatdrop/server/frame_sink.hpp"

namespace chatdrop::server
{

    enum class SessionState : std::uint8_t
    {
        Open,
        Completing,
        Completed,
        Failed,
        Expired
    };

    std::string_view to_string(SessionState state) noexcept;

    constexpr bool is_terminal(SessionState state) noexcept
    {
        return state == SessionState::Completed || state == SessionState::Failed || state == SessionState::Expired;
    }

    struct UploadDeclaration
    {
        std::string file_name;
        std::string content_type;
        std::uint64_t total_size{};
        std::uint32_t total_chunks{};
    };

    struct ProgressSnapshot
    {
        std::uint64_t bytes_received{};
        std::uint64_t total_size{};
        std::uint32_t chunks_received{};
        std::uint32_t total_chunks{};
    };

    /**
     * Chunk payloads of one upload, addressed by zero-based chunk index. The byte offset of a
     * chunk in the artifact is the summed size of all lower indexes, so arrival order never
     * affects the assembled result.
     */
    class ChunkBuffer
    {
    public:
        bool contains(std::uint32_t index) const;

        void store(std::uint32_t index, std::vector<std::byte> payload);

        std::uint32_t chunk_count() const noexcept { return chunk_count_; }
        std::uint64_t byte_count() const noexcept { return byte_count_; }

        std::vector<std::byte> assemble() const;

        // Frees the payloads; the counters keep their values for diagnostics.
        void release() noexcept;

    private:
        std::map<std::uint32_t, std::vector<std::byte>> slots_;
        std::uint32_t chunk_count_{};
        std::uint64_t byte_count_{};
    };

    struct UploadSession
    {
        using Clock = std::chrono::steady_clock;

        std::string upload_id;
        std::string uploader_id;
        std::string room_id;
        UploadDeclaration declaration;
        Clock::time_point created_at{};
        Clock::time_point last_activity_at{};
        SessionState state{SessionState::Open};
        ChunkBuffer buffer;
        std::weak_ptr<FrameSink> owner;
        std::mutex mutex;

        ProgressSnapshot progress() const
        {
            return ProgressSnapshot{
                .bytes_received = buffer.byte_count(),
                .total_size = declaration.total_size,
                .chunks_received = buffer.chunk_count(),
                .total_chunks = declaration.total_chunks,
            };
        }
    };

} // namespace chatdrop::server
