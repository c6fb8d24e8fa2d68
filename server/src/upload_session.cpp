#include "chatdrop/server/upload_session.hpp"

#include <array>

namespace chatdrop::server
{

    namespace
    {

        struct StateMapping
        {
            SessionState state;
            std::string_view label;
        };

        constexpr std::array<StateMapping, 5> kStateMappings{{
            {SessionState::Open, "open"},
            {SessionState::Completing, "completing"},
            {SessionState::Completed, "completed"},
            {SessionState::Failed, "failed"},
            {SessionState::Expired, "expired"},
        }};

    } // namespace

    std::string_view to_string(SessionState state) noexcept
    {
        for (const auto &mapping : kStateMappings)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    bool ChunkBuffer::contains(std::uint32_t index) const
    {
        return slots_.find(index) != slots_.end();
    }

    void ChunkBuffer::store(std::uint32_t index, std::vector<std::byte> payload)
    {
        const auto size = static_cast<std::uint64_t>(payload.size());
        if (slots_.try_emplace(index, std::move(payload)).second)
        {
            ++chunk_count_;
            byte_count_ += size;
        }
    }

    std::vector<std::byte> ChunkBuffer::assemble() const
    {
        std::vector<std::byte> output;
        output.reserve(static_cast<std::size_t>(byte_count_));
        for (const auto &[index, payload] : slots_)
        {
            output.insert(output.end(), payload.begin(), payload.end());
        }
        return output;
    }

    void ChunkBuffer::release() noexcept
    {
        slots_.clear();
    }

} // namespace chatdrop::server
