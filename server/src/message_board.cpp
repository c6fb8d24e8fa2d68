#include "chatdrop/server/message_board.hpp"

#include <spdlog/spdlog.h>

namespace chatdrop::server
{

    std::uint64_t MessageBoard::publish_attachment(const AttachmentEvent &event)
    {
        ChatMessage message{};
        message.room_id = event.room_id;
        message.sender = event.uploader_id;
        message.content = event.original_file_name;
        message.attachment_reference = event.public_reference;
        message.attachment_content_type = event.content_type;
        const auto id = append(std::move(message));
        spdlog::info("Room {}: {} shared {} as message {}", event.room_id, event.uploader_id, event.public_reference,
                     id);
        return id;
    }

    std::uint64_t MessageBoard::post_text(const std::string &room_id, const std::string &sender,
                                          const std::string &content)
    {
        ChatMessage message{};
        message.room_id = room_id;
        message.sender = sender;
        message.content = content;
        return append(std::move(message));
    }

    std::optional<ChatMessage> MessageBoard::find_message(std::uint64_t message_id) const
    {
        std::lock_guard lock(mutex_);
        const auto it = messages_.find(message_id);
        if (it == messages_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<ChatMessage> MessageBoard::room_history(const std::string &room_id) const
    {
        std::lock_guard lock(mutex_);
        std::vector<ChatMessage> history;
        for (const auto &[id, message] : messages_)
        {
            if (message.room_id == room_id)
            {
                history.push_back(message);
            }
        }
        return history;
    }

    std::uint64_t MessageBoard::append(ChatMessage message)
    {
        std::lock_guard lock(mutex_);
        message.id = next_id_++;
        message.sent_at = std::chrono::system_clock::now();
        const auto id = message.id;
        messages_.emplace(id, std::move(message));
        return id;
    }

} // namespace chatdrop::server
