#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chatdrop::server
{

    struct AttachmentEvent
    {
        std::string room_id;
        std::string uploader_id;
        std::string public_reference;
        std::string content_type;
        std::uint64_t size_bytes{};
        std::string original_file_name;
    };

    struct ChatMessage
    {
        std::uint64_t id{};
        std::string room_id;
        std::string sender;
        std::string content;
        std::optional<std::string> attachment_reference;
        std::optional<std::string> attachment_content_type;
        std::chrono::system_clock::time_point sent_at{};
    };

    // Room-side collaborator that turns finished uploads and text into chat messages.
    class RoomMessageSink
    {
    public:
        virtual ~RoomMessageSink() = default;

        // Returns the id of the message carrying the attachment.
        virtual std::uint64_t publish_attachment(const AttachmentEvent &event) = 0;

        virtual std::uint64_t post_text(const std::string &room_id, const std::string &sender,
                                        const std::string &content) = 0;

        virtual std::optional<ChatMessage> find_message(std::uint64_t message_id) const = 0;
    };

    // In-process room history.
    class MessageBoard : public RoomMessageSink
    {
    public:
        std::uint64_t publish_attachment(const AttachmentEvent &event) override;

        std::uint64_t post_text(const std::string &room_id, const std::string &sender,
                                const std::string &content) override;

        std::optional<ChatMessage> find_message(std::uint64_t message_id) const override;

        std::vector<ChatMessage> room_history(const std::string &room_id) const;

    private:
        std::uint64_t append(ChatMessage message);

        mutable std::mutex mutex_;
        std::uint64_t next_id_{1};
        std::map<std::uint64_t, ChatMessage> messages_;
    };

} // namespace chatdrop::server
