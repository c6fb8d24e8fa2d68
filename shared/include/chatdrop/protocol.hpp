/**
 * ChatDrop - Wire schema for the upload connection and its JSON serialization.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chatdrop/error_codes.hpp"

namespace chatdrop::protocol
{

    // A required numeric field is missing, or a numeric field is not an in-range unsigned integer.
    class PayloadError : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };

    enum class Command : std::uint8_t
    {
        Hello,
        UploadBegin,
        UploadChunk,
        UploadCancel,
        MessageSend,
        ArtifactFetch,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1,
        Progress = 2,
        Completed = 3,
        Failed = 4
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct HelloRequest
    {
        std::string uploader;
    };

    void to_json(nlohmann::json &json, const HelloRequest &request);
    void from_json(const nlohmann::json &json, HelloRequest &request);

    struct UploadBeginRequest
    {
        std::string room;
        std::string file_name;
        std::string content_type;
        std::uint64_t total_size{};
        std::uint32_t total_chunks{};
    };

    void to_json(nlohmann::json &json, const UploadBeginRequest &request);
    void from_json(const nlohmann::json &json, UploadBeginRequest &request);

    // Inbound chunk. upload_id is omitted on the first chunk to request session creation; the
    // declaration fields are then taken from this frame.
    struct UploadChunkRequest
    {
        std::optional<std::string> upload_id{};
        std::string room;
        std::int64_t sequence{};
        std::uint32_t total_chunks{};
        std::string file_name;
        std::string content_type;
        std::uint64_t total_size{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadCancelRequest
    {
        std::string upload_id;
    };

    void to_json(nlohmann::json &json, const UploadCancelRequest &request);
    void from_json(const nlohmann::json &json, UploadCancelRequest &request);

    struct UploadStarted
    {
        std::string upload_id;
        std::uint64_t total_size{};
        std::uint32_t total_chunks{};
    };

    void to_json(nlohmann::json &json, const UploadStarted &started);
    void from_json(const nlohmann::json &json, UploadStarted &started);

    struct ProgressFrame
    {
        std::string upload_id;
        std::uint64_t bytes_received{};
        std::uint64_t total_size{};
        std::uint32_t chunks_received{};
        std::uint32_t total_chunks{};
    };

    void to_json(nlohmann::json &json, const ProgressFrame &frame);
    void from_json(const nlohmann::json &json, ProgressFrame &frame);

    struct CompletionFrame
    {
        std::string upload_id;
        std::string public_reference;
        std::string content_type;
        std::uint64_t size_bytes{};
        std::string category;
        std::optional<std::uint64_t> message_id{};
    };

    void to_json(nlohmann::json &json, const CompletionFrame &frame);
    void from_json(const nlohmann::json &json, CompletionFrame &frame);

    struct FailureFrame
    {
        std::string upload_id;
        ErrorCode error_kind{ErrorCode::InternalError};
        std::string message;
        std::uint64_t bytes_received{};
    };

    void to_json(nlohmann::json &json, const FailureFrame &frame);
    void from_json(const nlohmann::json &json, FailureFrame &frame);

    struct MessageSendRequest
    {
        std::string room;
        std::string content;
    };

    void to_json(nlohmann::json &json, const MessageSendRequest &request);
    void from_json(const nlohmann::json &json, MessageSendRequest &request);

    struct MessagePosted
    {
        std::uint64_t message_id{};
        std::string room;
    };

    void to_json(nlohmann::json &json, const MessagePosted &posted);
    void from_json(const nlohmann::json &json, MessagePosted &posted);

    // Either reference or message_id selects the artifact.
    struct ArtifactFetchRequest
    {
        std::optional<std::string> reference{};
        std::optional<std::uint64_t> message_id{};
        std::uint64_t offset{};
        std::uint64_t max_bytes{};
    };

    void to_json(nlohmann::json &json, const ArtifactFetchRequest &request);
    void from_json(const nlohmann::json &json, ArtifactFetchRequest &request);

    struct ArtifactChunkResponse
    {
        std::string reference;
        std::string content_type;
        std::uint64_t total_size{};
        std::uint64_t offset{};
        std::uint64_t bytes{};
        bool done{};
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const ArtifactChunkResponse &response);
    void from_json(const nlohmann::json &json, ArtifactChunkResponse &response);

} // namespace chatdrop::protocol
