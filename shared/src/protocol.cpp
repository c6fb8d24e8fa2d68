#include "chatdrop/protocol.hpp"

#include <array>
#include <limits>
#include <stdexcept>

namespace chatdrop::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 7> kCommandMappings{{
            {Command::Hello, "HELLO"},
            {Command::UploadBegin, "UPLOAD_BEGIN"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadCancel, "UPLOAD_CANCEL"},
            {Command::MessageSend, "MESSAGE_SEND"},
            {Command::ArtifactFetch, "ARTIFACT_FETCH"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 5> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
            {ResponseKind::Progress, "PROGRESS"},
            {ResponseKind::Completed, "COMPLETED"},
            {ResponseKind::Failed, "FAILED"},
        }};

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

        // Rejects negative, fractional and out-of-range numbers instead of letting them wrap.
        template <typename T>
        T read_unsigned(const nlohmann::json &json, const char *key, bool required)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                if (required)
                {
                    throw PayloadError(std::string("Missing field ") + key);
                }
                return T{};
            }
            const bool non_negative = it->is_number_unsigned() ||
                                      (it->is_number_integer() && it->get<std::int64_t>() >= 0);
            if (!non_negative || it->get<std::uint64_t>() > std::numeric_limits<T>::max())
            {
                throw PayloadError(std::string("Field ") + key + " is not an unsigned integer in range");
            }
            return static_cast<T>(it->get<std::uint64_t>());
        }

        std::optional<std::uint64_t> read_optional_unsigned(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it == json.end() || it->is_null())
            {
                return std::nullopt;
            }
            return read_unsigned<std::uint64_t>(json, key, true);
        }

        std::int64_t read_signed(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                throw PayloadError(std::string("Missing field ") + key);
            }
            if (!it->is_number_integer() ||
                (it->is_number_unsigned() &&
                 it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())))
            {
                throw PayloadError(std::string("Field ") + key + " is not an integer in range");
            }
            return it->get<std::int64_t>();
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_string(json, "id");
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_string(json, "id");
    }

    void to_json(nlohmann::json &json, const HelloRequest &request)
    {
        json = {{"uploader", request.uploader}};
    }

    void from_json(const nlohmann::json &json, HelloRequest &request)
    {
        request.uploader = json.at("uploader").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadBeginRequest &request)
    {
        json = {
            {"room", request.room},
            {"file_name", request.file_name},
            {"content_type", request.content_type},
            {"total_size", request.total_size},
            {"total_chunks", request.total_chunks},
        };
    }

    void from_json(const nlohmann::json &json, UploadBeginRequest &request)
    {
        request.room = json.at("room").get<std::string>();
        request.file_name = json.at("file_name").get<std::string>();
        request.content_type = json.value("content_type", std::string{});
        request.total_size = read_unsigned<std::uint64_t>(json, "total_size", true);
        request.total_chunks = read_unsigned<std::uint32_t>(json, "total_chunks", true);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"room", request.room},
            {"sequence", request.sequence},
            {"total_chunks", request.total_chunks},
            {"file_name", request.file_name},
            {"content_type", request.content_type},
            {"total_size", request.total_size},
            {"data", request.data_base64},
        };
        if (request.upload_id)
        {
            json["upload_id"] = *request.upload_id;
        }
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.upload_id = optional_string(json, "upload_id");
        request.room = json.value("room", std::string{});
        request.sequence = read_signed(json, "sequence");
        request.total_chunks = read_unsigned<std::uint32_t>(json, "total_chunks", false);
        request.file_name = json.value("file_name", std::string{});
        request.content_type = json.value("content_type", std::string{});
        request.total_size = read_unsigned<std::uint64_t>(json, "total_size", false);
        request.data_base64 = json.at("data").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadCancelRequest &request)
    {
        json = {{"upload_id", request.upload_id}};
    }

    void from_json(const nlohmann::json &json, UploadCancelRequest &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadStarted &started)
    {
        json = {
            {"upload_id", started.upload_id},
            {"total_size", started.total_size},
            {"total_chunks", started.total_chunks},
        };
    }

    void from_json(const nlohmann::json &json, UploadStarted &started)
    {
        started.upload_id = json.at("upload_id").get<std::string>();
        started.total_size = json.value("total_size", 0ULL);
        started.total_chunks = json.value("total_chunks", 0u);
    }

    void to_json(nlohmann::json &json, const ProgressFrame &frame)
    {
        json = {
            {"upload_id", frame.upload_id},
            {"bytes_received", frame.bytes_received},
            {"total_size", frame.total_size},
            {"chunks_received", frame.chunks_received},
            {"total_chunks", frame.total_chunks},
        };
    }

    void from_json(const nlohmann::json &json, ProgressFrame &frame)
    {
        frame.upload_id = json.at("upload_id").get<std::string>();
        frame.bytes_received = json.value("bytes_received", 0ULL);
        frame.total_size = json.value("total_size", 0ULL);
        frame.chunks_received = json.value("chunks_received", 0u);
        frame.total_chunks = json.value("total_chunks", 0u);
    }

    void to_json(nlohmann::json &json, const CompletionFrame &frame)
    {
        json = {
            {"upload_id", frame.upload_id},
            {"public_reference", frame.public_reference},
            {"content_type", frame.content_type},
            {"size_bytes", frame.size_bytes},
            {"category", frame.category},
        };
        if (frame.message_id)
        {
            json["message_id"] = *frame.message_id;
        }
    }

    void from_json(const nlohmann::json &json, CompletionFrame &frame)
    {
        frame.upload_id = json.at("upload_id").get<std::string>();
        frame.public_reference = json.at("public_reference").get<std::string>();
        frame.content_type = json.value("content_type", std::string{});
        frame.size_bytes = json.value("size_bytes", 0ULL);
        frame.category = json.value("category", std::string{});
        if (auto it = json.find("message_id"); it != json.end() && !it->is_null())
        {
            frame.message_id = it->get<std::uint64_t>();
        }
        else
        {
            frame.message_id.reset();
        }
    }

    void to_json(nlohmann::json &json, const FailureFrame &frame)
    {
        json = {
            {"upload_id", frame.upload_id},
            {"error_kind", to_string(frame.error_kind)},
            {"message", frame.message},
            {"bytes_received", frame.bytes_received},
        };
    }

    void from_json(const nlohmann::json &json, FailureFrame &frame)
    {
        frame.upload_id = json.value("upload_id", std::string{});
        const auto kind_label = json.at("error_kind").get<std::string>();
        frame.error_kind = error_code_from_string(kind_label).value_or(ErrorCode::InternalError);
        frame.message = json.value("message", std::string{});
        frame.bytes_received = json.value("bytes_received", 0ULL);
    }

    void to_json(nlohmann::json &json, const MessageSendRequest &request)
    {
        json = {
            {"room", request.room},
            {"content", request.content},
        };
    }

    void from_json(const nlohmann::json &json, MessageSendRequest &request)
    {
        request.room = json.at("room").get<std::string>();
        request.content = json.at("content").get<std::string>();
    }

    void to_json(nlohmann::json &json, const MessagePosted &posted)
    {
        json = {
            {"message_id", posted.message_id},
            {"room", posted.room},
        };
    }

    void from_json(const nlohmann::json &json, MessagePosted &posted)
    {
        posted.message_id = json.at("message_id").get<std::uint64_t>();
        posted.room = json.value("room", std::string{});
    }

    void to_json(nlohmann::json &json, const ArtifactFetchRequest &request)
    {
        json = {
            {"offset", request.offset},
            {"max_bytes", request.max_bytes},
        };
        if (request.reference)
        {
            json["reference"] = *request.reference;
        }
        if (request.message_id)
        {
            json["message_id"] = *request.message_id;
        }
    }

    void from_json(const nlohmann::json &json, ArtifactFetchRequest &request)
    {
        request.reference = optional_string(json, "reference");
        request.message_id = read_optional_unsigned(json, "message_id");
        request.offset = read_unsigned<std::uint64_t>(json, "offset", false);
        request.max_bytes = read_unsigned<std::uint64_t>(json, "max_bytes", false);
    }

    void to_json(nlohmann::json &json, const ArtifactChunkResponse &response)
    {
        json = {
            {"reference", response.reference},
            {"content_type", response.content_type},
            {"total_size", response.total_size},
            {"offset", response.offset},
            {"bytes", response.bytes},
            {"done", response.done},
            {"data", response.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, ArtifactChunkResponse &response)
    {
        response.reference = json.at("reference").get<std::string>();
        response.content_type = json.value("content_type", std::string{});
        response.total_size = json.value("total_size", 0ULL);
        response.offset = json.value("offset", 0ULL);
        response.bytes = json.value("bytes", 0ULL);
        response.done = json.value("done", false);
        response.data_base64 = json.value("data", std::string{});
    }

} // namespace chatdrop::protocol
