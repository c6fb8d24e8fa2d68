#include <array>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include "chatdrop/encoding/base64.hpp"
#include "chatdrop/framing.hpp"
#include "chatdrop/protocol.hpp"
#include "chatdrop/server/server.hpp"

using namespace chatdrop;
using namespace chatdrop::server;

namespace
{

    // Blocking client speaking the length-prefixed protocol.
    class TestClient
    {
    public:
        explicit TestClient(std::uint16_t port) : socket_(io_context_)
        {
            socket_.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
        }

        void send(protocol::Command command, const nlohmann::json &payload)
        {
            protocol::RequestEnvelope envelope{};
            envelope.command = command;
            envelope.payload = payload;
            const auto frame = protocol::encode_frame(nlohmann::json(envelope));
            asio::write(socket_, asio::buffer(frame));
        }

        // nullopt once the server has closed the connection.
        std::optional<protocol::ResponseEnvelope> receive()
        {
            std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
            std::error_code ec;
            asio::read(socket_, asio::buffer(header), ec);
            if (ec)
            {
                return std::nullopt;
            }
            std::vector<std::uint8_t> payload(protocol::read_frame_length(header));
            asio::read(socket_, asio::buffer(payload), ec);
            if (ec)
            {
                return std::nullopt;
            }
            return nlohmann::json::parse(payload.begin(), payload.end()).get<protocol::ResponseEnvelope>();
        }

    private:
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
    };

    void test_shutdown_fails_open_uploads_and_closes()
    {
        const auto root = std::filesystem::temp_directory_path() / "chatdrop_lifecycle_test";
        std::error_code ec;
        std::filesystem::remove_all(root, ec);

        ServerConfig config{};
        config.address = "127.0.0.1";
        config.port = 0;
        config.storage_root = root;
        config.worker_threads = 2;

        {
            Server server(config);
            std::thread loop([&server]
                             { server.run(); });

            TestClient client(server.port());
            client.send(protocol::Command::Hello, protocol::HelloRequest{.uploader = "alice"});
            assert(client.receive()->kind == protocol::ResponseKind::Ok);

            client.send(protocol::Command::UploadBegin,
                        protocol::UploadBeginRequest{.room = "general", .file_name = "notes.txt",
                                                     .content_type = "text/plain", .total_size = 300,
                                                     .total_chunks = 3});
            const auto begun = client.receive();
            assert(begun->kind == protocol::ResponseKind::Ok);
            const auto upload_id = begun->payload.get<protocol::UploadStarted>().upload_id;

            const std::vector<std::byte> first(100, std::byte{'a'});
            client.send(protocol::Command::UploadChunk,
                        protocol::UploadChunkRequest{.upload_id = upload_id, .room = "general", .sequence = 1,
                                                     .data_base64 = encoding::encode_base64(first)});
            const auto progress = client.receive();
            assert(progress->kind == protocol::ResponseKind::Progress);
            assert(progress->payload.get<protocol::ProgressFrame>().bytes_received == 100);

            server.shutdown();

            // The cancellation notice is written before the connection closes.
            const auto failed = client.receive();
            assert(failed.has_value());
            assert(failed->kind == protocol::ResponseKind::Failed);
            const auto failure = failed->payload.get<protocol::FailureFrame>();
            assert(failure.upload_id == upload_id);
            assert(failure.error_kind == ErrorCode::Cancelled);
            assert(failure.bytes_received == 100);
            assert(!client.receive().has_value());

            loop.join();
        }

        assert(std::filesystem::is_empty(root / "documents"));
        assert(std::filesystem::is_empty(root / "temp"));
        std::filesystem::remove_all(root, ec);
    }

} // namespace

void run_server_lifecycle_tests()
{
    test_shutdown_fails_open_uploads_and_closes();
}
