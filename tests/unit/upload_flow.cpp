#include <algorithm>
#include <array>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "chatdrop/encoding/base64.hpp"
#include "chatdrop/protocol.hpp"
#include "chatdrop/server/artifact_finalizer.hpp"
#include "chatdrop/server/artifact_store.hpp"
#include "chatdrop/server/chunk_assembler.hpp"
#include "chatdrop/server/message_board.hpp"
#include "chatdrop/server/session_reaper.hpp"
#include "chatdrop/server/type_catalog.hpp"
#include "chatdrop/server/upload_gateway.hpp"
#include "chatdrop/server/upload_session_store.hpp"

using namespace chatdrop;
using namespace chatdrop::server;

namespace
{

    class RecordingSink : public FrameSink
    {
    public:
        void send(protocol::ResponseEnvelope envelope) override
        {
            std::lock_guard lock(mutex_);
            frames_.push_back(std::move(envelope));
        }

        std::vector<protocol::ResponseEnvelope> take()
        {
            std::lock_guard lock(mutex_);
            auto frames = std::move(frames_);
            frames_.clear();
            return frames;
        }

    private:
        std::mutex mutex_;
        std::vector<protocol::ResponseEnvelope> frames_;
    };

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::size_t file_count(const std::filesystem::path &dir)
    {
        std::size_t count = 0;
        for (const auto &entry : std::filesystem::directory_iterator(dir))
        {
            if (entry.is_regular_file())
            {
                ++count;
            }
        }
        return count;
    }

    std::vector<std::byte> filled(std::size_t size, char value)
    {
        return std::vector<std::byte>(size, static_cast<std::byte>(value));
    }

    std::filesystem::path fresh_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        cleanup_path(root);
        return root;
    }

    // Store, finalizer and assembler wired the way the server wires them.
    struct UploadFixture
    {
        explicit UploadFixture(const std::string &name)
            : root(fresh_root(name)),
              artifacts(root),
              catalog(default_type_table()),
              finalizer(artifacts, catalog),
              assembler(sessions, finalizer, catalog, limits)
        {
        }

        ~UploadFixture() { cleanup_path(root); }

        std::filesystem::path root;
        UploadLimits limits{};
        ArtifactStore artifacts;
        TypeCatalog catalog;
        UploadSessionStore sessions;
        ArtifactFinalizer finalizer;
        ChunkAssembler assembler;
    };

    const UploadDeclaration kThreeChunkText{
        .file_name = "notes.txt",
        .content_type = "text/plain",
        .total_size = 300,
        .total_chunks = 3,
    };

    void test_out_of_order_chunks_complete_on_last()
    {
        std::vector<int> order = {1, 2, 3};
        do
        {
            UploadFixture fixture("chatdrop_order_test");
            auto sink = std::make_shared<RecordingSink>();
            const UploadContext context{.uploader_id = "alice", .room_id = "general", .owner = sink};
            const auto opened = fixture.assembler.begin(context, kThreeChunkText);
            assert(opened.status == AssemblyStatus::Accepted);

            for (std::size_t i = 0; i < order.size(); ++i)
            {
                const auto sequence = order[i];
                const auto outcome = fixture.assembler.accept("alice", opened.upload_id, sequence,
                                                              filled(100, static_cast<char>('0' + sequence)));
                if (i + 1 < order.size())
                {
                    assert(outcome.status == AssemblyStatus::Accepted);
                    assert(outcome.progress.chunks_received == i + 1);
                    continue;
                }
                assert(outcome.status == AssemblyStatus::Completed);
                assert(outcome.artifact.has_value());
                const auto &artifact = *outcome.artifact;
                assert(artifact.size_bytes == 300);
                assert(artifact.category == Category::Documents);

                const auto location = fixture.artifacts.find(artifact.public_reference);
                assert(location.has_value());
                const auto stored = fixture.artifacts.read_range(*location, 0, 300);
                assert(stored.size() == 300);
                assert(stored[0] == std::byte{'1'});
                assert(stored[100] == std::byte{'2'});
                assert(stored[299] == std::byte{'3'});
            }
            assert(fixture.sessions.closed_state(opened.upload_id) == SessionState::Completed);
            assert(fixture.sessions.live_count() == 0);
        } while (std::next_permutation(order.begin(), order.end()));
    }

    void test_duplicate_chunks_are_ignored()
    {
        UploadFixture fixture("chatdrop_duplicate_test");
        auto sink = std::make_shared<RecordingSink>();
        const auto opened = fixture.assembler.begin({.uploader_id = "alice", .room_id = "r", .owner = sink},
                                                    kThreeChunkText);

        assert(fixture.assembler.accept("alice", opened.upload_id, 2, filled(100, 'b')).status ==
               AssemblyStatus::Accepted);
        const auto duplicate = fixture.assembler.accept("alice", opened.upload_id, 2, filled(100, 'x'));
        assert(duplicate.status == AssemblyStatus::DuplicateIgnored);
        assert(duplicate.progress.bytes_received == 100);
        assert(duplicate.progress.chunks_received == 1);

        assert(fixture.assembler.accept("alice", opened.upload_id, 1, filled(100, 'a')).status ==
               AssemblyStatus::Accepted);
        const auto done = fixture.assembler.accept("alice", opened.upload_id, 3, filled(100, 'c'));
        assert(done.status == AssemblyStatus::Completed);

        const auto location = fixture.artifacts.find(done.artifact->public_reference);
        const auto middle = fixture.artifacts.read_range(*location, 100, 1);
        assert(middle.size() == 1 && middle[0] == std::byte{'b'});
    }

    void test_oversized_upload_fails_before_storing()
    {
        UploadFixture fixture("chatdrop_oversize_test");
        auto sink = std::make_shared<RecordingSink>();
        const UploadDeclaration small{.file_name = "a.txt", .content_type = "text/plain", .total_size = 10,
                                      .total_chunks = 2};
        const auto opened = fixture.assembler.begin({.uploader_id = "alice", .room_id = "r", .owner = sink}, small);

        assert(fixture.assembler.accept("alice", opened.upload_id, 1, filled(6, 'a')).status ==
               AssemblyStatus::Accepted);
        const auto overflow = fixture.assembler.accept("alice", opened.upload_id, 2, filled(6, 'b'));
        assert(overflow.status == AssemblyStatus::Rejected);
        assert(overflow.rejection->code == ErrorCode::SizeExceeded);
        assert(fixture.sessions.closed_state(opened.upload_id) == SessionState::Failed);
        assert(std::filesystem::directory_iterator(fixture.root / "documents") == std::filesystem::directory_iterator());

        fixture.limits.max_artifact_bytes = 100;
        ChunkAssembler strict(fixture.sessions, fixture.finalizer, fixture.catalog, fixture.limits);
        const auto refused = strict.begin({.uploader_id = "alice", .room_id = "r", .owner = sink}, kThreeChunkText);
        assert(refused.status == AssemblyStatus::Rejected);
        assert(refused.rejection->code == ErrorCode::SizeExceeded);
        assert(fixture.sessions.live_count() == 0);
    }

    void test_late_and_foreign_chunks_are_rejected()
    {
        UploadFixture fixture("chatdrop_late_test");
        auto sink = std::make_shared<RecordingSink>();
        const UploadDeclaration single{.file_name = "a.txt", .content_type = "text/plain", .total_size = 4,
                                       .total_chunks = 1};
        const auto opened = fixture.assembler.begin({.uploader_id = "alice", .room_id = "r", .owner = sink}, single);

        const auto foreign = fixture.assembler.accept("mallory", opened.upload_id, 1, filled(4, 'm'));
        assert(foreign.status == AssemblyStatus::Rejected);
        assert(foreign.rejection->code == ErrorCode::UnknownOrClosedSession);
        assert(fixture.sessions.live_count() == 1);

        assert(fixture.assembler.accept("alice", opened.upload_id, 1, filled(4, 'a')).status ==
               AssemblyStatus::Completed);
        const auto late = fixture.assembler.accept("alice", opened.upload_id, 1, filled(4, 'a'));
        assert(late.status == AssemblyStatus::Rejected);
        assert(late.rejection->code == ErrorCode::UnknownOrClosedSession);

        const auto unknown = fixture.assembler.accept("alice", "no-such-upload", 1, filled(4, 'a'));
        assert(unknown.rejection->code == ErrorCode::UnknownOrClosedSession);

        const auto second = fixture.assembler.begin({.uploader_id = "alice", .room_id = "r", .owner = sink}, single);
        const auto bad_sequence = fixture.assembler.accept("alice", second.upload_id, 2, filled(4, 'a'));
        assert(bad_sequence.rejection->code == ErrorCode::InvalidChunk);
        assert(fixture.sessions.closed_state(second.upload_id) == SessionState::Failed);
    }

    void test_cancel_and_cancel_all()
    {
        UploadFixture fixture("chatdrop_cancel_test");
        auto first_sink = std::make_shared<RecordingSink>();
        auto second_sink = std::make_shared<RecordingSink>();

        const auto cancelled = fixture.assembler.begin(
            {.uploader_id = "alice", .room_id = "r", .owner = first_sink}, kThreeChunkText);
        assert(fixture.assembler.cancel("mallory", cancelled.upload_id).rejection->code ==
               ErrorCode::UnknownOrClosedSession);
        const auto outcome = fixture.assembler.cancel("alice", cancelled.upload_id);
        assert(outcome.status == AssemblyStatus::Rejected);
        assert(outcome.rejection->code == ErrorCode::Cancelled);
        assert(fixture.sessions.closed_state(cancelled.upload_id) == SessionState::Failed);
        assert(fixture.assembler.cancel("alice", cancelled.upload_id).rejection->code ==
               ErrorCode::UnknownOrClosedSession);

        const auto mine = fixture.assembler.begin({.uploader_id = "alice", .room_id = "r", .owner = first_sink},
                                                  kThreeChunkText);
        const auto theirs = fixture.assembler.begin({.uploader_id = "bob", .room_id = "r", .owner = second_sink},
                                                    kThreeChunkText);
        (void)fixture.assembler.accept("alice", mine.upload_id, 1, filled(100, 'a'));

        const auto notices = fixture.assembler.cancel_all(first_sink);
        assert(notices.size() == 1);
        assert(notices[0].upload_id == mine.upload_id);
        assert(notices[0].bytes_received == 100);
        assert(notices[0].reason.code == ErrorCode::Cancelled);
        assert(fixture.sessions.closed_state(mine.upload_id) == SessionState::Failed);
        assert(!fixture.sessions.closed_state(theirs.upload_id).has_value());
        assert(fixture.sessions.live_count() == 1);
    }

    void test_reaper_expires_idle_sessions()
    {
        UploadFixture fixture("chatdrop_reaper_test");
        auto sink = std::make_shared<RecordingSink>();
        const auto opened = fixture.assembler.begin({.uploader_id = "alice", .room_id = "r", .owner = sink},
                                                    kThreeChunkText);
        (void)fixture.assembler.accept("alice", opened.upload_id, 1, filled(100, 'a'));

        asio::io_context io_context;
        std::vector<SessionNotice> seen;
        SessionReaper reaper(io_context, fixture.sessions, fixture.limits,
                             [&seen](const SessionNotice &notice)
                             { seen.push_back(notice); });

        const auto now = UploadSession::Clock::now();
        assert(reaper.sweep(now) == 0);
        assert(seen.empty());

        assert(reaper.sweep(now + fixture.limits.idle_timeout + std::chrono::seconds{1}) == 1);
        assert(seen.size() == 1);
        assert(seen[0].upload_id == opened.upload_id);
        assert(seen[0].reason.code == ErrorCode::SessionExpired);
        assert(seen[0].owner.lock() == sink);
        assert(fixture.sessions.closed_state(opened.upload_id) == SessionState::Expired);

        const auto late = fixture.assembler.accept("alice", opened.upload_id, 2, filled(100, 'b'));
        assert(late.rejection->code == ErrorCode::UnknownOrClosedSession);
        assert(late.rejection->message.find("expired") != std::string::npos);
    }

    void test_racing_final_chunk_completes_once()
    {
        constexpr int kRacers = 8;
        UploadFixture fixture("chatdrop_final_race_test");
        auto sink = std::make_shared<RecordingSink>();
        const auto opened = fixture.assembler.begin({.uploader_id = "alice", .room_id = "r", .owner = sink},
                                                    kThreeChunkText);
        assert(fixture.assembler.accept("alice", opened.upload_id, 1, filled(100, 'a')).status ==
               AssemblyStatus::Accepted);
        assert(fixture.assembler.accept("alice", opened.upload_id, 2, filled(100, 'b')).status ==
               AssemblyStatus::Accepted);

        std::vector<AssemblyOutcome> outcomes(kRacers);
        std::vector<std::thread> racers;
        for (int i = 0; i < kRacers; ++i)
        {
            racers.emplace_back([&fixture, &outcomes, &opened, i]
                                { outcomes[i] = fixture.assembler.accept("alice", opened.upload_id, 3,
                                                                         filled(100, 'c')); });
        }
        for (auto &racer : racers)
        {
            racer.join();
        }

        int completed = 0;
        for (const auto &outcome : outcomes)
        {
            if (outcome.status == AssemblyStatus::Completed)
            {
                ++completed;
                continue;
            }
            const bool duplicate = outcome.status == AssemblyStatus::DuplicateIgnored;
            const bool late = outcome.status == AssemblyStatus::Rejected &&
                              outcome.rejection->code == ErrorCode::UnknownOrClosedSession;
            assert(duplicate || late);
        }
        assert(completed == 1);
        assert(fixture.sessions.closed_state(opened.upload_id) == SessionState::Completed);
        assert(file_count(fixture.root / "documents") == 1);
    }

    void test_sweep_racing_final_chunk()
    {
        for (int round = 0; round < 20; ++round)
        {
            UploadFixture fixture("chatdrop_sweep_race_test");
            auto sink = std::make_shared<RecordingSink>();
            const auto opened = fixture.assembler.begin({.uploader_id = "alice", .room_id = "r", .owner = sink},
                                                        kThreeChunkText);
            (void)fixture.assembler.accept("alice", opened.upload_id, 1, filled(100, 'a'));
            (void)fixture.assembler.accept("alice", opened.upload_id, 2, filled(100, 'b'));

            asio::io_context io_context;
            SessionReaper reaper(io_context, fixture.sessions, fixture.limits, nullptr);
            const auto later = UploadSession::Clock::now() + fixture.limits.idle_timeout + std::chrono::seconds{1};

            std::size_t expired = 0;
            AssemblyOutcome outcome;
            std::thread sweeper([&]
                                { expired = reaper.sweep(later); });
            std::thread uploader([&]
                                 { outcome = fixture.assembler.accept("alice", opened.upload_id, 3,
                                                                      filled(100, 'c')); });
            sweeper.join();
            uploader.join();

            if (outcome.status == AssemblyStatus::Completed)
            {
                assert(expired == 0);
                assert(fixture.sessions.closed_state(opened.upload_id) == SessionState::Completed);
                assert(file_count(fixture.root / "documents") == 1);
            }
            else
            {
                assert(outcome.status == AssemblyStatus::Rejected);
                assert(outcome.rejection->code == ErrorCode::UnknownOrClosedSession);
                assert(expired == 1);
                assert(fixture.sessions.closed_state(opened.upload_id) == SessionState::Expired);
                assert(file_count(fixture.root / "documents") == 0);
            }
        }
    }

    void test_chunk_disagreeing_with_declaration_fails()
    {
        UploadFixture fixture("chatdrop_consistency_test");
        auto sink = std::make_shared<RecordingSink>();
        const auto opened = fixture.assembler.begin({.uploader_id = "alice", .room_id = "r", .owner = sink},
                                                    kThreeChunkText);

        // A frame that leaves the declaration out is still fine.
        assert(fixture.assembler.accept("alice", opened.upload_id, 1, filled(100, 'a'), UploadDeclaration{})
                   .status == AssemblyStatus::Accepted);
        assert(fixture.assembler.accept("alice", opened.upload_id, 2, filled(100, 'b'), kThreeChunkText).status ==
               AssemblyStatus::Accepted);

        auto resized = kThreeChunkText;
        resized.total_size = 900;
        const auto outcome = fixture.assembler.accept("alice", opened.upload_id, 3, filled(100, 'c'), resized);
        assert(outcome.status == AssemblyStatus::Rejected);
        assert(outcome.rejection->code == ErrorCode::InvalidChunk);
        assert(to_string(outcome.status) == "rejected");
        assert(fixture.sessions.closed_state(opened.upload_id) == SessionState::Failed);
        assert(file_count(fixture.root / "documents") == 0);
    }

    void test_begin_refused_after_drain()
    {
        UploadFixture fixture("chatdrop_drain_begin_test");
        auto sink = std::make_shared<RecordingSink>();
        const auto open = fixture.assembler.begin({.uploader_id = "alice", .room_id = "r", .owner = sink},
                                                  kThreeChunkText);
        const auto notices = fixture.sessions.drain(Rejection{ErrorCode::Cancelled, "Server shutting down"});
        assert(notices.size() == 1);
        assert(notices[0].upload_id == open.upload_id);

        const auto refused = fixture.assembler.begin({.uploader_id = "bob", .room_id = "r", .owner = sink},
                                                     kThreeChunkText);
        assert(refused.status == AssemblyStatus::Rejected);
        assert(refused.rejection->code == ErrorCode::Cancelled);
        assert(fixture.sessions.live_count() == 0);
    }

    protocol::RequestEnvelope make_request(protocol::Command command, nlohmann::json payload)
    {
        protocol::RequestEnvelope envelope{};
        envelope.command = command;
        envelope.payload = std::move(payload);
        return envelope;
    }

    void test_gateway_end_to_end()
    {
        UploadFixture fixture("chatdrop_gateway_test");
        MessageBoard board;
        UploadGateway gateway(fixture.assembler, fixture.artifacts, board, fixture.limits);

        auto sink = std::make_shared<RecordingSink>();
        ClientContext client;
        client.attach(sink);

        gateway.handle(client, make_request(protocol::Command::Ping, nlohmann::json::object()));
        assert(sink->take().at(0).kind == protocol::ResponseKind::Ok);

        const protocol::UploadChunkRequest early{
            .room = "general", .sequence = 1, .total_chunks = 1, .file_name = "a.txt",
            .content_type = "text/plain", .total_size = 4, .data_base64 = "dGVzdA=="};
        gateway.handle(client, make_request(protocol::Command::UploadChunk, early));
        auto frames = sink->take();
        assert(frames.size() == 1);
        assert(frames[0].kind == protocol::ResponseKind::Error);
        assert(frames[0].error == ErrorCode::AuthenticationRequired);
        assert(fixture.sessions.live_count() == 0);

        gateway.handle(client, make_request(protocol::Command::Hello, protocol::HelloRequest{.uploader = "alice"}));
        assert(sink->take().at(0).kind == protocol::ResponseKind::Ok);
        gateway.handle(client, make_request(protocol::Command::Hello, protocol::HelloRequest{.uploader = "bob"}));
        assert(sink->take().at(0).error == ErrorCode::InvalidCommand);

        const std::array<std::byte, 6> first_half = {std::byte{0x89}, std::byte{'P'}, std::byte{'N'},
                                                     std::byte{'G'},  std::byte{'\r'}, std::byte{'\n'}};
        const std::array<std::byte, 4> second_half = {std::byte{1}, std::byte{2}, std::byte{3}, std::byte{4}};

        protocol::UploadChunkRequest chunk{
            .room = "general",
            .sequence = 1,
            .total_chunks = 2,
            .file_name = "diagram.png",
            .content_type = "image/png",
            .total_size = 10,
            .data_base64 = encoding::encode_base64(first_half),
        };
        gateway.handle(client, make_request(protocol::Command::UploadChunk, chunk));
        frames = sink->take();
        assert(frames.size() == 1);
        assert(frames[0].kind == protocol::ResponseKind::Progress);
        const auto progress = frames[0].payload.get<protocol::ProgressFrame>();
        assert(progress.bytes_received == 6);
        assert(progress.chunks_received == 1);

        chunk.upload_id = progress.upload_id;
        chunk.sequence = 2;
        chunk.data_base64 = encoding::encode_base64(second_half);
        gateway.handle(client, make_request(protocol::Command::UploadChunk, chunk));
        frames = sink->take();
        assert(frames.size() == 1);
        assert(frames[0].kind == protocol::ResponseKind::Completed);
        const auto completion = frames[0].payload.get<protocol::CompletionFrame>();
        assert(completion.upload_id == progress.upload_id);
        assert(completion.category == "images");
        assert(completion.size_bytes == 10);
        assert(completion.public_reference.starts_with("images/"));
        assert(completion.message_id.has_value());

        const auto posted = board.find_message(*completion.message_id);
        assert(posted.has_value());
        assert(posted->content == "diagram.png");
        assert(posted->attachment_reference == completion.public_reference);
        assert(board.room_history("general").size() == 1);

        protocol::ArtifactFetchRequest fetch{.message_id = completion.message_id, .offset = 6, .max_bytes = 100};
        gateway.handle(client, make_request(protocol::Command::ArtifactFetch, fetch));
        frames = sink->take();
        assert(frames.at(0).kind == protocol::ResponseKind::Ok);
        const auto fetched = frames[0].payload.get<protocol::ArtifactChunkResponse>();
        assert(fetched.reference == completion.public_reference);
        assert(fetched.total_size == 10);
        assert(fetched.bytes == 4);
        assert(fetched.done);
        assert(fetched.data_base64 == encoding::encode_base64(second_half));

        // Sessions left open when the connection goes away are cancelled.
        chunk.upload_id.reset();
        chunk.sequence = 1;
        chunk.data_base64 = encoding::encode_base64(first_half);
        gateway.handle(client, make_request(protocol::Command::UploadChunk, chunk));
        assert(sink->take().at(0).kind == protocol::ResponseKind::Progress);
        assert(fixture.sessions.live_count() == 1);
        gateway.disconnect(client);
        assert(fixture.sessions.live_count() == 0);
    }

    void test_gateway_message_paths()
    {
        UploadFixture fixture("chatdrop_gateway_message_test");
        MessageBoard board;
        UploadGateway gateway(fixture.assembler, fixture.artifacts, board, fixture.limits);

        auto sink = std::make_shared<RecordingSink>();
        ClientContext client(sink);
        gateway.handle(client, make_request(protocol::Command::Hello, protocol::HelloRequest{.uploader = "alice"}));
        (void)sink->take();

        gateway.handle(client, make_request(protocol::Command::MessageSend,
                                            protocol::MessageSendRequest{.room = "general", .content = "hello all"}));
        auto frames = sink->take();
        assert(frames.at(0).kind == protocol::ResponseKind::Ok);
        const auto posted = frames[0].payload.get<protocol::MessagePosted>();
        assert(posted.room == "general");

        gateway.handle(client, make_request(protocol::Command::ArtifactFetch,
                                            protocol::ArtifactFetchRequest{.message_id = posted.message_id}));
        frames = sink->take();
        assert(frames.at(0).kind == protocol::ResponseKind::Error);
        assert(frames[0].error == ErrorCode::NoAttachment);

        gateway.handle(client, make_request(protocol::Command::MessageSend,
                                            protocol::MessageSendRequest{.room = "general",
                                                                         .content = "uploads/auto_generated/x.png"}));
        frames = sink->take();
        assert(frames.at(0).error == ErrorCode::MisusedTransport);
        assert(board.room_history("general").size() == 1);
        assert(fixture.sessions.live_count() == 0);

        assert(UploadGateway::looks_like_storage_path("  images/20240102-030405-photo-0a1b2c3d.jpg "));
        assert(!UploadGateway::looks_like_storage_path("images/are nice"));
        assert(!UploadGateway::looks_like_storage_path("see you at 20240102-030405"));

        gateway.handle(client, make_request(protocol::Command::ArtifactFetch,
                                            protocol::ArtifactFetchRequest{.reference = std::string("images/missing.png")}));
        assert(sink->take().at(0).error == ErrorCode::NotFound);

        gateway.handle(client, make_request(protocol::Command::ArtifactFetch,
                                            protocol::ArtifactFetchRequest{.message_id = 9999}));
        assert(sink->take().at(0).error == ErrorCode::NotFound);

        gateway.handle(client, make_request(protocol::Command::ArtifactFetch, nlohmann::json::object()));
        assert(sink->take().at(0).error == ErrorCode::InvalidPayload);

        const protocol::UploadChunkRequest bad_data{
            .room = "general", .sequence = 1, .total_chunks = 1, .file_name = "a.txt",
            .content_type = "text/plain", .total_size = 4, .data_base64 = "***"};
        gateway.handle(client, make_request(protocol::Command::UploadChunk, bad_data));
        assert(sink->take().at(0).error == ErrorCode::InvalidPayload);

        const protocol::UploadChunkRequest unsupported{
            .room = "general", .sequence = 1, .total_chunks = 1, .file_name = "page.html",
            .content_type = "text/html", .total_size = 4, .data_base64 = "dGVzdA=="};
        gateway.handle(client, make_request(protocol::Command::UploadChunk, unsupported));
        frames = sink->take();
        assert(frames.at(0).kind == protocol::ResponseKind::Failed);
        assert(frames[0].payload.get<protocol::FailureFrame>().error_kind == ErrorCode::UnsupportedType);
        assert(fixture.sessions.live_count() == 0);

        const auto out_of_range = nlohmann::json{
            {"room", "general"},
            {"sequence", 1},
            {"total_chunks", 4294967299ULL},
            {"file_name", "a.txt"},
            {"content_type", "text/plain"},
            {"total_size", 4},
            {"data", "dGVzdA=="},
        };
        gateway.handle(client, make_request(protocol::Command::UploadChunk, out_of_range));
        frames = sink->take();
        assert(frames.at(0).kind == protocol::ResponseKind::Error);
        assert(frames[0].error == ErrorCode::InvalidPayload);
        assert(fixture.sessions.live_count() == 0);

        auto negative_size = out_of_range;
        negative_size["total_chunks"] = 1;
        negative_size["total_size"] = -4;
        gateway.handle(client, make_request(protocol::Command::UploadChunk, negative_size));
        assert(sink->take().at(0).error == ErrorCode::InvalidPayload);
        assert(fixture.sessions.live_count() == 0);
    }

    void test_gateway_rejects_changed_declaration()
    {
        UploadFixture fixture("chatdrop_gateway_consistency_test");
        MessageBoard board;
        UploadGateway gateway(fixture.assembler, fixture.artifacts, board, fixture.limits);

        auto sink = std::make_shared<RecordingSink>();
        ClientContext client(sink);
        gateway.handle(client, make_request(protocol::Command::Hello, protocol::HelloRequest{.uploader = "alice"}));
        (void)sink->take();

        protocol::UploadChunkRequest chunk{
            .room = "general", .sequence = 1, .total_chunks = 2, .file_name = "a.txt",
            .content_type = "text/plain", .total_size = 8, .data_base64 = "dGVzdA=="};
        gateway.handle(client, make_request(protocol::Command::UploadChunk, chunk));
        auto frames = sink->take();
        assert(frames.at(0).kind == protocol::ResponseKind::Progress);
        const auto upload_id = frames[0].payload.get<protocol::ProgressFrame>().upload_id;

        chunk.upload_id = upload_id;
        chunk.sequence = 2;
        chunk.total_size = 12;
        gateway.handle(client, make_request(protocol::Command::UploadChunk, chunk));
        frames = sink->take();
        assert(frames.at(0).kind == protocol::ResponseKind::Failed);
        const auto failure = frames[0].payload.get<protocol::FailureFrame>();
        assert(failure.upload_id == upload_id);
        assert(failure.error_kind == ErrorCode::InvalidChunk);
        assert(fixture.sessions.closed_state(upload_id) == SessionState::Failed);
    }

} // namespace

void run_upload_flow_tests()
{
    test_out_of_order_chunks_complete_on_last();
    test_duplicate_chunks_are_ignored();
    test_oversized_upload_fails_before_storing();
    test_late_and_foreign_chunks_are_rejected();
    test_cancel_and_cancel_all();
    test_reaper_expires_idle_sessions();
    test_racing_final_chunk_completes_once();
    test_sweep_racing_final_chunk();
    test_chunk_disagreeing_with_declaration_fails();
    test_begin_refused_after_drain();
    test_gateway_end_to_end();
    test_gateway_message_paths();
    test_gateway_rejects_changed_declaration();
}
