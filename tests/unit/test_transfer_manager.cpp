#include <gtest/gtest.h>
#include "chunkstream/transfer/transfer_manager.hpp"
#include "chunkstream/network/codec.hpp"
#include "chunkstream/network/memory_transport.hpp"
#include "chunkstream/core/config.hpp"
#include "chunkstream/crypto/hash.hpp"
#include "chunkstream/crypto/random.hpp"
#include <filesystem>
#include <random>

using namespace chunkstream;
using namespace chunkstream::transfer;
using namespace chunkstream::network;
using namespace chunkstream::storage;
using namespace std::chrono_literals;

class TransferManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::initialize());

        options_.tick_interval = 5ms;
        options_.negotiation_timeout = 2000ms;

        sender_store_ = std::make_shared<MemoryChunkStore>();
        receiver_store_ = std::make_shared<MemoryChunkStore>();

        test_dir_ = std::filesystem::temp_directory_path() /
                    ("chunkstream_manager_test_" + crypto::SecureRandom::generate_hex(6));
        std::filesystem::create_directories(test_dir_);

        resume_manager_ = std::make_shared<ResumeManager>(test_dir_ / "resume.db");
        ASSERT_TRUE(resume_manager_->initialize());

        manifest_ = make_manifest({100, 100, 50});
    }

    void TearDown() override {
        resume_manager_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::shared_ptr<const Manifest> make_manifest(const std::vector<std::uint32_t>& sizes, unsigned seed = 42) {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> dist(0, 255);

        chunk_bytes_.clear();
        std::vector<ChunkDescriptor> descriptors;
        for (std::uint32_t i = 0; i < sizes.size(); ++i) {
            std::vector<std::uint8_t> bytes(sizes[i]);
            for (auto& b : bytes) {
                b = static_cast<std::uint8_t>(dist(rng));
            }
            auto id = crypto::Sha256Hasher::hash(bytes);
            EXPECT_TRUE(sender_store_->put(id, bytes).success());
            descriptors.push_back(ChunkDescriptor{id, i, sizes[i]});
            chunk_bytes_.push_back(std::move(bytes));
        }

        Manifest manifest;
        EXPECT_TRUE(Manifest::build("test-file", std::move(descriptors), {}, manifest).success());
        return std::make_shared<const Manifest>(std::move(manifest));
    }

    static void send(Transport& transport, const Message& message) {
        ASSERT_EQ(transport.send_frame(codec::encode(message)), TransportStatus::OK);
    }

    template<typename T>
    static T receive_as(Transport& transport) {
        std::vector<std::uint8_t> frame;
        auto status = transport.recv_frame(frame);
        if (status != TransportStatus::OK) {
            throw std::runtime_error(std::string("recv_frame failed: ") + transport_status_name(status));
        }
        return std::get<T>(codec::decode(frame));
    }

    TransferOptions options_;
    std::shared_ptr<MemoryChunkStore> sender_store_;
    std::shared_ptr<MemoryChunkStore> receiver_store_;
    std::filesystem::path test_dir_;
    std::shared_ptr<ResumeManager> resume_manager_;
    std::shared_ptr<const Manifest> manifest_;
    std::vector<std::vector<std::uint8_t>> chunk_bytes_;
};

TEST_F(TransferManagerTest, TransferManager_FullTransfer) {
    TransferManager uploader(sender_store_, options_);
    TransferManager downloader(receiver_store_, options_);
    downloader.set_resume_manager(resume_manager_);

    auto [a, b] = MemoryTransport::create_pair();

    std::string upload_id;
    ASSERT_TRUE(uploader.start_upload(manifest_, "receiver", a, upload_id).success());
    EXPECT_TRUE(uploader.has_session(upload_id));
    EXPECT_EQ(uploader.get_active_upload_count(), 1u);

    std::string download_id;
    ASSERT_TRUE(downloader.handle_incoming("sender", b, download_id).success());
    EXPECT_FALSE(download_id.empty());

    auto download = downloader.wait_for(download_id, 5s);
    auto upload = uploader.wait_for(upload_id, 5s);
    ASSERT_TRUE(download.has_value());
    ASSERT_TRUE(upload.has_value());
    EXPECT_TRUE(download->completed());
    EXPECT_TRUE(upload->completed());

    auto stats = downloader.get_session_stats(download_id);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->role, TransferRole::RECEIVER);
    EXPECT_EQ(stats->file_id, "test-file");
    EXPECT_EQ(stats->peer, "sender");
    EXPECT_EQ(stats->progress.completed_chunks, 3u);

    ASSERT_NE(downloader.get_manifest(download_id), nullptr);
    EXPECT_EQ(*downloader.get_manifest(download_id), *manifest_);

    EXPECT_EQ(downloader.get_active_download_count(), 0u);
    EXPECT_EQ(downloader.get_total_bytes_transferred(), 250u);
    EXPECT_FALSE(resume_manager_->is_resumable("test-file"));

    EXPECT_EQ(downloader.cleanup_completed_sessions(), 1u);
    EXPECT_FALSE(downloader.has_session(download_id));
    EXPECT_TRUE(downloader.get_all_sessions().empty());
    EXPECT_EQ(downloader.get_total_bytes_transferred(), 250u);
}

TEST_F(TransferManagerTest, TransferManager_UploadLimit) {
    TransferManager manager(sender_store_, options_);
    manager.set_max_uploads(1);

    auto [a1, b1] = MemoryTransport::create_pair();
    auto [a2, b2] = MemoryTransport::create_pair();

    std::string first;
    std::string second;
    ASSERT_TRUE(manager.start_upload(manifest_, "peer-1", a1, first).success());
    EXPECT_EQ(manager.start_upload(manifest_, "peer-2", a2, second).error, ErrorCode::LIMIT_REACHED);
    EXPECT_EQ(manager.get_all_sessions().size(), 1u);

    // Still negotiating
    EXPECT_EQ(manager.pause_transfer(first).error, ErrorCode::INVALID_STATE);
}

TEST_F(TransferManagerTest, TransferManager_LimitsFromConfig) {
    TransferManager manager(sender_store_, options_);

    core::Config config;
    config.set("transfer.max_uploads", "0");
    manager.configure(config);

    auto [a, b] = MemoryTransport::create_pair();
    std::string session_id;
    EXPECT_EQ(manager.start_upload(manifest_, "peer", a, session_id).error, ErrorCode::LIMIT_REACHED);
}

TEST_F(TransferManagerTest, TransferManager_RejectsOverDownloadLimit) {
    TransferManager manager(receiver_store_, options_);
    manager.set_max_downloads(0);

    auto [a, b] = MemoryTransport::create_pair();
    send(*a, TransferRequest{manifest_->file_id(), *manifest_});

    std::string session_id;
    auto result = manager.handle_incoming("sender", b, session_id);
    EXPECT_EQ(result.error, ErrorCode::LIMIT_REACHED);

    auto reject = receive_as<TransferReject>(*a);
    EXPECT_EQ(reject.file_id, "test-file");
    EXPECT_EQ(reject.reason, "Download limit reached");
    EXPECT_TRUE(b->is_closed());
    EXPECT_TRUE(manager.get_all_sessions().empty());
}

TEST_F(TransferManagerTest, TransferManager_RejectsMalformedRequest) {
    TransferManager manager(receiver_store_, options_);

    auto [a, b] = MemoryTransport::create_pair();
    std::vector<std::uint8_t> frame = {0, 0, 0, 4, static_cast<std::uint8_t>(MessageType::TRANSFER_REQUEST), 1, 2, 3};
    ASSERT_EQ(a->send_frame(frame), TransportStatus::OK);

    std::string session_id;
    EXPECT_EQ(manager.handle_incoming("sender", b, session_id).error, ErrorCode::PROTOCOL_VIOLATION);

    auto reject = receive_as<TransferReject>(*a);
    EXPECT_TRUE(reject.file_id.empty());
    EXPECT_EQ(reject.reason, "malformed request");
}

TEST_F(TransferManagerTest, TransferManager_RejectsWrongFirstMessage) {
    TransferManager manager(receiver_store_, options_);

    auto [a, b] = MemoryTransport::create_pair();
    send(*a, ChunkAck{"test-file", 0});

    std::string session_id;
    EXPECT_EQ(manager.handle_incoming("sender", b, session_id).error, ErrorCode::PROTOCOL_VIOLATION);
    EXPECT_EQ(receive_as<TransferReject>(*a).reason, "expected transfer request");
}

TEST_F(TransferManagerTest, TransferManager_ClosedBeforeRequest) {
    TransferManager manager(receiver_store_, options_);

    auto [a, b] = MemoryTransport::create_pair();
    a->close();

    std::string session_id;
    EXPECT_EQ(manager.handle_incoming("sender", b, session_id).error, ErrorCode::TRANSPORT_CLOSED);
}

TEST_F(TransferManagerTest, TransferManager_JournalsCancelledDownloadAndResumes) {
    std::string first_id;
    {
        TransferManager manager(receiver_store_, options_);
        manager.set_resume_manager(resume_manager_);

        auto [a, b] = MemoryTransport::create_pair();
        send(*a, TransferRequest{manifest_->file_id(), *manifest_});
        ASSERT_TRUE(manager.handle_incoming("sender", b, first_id).success());

        receive_as<TransferAccept>(*a);
        send(*a, ChunkData{manifest_->file_id(), 0, chunk_bytes_[0]});
        EXPECT_EQ(receive_as<ChunkAck>(*a).index, 0u);

        ASSERT_TRUE(manager.cancel_transfer(first_id).success());
        auto outcome = manager.wait_for(first_id, 1s);
        ASSERT_TRUE(outcome.has_value());
        EXPECT_TRUE(outcome->cancelled());
        EXPECT_EQ(receive_as<TransferAbort>(*a).reason, AbortReason::CANCELLED);
    }

    auto journal = resume_manager_->load_resume_state("test-file");
    ASSERT_TRUE(journal.has_value());
    EXPECT_EQ(journal->session_id, first_id);
    EXPECT_EQ(journal->peer, "sender");
    EXPECT_EQ(journal->manifest, *manifest_);
    EXPECT_EQ(journal->completed_chunks, (std::set<std::uint32_t>{0}));

    // A later download of the same file starts from what is already stored
    TransferManager manager(receiver_store_, options_);
    manager.set_resume_manager(resume_manager_);

    auto [a, b] = MemoryTransport::create_pair();
    auto sender = TransferSession::start_send(manifest_, "receiver", sender_store_, a, options_);

    std::string second_id;
    ASSERT_TRUE(manager.handle_incoming("sender", b, second_id).success());
    auto outcome = manager.wait_for(second_id, 5s);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->completed());

    auto stats = manager.get_session_stats(second_id);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->progress.bytes_transferred, 150u);
    EXPECT_FALSE(resume_manager_->is_resumable("test-file"));

    auto sender_outcome = sender->await_terminal_for(5s);
    ASSERT_TRUE(sender_outcome.has_value());
    EXPECT_TRUE(sender_outcome->completed());
}

TEST_F(TransferManagerTest, TransferManager_StaleJournalDiscarded) {
    ResumeInfo stale;
    stale.file_id = "test-file";
    stale.session_id = "old";
    stale.peer = "sender";
    stale.manifest = *make_manifest({64, 64}, 7);
    stale.completed_chunks = {0, 1};
    stale.last_activity = std::chrono::system_clock::now();
    ASSERT_TRUE(resume_manager_->save_resume_state(stale));

    manifest_ = make_manifest({100, 100, 50});

    TransferManager manager(receiver_store_, options_);
    manager.set_resume_manager(resume_manager_);

    auto [a, b] = MemoryTransport::create_pair();
    send(*a, TransferRequest{manifest_->file_id(), *manifest_});

    std::string session_id;
    ASSERT_TRUE(manager.handle_incoming("sender", b, session_id).success());
    EXPECT_FALSE(resume_manager_->is_resumable("test-file"));

    ASSERT_TRUE(manager.cancel_transfer(session_id).success());
    ASSERT_TRUE(manager.wait_for(session_id, 1s).has_value());

    auto journal = resume_manager_->load_resume_state("test-file");
    ASSERT_TRUE(journal.has_value());
    EXPECT_EQ(journal->manifest, *manifest_);
    EXPECT_TRUE(journal->completed_chunks.empty());
}

TEST_F(TransferManagerTest, TransferManager_JournalReconciledWithStore) {
    // The journal lists chunks 0 and 1, only chunk 0 is still stored
    ASSERT_TRUE(receiver_store_->put(manifest_->chunk(0).chunk_id, chunk_bytes_[0]).success());

    ResumeInfo previous;
    previous.file_id = "test-file";
    previous.session_id = "old";
    previous.peer = "sender";
    previous.manifest = *manifest_;
    previous.completed_chunks = {0, 1};
    previous.last_activity = std::chrono::system_clock::now();
    ASSERT_TRUE(resume_manager_->save_resume_state(previous));

    TransferManager manager(receiver_store_, options_);
    manager.set_resume_manager(resume_manager_);

    auto [a, b] = MemoryTransport::create_pair();
    send(*a, TransferRequest{manifest_->file_id(), *manifest_});

    std::string session_id;
    ASSERT_TRUE(manager.handle_incoming("sender", b, session_id).success());

    auto accept = receive_as<TransferAccept>(*a);
    ASSERT_EQ(accept.already_have.size(), 3u);
    EXPECT_TRUE(accept.already_have[0]);
    EXPECT_FALSE(accept.already_have[1]);
    EXPECT_EQ(resume_manager_->get_completed_chunks("test-file"), (std::set<std::uint32_t>{0}));

    ASSERT_TRUE(manager.cancel_transfer(session_id).success());
    ASSERT_TRUE(manager.wait_for(session_id, 1s).has_value());
}

TEST_F(TransferManagerTest, TransferManager_UnknownSession) {
    TransferManager manager(receiver_store_, options_);

    EXPECT_EQ(manager.pause_transfer("missing").error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(manager.resume_transfer("missing").error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(manager.cancel_transfer("missing").error, ErrorCode::NOT_FOUND);
    EXPECT_FALSE(manager.wait_for("missing", 10ms).has_value());
    EXPECT_FALSE(manager.get_session_stats("missing").has_value());
    EXPECT_EQ(manager.get_manifest("missing"), nullptr);
    EXPECT_EQ(manager.cleanup_completed_sessions(), 0u);
}
