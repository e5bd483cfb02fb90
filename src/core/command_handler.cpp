#include "chunkstream/core/command_handler.hpp"
#include "chunkstream/core/config.hpp"
#include "chunkstream/core/logger.hpp"
#include "chunkstream/core/utils.hpp"
#include "chunkstream/crypto/hash.hpp"
#include "chunkstream/network/tcp_transport.hpp"
#include "chunkstream/storage/chunker.hpp"
#include "chunkstream/storage/file_chunk_store.hpp"
#include "chunkstream/storage/resume_manager.hpp"
#include "chunkstream/transfer/transfer_manager.hpp"
#include <filesystem>
#include <iostream>
#include <iomanip>

namespace chunkstream::core {

namespace {

    std::shared_ptr<storage::FileChunkStore> open_store(const storage::StorageConfig& config, Result& result) {
        auto store = std::make_shared<storage::FileChunkStore>(config);
        result = store->initialize();
        return result ? store : nullptr;
    }

    Result chunk_into_store(const std::filesystem::path& file_path,
                            const std::string& file_id,
                            const storage::StorageConfig& config,
                            std::shared_ptr<storage::FileChunkStore>& store,
                            storage::Manifest& manifest) {
        Result result;
        store = open_store(config, result);
        if (!store) {
            return result;
        }

        if (config.chunk_size == 0 || config.chunk_size > storage::CHUNK_MAX) {
            return Result(ErrorCode::MANIFEST_INVALID, "chunk.size must be between 1 and " +
                          std::to_string(storage::CHUNK_MAX));
        }

        storage::Chunker chunker(config.chunk_size);
        return chunker.chunk_file(file_path, file_id, *store, manifest);
    }

    void print_progress(const transfer::TransferSessionStats& stats) {
        const auto& progress = stats.progress;
        std::cout << "\r  " << std::fixed << std::setprecision(1) << progress.percentage() << "%  "
                  << progress.completed_chunks << "/" << progress.total_chunks << " chunks  "
                  << utils::StringUtils::format_bytes(progress.speed_bps) << "/s  "
                  << "window " << progress.window;
        if (stats.estimated_time_remaining.count() > 0) {
            std::cout << "  eta " << utils::StringUtils::format_duration(stats.estimated_time_remaining);
        }
        std::cout << "    " << std::flush;
    }

    transfer::TransferOutcome wait_with_progress(transfer::TransferManager& manager, const std::string& session_id) {
        while (true) {
            auto outcome = manager.wait_for(session_id, std::chrono::milliseconds(500));
            if (auto stats = manager.get_session_stats(session_id)) {
                print_progress(*stats);
            }
            if (outcome) {
                std::cout << "\n";
                return *outcome;
            }
        }
    }

    std::optional<uint16_t> parse_port(const std::string& value) {
        auto port = utils::StringUtils::parse_int(value, 1, 65535);
        if (!port) {
            return std::nullopt;
        }
        return static_cast<uint16_t>(*port);
    }

}

// ManifestCommandHandler Implementation
CommandResult ManifestCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::filesystem::path file_path = args[1];
    std::string file_id = args.size() > 2 ? args[2] : file_path.filename().string();

    auto storage_config = storage::StorageConfig::from_config(Config::instance());
    std::shared_ptr<storage::FileChunkStore> store;
    storage::Manifest manifest;

    LOG_INFO("Building manifest for {}", file_path.string());
    auto result = chunk_into_store(file_path, file_id, storage_config, store, manifest);
    if (!result) {
        return CommandResult::error("Failed to process file: " + result.message);
    }

    std::cout << "File ID:    " << manifest.file_id() << "\n";
    std::cout << "Size:       " << utils::StringUtils::format_bytes(manifest.total_size())
              << " (" << manifest.total_size() << " bytes)\n";
    std::cout << "Chunks:     " << manifest.chunk_count() << "\n";
    std::cout << "Root hash:  " << crypto::hash_utils::hash_to_hex(manifest.file_hash()) << "\n";
    if (manifest.metadata().plaintext_hash) {
        std::cout << "SHA-256:    " << crypto::hash_utils::hash_to_hex(*manifest.metadata().plaintext_hash) << "\n";
    }
    std::cout << "\n";

    for (const auto& chunk : manifest.chunks()) {
        std::cout << "  " << std::setw(6) << chunk.index << "  "
                  << std::setw(8) << chunk.size << "  "
                  << crypto::hash_utils::hash_to_hex(chunk.chunk_id) << "\n";
    }

    return CommandResult::ok("Manifest built");
}

// SendCommandHandler Implementation
CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 4) {
        return CommandResult::error("Usage: " + get_usage());
    }

    const std::string& host = args[1];
    auto port = parse_port(args[2]);
    if (!port) {
        return CommandResult::error("Invalid port: " + args[2]);
    }

    std::filesystem::path file_path = args[3];
    std::string file_id = args.size() > 4 ? args[4] : file_path.filename().string();

    auto& config = Config::instance();
    auto storage_config = storage::StorageConfig::from_config(config);
    std::shared_ptr<storage::FileChunkStore> store;
    storage::Manifest manifest;

    std::cout << "Processing file: " << file_path.filename() << "\n";
    auto result = chunk_into_store(file_path, file_id, storage_config, store, manifest);
    if (!result) {
        return CommandResult::error("Failed to process file: " + result.message);
    }
    auto shared_manifest = std::make_shared<const storage::Manifest>(std::move(manifest));

    std::cout << "Connecting to " << host << ":" << *port << "...\n";
    auto transport = network::TcpTransport::connect(host, *port);
    if (!transport) {
        return CommandResult::error("Could not connect to " + host + ":" + args[2]);
    }

    transfer::TransferManager manager(store);
    manager.configure(config);

    std::string session_id;
    result = manager.start_upload(shared_manifest, transport->remote_endpoint(), transport, session_id);
    if (!result) {
        return CommandResult::error("Failed to start upload: " + result.message);
    }

    std::cout << "Sending " << shared_manifest->file_id() << " ("
              << utils::StringUtils::format_bytes(shared_manifest->total_size()) << ", "
              << shared_manifest->chunk_count() << " chunks)\n";

    auto outcome = wait_with_progress(manager, session_id);
    if (!outcome.completed()) {
        return CommandResult::error(std::string("Transfer ") + transfer::transfer_state_name(outcome.state) +
                                    ": " + error_code_name(outcome.result.error) + " " + outcome.result.message);
    }

    std::cout << "✓ Transfer complete\n";
    return CommandResult::ok("File sent");
}

// ReceiveCommandHandler Implementation
CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto port = parse_port(args[1]);
    if (!port) {
        return CommandResult::error("Invalid port: " + args[1]);
    }

    auto& config = Config::instance();
    auto storage_config = storage::StorageConfig::from_config(config);

    Result result;
    auto store = open_store(storage_config, result);
    if (!store) {
        return CommandResult::error("Failed to open chunk store: " + result.message);
    }

    auto resume_manager = std::make_shared<storage::ResumeManager>(storage_config.database_path);
    if (!resume_manager->initialize()) {
        return CommandResult::error("Failed to open resume journal");
    }
    resume_manager->cleanup_old_resume_states();

    network::TcpListener listener(*port);
    std::cout << "Listening on port " << listener.port() << "...\n";

    auto transport = listener.accept();
    if (!transport) {
        return CommandResult::error("Listener closed before a peer connected");
    }
    std::cout << "Connection from " << transport->remote_endpoint() << "\n";

    transfer::TransferManager manager(store);
    manager.configure(config);
    manager.set_resume_manager(resume_manager);

    std::string session_id;
    result = manager.handle_incoming(transport->remote_endpoint(), transport, session_id);
    if (!result) {
        return CommandResult::error("Transfer refused: " + result.message);
    }

    auto manifest = manager.get_manifest(session_id);
    std::cout << "Receiving " << manifest->file_id() << " ("
              << utils::StringUtils::format_bytes(manifest->total_size()) << ", "
              << manifest->chunk_count() << " chunks)\n";

    auto outcome = wait_with_progress(manager, session_id);
    if (!outcome.completed()) {
        if (resume_manager->is_resumable(manifest->file_id())) {
            std::cout << "Partial progress saved, receive again to resume.\n";
        }
        return CommandResult::error(std::string("Transfer ") + transfer::transfer_state_name(outcome.state) +
                                    ": " + error_code_name(outcome.result.error) + " " + outcome.result.message);
    }

    std::filesystem::path output_path = args.size() > 2
        ? std::filesystem::path(args[2])
        : storage_config.get_download_path(manifest->metadata().filename.value_or(manifest->file_id()));

    result = storage::Chunker::reassemble(*manifest, *store, output_path);
    if (!result) {
        return CommandResult::error("Failed to write " + output_path.string() + ": " + result.message);
    }

    std::cout << "✓ Transfer complete\n";
    std::cout << "File saved to: " << output_path << "\n";
    return CommandResult::ok("File received");
}

// ResumableCommandHandler Implementation
CommandResult ResumableCommandHandler::execute(const std::vector<std::string>&) {
    auto storage_config = storage::StorageConfig::from_config(Config::instance());
    if (!storage_config.create_directories()) {
        return CommandResult::error("Failed to create storage directories");
    }

    storage::ResumeManager resume_manager(storage_config.database_path);
    if (!resume_manager.initialize()) {
        return CommandResult::error("Failed to open resume journal");
    }
    resume_manager.cleanup_old_resume_states();

    auto transfers = resume_manager.list_resumable_transfers();
    if (transfers.empty()) {
        std::cout << "No interrupted downloads.\n";
        return CommandResult::ok();
    }

    for (const auto& info : transfers) {
        std::cout << info.file_id << "\n";
        std::cout << "  From:      " << info.peer << "\n";
        std::cout << "  Progress:  " << info.completed_chunks.size() << "/" << info.manifest.chunk_count()
                  << " chunks of " << utils::StringUtils::format_bytes(info.manifest.total_size()) << "\n";
        std::cout << "  Last seen: " << utils::TimeUtils::format_timestamp(info.last_activity) << "\n";
    }

    return CommandResult::ok();
}

}
