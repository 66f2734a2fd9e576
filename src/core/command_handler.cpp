#include "pqshare/core/command_handler.hpp"
#include "pqshare/core/config.hpp"
#include "pqshare/core/logger.hpp"
#include "pqshare/core/utils.hpp"
#include "pqshare/crypto/random.hpp"
#include "pqshare/network/tcp_channel.hpp"
#include "pqshare/storage/resume_store.hpp"
#include "pqshare/transfer/group_orchestrator.hpp"
#include "pqshare/transfer/resume_manager.hpp"
#include "pqshare/transfer/session_task.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <type_traits>

namespace pqshare::core {

namespace {

constexpr int DEFAULT_PORT = 9650;
constexpr int PAUSED_EXIT_CODE = 2;

std::uint16_t port_from(const std::vector<std::string>& args, size_t position) {
    int port = Config::instance().get_int("network.port", DEFAULT_PORT);
    if (args.size() > position) {
        try {
            port = std::stoi(args[position]);
        } catch (const std::exception&) {
            port = -1;
        }
    }
    return port > 0 && port <= 65535 ? static_cast<std::uint16_t>(port) : 0;
}

std::chrono::milliseconds peer_timeout() {
    return std::chrono::seconds(Config::instance().get_int64("peer.timeout_s", 300));
}

// A missing store only costs the ability to resume
std::shared_ptr<storage::ResumeStore> open_store(const EngineSettings& settings) {
    auto store = std::make_shared<storage::SqliteResumeStore>(settings.resume_database);
    if (!store->initialize()) {
        LOG_WARN("Resume database {} unavailable; transfers will not be resumable", settings.resume_database);
        return nullptr;
    }
    return store;
}

transfer::SessionOptions session_options(const EngineSettings& settings,
                                         std::shared_ptr<transfer::EventQueue> events,
                                         std::shared_ptr<storage::ResumeStore> store) {
    auto& config = Config::instance();

    transfer::SessionOptions options;
    options.settings = settings;
    options.events = std::move(events);
    options.store = std::move(store);
    options.bandwidth_limit = static_cast<std::uint64_t>(std::max<std::int64_t>(
        config.get_int64("send.bandwidth_limit", 0), 0));

    auto max_downloads = config.get_int64("send.max_downloads", 0);
    if (max_downloads > 0) {
        options.max_downloads = static_cast<std::uint32_t>(max_downloads);
    }
    auto expires_hours = config.get_int64("send.expires_hours", 0);
    if (expires_hours > 0) {
        options.expires_at = WallClock::now() + std::chrono::hours(expires_hours);
    }
    return options;
}

void render_event(const transfer::TransferEvent& event) {
    std::visit([](const auto& item) {
        using T = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<T, transfer::ChunkProgress>) {
            double percent = item.total_chunks == 0 ? 100.0 : 100.0 * item.chunks_done / item.total_chunks;
            std::cout << "\r  " << std::fixed << std::setprecision(1) << percent << "% ("
                      << item.chunks_done << "/" << item.total_chunks << " chunks, "
                      << utils::StringUtils::format_bytes(item.bytes_done) << ")" << std::flush;
        } else if constexpr (std::is_same_v<T, transfer::SpeedEstimate>) {
            std::cout << "  " << utils::StringUtils::format_rate(item.bytes_per_second)
                      << ", ETA " << utils::StringUtils::format_duration(item.eta) << "   " << std::flush;
        } else if constexpr (std::is_same_v<T, transfer::StatusChanged>) {
            LOG_DEBUG("Session {}: {} -> {}", item.session_id, transfer::to_string(item.from),
                      transfer::to_string(item.to));
            if (item.to == transfer::SessionState::TRANSFERRING && item.from == transfer::SessionState::NEGOTIATING) {
                std::cout << "Secure channel established, transferring...\n";
            }
        } else if constexpr (std::is_same_v<T, transfer::ConnectionLost>) {
            std::cout << "\nConnection lost after " << item.chunks_done << "/" << item.total_chunks << " chunks\n";
        } else if constexpr (std::is_same_v<T, transfer::ResumeAvailable>) {
            std::cout << "Session " << item.session_id << " can be resumed\n";
        } else if constexpr (std::is_same_v<T, transfer::RecipientOutcome>) {
            std::cout << "  recipient " << item.recipient_id << ": "
                      << (item.success ? "completed" : "failed");
            if (item.failure) {
                std::cout << " (" << transfer::to_string(item.failure->error) << ": " << item.failure->reason << ")";
            }
            std::cout << "\n";
        } else if constexpr (std::is_same_v<T, transfer::GroupProgress>) {
            LOG_DEBUG("Group {} at {:.1f}% ({} ok, {} failed of {})", item.group_id, item.progress * 100.0,
                      item.succeeded, item.failed, item.total);
        }
    }, event);
}

void drain_events(transfer::EventQueue& events) {
    for (const auto& event : events.drain()) {
        render_event(event);
    }
}

CommandResult finish_task(transfer::SessionTask& task, transfer::EventQueue& events, const std::string& verb) {
    while (!task.wait(std::chrono::milliseconds(200))) {
        drain_events(events);
    }
    drain_events(events);
    std::cout << "\n";

    auto session = task.release();
    auto state = task.get_state();
    if (state == transfer::SessionState::COMPLETED) {
        std::cout << "✓ " << verb << " " << utils::StringUtils::format_bytes(session->get_file_size()) << "\n";
        if (auto output = session->get_output_path()) {
            std::cout << "File saved to: " << output->string() << "\n";
        }
        const auto& stats = session->get_stats();
        LOG_INFO("Session {} done: {} chunks sent, {} retransmitted, {} key rotations", session->get_session_id(),
                 stats.chunks_sent, stats.chunks_retransmitted, stats.key_rotations);
        return CommandResult::ok(verb);
    }

    if (state == transfer::SessionState::PAUSED) {
        return CommandResult::error("Transfer paused. Resume with: pqshare resume " + session->get_session_id() +
                                    " connect <host> [port]  (or listen [port])", PAUSED_EXIT_CODE);
    }

    auto failure = task.get_failure();
    if (failure) {
        return CommandResult::error(std::string(transfer::to_string(failure->error)) + ": " + failure->reason);
    }
    return CommandResult::error(std::string("Transfer ended ") + transfer::to_string(state));
}

}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::filesystem::path file_path = args[1];
    auto file_size = utils::FileUtils::file_size(file_path);
    if (!file_size) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }
    auto port = port_from(args, 3);
    if (port == 0) {
        return CommandResult::error("Invalid port");
    }

    try {
        auto settings = EngineSettings::from_config(Config::instance());
        auto events = std::make_shared<transfer::EventQueue>();
        transfer::AdaptiveBitrateController controller(settings.network_mode, settings.bitrate_mode);
        auto chunk_size = controller.chunk_size_for(*file_size);

        std::cout << "Preparing " << file_path.filename().string() << " ("
                  << utils::StringUtils::format_bytes(*file_size) << ", "
                  << storage::chunk_count_for(*file_size, chunk_size) << " chunks)\n";

        auto session = transfer::TransferSession::create_sender(
            storage::Chunker(file_path, chunk_size), file_path.filename().string(),
            session_options(settings, events, open_store(settings)));
        if (session->is_terminal()) {
            return CommandResult::error("Cannot send file: " + session->get_failure()->reason);
        }

        network::IoRuntime runtime;
        runtime.start();
        auto channel = network::TcpChannel::connect(runtime.context(), args[2], port);
        if (!channel) {
            return CommandResult::error("Failed to connect to " + args[2] + ":" + std::to_string(port));
        }

        std::cout << "Connected to " << channel->describe() << ", session " << session->get_session_id() << "\n";
        transfer::SessionTask task(std::move(session), channel);
        channel->start();
        task.run();
        return finish_task(task, *events, "Sent");

    } catch (const std::exception& e) {
        return CommandResult::error("Send failed: " + std::string(e.what()));
    }
}

CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::filesystem::path output_dir = args[1];
    if (!utils::FileUtils::create_directories(output_dir)) {
        return CommandResult::error("Cannot create output directory: " + output_dir.string());
    }
    auto port = port_from(args, 2);
    if (port == 0) {
        return CommandResult::error("Invalid port");
    }

    try {
        auto settings = EngineSettings::from_config(Config::instance());
        auto events = std::make_shared<transfer::EventQueue>();

        network::IoRuntime runtime;
        network::TcpAcceptor acceptor(runtime.context(), port);
        runtime.start();

        std::cout << "Waiting for a sender on port " << acceptor.get_port() << "...\n";
        auto channel = acceptor.accept(peer_timeout());
        acceptor.close();
        if (!channel) {
            return CommandResult::error("No sender connected");
        }
        std::cout << "Sender connected from " << channel->describe() << "\n";

        auto session = transfer::TransferSession::create_receiver(
            output_dir, session_options(settings, events, open_store(settings)));
        transfer::SessionTask task(std::move(session), channel);
        channel->start();
        task.run();
        return finish_task(task, *events, "Received");

    } catch (const std::exception& e) {
        return CommandResult::error("Receive failed: " + std::string(e.what()));
    }
}

CommandResult ResumeCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    const auto& session_id = args[1];
    const auto& how = args[2];
    bool initiate = how == "connect";
    if (!initiate && how != "listen") {
        return CommandResult::error("Usage: " + get_usage());
    }
    if (initiate && args.size() < 4) {
        return CommandResult::error("Usage: " + get_usage());
    }
    auto port = port_from(args, initiate ? 4 : 3);
    if (port == 0) {
        return CommandResult::error("Invalid port");
    }

    try {
        auto settings = EngineSettings::from_config(Config::instance());
        auto store = open_store(settings);
        if (!store) {
            return CommandResult::error("Resume database unavailable");
        }

        auto events = std::make_shared<transfer::EventQueue>();
        transfer::ResumeManager manager(store, settings);
        transfer::TransferResult result;
        auto session = manager.restore(session_id, session_options(settings, events, store), WallClock::now(),
                                       result);
        if (!session) {
            return CommandResult::error(std::string(transfer::to_string(result.error)) + ": " + result.message);
        }

        std::cout << "Resuming " << session->get_file_name() << " at "
                  << session->get_progress_bitmap().count() << "/" << session->get_total_chunks() << " chunks\n";

        network::IoRuntime runtime;
        std::shared_ptr<network::TcpChannel> channel;
        if (initiate) {
            runtime.start();
            channel = network::TcpChannel::connect(runtime.context(), args[3], port);
        } else {
            network::TcpAcceptor acceptor(runtime.context(), port);
            runtime.start();
            std::cout << "Waiting for the peer on port " << acceptor.get_port() << "...\n";
            channel = acceptor.accept(peer_timeout());
            acceptor.close();
        }
        if (!channel) {
            return CommandResult::error("Peer not reachable");
        }

        transfer::SessionTask task(std::move(session), channel,
                                   initiate ? transfer::TaskStart::RESUME : transfer::TaskStart::ACCEPT_RESUME);
        channel->start();
        task.run();
        return finish_task(task, *events, "Resumed and finished");

    } catch (const std::exception& e) {
        return CommandResult::error("Resume failed: " + std::string(e.what()));
    }
}

CommandResult ListCommandHandler::execute(const std::vector<std::string>& args) {
    (void)args;
    auto settings = EngineSettings::from_config(Config::instance());
    auto store = open_store(settings);
    if (!store) {
        return CommandResult::error("Resume database unavailable");
    }

    transfer::ResumeManager manager(store, settings);
    auto now = WallClock::now();
    auto purged = manager.purge_expired(now);
    if (purged > 0) {
        LOG_INFO("Purged {} expired sessions", purged);
    }

    auto transfers = manager.list_resumable(now);
    if (transfers.empty()) {
        std::cout << "No resumable transfers.\n";
        return CommandResult::ok();
    }

    std::cout << "Resumable transfers:\n";
    for (const auto& transfer : transfers) {
        std::cout << "  " << transfer.session_id << "  "
                  << (transfer.direction == TransferDirection::SEND ? "send    " : "receive ")
                  << transfer.file_name << " (" << utils::StringUtils::format_bytes(transfer.file_size) << ")\n";
        std::cout << "      " << transfer.chunks_done << "/" << transfer.total_chunks << " chunks, "
                  << transfer.resume_attempts << " resume attempts, expires "
                  << utils::TimeUtils::to_iso_string(transfer.expires_at) << "\n";
    }
    return CommandResult::ok();
}

CommandResult SelfTestCommandHandler::execute(const std::vector<std::string>& args) {
    int recipients = 3;
    std::int64_t bytes = 4 * 1024 * 1024;
    int unreachable = 0;
    try {
        if (args.size() > 1) recipients = std::stoi(args[1]);
        if (args.size() > 2) bytes = std::stoll(args[2]);
        if (args.size() > 3) unreachable = std::stoi(args[3]);
    } catch (const std::exception&) {
        return CommandResult::error("Usage: " + get_usage());
    }
    if (recipients < 1 || bytes < 0 || static_cast<std::uint64_t>(bytes) > storage::MAX_FILE_SIZE ||
        unreachable < 0 || unreachable > recipients) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto settings = EngineSettings::from_config(Config::instance());
    auto size = static_cast<std::uint64_t>(bytes);
    transfer::AdaptiveBitrateController controller(settings.network_mode, settings.bitrate_mode);
    auto chunk_size = controller.chunk_size_for(size);

    std::vector<std::uint8_t> content(size);
    if (!content.empty() && !crypto::SecureRandom::generate_bytes(content)) {
        return CommandResult::error("Random generator unavailable");
    }

    auto events = std::make_shared<transfer::EventQueue>();
    transfer::GroupOrchestrator group(transfer::GroupOptions{settings, events, nullptr, 0});

    std::vector<transfer::Recipient> members;
    for (int i = 0; i < recipients; ++i) {
        members.push_back({"peer-" + std::to_string(i + 1), "Peer " + std::to_string(i + 1), std::nullopt});
    }

    // The first `unreachable` recipients refuse the connection
    std::set<std::string> refused;
    for (int i = 0; i < unreachable; ++i) {
        refused.insert(members[static_cast<std::size_t>(i)].id);
    }

    // Recipients are connected from their own setup threads
    std::mutex receivers_mutex;
    std::map<std::string, std::unique_ptr<transfer::SessionTask>> receivers;
    auto connect = [&](const transfer::Recipient& recipient) -> std::shared_ptr<network::MessageChannel> {
        if (refused.count(recipient.id)) {
            return nullptr;
        }
        auto [sender_side, receiver_side] = network::LoopbackChannel::create_pair(
            network::LoopbackDelivery::IMMEDIATE, 0, "selftest-" + recipient.id);
        transfer::SessionOptions options;
        options.settings = settings;
        auto task = std::make_unique<transfer::SessionTask>(
            transfer::TransferSession::create_receiver(std::nullopt, std::move(options)), receiver_side);
        task->run();
        std::lock_guard<std::mutex> lock(receivers_mutex);
        receivers[recipient.id] = std::move(task);
        return sender_side;
    };

    std::cout << "Sending " << utils::StringUtils::format_bytes(size) << " to " << recipients << " recipients\n";
    auto started = group.start([&content, chunk_size]() { return storage::Chunker::from_memory(content, chunk_size); },
                               "selftest.bin", members, connect);
    if (!started) {
        return CommandResult::error(started.message);
    }

    while (!group.wait(std::chrono::milliseconds(200))) {
        drain_events(*events);
    }
    drain_events(*events);

    auto result = group.get_result();
    int verified = 0;
    for (auto& [id, task] : receivers) {
        task->wait(std::chrono::seconds(5));
        auto session = task->release();
        if (!session) {
            task->cancel();
            continue;
        }
        auto received = session->take_received_file();
        if (received && *received == content) {
            verified++;
        } else if (session->get_state() == transfer::SessionState::COMPLETED) {
            LOG_ERROR("Recipient {} completed with different bytes", id);
        }
    }

    std::cout << "Group " << result.group_id << ": " << transfer::to_string(result.outcome) << ", "
              << result.succeeded.size() << " succeeded, " << result.failed.size() << " failed, "
              << verified << " verified in " << utils::StringUtils::format_duration(result.elapsed) << "\n";

    if (verified != static_cast<int>(result.succeeded.size())) {
        return CommandResult::error("Received bytes did not match");
    }
    if (result.outcome == transfer::GroupOutcome::FAILED) {
        return CommandResult::error("Every recipient failed");
    }
    return CommandResult::ok();
}

}
