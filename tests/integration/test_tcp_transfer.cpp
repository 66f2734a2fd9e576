#include <gtest/gtest.h>
#include "pqshare/crypto/random.hpp"
#include "pqshare/network/tcp_channel.hpp"
#include "pqshare/transfer/session_task.hpp"
#include <filesystem>
#include <fstream>
#include <future>
#include <random>

using namespace pqshare;
using namespace pqshare::transfer;

class TcpTransferIntegrationTest : public ::testing::Test {
protected:
    static constexpr std::uint32_t CHUNK = storage::MIN_CHUNK_SIZE;
    static constexpr std::chrono::seconds WAIT_LIMIT{30};

    void SetUp() override {
        ASSERT_TRUE(crypto::SecureRandom::initialize());
        events_ = std::make_shared<EventQueue>();
        sender_store_ = std::make_shared<storage::SqliteResumeStore>(":memory:");
        receiver_store_ = std::make_shared<storage::SqliteResumeStore>(":memory:");
        ASSERT_TRUE(sender_store_->initialize());
        ASSERT_TRUE(receiver_store_->initialize());

        test_dir_ = std::filesystem::temp_directory_path() / "pqshare_tcp_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_ / "out");
        runtime_.start();
    }

    void TearDown() override {
        runtime_.stop();
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path write_source(std::size_t size) {
        std::mt19937 rng(42);
        std::uniform_int_distribution<int> dist(0, 255);
        content_.resize(size);
        for (auto& byte : content_) {
            byte = static_cast<std::uint8_t>(dist(rng));
        }
        auto path = test_dir_ / "dataset.bin";
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content_.data()), static_cast<std::streamsize>(content_.size()));
        return path;
    }

    std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    // Connected (client, server) channels over 127.0.0.1
    std::pair<std::shared_ptr<network::TcpChannel>, std::shared_ptr<network::TcpChannel>> connect_pair() {
        network::TcpAcceptor acceptor(runtime_.context(), 0);
        auto port = acceptor.get_port();
        auto client = std::async(std::launch::async, [this, port] {
            return network::TcpChannel::connect(runtime_.context(), "127.0.0.1", port);
        });
        auto server = acceptor.accept(std::chrono::seconds(5));
        acceptor.close();
        return {client.get(), server};
    }

    SessionOptions options(std::shared_ptr<storage::ResumeStore> store, std::uint64_t bandwidth_limit = 0) {
        SessionOptions options;
        options.events = events_;
        options.store = std::move(store);
        options.bandwidth_limit = bandwidth_limit;
        return options;
    }

    void run_tasks(SessionTask& sender, SessionTask& receiver,
                   const std::shared_ptr<network::TcpChannel>& sender_channel,
                   const std::shared_ptr<network::TcpChannel>& receiver_channel) {
        receiver_channel->start();
        sender_channel->start();
        receiver.run();
        sender.run();
    }

    network::IoRuntime runtime_;
    std::shared_ptr<EventQueue> events_;
    std::shared_ptr<storage::SqliteResumeStore> sender_store_;
    std::shared_ptr<storage::SqliteResumeStore> receiver_store_;
    std::filesystem::path test_dir_;
    std::vector<std::uint8_t> content_;
};

TEST_F(TcpTransferIntegrationTest, TcpTransfer_FileReachesDisk) {
    auto source = write_source(37 * CHUNK + 321);
    auto [client, server] = connect_pair();
    ASSERT_NE(client, nullptr);
    ASSERT_NE(server, nullptr);

    auto sender = TransferSession::create_sender(storage::Chunker(source, CHUNK), "dataset.bin",
                                                 options(sender_store_));
    auto session_id = sender->get_session_id();
    SessionTask sender_task(std::move(sender), client);
    SessionTask receiver_task(TransferSession::create_receiver(test_dir_ / "out", options(receiver_store_)),
                              server);
    run_tasks(sender_task, receiver_task, client, server);

    ASSERT_TRUE(sender_task.wait(WAIT_LIMIT));
    ASSERT_TRUE(receiver_task.wait(WAIT_LIMIT));
    EXPECT_EQ(sender_task.get_state(), SessionState::COMPLETED);
    EXPECT_EQ(receiver_task.get_state(), SessionState::COMPLETED);

    auto output = test_dir_ / "out" / "dataset.bin";
    ASSERT_TRUE(std::filesystem::exists(output));
    EXPECT_TRUE(read_file(output) == content_);

    // Completed sessions leave nothing to resume
    EXPECT_FALSE(sender_store_->get(session_id).has_value());
    EXPECT_FALSE(receiver_store_->get(session_id).has_value());
}

TEST_F(TcpTransferIntegrationTest, TcpTransfer_ResumesOnNewConnection) {
    // One burst goes out at once, the rest is paced at 64 KiB/s
    auto source = write_source(60 * CHUNK);

    auto [client, server] = connect_pair();
    ASSERT_NE(client, nullptr);
    ASSERT_NE(server, nullptr);
    SessionTask sender_task(TransferSession::create_sender(storage::Chunker(source, CHUNK), "dataset.bin",
                                                           options(sender_store_, 64 * 1024)),
                            client);
    SessionTask receiver_task(TransferSession::create_receiver(test_dir_ / "out", options(receiver_store_)),
                              server);
    run_tasks(sender_task, receiver_task, client, server);

    auto deadline = core::Clock::now() + WAIT_LIMIT;
    while (sender_task.get_progress() == 0.0 && core::Clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    sender_task.pause();
    ASSERT_TRUE(sender_task.wait(WAIT_LIMIT));
    ASSERT_TRUE(receiver_task.wait(WAIT_LIMIT));
    ASSERT_EQ(sender_task.get_state(), SessionState::PAUSED);
    ASSERT_EQ(receiver_task.get_state(), SessionState::PAUSED);

    auto sender = sender_task.release();
    auto receiver = receiver_task.release();
    ASSERT_NE(sender, nullptr);
    ASSERT_NE(receiver, nullptr);
    auto persisted = sender_store_->get(sender->get_session_id());
    ASSERT_TRUE(persisted.has_value());
    EXPECT_LT(persisted->bitmap.count(), persisted->total_chunks);

    auto [client2, server2] = connect_pair();
    ASSERT_NE(client2, nullptr);
    ASSERT_NE(server2, nullptr);
    SessionTask resumed_sender(std::move(sender), client2, TaskStart::RESUME);
    SessionTask resumed_receiver(std::move(receiver), server2, TaskStart::ACCEPT_RESUME);
    run_tasks(resumed_sender, resumed_receiver, client2, server2);

    ASSERT_TRUE(resumed_sender.wait(WAIT_LIMIT));
    ASSERT_TRUE(resumed_receiver.wait(WAIT_LIMIT));
    EXPECT_EQ(resumed_sender.get_state(), SessionState::COMPLETED);
    EXPECT_EQ(resumed_receiver.get_state(), SessionState::COMPLETED);
    EXPECT_TRUE(read_file(test_dir_ / "out" / "dataset.bin") == content_);

    auto finished = resumed_sender.release();
    ASSERT_NE(finished, nullptr);
    EXPECT_GE(finished->get_stats().resumes, 1u);
}

TEST_F(TcpTransferIntegrationTest, TcpTransfer_PeerDisconnectDuringKeyExchange) {
    auto source = write_source(4 * CHUNK);
    auto [client, server] = connect_pair();
    ASSERT_NE(client, nullptr);
    ASSERT_NE(server, nullptr);

    // Nobody answers the public key; the far end simply goes away
    server->close();

    SessionTask sender_task(TransferSession::create_sender(storage::Chunker(source, CHUNK), "dataset.bin",
                                                           options(sender_store_)),
                            client);
    client->start();
    sender_task.run();

    ASSERT_TRUE(sender_task.wait(WAIT_LIMIT));
    EXPECT_EQ(sender_task.get_state(), SessionState::FAILED);
    auto failure = sender_task.get_failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->error, TransferError::CONNECTION_LOST);
}
