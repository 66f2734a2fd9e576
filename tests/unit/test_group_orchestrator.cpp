#include <gtest/gtest.h>
#include "pqshare/crypto/random.hpp"
#include "pqshare/transfer/group_orchestrator.hpp"
#include <algorithm>
#include <future>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <thread>

using namespace pqshare;
using namespace pqshare::transfer;

class GroupOrchestratorTest : public ::testing::Test {
protected:
    static constexpr std::uint32_t CHUNK = storage::MIN_CHUNK_SIZE;
    static constexpr std::chrono::seconds WAIT_LIMIT{30};

    void SetUp() override {
        ASSERT_TRUE(crypto::SecureRandom::initialize());
        events_ = std::make_shared<EventQueue>();

        std::mt19937 rng(42);
        std::uniform_int_distribution<int> dist(0, 255);
        content_.resize(8 * CHUNK + 500);
        for (auto& byte : content_) {
            byte = static_cast<std::uint8_t>(dist(rng));
        }
    }

    void TearDown() override {
        std::lock_guard<std::mutex> lock(receivers_mutex_);
        receivers_.clear();
        receiver_channels_.clear();
    }

    GroupOptions group_options() {
        GroupOptions options;
        options.events = events_;
        return options;
    }

    SourceFactory source() {
        return [this] { return storage::Chunker::from_memory(content_, CHUNK); };
    }

    // Every reachable recipient gets an in-memory receiver on its own task.
    // Recipients connect from their own setup threads.
    ChannelFactory connector() {
        return [this](const Recipient& recipient) -> std::shared_ptr<network::MessageChannel> {
            if (unreachable_.count(recipient.id)) {
                return nullptr;
            }
            auto gate = gates_.find(recipient.id);
            if (gate != gates_.end()) {
                gate->second.wait();
            }
            auto pair = network::LoopbackChannel::create_pair(network::LoopbackDelivery::IMMEDIATE, 0,
                                                              "loopback:" + recipient.id);
            auto receiver = TransferSession::create_receiver(std::nullopt, SessionOptions{});
            auto task = std::make_unique<SessionTask>(std::move(receiver), pair.second);
            task->run();
            std::lock_guard<std::mutex> lock(receivers_mutex_);
            receivers_[recipient.id] = std::move(task);
            receiver_channels_[recipient.id] = pair.second;
            return pair.first;
        };
    }

    double receiver_progress(const std::string& id) {
        std::lock_guard<std::mutex> lock(receivers_mutex_);
        auto it = receivers_.find(id);
        return it == receivers_.end() ? 0.0 : it->second->get_progress();
    }

    // Drops the link to one recipient once it has received something
    void disconnect_when_started(const std::string& id) {
        auto deadline = core::Clock::now() + WAIT_LIMIT;
        while (receiver_progress(id) == 0.0 && core::Clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        ASSERT_GT(receiver_progress(id), 0.0);
        std::lock_guard<std::mutex> lock(receivers_mutex_);
        receiver_channels_[id]->close();
    }

    void expect_received(const std::string& id) {
        std::unique_ptr<SessionTask> task;
        {
            std::lock_guard<std::mutex> lock(receivers_mutex_);
            task = std::move(receivers_[id]);
        }
        ASSERT_NE(task, nullptr) << id;
        ASSERT_TRUE(task->wait(WAIT_LIMIT)) << id;
        auto receiver = task->release();
        ASSERT_NE(receiver, nullptr) << id;
        auto received = receiver->take_received_file();
        ASSERT_TRUE(received.has_value()) << id;
        EXPECT_TRUE(*received == content_) << id;
    }

    void run_with_disconnect(std::size_t count) {
        // Past the first burst the paced recipient needs seconds, so the link drops mid-transfer
        content_.resize(100 * CHUNK);
        auto list = recipients(count);
        list[0].bandwidth_limit = 64 * 1024;

        GroupOrchestrator group(group_options());
        ASSERT_TRUE(group.start(source(), "report.bin", list, connector()));
        disconnect_when_started("peer-0");
        ASSERT_TRUE(group.wait(WAIT_LIMIT));

        auto result = group.get_result();
        EXPECT_EQ(result.outcome, GroupOutcome::PARTIAL);
        EXPECT_EQ(result.succeeded.size(), count - 1);
        ASSERT_EQ(result.failed.size(), 1u);
        EXPECT_EQ(result.failed[0].recipient_id, "peer-0");
        EXPECT_EQ(result.failed[0].error, TransferError::CONNECTION_LOST);
        for (std::size_t i = 1; i < count; ++i) {
            expect_received("peer-" + std::to_string(i));
        }
    }

    std::vector<Recipient> recipients(std::size_t count) {
        std::vector<Recipient> list;
        for (std::size_t i = 0; i < count; ++i) {
            list.push_back(Recipient{"peer-" + std::to_string(i), "Peer " + std::to_string(i), std::nullopt});
        }
        return list;
    }

    std::vector<RecipientOutcome> outcome_events() {
        std::vector<RecipientOutcome> outcomes;
        for (auto& event : events_->drain()) {
            if (auto* outcome = std::get_if<RecipientOutcome>(&event)) {
                outcomes.push_back(*outcome);
            }
        }
        return outcomes;
    }

    std::shared_ptr<EventQueue> events_;
    std::vector<std::uint8_t> content_;
    std::set<std::string> unreachable_;
    std::map<std::string, std::shared_future<void>> gates_;
    std::mutex receivers_mutex_;
    std::map<std::string, std::unique_ptr<SessionTask>> receivers_;
    std::map<std::string, std::shared_ptr<network::LoopbackChannel>> receiver_channels_;
};

TEST_F(GroupOrchestratorTest, Validate_RecipientRules) {
    EXPECT_TRUE(GroupOrchestrator::validate(recipients(3), 10));
    EXPECT_TRUE(GroupOrchestrator::validate(recipients(10), 10));

    EXPECT_EQ(GroupOrchestrator::validate({}, 10).error, TransferError::INVALID_RECIPIENT);
    EXPECT_EQ(GroupOrchestrator::validate(recipients(11), 10).error, TransferError::INVALID_RECIPIENT);

    auto duplicate = recipients(2);
    duplicate[1].id = duplicate[0].id;
    EXPECT_EQ(GroupOrchestrator::validate(duplicate, 10).error, TransferError::INVALID_RECIPIENT);

    EXPECT_TRUE(GroupOrchestrator::is_valid_recipient_id("alice_01-laptop"));
    EXPECT_FALSE(GroupOrchestrator::is_valid_recipient_id(""));
    EXPECT_FALSE(GroupOrchestrator::is_valid_recipient_id("alice laptop"));
    EXPECT_FALSE(GroupOrchestrator::is_valid_recipient_id(std::string(65, 'a')));

    EXPECT_TRUE(GroupOrchestrator::is_valid_recipient_name("Alice Laptop"));
    EXPECT_FALSE(GroupOrchestrator::is_valid_recipient_name(""));
    EXPECT_FALSE(GroupOrchestrator::is_valid_recipient_name("Alice!"));
    EXPECT_FALSE(GroupOrchestrator::is_valid_recipient_name(std::string(101, 'a')));
}

TEST_F(GroupOrchestratorTest, Start_RejectsInvalidGroupUpFront) {
    GroupOrchestrator group(group_options());
    auto list = recipients(2);
    list[1].name = "bad/name";

    auto result = group.start(source(), "report.bin", list, connector());
    EXPECT_EQ(result.error, TransferError::INVALID_RECIPIENT);
    // No session was opened for the valid recipient either
    EXPECT_TRUE(receivers_.empty());
    EXPECT_TRUE(group.get_result().recipients.empty());
}

TEST_F(GroupOrchestratorTest, Group_AllRecipientsComplete) {
    GroupOrchestrator group(group_options());
    ASSERT_TRUE(group.start(source(), "report.bin", recipients(3), connector()));
    EXPECT_EQ(group.start(source(), "report.bin", recipients(1), connector()).error,
              TransferError::INVALID_STATE);

    ASSERT_TRUE(group.wait(WAIT_LIMIT));
    auto result = group.get_result();
    EXPECT_EQ(result.outcome, GroupOutcome::COMPLETED);
    EXPECT_EQ(result.succeeded.size(), 3u);
    EXPECT_TRUE(result.failed.empty());
    EXPECT_EQ(result.group_id, group.get_group_id());
    EXPECT_DOUBLE_EQ(group.get_progress(), 1.0);

    std::set<std::string> sessions;
    for (const auto& report : result.recipients) {
        EXPECT_EQ(report.status, RecipientStatus::SUCCEEDED);
        sessions.insert(report.session_id);
    }
    // Independent sessions, one per recipient
    EXPECT_EQ(sessions.size(), 3u);

    EXPECT_EQ(outcome_events().size(), 3u);
    for (const auto& id : {"peer-0", "peer-1", "peer-2"}) {
        expect_received(id);
    }
}

TEST_F(GroupOrchestratorTest, Group_UnreachableRecipientIsPartial) {
    unreachable_.insert("peer-1");
    GroupOrchestrator group(group_options());
    ASSERT_TRUE(group.start(source(), "report.bin", recipients(3), connector()));
    ASSERT_TRUE(group.wait(WAIT_LIMIT));

    auto result = group.get_result();
    EXPECT_EQ(result.outcome, GroupOutcome::PARTIAL);
    EXPECT_EQ(result.succeeded.size(), 2u);
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].recipient_id, "peer-1");
    EXPECT_EQ(result.failed[0].error, TransferError::CONNECTION_LOST);
    EXPECT_EQ(result.failed[0].reason, "Recipient unreachable");
    // The unreachable recipient still counts, at the progress it reached
    EXPECT_NEAR(group.get_progress(), 2.0 / 3.0, 1e-9);

    auto outcomes = outcome_events();
    ASSERT_EQ(outcomes.size(), 3u);
    auto failed = std::count_if(outcomes.begin(), outcomes.end(),
                                [](const RecipientOutcome& outcome) { return !outcome.success; });
    EXPECT_EQ(failed, 1);
}

TEST_F(GroupOrchestratorTest, Group_NobodyReachableFails) {
    unreachable_ = {"peer-0", "peer-1"};
    GroupOrchestrator group(group_options());
    ASSERT_TRUE(group.start(source(), "report.bin", recipients(2), connector()));
    ASSERT_TRUE(group.wait(WAIT_LIMIT));

    auto result = group.get_result();
    EXPECT_EQ(result.outcome, GroupOutcome::FAILED);
    EXPECT_EQ(result.failed.size(), 2u);
    EXPECT_DOUBLE_EQ(group.get_progress(), 0.0);
}

TEST_F(GroupOrchestratorTest, Group_CancelOneRecipient) {
    // Past the first burst the paced recipient needs minutes, so it is still running when cancelled
    content_.resize(400 * CHUNK);
    auto list = recipients(2);
    list[1].bandwidth_limit = 64 * 1024;

    GroupOrchestrator group(group_options());
    ASSERT_TRUE(group.start(source(), "report.bin", list, connector()));
    EXPECT_TRUE(group.cancel_recipient("peer-1"));
    EXPECT_FALSE(group.cancel_recipient("nobody"));
    ASSERT_TRUE(group.wait(WAIT_LIMIT));

    auto result = group.get_result();
    EXPECT_EQ(result.outcome, GroupOutcome::PARTIAL);
    ASSERT_EQ(result.succeeded.size(), 1u);
    EXPECT_EQ(result.succeeded[0], "peer-0");
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].error, TransferError::CANCELLED);
}

TEST_F(GroupOrchestratorTest, Group_SlowRecipientDoesNotBlockOthers) {
    std::promise<void> release;
    gates_["peer-0"] = release.get_future().share();
    // Declared after the group, so the gate opens before the group joins its setup threads
    struct Opener {
        std::promise<void>& gate;
        bool opened = false;
        void open() {
            if (!opened) {
                opened = true;
                gate.set_value();
            }
        }
        ~Opener() { open(); }
    };

    GroupOrchestrator group(group_options());
    Opener opener{release};
    ASSERT_TRUE(group.start(source(), "report.bin", recipients(3), connector()));

    // The other two finish while peer-0 is still connecting
    auto deadline = core::Clock::now() + WAIT_LIMIT;
    while (group.get_result().succeeded.size() < 2 && core::Clock::now() < deadline) {
        EXPECT_FALSE(group.wait(std::chrono::milliseconds(20)));
    }
    auto result = group.get_result();
    ASSERT_EQ(result.succeeded.size(), 2u);
    EXPECT_EQ(result.recipients[0].status, RecipientStatus::PENDING);
    EXPECT_EQ(result.recipients[1].status, RecipientStatus::SUCCEEDED);
    EXPECT_EQ(result.recipients[2].status, RecipientStatus::SUCCEEDED);

    opener.open();
    ASSERT_TRUE(group.wait(WAIT_LIMIT));
    EXPECT_EQ(group.get_result().outcome, GroupOutcome::COMPLETED);
    expect_received("peer-0");
}

TEST_F(GroupOrchestratorTest, Group_DisconnectedRecipientOthersComplete) {
    run_with_disconnect(3);
}

TEST_F(GroupOrchestratorTest, Group_DisconnectAmongTenRecipients) {
    run_with_disconnect(10);
}

TEST_F(GroupOrchestratorTest, Group_CancelWhileConnecting) {
    std::promise<void> release;
    gates_["peer-1"] = release.get_future().share();

    GroupOrchestrator group(group_options());
    ASSERT_TRUE(group.start(source(), "report.bin", recipients(2), connector()));
    EXPECT_TRUE(group.cancel_recipient("peer-1"));
    release.set_value();
    ASSERT_TRUE(group.wait(WAIT_LIMIT));

    auto result = group.get_result();
    EXPECT_EQ(result.outcome, GroupOutcome::PARTIAL);
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].recipient_id, "peer-1");
    EXPECT_EQ(result.failed[0].error, TransferError::CANCELLED);
}
