#include <chrono>
#include <memory>
#include <sstream>
#include <string>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "mudlink/realtime.hpp"
#include "support/recording_sink.hpp"

namespace {

using mudlink::test_support::MakeSink;
using mudlink::test_support::RecordingSink;

class BrokerBridgeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    observability_ = std::make_shared<mudlink::Observability>(mudlink::LogLevel::kError, &log_);
    world_ = std::make_shared<mudlink::InMemoryWorld>();
    broker_ = std::make_shared<mudlink::InProcessBroker>(io_.get_executor());
    node_a_ = MakeNode("node-a");
    node_b_ = MakeNode("node-b");
    node_a_->Bridge()->Start();
    node_b_->Bridge()->Start();
  }

  void TearDown() override {
    node_a_->Bridge()->Stop();
    node_b_->Bridge()->Stop();
    io_.restart();
    io_.poll();
  }

  std::shared_ptr<mudlink::RealtimeCoordinator> MakeNode(const std::string& node_id) {
    auto cfg = mudlink::DefaultConfig();
    cfg.node_id = node_id;
    return std::make_shared<mudlink::RealtimeCoordinator>(io_.get_executor(), cfg, world_,
                                                          std::make_shared<mudlink::InMemoryMuteList>(), broker_,
                                                          observability_);
  }

  std::shared_ptr<RecordingSink> Join(mudlink::RealtimeCoordinator& node, const std::string& identity,
                                      mudlink::ConnectionId* id = nullptr) {
    auto sink = MakeSink();
    auto result =
        node.AcceptConnection(identity, mudlink::TransportKind::kBidirectionalSocket, "s-" + identity, sink);
    if (id && result.handle) {
      *id = result.handle->connection_id;
    }
    return sink;
  }

  void Pump() {
    io_.restart();
    io_.poll();
  }

  boost::asio::io_context io_;
  std::ostringstream log_;
  std::shared_ptr<mudlink::Observability> observability_;
  std::shared_ptr<mudlink::InMemoryWorld> world_;
  std::shared_ptr<mudlink::InProcessBroker> broker_;
  std::shared_ptr<mudlink::RealtimeCoordinator> node_a_;
  std::shared_ptr<mudlink::RealtimeCoordinator> node_b_;
};

TEST_F(BrokerBridgeTest, LocationMessageReachesOccupantsOnOtherNode) {
  world_->Place("alice", "town");
  world_->Place("bob", "town");
  auto alice = Join(*node_a_, "alice");
  auto bob = Join(*node_b_, "bob");

  auto report = node_a_->Send("alice", mudlink::ChannelKind::kLocation, "hi");
  ASSERT_EQ(report.result, mudlink::SendResult::kDelivered);
  ASSERT_TRUE(report.message.has_value());
  Pump();

  auto received = bob->EventsNamed("chat.message");
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].payload["sender"], "alice");
  EXPECT_EQ(received[0].payload["message"], "hi");
  EXPECT_EQ(received[0].payload["location"], "town");
  EXPECT_EQ(received[0].payload["messageId"], report.message->payload["messageId"]);
  EXPECT_TRUE(alice->EventsNamed("chat.message").empty());

  EXPECT_EQ(node_a_->Bridge()->Stats().echoes_ignored, 1u);
  EXPECT_EQ(node_b_->Bridge()->Stats().relayed_in, 1u);
  EXPECT_EQ(node_b_->Bridge()->Stats().published, 0u);
}

TEST_F(BrokerBridgeTest, GlobalAndSystemRelayAcrossNodes) {
  auto alice = Join(*node_a_, "alice");
  auto bob = Join(*node_b_, "bob");

  node_a_->Send("alice", mudlink::ChannelKind::kBroadcast, "hear ye");
  Pump();
  ASSERT_EQ(bob->EventsNamed("chat.message").size(), 1u);
  EXPECT_TRUE(alice->EventsNamed("chat.message").empty());

  ASSERT_TRUE(broker_->Publish("chat.system", {{"origin", "node-ops"},
                                                {"messageId", "sys-1"},
                                                {"channel", "system"},
                                                {"sender", "system"},
                                                {"message", "restart"}}));
  Pump();
  EXPECT_EQ(alice->EventsNamed("chat.message").size(), 1u);
  EXPECT_EQ(bob->EventsNamed("chat.message").size(), 2u);
}

TEST_F(BrokerBridgeTest, DirectMessageAndReplyCrossNodes) {
  world_->Place("alice", "town");
  world_->Place("bob", "dock");
  auto alice = Join(*node_a_, "alice");
  auto bob = Join(*node_b_, "bob");

  auto sent = node_a_->Send("alice", mudlink::ChannelKind::kDirect, "psst", std::string("bob"));
  EXPECT_EQ(sent.result, mudlink::SendResult::kDelivered);
  Pump();
  auto whispered = bob->EventsNamed("chat.message");
  ASSERT_EQ(whispered.size(), 1u);
  EXPECT_EQ(whispered[0].payload["target"], "bob");

  auto reply = node_b_->Reply("bob", "who is this?");
  EXPECT_EQ(reply.result, mudlink::SendResult::kDelivered);
  Pump();
  auto replies = alice->EventsNamed("chat.message");
  ASSERT_EQ(replies.size(), 1u);
  EXPECT_EQ(replies[0].payload["sender"], "bob");
}

TEST_F(BrokerBridgeTest, LocationSubscriptionsFollowMovesWithRefCounts) {
  world_->Place("alice", "town");
  world_->Place("carol", "town");
  Join(*node_a_, "alice");
  mudlink::ConnectionId carol_id;
  Join(*node_a_, "carol", &carol_id);
  auto bridge = node_a_->Bridge();
  EXPECT_EQ(bridge->SubjectRefCount("chat.location.town"), 2u);

  world_->Place("alice", "dock");
  node_a_->OnLocationSynced("alice", std::string("dock"));
  EXPECT_EQ(bridge->SubjectRefCount("chat.location.town"), 1u);
  EXPECT_EQ(bridge->SubjectRefCount("chat.location.dock"), 1u);
  EXPECT_EQ(bridge->SubscribedLocation("alice").value_or(""), "dock");

  node_a_->OnConnectionClosed(carol_id);
  EXPECT_EQ(bridge->SubjectRefCount("chat.location.town"), 0u);
  EXPECT_EQ(bridge->SubjectRefCount("chat.direct.carol"), 0u);

  world_->Remove("alice");
  node_a_->OnLocationSynced("alice", std::nullopt);
  EXPECT_EQ(bridge->SubjectRefCount("chat.location.dock"), 0u);
  EXPECT_FALSE(bridge->SubscribedLocation("alice").has_value());
  EXPECT_EQ(bridge->SubjectRefCount("chat.direct.alice"), 1u);
  EXPECT_EQ(bridge->Stats().subscribed_subjects, 3u);
}

TEST_F(BrokerBridgeTest, OutageIsRetriedWithBackoff) {
  auto bob = Join(*node_b_, "bob");
  broker_->SetAvailable(false);
  Join(*node_a_, "alice");
  auto report = node_a_->Send("alice", mudlink::ChannelKind::kBroadcast, "are you there?");
  EXPECT_EQ(report.result, mudlink::SendResult::kDelivered);

  auto stats = node_a_->Bridge()->Stats();
  EXPECT_EQ(stats.retry_queue, 2u);
  EXPECT_FALSE(stats.connected);
  EXPECT_GE(observability_->Snapshot().broker_failures, 2u);

  io_.restart();
  io_.run_for(std::chrono::milliseconds(150));
  EXPECT_EQ(node_a_->Bridge()->Stats().retry_queue, 2u);
  EXPECT_TRUE(bob->EventsNamed("chat.message").empty());

  broker_->SetAvailable(true);
  io_.restart();
  io_.run_for(std::chrono::milliseconds(1000));
  EXPECT_EQ(node_a_->Bridge()->Stats().retry_queue, 0u);
  EXPECT_EQ(node_a_->Bridge()->Stats().published, 1u);
  EXPECT_EQ(bob->EventsNamed("chat.message").size(), 1u);
  EXPECT_EQ(node_a_->Bridge()->SubjectRefCount("chat.direct.alice"), 1u);
}

TEST_F(BrokerBridgeTest, MalformedInboundMessagesAreIgnored) {
  auto bob = Join(*node_b_, "bob");
  ASSERT_TRUE(broker_->Publish("chat.global", nlohmann::json::array()));
  ASSERT_TRUE(broker_->Publish("chat.global", {{"origin", "node-x"}, {"message", "no sender"}}));
  Pump();
  EXPECT_TRUE(bob->EventsNamed("chat.message").empty());
  EXPECT_EQ(node_b_->Bridge()->Stats().relayed_in, 0u);
}

TEST_F(BrokerBridgeTest, StopReleasesBrokerSubscriptions) {
  Join(*node_a_, "alice");
  EXPECT_GT(broker_->SubscriptionCount(), 0u);
  node_a_->Bridge()->Stop();
  node_b_->Bridge()->Stop();
  EXPECT_EQ(broker_->SubscriptionCount(), 0u);
  EXPECT_EQ(node_a_->Bridge()->Stats().subscribed_subjects, 0u);
}

}  // namespace
