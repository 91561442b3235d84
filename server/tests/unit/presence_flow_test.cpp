#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "mudlink/api_response.hpp"
#include "mudlink/realtime.hpp"
#include "support/recording_sink.hpp"

namespace {

using mudlink::test_support::MakeSink;
using mudlink::test_support::RecordingSink;

class PresenceFlowTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto cfg = mudlink::DefaultConfig();
    cfg.node_id = "node-test";
    cfg.pending_max_per_identity = 20;
    cfg.rate_limit_location = 100;
    observability_ = std::make_shared<mudlink::Observability>(mudlink::LogLevel::kError, &log_);
    world_ = std::make_shared<mudlink::InMemoryWorld>();
    mutes_ = std::make_shared<mudlink::InMemoryMuteList>();
    broker_ = std::make_shared<mudlink::InProcessBroker>(io_.get_executor());
    coordinator_ = std::make_shared<mudlink::RealtimeCoordinator>(io_.get_executor(), cfg, world_, mutes_, broker_,
                                                                  observability_);
  }

  mudlink::AcceptResult Accept(const std::string& identity, const std::string& session,
                               const std::shared_ptr<RecordingSink>& sink) {
    return coordinator_->AcceptConnection(identity, mudlink::TransportKind::kBidirectionalSocket, session, sink);
  }

  static std::size_t PresenceAbout(const RecordingSink& sink, const std::string& identity) {
    std::size_t count = 0;
    for (const auto& message : sink.Messages()) {
      if (message.event.rfind("presence.", 0) == 0 && message.payload["identity"] == identity) {
        ++count;
      }
    }
    return count;
  }

  boost::asio::io_context io_;
  std::ostringstream log_;
  std::shared_ptr<mudlink::Observability> observability_;
  std::shared_ptr<mudlink::InMemoryWorld> world_;
  std::shared_ptr<mudlink::InMemoryMuteList> mutes_;
  std::shared_ptr<mudlink::InProcessBroker> broker_;
  std::shared_ptr<mudlink::RealtimeCoordinator> coordinator_;
};

TEST_F(PresenceFlowTest, SessionReplacementIsSeenAsLeftThenEntered) {
  world_->Place("alice", "town");
  world_->Place("bob", "town");
  auto bob = MakeSink();
  auto alice_old = MakeSink();
  ASSERT_TRUE(Accept("bob", "s-bob", bob).accepted());
  ASSERT_TRUE(Accept("alice", "s1", alice_old).accepted());

  auto entered = bob->EventsNamed("presence.entered");
  ASSERT_EQ(entered.size(), 1u);
  EXPECT_EQ(entered[0].payload["identity"], "alice");
  EXPECT_EQ(entered[0].payload["location"], "town");
  bob->Clear();

  auto alice_new = MakeSink();
  auto result = Accept("alice", "s2", alice_new);
  ASSERT_TRUE(result.accepted());
  EXPECT_EQ(result.evicted, 1u);

  auto messages = bob->Messages();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].event, "presence.left");
  EXPECT_EQ(messages[0].payload["identity"], "alice");
  EXPECT_EQ(messages[1].event, "presence.entered");
  EXPECT_EQ(messages[1].payload["identity"], "alice");
  EXPECT_LT(messages[0].seq, messages[1].seq);

  ASSERT_EQ(alice_old->Closes().size(), 1u);
  EXPECT_EQ(alice_old->Closes()[0], "session_replaced");
  EXPECT_EQ(PresenceAbout(*alice_old, "alice"), 0u);
  EXPECT_EQ(PresenceAbout(*alice_new, "alice"), 0u);

  auto stale = Accept("alice", "s1", MakeSink());
  EXPECT_FALSE(stale.accepted());
  EXPECT_EQ(observability_->Snapshot().rejected_connections, 1u);
}

TEST_F(PresenceFlowTest, OfflineOverflowKeepsMostRecentAndDrainsOnce) {
  world_->Place("alice", "town");
  world_->Place("carol", "town");
  ASSERT_TRUE(Accept("alice", "s-alice", MakeSink()).accepted());
  auto carol_first = Accept("carol", "s-carol", MakeSink());
  ASSERT_TRUE(carol_first.accepted());
  coordinator_->OnConnectionClosed(carol_first.handle->connection_id);

  for (int i = 0; i < 30; ++i) {
    auto report = coordinator_->Send("alice", mudlink::ChannelKind::kLocation, "m" + std::to_string(i));
    ASSERT_EQ(report.result, mudlink::SendResult::kDelivered);
  }
  EXPECT_EQ(coordinator_->Pending()->Size("carol"), 20u);

  auto carol = MakeSink();
  auto back = Accept("carol", "s-carol", carol);
  ASSERT_TRUE(back.accepted());
  EXPECT_EQ(back.drained, 20u);
  auto messages = carol->EventsNamed("chat.message");
  ASSERT_EQ(messages.size(), 20u);
  EXPECT_EQ(messages.front().payload["message"], "m10");
  EXPECT_EQ(messages.back().payload["message"], "m29");

  auto second_tab = Accept("carol", "s-carol", MakeSink());
  ASSERT_TRUE(second_tab.accepted());
  EXPECT_EQ(second_tab.drained, 0u);
}

TEST_F(PresenceFlowTest, OfflineRecipientReceivesQueuedPresenceButNeverItsOwn) {
  world_->Place("alice", "town");
  world_->Place("bob", "town");
  auto bob_first = Accept("bob", "s-bob", MakeSink());
  ASSERT_TRUE(bob_first.accepted());
  coordinator_->OnConnectionClosed(bob_first.handle->connection_id);

  ASSERT_TRUE(Accept("alice", "s1", MakeSink()).accepted());
  ASSERT_TRUE(Accept("alice", "s2", MakeSink()).accepted());

  auto bob = MakeSink();
  auto back = Accept("bob", "s-bob", bob);
  ASSERT_TRUE(back.accepted());
  EXPECT_EQ(back.drained, 3u);
  auto messages = bob->Messages();
  ASSERT_EQ(messages.size(), 3u);
  EXPECT_EQ(messages[0].event, "presence.entered");
  EXPECT_EQ(messages[1].event, "presence.left");
  EXPECT_EQ(messages[2].event, "presence.entered");
  EXPECT_EQ(PresenceAbout(*bob, "bob"), 0u);
}

TEST_F(PresenceFlowTest, DirectMessageExistenceIsHidden) {
  auto alice = MakeSink();
  auto carol = MakeSink();
  ASSERT_TRUE(Accept("alice", "s-alice", alice).accepted());
  ASSERT_TRUE(Accept("carol", "s-carol", carol).accepted());
  mutes_->Mute("carol", "alice");

  auto muted = coordinator_->Send("alice", mudlink::ChannelKind::kDirect, "hi", std::string("carol"));
  auto missing = coordinator_->Send("alice", mudlink::ChannelKind::kDirect, "hi", std::string("nobody"));
  EXPECT_EQ(muted.result, mudlink::SendResult::kMuted);
  EXPECT_EQ(missing.result, mudlink::SendResult::kNoSuchTarget);
  EXPECT_EQ(mudlink::RenderSendResult(muted.result), mudlink::RenderSendResult(missing.result));
  EXPECT_EQ(mudlink::RenderSendResult(muted.result)["result"], "sent_into_void");
  EXPECT_TRUE(carol->EventsNamed("chat.message").empty());
}

TEST_F(PresenceFlowTest, ReplyGoesToLastDirectSender) {
  auto alice = MakeSink();
  auto bob = MakeSink();
  ASSERT_TRUE(Accept("alice", "s-alice", alice).accepted());
  ASSERT_TRUE(Accept("bob", "s-bob", bob).accepted());

  EXPECT_EQ(coordinator_->Reply("bob", "anyone?").result, mudlink::SendResult::kNoSuchTarget);
  ASSERT_EQ(coordinator_->Send("alice", mudlink::ChannelKind::kDirect, "psst", std::string("bob")).result,
            mudlink::SendResult::kDelivered);

  auto reply = coordinator_->Reply("bob", "what?");
  EXPECT_EQ(reply.result, mudlink::SendResult::kDelivered);
  auto received = alice->EventsNamed("chat.message");
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].payload["sender"], "bob");
  EXPECT_EQ(received[0].payload["message"], "what?");
  EXPECT_EQ(bob->EventsNamed("chat.message").size(), 2u);
}

TEST_F(PresenceFlowTest, SystemAnnouncementReachesEveryoneOnline) {
  auto alice = MakeSink();
  auto bob = MakeSink();
  ASSERT_TRUE(Accept("alice", "s-alice", alice).accepted());
  ASSERT_TRUE(Accept("bob", "s-bob", bob).accepted());
  mutes_->MuteChannel("bob", mudlink::ChannelKind::kSystem);

  auto report = coordinator_->SystemAnnounce("maintenance at noon");
  EXPECT_EQ(report.result, mudlink::SendResult::kDelivered);
  EXPECT_EQ(report.delivered_live, 2u);
  auto received = bob->EventsNamed("chat.message");
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].payload["sender"], mudlink::kSystemSender);
  EXPECT_EQ(received[0].payload["channel"], "system");
}

TEST_F(PresenceFlowTest, InspectDescribesIdentity) {
  world_->Place("alice", "town");
  ASSERT_TRUE(Accept("alice", "s-alice", MakeSink()).accepted());

  auto view = coordinator_->Inspect("alice");
  EXPECT_TRUE(view["online"].get<bool>());
  EXPECT_EQ(view["connectionCount"], 1);
  EXPECT_EQ(view["sessionId"], "s-alice");
  EXPECT_EQ(view["subscribedLocation"], "town");
  EXPECT_EQ(view["connections"].size(), 1u);
  EXPECT_TRUE(view["connections"][0]["healthy"].get<bool>());

  auto stats = coordinator_->Stats();
  EXPECT_EQ(stats["connections"]["total"], 1);
  EXPECT_EQ(stats["broker"]["nodeId"], "node-test");
}

TEST_F(PresenceFlowTest, LocationSyncDoesNotRepeatPresence) {
  world_->Place("alice", "town");
  world_->Place("bob", "town");
  auto bob = MakeSink();
  ASSERT_TRUE(Accept("bob", "s-bob", bob).accepted());
  ASSERT_TRUE(Accept("alice", "s-alice", MakeSink()).accepted());
  ASSERT_EQ(PresenceAbout(*bob, "alice"), 1u);
  const auto events_before = observability_->Snapshot().presence_events;

  coordinator_->OnLocationSynced("alice", "town");
  world_->Place("alice", "market");
  coordinator_->OnLocationSynced("alice", "market");
  world_->Place("alice", "town");
  coordinator_->OnLocationSynced("alice", "town");

  EXPECT_EQ(PresenceAbout(*bob, "alice"), 1u);
  EXPECT_EQ(bob->EventsNamed("presence.entered").size(), 1u);
  EXPECT_EQ(observability_->Snapshot().presence_events, events_before);
}

TEST_F(PresenceFlowTest, ReconnectUnderTrafficLeavesNothingQueuedWhileOnline) {
  auto cfg = mudlink::DefaultConfig();
  cfg.node_id = "node-busy";
  cfg.rate_limit_location = 10000000;
  auto coordinator = std::make_shared<mudlink::RealtimeCoordinator>(io_.get_executor(), cfg, world_, mutes_,
                                                                    broker_, observability_);
  world_->Place("alice", "town");
  world_->Place("carol", "town");
  ASSERT_TRUE(coordinator->AcceptConnection("alice", mudlink::TransportKind::kBidirectionalSocket, "s-alice",
                                            MakeSink())
                  .accepted());

  std::atomic<bool> stop{false};
  std::thread sender([&]() {
    std::size_t n = 0;
    while (!stop.load()) {
      coordinator->Send("alice", mudlink::ChannelKind::kLocation, "tick " + std::to_string(n++));
    }
  });

  std::size_t stranded = 0;
  for (int cycle = 0; cycle < 2000; ++cycle) {
    auto sink = MakeSink();
    auto result = coordinator->AcceptConnection("carol", mudlink::TransportKind::kServerPushStream, "s-carol", sink);
    if (!result.accepted()) {
      ADD_FAILURE() << "carol rejected on cycle " << cycle;
      break;
    }
    std::this_thread::sleep_for(std::chrono::microseconds(50));
    if (coordinator->Registry()->Presence("carol").online && coordinator->Pending()->Size("carol") > 0) {
      ++stranded;
    }
    coordinator->OnConnectionClosed(result.handle->connection_id);
  }
  stop.store(true);
  sender.join();

  EXPECT_EQ(stranded, 0u);
}

}  // namespace
