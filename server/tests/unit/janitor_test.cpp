#include <chrono>
#include <memory>
#include <optional>
#include <sstream>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "mudlink/janitor.hpp"
#include "support/recording_sink.hpp"

namespace {

using mudlink::test_support::MakeSink;

class JanitorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    observability_ = std::make_shared<mudlink::Observability>(mudlink::LogLevel::kError, &log_);
    registry_ = std::make_shared<mudlink::ConnectionRegistry>();
    pending_ = std::make_shared<mudlink::PendingMessageBuffer>(
        mudlink::PendingBufferConfig{50, std::chrono::seconds(60)});
    limiter_ = std::make_shared<mudlink::ChannelRateLimiter>(mudlink::RateLimitConfig{});
    world_ = std::make_shared<mudlink::InMemoryWorld>();
    router_ = std::make_shared<mudlink::ChannelRouter>(registry_, world_, mudlink::SubjectNamer(),
                                                       std::chrono::seconds(60));
    config_.max_pending_per_identity = 2;
    config_.max_rate_limit_entries = 1;
    janitor_ = std::make_shared<mudlink::Janitor>(io_.get_executor(), registry_, pending_, limiter_, router_,
                                                  observability_, config_,
                                                  [this]() -> std::optional<double> { return ratio_; });
  }

  mudlink::OutboundMessage Message() { return mudlink::OutboundMessage{"chat.message", 1, {{"message", "x"}}}; }

  boost::asio::io_context io_;
  std::ostringstream log_;
  std::optional<double> ratio_{0.1};
  mudlink::JanitorConfig config_;
  std::shared_ptr<mudlink::Observability> observability_;
  std::shared_ptr<mudlink::ConnectionRegistry> registry_;
  std::shared_ptr<mudlink::PendingMessageBuffer> pending_;
  std::shared_ptr<mudlink::ChannelRateLimiter> limiter_;
  std::shared_ptr<mudlink::InMemoryWorld> world_;
  std::shared_ptr<mudlink::ChannelRouter> router_;
  std::shared_ptr<mudlink::Janitor> janitor_;
  const mudlink::Clock::time_point t0_ = mudlink::Clock::now();
};

TEST_F(JanitorTest, ClosesIdleConnections) {
  auto idle = MakeSink();
  registry_->Register("alice", mudlink::TransportKind::kBidirectionalSocket, "s1", idle, t0_);
  auto active = registry_->Register("bob", mudlink::TransportKind::kServerPushStream, "s1", MakeSink(), t0_);
  registry_->Touch(*active.connection_id, t0_ + std::chrono::seconds(250));

  auto report = janitor_->Sweep(mudlink::SweepTrigger::kForced, t0_ + std::chrono::seconds(301));
  EXPECT_EQ(report.stale_connections_closed, 1u);
  ASSERT_EQ(idle->Closes().size(), 1u);
  EXPECT_EQ(idle->Closes()[0], "idle_timeout");
  EXPECT_FALSE(registry_->Presence("alice").online);
  EXPECT_TRUE(registry_->Presence("bob").online);
}

TEST_F(JanitorTest, EvictsExpiredPendingAndRateBuckets) {
  pending_->Enqueue("bob", Message(), t0_);
  limiter_->Admit("bob", mudlink::ChannelKind::kLocation, t0_);

  auto report = janitor_->Sweep(mudlink::SweepTrigger::kScheduled, t0_ + std::chrono::seconds(120));
  EXPECT_EQ(report.pending_expired, 1u);
  EXPECT_EQ(report.rate_buckets_expired, 1u);
  EXPECT_EQ(pending_->Size("bob"), 0u);
  EXPECT_EQ(limiter_->Stats().tracked_buckets, 0u);
}

TEST_F(JanitorTest, CapsCollectionsOldestFirst) {
  for (int i = 0; i < 5; ++i) {
    pending_->Enqueue("bob", Message(), t0_);
  }
  limiter_->Admit("a", mudlink::ChannelKind::kLocation, t0_);
  limiter_->Admit("b", mudlink::ChannelKind::kLocation, t0_ + std::chrono::seconds(1));
  limiter_->Admit("c", mudlink::ChannelKind::kLocation, t0_ + std::chrono::seconds(2));

  auto report = janitor_->Sweep(mudlink::SweepTrigger::kForced, t0_ + std::chrono::seconds(3));
  EXPECT_EQ(report.pending_capped, 3u);
  EXPECT_EQ(report.rate_buckets_capped, 2u);
  EXPECT_EQ(pending_->Size("bob"), 2u);
  EXPECT_EQ(limiter_->Stats().tracked_identities, 1u);
}

TEST_F(JanitorTest, PrunesLongOfflineIdentities) {
  auto alice = registry_->Register("alice", mudlink::TransportKind::kBidirectionalSocket, "s1", MakeSink(), t0_);
  registry_->Unregister(*alice.connection_id, t0_);
  router_->NoteDirectDelivery("bob", "alice", t0_);

  auto report = janitor_->Sweep(mudlink::SweepTrigger::kForced, t0_ + std::chrono::seconds(901));
  EXPECT_EQ(report.identities_pruned, 1u);
  EXPECT_EQ(report.reply_entries_pruned, 1u);
  EXPECT_FALSE(registry_->IsKnown("alice"));
  EXPECT_EQ(router_->ReplyBookSize(), 0u);
  EXPECT_EQ(report.TotalEvictions(), 1u);
  EXPECT_EQ(observability_->Snapshot().janitor_evictions, 1u);
}

TEST_F(JanitorTest, ProbeSweepsOnMemoryPressure) {
  const auto now = mudlink::Clock::now();
  EXPECT_FALSE(janitor_->ProbeOnce(now).has_value());

  ratio_ = 0.95;
  auto report = janitor_->ProbeOnce(now);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->trigger, mudlink::SweepTrigger::kMemoryPressure);
  EXPECT_DOUBLE_EQ(report->memory_ratio.value_or(0.0), 0.95);

  ratio_ = std::nullopt;
  EXPECT_FALSE(janitor_->ProbeOnce(now).has_value());

  auto scheduled = janitor_->ProbeOnce(now + config_.interval);
  ASSERT_TRUE(scheduled.has_value());
  EXPECT_EQ(scheduled->trigger, mudlink::SweepTrigger::kScheduled);

  auto stats = janitor_->Stats();
  EXPECT_EQ(stats.pressure_sweeps, 1u);
  EXPECT_EQ(stats.scheduled_sweeps, 1u);
  EXPECT_EQ(stats.forced_sweeps, 0u);
  ASSERT_TRUE(stats.last_report.has_value());
  EXPECT_EQ(stats.last_report->trigger, mudlink::SweepTrigger::kScheduled);
}

TEST_F(JanitorTest, ReportSerializesForOperators) {
  auto report = janitor_->ForceCleanup();
  auto json = report.ToJson();
  EXPECT_EQ(json["trigger"], "forced");
  EXPECT_TRUE(json.contains("staleConnectionsClosed"));
  EXPECT_TRUE(json.contains("identitiesPruned"));
  EXPECT_TRUE(json.contains("durationMs"));
  EXPECT_DOUBLE_EQ(json["memoryRatio"].get<double>(), 0.1);
  EXPECT_EQ(janitor_->Stats().forced_sweeps, 1u);
}

TEST(MemoryProbeTest, ReadsProcessRatio) {
  auto ratio = mudlink::ReadProcessMemoryRatio();
  ASSERT_TRUE(ratio.has_value());
  EXPECT_GT(*ratio, 0.0);
  EXPECT_LT(*ratio, 1.0);
}

}  // namespace
