#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "mudlink/app.hpp"
#include "mudlink/config.hpp"
#include "support/e2e_client.hpp"

namespace {

using mudlink::test_support::ExpectErrorEnvelope;
using mudlink::test_support::ExpectSuccessEnvelope;
using mudlink::test_support::Headers;
using mudlink::test_support::TestClient;

const Headers kOpsHeaders{{"X-Ops-Token", "ops-secret"}};

mudlink::AppConfig TestConfig(unsigned short port) {
  auto cfg = mudlink::DefaultConfig();
  cfg.port = port;
  cfg.log_level = "error";
  cfg.ops_token = "ops-secret";
  cfg.node_id = "node-ops";
  return cfg;
}

class OpsEndpointsFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = TestConfig(18092);
    app_ = std::make_unique<mudlink::ServerApp>(config_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    client_ = std::make_unique<TestClient>("127.0.0.1", config_.port);
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  mudlink::AppConfig config_{};
  std::unique_ptr<mudlink::ServerApp> app_;
  std::thread server_thread_;
  std::unique_ptr<TestClient> client_;
};

TEST_F(OpsEndpointsFixture, HealthReportsOk) {
  auto res = client_->Get("/api/health");
  EXPECT_EQ(res.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(res.body);
  EXPECT_EQ(res.body["data"]["status"], "ok");
}

TEST_F(OpsEndpointsFixture, MetricsCountRequests) {
  auto first = client_->Get("/metrics");
  ASSERT_EQ(first.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(first.body);
  const auto before = first.body["data"]["requests"]["total"].get<std::uint64_t>();

  client_->Get("/api/health");
  auto second = client_->Get("/metrics");
  const auto after = second.body["data"]["requests"]["total"].get<std::uint64_t>();
  EXPECT_GE(after, before + 2);
  EXPECT_TRUE(second.body["data"].contains("connections"));
  EXPECT_TRUE(second.body["data"].contains("pending"));
  EXPECT_EQ(second.body["data"]["broker"]["nodeId"], "node-ops");
}

TEST_F(OpsEndpointsFixture, OpsRequireToken) {
  auto missing = client_->Get("/ops/status");
  EXPECT_EQ(missing.status, boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(missing.body, "unauthorized");

  auto wrong = client_->Get("/ops/status", {{"X-Ops-Token", "nope"}});
  EXPECT_EQ(wrong.status, boost::beast::http::status::unauthorized);

  auto ok = client_->Get("/ops/status", kOpsHeaders);
  EXPECT_EQ(ok.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(ok.body);
  EXPECT_EQ(ok.body["data"]["connections"]["total"], 0);
}

TEST_F(OpsEndpointsFixture, InspectUnknownIdentity) {
  auto res = client_->Get("/ops/identities/nobody", kOpsHeaders);
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(res.body);
  EXPECT_EQ(res.body["data"]["identity"], "nobody");
  EXPECT_FALSE(res.body["data"]["known"].get<bool>());
  EXPECT_FALSE(res.body["data"]["online"].get<bool>());
}

TEST_F(OpsEndpointsFixture, ForcedCleanupReturnsReport) {
  auto res = client_->PostJson("/ops/cleanup", nlohmann::json::object(), kOpsHeaders);
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(res.body);
  EXPECT_EQ(res.body["data"]["trigger"], "forced");
  EXPECT_EQ(res.body["data"]["staleConnectionsClosed"], 0);

  auto status = client_->Get("/ops/status", kOpsHeaders);
  EXPECT_EQ(status.body["data"]["janitor"]["forcedSweeps"], 1);
}

TEST_F(OpsEndpointsFixture, SystemAnnounceValidatesBody) {
  auto bad = client_->PostJson("/ops/system", {{"text", "hi"}}, kOpsHeaders);
  EXPECT_EQ(bad.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(bad.body, "bad_request");

  auto ok = client_->PostJson("/ops/system", {{"message", "maintenance at noon"}}, kOpsHeaders);
  ASSERT_EQ(ok.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(ok.body);
  EXPECT_EQ(ok.body["data"]["result"], "delivered");
  EXPECT_EQ(ok.body["data"]["deliveredLive"], 0);
}

TEST_F(OpsEndpointsFixture, WorldLocationUpdates) {
  auto placed = client_->PostJson("/ops/world/location", {{"identity", "alice"}, {"location", "town"}}, kOpsHeaders);
  ASSERT_EQ(placed.status, boost::beast::http::status::ok);
  EXPECT_TRUE(placed.body["data"]["changed"].get<bool>());

  auto again = client_->PostJson("/ops/world/location", {{"identity", "alice"}, {"location", "town"}}, kOpsHeaders);
  EXPECT_FALSE(again.body["data"]["changed"].get<bool>());

  auto invalid = client_->PostJson("/ops/world/location", {{"identity", "alice"}, {"location", "bad.loc"}},
                                   kOpsHeaders);
  EXPECT_EQ(invalid.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(invalid.body, "bad_request");

  auto removed = client_->PostJson("/ops/world/location", {{"identity", "alice"}, {"location", nullptr}},
                                   kOpsHeaders);
  ASSERT_EQ(removed.status, boost::beast::http::status::ok);
  EXPECT_TRUE(removed.body["data"]["location"].is_null());
}

TEST_F(OpsEndpointsFixture, MuteValidation) {
  auto missing = client_->PostJson("/ops/mutes", {{"recipient", "bob"}}, kOpsHeaders);
  EXPECT_EQ(missing.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(missing.body, "bad_request");

  auto bad_channel = client_->PostJson("/ops/mutes", {{"recipient", "bob"}, {"channel", "shout"}}, kOpsHeaders);
  EXPECT_EQ(bad_channel.status, boost::beast::http::status::bad_request);

  auto ok = client_->PostJson("/ops/mutes", {{"recipient", "bob"}, {"sender", "alice"}, {"muted", true}},
                              kOpsHeaders);
  ASSERT_EQ(ok.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(ok.body);
  EXPECT_TRUE(ok.body["data"]["muted"].get<bool>());
}

TEST_F(OpsEndpointsFixture, UnknownRouteAndUnauthenticatedStream) {
  auto missing = client_->Get("/nope");
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);
  ExpectErrorEnvelope(missing.body, "not_found");

  auto stream = client_->Get("/events");
  EXPECT_EQ(stream.status, boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(stream.body, "unauthorized");
}

TEST(ServerLifecycleTest, TerminationSignalStopsRun) {
  mudlink::ServerApp app(TestConfig(18093));
  std::atomic<bool> returned{false};
  std::thread server_thread([&]() {
    app.Run();
    returned.store(true);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(300));

  std::raise(SIGTERM);
  for (int i = 0; i < 100 && !returned.load(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  EXPECT_TRUE(returned.load());
  if (!returned.load()) {
    app.Stop();
  }
  server_thread.join();
}

}  // namespace
