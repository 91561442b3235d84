/*
 * 설명: 레지스트리, 보류 버퍼, 발송 제한, 라우터, 발송기, 브로커 브리지, 정리 작업을 묶어
 *       전송 계층/게임 로직/운영 도구가 호출하는 실시간 코어 진입점을 제공한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_flow_test.cpp, server/tests/e2e/realtime_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>

#include <boost/asio/any_io_executor.hpp>
#include <nlohmann/json.hpp>

#include "mudlink/broker.hpp"
#include "mudlink/channel_router.hpp"
#include "mudlink/config.hpp"
#include "mudlink/connection_registry.hpp"
#include "mudlink/dispatcher.hpp"
#include "mudlink/event_bus.hpp"
#include "mudlink/janitor.hpp"
#include "mudlink/observability.hpp"
#include "mudlink/pending_buffer.hpp"
#include "mudlink/rate_limiter.hpp"
#include "mudlink/world.hpp"

namespace mudlink {

struct ConnectionHandle {
  ConnectionId connection_id;
  Identity identity;
  SessionId session_id;
  TransportKind transport{TransportKind::kBidirectionalSocket};
};

struct AcceptResult {
  std::optional<ConnectionHandle> handle;
  std::optional<RejectReason> rejected;
  std::size_t evicted{0};
  std::size_t drained{0};

  bool accepted() const { return handle.has_value(); }
};

class RealtimeCoordinator {
 public:
  RealtimeCoordinator(boost::asio::any_io_executor executor, const AppConfig& config,
                      std::shared_ptr<LocationService> locations, std::shared_ptr<MuteService> mutes,
                      std::shared_ptr<BrokerClient> broker, std::shared_ptr<Observability> observability,
                      MemoryProbe memory_probe = ReadProcessMemoryRatio);

  void Start();
  void Stop();

  // 전송 계층
  AcceptResult AcceptConnection(const Identity& identity, TransportKind transport, const SessionId& session_id,
                                std::shared_ptr<ConnectionSink> sink, Clock::time_point now = Clock::now());
  void OnConnectionClosed(const ConnectionId& connection_id, Clock::time_point now = Clock::now());
  bool Touch(const ConnectionId& connection_id, Clock::time_point now = Clock::now());

  // 게임 로직
  DispatchReport Send(const Identity& sender, ChannelKind kind, const nlohmann::json& content,
                      const std::optional<Identity>& target = std::nullopt, Clock::time_point now = Clock::now());
  DispatchReport Reply(const Identity& sender, const nlohmann::json& content, Clock::time_point now = Clock::now());
  DispatchReport SystemAnnounce(const nlohmann::json& content, Clock::time_point now = Clock::now());
  void OnLocationSynced(const Identity& identity, const std::optional<LocationKey>& location);

  // 운영 도구
  nlohmann::json Inspect(const Identity& identity, Clock::time_point now = Clock::now()) const;
  nlohmann::json Stats() const;
  JanitorReport ForceCleanup();

  const std::shared_ptr<ConnectionRegistry>& Registry() const { return registry_; }
  const std::shared_ptr<PendingMessageBuffer>& Pending() const { return pending_; }
  const std::shared_ptr<ChannelRateLimiter>& Limiter() const { return limiter_; }
  const std::shared_ptr<ChannelRouter>& Router() const { return router_; }
  const std::shared_ptr<BroadcastDispatcher>& Dispatcher() const { return dispatcher_; }
  const std::shared_ptr<BrokerBridge>& Bridge() const { return bridge_; }
  const std::shared_ptr<Janitor>& GetJanitor() const { return janitor_; }

 private:
  DispatchReport DispatchAndPublish(const DispatchRequest& request, Clock::time_point now);

  std::chrono::seconds max_connection_age_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<PendingMessageBuffer> pending_;
  std::shared_ptr<ChannelRateLimiter> limiter_;
  std::shared_ptr<ChannelRouter> router_;
  std::shared_ptr<BroadcastDispatcher> dispatcher_;
  std::shared_ptr<BrokerBridge> bridge_;
  std::shared_ptr<Janitor> janitor_;
};

// 시스템 공지의 발신자 식별자.
inline constexpr const char* kSystemSender = "system";

}  // namespace mudlink
