/*
 * 설명: 채널별 포함/제외 규칙을 적용해 메시지를 활성 연결 또는 보류 큐로 분배한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/dispatcher_test.cpp, server/tests/unit/presence_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "mudlink/channel_router.hpp"
#include "mudlink/connection_registry.hpp"
#include "mudlink/observability.hpp"
#include "mudlink/pending_buffer.hpp"
#include "mudlink/rate_limiter.hpp"
#include "mudlink/world.hpp"

namespace mudlink {

struct DispatchRequest {
  Identity sender;
  ChannelKind kind{ChannelKind::kLocation};
  nlohmann::json content;
  bool include_self{false};
  std::optional<Identity> target;
  // 다른 노드에서 이미 허용된 메시지를 중계할 때만 true.
  bool relayed{false};
  std::optional<std::string> message_id;
  std::optional<LocationKey> location;
};

struct DispatchReport {
  SendResult result{SendResult::kDelivered};
  std::size_t delivered_live{0};
  std::size_t enqueued_pending{0};
  std::size_t muted{0};
  std::optional<std::string> subject;
  std::optional<OutboundMessage> message;
};

struct DeliveryCount {
  std::size_t live{0};
  std::size_t pending{0};
};

class BroadcastDispatcher {
 public:
  BroadcastDispatcher(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<PendingMessageBuffer> pending,
                      std::shared_ptr<ChannelRateLimiter> limiter, std::shared_ptr<ChannelRouter> router,
                      std::shared_ptr<MuteService> mutes, std::shared_ptr<Observability> observability);

  DispatchReport Dispatch(const DispatchRequest& request, Clock::time_point now = Clock::now());
  // 접속/이탈 알림의 유일한 경로. PresenceEvent는 레지스트리만 만들 수 있다.
  DeliveryCount PublishPresence(const PresenceEvent& event);
  std::size_t DrainPendingTo(const Identity& identity, ConnectionSink& sink, Clock::time_point now = Clock::now());

  OutboundMessage MakeServerEvent(std::string event, nlohmann::json payload);

 private:
  DeliveryCount DeliverTo(const Identity& recipient, const OutboundMessage& message, bool allow_pending,
                          Clock::time_point now);
  static bool IsSelfPresence(const Identity& recipient, const OutboundMessage& message);
  std::uint64_t NextSeq() { return seq_counter_.fetch_add(1) + 1; }

  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<PendingMessageBuffer> pending_;
  std::shared_ptr<ChannelRateLimiter> limiter_;
  std::shared_ptr<ChannelRouter> router_;
  std::shared_ptr<MuteService> mutes_;
  std::shared_ptr<Observability> observability_;
  std::atomic<std::uint64_t> seq_counter_{0};
};

}  // namespace mudlink
