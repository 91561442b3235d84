/*
 * 설명: 발송 제한, 음소거, 자기 반향 제외 규칙을 적용한 뒤 활성 연결 전달 또는 보류 적재를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/dispatcher_test.cpp, server/tests/unit/presence_flow_test.cpp
 */
#include "mudlink/dispatcher.hpp"

#include <set>

#include "mudlink/api_response.hpp"
#include "mudlink/random_id.hpp"

namespace mudlink {

BroadcastDispatcher::BroadcastDispatcher(std::shared_ptr<ConnectionRegistry> registry,
                                         std::shared_ptr<PendingMessageBuffer> pending,
                                         std::shared_ptr<ChannelRateLimiter> limiter,
                                         std::shared_ptr<ChannelRouter> router, std::shared_ptr<MuteService> mutes,
                                         std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), pending_(std::move(pending)), limiter_(std::move(limiter)),
      router_(std::move(router)), mutes_(std::move(mutes)), observability_(std::move(observability)) {}

DispatchReport BroadcastDispatcher::Dispatch(const DispatchRequest& request, Clock::time_point now) {
  DispatchReport report;
  if (!request.relayed && !limiter_->Admit(request.sender, request.kind, now)) {
    observability_->IncrementRateLimited();
    report.result = SendResult::kRateLimited;
    return report;
  }

  auto route = request.relayed && request.kind == ChannelKind::kLocation && request.location
                   ? router_->ResolveAtLocation(*request.location)
                   : router_->Resolve(request.kind, request.sender, request.target, now);
  if (!route.matched) {
    observability_->IncrementNoSuchTarget();
    report.result = SendResult::kNoSuchTarget;
    return report;
  }
  report.subject = route.subject;

  nlohmann::json payload{{"messageId", request.message_id.value_or(RandomHex(8))},
                         {"channel", ToString(request.kind)},
                         {"sender", request.sender},
                         {"message", request.content},
                         {"sentAt", ToIsoString(now)}};
  if (route.subject) {
    payload["subject"] = *route.subject;
  }
  if (route.location) {
    payload["location"] = *route.location;
  }
  if (request.kind == ChannelKind::kDirect && request.target) {
    payload["target"] = *request.target;
  }
  OutboundMessage message{"chat.message", NextSeq(), std::move(payload)};

  const bool system = request.kind == ChannelKind::kSystem;
  const bool include_self = request.include_self || system;
  std::set<Identity> seen;
  for (const auto& recipient : route.recipients) {
    if (!seen.insert(recipient).second) {
      continue;
    }
    if (recipient == request.sender && !include_self) {
      continue;
    }
    if (!system && mutes_->IsMuted(recipient, request.sender, request.kind)) {
      ++report.muted;
      continue;
    }
    auto count = DeliverTo(recipient, message, true, now);
    report.delivered_live += count.live;
    report.enqueued_pending += count.pending;
  }

  if (request.kind == ChannelKind::kDirect) {
    if (report.muted > 0) {
      observability_->AddMuted(report.muted);
      report.result = SendResult::kMuted;
      return report;
    }
    router_->NoteDirectDelivery(request.sender, *request.target, now);
    // 답장 확인용 사본. 보류 큐에는 넣지 않는다.
    if (request.include_self && seen.count(request.sender) == 0) {
      report.delivered_live += DeliverTo(request.sender, message, false, now).live;
    }
  }

  observability_->AddMuted(report.muted);
  observability_->AddDeliveredLive(report.delivered_live);
  observability_->AddEnqueuedPending(report.enqueued_pending);
  report.message = std::move(message);
  report.result = SendResult::kDelivered;
  return report;
}

DeliveryCount BroadcastDispatcher::PublishPresence(const PresenceEvent& event) {
  observability_->IncrementPresenceEvents();
  auto audience = router_->ResolvePresenceAudience(event.identity());
  nlohmann::json payload{{"identity", event.identity()}, {"at", ToIsoString(event.at())}};
  if (audience.location) {
    payload["location"] = *audience.location;
  }
  auto name = event.kind() == PresenceEvent::Kind::kEntered ? "presence.entered" : "presence.left";
  OutboundMessage message{name, NextSeq(), std::move(payload)};

  DeliveryCount total;
  const auto now = Clock::now();
  for (const auto& recipient : audience.recipients) {
    if (recipient == event.identity()) {
      continue;
    }
    auto count = DeliverTo(recipient, message, true, now);
    total.live += count.live;
    total.pending += count.pending;
  }
  observability_->AddDeliveredLive(total.live);
  observability_->AddEnqueuedPending(total.pending);

  LogContext ctx;
  ctx.level = LogLevel::kDebug;
  ctx.name = std::string(name);
  ctx.identity = event.identity();
  ctx.session_id = event.session_id();
  ctx.detail = {{"live", total.live}, {"pending", total.pending}};
  observability_->Log(ctx);
  return total;
}

std::size_t BroadcastDispatcher::DrainPendingTo(const Identity& identity, ConnectionSink& sink,
                                                Clock::time_point now) {
  auto drained = pending_->Drain(identity, now);
  std::size_t delivered = 0;
  for (const auto& entry : drained) {
    if (IsSelfPresence(identity, entry.payload)) {
      observability_->IncrementInvariantViolations();
      observability_->Log(LogLevel::kError, "pending.self_presence_dropped", {{"identity", identity}});
      continue;
    }
    sink.Deliver(entry.payload);
    ++delivered;
  }
  observability_->AddDeliveredLive(delivered);
  return delivered;
}

OutboundMessage BroadcastDispatcher::MakeServerEvent(std::string event, nlohmann::json payload) {
  return OutboundMessage{std::move(event), NextSeq(), std::move(payload)};
}

DeliveryCount BroadcastDispatcher::DeliverTo(const Identity& recipient, const OutboundMessage& message,
                                             bool allow_pending, Clock::time_point now) {
  DeliveryCount count;
  if (IsSelfPresence(recipient, message)) {
    return count;
  }
  ConnectionRegistry::HoldFn hold;
  if (allow_pending) {
    hold = [this, &recipient, now](const OutboundMessage& held) { pending_->Enqueue(recipient, held, now); };
  }
  auto routed = registry_->DeliverOrHold(recipient, message, now, router_->ReconnectWindow(), hold);
  count.live = routed.live;
  count.pending = routed.held ? 1 : 0;
  return count;
}

bool BroadcastDispatcher::IsSelfPresence(const Identity& recipient, const OutboundMessage& message) {
  if (message.event.rfind("presence.", 0) != 0) {
    return false;
  }
  auto it = message.payload.find("identity");
  return it != message.payload.end() && it->is_string() && it->get<std::string>() == recipient;
}

}  // namespace mudlink
