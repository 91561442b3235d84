/*
 * 설명: 실시간 코어 구성 요소를 설정값으로 조립하고 접속 이벤트를 발송기와 브로커 브리지에 연결한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_flow_test.cpp, server/tests/e2e/realtime_flow_test.cpp
 */
#include "mudlink/realtime.hpp"

#include <algorithm>

#include "mudlink/api_response.hpp"

namespace mudlink {
namespace {
std::chrono::seconds Seconds(std::size_t value) { return std::chrono::seconds(static_cast<long>(value)); }

RateLimitConfig ToRateLimitConfig(const AppConfig& config) {
  RateLimitConfig rate;
  rate.window = Seconds(config.rate_limit_window_seconds);
  rate.SetLimit(ChannelKind::kDirect, config.rate_limit_direct);
  rate.SetLimit(ChannelKind::kLocation, config.rate_limit_location);
  rate.SetLimit(ChannelKind::kBroadcast, config.rate_limit_broadcast);
  rate.SetLimit(ChannelKind::kSystem, config.rate_limit_system);
  return rate;
}

JanitorConfig ToJanitorConfig(const AppConfig& config) {
  JanitorConfig janitor;
  janitor.interval = Seconds(config.janitor_interval_seconds);
  janitor.probe_interval = Seconds(std::max<std::size_t>(config.janitor_probe_interval_seconds, 1));
  janitor.memory_threshold = config.janitor_memory_threshold;
  janitor.max_connection_age = Seconds(config.max_connection_age_seconds);
  janitor.presence_retention = Seconds(config.presence_retention_seconds);
  janitor.max_pending_per_identity = config.pending_max_per_identity;
  janitor.max_rate_limit_entries = config.max_rate_limit_entries;
  return janitor;
}

nlohmann::json ToJson(const std::optional<Clock::time_point>& at) {
  return at ? nlohmann::json(ToIsoString(*at)) : nlohmann::json(nullptr);
}
}  // namespace

RealtimeCoordinator::RealtimeCoordinator(boost::asio::any_io_executor executor, const AppConfig& config,
                                         std::shared_ptr<LocationService> locations,
                                         std::shared_ptr<MuteService> mutes, std::shared_ptr<BrokerClient> broker,
                                         std::shared_ptr<Observability> observability, MemoryProbe memory_probe)
    : max_connection_age_(Seconds(config.max_connection_age_seconds)), observability_(std::move(observability)) {
  registry_ = std::make_shared<ConnectionRegistry>();
  pending_ = std::make_shared<PendingMessageBuffer>(
      PendingBufferConfig{config.pending_max_per_identity, Seconds(config.pending_ttl_seconds)});
  limiter_ = std::make_shared<ChannelRateLimiter>(ToRateLimitConfig(config));
  SubjectNamer subjects(config.subject_root);
  router_ = std::make_shared<ChannelRouter>(registry_, locations, subjects, Seconds(config.reconnect_window_seconds));
  dispatcher_ = std::make_shared<BroadcastDispatcher>(registry_, pending_, limiter_, router_, std::move(mutes),
                                                      observability_);
  bridge_ = std::make_shared<BrokerBridge>(executor, std::move(broker), dispatcher_, std::move(locations), subjects,
                                           config.node_id, observability_);
  janitor_ = std::make_shared<Janitor>(executor, registry_, pending_, limiter_, router_, observability_,
                                       ToJanitorConfig(config), std::move(memory_probe));

  // 레지스트리가 리스너를 소유하므로 약한 참조로 순환을 끊는다.
  std::weak_ptr<BroadcastDispatcher> weak_dispatcher = dispatcher_;
  std::weak_ptr<BrokerBridge> weak_bridge = bridge_;
  registry_->SetPresenceListener([weak_dispatcher, weak_bridge](const PresenceEvent& event) {
    if (auto dispatcher = weak_dispatcher.lock()) {
      dispatcher->PublishPresence(event);
    }
    if (auto bridge = weak_bridge.lock()) {
      bridge->OnPresence(event);
    }
  });
}

void RealtimeCoordinator::Start() {
  bridge_->Start();
  janitor_->Start();
}

void RealtimeCoordinator::Stop() {
  janitor_->Stop();
  bridge_->Stop();
}

AcceptResult RealtimeCoordinator::AcceptConnection(const Identity& identity, TransportKind transport,
                                                   const SessionId& session_id, std::shared_ptr<ConnectionSink> sink,
                                                   Clock::time_point now) {
  AcceptResult result;
  auto outcome = registry_->Admit(identity, transport, session_id, sink, now, [&](ConnectionSink& registered) {
    return dispatcher_->DrainPendingTo(identity, registered, now);
  });
  result.evicted = outcome.evicted.size();
  if (!outcome.accepted()) {
    result.rejected = outcome.rejected;
    observability_->IncrementRejectedConnections();
    LogContext ctx;
    ctx.level = LogLevel::kWarn;
    ctx.name = "connection.rejected";
    ctx.identity = identity;
    ctx.session_id = session_id;
    ctx.detail = {{"reason", ToString(outcome.rejected.value_or(RejectReason::kInvalidRequest))},
                  {"transport", ToString(transport)}};
    observability_->Log(ctx);
    return result;
  }

  result.handle = ConnectionHandle{*outcome.connection_id, identity, session_id, transport};
  result.drained = outcome.drained;

  LogContext ctx;
  ctx.name = "connection.accepted";
  ctx.identity = identity;
  ctx.connection_id = *outcome.connection_id;
  ctx.session_id = session_id;
  ctx.detail = {{"transport", ToString(transport)}, {"evicted", result.evicted}, {"drained", result.drained}};
  observability_->Log(ctx);
  return result;
}

void RealtimeCoordinator::OnConnectionClosed(const ConnectionId& connection_id, Clock::time_point now) {
  auto removed = registry_->Unregister(connection_id, now);
  if (!removed) {
    return;
  }
  LogContext ctx;
  ctx.level = LogLevel::kDebug;
  ctx.name = "connection.closed";
  ctx.identity = removed->identity;
  ctx.connection_id = connection_id;
  ctx.session_id = removed->session_id;
  observability_->Log(ctx);
}

bool RealtimeCoordinator::Touch(const ConnectionId& connection_id, Clock::time_point now) {
  return registry_->Touch(connection_id, now);
}

DispatchReport RealtimeCoordinator::Send(const Identity& sender, ChannelKind kind, const nlohmann::json& content,
                                         const std::optional<Identity>& target, Clock::time_point now) {
  DispatchRequest request;
  request.sender = sender;
  request.kind = kind;
  request.content = content;
  request.target = target;
  return DispatchAndPublish(request, now);
}

DispatchReport RealtimeCoordinator::Reply(const Identity& sender, const nlohmann::json& content,
                                          Clock::time_point now) {
  auto target = router_->ResolveReply(sender);
  if (!target) {
    observability_->IncrementNoSuchTarget();
    DispatchReport report;
    report.result = SendResult::kNoSuchTarget;
    return report;
  }
  DispatchRequest request;
  request.sender = sender;
  request.kind = ChannelKind::kDirect;
  request.content = content;
  request.target = std::move(target);
  request.include_self = true;
  return DispatchAndPublish(request, now);
}

DispatchReport RealtimeCoordinator::SystemAnnounce(const nlohmann::json& content, Clock::time_point now) {
  DispatchRequest request;
  request.sender = kSystemSender;
  request.kind = ChannelKind::kSystem;
  request.content = content;
  request.include_self = true;
  return DispatchAndPublish(request, now);
}

void RealtimeCoordinator::OnLocationSynced(const Identity& identity, const std::optional<LocationKey>& location) {
  bridge_->OnLocationChanged(identity, location);
}

DispatchReport RealtimeCoordinator::DispatchAndPublish(const DispatchRequest& request, Clock::time_point now) {
  auto report = dispatcher_->Dispatch(request, now);
  bridge_->PublishLocal(request, report);
  return report;
}

nlohmann::json RealtimeCoordinator::Inspect(const Identity& identity, Clock::time_point now) const {
  auto presence = registry_->Presence(identity);
  nlohmann::json connections = nlohmann::json::array();
  for (const auto& record : registry_->ConnectionsFor(identity)) {
    auto age = std::chrono::duration_cast<std::chrono::seconds>(now - record.established_at).count();
    auto idle = std::chrono::duration_cast<std::chrono::seconds>(now - record.last_activity_at).count();
    connections.push_back({{"connectionId", record.id},
                           {"transport", ToString(record.transport)},
                           {"sessionId", record.session_id},
                           {"establishedAt", ToIsoString(record.established_at)},
                           {"lastActivityAt", ToIsoString(record.last_activity_at)},
                           {"ageSeconds", age},
                           {"idleSeconds", idle},
                           {"healthy", idle <= max_connection_age_.count()}});
  }
  nlohmann::json remaining = nlohmann::json::object();
  for (auto kind : {ChannelKind::kLocation, ChannelKind::kBroadcast, ChannelKind::kDirect, ChannelKind::kSystem}) {
    remaining[std::string(ToString(kind))] = limiter_->Remaining(identity, kind, now);
  }
  auto location = bridge_->SubscribedLocation(identity);
  return {{"identity", identity},
          {"known", registry_->IsKnown(identity)},
          {"online", presence.online},
          {"connectionCount", presence.connection_count},
          {"sessionId", presence.session_id ? nlohmann::json(*presence.session_id) : nlohmann::json(nullptr)},
          {"lastSeen", ToJson(presence.last_seen)},
          {"reachable", registry_->IsReachable(identity, now, router_->ReconnectWindow())},
          {"pending", pending_->Size(identity)},
          {"subscribedLocation", location ? nlohmann::json(*location) : nlohmann::json(nullptr)},
          {"rateLimitRemaining", remaining},
          {"connections", connections}};
}

nlohmann::json RealtimeCoordinator::Stats() const {
  auto registry = registry_->Stats();
  auto pending = pending_->Stats();
  auto limiter = limiter_->Stats();
  auto bridge = bridge_->Stats();
  auto janitor = janitor_->Stats();
  auto metrics = observability_->Snapshot();
  return {{"connections",
           {{"total", registry.total_connections},
            {"websocket", registry.websocket_connections},
            {"sse", registry.sse_connections},
            {"onlineIdentities", registry.online_identities},
            {"trackedIdentities", registry.tracked_identities}}},
          {"pending",
           {{"identities", pending.identities},
            {"messages", pending.messages},
            {"largestQueue", pending.largest_queue},
            {"overflowEvictions", pending.overflow_evictions}}},
          {"rateLimiter",
           {{"trackedBuckets", limiter.tracked_buckets},
            {"trackedIdentities", limiter.tracked_identities},
            {"saturatedBuckets", limiter.saturated_buckets}}},
          {"broker",
           {{"nodeId", bridge_->NodeId()},
            {"connected", bridge.connected},
            {"subscribedSubjects", bridge.subscribed_subjects},
            {"trackedIdentities", bridge.tracked_identities},
            {"retryQueue", bridge.retry_queue},
            {"published", bridge.published},
            {"relayedIn", bridge.relayed_in},
            {"echoesIgnored", bridge.echoes_ignored},
            {"droppedRetries", bridge.dropped_retries}}},
          {"janitor",
           {{"scheduledSweeps", janitor.scheduled_sweeps},
            {"pressureSweeps", janitor.pressure_sweeps},
            {"forcedSweeps", janitor.forced_sweeps},
            {"totalEvictions", janitor.total_evictions},
            {"lastSweep", janitor.last_report ? janitor.last_report->ToJson() : nlohmann::json(nullptr)}}},
          {"replyBook", router_->ReplyBookSize()},
          {"counters",
           {{"deliveredLive", metrics.delivered_live},
            {"enqueuedPending", metrics.enqueued_pending},
            {"rateLimited", metrics.rate_limited},
            {"muted", metrics.muted},
            {"noSuchTarget", metrics.no_such_target},
            {"presenceEvents", metrics.presence_events},
            {"rejectedConnections", metrics.rejected_connections},
            {"brokerFailures", metrics.broker_failures},
            {"janitorEvictions", metrics.janitor_evictions},
            {"invariantViolations", metrics.invariant_violations}}}};
}

JanitorReport RealtimeCoordinator::ForceCleanup() { return janitor_->ForceCleanup(); }

}  // namespace mudlink
