/*
 * 설명: 브로커 주제 구독 참조 수와 위치 구독 전이를 관리하고, 발행 실패를 지수 백오프로 재시도한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_bus_test.cpp
 */
#include "mudlink/event_bus.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>

namespace mudlink {

BrokerBridge::BrokerBridge(boost::asio::any_io_executor executor, std::shared_ptr<BrokerClient> broker,
                           std::shared_ptr<BroadcastDispatcher> dispatcher, std::shared_ptr<LocationService> locations,
                           SubjectNamer subjects, std::string node_id, std::shared_ptr<Observability> observability,
                           BrokerRetryPolicy policy)
    : strand_(boost::asio::make_strand(executor)), retry_timer_(strand_), broker_(std::move(broker)),
      dispatcher_(std::move(dispatcher)), locations_(std::move(locations)), subjects_(std::move(subjects)),
      node_id_(std::move(node_id)), observability_(std::move(observability)), policy_(policy) {}

void BrokerBridge::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_) {
    return;
  }
  started_ = true;
  for (const auto& pattern : subjects_.InboundPatterns()) {
    AcquireLocked(pattern);
  }
  observability_->Log(LogLevel::kInfo, "broker.bridge_started",
                      {{"nodeId", node_id_}, {"connected", broker_->Connected()}});
}

void BrokerBridge::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
    stopped_ = true;
    for (const auto& [subject, ref] : subject_refs_) {
      if (ref.subscription && !broker_->Unsubscribe(*ref.subscription)) {
        observability_->Log(LogLevel::kWarn, "broker.unsubscribe_failed", {{"subject", subject}});
      }
    }
    subject_refs_.clear();
    identities_.clear();
    retry_queue_.clear();
  }
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() { self->retry_timer_.cancel(); });
}

void BrokerBridge::PublishLocal(const DispatchRequest& request, const DispatchReport& report) {
  if (request.relayed || report.result != SendResult::kDelivered || !report.subject || !report.message) {
    return;
  }
  const auto& payload = report.message->payload;
  nlohmann::json body{{"origin", node_id_},
                      {"messageId", payload.value("messageId", std::string{})},
                      {"channel", ToString(request.kind)},
                      {"sender", request.sender},
                      {"message", request.content}};
  if (request.target) {
    body["target"] = *request.target;
  }
  if (payload.contains("location")) {
    body["location"] = payload["location"];
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (stopped_) {
    return;
  }
  if (broker_->Publish(*report.subject, body)) {
    ++published_;
    return;
  }
  observability_->IncrementBrokerFailures();
  QueueRetryLocked(RetryOp{OpKind::kPublish, *report.subject, std::move(body), 0});
}

void BrokerBridge::OnPresence(const PresenceEvent& event) {
  const auto& identity = event.identity();
  if (event.kind() == PresenceEvent::Kind::kEntered) {
    auto location = locations_->CurrentLocation(identity);
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
    auto& state = identities_[identity];
    if (!state.direct_subject) {
      auto direct = subjects_.Direct(identity);
      if (direct) {
        AcquireLocked(*direct);
        state.direct_subject = std::move(direct);
      }
    }
    TransitionLocked(state, location);
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = identities_.find(identity);
  if (it == identities_.end()) {
    return;
  }
  if (it->second.location_subject) {
    ReleaseLocked(*it->second.location_subject);
  }
  if (it->second.direct_subject) {
    ReleaseLocked(*it->second.direct_subject);
  }
  identities_.erase(it);
}

void BrokerBridge::OnLocationChanged(const Identity& identity, const std::optional<LocationKey>& location) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = identities_.find(identity);
  if (it == identities_.end()) {
    // 접속 중이 아니면 다음 접속 시 현재 위치로 구독한다.
    return;
  }
  TransitionLocked(it->second, location);
}

std::optional<LocationKey> BrokerBridge::SubscribedLocation(const Identity& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = identities_.find(identity);
  if (it == identities_.end() || !it->second.location_subject) {
    return std::nullopt;
  }
  return it->second.location;
}

std::size_t BrokerBridge::SubjectRefCount(const std::string& subject) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = subject_refs_.find(subject);
  return it == subject_refs_.end() ? 0 : it->second.count;
}

BrokerBridgeStats BrokerBridge::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  BrokerBridgeStats stats;
  stats.subscribed_subjects = subject_refs_.size();
  stats.tracked_identities = identities_.size();
  stats.retry_queue = retry_queue_.size();
  stats.published = published_;
  stats.relayed_in = relayed_in_;
  stats.echoes_ignored = echoes_ignored_;
  stats.dropped_retries = dropped_retries_;
  stats.connected = broker_->Connected();
  return stats;
}

void BrokerBridge::TransitionLocked(IdentityState& state, const std::optional<LocationKey>& location) {
  if (state.location == location && (state.location_subject.has_value() || !location)) {
    return;
  }
  // 이전 구독을 먼저 해제한 뒤 새 위치를 구독한다.
  if (state.location_subject) {
    ReleaseLocked(*state.location_subject);
    state.location_subject.reset();
  }
  state.location = location;
  if (!location) {
    return;
  }
  auto subject = subjects_.Location(*location);
  if (!subject) {
    observability_->Log(LogLevel::kWarn, "broker.invalid_location_subject", {{"location", *location}});
    return;
  }
  AcquireLocked(*subject);
  state.location_subject = std::move(subject);
}

void BrokerBridge::AcquireLocked(const std::string& subject) {
  auto& ref = subject_refs_[subject];
  if (++ref.count > 1) {
    return;
  }
  auto id = broker_->Subscribe(subject, MakeHandler());
  if (id) {
    ref.subscription = id;
    return;
  }
  observability_->IncrementBrokerFailures();
  QueueRetryLocked(RetryOp{OpKind::kSubscribe, subject, nullptr, 0});
}

void BrokerBridge::ReleaseLocked(const std::string& subject) {
  auto it = subject_refs_.find(subject);
  if (it == subject_refs_.end()) {
    return;
  }
  if (--it->second.count > 0) {
    return;
  }
  auto subscription = it->second.subscription;
  subject_refs_.erase(it);
  if (!subscription) {
    return;
  }
  if (!broker_->Unsubscribe(*subscription)) {
    observability_->IncrementBrokerFailures();
    QueueRetryLocked(RetryOp{OpKind::kUnsubscribe, subject, nullptr, *subscription});
  }
}

void BrokerBridge::QueueRetryLocked(RetryOp op) {
  if (retry_queue_.size() >= policy_.max_queue) {
    retry_queue_.pop_front();
    ++dropped_retries_;
    observability_->Log(LogLevel::kWarn, "broker.retry_dropped", {{"subject", op.subject}});
  }
  retry_queue_.push_back(std::move(op));
  if (retry_scheduled_ || stopped_) {
    return;
  }
  retry_scheduled_ = true;
  auto delay = RetryDelayLocked();
  auto weak = weak_from_this();
  boost::asio::post(strand_, [weak, delay]() {
    if (auto self = weak.lock()) {
      self->ArmRetryTimer(delay);
    }
  });
}

std::chrono::milliseconds BrokerBridge::RetryDelayLocked() const {
  auto shift = std::min(retry_attempt_, 16u);
  auto delay = std::chrono::milliseconds(policy_.base_delay.count() << shift);
  return std::min(delay, policy_.max_delay);
}

void BrokerBridge::ArmRetryTimer(std::chrono::milliseconds delay) {
  retry_timer_.expires_after(delay);
  auto weak = weak_from_this();
  retry_timer_.async_wait([weak](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    if (auto self = weak.lock()) {
      self->FlushRetries();
    }
  });
}

void BrokerBridge::FlushRetries() {
  std::lock_guard<std::mutex> lock(mutex_);
  retry_scheduled_ = false;
  if (stopped_) {
    return;
  }
  while (!retry_queue_.empty()) {
    if (!Execute(retry_queue_.front())) {
      ++retry_attempt_;
      retry_scheduled_ = true;
      ArmRetryTimer(RetryDelayLocked());
      return;
    }
    retry_queue_.pop_front();
  }
  if (retry_attempt_ > 0) {
    observability_->Log(LogLevel::kInfo, "broker.recovered", {{"attempts", retry_attempt_}});
  }
  retry_attempt_ = 0;
}

bool BrokerBridge::Execute(RetryOp& op) {
  switch (op.kind) {
    case OpKind::kPublish:
      if (!broker_->Publish(op.subject, op.body)) {
        return false;
      }
      ++published_;
      return true;
    case OpKind::kSubscribe: {
      auto it = subject_refs_.find(op.subject);
      if (it == subject_refs_.end() || it->second.subscription) {
        return true;
      }
      auto id = broker_->Subscribe(op.subject, MakeHandler());
      if (!id) {
        return false;
      }
      it->second.subscription = id;
      return true;
    }
    case OpKind::kUnsubscribe:
      return broker_->Unsubscribe(op.subscription);
  }
  return true;
}

BrokerHandler BrokerBridge::MakeHandler() {
  auto weak = weak_from_this();
  return [weak](const BrokerMessage& message) {
    if (auto self = weak.lock()) {
      self->HandleInbound(message);
    }
  };
}

void BrokerBridge::HandleInbound(const BrokerMessage& message) {
  if (!message.body.is_object()) {
    observability_->Log(LogLevel::kWarn, "broker.malformed_message", {{"subject", message.subject}});
    return;
  }
  if (message.body.value("origin", std::string{}) == node_id_) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++echoes_ignored_;
    return;
  }
  auto parsed = subjects_.Parse(message.subject);
  auto sender = message.body.value("sender", std::string{});
  if (!parsed || sender.empty()) {
    observability_->Log(LogLevel::kWarn, "broker.unroutable_message", {{"subject", message.subject}});
    return;
  }

  DispatchRequest request;
  request.sender = std::move(sender);
  request.kind = parsed->kind;
  request.content = message.body.contains("message") ? message.body["message"] : nlohmann::json();
  request.relayed = true;
  auto id_it = message.body.find("messageId");
  if (id_it != message.body.end() && id_it->is_string() && !id_it->get<std::string>().empty()) {
    request.message_id = id_it->get<std::string>();
  }
  if (parsed->kind == ChannelKind::kDirect) {
    request.target = parsed->parameter;
  } else if (parsed->kind == ChannelKind::kLocation) {
    request.location = parsed->parameter;
  }

  auto report = dispatcher_->Dispatch(request);
  std::lock_guard<std::mutex> lock(mutex_);
  ++relayed_in_;
  LogContext ctx;
  ctx.level = LogLevel::kDebug;
  ctx.name = "broker.relayed";
  ctx.identity = request.sender;
  ctx.detail = {{"subject", message.subject},
                {"result", ToString(report.result)},
                {"live", report.delivered_live},
                {"pending", report.enqueued_pending}};
  observability_->Log(ctx);
}

}  // namespace mudlink
