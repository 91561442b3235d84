/*
 * 설명: 식별자 단위 전이 잠금으로 연결 등록/해제/세션 교체를 직렬화하고 접속 이벤트를 발생시킨다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp, server/tests/unit/presence_flow_test.cpp
 */
#include "mudlink/connection_registry.hpp"

#include <algorithm>

#include "mudlink/random_id.hpp"

namespace mudlink {

std::string_view ToString(RejectReason reason) {
  switch (reason) {
    case RejectReason::kStaleSession:
      return "stale_session";
    case RejectReason::kSessionMismatch:
      return "session_mismatch";
    case RejectReason::kInvalidRequest:
      return "invalid_request";
  }
  return "unknown";
}

std::string_view ToString(PresenceEvent::Kind kind) {
  return kind == PresenceEvent::Kind::kEntered ? "entered" : "left";
}

ConnectionRegistry::ConnectionRegistry(std::size_t retired_session_history)
    : retired_session_history_(retired_session_history) {}

RegisterOutcome ConnectionRegistry::Register(const Identity& identity, TransportKind transport,
                                             const SessionId& session_id, std::shared_ptr<ConnectionSink> sink,
                                             Clock::time_point now) {
  if (identity.empty() || session_id.empty() || !sink) {
    RegisterOutcome outcome;
    outcome.rejected = RejectReason::kInvalidRequest;
    return outcome;
  }
  auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> transition(shard.transition_mutex);
  bool came_online = false;
  std::size_t drained = 0;
  auto outcome =
      InsertLocked(shard, identity, transport, session_id, std::move(sink), now, nullptr, came_online, drained);
  if (came_online) {
    Emit(PresenceEvent::Kind::kEntered, identity, session_id, now);
  }
  return outcome;
}

std::vector<ConnectionId> ConnectionRegistry::StartNewSession(const Identity& identity, const SessionId& session_id,
                                                              Clock::time_point now) {
  if (identity.empty() || session_id.empty()) {
    return {};
  }
  auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> transition(shard.transition_mutex);
  auto rotation = RotateSessionLocked(shard, identity, session_id, now);
  FinishRotation(identity, rotation, now);
  std::vector<ConnectionId> evicted;
  evicted.reserve(rotation.evicted.size());
  for (const auto& record : rotation.evicted) {
    evicted.push_back(record.id);
  }
  return evicted;
}

RegisterOutcome ConnectionRegistry::Admit(const Identity& identity, TransportKind transport,
                                          const SessionId& session_id, std::shared_ptr<ConnectionSink> sink,
                                          Clock::time_point now, const DrainFn& on_registered) {
  RegisterOutcome outcome;
  if (identity.empty() || session_id.empty() || !sink) {
    outcome.rejected = RejectReason::kInvalidRequest;
    return outcome;
  }
  auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> transition(shard.transition_mutex);

  bool needs_rotation = false;
  {
    std::lock_guard<std::mutex> lock(shard.data_mutex);
    auto it = shard.entries.find(identity);
    if (it != shard.entries.end() && it->second.session_id && *it->second.session_id != session_id) {
      if (IsRetired(it->second, session_id)) {
        outcome.rejected = RejectReason::kStaleSession;
        return outcome;
      }
      needs_rotation = true;
    }
  }

  std::vector<ConnectionId> evicted;
  if (needs_rotation) {
    auto rotation = RotateSessionLocked(shard, identity, session_id, now);
    FinishRotation(identity, rotation, now);
    for (const auto& record : rotation.evicted) {
      evicted.push_back(record.id);
    }
  }

  bool came_online = false;
  std::size_t drained = 0;
  outcome =
      InsertLocked(shard, identity, transport, session_id, std::move(sink), now, on_registered, came_online, drained);
  outcome.evicted = std::move(evicted);
  outcome.drained = drained;
  if (came_online) {
    Emit(PresenceEvent::Kind::kEntered, identity, session_id, now);
  }
  return outcome;
}

std::optional<ConnectionRecord> ConnectionRegistry::Unregister(const ConnectionId& connection_id,
                                                               Clock::time_point now) {
  Identity identity;
  {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = connection_index_.find(connection_id);
    if (it == connection_index_.end()) {
      return std::nullopt;
    }
    identity = it->second;
  }

  auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> transition(shard.transition_mutex);
  std::optional<ConnectionRecord> removed;
  bool went_offline = false;
  {
    std::lock_guard<std::mutex> lock(shard.data_mutex);
    auto entry_it = shard.entries.find(identity);
    if (entry_it == shard.entries.end()) {
      return std::nullopt;
    }
    auto& entry = entry_it->second;
    auto conn_it = entry.connections.find(connection_id);
    if (conn_it == entry.connections.end()) {
      // 세션 교체나 정리 작업이 먼저 제거했다.
      return std::nullopt;
    }
    removed = std::move(conn_it->second);
    entry.connections.erase(conn_it);
    {
      std::lock_guard<std::mutex> index_lock(index_mutex_);
      connection_index_.erase(connection_id);
    }
    if (entry.connections.empty()) {
      entry.last_seen = now;
      went_offline = true;
    }
  }
  if (went_offline) {
    Emit(PresenceEvent::Kind::kLeft, identity, removed->session_id, now);
  }
  return removed;
}

RoutedDelivery ConnectionRegistry::DeliverOrHold(const Identity& identity, const OutboundMessage& message,
                                               Clock::time_point now, std::chrono::seconds window,
                                               const HoldFn& hold) const {
  RoutedDelivery routed;
  const auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> lock(shard.data_mutex);
  auto it = shard.entries.find(identity);
  if (it == shard.entries.end()) {
    return routed;
  }
  const auto& entry = it->second;
  if (!entry.connections.empty()) {
    for (const auto& [id, record] : entry.connections) {
      record.sink->Deliver(message);
      ++routed.live;
    }
    return routed;
  }
  if (hold && entry.last_seen && now - *entry.last_seen <= window) {
    hold(message);
    routed.held = true;
  }
  return routed;
}

std::optional<ConnectionRecord> ConnectionRegistry::CloseAndUnregister(const ConnectionId& connection_id,
                                                                       std::string_view reason,
                                                                       Clock::time_point now) {
  auto removed = Unregister(connection_id, now);
  if (removed && removed->sink) {
    removed->sink->Close(reason);
  }
  return removed;
}

bool ConnectionRegistry::Touch(const ConnectionId& connection_id, Clock::time_point now) {
  Identity identity;
  {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = connection_index_.find(connection_id);
    if (it == connection_index_.end()) {
      return false;
    }
    identity = it->second;
  }
  auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> lock(shard.data_mutex);
  auto entry_it = shard.entries.find(identity);
  if (entry_it == shard.entries.end()) {
    return false;
  }
  auto conn_it = entry_it->second.connections.find(connection_id);
  if (conn_it == entry_it->second.connections.end()) {
    return false;
  }
  conn_it->second.last_activity_at = std::max(conn_it->second.last_activity_at, now);
  return true;
}

std::vector<ConnectionRecord> ConnectionRegistry::ConnectionsFor(const Identity& identity) const {
  const auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> lock(shard.data_mutex);
  std::vector<ConnectionRecord> records;
  auto it = shard.entries.find(identity);
  if (it == shard.entries.end()) {
    return records;
  }
  records.reserve(it->second.connections.size());
  for (const auto& [id, record] : it->second.connections) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(),
            [](const ConnectionRecord& a, const ConnectionRecord& b) { return a.established_at < b.established_at; });
  return records;
}

std::optional<ConnectionRecord> ConnectionRegistry::Find(const ConnectionId& connection_id) const {
  Identity identity;
  {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = connection_index_.find(connection_id);
    if (it == connection_index_.end()) {
      return std::nullopt;
    }
    identity = it->second;
  }
  const auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> lock(shard.data_mutex);
  auto entry_it = shard.entries.find(identity);
  if (entry_it == shard.entries.end()) {
    return std::nullopt;
  }
  auto conn_it = entry_it->second.connections.find(connection_id);
  if (conn_it == entry_it->second.connections.end()) {
    return std::nullopt;
  }
  return conn_it->second;
}

PresenceInfo ConnectionRegistry::Presence(const Identity& identity) const {
  const auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> lock(shard.data_mutex);
  PresenceInfo info;
  auto it = shard.entries.find(identity);
  if (it == shard.entries.end()) {
    return info;
  }
  info.connection_count = it->second.connections.size();
  info.online = info.connection_count > 0;
  info.last_seen = it->second.last_seen;
  info.session_id = it->second.session_id;
  return info;
}

bool ConnectionRegistry::IsKnown(const Identity& identity) const {
  const auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> lock(shard.data_mutex);
  return shard.entries.count(identity) > 0;
}

bool ConnectionRegistry::IsReachable(const Identity& identity, Clock::time_point now,
                                     std::chrono::seconds window) const {
  const auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> lock(shard.data_mutex);
  auto it = shard.entries.find(identity);
  if (it == shard.entries.end()) {
    return false;
  }
  if (!it->second.connections.empty()) {
    return true;
  }
  return it->second.last_seen && now - *it->second.last_seen <= window;
}

std::vector<Identity> ConnectionRegistry::OnlineIdentities() const {
  std::vector<Identity> identities;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.data_mutex);
    for (const auto& [identity, entry] : shard.entries) {
      if (!entry.connections.empty()) {
        identities.push_back(identity);
      }
    }
  }
  std::sort(identities.begin(), identities.end());
  return identities;
}

std::vector<Identity> ConnectionRegistry::ReachableIdentities(Clock::time_point now,
                                                              std::chrono::seconds window) const {
  std::vector<Identity> identities;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.data_mutex);
    for (const auto& [identity, entry] : shard.entries) {
      if (!entry.connections.empty() || (entry.last_seen && now - *entry.last_seen <= window)) {
        identities.push_back(identity);
      }
    }
  }
  std::sort(identities.begin(), identities.end());
  return identities;
}

std::vector<ConnectionRecord> ConnectionRegistry::StaleConnections(Clock::time_point now,
                                                                   std::chrono::seconds max_idle) const {
  std::vector<ConnectionRecord> stale;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.data_mutex);
    for (const auto& [identity, entry] : shard.entries) {
      for (const auto& [id, record] : entry.connections) {
        if (now - record.last_activity_at > max_idle) {
          stale.push_back(record);
        }
      }
    }
  }
  return stale;
}

std::vector<Identity> ConnectionRegistry::PruneOffline(Clock::time_point now, std::chrono::seconds retention) {
  std::vector<Identity> pruned;
  for (auto& shard : shards_) {
    std::lock_guard<std::mutex> transition(shard.transition_mutex);
    std::lock_guard<std::mutex> lock(shard.data_mutex);
    for (auto it = shard.entries.begin(); it != shard.entries.end();) {
      const auto& entry = it->second;
      const auto reference = entry.last_seen ? *entry.last_seen : entry.session_created_at;
      if (entry.connections.empty() && now - reference > retention) {
        pruned.push_back(it->first);
        it = shard.entries.erase(it);
      } else {
        ++it;
      }
    }
  }
  return pruned;
}

RegistryStats ConnectionRegistry::Stats() const {
  RegistryStats stats;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.data_mutex);
    stats.tracked_identities += shard.entries.size();
    for (const auto& [identity, entry] : shard.entries) {
      if (!entry.connections.empty()) {
        ++stats.online_identities;
      }
      for (const auto& [id, record] : entry.connections) {
        ++stats.total_connections;
        if (record.transport == TransportKind::kBidirectionalSocket) {
          ++stats.websocket_connections;
        } else {
          ++stats.sse_connections;
        }
      }
    }
  }
  return stats;
}

ConnectionRegistry::Rotation ConnectionRegistry::RotateSessionLocked(Shard& shard, const Identity& identity,
                                                                     const SessionId& session_id,
                                                                     Clock::time_point now) {
  Rotation rotation;
  std::lock_guard<std::mutex> lock(shard.data_mutex);
  auto& entry = shard.entries[identity];
  if (entry.session_id && *entry.session_id == session_id) {
    return rotation;
  }
  if (entry.session_id) {
    rotation.previous_session = entry.session_id;
    entry.retired_sessions.push_back(*entry.session_id);
    while (entry.retired_sessions.size() > retired_session_history_) {
      entry.retired_sessions.pop_front();
    }
  }
  entry.session_id = session_id;
  entry.session_created_at = now;
  if (entry.connections.empty()) {
    return rotation;
  }
  rotation.evicted.reserve(entry.connections.size());
  {
    std::lock_guard<std::mutex> index_lock(index_mutex_);
    for (auto& [id, record] : entry.connections) {
      connection_index_.erase(id);
      rotation.evicted.push_back(std::move(record));
    }
  }
  entry.connections.clear();
  entry.last_seen = now;
  rotation.went_offline = true;
  return rotation;
}

void ConnectionRegistry::FinishRotation(const Identity& identity, const Rotation& rotation,
                                        Clock::time_point now) const {
  CloseSinks(rotation.evicted, "session_replaced");
  if (rotation.went_offline) {
    Emit(PresenceEvent::Kind::kLeft, identity, rotation.previous_session.value_or(SessionId{}), now);
  }
}

RegisterOutcome ConnectionRegistry::InsertLocked(Shard& shard, const Identity& identity, TransportKind transport,
                                                 const SessionId& session_id, std::shared_ptr<ConnectionSink> sink,
                                                 Clock::time_point now, const DrainFn& on_registered,
                                                 bool& came_online, std::size_t& drained) {
  RegisterOutcome outcome;
  std::lock_guard<std::mutex> lock(shard.data_mutex);
  auto& entry = shard.entries[identity];
  if (entry.session_id && *entry.session_id != session_id) {
    outcome.rejected = IsRetired(entry, session_id) ? RejectReason::kStaleSession : RejectReason::kSessionMismatch;
    return outcome;
  }
  if (!entry.session_id) {
    entry.session_id = session_id;
    entry.session_created_at = now;
  }

  ConnectionRecord record;
  record.id = RandomHex(16);
  record.identity = identity;
  record.transport = transport;
  record.session_id = session_id;
  record.established_at = now;
  record.last_activity_at = now;
  record.sink = std::move(sink);

  came_online = entry.connections.empty();
  {
    std::lock_guard<std::mutex> index_lock(index_mutex_);
    connection_index_[record.id] = identity;
  }
  outcome.connection_id = record.id;
  auto& inserted = entry.connections.emplace(record.id, std::move(record)).first->second;
  if (on_registered) {
    drained = on_registered(*inserted.sink);
  }
  return outcome;
}

bool ConnectionRegistry::IsRetired(const IdentityEntry& entry, const SessionId& session_id) const {
  return std::find(entry.retired_sessions.begin(), entry.retired_sessions.end(), session_id) !=
         entry.retired_sessions.end();
}

void ConnectionRegistry::Emit(PresenceEvent::Kind kind, const Identity& identity, const SessionId& session_id,
                              Clock::time_point at) const {
  if (!presence_listener_) {
    return;
  }
  presence_listener_(PresenceEvent(kind, identity, session_id, at));
}

void ConnectionRegistry::CloseSinks(const std::vector<ConnectionRecord>& records, std::string_view reason) {
  for (const auto& record : records) {
    if (record.sink) {
      record.sink->Close(reason);
    }
  }
}

}  // namespace mudlink
