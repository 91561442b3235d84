/*
 * 설명: 식별자별 활성 연결과 세션, 접속 상태를 관리하고 접속/이탈 이벤트를 유일하게 발생시킨다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp, server/tests/unit/presence_flow_test.cpp
 */
#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "mudlink/connection_sink.hpp"
#include "mudlink/types.hpp"

namespace mudlink {

struct ConnectionRecord {
  ConnectionId id;
  Identity identity;
  TransportKind transport{TransportKind::kBidirectionalSocket};
  SessionId session_id;
  Clock::time_point established_at{};
  Clock::time_point last_activity_at{};
  std::shared_ptr<ConnectionSink> sink;
};

struct PresenceInfo {
  bool online{false};
  std::size_t connection_count{0};
  std::optional<Clock::time_point> last_seen;
  std::optional<SessionId> session_id;
};

struct RegistryStats {
  std::size_t total_connections{0};
  std::size_t websocket_connections{0};
  std::size_t sse_connections{0};
  std::size_t online_identities{0};
  std::size_t tracked_identities{0};
};

enum class RejectReason { kStaleSession, kSessionMismatch, kInvalidRequest };

std::string_view ToString(RejectReason reason);

struct RegisterOutcome {
  std::optional<ConnectionId> connection_id;
  std::optional<RejectReason> rejected;
  std::vector<ConnectionId> evicted;
  std::size_t drained{0};

  bool accepted() const { return connection_id.has_value(); }
};

struct RoutedDelivery {
  std::size_t live{0};
  bool held{false};
};

class ConnectionRegistry;

// 접속/이탈 전이 이벤트. 생성자는 레지스트리만 호출할 수 있다.
class PresenceEvent {
 public:
  enum class Kind { kEntered, kLeft };

  Kind kind() const { return kind_; }
  const Identity& identity() const { return identity_; }
  const SessionId& session_id() const { return session_id_; }
  Clock::time_point at() const { return at_; }

 private:
  friend class ConnectionRegistry;

  PresenceEvent(Kind kind, Identity identity, SessionId session_id, Clock::time_point at)
      : kind_(kind), identity_(std::move(identity)), session_id_(std::move(session_id)), at_(at) {}

  Kind kind_;
  Identity identity_;
  SessionId session_id_;
  Clock::time_point at_;
};

std::string_view ToString(PresenceEvent::Kind kind);

class ConnectionRegistry {
 public:
  using PresenceListener = std::function<void(const PresenceEvent&)>;
  using HoldFn = std::function<void(const OutboundMessage&)>;
  using DrainFn = std::function<std::size_t(ConnectionSink&)>;

  explicit ConnectionRegistry(std::size_t retired_session_history = 8);

  // 배선 단계에서 한 번만 설정한다. 전이 잠금을 쥔 채 호출되므로 같은 식별자의 전이는 순서가 보장된다.
  void SetPresenceListener(PresenceListener listener) { presence_listener_ = std::move(listener); }

  RegisterOutcome Register(const Identity& identity, TransportKind transport, const SessionId& session_id,
                           std::shared_ptr<ConnectionSink> sink, Clock::time_point now = Clock::now());
  std::optional<ConnectionRecord> Unregister(const ConnectionId& connection_id, Clock::time_point now = Clock::now());
  std::vector<ConnectionId> StartNewSession(const Identity& identity, const SessionId& session_id,
                                            Clock::time_point now = Clock::now());

  // 세션이 같으면 등록, 처음 보는 세션이면 교체 후 등록, 폐기된 세션이면 거절한다.
  // on_registered는 새 연결이 보이게 된 직후, 연결 집합 잠금을 쥔 채 한 번 호출된다.
  RegisterOutcome Admit(const Identity& identity, TransportKind transport, const SessionId& session_id,
                        std::shared_ptr<ConnectionSink> sink, Clock::time_point now = Clock::now(),
                        const DrainFn& on_registered = nullptr);

  // 활성 연결이 있으면 모두에 전달하고, 없으면 재접속 창 안에서만 hold를 호출한다.
  // 판단과 hold는 Admit의 on_registered와 같은 잠금 안에서 일어난다.
  RoutedDelivery DeliverOrHold(const Identity& identity, const OutboundMessage& message, Clock::time_point now,
                               std::chrono::seconds window, const HoldFn& hold) const;

  std::optional<ConnectionRecord> CloseAndUnregister(const ConnectionId& connection_id, std::string_view reason,
                                                     Clock::time_point now = Clock::now());

  bool Touch(const ConnectionId& connection_id, Clock::time_point now = Clock::now());
  std::vector<ConnectionRecord> ConnectionsFor(const Identity& identity) const;
  std::optional<ConnectionRecord> Find(const ConnectionId& connection_id) const;
  PresenceInfo Presence(const Identity& identity) const;
  bool IsKnown(const Identity& identity) const;
  bool IsReachable(const Identity& identity, Clock::time_point now, std::chrono::seconds window) const;
  std::vector<Identity> OnlineIdentities() const;
  std::vector<Identity> ReachableIdentities(Clock::time_point now, std::chrono::seconds window) const;

  std::vector<ConnectionRecord> StaleConnections(Clock::time_point now, std::chrono::seconds max_idle) const;
  std::vector<Identity> PruneOffline(Clock::time_point now, std::chrono::seconds retention);
  RegistryStats Stats() const;

 private:
  static constexpr std::size_t kShardCount = 32;

  struct IdentityEntry {
    std::optional<SessionId> session_id;
    Clock::time_point session_created_at{};
    std::deque<SessionId> retired_sessions;
    std::unordered_map<ConnectionId, ConnectionRecord> connections;
    std::optional<Clock::time_point> last_seen;
  };

  struct Shard {
    // 같은 샤드의 연결/해제/세션 전이를 직렬화한다. 이벤트 발생이 끝날 때까지 유지된다.
    std::mutex transition_mutex;
    mutable std::mutex data_mutex;
    std::unordered_map<Identity, IdentityEntry> entries;
  };

  Shard& ShardFor(const Identity& identity) { return shards_[ShardIndex(identity, kShardCount)]; }
  const Shard& ShardFor(const Identity& identity) const { return shards_[ShardIndex(identity, kShardCount)]; }

  struct Rotation {
    std::vector<ConnectionRecord> evicted;
    std::optional<SessionId> previous_session;
    bool went_offline{false};
  };

  Rotation RotateSessionLocked(Shard& shard, const Identity& identity, const SessionId& session_id,
                               Clock::time_point now);
  void FinishRotation(const Identity& identity, const Rotation& rotation, Clock::time_point now) const;
  RegisterOutcome InsertLocked(Shard& shard, const Identity& identity, TransportKind transport,
                               const SessionId& session_id, std::shared_ptr<ConnectionSink> sink,
                               Clock::time_point now, const DrainFn& on_registered, bool& came_online,
                               std::size_t& drained);
  bool IsRetired(const IdentityEntry& entry, const SessionId& session_id) const;
  void Emit(PresenceEvent::Kind kind, const Identity& identity, const SessionId& session_id,
            Clock::time_point at) const;
  static void CloseSinks(const std::vector<ConnectionRecord>& records, std::string_view reason);

  std::size_t retired_session_history_;
  std::array<Shard, kShardCount> shards_;
  mutable std::mutex index_mutex_;
  std::unordered_map<ConnectionId, Identity> connection_index_;
  PresenceListener presence_listener_;
};

}  // namespace mudlink
