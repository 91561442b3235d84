/*
 * 설명: 로컬 발송을 브로커 주제로 발행하고, 다른 노드에서 온 메시지를 로컬 발송기로 중계한다.
 *       식별자별 위치 구독 상태와 주제별 참조 수, 브로커 장애 시 재시도 큐를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_bus_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <nlohmann/json.hpp>

#include "mudlink/broker.hpp"
#include "mudlink/dispatcher.hpp"
#include "mudlink/observability.hpp"
#include "mudlink/subjects.hpp"
#include "mudlink/world.hpp"

namespace mudlink {

struct BrokerRetryPolicy {
  std::chrono::milliseconds base_delay{100};
  std::chrono::milliseconds max_delay{5000};
  std::size_t max_queue{1024};
};

struct BrokerBridgeStats {
  std::size_t subscribed_subjects{0};
  std::size_t tracked_identities{0};
  std::size_t retry_queue{0};
  std::uint64_t published{0};
  std::uint64_t relayed_in{0};
  std::uint64_t echoes_ignored{0};
  std::uint64_t dropped_retries{0};
  bool connected{false};
};

class BrokerBridge : public std::enable_shared_from_this<BrokerBridge> {
 public:
  BrokerBridge(boost::asio::any_io_executor executor, std::shared_ptr<BrokerClient> broker,
               std::shared_ptr<BroadcastDispatcher> dispatcher, std::shared_ptr<LocationService> locations,
               SubjectNamer subjects, std::string node_id, std::shared_ptr<Observability> observability,
               BrokerRetryPolicy policy = {});

  void Start();
  void Stop();

  // 로컬에서 허용된 발송만 발행한다. 중계된 메시지는 다시 발행하지 않는다.
  void PublishLocal(const DispatchRequest& request, const DispatchReport& report);
  void OnPresence(const PresenceEvent& event);
  // 월드 동기화 경로. 구독만 갱신하고 접속 알림은 만들지 않는다.
  void OnLocationChanged(const Identity& identity, const std::optional<LocationKey>& location);

  std::optional<LocationKey> SubscribedLocation(const Identity& identity) const;
  std::size_t SubjectRefCount(const std::string& subject) const;
  const std::string& NodeId() const { return node_id_; }
  BrokerBridgeStats Stats() const;

 private:
  enum class OpKind { kPublish, kSubscribe, kUnsubscribe };

  struct RetryOp {
    OpKind kind;
    std::string subject;
    nlohmann::json body;
    SubscriptionId subscription{0};
  };

  struct SubjectRef {
    std::size_t count{0};
    std::optional<SubscriptionId> subscription;
  };

  struct IdentityState {
    std::optional<LocationKey> location;
    std::optional<std::string> location_subject;
    std::optional<std::string> direct_subject;
  };

  void AcquireLocked(const std::string& subject);
  void ReleaseLocked(const std::string& subject);
  void TransitionLocked(IdentityState& state, const std::optional<LocationKey>& location);
  void QueueRetryLocked(RetryOp op);
  std::chrono::milliseconds RetryDelayLocked() const;
  void ArmRetryTimer(std::chrono::milliseconds delay);
  void FlushRetries();
  bool Execute(RetryOp& op);
  BrokerHandler MakeHandler();
  void HandleInbound(const BrokerMessage& message);

  boost::asio::strand<boost::asio::any_io_executor> strand_;
  boost::asio::steady_timer retry_timer_;
  std::shared_ptr<BrokerClient> broker_;
  std::shared_ptr<BroadcastDispatcher> dispatcher_;
  std::shared_ptr<LocationService> locations_;
  SubjectNamer subjects_;
  std::string node_id_;
  std::shared_ptr<Observability> observability_;
  BrokerRetryPolicy policy_;

  mutable std::mutex mutex_;
  bool started_{false};
  bool stopped_{false};
  bool retry_scheduled_{false};
  unsigned retry_attempt_{0};
  std::unordered_map<std::string, SubjectRef> subject_refs_;
  std::unordered_map<Identity, IdentityState> identities_;
  std::deque<RetryOp> retry_queue_;
  std::uint64_t published_{0};
  std::uint64_t relayed_in_{0};
  std::uint64_t echoes_ignored_{0};
  std::uint64_t dropped_retries_{0};
};

}  // namespace mudlink
