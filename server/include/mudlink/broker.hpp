/*
 * 설명: 계층형 주제 기반 발행/구독 브로커 인터페이스와 프로세스 내부 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_bus_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <nlohmann/json.hpp>

namespace mudlink {

struct BrokerMessage {
  std::string subject;
  nlohmann::json body;
};

using BrokerHandler = std::function<void(const BrokerMessage&)>;
using SubscriptionId = std::uint64_t;

// 실패는 예외가 아니라 반환값으로 알린다. 호출자가 재시도를 결정한다.
class BrokerClient {
 public:
  virtual ~BrokerClient() = default;

  virtual bool Publish(const std::string& subject, const nlohmann::json& body) = 0;
  virtual std::optional<SubscriptionId> Subscribe(const std::string& pattern, BrokerHandler handler) = 0;
  virtual bool Unsubscribe(SubscriptionId id) = 0;
  virtual bool Connected() const = 0;
};

// 핸들러는 항상 실행기에 post되어 발행 호출 스택 밖에서 실행된다.
class InProcessBroker : public BrokerClient {
 public:
  explicit InProcessBroker(boost::asio::any_io_executor executor);

  bool Publish(const std::string& subject, const nlohmann::json& body) override;
  std::optional<SubscriptionId> Subscribe(const std::string& pattern, BrokerHandler handler) override;
  bool Unsubscribe(SubscriptionId id) override;
  bool Connected() const override { return available_.load(); }

  // 장애 주입용.
  void SetAvailable(bool available) { available_.store(available); }
  std::size_t SubscriptionCount() const;
  std::uint64_t PublishedCount() const { return published_.load(); }

 private:
  struct Subscription {
    std::string pattern;
    BrokerHandler handler;
  };

  boost::asio::any_io_executor executor_;
  std::atomic<bool> available_{true};
  std::atomic<std::uint64_t> published_{0};
  mutable std::mutex mutex_;
  SubscriptionId next_id_{1};
  std::map<SubscriptionId, Subscription> subscriptions_;
};

}  // namespace mudlink
