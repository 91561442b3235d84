/*
 * 설명: 와일드카드 주제 일치로 구독자를 찾아 Asio 실행기에 핸들러를 예약한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_bus_test.cpp
 */
#include "mudlink/broker.hpp"

#include <vector>

#include <boost/asio/post.hpp>

#include "mudlink/subjects.hpp"

namespace mudlink {

InProcessBroker::InProcessBroker(boost::asio::any_io_executor executor) : executor_(std::move(executor)) {}

bool InProcessBroker::Publish(const std::string& subject, const nlohmann::json& body) {
  if (!available_.load() || subject.empty() || subject.size() > SubjectNamer::kMaxSubjectLength) {
    return false;
  }
  std::vector<BrokerHandler> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, subscription] : subscriptions_) {
      if (SubjectNamer::Matches(subscription.pattern, subject)) {
        targets.push_back(subscription.handler);
      }
    }
  }
  published_.fetch_add(1);
  for (auto& handler : targets) {
    boost::asio::post(executor_, [handler = std::move(handler), message = BrokerMessage{subject, body}]() {
      handler(message);
    });
  }
  return true;
}

std::optional<SubscriptionId> InProcessBroker::Subscribe(const std::string& pattern, BrokerHandler handler) {
  if (!available_.load() || pattern.empty() || !handler) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = next_id_++;
  subscriptions_.emplace(id, Subscription{pattern, std::move(handler)});
  return id;
}

bool InProcessBroker::Unsubscribe(SubscriptionId id) {
  if (!available_.load()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  subscriptions_.erase(id);
  return true;
}

std::size_t InProcessBroker::SubscriptionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.size();
}

}  // namespace mudlink
