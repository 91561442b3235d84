/*
 * 설명: 위치/전체/개인/시스템 채널의 수신자 해석과 답장 장부를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/channel_router_test.cpp
 */
#include "mudlink/channel_router.hpp"

namespace mudlink {

ChannelRouter::ChannelRouter(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<LocationService> locations,
                             SubjectNamer subjects, std::chrono::seconds reconnect_window,
                             std::size_t reply_book_capacity)
    : registry_(std::move(registry)), locations_(std::move(locations)), subjects_(std::move(subjects)),
      reconnect_window_(reconnect_window), reply_book_capacity_(reply_book_capacity) {}

RouteResult ChannelRouter::Resolve(ChannelKind kind, const Identity& sender, const std::optional<Identity>& target,
                                   Clock::time_point now) const {
  RouteResult route;
  switch (kind) {
    case ChannelKind::kLocation:
      return ResolveLocation(sender);
    case ChannelKind::kBroadcast: {
      route.subject = subjects_.Global();
      for (auto& identity : registry_->ReachableIdentities(now, reconnect_window_)) {
        if (locations_->MinEligibility(identity)) {
          route.recipients.push_back(std::move(identity));
        }
      }
      return route;
    }
    case ChannelKind::kDirect: {
      // 다른 노드에 접속한 대상도 월드 디렉터리에 있으면 알려진 대상으로 본다.
      if (!target || target->empty() || (!registry_->IsKnown(*target) && !locations_->CurrentLocation(*target))) {
        route.matched = false;
        return route;
      }
      route.subject = subjects_.Direct(*target);
      route.recipients.push_back(*target);
      return route;
    }
    case ChannelKind::kSystem:
      route.subject = subjects_.System();
      route.recipients = registry_->OnlineIdentities();
      return route;
  }
  route.matched = false;
  return route;
}

RouteResult ChannelRouter::ResolvePresenceAudience(const Identity& subject) const {
  return ResolveLocation(subject);
}

RouteResult ChannelRouter::ResolveLocation(const Identity& sender) const {
  RouteResult route;
  auto location = locations_->CurrentLocation(sender);
  if (!location || location->empty()) {
    return route;
  }
  return ResolveAtLocation(*location);
}

RouteResult ChannelRouter::ResolveAtLocation(const LocationKey& location) const {
  RouteResult route;
  route.location = location;
  route.subject = subjects_.Location(location);
  route.recipients = locations_->IdentitiesAt(location);
  return route;
}

void ChannelRouter::NoteDirectDelivery(const Identity& sender, const Identity& target, Clock::time_point now) {
  std::lock_guard<std::mutex> lock(reply_mutex_);
  auto it = last_direct_sender_.find(target);
  if (it != last_direct_sender_.end()) {
    it->second.sender = sender;
    it->second.at = now;
    reply_order_.splice(reply_order_.end(), reply_order_, it->second.position);
    return;
  }
  auto position = reply_order_.insert(reply_order_.end(), target);
  last_direct_sender_.emplace(target, ReplyEntry{sender, now, position});
  if (last_direct_sender_.size() <= reply_book_capacity_) {
    return;
  }
  last_direct_sender_.erase(reply_order_.front());
  reply_order_.pop_front();
}

std::optional<Identity> ChannelRouter::ResolveReply(const Identity& sender) const {
  std::lock_guard<std::mutex> lock(reply_mutex_);
  auto it = last_direct_sender_.find(sender);
  if (it == last_direct_sender_.end()) {
    return std::nullopt;
  }
  return it->second.sender;
}

std::size_t ChannelRouter::ForgetIdentities(const std::vector<Identity>& identities) {
  std::lock_guard<std::mutex> lock(reply_mutex_);
  std::size_t removed = 0;
  for (const auto& identity : identities) {
    auto it = last_direct_sender_.find(identity);
    if (it == last_direct_sender_.end()) {
      continue;
    }
    reply_order_.erase(it->second.position);
    last_direct_sender_.erase(it);
    ++removed;
  }
  return removed;
}

std::size_t ChannelRouter::ReplyBookSize() const {
  std::lock_guard<std::mutex> lock(reply_mutex_);
  return last_direct_sender_.size();
}

}  // namespace mudlink
