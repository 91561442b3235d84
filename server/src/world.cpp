/*
 * 설명: 메모리 기반 위치 디렉터리와 음소거 목록을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/channel_router_test.cpp, server/tests/unit/dispatcher_test.cpp
 */
#include "mudlink/world.hpp"

namespace mudlink {

std::optional<LocationKey> InMemoryWorld::CurrentLocation(const Identity& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = locations_.find(identity);
  if (it == locations_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Identity> InMemoryWorld::IdentitiesAt(const LocationKey& location) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = occupants_.find(location);
  if (it == occupants_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

bool InMemoryWorld::MinEligibility(const Identity& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ineligible_.count(identity) == 0;
}

bool InMemoryWorld::Place(const Identity& identity, const LocationKey& location) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = locations_.find(identity);
  if (it != locations_.end() && it->second == location) {
    return false;
  }
  if (it != locations_.end()) {
    auto occ_it = occupants_.find(it->second);
    if (occ_it != occupants_.end()) {
      occ_it->second.erase(identity);
      if (occ_it->second.empty()) {
        occupants_.erase(occ_it);
      }
    }
  }
  locations_[identity] = location;
  occupants_[location].insert(identity);
  return true;
}

void InMemoryWorld::Remove(const Identity& identity) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = locations_.find(identity);
  if (it == locations_.end()) {
    return;
  }
  auto occ_it = occupants_.find(it->second);
  if (occ_it != occupants_.end()) {
    occ_it->second.erase(identity);
    if (occ_it->second.empty()) {
      occupants_.erase(occ_it);
    }
  }
  locations_.erase(it);
}

void InMemoryWorld::SetEligibility(const Identity& identity, bool eligible) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (eligible) {
    ineligible_.erase(identity);
  } else {
    ineligible_.insert(identity);
  }
}

bool InMemoryMuteList::IsMuted(const Identity& recipient, const Identity& sender, ChannelKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto channel_it = muted_channels_.find(recipient);
  if (channel_it != muted_channels_.end() && channel_it->second.count(kind) > 0) {
    return true;
  }
  auto sender_it = muted_senders_.find(recipient);
  return sender_it != muted_senders_.end() && sender_it->second.count(sender) > 0;
}

void InMemoryMuteList::Mute(const Identity& recipient, const Identity& sender) {
  std::lock_guard<std::mutex> lock(mutex_);
  muted_senders_[recipient].insert(sender);
}

void InMemoryMuteList::Unmute(const Identity& recipient, const Identity& sender) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = muted_senders_.find(recipient);
  if (it == muted_senders_.end()) {
    return;
  }
  it->second.erase(sender);
  if (it->second.empty()) {
    muted_senders_.erase(it);
  }
}

void InMemoryMuteList::MuteChannel(const Identity& recipient, ChannelKind kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  muted_channels_[recipient].insert(kind);
}

void InMemoryMuteList::UnmuteChannel(const Identity& recipient, ChannelKind kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = muted_channels_.find(recipient);
  if (it == muted_channels_.end()) {
    return;
  }
  it->second.erase(kind);
  if (it->second.empty()) {
    muted_channels_.erase(it);
  }
}

}  // namespace mudlink
