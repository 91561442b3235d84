/*
 * 설명: 위치/자격 조회와 음소거 판정 협력자 인터페이스, 그리고 메모리 기반 구현을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/channel_router_test.cpp, server/tests/unit/dispatcher_test.cpp
 */
#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "mudlink/types.hpp"

namespace mudlink {

// 디스패치 경로에서 동기 호출되므로 메모리 조회 수준으로 빨라야 한다.
class LocationService {
 public:
  virtual ~LocationService() = default;

  virtual std::optional<LocationKey> CurrentLocation(const Identity& identity) const = 0;
  virtual std::vector<Identity> IdentitiesAt(const LocationKey& location) const = 0;
  virtual bool MinEligibility(const Identity& identity) const = 0;
};

class MuteService {
 public:
  virtual ~MuteService() = default;

  virtual bool IsMuted(const Identity& recipient, const Identity& sender, ChannelKind kind) const = 0;
};

// 월드 동기화 경로. 위치 멤버십만 갱신하며 접속 이벤트는 만들지 않는다.
class InMemoryWorld : public LocationService {
 public:
  std::optional<LocationKey> CurrentLocation(const Identity& identity) const override;
  std::vector<Identity> IdentitiesAt(const LocationKey& location) const override;
  bool MinEligibility(const Identity& identity) const override;

  // 위치가 실제로 바뀌었으면 true.
  bool Place(const Identity& identity, const LocationKey& location);
  void Remove(const Identity& identity);
  void SetEligibility(const Identity& identity, bool eligible);

 private:
  mutable std::mutex mutex_;
  std::unordered_map<Identity, LocationKey> locations_;
  std::unordered_map<LocationKey, std::set<Identity>> occupants_;
  std::unordered_set<Identity> ineligible_;
};

class InMemoryMuteList : public MuteService {
 public:
  bool IsMuted(const Identity& recipient, const Identity& sender, ChannelKind kind) const override;

  void Mute(const Identity& recipient, const Identity& sender);
  void Unmute(const Identity& recipient, const Identity& sender);
  void MuteChannel(const Identity& recipient, ChannelKind kind);
  void UnmuteChannel(const Identity& recipient, ChannelKind kind);

 private:
  mutable std::mutex mutex_;
  std::map<Identity, std::set<Identity>> muted_senders_;
  std::map<Identity, std::set<ChannelKind>> muted_channels_;
};

}  // namespace mudlink
