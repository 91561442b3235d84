/*
 * 설명: 채널 종류와 발신자/대상으로부터 수신자 집합과 브로커 주제를 결정하고 답장 대상을 기록한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/channel_router_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mudlink/connection_registry.hpp"
#include "mudlink/subjects.hpp"
#include "mudlink/types.hpp"
#include "mudlink/world.hpp"

namespace mudlink {

struct RouteResult {
  // 개인 채널에서 대상이 없으면 false. 오류가 아니라 "허공으로 보냄" 결과로 처리한다.
  bool matched{true};
  std::vector<Identity> recipients;
  std::optional<std::string> subject;
  std::optional<LocationKey> location;
};

class ChannelRouter {
 public:
  ChannelRouter(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<LocationService> locations,
                SubjectNamer subjects, std::chrono::seconds reconnect_window,
                std::size_t reply_book_capacity = 10000);

  RouteResult Resolve(ChannelKind kind, const Identity& sender, const std::optional<Identity>& target,
                      Clock::time_point now = Clock::now()) const;
  // 위치 채널 접속/이탈 알림의 청중. 위치는 호출 시점에 다시 조회한다.
  RouteResult ResolvePresenceAudience(const Identity& subject) const;
  // 다른 노드에서 중계된 위치 메시지는 발신자 대신 주제의 위치로 해석한다.
  RouteResult ResolveAtLocation(const LocationKey& location) const;

  void NoteDirectDelivery(const Identity& sender, const Identity& target, Clock::time_point now = Clock::now());
  std::optional<Identity> ResolveReply(const Identity& sender) const;
  std::size_t ForgetIdentities(const std::vector<Identity>& identities);
  std::size_t ReplyBookSize() const;

  const SubjectNamer& Subjects() const { return subjects_; }
  std::chrono::seconds ReconnectWindow() const { return reconnect_window_; }

 private:
  struct ReplyEntry {
    Identity sender;
    Clock::time_point at;
    std::list<Identity>::iterator position;
  };

  RouteResult ResolveLocation(const Identity& sender) const;

  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<LocationService> locations_;
  SubjectNamer subjects_;
  std::chrono::seconds reconnect_window_;
  std::size_t reply_book_capacity_;
  mutable std::mutex reply_mutex_;
  std::unordered_map<Identity, ReplyEntry> last_direct_sender_;
  // 갱신 순서. 앞쪽이 가장 오래된 항목이다.
  std::list<Identity> reply_order_;
};

}  // namespace mudlink
