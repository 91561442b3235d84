/*
 * 설명: 실시간 코어 전반에서 공유하는 식별자, 채널 종류, 전송 종류, 발송 결과 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/channel_router_test.cpp, server/tests/unit/dispatcher_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mudlink {

using Identity = std::string;
using ConnectionId = std::string;
using SessionId = std::string;
using LocationKey = std::string;
using Clock = std::chrono::system_clock;

enum class TransportKind { kBidirectionalSocket, kServerPushStream };

enum class ChannelKind { kLocation, kBroadcast, kDirect, kSystem };

inline constexpr std::size_t kChannelKindCount = 4;

enum class SendResult { kDelivered, kRateLimited, kNoSuchTarget, kMuted };

std::string_view ToString(TransportKind kind);
std::string_view ToString(ChannelKind kind);
std::string_view ToString(SendResult result);
std::optional<ChannelKind> ParseChannelKind(std::string_view value);

inline std::size_t ChannelIndex(ChannelKind kind) { return static_cast<std::size_t>(kind); }

// 식별자 해시로 샤드를 고른다. 같은 식별자는 항상 같은 샤드에 들어간다.
inline std::size_t ShardIndex(const Identity& identity, std::size_t shard_count) {
  return std::hash<Identity>{}(identity) % shard_count;
}

}  // namespace mudlink
