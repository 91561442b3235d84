/*
 * 설명: 공용 열거형의 문자열 변환을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/channel_router_test.cpp
 */
#include "mudlink/types.hpp"

namespace mudlink {

std::string_view ToString(TransportKind kind) {
  switch (kind) {
    case TransportKind::kBidirectionalSocket:
      return "websocket";
    case TransportKind::kServerPushStream:
      return "sse";
  }
  return "unknown";
}

std::string_view ToString(ChannelKind kind) {
  switch (kind) {
    case ChannelKind::kLocation:
      return "location";
    case ChannelKind::kBroadcast:
      return "global";
    case ChannelKind::kDirect:
      return "direct";
    case ChannelKind::kSystem:
      return "system";
  }
  return "unknown";
}

std::string_view ToString(SendResult result) {
  switch (result) {
    case SendResult::kDelivered:
      return "delivered";
    case SendResult::kRateLimited:
      return "rate_limited";
    case SendResult::kNoSuchTarget:
      return "no_such_target";
    case SendResult::kMuted:
      return "muted";
  }
  return "unknown";
}

std::optional<ChannelKind> ParseChannelKind(std::string_view value) {
  if (value == "location" || value == "local" || value == "say") {
    return ChannelKind::kLocation;
  }
  if (value == "global" || value == "broadcast") {
    return ChannelKind::kBroadcast;
  }
  if (value == "direct" || value == "whisper") {
    return ChannelKind::kDirect;
  }
  if (value == "system") {
    return ChannelKind::kSystem;
  }
  return std::nullopt;
}

}  // namespace mudlink
