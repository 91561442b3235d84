/*
 * 설명: 레지스트리가 보관하는 전송 연결의 송신 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp, server/tests/unit/dispatcher_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mudlink {

struct OutboundMessage {
  std::string event;
  std::uint64_t seq{0};
  nlohmann::json payload;
};

// WebSocket/SSE 세션이 구현한다. 두 함수 모두 전송 작업을 예약만 하고 즉시 반환해야 하며,
// 같은 스레드에서 레지스트리를 다시 호출해서는 안 된다.
class ConnectionSink {
 public:
  virtual ~ConnectionSink() = default;

  virtual void Deliver(const OutboundMessage& message) = 0;
  virtual void Close(std::string_view reason) = 0;
};

}  // namespace mudlink
