/*
 * 설명: REST/WS/SSE 응답 엔벨로프 생성을 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "mudlink/connection_sink.hpp"
#include "mudlink/types.hpp"

namespace mudlink {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

struct WsEnvelope {
  std::string type;
  std::string event;
  std::uint64_t seq;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);
nlohmann::json ToWsJson(const OutboundMessage& message);

// "event: {name}\ndata: {json}\n\n" 형식. 주석 프레임은 하트비트에 쓴다.
std::string ToSseFrame(const OutboundMessage& message);
std::string SseCommentFrame(std::string_view text);

// 발송 결과의 유선 표현. 대상 없음과 음소거는 구분되지 않는다.
nlohmann::json RenderSendResult(SendResult result);

std::string ToIsoString(Clock::time_point at);

}  // namespace mudlink
