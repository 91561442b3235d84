/*
 * 설명: JSON 응답 엔벨로프와 SSE 프레임을 생성하고 직렬화한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "mudlink/api_response.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace mudlink {

std::string ToIsoString(Clock::time_point at) {
  auto itt = Clock::to_time_t(at);
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", ToIsoString(Clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", ToIsoString(Clock::now())}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "event") {
    j["event"] = env.event;
  } else {
    j["event"] = nullptr;
  }
  j["p"] = env.payload;
  return j;
}

nlohmann::json ToWsJson(const OutboundMessage& message) {
  return ToWsJson(WsEnvelope{"event", message.event, message.seq, message.payload});
}

std::string ToSseFrame(const OutboundMessage& message) {
  std::string frame;
  frame.append("id: ").append(std::to_string(message.seq)).append("\n");
  frame.append("event: ").append(message.event).append("\n");
  frame.append("data: ").append(ToWsJson(message).dump()).append("\n\n");
  return frame;
}

std::string SseCommentFrame(std::string_view text) {
  std::string frame(": ");
  frame.append(text).append("\n\n");
  return frame;
}

nlohmann::json RenderSendResult(SendResult result) {
  switch (result) {
    case SendResult::kDelivered:
      return {{"result", "delivered"}};
    case SendResult::kRateLimited:
      return {{"result", "rate_limited"}};
    case SendResult::kNoSuchTarget:
    case SendResult::kMuted:
      return {{"result", "sent_into_void"}};
  }
  return {{"result", "sent_into_void"}};
}

}  // namespace mudlink
