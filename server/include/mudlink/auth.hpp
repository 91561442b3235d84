/*
 * 설명: 전송 요청에서 사전 검증된 (식별자, 세션) 쌍을 꺼내는 인증 협력자를 정의한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/auth_test.cpp, server/tests/e2e/realtime_flow_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/beast/http.hpp>

#include "mudlink/types.hpp"

namespace mudlink {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;

struct AuthenticatedPeer {
  Identity identity;
  SessionId session_id;
};

class SessionAuthenticator {
 public:
  virtual ~SessionAuthenticator() = default;

  virtual std::optional<AuthenticatedPeer> Authenticate(const HttpRequest& request) const = 0;
};

// 상위 게이트웨이가 인증을 마치고 X-Player-Id / X-Session-Id 헤더를 붙인다고 가정한다.
// EventSource처럼 헤더를 못 붙이는 클라이언트는 player / session 쿼리 파라미터를 쓴다.
class GatewayHeaderAuthenticator : public SessionAuthenticator {
 public:
  std::optional<AuthenticatedPeer> Authenticate(const HttpRequest& request) const override;
};

struct RequestTarget {
  std::string path;
  std::unordered_map<std::string, std::string> query;
};

RequestTarget SplitTarget(std::string_view target);
std::unordered_map<std::string, std::string> ParseQueryParams(std::string_view query);

}  // namespace mudlink
