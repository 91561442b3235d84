/*
 * 설명: 게이트웨이 헤더 또는 쿼리 파라미터에서 식별자와 세션을 읽어 검증한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/auth_test.cpp, server/tests/e2e/realtime_flow_test.cpp
 */
#include "mudlink/auth.hpp"

#include "mudlink/subjects.hpp"

namespace mudlink {
namespace {
std::string HeaderValue(const HttpRequest& request, std::string_view name) {
  auto it = request.base().find(boost::beast::string_view(name.data(), name.size()));
  return it == request.base().end() ? std::string() : std::string(it->value());
}
}  // namespace

std::optional<AuthenticatedPeer> GatewayHeaderAuthenticator::Authenticate(const HttpRequest& request) const {
  auto identity = HeaderValue(request, "X-Player-Id");
  auto session = HeaderValue(request, "X-Session-Id");
  if (identity.empty() || session.empty()) {
    auto target = SplitTarget(std::string_view(request.target().data(), request.target().size()));
    if (identity.empty()) {
      auto it = target.query.find("player");
      identity = it == target.query.end() ? std::string() : it->second;
    }
    if (session.empty()) {
      auto it = target.query.find("session");
      session = it == target.query.end() ? std::string() : it->second;
    }
  }
  // 식별자는 브로커 주제 토큰으로도 쓰인다.
  if (!SubjectNamer::IsValidToken(identity) || session.empty() || session.size() > 128) {
    return std::nullopt;
  }
  return AuthenticatedPeer{identity, session};
}

RequestTarget SplitTarget(std::string_view target) {
  RequestTarget result;
  auto qpos = target.find('?');
  if (qpos == std::string_view::npos) {
    result.path = std::string(target);
    return result;
  }
  result.path = std::string(target.substr(0, qpos));
  result.query = ParseQueryParams(target.substr(qpos + 1));
  return result;
}

std::unordered_map<std::string, std::string> ParseQueryParams(std::string_view query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    auto pair = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string_view::npos) {
      params.emplace(std::string(pair.substr(0, eq)), std::string(pair.substr(eq + 1)));
    }
    if (amp == std::string_view::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

}  // namespace mudlink
