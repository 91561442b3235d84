/*
 * 설명: HTTP 연결을 처리하고 상태/메트릭/운영 엔드포인트, WS 업그레이드, SSE 스트림을 분기한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/ops_endpoints_test.cpp, server/tests/e2e/realtime_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "mudlink/auth.hpp"
#include "mudlink/config.hpp"
#include "mudlink/observability.hpp"
#include "mudlink/realtime.hpp"
#include "mudlink/world.hpp"

namespace mudlink {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<SessionAuthenticator> authenticator, std::shared_ptr<RealtimeCoordinator> coordinator,
              std::shared_ptr<InMemoryWorld> world, std::shared_ptr<InMemoryMuteList> mutes,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleOps(const std::string& path, const std::shared_ptr<Response>& res);
  bool HasOpsToken() const;
  std::optional<nlohmann::json> ParseJsonBody();
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();
  void HandleEventStream();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<SessionAuthenticator> authenticator_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<InMemoryWorld> world_;
  std::shared_ptr<InMemoryMuteList> mutes_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace mudlink
