/*
 * 설명: 서버 푸시 스트림(Server-Sent Events) 연결을 청크 응답으로 유지하고 레지스트리 송신 인터페이스를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/realtime_flow_test.cpp
 */
#pragma once

#include <array>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "mudlink/auth.hpp"
#include "mudlink/connection_sink.hpp"
#include "mudlink/observability.hpp"
#include "mudlink/realtime.hpp"

namespace mudlink {

class SseSession : public ConnectionSink, public std::enable_shared_from_this<SseSession> {
 public:
  SseSession(boost::beast::tcp_stream stream, AuthenticatedPeer peer, unsigned http_version,
             std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<Observability> observability,
             std::chrono::seconds heartbeat, std::size_t max_queue_messages, std::size_t max_queue_bytes);
  void Run();

  void Deliver(const OutboundMessage& message) override;
  void Close(std::string_view reason) override;

 private:
  void OnHeaderWritten(boost::beast::error_code ec);
  void WatchDisconnect();
  void ScheduleHeartbeat();
  void EnqueueFrame(std::string frame);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void CloseStream(std::string reason);
  void Shutdown();
  void Finish();

  boost::beast::tcp_stream stream_;
  AuthenticatedPeer peer_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
  std::chrono::seconds heartbeat_;
  boost::asio::steady_timer heartbeat_timer_;
  boost::beast::http::response<boost::beast::http::empty_body> response_;
  std::optional<boost::beast::http::response_serializer<boost::beast::http::empty_body>> serializer_;
  std::array<char, 256> discard_{};
  ConnectionId connection_id_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool header_sent_{false};
  bool writing_{false};
  bool closing_{false};
  bool finished_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace mudlink
