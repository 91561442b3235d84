/*
 * 설명: 양방향 소켓 연결의 채팅 이벤트 처리, 송신 큐 백프레셔, 레지스트리 송신 인터페이스를 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/realtime_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "mudlink/auth.hpp"
#include "mudlink/connection_sink.hpp"
#include "mudlink/observability.hpp"
#include "mudlink/realtime.hpp"

namespace mudlink {

class WebSocketSession : public ConnectionSink, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, AuthenticatedPeer peer,
                   std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<Observability> observability,
                   std::size_t max_queue_messages, std::size_t max_queue_bytes);
  void Run();

  // 다른 스레드에서 호출된다. 스트림 실행기에 예약만 한다.
  void Deliver(const OutboundMessage& message) override;
  void Close(std::string_view reason) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleChatSend(const nlohmann::json& payload, std::uint64_t seq);
  void HandleChatReply(const nlohmann::json& payload, std::uint64_t seq);
  void SendResult(const DispatchReport& report, ChannelKind kind, std::uint64_t seq);
  void SendEvent(std::string_view event, const nlohmann::json& payload, std::uint64_t seq);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void CloseWith(boost::beast::websocket::close_code code, std::string reason);
  void Finish();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  AuthenticatedPeer peer_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
  ConnectionId connection_id_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool close_requested_{false};
  bool finished_{false};
  std::optional<boost::beast::websocket::close_reason> pending_close_;
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace mudlink
