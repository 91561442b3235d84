/*
 * 설명: WebSocket 메시지를 읽어 채팅 발송/답장/핑을 처리하고, 레지스트리가 보낸 이벤트를 순서대로 전송한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/realtime_flow_test.cpp
 */
#include "mudlink/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

#include "mudlink/api_response.hpp"

namespace mudlink {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   AuthenticatedPeer peer, std::shared_ptr<RealtimeCoordinator> coordinator,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), peer_(std::move(peer)), coordinator_(std::move(coordinator)),
      observability_(std::move(observability)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

void WebSocketSession::Run() {
  auto result = coordinator_->AcceptConnection(peer_.identity, TransportKind::kBidirectionalSocket,
                                               peer_.session_id, shared_from_this());
  if (!result.accepted()) {
    auto reason = std::string(ToString(result.rejected.value_or(RejectReason::kInvalidRequest)));
    SendError(reason, "세션이 유효하지 않습니다", 0);
    CloseWith(boost::beast::websocket::close_code::policy_error, reason);
    return;
  }
  connection_id_ = result.handle->connection_id;
  // 보류 메시지는 실행기에 예약되어 있으므로 준비 이벤트가 먼저 나간다.
  SendEvent("session.ready",
            {{"identity", peer_.identity},
             {"sessionId", peer_.session_id},
             {"connectionId", connection_id_},
             {"drained", result.drained}},
            0);

  auto weak = weak_from_this();
  ws_.control_callback([weak](boost::beast::websocket::frame_type kind, boost::beast::string_view) {
    if (kind != boost::beast::websocket::frame_type::pong) {
      return;
    }
    if (auto self = weak.lock()) {
      self->coordinator_->Touch(self->connection_id_);
    }
  });
  DoRead();
}

void WebSocketSession::Deliver(const OutboundMessage& message) {
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(),
                    [self, text = ToWsJson(message).dump()]() mutable { self->EnqueueMessage(std::move(text)); });
}

void WebSocketSession::Close(std::string_view reason) {
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self, reason = std::string(reason)]() mutable {
    self->CloseWith(boost::beast::websocket::close_code::going_away, std::move(reason));
  });
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    closing_ = true;
    Finish();
    return;
  }
  if (closing_) {
    return;
  }
  coordinator_->Touch(connection_id_);

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  try {
    auto message = nlohmann::json::parse(data);
    std::uint64_t seq = 0;
    auto seq_it = message.find("seq");
    if (seq_it != message.end() && seq_it->is_number_unsigned()) {
      seq = seq_it->get<std::uint64_t>();
    }
    auto type_it = message.find("t");
    auto event_it = message.find("event");
    if (type_it == message.end() || *type_it != "event" || event_it == message.end() || !event_it->is_string()) {
      SendError("bad_request", "잘못된 메시지 형식", seq);
      return DoRead();
    }
    auto payload_it = message.find("p");
    const nlohmann::json payload =
        payload_it != message.end() && payload_it->is_object() ? *payload_it : nlohmann::json::object();
    if (*event_it == "chat.send") {
      HandleChatSend(payload, seq);
    } else if (*event_it == "chat.reply") {
      HandleChatReply(payload, seq);
    } else if (*event_it == "ping") {
      SendEvent("pong", {{"at", ToIsoString(Clock::now())}}, seq);
    } else {
      SendError("bad_request", "알 수 없는 이벤트", seq);
    }
  } catch (const nlohmann::json::exception&) {
    SendError("bad_request", "JSON 파싱 오류", 0);
  }

  DoRead();
}

void WebSocketSession::HandleChatSend(const nlohmann::json& payload, std::uint64_t seq) {
  auto channel_it = payload.find("channel");
  auto message_it = payload.find("message");
  if (channel_it == payload.end() || !channel_it->is_string() || message_it == payload.end() ||
      !message_it->is_string() || message_it->get<std::string>().empty()) {
    SendError("bad_request", "channel과 message 필드가 필요합니다", seq);
    return;
  }
  auto kind = ParseChannelKind(channel_it->get<std::string>());
  if (!kind) {
    SendError("bad_request", "알 수 없는 채널", seq);
    return;
  }
  if (*kind == ChannelKind::kSystem) {
    SendError("forbidden_channel", "시스템 채널에는 보낼 수 없습니다", seq);
    return;
  }
  std::optional<Identity> target;
  if (*kind == ChannelKind::kDirect) {
    auto target_it = payload.find("target");
    if (target_it == payload.end() || !target_it->is_string() || target_it->get<std::string>().empty()) {
      SendError("bad_request", "개인 채널에는 target이 필요합니다", seq);
      return;
    }
    target = target_it->get<std::string>();
  }
  auto report = coordinator_->Send(peer_.identity, *kind, *message_it, target);
  SendResult(report, *kind, seq);
}

void WebSocketSession::HandleChatReply(const nlohmann::json& payload, std::uint64_t seq) {
  auto message_it = payload.find("message");
  if (message_it == payload.end() || !message_it->is_string() || message_it->get<std::string>().empty()) {
    SendError("bad_request", "message 필드가 필요합니다", seq);
    return;
  }
  auto report = coordinator_->Reply(peer_.identity, *message_it);
  SendResult(report, ChannelKind::kDirect, seq);
}

void WebSocketSession::SendResult(const DispatchReport& report, ChannelKind kind, std::uint64_t seq) {
  auto payload = RenderSendResult(report.result);
  payload["channel"] = ToString(kind);
  SendEvent("chat.result", payload, seq);
}

void WebSocketSession::SendEvent(std::string_view event, const nlohmann::json& payload, std::uint64_t seq) {
  WsEnvelope env{.type = "event", .event = std::string(event), .seq = seq, .payload = payload};
  EnqueueMessage(ToWsJson(env).dump());
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  WsEnvelope env{.type = "error", .event = "", .seq = seq, .payload = {{"code", code}, {"message", message}}};
  EnqueueMessage(ToWsJson(env).dump());
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty()) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    Finish();
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
    return;
  }
  if (pending_close_) {
    auto reason = *pending_close_;
    pending_close_.reset();
    auto self = shared_from_this();
    ws_.async_close(reason, [self](boost::beast::error_code) {});
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (close_requested_) {
    return;
  }
  observability_->Log(LogLevel::kWarn, "ws.backpressure_exceeded",
                      {{"identity", peer_.identity}, {"queued", send_queue_.size()}, {"bytes", queued_bytes_}});
  // 쓰는 중인 프레임만 남기고 버린다.
  while (send_queue_.size() > (writing_ ? 1u : 0u)) {
    queued_bytes_ -= send_queue_.back().size();
    send_queue_.pop_back();
  }
  CloseWith(boost::beast::websocket::close_code::policy_error, "backpressure_exceeded");
  Finish();
}

void WebSocketSession::CloseWith(boost::beast::websocket::close_code code, std::string reason) {
  if (close_requested_) {
    return;
  }
  close_requested_ = true;
  closing_ = true;
  boost::beast::websocket::close_reason close_reason{code};
  close_reason.reason = std::move(reason);
  if (writing_) {
    pending_close_ = close_reason;
    return;
  }
  auto self = shared_from_this();
  ws_.async_close(close_reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::Finish() {
  if (finished_ || connection_id_.empty()) {
    return;
  }
  finished_ = true;
  coordinator_->OnConnectionClosed(connection_id_);
}

}  // namespace mudlink
