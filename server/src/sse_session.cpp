/*
 * 설명: text/event-stream 청크 응답을 열고, 이벤트 프레임과 하트비트를 순서대로 전송한다.
 *       클라이언트 종료는 소켓 읽기 실패로 감지한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/realtime_flow_test.cpp
 */
#include "mudlink/sse_session.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

#include "mudlink/api_response.hpp"

namespace mudlink {

SseSession::SseSession(boost::beast::tcp_stream stream, AuthenticatedPeer peer, unsigned http_version,
                       std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<Observability> observability,
                       std::chrono::seconds heartbeat, std::size_t max_queue_messages, std::size_t max_queue_bytes)
    : stream_(std::move(stream)), peer_(std::move(peer)), coordinator_(std::move(coordinator)),
      observability_(std::move(observability)), heartbeat_(heartbeat), heartbeat_timer_(stream_.get_executor()),
      response_(boost::beast::http::status::ok, http_version), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {
  response_.set(boost::beast::http::field::server, "mudlink");
  response_.set(boost::beast::http::field::content_type, "text/event-stream");
  response_.set(boost::beast::http::field::cache_control, "no-cache");
  response_.keep_alive(true);
  response_.chunked(true);
}

void SseSession::Run() {
  // 스트림은 무기한 유지되므로 HTTP 요청 타임아웃을 해제한다.
  stream_.expires_never();
  serializer_.emplace(response_);
  auto self = shared_from_this();
  boost::beast::http::async_write_header(stream_, *serializer_, [self](boost::beast::error_code ec, std::size_t) {
    self->OnHeaderWritten(ec);
  });
}

void SseSession::OnHeaderWritten(boost::beast::error_code ec) {
  if (ec) {
    closing_ = true;
    return;
  }
  header_sent_ = true;
  auto result = coordinator_->AcceptConnection(peer_.identity, TransportKind::kServerPushStream, peer_.session_id,
                                               shared_from_this());
  if (!result.accepted()) {
    auto reason = std::string(ToString(result.rejected.value_or(RejectReason::kInvalidRequest)));
    EnqueueFrame(ToSseFrame(OutboundMessage{"session.rejected", 0, {{"code", reason}}}));
    CloseStream(reason);
    return;
  }
  connection_id_ = result.handle->connection_id;
  EnqueueFrame(ToSseFrame(OutboundMessage{"session.ready",
                                          0,
                                          {{"identity", peer_.identity},
                                           {"sessionId", peer_.session_id},
                                           {"connectionId", connection_id_},
                                           {"drained", result.drained}}}));
  WatchDisconnect();
  ScheduleHeartbeat();
}

void SseSession::Deliver(const OutboundMessage& message) {
  auto self = shared_from_this();
  boost::asio::post(stream_.get_executor(),
                    [self, frame = ToSseFrame(message)]() mutable { self->EnqueueFrame(std::move(frame)); });
}

void SseSession::Close(std::string_view reason) {
  auto self = shared_from_this();
  boost::asio::post(stream_.get_executor(),
                    [self, reason = std::string(reason)]() mutable { self->CloseStream(std::move(reason)); });
}

void SseSession::WatchDisconnect() {
  auto self = shared_from_this();
  stream_.async_read_some(boost::asio::buffer(discard_), [self](boost::beast::error_code ec, std::size_t) {
    if (ec) {
      self->closing_ = true;
      self->heartbeat_timer_.cancel();
      self->Finish();
      return;
    }
    self->WatchDisconnect();
  });
}

void SseSession::ScheduleHeartbeat() {
  if (closing_) {
    return;
  }
  heartbeat_timer_.expires_after(heartbeat_);
  auto self = shared_from_this();
  heartbeat_timer_.async_wait([self](const boost::system::error_code& ec) {
    if (ec || self->closing_) {
      return;
    }
    self->coordinator_->Touch(self->connection_id_);
    self->EnqueueFrame(SseCommentFrame("heartbeat"));
    self->ScheduleHeartbeat();
  });
}

void SseSession::EnqueueFrame(std::string frame) {
  if (closing_ || !header_sent_) {
    return;
  }
  const auto frame_size = frame.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + frame_size > max_queue_bytes_) {
    observability_->Log(LogLevel::kWarn, "sse.backpressure_exceeded",
                        {{"identity", peer_.identity}, {"queued", send_queue_.size()}});
    closing_ = true;
    heartbeat_timer_.cancel();
    Finish();
    if (!writing_) {
      Shutdown();
    }
    return;
  }
  send_queue_.push_back(std::move(frame));
  queued_bytes_ += frame_size;
  if (!writing_) {
    WriteNext();
  }
}

void SseSession::WriteNext() {
  if (send_queue_.empty()) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  boost::asio::async_write(stream_, boost::beast::http::make_chunk(boost::asio::buffer(send_queue_.front())),
                           [self](boost::beast::error_code ec, std::size_t) { self->OnWrite(ec); });
}

void SseSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    heartbeat_timer_.cancel();
    Finish();
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
    return;
  }
  if (closing_) {
    Shutdown();
  }
}

void SseSession::CloseStream(std::string reason) {
  if (closing_) {
    return;
  }
  EnqueueFrame(ToSseFrame(OutboundMessage{"session.closed", 0, {{"reason", reason}}}));
  closing_ = true;
  heartbeat_timer_.cancel();
  if (!writing_) {
    Shutdown();
  }
}

void SseSession::Shutdown() {
  auto self = shared_from_this();
  boost::asio::async_write(stream_, boost::beast::http::make_chunk_last(),
                           [self](boost::beast::error_code, std::size_t) {
                             boost::beast::error_code ignored;
                             self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
                           });
}

void SseSession::Finish() {
  if (finished_ || connection_id_.empty()) {
    return;
  }
  finished_ = true;
  coordinator_->OnConnectionClosed(connection_id_);
}

}  // namespace mudlink
