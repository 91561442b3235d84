/*
 * 설명: HTTP 요청을 처리하고 상태/메트릭/운영 엔드포인트와 WS 업그레이드, SSE 스트림을 분기한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/ops_endpoints_test.cpp, server/tests/e2e/realtime_flow_test.cpp
 */
#include "mudlink/http_session.hpp"

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "mudlink/api_response.hpp"
#include "mudlink/sse_session.hpp"
#include "mudlink/subjects.hpp"
#include "mudlink/websocket_session.hpp"

namespace mudlink {

namespace {
void Fill(HttpSession::Response& res, boost::beast::http::status status, const nlohmann::json& body) {
  res.result(status);
  res.body() = body.dump();
  res.content_length(res.body().size());
}

std::optional<std::string> StringField(const nlohmann::json& body, const char* key) {
  auto it = body.find(key);
  if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<SessionAuthenticator> authenticator,
                         std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<InMemoryWorld> world,
                         std::shared_ptr<InMemoryMuteList> mutes, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), authenticator_(std::move(authenticator)),
      coordinator_(std::move(coordinator)), world_(std::move(world)), mutes_(std::move(mutes)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  auto target = SplitTarget(std::string_view(req_.target().data(), req_.target().size()));
  if (boost::beast::websocket::is_upgrade(req_) && target.path == "/ws") {
    return HandleWebSocket();
  }
  if (req_.method() == boost::beast::http::verb::get && target.path == "/events") {
    return HandleEventStream();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "mudlink");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  auto path = SplitTarget(std::string_view(req_.target().data(), req_.target().size())).path;

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.1.0"}};
    Fill(*res, http::status::ok, MakeSuccessEnvelope(payload));
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    auto data = coordinator_->Stats();
    data["requests"] = {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}};
    Fill(*res, http::status::ok, MakeSuccessEnvelope(data));
    return SendResponse(res);
  }

  if (path.rfind("/ops/", 0) == 0) {
    if (!HasOpsToken()) {
      Fill(*res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
      return SendResponse(res);
    }
    return HandleOps(path, res);
  }

  Fill(*res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  SendResponse(res);
}

void HttpSession::HandleOps(const std::string& path, const std::shared_ptr<Response>& res) {
  using namespace boost::beast;
  const std::string identities_prefix = "/ops/identities/";

  if (req_.method() == http::verb::get && path == "/ops/status") {
    Fill(*res, http::status::ok, MakeSuccessEnvelope(coordinator_->Stats()));
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path.rfind(identities_prefix, 0) == 0 &&
      path.size() > identities_prefix.size()) {
    auto identity = path.substr(identities_prefix.size());
    Fill(*res, http::status::ok, MakeSuccessEnvelope(coordinator_->Inspect(identity)));
    return SendResponse(res);
  }

  if (req_.method() == http::verb::post && path == "/ops/cleanup") {
    auto report = coordinator_->ForceCleanup();
    Fill(*res, http::status::ok, MakeSuccessEnvelope(report.ToJson()));
    return SendResponse(res);
  }

  if (req_.method() == http::verb::post && path == "/ops/system") {
    auto body = ParseJsonBody();
    auto message = body ? StringField(*body, "message") : std::nullopt;
    if (!message) {
      Fill(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", "message 필드가 필요합니다"));
      return SendResponse(res);
    }
    auto report = coordinator_->SystemAnnounce(*message);
    auto data = RenderSendResult(report.result);
    data["deliveredLive"] = report.delivered_live;
    Fill(*res, http::status::ok, MakeSuccessEnvelope(data));
    return SendResponse(res);
  }

  if (req_.method() == http::verb::post && path == "/ops/world/location") {
    auto body = ParseJsonBody();
    auto identity = body ? StringField(*body, "identity") : std::nullopt;
    if (!identity) {
      Fill(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", "identity 필드가 필요합니다"));
      return SendResponse(res);
    }
    auto location = StringField(*body, "location");
    if (location && !SubjectNamer::IsValidToken(*location)) {
      Fill(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", "location 형식이 올바르지 않습니다"));
      return SendResponse(res);
    }
    bool changed = true;
    if (location) {
      changed = world_->Place(*identity, *location);
    } else {
      world_->Remove(*identity);
    }
    if (changed) {
      coordinator_->OnLocationSynced(*identity, location);
    }
    nlohmann::json data{{"identity", *identity},
                        {"location", location ? nlohmann::json(*location) : nlohmann::json(nullptr)},
                        {"changed", changed}};
    Fill(*res, http::status::ok, MakeSuccessEnvelope(data));
    return SendResponse(res);
  }

  if (req_.method() == http::verb::post && path == "/ops/mutes") {
    auto body = ParseJsonBody();
    auto recipient = body ? StringField(*body, "recipient") : std::nullopt;
    if (!recipient) {
      Fill(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", "recipient 필드가 필요합니다"));
      return SendResponse(res);
    }
    auto sender = StringField(*body, "sender");
    auto channel = StringField(*body, "channel");
    std::optional<ChannelKind> kind = channel ? ParseChannelKind(*channel) : std::nullopt;
    if ((!sender && !channel) || (channel && !kind)) {
      Fill(*res, http::status::bad_request,
           MakeErrorEnvelope("bad_request", "sender 또는 올바른 channel이 필요합니다"));
      return SendResponse(res);
    }
    auto muted_it = body->find("muted");
    const bool muted = muted_it == body->end() || !muted_it->is_boolean() || muted_it->get<bool>();
    if (sender && muted) {
      mutes_->Mute(*recipient, *sender);
    } else if (sender) {
      mutes_->Unmute(*recipient, *sender);
    }
    if (kind && muted) {
      mutes_->MuteChannel(*recipient, *kind);
    } else if (kind) {
      mutes_->UnmuteChannel(*recipient, *kind);
    }
    nlohmann::json data{{"recipient", *recipient}, {"muted", muted}};
    Fill(*res, http::status::ok, MakeSuccessEnvelope(data));
    return SendResponse(res);
  }

  Fill(*res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  SendResponse(res);
}

bool HttpSession::HasOpsToken() const {
  auto header_it = req_.base().find("X-Ops-Token");
  std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
  return !config_.ops_token.empty() && header_token == config_.ops_token;
}

std::optional<nlohmann::json> HttpSession::ParseJsonBody() {
  auto body = nlohmann::json::parse(req_.body(), nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    return std::nullopt;
  }
  return body;
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability_->IncrementError();
  }
  LogContext ctx;
  ctx.trace_id = trace_id_;
  ctx.name = "http.request";
  ctx.latency_ms = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
          .count());
  ctx.detail = {{"method", std::string(req_.method_string())},
                {"target", std::string(req_.target())},
                {"status", res->result_int()}};
  observability_->Log(ctx);
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  request_start_ = std::chrono::steady_clock::now();
  auto peer = authenticator_->Authenticate(req_);
  if (!peer) {
    observability_->IncrementRejectedConnections();
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    Fill(*res, boost::beast::http::status::unauthorized,
         MakeErrorEnvelope("unauthorized", "WS 업그레이드에는 식별자와 세션이 필요합니다"));
    return SendResponse(res);
  }
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "mudlink");
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    observability_->Log(LogLevel::kWarn, "ws.accept_failed", {{"error", ec.message()}});
    boost::beast::error_code ignored;
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), *peer, coordinator_, observability_,
                                     config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
      ->Run();
}

void HttpSession::HandleEventStream() {
  request_start_ = std::chrono::steady_clock::now();
  auto peer = authenticator_->Authenticate(req_);
  if (!peer) {
    observability_->IncrementRejectedConnections();
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    Fill(*res, boost::beast::http::status::unauthorized,
         MakeErrorEnvelope("unauthorized", "이벤트 스트림에는 식별자와 세션이 필요합니다"));
    return SendResponse(res);
  }
  std::make_shared<SseSession>(std::move(stream_), *peer, req_.version(), coordinator_, observability_,
                               std::chrono::seconds(static_cast<long>(config_.sse_heartbeat_seconds)),
                               config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
      ->Run();
}

}  // namespace mudlink
