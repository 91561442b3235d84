/*
 * 설명: 서버 수명주기와 리스닝 스레드, 환경설정 로딩을 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/realtime_flow_test.cpp,
 *         server/tests/e2e/ops_endpoints_test.cpp
 */
#include "mudlink/app.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <optional>
#include <string>
#include <stdexcept>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "mudlink/http_session.hpp"
#include "mudlink/random_id.hpp"

namespace mudlink {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<SessionAuthenticator> authenticator, std::shared_ptr<RealtimeCoordinator> coordinator,
           std::shared_ptr<InMemoryWorld> world, std::shared_ptr<InMemoryMuteList> mutes,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config),
        authenticator_(std::move(authenticator)), coordinator_(std::move(coordinator)), world_(std::move(world)),
        mutes_(std::move(mutes)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->authenticator_,
                                          self->coordinator_, self->world_, self->mutes_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<SessionAuthenticator> authenticator_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<InMemoryWorld> world_;
  std::shared_ptr<InMemoryMuteList> mutes_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  if (config_.node_id.empty()) {
    config_.node_id = "node-" + RandomHex(6);
  }
  observability_ = std::make_shared<Observability>(ParseLogLevel(config_.log_level));
  world_ = std::make_shared<InMemoryWorld>();
  mutes_ = std::make_shared<InMemoryMuteList>();
  broker_ = std::make_shared<InProcessBroker>(ioc_.get_executor());
  authenticator_ = std::make_shared<GatewayHeaderAuthenticator>();
  coordinator_ = std::make_shared<RealtimeCoordinator>(ioc_.get_executor(), config_, world_, mutes_, broker_,
                                                       observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, authenticator_, coordinator_, world_, mutes_,
                                           observability_);
    listener_->Run();
    coordinator_->Start();
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->Log(LogLevel::kInfo, "server.signal_received", {{"signal", signal_number}});
      Stop();
    });
    observability_->Log(LogLevel::kInfo, "server.started", {{"port", config_.port}, {"nodeId", config_.node_id}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->IncrementInvariantViolations();
    observability_->Log(LogLevel::kError, "server.run_failed", {{"error", ex.what()}});
    Stop();
  }
  JoinWorkers();
  observability_->Log(LogLevel::kInfo, "server.stopped", {{"nodeId", config_.node_id}});
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::JoinWorkers() {
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

// 실행기 스레드(시그널 처리기)에서도 호출되므로 합류는 Run()이 맡는다.
void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  coordinator_->Stop();
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
}

AppConfig DefaultConfig() {
  AppConfig cfg;
  cfg.port = 8080;
  cfg.log_level = "info";
  cfg.ops_token = "";
  cfg.node_id = "";
  cfg.subject_root = "chat";
  cfg.ws_queue_limit_messages = 64;
  cfg.ws_queue_limit_bytes = 262144;
  cfg.rate_limit_window_seconds = 60;
  cfg.rate_limit_direct = 30;
  cfg.rate_limit_location = 20;
  cfg.rate_limit_broadcast = 10;
  cfg.rate_limit_system = 100;
  cfg.pending_max_per_identity = 50;
  cfg.pending_ttl_seconds = 60;
  cfg.reconnect_window_seconds = 60;
  cfg.janitor_interval_seconds = 300;
  cfg.janitor_probe_interval_seconds = 5;
  cfg.janitor_memory_threshold = 0.8;
  cfg.max_connection_age_seconds = 300;
  cfg.presence_retention_seconds = 900;
  cfg.max_rate_limit_entries = 100000;
  cfg.sse_heartbeat_seconds = 15;
  return cfg;
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key) -> std::optional<std::string> {
    const char* val = std::getenv(key);
    return val ? std::optional<std::string>{val} : std::nullopt;
  };
  auto read_size = [&](const char* key, std::size_t def) -> std::size_t {
    auto value = get_env(key);
    return value ? static_cast<std::size_t>(std::stoul(*value)) : def;
  };

  AppConfig cfg = DefaultConfig();
  cfg.port = static_cast<unsigned short>(read_size("SERVER_PORT", cfg.port));
  cfg.log_level = get_env("LOG_LEVEL").value_or(cfg.log_level);
  cfg.ops_token = get_env("OPS_TOKEN").value_or(cfg.ops_token);
  cfg.node_id = get_env("NODE_ID").value_or(cfg.node_id);
  cfg.subject_root = get_env("SUBJECT_ROOT").value_or(cfg.subject_root);
  cfg.ws_queue_limit_messages = read_size("WS_QUEUE_LIMIT_MESSAGES", cfg.ws_queue_limit_messages);
  cfg.ws_queue_limit_bytes = read_size("WS_QUEUE_LIMIT_BYTES", cfg.ws_queue_limit_bytes);
  cfg.rate_limit_window_seconds = read_size("RATE_LIMIT_WINDOW_SECONDS", cfg.rate_limit_window_seconds);
  cfg.rate_limit_direct = read_size("RATE_LIMIT_DIRECT", cfg.rate_limit_direct);
  cfg.rate_limit_location = read_size("RATE_LIMIT_LOCATION", cfg.rate_limit_location);
  cfg.rate_limit_broadcast = read_size("RATE_LIMIT_BROADCAST", cfg.rate_limit_broadcast);
  cfg.rate_limit_system = read_size("RATE_LIMIT_SYSTEM", cfg.rate_limit_system);
  cfg.pending_max_per_identity = read_size("PENDING_MAX_PER_IDENTITY", cfg.pending_max_per_identity);
  cfg.pending_ttl_seconds = read_size("PENDING_TTL_SECONDS", cfg.pending_ttl_seconds);
  cfg.reconnect_window_seconds = read_size("RECONNECT_WINDOW_SECONDS", cfg.reconnect_window_seconds);
  cfg.janitor_interval_seconds = read_size("JANITOR_INTERVAL_SECONDS", cfg.janitor_interval_seconds);
  cfg.janitor_probe_interval_seconds = read_size("JANITOR_PROBE_INTERVAL_SECONDS", cfg.janitor_probe_interval_seconds);
  if (auto threshold = get_env("JANITOR_MEMORY_THRESHOLD")) {
    cfg.janitor_memory_threshold = std::stod(*threshold);
  }
  cfg.max_connection_age_seconds = read_size("MAX_CONNECTION_AGE_SECONDS", cfg.max_connection_age_seconds);
  cfg.presence_retention_seconds = read_size("PRESENCE_RETENTION_SECONDS", cfg.presence_retention_seconds);
  cfg.max_rate_limit_entries = read_size("MAX_RATE_LIMIT_ENTRIES", cfg.max_rate_limit_entries);
  cfg.sse_heartbeat_seconds = read_size("SSE_HEARTBEAT_SECONDS", cfg.sse_heartbeat_seconds);
  if (cfg.janitor_memory_threshold <= 0.0 || cfg.janitor_memory_threshold > 1.0) {
    throw std::out_of_range("JANITOR_MEMORY_THRESHOLD는 (0, 1] 범위여야 합니다");
  }
  return cfg;
}

}  // namespace mudlink
