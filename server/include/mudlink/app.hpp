/*
 * 설명: 서버 전체 수명주기를 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/realtime_flow_test.cpp, server/tests/e2e/ops_endpoints_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "mudlink/auth.hpp"
#include "mudlink/broker.hpp"
#include "mudlink/config.hpp"
#include "mudlink/observability.hpp"
#include "mudlink/realtime.hpp"
#include "mudlink/world.hpp"

namespace mudlink {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  // SIGINT/SIGTERM 또는 Stop() 호출까지 블록한다. 반환 전에 워커 스레드를 모두 합류시킨다.
  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<RealtimeCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<InMemoryWorld> GetWorld() { return world_; }
  std::shared_ptr<InMemoryMuteList> GetMutes() { return mutes_; }
  std::shared_ptr<InProcessBroker> GetBroker() { return broker_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  void JoinWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<InMemoryWorld> world_;
  std::shared_ptr<InMemoryMuteList> mutes_;
  std::shared_ptr<InProcessBroker> broker_;
  std::shared_ptr<SessionAuthenticator> authenticator_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace mudlink
