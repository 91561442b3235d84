/*
 * 설명: 구조화 로그와 실시간 코어 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/ops_endpoints_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mudlink {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view value);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string trace_id;
  std::optional<std::string> identity;
  std::optional<std::string> connection_id;
  std::optional<std::string> session_id;
  std::string name;
  long latency_ms{0};
  nlohmann::json detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t delivered_live{0};
  std::uint64_t enqueued_pending{0};
  std::uint64_t rate_limited{0};
  std::uint64_t muted{0};
  std::uint64_t no_such_target{0};
  std::uint64_t presence_events{0};
  std::uint64_t rejected_connections{0};
  std::uint64_t broker_failures{0};
  std::uint64_t janitor_evictions{0};
  std::uint64_t invariant_violations{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream* sink = nullptr);

  std::string NextTraceId();
  void IncrementRequest() { request_total_.fetch_add(1); }
  void IncrementError() { request_errors_.fetch_add(1); }
  void AddDeliveredLive(std::uint64_t count) { delivered_live_.fetch_add(count); }
  void AddEnqueuedPending(std::uint64_t count) { enqueued_pending_.fetch_add(count); }
  void IncrementRateLimited() { rate_limited_.fetch_add(1); }
  void AddMuted(std::uint64_t count) { muted_.fetch_add(count); }
  void IncrementNoSuchTarget() { no_such_target_.fetch_add(1); }
  void IncrementPresenceEvents() { presence_events_.fetch_add(1); }
  void IncrementRejectedConnections() { rejected_connections_.fetch_add(1); }
  void IncrementBrokerFailures() { broker_failures_.fetch_add(1); }
  void AddJanitorEvictions(std::uint64_t count) { janitor_evictions_.fetch_add(count); }
  void IncrementInvariantViolations() { invariant_violations_.fetch_add(1); }

  MetricsSnapshot Snapshot() const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;
  void Log(LogLevel level, std::string name, nlohmann::json detail = nullptr) const;

 private:
  LogLevel min_level_;
  std::ostream* sink_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> delivered_live_{0};
  std::atomic<std::uint64_t> enqueued_pending_{0};
  std::atomic<std::uint64_t> rate_limited_{0};
  std::atomic<std::uint64_t> muted_{0};
  std::atomic<std::uint64_t> no_such_target_{0};
  std::atomic<std::uint64_t> presence_events_{0};
  std::atomic<std::uint64_t> rejected_connections_{0};
  std::atomic<std::uint64_t> broker_failures_{0};
  std::atomic<std::uint64_t> janitor_evictions_{0};
  std::atomic<std::uint64_t> invariant_violations_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace mudlink
