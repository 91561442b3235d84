/*
 * 설명: 구조화 로그 출력과 메트릭 카운터 스냅샷을 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#include "mudlink/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace mudlink {
namespace {
std::string_view LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

// 여러 스레드의 로그 라인이 섞이지 않도록 출력 구간만 직렬화한다.
std::mutex& LogMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

Observability::Observability(LogLevel min_level, std::ostream* sink)
    : min_level_(min_level), sink_(sink ? sink : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.delivered_live = delivered_live_.load();
  snapshot.enqueued_pending = enqueued_pending_.load();
  snapshot.rate_limited = rate_limited_.load();
  snapshot.muted = muted_.load();
  snapshot.no_such_target = no_such_target_.load();
  snapshot.presence_events = presence_events_.load();
  snapshot.rejected_connections = rejected_connections_.load();
  snapshot.broker_failures = broker_failures_.load();
  snapshot.janitor_evictions = janitor_evictions_.load();
  snapshot.invariant_violations = invariant_violations_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.identity) {
    log_json["identity"] = *ctx.identity;
  }
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(LogMutex());
  *sink_ << log_json.dump() << std::endl;
}

void Observability::Log(LogLevel level, std::string name, nlohmann::json detail) const {
  if (!Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.level = level;
  ctx.name = std::move(name);
  ctx.detail = std::move(detail);
  Log(ctx);
}

}  // namespace mudlink
