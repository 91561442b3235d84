/*
 * 설명: 정리 작업 (a)~(e)를 짧은 잠금 단위로 수행하고 결과를 보고/계수한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/janitor_test.cpp
 */
#include "mudlink/janitor.hpp"

#include <unistd.h>

#include <fstream>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

#include "mudlink/api_response.hpp"

namespace mudlink {

std::string_view ToString(SweepTrigger trigger) {
  switch (trigger) {
    case SweepTrigger::kScheduled:
      return "scheduled";
    case SweepTrigger::kMemoryPressure:
      return "memory_pressure";
    case SweepTrigger::kForced:
      return "forced";
  }
  return "unknown";
}

std::size_t JanitorReport::TotalEvictions() const {
  return stale_connections_closed + pending_expired + rate_buckets_expired + pending_capped + rate_buckets_capped +
         identities_pruned;
}

nlohmann::json JanitorReport::ToJson() const {
  nlohmann::json j{{"trigger", ToString(trigger)},
                   {"at", ToIsoString(at)},
                   {"staleConnectionsClosed", stale_connections_closed},
                   {"pendingExpired", pending_expired},
                   {"rateBucketsExpired", rate_buckets_expired},
                   {"pendingCapped", pending_capped},
                   {"rateBucketsCapped", rate_buckets_capped},
                   {"identitiesPruned", identities_pruned},
                   {"replyEntriesPruned", reply_entries_pruned},
                   {"durationMs", duration_ms}};
  j["memoryRatio"] = memory_ratio ? nlohmann::json(*memory_ratio) : nlohmann::json(nullptr);
  return j;
}

std::optional<double> ReadProcessMemoryRatio() {
  std::ifstream statm("/proc/self/statm");
  long total_pages = 0;
  long resident_pages = 0;
  if (!(statm >> total_pages >> resident_pages)) {
    return std::nullopt;
  }
  const long physical_pages = ::sysconf(_SC_PHYS_PAGES);
  if (physical_pages <= 0) {
    return std::nullopt;
  }
  return static_cast<double>(resident_pages) / static_cast<double>(physical_pages);
}

Janitor::Janitor(boost::asio::any_io_executor executor, std::shared_ptr<ConnectionRegistry> registry,
                 std::shared_ptr<PendingMessageBuffer> pending, std::shared_ptr<ChannelRateLimiter> limiter,
                 std::shared_ptr<ChannelRouter> router, std::shared_ptr<Observability> observability,
                 JanitorConfig config, MemoryProbe probe)
    : strand_(boost::asio::make_strand(executor)), timer_(strand_), registry_(std::move(registry)),
      pending_(std::move(pending)), limiter_(std::move(limiter)), router_(std::move(router)),
      observability_(std::move(observability)), config_(config), probe_(std::move(probe)),
      last_sweep_at_(Clock::now()) {}

void Janitor::Start() {
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() { self->ScheduleProbe(); });
}

void Janitor::Stop() {
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    self->stopped_ = true;
    self->timer_.cancel();
  });
}

void Janitor::ScheduleProbe() {
  if (stopped_) {
    return;
  }
  timer_.expires_after(config_.probe_interval);
  auto self = shared_from_this();
  timer_.async_wait(boost::asio::bind_executor(strand_, [self](const boost::system::error_code& ec) {
    if (ec || self->stopped_) {
      return;
    }
    try {
      self->ProbeOnce();
    } catch (const std::exception& ex) {
      self->observability_->IncrementInvariantViolations();
      self->observability_->Log(LogLevel::kError, "janitor.sweep_failed", {{"error", ex.what()}});
    }
    self->ScheduleProbe();
  }));
}

std::optional<JanitorReport> Janitor::ProbeOnce(Clock::time_point now) {
  Clock::time_point last;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    last = last_sweep_at_;
  }
  if (now - last >= config_.interval) {
    return Sweep(SweepTrigger::kScheduled, now);
  }
  auto ratio = probe_ ? probe_() : std::nullopt;
  if (ratio && *ratio >= config_.memory_threshold) {
    observability_->Log(LogLevel::kWarn, "janitor.memory_pressure",
                        {{"ratio", *ratio}, {"threshold", config_.memory_threshold}});
    auto report = Sweep(SweepTrigger::kMemoryPressure, now);
    return report;
  }
  return std::nullopt;
}

JanitorReport Janitor::Sweep(SweepTrigger trigger, Clock::time_point now) {
  std::lock_guard<std::mutex> sweep_lock(sweep_mutex_);
  const auto started = std::chrono::steady_clock::now();
  JanitorReport report;
  report.trigger = trigger;
  report.at = now;
  report.memory_ratio = probe_ ? probe_() : std::nullopt;

  // (a) 활동이 끊긴 연결
  for (const auto& record : registry_->StaleConnections(now, config_.max_connection_age)) {
    if (registry_->CloseAndUnregister(record.id, "idle_timeout", now)) {
      ++report.stale_connections_closed;
    }
  }
  // (b), (c)
  report.pending_expired = pending_->EvictExpired(now);
  report.rate_buckets_expired = limiter_->EvictExpired(now);
  // (d)
  report.pending_capped = pending_->CapPerIdentity(config_.max_pending_per_identity);
  report.rate_buckets_capped = limiter_->CapEntries(config_.max_rate_limit_entries);
  // (e)
  auto pruned = registry_->PruneOffline(now, config_.presence_retention);
  report.identities_pruned = pruned.size();
  if (!pruned.empty()) {
    report.reply_entries_pruned = router_->ForgetIdentities(pruned);
    for (const auto& identity : pruned) {
      pending_->Discard(identity);
      limiter_->Forget(identity);
    }
  }

  report.duration_ms = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
  observability_->AddJanitorEvictions(report.TotalEvictions());
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    switch (trigger) {
      case SweepTrigger::kScheduled:
        ++stats_.scheduled_sweeps;
        break;
      case SweepTrigger::kMemoryPressure:
        ++stats_.pressure_sweeps;
        break;
      case SweepTrigger::kForced:
        ++stats_.forced_sweeps;
        break;
    }
    stats_.total_evictions += report.TotalEvictions();
    stats_.last_report = report;
    last_sweep_at_ = now;
  }

  LogContext ctx;
  ctx.level = report.TotalEvictions() > 0 ? LogLevel::kInfo : LogLevel::kDebug;
  ctx.trace_id = observability_->NextTraceId();
  ctx.name = "janitor.sweep";
  ctx.latency_ms = report.duration_ms;
  ctx.detail = report.ToJson();
  observability_->Log(ctx);
  return report;
}

JanitorStats Janitor::Stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

}  // namespace mudlink
