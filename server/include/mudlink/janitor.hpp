/*
 * 설명: 주기적으로 또는 메모리 압박 시 오래된 연결, 만료된 보류 메시지, 발송 제한 버킷, 오프라인 식별자를 정리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/janitor_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <nlohmann/json.hpp>

#include "mudlink/channel_router.hpp"
#include "mudlink/connection_registry.hpp"
#include "mudlink/observability.hpp"
#include "mudlink/pending_buffer.hpp"
#include "mudlink/rate_limiter.hpp"

namespace mudlink {

struct JanitorConfig {
  std::chrono::seconds interval{300};
  std::chrono::seconds probe_interval{5};
  double memory_threshold{0.8};
  std::chrono::seconds max_connection_age{300};
  std::chrono::seconds presence_retention{900};
  std::size_t max_pending_per_identity{50};
  std::size_t max_rate_limit_entries{100000};
};

enum class SweepTrigger { kScheduled, kMemoryPressure, kForced };

std::string_view ToString(SweepTrigger trigger);

struct JanitorReport {
  SweepTrigger trigger{SweepTrigger::kScheduled};
  Clock::time_point at{};
  std::size_t stale_connections_closed{0};
  std::size_t pending_expired{0};
  std::size_t rate_buckets_expired{0};
  std::size_t pending_capped{0};
  std::size_t rate_buckets_capped{0};
  std::size_t identities_pruned{0};
  std::size_t reply_entries_pruned{0};
  std::optional<double> memory_ratio;
  long duration_ms{0};

  std::size_t TotalEvictions() const;
  nlohmann::json ToJson() const;
};

struct JanitorStats {
  std::uint64_t scheduled_sweeps{0};
  std::uint64_t pressure_sweeps{0};
  std::uint64_t forced_sweeps{0};
  std::uint64_t total_evictions{0};
  std::optional<JanitorReport> last_report;
};

// 물리 메모리 대비 상주 메모리 비율. 읽을 수 없으면 nullopt.
using MemoryProbe = std::function<std::optional<double>()>;

std::optional<double> ReadProcessMemoryRatio();

class Janitor : public std::enable_shared_from_this<Janitor> {
 public:
  Janitor(boost::asio::any_io_executor executor, std::shared_ptr<ConnectionRegistry> registry,
          std::shared_ptr<PendingMessageBuffer> pending, std::shared_ptr<ChannelRateLimiter> limiter,
          std::shared_ptr<ChannelRouter> router, std::shared_ptr<Observability> observability,
          JanitorConfig config, MemoryProbe probe = ReadProcessMemoryRatio);

  void Start();
  void Stop();

  JanitorReport Sweep(SweepTrigger trigger, Clock::time_point now = Clock::now());
  JanitorReport ForceCleanup() { return Sweep(SweepTrigger::kForced); }
  // 타이머 한 번 분량의 판단. 주기가 지났으면 정기 정리, 아니면 메모리 임계치를 확인한다.
  std::optional<JanitorReport> ProbeOnce(Clock::time_point now = Clock::now());

  JanitorStats Stats() const;
  const JanitorConfig& GetConfig() const { return config_; }

 private:
  void ScheduleProbe();

  boost::asio::strand<boost::asio::any_io_executor> strand_;
  boost::asio::steady_timer timer_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<PendingMessageBuffer> pending_;
  std::shared_ptr<ChannelRateLimiter> limiter_;
  std::shared_ptr<ChannelRouter> router_;
  std::shared_ptr<Observability> observability_;
  JanitorConfig config_;
  MemoryProbe probe_;

  std::mutex sweep_mutex_;
  mutable std::mutex stats_mutex_;
  bool stopped_{false};
  Clock::time_point last_sweep_at_;
  JanitorStats stats_;
};

}  // namespace mudlink
