/*
 * 설명: 식별자와 채널 종류 단위의 고정 윈도우 발송 제한을 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rate_limiter_test.cpp
 */
#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "mudlink/types.hpp"

namespace mudlink {

struct RateLimitConfig {
  std::chrono::seconds window{std::chrono::seconds(60)};
  std::array<std::size_t, kChannelKindCount> limits{20, 10, 30, 100};

  std::size_t LimitFor(ChannelKind kind) const { return limits[ChannelIndex(kind)]; }
  void SetLimit(ChannelKind kind, std::size_t limit) { limits[ChannelIndex(kind)] = limit; }
};

struct RateLimiterStats {
  std::size_t tracked_buckets{0};
  std::size_t tracked_identities{0};
  std::size_t saturated_buckets{0};
};

class ChannelRateLimiter {
 public:
  explicit ChannelRateLimiter(const RateLimitConfig& config);

  bool Admit(const Identity& identity, ChannelKind kind, Clock::time_point now = Clock::now());
  std::size_t Remaining(const Identity& identity, ChannelKind kind, Clock::time_point now = Clock::now()) const;

  std::size_t EvictExpired(Clock::time_point now);
  std::size_t CapEntries(std::size_t max_entries);
  void Forget(const Identity& identity);
  RateLimiterStats Stats() const;
  const RateLimitConfig& GetConfig() const { return config_; }

 private:
  static constexpr std::size_t kShardCount = 16;

  struct Bucket {
    std::size_t count{0};
    Clock::time_point window_start{};
  };

  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<Identity, std::array<std::optional<Bucket>, kChannelKindCount>> buckets;
  };

  Shard& ShardFor(const Identity& identity) { return shards_[ShardIndex(identity, kShardCount)]; }
  const Shard& ShardFor(const Identity& identity) const { return shards_[ShardIndex(identity, kShardCount)]; }
  bool Expired(const Bucket& bucket, Clock::time_point now) const { return now - bucket.window_start > config_.window; }

  RateLimitConfig config_;
  std::array<Shard, kShardCount> shards_;
};

}  // namespace mudlink
