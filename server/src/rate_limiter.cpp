/*
 * 설명: 식별자/채널 종류별 고정 윈도우 카운터로 발송을 허용하거나 거절한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rate_limiter_test.cpp
 */
#include "mudlink/rate_limiter.hpp"

#include <algorithm>
#include <tuple>
#include <vector>

namespace mudlink {

ChannelRateLimiter::ChannelRateLimiter(const RateLimitConfig& config) : config_(config) {}

bool ChannelRateLimiter::Admit(const Identity& identity, ChannelKind kind, Clock::time_point now) {
  auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto& slot = shard.buckets[identity][ChannelIndex(kind)];
  if (!slot) {
    slot = Bucket{0, now};
  }
  auto& bucket = *slot;
  if (Expired(bucket, now)) {
    bucket.window_start = now;
    bucket.count = 0;
  }
  if (bucket.count >= config_.LimitFor(kind)) {
    return false;
  }
  ++bucket.count;
  return true;
}

std::size_t ChannelRateLimiter::Remaining(const Identity& identity, ChannelKind kind, Clock::time_point now) const {
  const auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> lock(shard.mutex);
  const auto limit = config_.LimitFor(kind);
  auto it = shard.buckets.find(identity);
  if (it == shard.buckets.end()) {
    return limit;
  }
  const auto& slot = it->second[ChannelIndex(kind)];
  if (!slot || Expired(*slot, now)) {
    return limit;
  }
  return slot->count >= limit ? 0 : limit - slot->count;
}

std::size_t ChannelRateLimiter::EvictExpired(Clock::time_point now) {
  std::size_t evicted = 0;
  for (auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (auto it = shard.buckets.begin(); it != shard.buckets.end();) {
      bool any_live = false;
      for (auto& slot : it->second) {
        if (slot && Expired(*slot, now)) {
          slot.reset();
          ++evicted;
        }
        any_live = any_live || slot.has_value();
      }
      if (!any_live) {
        it = shard.buckets.erase(it);
      } else {
        ++it;
      }
    }
  }
  return evicted;
}

std::size_t ChannelRateLimiter::CapEntries(std::size_t max_entries) {
  using Entry = std::tuple<Clock::time_point, Identity, std::size_t>;
  std::vector<Entry> entries;
  for (auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (const auto& [identity, slots] : shard.buckets) {
      for (std::size_t i = 0; i < slots.size(); ++i) {
        if (slots[i]) {
          entries.emplace_back(slots[i]->window_start, identity, i);
        }
      }
    }
  }
  if (entries.size() <= max_entries) {
    return 0;
  }
  const auto excess = entries.size() - max_entries;
  std::partial_sort(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(excess), entries.end());
  std::size_t removed = 0;
  for (std::size_t i = 0; i < excess; ++i) {
    const auto& [window_start, identity, index] = entries[i];
    auto& shard = ShardFor(identity);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.buckets.find(identity);
    if (it == shard.buckets.end()) {
      continue;
    }
    // 수집 이후 윈도우가 갱신된 버킷은 더 이상 가장 오래된 항목이 아니므로 남긴다.
    auto& slot = it->second[index];
    if (slot && slot->window_start == window_start) {
      slot.reset();
      ++removed;
    }
    if (std::none_of(it->second.begin(), it->second.end(), [](const auto& s) { return s.has_value(); })) {
      shard.buckets.erase(it);
    }
  }
  return removed;
}

void ChannelRateLimiter::Forget(const Identity& identity) {
  auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> lock(shard.mutex);
  shard.buckets.erase(identity);
}

RateLimiterStats ChannelRateLimiter::Stats() const {
  RateLimiterStats stats;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    stats.tracked_identities += shard.buckets.size();
    for (const auto& [identity, slots] : shard.buckets) {
      for (std::size_t i = 0; i < slots.size(); ++i) {
        if (!slots[i]) {
          continue;
        }
        ++stats.tracked_buckets;
        if (slots[i]->count >= config_.limits[i]) {
          ++stats.saturated_buckets;
        }
      }
    }
  }
  return stats;
}

}  // namespace mudlink
