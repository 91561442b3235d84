/*
 * 설명: 식별자별 보류 메시지 큐의 적재/배출/만료/상한 정리를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/pending_buffer_test.cpp
 */
#include "mudlink/pending_buffer.hpp"

#include <algorithm>

namespace mudlink {

PendingMessageBuffer::PendingMessageBuffer(const PendingBufferConfig& config) : config_(config) {}

std::size_t PendingMessageBuffer::Enqueue(const Identity& identity, OutboundMessage payload,
                                          std::chrono::seconds ttl, Clock::time_point now) {
  if (config_.max_pending == 0) {
    return 1;
  }
  std::size_t evicted = 0;
  {
    auto& shard = ShardFor(identity);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto& queue = shard.queues[identity];
    while (queue.size() >= config_.max_pending) {
      queue.pop_front();
      ++evicted;
    }
    queue.push_back(PendingMessage{identity, std::move(payload), now, ttl});
  }
  if (evicted > 0) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    overflow_evictions_ += evicted;
  }
  return evicted;
}

std::size_t PendingMessageBuffer::Enqueue(const Identity& identity, OutboundMessage payload,
                                          Clock::time_point now) {
  return Enqueue(identity, std::move(payload), config_.default_ttl, now);
}

std::vector<PendingMessage> PendingMessageBuffer::Drain(const Identity& identity, Clock::time_point now) {
  std::deque<PendingMessage> queue;
  {
    auto& shard = ShardFor(identity);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.queues.find(identity);
    if (it == shard.queues.end()) {
      return {};
    }
    queue = std::move(it->second);
    shard.queues.erase(it);
  }
  std::vector<PendingMessage> drained;
  drained.reserve(queue.size());
  for (auto& message : queue) {
    if (!message.Expired(now)) {
      drained.push_back(std::move(message));
    }
  }
  return drained;
}

std::size_t PendingMessageBuffer::Size(const Identity& identity) const {
  const auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.queues.find(identity);
  return it == shard.queues.end() ? 0 : it->second.size();
}

std::size_t PendingMessageBuffer::Discard(const Identity& identity) {
  auto& shard = ShardFor(identity);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.queues.find(identity);
  if (it == shard.queues.end()) {
    return 0;
  }
  auto count = it->second.size();
  shard.queues.erase(it);
  return count;
}

std::size_t PendingMessageBuffer::EvictExpired(Clock::time_point now) {
  std::size_t evicted = 0;
  for (auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (auto it = shard.queues.begin(); it != shard.queues.end();) {
      auto& queue = it->second;
      auto before = queue.size();
      queue.erase(std::remove_if(queue.begin(), queue.end(),
                                 [now](const PendingMessage& message) { return message.Expired(now); }),
                  queue.end());
      evicted += before - queue.size();
      if (queue.empty()) {
        it = shard.queues.erase(it);
      } else {
        ++it;
      }
    }
  }
  return evicted;
}

std::size_t PendingMessageBuffer::CapPerIdentity(std::size_t max_entries) {
  std::size_t trimmed = 0;
  for (auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (auto& [identity, queue] : shard.queues) {
      while (queue.size() > max_entries) {
        queue.pop_front();
        ++trimmed;
      }
    }
  }
  return trimmed;
}

PendingBufferStats PendingMessageBuffer::Stats() const {
  PendingBufferStats stats;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    stats.identities += shard.queues.size();
    for (const auto& [identity, queue] : shard.queues) {
      stats.messages += queue.size();
      stats.largest_queue = std::max(stats.largest_queue, queue.size());
    }
  }
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats.overflow_evictions = overflow_evictions_;
  return stats;
}

}  // namespace mudlink
