/*
 * 설명: 잠시 연결이 끊긴 식별자에게 보낼 메시지를 개수/TTL 제한 큐로 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/pending_buffer_test.cpp
 */
#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "mudlink/connection_sink.hpp"
#include "mudlink/types.hpp"

namespace mudlink {

struct PendingMessage {
  Identity identity;
  OutboundMessage payload;
  Clock::time_point enqueued_at{};
  std::chrono::seconds ttl{0};

  bool Expired(Clock::time_point now) const { return now - enqueued_at > ttl; }
};

struct PendingBufferConfig {
  std::size_t max_pending{50};
  std::chrono::seconds default_ttl{std::chrono::seconds(60)};
};

struct PendingBufferStats {
  std::size_t identities{0};
  std::size_t messages{0};
  std::size_t largest_queue{0};
  std::size_t overflow_evictions{0};
};

class PendingMessageBuffer {
 public:
  explicit PendingMessageBuffer(const PendingBufferConfig& config);

  // 상한을 넘기면 가장 오래된 항목을 버린다. 버려진 개수를 돌려준다.
  std::size_t Enqueue(const Identity& identity, OutboundMessage payload, std::chrono::seconds ttl,
                      Clock::time_point now = Clock::now());
  std::size_t Enqueue(const Identity& identity, OutboundMessage payload, Clock::time_point now = Clock::now());

  // 파괴적으로 꺼낸다. 만료된 항목은 제외하며 넣은 순서를 유지한다.
  std::vector<PendingMessage> Drain(const Identity& identity, Clock::time_point now = Clock::now());

  std::size_t Size(const Identity& identity) const;
  std::size_t Discard(const Identity& identity);
  std::size_t EvictExpired(Clock::time_point now);
  std::size_t CapPerIdentity(std::size_t max_entries);
  PendingBufferStats Stats() const;
  const PendingBufferConfig& GetConfig() const { return config_; }

 private:
  static constexpr std::size_t kShardCount = 16;

  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<Identity, std::deque<PendingMessage>> queues;
  };

  Shard& ShardFor(const Identity& identity) { return shards_[ShardIndex(identity, kShardCount)]; }
  const Shard& ShardFor(const Identity& identity) const { return shards_[ShardIndex(identity, kShardCount)]; }

  PendingBufferConfig config_;
  std::array<Shard, kShardCount> shards_;
  std::size_t overflow_evictions_{0};
  mutable std::mutex stats_mutex_;
};

}  // namespace mudlink
