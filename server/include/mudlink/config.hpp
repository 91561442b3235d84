/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/realtime_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace mudlink {

struct AppConfig {
  unsigned short port;
  std::string log_level;
  std::string ops_token;
  std::string node_id;
  std::string subject_root;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t rate_limit_window_seconds;
  std::size_t rate_limit_direct;
  std::size_t rate_limit_location;
  std::size_t rate_limit_broadcast;
  std::size_t rate_limit_system;
  std::size_t pending_max_per_identity;
  std::size_t pending_ttl_seconds;
  std::size_t reconnect_window_seconds;
  std::size_t janitor_interval_seconds;
  std::size_t janitor_probe_interval_seconds;
  double janitor_memory_threshold;
  std::size_t max_connection_age_seconds;
  std::size_t presence_retention_seconds;
  std::size_t max_rate_limit_entries;
  std::size_t sse_heartbeat_seconds;
};

AppConfig DefaultConfig();
AppConfig LoadConfigFromEnv();

}  // namespace mudlink
