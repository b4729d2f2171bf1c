/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace ttt {

struct AppConfig {
  unsigned short port;
  std::string log_level;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t heartbeat_timeout_seconds;
  std::size_t reaper_interval_seconds;
  std::size_t session_stale_seconds;
  std::size_t worker_threads;
};

AppConfig LoadConfigFromEnv();

}  // namespace ttt
