/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ttt {

enum class LogLevel { kDebug, kInfo, kWarn, kError };

std::optional<LogLevel> ParseLogLevel(std::string_view value);
std::string_view LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> session_id;
  std::optional<std::string> role;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  std::string detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t active_sessions{0};
  std::uint64_t moves_total{0};
  std::uint64_t rejections_total{0};
  std::uint64_t sessions_reaped{0};
};

class Observability {
 public:
  explicit Observability(LogLevel threshold = LogLevel::kInfo);
  // 테스트에서 로그 출력을 가로챌 때 사용한다.
  Observability(LogLevel threshold, std::ostream& out);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void ConnectionOpened();
  void ConnectionClosed();
  void IncrementMoves();
  void IncrementRejections();
  void AddReaped(std::uint64_t count);
  MetricsSnapshot Snapshot(std::uint64_t active_sessions) const;

  bool Enabled(LogLevel level) const { return level >= threshold_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel threshold_;
  std::ostream* out_;
  mutable std::mutex out_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> moves_total_{0};
  std::atomic<std::uint64_t> rejections_total_{0};
  std::atomic<std::uint64_t> sessions_reaped_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace ttt
