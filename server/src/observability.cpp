/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "ttt/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ttt {

std::optional<LogLevel> ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "info") {
    return LogLevel::kInfo;
  }
  if (value == "warn") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

std::string_view LogLevelName(LogLevel level) {
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

Observability::Observability(LogLevel threshold) : threshold_(threshold), out_(&std::cout) {}

Observability::Observability(LogLevel threshold, std::ostream& out) : threshold_(threshold), out_(&out) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::ConnectionOpened() { websocket_active_.fetch_add(1); }

void Observability::ConnectionClosed() { websocket_active_.fetch_sub(1); }

void Observability::IncrementMoves() { moves_total_.fetch_add(1); }

void Observability::IncrementRejections() { rejections_total_.fetch_add(1); }

void Observability::AddReaped(std::uint64_t count) { sessions_reaped_.fetch_add(count); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_sessions) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.active_sessions = active_sessions;
  snapshot.moves_total = moves_total_.load();
  snapshot.rejections_total = rejections_total_.load();
  snapshot.sessions_reaped = sessions_reaped_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (ctx.role) {
    log_json["role"] = *ctx.role;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(out_mutex_);
  *out_ << log_json.dump() << std::endl;
}

}  // namespace ttt
