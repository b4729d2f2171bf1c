/*
 * 설명: 세션 락 안에서 참가/재연결/착수/리셋/퇴장/해제를 적용하고 결과 스냅샷을 발행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_supervisor_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#include "ttt/connection_supervisor.hpp"

#include <chrono>
#include <mutex>

#include "ttt/api_response.hpp"

namespace ttt {

ConnectionSupervisor::ConnectionSupervisor(std::shared_ptr<SessionRegistry> registry,
                                           std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), observability_(std::move(observability)) {}

BindResult ConnectionSupervisor::Bind(std::uint64_t connection_id, const std::shared_ptr<ClientChannel>& channel,
                                      const std::string& session_id, const std::string& name) {
  for (;;) {
    auto entry = registry_->GetOrCreate(session_id);
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->retired) {
      // 리퍼가 방금 제거한 항목이다. 새 항목을 다시 받는다.
      continue;
    }

    auto& session = entry->session;
    const auto now = std::chrono::steady_clock::now();
    auto joined = JoinSession(session, name, now);
    if (!joined.accepted) {
      if (observability_) {
        observability_->IncrementRejections();
      }
      LogEvent(LogLevel::kInfo, "session.join_rejected", session_id, Mark::kEmpty,
               std::string(RejectionCode(joined.rejection)));
      return BindResult{false, joined.rejection, false, std::nullopt};
    }

    // 슬롯을 붙이기 전에 검사한다. 여기서 던지면 슬롯은 끊긴 상태로 남아 리퍼가 치울 수 있다.
    CheckSessionInvariants(session);
    auto& slot = session.players.at(joined.role);
    slot.channel = channel;
    slot.connection_id = connection_id;
    slot.connected = true;
    session.last_activity = now;

    LogEvent(LogLevel::kInfo, joined.reconnected ? "session.reconnected" : "session.joined", session_id, joined.role,
             name);
    const bool acked = channel->Deliver(MakeWsEvent("game.joined", 0,
                                                    {{"sessionId", session_id},
                                                     {"role", MarkToString(joined.role)},
                                                     {"name", name},
                                                     {"reconnected", joined.reconnected}}));
    if (!acked) {
      // 채널이 이미 닫혔다. 아래 발행에서 전달 실패로 해제된다.
      LogEvent(LogLevel::kWarn, "session.join_ack_failed", session_id, joined.role);
    }
    PublishLocked(*entry);

    Binding binding{session_id, name, joined.role, connection_id, entry};
    return BindResult{true, Rejection::kNone, joined.reconnected, std::move(binding)};
  }
}

CommandResult ConnectionSupervisor::Move(const Binding& binding, int cell) {
  std::lock_guard<std::mutex> lock(binding.entry->mutex);
  if (!IsCurrentLocked(binding)) {
    return CommandResult{false, Rejection::kNotJoined};
  }
  auto& session = binding.entry->session;
  auto result = ApplyMove(session, binding.role, cell, std::chrono::steady_clock::now());
  if (!result.accepted) {
    if (observability_) {
      observability_->IncrementRejections();
    }
    LogEvent(LogLevel::kDebug, "game.move_rejected", binding.session_id, binding.role,
             std::string(RejectionCode(result.rejection)));
    return CommandResult{false, result.rejection};
  }
  if (observability_) {
    observability_->IncrementMoves();
  }
  CheckSessionInvariants(session);
  if (result.status == SessionStatus::kFinished) {
    LogEvent(LogLevel::kInfo, "game.finished", binding.session_id, session.winner,
             session.IsDraw() ? "draw" : "win");
  }
  PublishLocked(*binding.entry);
  return CommandResult{true, Rejection::kNone};
}

CommandResult ConnectionSupervisor::Reset(const Binding& binding) {
  std::lock_guard<std::mutex> lock(binding.entry->mutex);
  if (!IsCurrentLocked(binding)) {
    return CommandResult{false, Rejection::kNotJoined};
  }
  auto& session = binding.entry->session;
  ResetSession(session, std::chrono::steady_clock::now());
  CheckSessionInvariants(session);
  LogEvent(LogLevel::kInfo, "game.reset", binding.session_id, binding.role);
  PublishLocked(*binding.entry);
  return CommandResult{true, Rejection::kNone};
}

CommandResult ConnectionSupervisor::Leave(const Binding& binding) {
  std::lock_guard<std::mutex> lock(binding.entry->mutex);
  if (!IsCurrentLocked(binding)) {
    return CommandResult{false, Rejection::kNotJoined};
  }
  auto& session = binding.entry->session;
  LeaveSession(session, binding.role, std::chrono::steady_clock::now());
  CheckSessionInvariants(session);
  LogEvent(LogLevel::kInfo, "session.left", binding.session_id, binding.role, binding.name);
  PublishLocked(*binding.entry);
  return CommandResult{true, Rejection::kNone};
}

void ConnectionSupervisor::Unbind(const Binding& binding) {
  if (!binding.entry) {
    return;
  }
  std::lock_guard<std::mutex> lock(binding.entry->mutex);
  if (!IsCurrentLocked(binding)) {
    // 재연결로 슬롯이 이미 다른 연결에 넘어갔거나 세션이 제거됐다.
    return;
  }
  auto& session = binding.entry->session;
  DetachLocked(session, binding.role);
  session.last_activity = std::chrono::steady_clock::now();
  LogEvent(LogLevel::kInfo, "session.unbound", binding.session_id, binding.role, binding.name);
  PublishLocked(*binding.entry);
}

bool ConnectionSupervisor::IsCurrentLocked(const Binding& binding) const {
  if (!binding.entry || binding.entry->retired) {
    return false;
  }
  const auto& players = binding.entry->session.players;
  auto it = players.find(binding.role);
  return it != players.end() && it->second.connected && it->second.connection_id == binding.connection_id;
}

void ConnectionSupervisor::DetachLocked(Session& session, Mark role) {
  auto it = session.players.find(role);
  if (it == session.players.end()) {
    return;
  }
  it->second.connected = false;
  it->second.channel.reset();
  it->second.connection_id = 0;
}

void ConnectionSupervisor::PublishLocked(SessionEntry& entry) {
  auto failed = entry.hub.Publish(entry.session);
  // 실패한 연결을 떼어 낸 뒤 남은 연결에 갱신된 connected 플래그를 다시 보낸다.
  while (!failed.empty()) {
    for (Mark role : failed) {
      auto& slot = entry.session.players.at(role);
      if (auto channel = slot.channel.lock()) {
        channel->Close("send_failed");
      }
      DetachLocked(entry.session, role);
      LogEvent(LogLevel::kWarn, "session.delivery_failed", entry.session.id, role);
    }
    entry.session.last_activity = std::chrono::steady_clock::now();
    failed = entry.hub.Publish(entry.session);
  }
}

void ConnectionSupervisor::LogEvent(LogLevel level, const std::string& event, const std::string& session_id,
                                    Mark role, std::string detail) const {
  if (!observability_ || !observability_->Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.session_id = session_id;
  if (role != Mark::kEmpty) {
    ctx.role = std::string(MarkToString(role));
  }
  ctx.name = event;
  ctx.level = level;
  ctx.detail = std::move(detail);
  observability_->Log(ctx);
}

}  // namespace ttt
