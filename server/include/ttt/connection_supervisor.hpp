/*
 * 설명: 전송 연결을 세션의 플레이어 슬롯에 바인딩하고 재연결/해제/명령 적용을 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_supervisor_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "ttt/client_channel.hpp"
#include "ttt/game.hpp"
#include "ttt/observability.hpp"
#include "ttt/session_registry.hpp"

namespace ttt {

// 연결 하나가 점유한 슬롯. 연결 태스크만 소유하며 해제 시 Unbind에 그대로 넘긴다.
struct Binding {
  std::string session_id;
  std::string name;
  Mark role{Mark::kEmpty};
  std::uint64_t connection_id{0};
  SessionHandle entry;
};

struct BindResult {
  bool accepted{false};
  Rejection rejection{Rejection::kNone};
  bool reconnected{false};
  std::optional<Binding> binding;
};

struct CommandResult {
  bool accepted{false};
  Rejection rejection{Rejection::kNone};
};

class ConnectionSupervisor {
 public:
  ConnectionSupervisor(std::shared_ptr<SessionRegistry> registry, std::shared_ptr<Observability> observability);

  std::uint64_t NextConnectionId() { return next_connection_id_.fetch_add(1); }

  BindResult Bind(std::uint64_t connection_id, const std::shared_ptr<ClientChannel>& channel,
                  const std::string& session_id, const std::string& name);
  CommandResult Move(const Binding& binding, int cell);
  CommandResult Reset(const Binding& binding);
  CommandResult Leave(const Binding& binding);
  void Unbind(const Binding& binding);

 private:
  bool IsCurrentLocked(const Binding& binding) const;
  void DetachLocked(Session& session, Mark role);
  void PublishLocked(SessionEntry& entry);
  void LogEvent(LogLevel level, const std::string& event, const std::string& session_id, Mark role,
                std::string detail = {}) const;

  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  std::atomic<std::uint64_t> next_connection_id_{1};
};

}  // namespace ttt
