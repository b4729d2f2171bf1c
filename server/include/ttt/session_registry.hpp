/*
 * 설명: 세션 ID별 게임 세션을 생성/조회/삭제하는 동시성 안전 레지스트리를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "ttt/broadcast_hub.hpp"
#include "ttt/game.hpp"

namespace ttt {

// 세션 하나의 상태와 그 세션 전용 락. session, hub, retired는 mutex를 잡고 접근한다.
struct SessionEntry {
  SessionEntry(std::string session_id, std::chrono::steady_clock::time_point now)
      : session(std::move(session_id), now) {}

  std::mutex mutex;
  Session session;
  BroadcastHub hub;
  // 레지스트리에서 제거된 항목. 핸들을 들고 있던 호출자는 다시 조회해야 한다.
  bool retired{false};
};

using SessionHandle = std::shared_ptr<SessionEntry>;

class SessionRegistry {
 public:
  SessionHandle GetOrCreate(const std::string& session_id);
  SessionHandle Find(const std::string& session_id) const;

  // 항목을 지우고 retired로 표시한다. 해당 세션의 락을 잡은 채로 호출하면 안 된다.
  bool Remove(const std::string& session_id);
  // 맵이 아직 expected를 가리킬 때만 지운다. 호출자가 expected의 락을 잡고 retired를 설정한다.
  bool RemoveIf(const std::string& session_id, const SessionHandle& expected);

  std::vector<std::string> SnapshotIds() const;
  std::size_t Size() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, SessionHandle> sessions_;
};

}  // namespace ttt
