/*
 * 설명: 세션 스냅샷을 한 번 직렬화해 바인딩된 연결마다 전달하고 실패한 역할을 수집한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcast_hub_test.cpp
 */
#include "ttt/broadcast_hub.hpp"

#include "ttt/api_response.hpp"
#include "ttt/client_channel.hpp"

namespace ttt {

std::vector<Mark> BroadcastHub::Publish(const Session& session) {
  ++version_;
  const auto message = MakeWsEvent("game.state", version_, VersionedSnapshot(session));

  std::vector<Mark> failed;
  for (const auto& [role, slot] : session.players) {
    if (!slot.connected) {
      continue;
    }
    auto channel = slot.channel.lock();
    if (!channel || !channel->Deliver(message)) {
      failed.push_back(role);
    }
  }
  return failed;
}

nlohmann::json BroadcastHub::VersionedSnapshot(const Session& session) const {
  auto snapshot = BuildSessionSnapshot(session);
  snapshot["version"] = version_;
  return snapshot;
}

}  // namespace ttt
