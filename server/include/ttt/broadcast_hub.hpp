/*
 * 설명: 세션별 상태 스냅샷을 바인딩된 모든 연결로 순서대로 팬아웃한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcast_hub_test.cpp
 */
#pragma once

#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include "ttt/game.hpp"

namespace ttt {

// 세션 락을 잡은 상태에서만 호출한다. 락이 발행 순서를 직렬화한다.
class BroadcastHub {
 public:
  // 스냅샷을 connected 상태의 모든 슬롯에 전달하고, 전달에 실패한 역할을 반환한다.
  std::vector<Mark> Publish(const Session& session);

  std::uint64_t Version() const { return version_; }
  nlohmann::json VersionedSnapshot(const Session& session) const;

 private:
  std::uint64_t version_{0};
};

}  // namespace ttt
