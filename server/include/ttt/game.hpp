/*
 * 설명: 틱택토 세션 상태와 턴 엔진(참가, 착수 검증, 승패 판정, 리셋, 퇴장)을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/turn_engine_test.cpp
 */
#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ttt {

class ClientChannel;

enum class Mark { kEmpty, kX, kO };

enum class SessionStatus { kWaitingForPlayers, kInProgress, kFinished };

enum class Rejection {
  kNone,
  kNotYourTurn,
  kCellOccupied,
  kGameFinished,
  kInvalidCell,
  kWaitingForPlayers,
  kSessionFull,
  kNotJoined,
  kAlreadyJoined,
};

constexpr int kBoardCells = 9;

using Board = std::array<Mark, kBoardCells>;

struct PlayerSlot {
  std::string name;
  Mark role{Mark::kEmpty};
  // 연결을 소유하지 않는다. 세션 수명은 연결 수명과 무관하다.
  std::weak_ptr<ClientChannel> channel;
  std::uint64_t connection_id{0};
  bool connected{false};
};

struct Session {
  Session(std::string session_id, std::chrono::steady_clock::time_point now);

  PlayerSlot* FindSlotByName(const std::string& player_name);
  bool HasLiveConnection() const;
  bool BothRolesOccupied() const;
  bool IsDraw() const { return status == SessionStatus::kFinished && winner == Mark::kEmpty; }

  std::string id;
  Board board{};
  Mark turn{Mark::kX};
  std::map<Mark, PlayerSlot> players;
  std::map<Mark, int> scores;
  SessionStatus status{SessionStatus::kWaitingForPlayers};
  // kFinished 상태에서 kEmpty면 무승부다.
  Mark winner{Mark::kEmpty};
  std::chrono::steady_clock::time_point last_activity;
};

struct JoinResult {
  bool accepted{false};
  Rejection rejection{Rejection::kNone};
  Mark role{Mark::kEmpty};
  bool reconnected{false};
};

struct MoveResult {
  bool accepted{false};
  Rejection rejection{Rejection::kNone};
  SessionStatus status{SessionStatus::kWaitingForPlayers};
};

class InvariantViolation : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

JoinResult JoinSession(Session& session, const std::string& player_name, std::chrono::steady_clock::time_point now);
MoveResult ApplyMove(Session& session, Mark role, int cell, std::chrono::steady_clock::time_point now);
void ResetSession(Session& session, std::chrono::steady_clock::time_point now);
void LeaveSession(Session& session, Mark role, std::chrono::steady_clock::time_point now);

Mark FindWinner(const Board& board);
Mark Opponent(Mark mark);
void CheckSessionInvariants(const Session& session);

std::string_view MarkToString(Mark mark);
std::string_view StatusToString(SessionStatus status);
std::string_view RejectionCode(Rejection rejection);
std::string_view RejectionMessage(Rejection rejection);

// 클라이언트에 노출되는 세션 상태. 버전 번호는 브로드캐스트 허브가 붙인다.
nlohmann::json BuildSessionSnapshot(const Session& session);

}  // namespace ttt
