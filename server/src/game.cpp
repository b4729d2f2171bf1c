/*
 * 설명: 착수 검증 순서(상태 → 차례 → 범위 → 점유)와 8개 라인 승리 판정을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/turn_engine_test.cpp
 */
#include "ttt/game.hpp"

#include <algorithm>

namespace ttt {
namespace {
constexpr std::array<std::array<int, 3>, 8> kLines{{
    {0, 1, 2}, {3, 4, 5}, {6, 7, 8},  // 행
    {0, 3, 6}, {1, 4, 7}, {2, 5, 8},  // 열
    {0, 4, 8}, {2, 4, 6},             // 대각선
}};

bool IsFull(const Board& board) {
  return std::none_of(board.begin(), board.end(), [](Mark cell) { return cell == Mark::kEmpty; });
}
}  // namespace

Session::Session(std::string session_id, std::chrono::steady_clock::time_point now)
    : id(std::move(session_id)), last_activity(now) {
  board.fill(Mark::kEmpty);
  scores[Mark::kX] = 0;
  scores[Mark::kO] = 0;
}

PlayerSlot* Session::FindSlotByName(const std::string& player_name) {
  for (auto& [role, slot] : players) {
    if (slot.name == player_name) {
      return &slot;
    }
  }
  return nullptr;
}

bool Session::HasLiveConnection() const {
  return std::any_of(players.begin(), players.end(), [](const auto& entry) { return entry.second.connected; });
}

bool Session::BothRolesOccupied() const { return players.count(Mark::kX) > 0 && players.count(Mark::kO) > 0; }

JoinResult JoinSession(Session& session, const std::string& player_name, std::chrono::steady_clock::time_point now) {
  if (auto* existing = session.FindSlotByName(player_name)) {
    if (existing->connected) {
      // 이름이 같아도 살아 있는 연결이 있으면 재연결이 아니다.
      return JoinResult{false, Rejection::kSessionFull, Mark::kEmpty, false};
    }
    session.last_activity = now;
    return JoinResult{true, Rejection::kNone, existing->role, true};
  }
  if (session.BothRolesOccupied()) {
    return JoinResult{false, Rejection::kSessionFull, Mark::kEmpty, false};
  }

  const Mark role = session.players.count(Mark::kX) == 0 ? Mark::kX : Mark::kO;
  PlayerSlot slot;
  slot.name = player_name;
  slot.role = role;
  session.players.emplace(role, std::move(slot));
  if (session.status == SessionStatus::kWaitingForPlayers && session.BothRolesOccupied()) {
    session.status = SessionStatus::kInProgress;
  }
  session.last_activity = now;
  return JoinResult{true, Rejection::kNone, role, false};
}

MoveResult ApplyMove(Session& session, Mark role, int cell, std::chrono::steady_clock::time_point now) {
  if (session.status == SessionStatus::kFinished) {
    return MoveResult{false, Rejection::kGameFinished, session.status};
  }
  if (session.status == SessionStatus::kWaitingForPlayers) {
    return MoveResult{false, Rejection::kWaitingForPlayers, session.status};
  }
  if (role != session.turn) {
    return MoveResult{false, Rejection::kNotYourTurn, session.status};
  }
  if (cell < 0 || cell >= kBoardCells) {
    return MoveResult{false, Rejection::kInvalidCell, session.status};
  }
  if (session.board[static_cast<std::size_t>(cell)] != Mark::kEmpty) {
    return MoveResult{false, Rejection::kCellOccupied, session.status};
  }

  session.board[static_cast<std::size_t>(cell)] = role;
  const Mark winner = FindWinner(session.board);
  if (winner != Mark::kEmpty) {
    session.status = SessionStatus::kFinished;
    session.winner = winner;
    ++session.scores[winner];
  } else if (IsFull(session.board)) {
    session.status = SessionStatus::kFinished;
    session.winner = Mark::kEmpty;
  } else {
    session.turn = Opponent(session.turn);
  }
  session.last_activity = now;
  return MoveResult{true, Rejection::kNone, session.status};
}

void ResetSession(Session& session, std::chrono::steady_clock::time_point now) {
  session.board.fill(Mark::kEmpty);
  session.turn = Mark::kX;
  session.winner = Mark::kEmpty;
  session.status = session.BothRolesOccupied() ? SessionStatus::kInProgress : SessionStatus::kWaitingForPlayers;
  session.last_activity = now;
}

void LeaveSession(Session& session, Mark role, std::chrono::steady_clock::time_point now) {
  session.players.erase(role);
  session.last_activity = now;
}

Mark FindWinner(const Board& board) {
  for (const auto& line : kLines) {
    const Mark first = board[line[0]];
    if (first != Mark::kEmpty && first == board[line[1]] && first == board[line[2]]) {
      return first;
    }
  }
  return Mark::kEmpty;
}

Mark Opponent(Mark mark) {
  switch (mark) {
    case Mark::kX:
      return Mark::kO;
    case Mark::kO:
      return Mark::kX;
    default:
      return Mark::kEmpty;
  }
}

void CheckSessionInvariants(const Session& session) {
  if (session.players.size() > 2) {
    throw InvariantViolation("세션 " + session.id + "의 플레이어 슬롯이 2개를 넘었습니다");
  }
  for (const auto& [role, slot] : session.players) {
    if (role == Mark::kEmpty || slot.role != role) {
      throw InvariantViolation("세션 " + session.id + "의 슬롯 역할이 키와 일치하지 않습니다");
    }
  }
  if (session.turn == Mark::kEmpty) {
    throw InvariantViolation("세션 " + session.id + "의 차례가 비어 있습니다");
  }
  if (session.status != SessionStatus::kFinished && session.winner != Mark::kEmpty) {
    throw InvariantViolation("세션 " + session.id + "이 종료되지 않았는데 승자가 있습니다");
  }
}

std::string_view MarkToString(Mark mark) {
  switch (mark) {
    case Mark::kX:
      return "X";
    case Mark::kO:
      return "O";
    default:
      return "";
  }
}

std::string_view StatusToString(SessionStatus status) {
  switch (status) {
    case SessionStatus::kWaitingForPlayers:
      return "waiting_for_players";
    case SessionStatus::kInProgress:
      return "in_progress";
    case SessionStatus::kFinished:
      return "finished";
  }
  return "unknown";
}

std::string_view RejectionCode(Rejection rejection) {
  switch (rejection) {
    case Rejection::kNone:
      return "none";
    case Rejection::kNotYourTurn:
      return "not_your_turn";
    case Rejection::kCellOccupied:
      return "cell_occupied";
    case Rejection::kGameFinished:
      return "game_finished";
    case Rejection::kInvalidCell:
      return "invalid_cell";
    case Rejection::kWaitingForPlayers:
      return "waiting_for_players";
    case Rejection::kSessionFull:
      return "session_full";
    case Rejection::kNotJoined:
      return "not_joined";
    case Rejection::kAlreadyJoined:
      return "already_joined";
  }
  return "unknown";
}

std::string_view RejectionMessage(Rejection rejection) {
  switch (rejection) {
    case Rejection::kNone:
      return "";
    case Rejection::kNotYourTurn:
      return "상대의 차례입니다";
    case Rejection::kCellOccupied:
      return "이미 표시된 칸입니다";
    case Rejection::kGameFinished:
      return "게임이 이미 끝났습니다";
    case Rejection::kInvalidCell:
      return "칸 번호는 0부터 8까지입니다";
    case Rejection::kWaitingForPlayers:
      return "상대 플레이어를 기다리는 중입니다";
    case Rejection::kSessionFull:
      return "세션에 빈 자리가 없습니다";
    case Rejection::kNotJoined:
      return "세션에 참가하지 않은 연결입니다";
    case Rejection::kAlreadyJoined:
      return "이미 세션에 참가한 연결입니다";
  }
  return "";
}

nlohmann::json BuildSessionSnapshot(const Session& session) {
  nlohmann::json board = nlohmann::json::array();
  for (Mark cell : session.board) {
    board.push_back(MarkToString(cell));
  }

  nlohmann::json roles = nlohmann::json::object();
  for (Mark role : {Mark::kX, Mark::kO}) {
    auto it = session.players.find(role);
    if (it == session.players.end()) {
      roles[std::string(MarkToString(role))] = nullptr;
    } else {
      roles[std::string(MarkToString(role))] = {{"name", it->second.name}, {"connected", it->second.connected}};
    }
  }

  nlohmann::json winner = nullptr;
  if (session.status == SessionStatus::kFinished) {
    winner = session.IsDraw() ? std::string("draw") : std::string(MarkToString(session.winner));
  }

  return {{"sessionId", session.id},
          {"board", board},
          {"turn", MarkToString(session.turn)},
          {"status", StatusToString(session.status)},
          {"winner", winner},
          {"scores", {{"X", session.scores.at(Mark::kX)}, {"O", session.scores.at(Mark::kO)}}},
          {"roles", roles}};
}

}  // namespace ttt
