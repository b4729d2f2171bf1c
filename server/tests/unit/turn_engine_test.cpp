#include <array>
#include <chrono>
#include <memory>
#include <random>
#include <vector>

#include <gtest/gtest.h>

#include "ttt/game.hpp"

namespace {

using ttt::ApplyMove;
using ttt::JoinSession;
using ttt::Mark;
using ttt::Rejection;
using ttt::SessionStatus;

constexpr std::array<std::array<int, 3>, 8> kAllLines{{
    {0, 1, 2}, {3, 4, 5}, {6, 7, 8}, {0, 3, 6}, {1, 4, 7}, {2, 5, 8}, {0, 4, 8}, {2, 4, 6},
}};

class TurnEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    now_ = std::chrono::steady_clock::now();
    session_ = std::make_unique<ttt::Session>("abc", now_);
  }

  void JoinBoth() {
    ASSERT_TRUE(JoinSession(*session_, "Alice", now_).accepted);
    ASSERT_TRUE(JoinSession(*session_, "Bob", now_).accepted);
  }

  std::chrono::steady_clock::time_point now_;
  std::unique_ptr<ttt::Session> session_;
};

TEST_F(TurnEngineTest, ScenarioWinThenResetKeepsScores) {
  auto alice = JoinSession(*session_, "Alice", now_);
  EXPECT_TRUE(alice.accepted);
  EXPECT_EQ(alice.role, Mark::kX);
  EXPECT_FALSE(alice.reconnected);
  EXPECT_EQ(session_->status, SessionStatus::kWaitingForPlayers);

  auto bob = JoinSession(*session_, "Bob", now_);
  EXPECT_TRUE(bob.accepted);
  EXPECT_EQ(bob.role, Mark::kO);
  EXPECT_EQ(session_->status, SessionStatus::kInProgress);
  EXPECT_EQ(session_->turn, Mark::kX);

  EXPECT_TRUE(ApplyMove(*session_, Mark::kX, 0, now_).accepted);
  EXPECT_TRUE(ApplyMove(*session_, Mark::kO, 3, now_).accepted);
  EXPECT_TRUE(ApplyMove(*session_, Mark::kX, 1, now_).accepted);
  EXPECT_TRUE(ApplyMove(*session_, Mark::kO, 4, now_).accepted);
  auto last = ApplyMove(*session_, Mark::kX, 2, now_);
  EXPECT_TRUE(last.accepted);
  EXPECT_EQ(last.status, SessionStatus::kFinished);

  EXPECT_EQ(session_->board[0], Mark::kX);
  EXPECT_EQ(session_->board[1], Mark::kX);
  EXPECT_EQ(session_->board[2], Mark::kX);
  EXPECT_EQ(session_->winner, Mark::kX);
  EXPECT_FALSE(session_->IsDraw());
  EXPECT_EQ(session_->scores.at(Mark::kX), 1);
  EXPECT_EQ(session_->scores.at(Mark::kO), 0);

  ttt::ResetSession(*session_, now_);
  for (Mark cell : session_->board) {
    EXPECT_EQ(cell, Mark::kEmpty);
  }
  EXPECT_EQ(session_->status, SessionStatus::kInProgress);
  EXPECT_EQ(session_->turn, Mark::kX);
  EXPECT_EQ(session_->winner, Mark::kEmpty);
  EXPECT_EQ(session_->scores.at(Mark::kX), 1);
  EXPECT_EQ(session_->scores.at(Mark::kO), 0);
  EXPECT_NO_THROW(ttt::CheckSessionInvariants(*session_));
}

TEST_F(TurnEngineTest, NeverTwoConsecutiveMovesBySameRole) {
  JoinBoth();
  std::mt19937 rng(42);
  for (int game = 0; game < 200; ++game) {
    ttt::ResetSession(*session_, now_);
    std::vector<Mark> accepted_roles;
    while (session_->status == SessionStatus::kInProgress) {
      std::uniform_int_distribution<int> cell_dist(0, 8);
      const int cell = cell_dist(rng);
      // 두 역할 모두 같은 칸을 시도한다. 차례가 아닌 쪽은 항상 거절돼야 한다.
      for (Mark role : {Mark::kX, Mark::kO}) {
        auto result = ApplyMove(*session_, role, cell, now_);
        if (result.accepted) {
          accepted_roles.push_back(role);
          break;
        }
      }
    }
    ASSERT_FALSE(accepted_roles.empty());
    EXPECT_EQ(accepted_roles.front(), Mark::kX);
    for (std::size_t i = 1; i < accepted_roles.size(); ++i) {
      ASSERT_NE(accepted_roles[i], accepted_roles[i - 1]) << "game " << game << " move " << i;
    }
  }
}

TEST_F(TurnEngineTest, OccupiedCellLeavesBoardAndTurnUnchanged) {
  JoinBoth();
  ASSERT_TRUE(ApplyMove(*session_, Mark::kX, 4, now_).accepted);
  const auto board_before = session_->board;
  const auto turn_before = session_->turn;

  auto result = ApplyMove(*session_, Mark::kO, 4, now_);
  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.rejection, Rejection::kCellOccupied);
  EXPECT_EQ(session_->board, board_before);
  EXPECT_EQ(session_->turn, turn_before);
  EXPECT_EQ(session_->status, SessionStatus::kInProgress);
}

TEST_F(TurnEngineTest, FullBoardWithoutLineIsDraw) {
  JoinBoth();
  const std::vector<int> moves{0, 1, 2, 4, 3, 5, 7, 6, 8};
  Mark role = Mark::kX;
  for (std::size_t i = 0; i < moves.size(); ++i) {
    auto result = ApplyMove(*session_, role, moves[i], now_);
    ASSERT_TRUE(result.accepted) << "move " << i;
    if (i + 1 < moves.size()) {
      EXPECT_EQ(result.status, SessionStatus::kInProgress);
    }
    role = ttt::Opponent(role);
  }
  EXPECT_EQ(session_->status, SessionStatus::kFinished);
  EXPECT_TRUE(session_->IsDraw());
  EXPECT_EQ(session_->scores.at(Mark::kX), 0);
  EXPECT_EQ(session_->scores.at(Mark::kO), 0);

  auto snapshot = ttt::BuildSessionSnapshot(*session_);
  EXPECT_EQ(snapshot["status"], "finished");
  EXPECT_EQ(snapshot["winner"], "draw");
}

TEST_F(TurnEngineTest, EveryLineWinsAndScoresOnce) {
  JoinBoth();
  for (Mark winner : {Mark::kX, Mark::kO}) {
    for (const auto& line : kAllLines) {
      ttt::ResetSession(*session_, now_);
      const int x_before = session_->scores.at(Mark::kX);
      const int o_before = session_->scores.at(Mark::kO);

      // 상대 수는 라인 밖에서 고르되, 상대가 먼저 라인을 완성하지 않는 칸만 쓴다.
      auto play_filler = [&](Mark who) {
        for (int cell = 0; cell < ttt::kBoardCells; ++cell) {
          const auto index = static_cast<std::size_t>(cell);
          if (cell == line[0] || cell == line[1] || cell == line[2] || session_->board[index] != Mark::kEmpty) {
            continue;
          }
          auto trial = session_->board;
          trial[index] = who;
          if (ttt::FindWinner(trial) != Mark::kEmpty) {
            continue;
          }
          return ApplyMove(*session_, who, cell, now_).accepted;
        }
        return false;
      };

      if (winner == Mark::kO) {
        ASSERT_TRUE(play_filler(Mark::kX));
      }
      for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(ApplyMove(*session_, winner, line[static_cast<std::size_t>(i)], now_).accepted);
        if (i < 2) {
          ASSERT_TRUE(play_filler(ttt::Opponent(winner)));
        }
      }

      EXPECT_EQ(session_->status, SessionStatus::kFinished);
      EXPECT_EQ(session_->winner, winner);
      EXPECT_EQ(session_->scores.at(winner), (winner == Mark::kX ? x_before : o_before) + 1);
      EXPECT_EQ(session_->scores.at(ttt::Opponent(winner)), winner == Mark::kX ? o_before : x_before);
    }
  }
}

TEST_F(TurnEngineTest, ValidationOrderIsStatusTurnRangeOccupancy) {
  auto waiting = ApplyMove(*session_, Mark::kX, 0, now_);
  EXPECT_EQ(waiting.rejection, Rejection::kWaitingForPlayers);

  JoinBoth();
  EXPECT_EQ(ApplyMove(*session_, Mark::kO, 42, now_).rejection, Rejection::kNotYourTurn);
  EXPECT_EQ(ApplyMove(*session_, Mark::kX, 9, now_).rejection, Rejection::kInvalidCell);
  EXPECT_EQ(ApplyMove(*session_, Mark::kX, -1, now_).rejection, Rejection::kInvalidCell);
  ASSERT_TRUE(ApplyMove(*session_, Mark::kX, 0, now_).accepted);
  EXPECT_EQ(ApplyMove(*session_, Mark::kO, 0, now_).rejection, Rejection::kCellOccupied);

  ASSERT_TRUE(ApplyMove(*session_, Mark::kO, 3, now_).accepted);
  ASSERT_TRUE(ApplyMove(*session_, Mark::kX, 1, now_).accepted);
  ASSERT_TRUE(ApplyMove(*session_, Mark::kO, 4, now_).accepted);
  ASSERT_TRUE(ApplyMove(*session_, Mark::kX, 2, now_).accepted);
  // 종료 후에는 차례나 칸과 무관하게 GameFinished가 먼저다.
  EXPECT_EQ(ApplyMove(*session_, Mark::kX, 0, now_).rejection, Rejection::kGameFinished);
  EXPECT_EQ(ApplyMove(*session_, Mark::kO, 8, now_).rejection, Rejection::kGameFinished);
}

TEST_F(TurnEngineTest, RejectedMoveDoesNotTouchActivity) {
  JoinBoth();
  const auto later = now_ + std::chrono::seconds(30);
  auto result = ApplyMove(*session_, Mark::kO, 0, later);
  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(session_->last_activity, now_);

  ASSERT_TRUE(ApplyMove(*session_, Mark::kX, 0, later).accepted);
  EXPECT_EQ(session_->last_activity, later);
}

TEST_F(TurnEngineTest, SameNameRejoinReturnsSameRole) {
  JoinBoth();
  auto again = JoinSession(*session_, "Bob", now_);
  EXPECT_TRUE(again.accepted);
  EXPECT_TRUE(again.reconnected);
  EXPECT_EQ(again.role, Mark::kO);
  EXPECT_EQ(session_->players.size(), 2u);
}

TEST_F(TurnEngineTest, SameNameWhileConnectedIsSessionFull) {
  JoinBoth();
  session_->players.at(Mark::kO).connected = true;
  const auto later = now_ + std::chrono::seconds(30);
  auto intruder = JoinSession(*session_, "Bob", later);
  EXPECT_FALSE(intruder.accepted);
  EXPECT_EQ(intruder.rejection, Rejection::kSessionFull);
  EXPECT_EQ(session_->players.size(), 2u);
  EXPECT_EQ(session_->last_activity, now_);
}

TEST_F(TurnEngineTest, ThirdNameIsSessionFull) {
  JoinBoth();
  auto carol = JoinSession(*session_, "Carol", now_);
  EXPECT_FALSE(carol.accepted);
  EXPECT_EQ(carol.rejection, Rejection::kSessionFull);
  EXPECT_EQ(session_->players.at(Mark::kX).name, "Alice");
  EXPECT_EQ(session_->players.at(Mark::kO).name, "Bob");
}

TEST_F(TurnEngineTest, LeaveFreesSlotForNewPlayerAndKeepsScores) {
  JoinBoth();
  ASSERT_TRUE(ApplyMove(*session_, Mark::kX, 0, now_).accepted);
  ttt::LeaveSession(*session_, Mark::kX, now_);
  EXPECT_EQ(session_->players.count(Mark::kX), 0u);
  EXPECT_EQ(session_->board[0], Mark::kX);

  auto carol = JoinSession(*session_, "Carol", now_);
  EXPECT_TRUE(carol.accepted);
  EXPECT_EQ(carol.role, Mark::kX);
  EXPECT_FALSE(carol.reconnected);

  ttt::ResetSession(*session_, now_);
  EXPECT_EQ(session_->status, SessionStatus::kInProgress);
  EXPECT_EQ(session_->scores.at(Mark::kX), 0);
}

TEST_F(TurnEngineTest, ResetWithOnePlayerWaits) {
  ASSERT_TRUE(JoinSession(*session_, "Alice", now_).accepted);
  ttt::ResetSession(*session_, now_);
  EXPECT_EQ(session_->status, SessionStatus::kWaitingForPlayers);
}

TEST_F(TurnEngineTest, SnapshotShape) {
  JoinBoth();
  session_->players.at(Mark::kX).connected = true;
  ASSERT_TRUE(ApplyMove(*session_, Mark::kX, 4, now_).accepted);

  auto snapshot = ttt::BuildSessionSnapshot(*session_);
  EXPECT_EQ(snapshot["sessionId"], "abc");
  ASSERT_EQ(snapshot["board"].size(), 9u);
  EXPECT_EQ(snapshot["board"][4], "X");
  EXPECT_EQ(snapshot["board"][0], "");
  EXPECT_EQ(snapshot["turn"], "O");
  EXPECT_EQ(snapshot["status"], "in_progress");
  EXPECT_TRUE(snapshot["winner"].is_null());
  EXPECT_EQ(snapshot["scores"]["X"], 0);
  EXPECT_EQ(snapshot["roles"]["X"]["name"], "Alice");
  EXPECT_TRUE(snapshot["roles"]["X"]["connected"].get<bool>());
  EXPECT_FALSE(snapshot["roles"]["O"]["connected"].get<bool>());
}

TEST_F(TurnEngineTest, InvariantCheckDetectsMismatchedSlot) {
  JoinBoth();
  session_->players.at(Mark::kO).role = Mark::kX;
  EXPECT_THROW(ttt::CheckSessionInvariants(*session_), ttt::InvariantViolation);
}

TEST(FindWinnerTest, EmptyBoardHasNoWinner) {
  ttt::Board board{};
  board.fill(Mark::kEmpty);
  EXPECT_EQ(ttt::FindWinner(board), Mark::kEmpty);
}

}  // namespace
