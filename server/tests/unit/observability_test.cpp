#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "ttt/observability.hpp"

namespace {

TEST(ObservabilityTest, ParsesKnownLevels) {
  EXPECT_EQ(ttt::ParseLogLevel("debug").value_or(ttt::LogLevel::kError), ttt::LogLevel::kDebug);
  EXPECT_EQ(ttt::ParseLogLevel("warn").value_or(ttt::LogLevel::kError), ttt::LogLevel::kWarn);
  EXPECT_FALSE(ttt::ParseLogLevel("verbose").has_value());
}

TEST(ObservabilityTest, LogWritesSingleJsonLine) {
  std::ostringstream out;
  ttt::Observability observability(ttt::LogLevel::kInfo, out);
  ttt::LogContext ctx;
  ctx.trace_id = observability.NextTraceId();
  ctx.session_id = "abc";
  ctx.role = "X";
  ctx.name = "game.finished";
  ctx.detail = "win";
  observability.Log(ctx);

  auto line = out.str();
  ASSERT_FALSE(line.empty());
  EXPECT_EQ(line.back(), '\n');
  auto parsed = nlohmann::json::parse(line);
  EXPECT_EQ(parsed["level"], "info");
  EXPECT_EQ(parsed["eventName"], "game.finished");
  EXPECT_EQ(parsed["sessionId"], "abc");
  EXPECT_EQ(parsed["role"], "X");
  EXPECT_EQ(parsed["detail"], "win");
  EXPECT_EQ(parsed["traceId"], ctx.trace_id);
}

TEST(ObservabilityTest, DropsEntriesBelowThreshold) {
  std::ostringstream out;
  ttt::Observability observability(ttt::LogLevel::kWarn, out);
  ttt::LogContext ctx;
  ctx.name = "session.joined";
  observability.Log(ctx);
  EXPECT_TRUE(out.str().empty());
  EXPECT_FALSE(observability.Enabled(ttt::LogLevel::kInfo));

  ctx.level = ttt::LogLevel::kError;
  observability.Log(ctx);
  EXPECT_FALSE(out.str().empty());
}

TEST(ObservabilityTest, CountersFeedSnapshot) {
  std::ostringstream out;
  ttt::Observability observability(ttt::LogLevel::kInfo, out);
  observability.IncrementRequest();
  observability.IncrementRequest();
  observability.IncrementError();
  observability.ConnectionOpened();
  observability.ConnectionOpened();
  observability.ConnectionClosed();
  observability.IncrementMoves();
  observability.IncrementRejections();
  observability.AddReaped(3);

  auto snapshot = observability.Snapshot(7);
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.websocket_active, 1u);
  EXPECT_EQ(snapshot.active_sessions, 7u);
  EXPECT_EQ(snapshot.moves_total, 1u);
  EXPECT_EQ(snapshot.rejections_total, 1u);
  EXPECT_EQ(snapshot.sessions_reaped, 3u);
}

TEST(ObservabilityTest, TraceIdsAreUnique) {
  ttt::Observability observability(ttt::LogLevel::kError);
  EXPECT_NE(observability.NextTraceId(), observability.NextTraceId());
}

}  // namespace
