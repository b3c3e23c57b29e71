#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "chessroom/observability.hpp"

TEST(ObservabilityTest, WritesStructuredJsonLine) {
  std::ostringstream out;
  chessroom::Observability observability(chessroom::LogLevel::kInfo, out);
  observability.LogEvent("game.created", "a1b2c3d4", std::string("player-1"), "white");

  auto line = nlohmann::json::parse(out.str());
  EXPECT_EQ(line["level"], "info");
  EXPECT_EQ(line["eventName"], "game.created");
  EXPECT_EQ(line["sessionId"], "a1b2c3d4");
  EXPECT_EQ(line["playerId"], "player-1");
  EXPECT_EQ(line["detail"], "white");
}

TEST(ObservabilityTest, FiltersBelowMinimumLevel) {
  std::ostringstream out;
  chessroom::Observability observability(chessroom::LogLevel::kWarn, out);
  observability.LogEvent("game.move", "a1b2c3d4");
  EXPECT_TRUE(out.str().empty());

  observability.LogEvent("game.abandon_failed", "a1b2c3d4", std::nullopt, "db down", chessroom::LogLevel::kError);
  EXPECT_NE(out.str().find("\"error\""), std::string::npos);

  observability.SetMinLevel(chessroom::LogLevel::kDebug);
  observability.LogEvent("game.move", "a1b2c3d4", std::nullopt, "", chessroom::LogLevel::kDebug);
  EXPECT_NE(out.str().find("game.move"), std::string::npos);
}

TEST(ObservabilityTest, CountersFeedSnapshot) {
  std::ostringstream out;
  chessroom::Observability observability(chessroom::LogLevel::kInfo, out);
  observability.IncrementRequest();
  observability.IncrementRequest();
  observability.IncrementError();
  observability.SetWebsocketActive(5);

  auto snapshot = observability.Snapshot(3);
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.websocket_active, 5u);
  EXPECT_EQ(snapshot.active_sessions, 3u);
  EXPECT_NE(observability.NextTraceId(), observability.NextTraceId());
}

TEST(ObservabilityTest, ParsesLogLevel) {
  EXPECT_EQ(chessroom::ParseLogLevel("debug"), chessroom::LogLevel::kDebug);
  EXPECT_EQ(chessroom::ParseLogLevel("warn"), chessroom::LogLevel::kWarn);
  EXPECT_EQ(chessroom::ParseLogLevel("error"), chessroom::LogLevel::kError);
  EXPECT_EQ(chessroom::ParseLogLevel("verbose"), chessroom::LogLevel::kInfo);
}
