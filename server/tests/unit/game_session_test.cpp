#include <chrono>
#include <memory>
#include <optional>
#include <sstream>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "chessroom/chess_rules.hpp"
#include "chessroom/db_client.hpp"
#include "chessroom/game_session.hpp"
#include "chessroom/memory_game_store.hpp"

namespace {

using chessroom::Color;
using chessroom::GameError;
using chessroom::GameOver;
using chessroom::GameSession;
using chessroom::GameStatus;
using chessroom::MoveRequest;

MoveRequest Move(const char* from, const char* to) { return MoveRequest{from, to, std::nullopt}; }

class GameSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<chessroom::MemoryGameStore>();
    observability_ = std::make_shared<chessroom::Observability>(chessroom::LogLevel::kDebug, log_);
    store_->CreatePlayer("white-1", "Alice");
    store_->CreatePlayer("black-1", "Bob");
    store_->CreateGame("g1", "white-1");
    session_ = std::make_shared<GameSession>(ioc_, "g1", "white-1", std::make_unique<chessroom::StandardChessRules>(),
                                             store_, observability_);
  }

  void StartGame() {
    GameError error = GameError::kNone;
    ASSERT_TRUE(session_->Join("black-1", error));
  }

  void PlayFoolsMate(std::optional<GameOver>& game_over) {
    GameError error = GameError::kNone;
    ASSERT_TRUE(session_->ApplyMove("white-1", Move("f2", "f3"), error));
    ASSERT_TRUE(session_->ApplyMove("black-1", Move("e7", "e5"), error));
    ASSERT_TRUE(session_->ApplyMove("white-1", Move("g2", "g4"), error));
    auto mate = session_->ApplyMove("black-1", Move("d8", "h4"), error);
    ASSERT_TRUE(mate.has_value());
    game_over = mate->game_over;
  }

  boost::asio::io_context ioc_;
  std::ostringstream log_;
  std::shared_ptr<chessroom::MemoryGameStore> store_;
  std::shared_ptr<chessroom::Observability> observability_;
  std::shared_ptr<GameSession> session_;
};

}  // namespace

TEST_F(GameSessionTest, JoinActivatesGameOnce) {
  EXPECT_EQ(session_->Status(), GameStatus::kWaiting);
  StartGame();
  EXPECT_EQ(session_->Status(), GameStatus::kActive);
  EXPECT_EQ(session_->ColorOf("black-1"), Color::kBlack);
  EXPECT_EQ(store_->GetGame("g1")->status, GameStatus::kActive);

  GameError error = GameError::kNone;
  EXPECT_FALSE(session_->Join("late-1", error));
  EXPECT_EQ(error, GameError::kGameAlreadyStarted);
}

TEST_F(GameSessionTest, MovePersistsBeforeCommit) {
  StartGame();
  GameError error = GameError::kNone;
  auto result = session_->ApplyMove("white-1", Move("e2", "e4"), error);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->move.san, "e4");
  EXPECT_EQ(result->move_number, 1);
  EXPECT_EQ(result->turn, Color::kBlack);
  EXPECT_FALSE(result->in_check);
  EXPECT_FALSE(result->game_over.has_value());
  EXPECT_EQ(result->legal_moves.size(), 10u);

  auto moves = store_->GetGameMoves("g1");
  ASSERT_EQ(moves.size(), 1u);
  EXPECT_EQ(moves[0].san, "e4");
  EXPECT_EQ(moves[0].player_id, "white-1");
  EXPECT_EQ(moves[0].fen_after, result->fen);
  EXPECT_EQ(store_->GetGame("g1")->fen, result->fen);
  EXPECT_EQ(store_->GetGame("g1")->pgn, "1. e4");

  auto state = session_->GetState();
  EXPECT_EQ(state.move_count, 1);
  EXPECT_EQ(state.turn, Color::kBlack);
}

TEST_F(GameSessionTest, TurnIsCheckedBeforeStatus) {
  GameError error = GameError::kNone;
  // 대기 중에도 흑의 수는 차례 위반이 먼저다.
  EXPECT_FALSE(session_->ApplyMove("black-1", Move("e7", "e5"), error));
  EXPECT_EQ(error, GameError::kNotYourTurn);
  EXPECT_FALSE(session_->ApplyMove("white-1", Move("e2", "e4"), error));
  EXPECT_EQ(error, GameError::kGameNotActive);

  StartGame();
  EXPECT_FALSE(session_->ApplyMove("black-1", Move("e7", "e5"), error));
  EXPECT_EQ(error, GameError::kNotYourTurn);
  EXPECT_FALSE(session_->ApplyMove("stranger", Move("e2", "e4"), error));
  EXPECT_EQ(error, GameError::kNotYourTurn);
}

TEST_F(GameSessionTest, IllegalMoveIsRejected) {
  StartGame();
  GameError error = GameError::kNone;
  EXPECT_FALSE(session_->ApplyMove("white-1", Move("e2", "e5"), error));
  EXPECT_EQ(error, GameError::kIllegalMove);
  EXPECT_EQ(session_->MoveCount(), 0);
  EXPECT_TRUE(store_->GetGameMoves("g1").empty());
}

TEST_F(GameSessionTest, PersistenceFailureLeavesStateUnchanged) {
  StartGame();
  store_->SetWriteFailureInjector([](const std::string& op) { return op == "RecordMove"; });
  GameError error = GameError::kNone;
  EXPECT_THROW(session_->ApplyMove("white-1", Move("e2", "e4"), error), chessroom::DbException);

  auto state = session_->GetState();
  EXPECT_EQ(state.fen, chessroom::kInitialFen);
  EXPECT_EQ(state.turn, Color::kWhite);
  EXPECT_EQ(state.move_count, 0);

  store_->SetWriteFailureInjector(nullptr);
  auto retry = session_->ApplyMove("white-1", Move("e2", "e4"), error);
  ASSERT_TRUE(retry.has_value());
  EXPECT_EQ(retry->move_number, 1);
}

TEST_F(GameSessionTest, CheckmateCompletesGameAndUpdatesStats) {
  StartGame();
  std::string completed_id;
  session_->SetCompletionHook([&completed_id](const std::string& id) { completed_id = id; });

  std::optional<GameOver> game_over;
  PlayFoolsMate(game_over);
  ASSERT_TRUE(game_over.has_value());
  EXPECT_EQ(game_over->type, "checkmate");
  EXPECT_EQ(game_over->winner, Color::kBlack);
  EXPECT_EQ(game_over->result, "black_wins");
  EXPECT_EQ(session_->Status(), GameStatus::kCompleted);
  EXPECT_EQ(completed_id, "g1");
  EXPECT_TRUE(session_->GetLegalMoves().empty());

  auto record = store_->GetGame("g1");
  EXPECT_EQ(record->status, GameStatus::kCompleted);
  EXPECT_EQ(record->result, "black_wins");
  EXPECT_EQ(store_->GetPlayer("black-1")->score, 3);
  EXPECT_EQ(store_->GetPlayer("black-1")->wins, 1);
  EXPECT_EQ(store_->GetPlayer("white-1")->losses, 1);

  GameError error = GameError::kNone;
  EXPECT_FALSE(session_->ApplyMove("white-1", Move("a2", "a3"), error));
  EXPECT_EQ(error, GameError::kGameNotActive);
}

TEST_F(GameSessionTest, ResignAwardsOpponent) {
  StartGame();
  GameError error = GameError::kNone;
  EXPECT_FALSE(session_->Resign("stranger", error));
  EXPECT_EQ(error, GameError::kNotAPlayer);

  auto game_over = session_->Resign("white-1", error);
  ASSERT_TRUE(game_over.has_value());
  EXPECT_EQ(game_over->type, "resignation");
  EXPECT_EQ(game_over->winner, Color::kBlack);
  EXPECT_EQ(game_over->result, "black_wins");

  EXPECT_FALSE(session_->Resign("black-1", error));
  EXPECT_EQ(error, GameError::kGameNotActive);
}

TEST_F(GameSessionTest, DrawOfferGuards) {
  GameError error = GameError::kNone;
  EXPECT_FALSE(session_->OfferDraw("white-1", error));
  EXPECT_EQ(error, GameError::kGameNotActive);

  StartGame();
  EXPECT_FALSE(session_->AcceptDraw("black-1", error));
  EXPECT_EQ(error, GameError::kDrawNotAvailable);

  EXPECT_EQ(session_->OfferDraw("white-1", error), Color::kWhite);
  EXPECT_FALSE(session_->OfferDraw("white-1", error));
  EXPECT_EQ(error, GameError::kDrawNotAvailable);
  // 자기 제안은 수락할 수 없다.
  EXPECT_FALSE(session_->AcceptDraw("white-1", error));
  EXPECT_EQ(error, GameError::kDrawNotAvailable);

  EXPECT_TRUE(session_->DeclineDraw("black-1", error));
  EXPECT_FALSE(session_->GetState().draw_offer.has_value());
  EXPECT_FALSE(session_->DeclineDraw("black-1", error));
  EXPECT_EQ(error, GameError::kDrawNotAvailable);
  EXPECT_EQ(session_->Status(), GameStatus::kActive);
}

TEST_F(GameSessionTest, AcceptedDrawCompletesGame) {
  StartGame();
  GameError error = GameError::kNone;
  ASSERT_TRUE(session_->OfferDraw("black-1", error));
  auto game_over = session_->AcceptDraw("white-1", error);
  ASSERT_TRUE(game_over.has_value());
  EXPECT_EQ(game_over->type, "draw_agreed");
  EXPECT_FALSE(game_over->winner.has_value());
  EXPECT_EQ(game_over->result, "draw");
  EXPECT_EQ(store_->GetPlayer("white-1")->draws, 1);
  EXPECT_EQ(store_->GetPlayer("black-1")->score, 1);
}

TEST_F(GameSessionTest, MoveClearsPendingDrawOffer) {
  StartGame();
  GameError error = GameError::kNone;
  ASSERT_TRUE(session_->OfferDraw("black-1", error));
  ASSERT_TRUE(session_->ApplyMove("white-1", Move("e2", "e4"), error));
  EXPECT_FALSE(session_->GetState().draw_offer.has_value());
  EXPECT_FALSE(session_->AcceptDraw("white-1", error));
  EXPECT_EQ(error, GameError::kDrawNotAvailable);
}

TEST_F(GameSessionTest, LegalMovesOnlyWhileActive) {
  EXPECT_TRUE(session_->GetLegalMoves().empty());
  StartGame();
  EXPECT_EQ(session_->GetLegalMoves().size(), 10u);
}

TEST_F(GameSessionTest, ReadyFiresOnceWhenBothAttached) {
  StartGame();
  GameError error = GameError::kNone;
  ASSERT_TRUE(session_->AttachSubscriber("white-1", "sock-w", error));
  EXPECT_FALSE(session_->MarkReadyIfBothConnected());
  ASSERT_TRUE(session_->AttachSubscriber("black-1", "sock-b", error));
  EXPECT_TRUE(session_->MarkReadyIfBothConnected());
  EXPECT_FALSE(session_->MarkReadyIfBothConnected());

  EXPECT_FALSE(session_->AttachSubscriber("stranger", "sock-x", error));
  EXPECT_EQ(error, GameError::kNotAPlayer);
}

TEST_F(GameSessionTest, DisconnectTimerAbandonsGame) {
  StartGame();
  GameError error = GameError::kNone;
  ASSERT_TRUE(session_->AttachSubscriber("white-1", "sock-w", error));
  ASSERT_TRUE(session_->AttachSubscriber("black-1", "sock-b", error));

  std::optional<GameOver> abandoned;
  auto color = session_->DetachSubscriber("black-1", "sock-b", std::chrono::milliseconds(10),
                                          [&abandoned](const GameOver& game_over) { abandoned = game_over; });
  EXPECT_EQ(color, Color::kBlack);
  EXPECT_TRUE(session_->HasDisconnectTimer("black-1"));
  EXPECT_FALSE(session_->GetState().black_connected);

  ioc_.run();

  ASSERT_TRUE(abandoned.has_value());
  EXPECT_EQ(abandoned->type, "abandonment");
  EXPECT_EQ(abandoned->winner, Color::kWhite);
  EXPECT_EQ(abandoned->reason, "black player disconnected");
  EXPECT_EQ(session_->Status(), GameStatus::kCompleted);
  EXPECT_FALSE(session_->HasDisconnectTimer("black-1"));
  EXPECT_EQ(store_->GetGame("g1")->result, "white_wins");
  EXPECT_NE(log_.str().find("game.abandoned"), std::string::npos);
}

TEST_F(GameSessionTest, ReattachCancelsDisconnectTimer) {
  StartGame();
  GameError error = GameError::kNone;
  ASSERT_TRUE(session_->AttachSubscriber("white-1", "sock-1", error));
  bool abandoned = false;
  session_->DetachSubscriber("white-1", "sock-1", std::chrono::milliseconds(10),
                             [&abandoned](const GameOver&) { abandoned = true; });
  ASSERT_TRUE(session_->HasDisconnectTimer("white-1"));

  ASSERT_TRUE(session_->AttachSubscriber("white-1", "sock-2", error));
  EXPECT_FALSE(session_->HasDisconnectTimer("white-1"));

  ioc_.run();
  EXPECT_FALSE(abandoned);
  EXPECT_EQ(session_->Status(), GameStatus::kActive);
  EXPECT_TRUE(session_->GetState().white_connected);
}

TEST_F(GameSessionTest, StaleSocketDetachIsIgnored) {
  StartGame();
  GameError error = GameError::kNone;
  ASSERT_TRUE(session_->AttachSubscriber("white-1", "sock-1", error));
  ASSERT_TRUE(session_->AttachSubscriber("white-1", "sock-2", error));

  auto color = session_->DetachSubscriber("white-1", "sock-1", std::chrono::milliseconds(10), nullptr);
  EXPECT_FALSE(color.has_value());
  EXPECT_FALSE(session_->HasDisconnectTimer("white-1"));
  EXPECT_TRUE(session_->GetState().white_connected);
}

TEST_F(GameSessionTest, DisconnectWhileWaitingStartsNoTimer) {
  GameError error = GameError::kNone;
  ASSERT_TRUE(session_->AttachSubscriber("white-1", "sock-w", error));
  EXPECT_TRUE(session_->DetachSubscriber("white-1", "sock-w", std::chrono::milliseconds(10), nullptr));
  EXPECT_FALSE(session_->HasDisconnectTimer("white-1"));
  EXPECT_EQ(session_->Status(), GameStatus::kWaiting);
}

TEST_F(GameSessionTest, AbandonFailureRetriesUntilStored) {
  StartGame();
  GameError error = GameError::kNone;
  ASSERT_TRUE(session_->AttachSubscriber("black-1", "sock-b", error));
  store_->SetWriteFailureInjector([](const std::string& op) { return op == "CompleteGame"; });

  std::optional<GameOver> abandoned;
  session_->DetachSubscriber("black-1", "sock-b", std::chrono::milliseconds(10),
                             [&abandoned](const GameOver& game_over) { abandoned = game_over; });
  ASSERT_EQ(ioc_.run_one(), 1u);

  EXPECT_FALSE(abandoned.has_value());
  EXPECT_EQ(session_->Status(), GameStatus::kActive);
  EXPECT_NE(log_.str().find("game.abandon_failed"), std::string::npos);
  EXPECT_TRUE(session_->HasDisconnectTimer("black-1"));

  store_->SetWriteFailureInjector(nullptr);
  ioc_.run();

  ASSERT_TRUE(abandoned.has_value());
  EXPECT_EQ(abandoned->winner, Color::kWhite);
  EXPECT_EQ(session_->Status(), GameStatus::kCompleted);
  EXPECT_EQ(store_->GetGame("g1")->result, "white_wins");
}

TEST_F(GameSessionTest, ReturningPlayerStopsAbandonRetry) {
  StartGame();
  GameError error = GameError::kNone;
  ASSERT_TRUE(session_->AttachSubscriber("black-1", "sock-b", error));
  store_->SetWriteFailureInjector([](const std::string& op) { return op == "CompleteGame"; });

  session_->DetachSubscriber("black-1", "sock-b", std::chrono::milliseconds(10), nullptr);
  ASSERT_EQ(ioc_.run_one(), 1u);
  ASSERT_TRUE(session_->HasDisconnectTimer("black-1"));

  ASSERT_TRUE(session_->AttachSubscriber("black-1", "sock-b2", error));
  EXPECT_FALSE(session_->HasDisconnectTimer("black-1"));
  ioc_.run();
  EXPECT_EQ(session_->Status(), GameStatus::kActive);
}

TEST_F(GameSessionTest, FailedCommitLeavesNoMoveBehind) {
  StartGame();
  store_->SetWriteFailureInjector([](const std::string& op) { return op == "UpdateGameState"; });
  GameError error = GameError::kNone;
  EXPECT_THROW(session_->ApplyMove("white-1", Move("e2", "e4"), error), chessroom::DbException);
  EXPECT_EQ(session_->MoveCount(), 0);
  EXPECT_TRUE(store_->GetGameMoves("g1").empty());
  EXPECT_EQ(store_->GetGame("g1")->fen, chessroom::kInitialFen);

  store_->SetWriteFailureInjector(nullptr);
  auto retry = session_->ApplyMove("white-1", Move("d2", "d4"), error);
  ASSERT_TRUE(retry.has_value());
  EXPECT_EQ(retry->move_number, 1);
  auto moves = store_->GetGameMoves("g1");
  ASSERT_EQ(moves.size(), 1u);
  EXPECT_EQ(moves[0].san, "d4");
  EXPECT_EQ(store_->GetGame("g1")->pgn, "1. d4");
}

TEST_F(GameSessionTest, FailedCompletionRejectsMatingMove) {
  StartGame();
  GameError error = GameError::kNone;
  ASSERT_TRUE(session_->ApplyMove("white-1", Move("f2", "f3"), error));
  ASSERT_TRUE(session_->ApplyMove("black-1", Move("e7", "e5"), error));
  ASSERT_TRUE(session_->ApplyMove("white-1", Move("g2", "g4"), error));

  store_->SetWriteFailureInjector([](const std::string& op) { return op == "CompleteGame"; });
  EXPECT_THROW(session_->ApplyMove("black-1", Move("d8", "h4"), error), chessroom::DbException);
  EXPECT_EQ(session_->Status(), GameStatus::kActive);
  EXPECT_EQ(session_->MoveCount(), 3);
  EXPECT_EQ(store_->GetGameMoves("g1").size(), 3u);
  EXPECT_EQ(store_->GetPlayer("black-1")->wins, 0);

  store_->SetWriteFailureInjector(nullptr);
  auto mate = session_->ApplyMove("black-1", Move("d8", "h4"), error);
  ASSERT_TRUE(mate.has_value());
  ASSERT_TRUE(mate->game_over.has_value());
  EXPECT_EQ(mate->move_number, 4);
  EXPECT_EQ(store_->GetGame("g1")->result, "black_wins");
}

TEST_F(GameSessionTest, ReplayedMoveLogReproducesStoredPosition) {
  StartGame();
  std::optional<GameOver> game_over;
  PlayFoolsMate(game_over);
  ASSERT_TRUE(game_over.has_value());

  chessroom::StandardChessRules replay;
  for (const auto& move : store_->GetGameMoves("g1")) {
    ASSERT_TRUE(replay.ApplyMove(MoveRequest{move.from_square, move.to_square, std::nullopt}).has_value());
    EXPECT_EQ(replay.Fen(), move.fen_after);
  }
  auto record = store_->GetGame("g1");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->status, GameStatus::kCompleted);
  EXPECT_EQ(replay.Fen(), record->fen);
  EXPECT_EQ(replay.Pgn(), record->pgn);
}

TEST_F(GameSessionTest, DrawByRepetitionReportsNoLegalMoves) {
  StartGame();
  const std::pair<const char*, const char*> shuffle[] = {{"g1", "f3"}, {"g8", "f6"}, {"f3", "g1"}, {"f6", "g8"}};
  GameError error = GameError::kNone;
  std::optional<chessroom::MoveResult> last;
  for (int i = 0; i < 8; ++i) {
    const char* player = i % 2 == 0 ? "white-1" : "black-1";
    last = session_->ApplyMove(player, Move(shuffle[i % 4].first, shuffle[i % 4].second), error);
    ASSERT_TRUE(last.has_value());
  }
  ASSERT_TRUE(last->game_over.has_value());
  EXPECT_EQ(last->game_over->reason, "threefold repetition");
  EXPECT_TRUE(last->legal_moves.empty());
  EXPECT_TRUE(session_->GetLegalMoves().empty());
  EXPECT_EQ(store_->GetGame("g1")->result, "draw");
}
