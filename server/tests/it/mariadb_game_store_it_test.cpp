#include <atomic>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "chessroom/db_client.hpp"
#include "chessroom/mariadb_game_store.hpp"
#include "chessroom/rules_engine.hpp"

namespace {

using chessroom::GameStatus;

chessroom::DbConfig TestDbConfig() {
  chessroom::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "chess";
  cfg.password = pass ? pass : "chess_pass";
  cfg.database = name ? name : "chessroom";
  return cfg;
}

class MariaDbGameStoreItTest : public ::testing::Test {
 protected:
  void SetUp() override {
    db_client_ = std::make_shared<chessroom::MariaDbClient>(TestDbConfig());
    store_ = std::make_shared<chessroom::MariaDbGameStore>(db_client_);
    try {
      store_->ClearAll();
    } catch (const chessroom::DbException& ex) {
      FAIL() << "MariaDB에 연결할 수 없습니다: " << ex.what();
    }
  }

  void SeedGame(const std::string& game_id, const std::string& white, const std::string& black) {
    store_->CreatePlayer(white, "Alice");
    store_->CreatePlayer(black, "Bob");
    store_->CreateGame(game_id, white);
    store_->JoinGame(game_id, black);
  }

  std::shared_ptr<chessroom::MariaDbClient> db_client_;
  std::shared_ptr<chessroom::MariaDbGameStore> store_;
};

const std::string kWhite = "00000000-0000-4000-8000-000000000001";
const std::string kBlack = "00000000-0000-4000-8000-000000000002";
constexpr const char* kFenAfterE4 = "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1";
constexpr const char* kFenAfterD4 = "rnbqkbnr/pppppppp/8/8/3P4/8/PPP1PPPP/RNBQKBNR b KQkq d3 0 1";

}  // namespace

TEST_F(MariaDbGameStoreItTest, GameLifecyclePersists) {
  SeedGame("it000001", kWhite, kBlack);
  auto game = store_->GetGame("it000001");
  ASSERT_TRUE(game.has_value());
  EXPECT_EQ(game->status, GameStatus::kActive);
  EXPECT_EQ(game->white_player_id, kWhite);
  EXPECT_EQ(game->black_player_id, kBlack);
  EXPECT_EQ(game->fen, chessroom::kInitialFen);

  store_->CommitMove(chessroom::MoveRecord{"it000001", 1, kWhite, "e2", "e4", "e4", kFenAfterE4}, "1. e4",
                     std::nullopt);
  auto moves = store_->GetGameMoves("it000001");
  ASSERT_EQ(moves.size(), 1u);
  EXPECT_EQ(moves[0].san, "e4");
  EXPECT_EQ(moves[0].fen_after, kFenAfterE4);
  EXPECT_EQ(store_->GetGame("it000001")->pgn, "1. e4");

  auto stats = store_->GetStats();
  EXPECT_EQ(stats.active_games, 1u);
  EXPECT_EQ(stats.total_players, 2u);
}

TEST_F(MariaDbGameStoreItTest, CompleteGameAppliesStatsOnce) {
  SeedGame("it000002", kWhite, kBlack);
  store_->CompleteGame("it000002", "black_wins");
  store_->CompleteGame("it000002", "white_wins");

  auto game = store_->GetGame("it000002");
  EXPECT_EQ(game->status, GameStatus::kCompleted);
  EXPECT_EQ(game->result, "black_wins");
  auto black = store_->GetPlayer(kBlack);
  auto white = store_->GetPlayer(kWhite);
  ASSERT_TRUE(black.has_value());
  ASSERT_TRUE(white.has_value());
  EXPECT_EQ(black->wins, 1);
  EXPECT_EQ(black->score, 3);
  EXPECT_EQ(white->losses, 1);
  EXPECT_EQ(white->score, 0);

  auto board = store_->GetLeaderboard(10);
  ASSERT_EQ(board.size(), 2u);
  EXPECT_EQ(board[0].id, kBlack);

  auto recent = store_->GetRecentGames(5);
  ASSERT_EQ(recent.size(), 1u);
  EXPECT_EQ(recent[0].game.id, "it000002");
  EXPECT_EQ(recent[0].white_name, "Alice");
  EXPECT_EQ(recent[0].black_name, "Bob");
}

TEST_F(MariaDbGameStoreItTest, ConcurrentCompletionCountsOnce) {
  SeedGame("it000003", kWhite, kBlack);
  std::thread t1([&]() { store_->CompleteGame("it000003", "draw"); });
  std::thread t2([&]() { store_->CompleteGame("it000003", "draw"); });
  t1.join();
  t2.join();

  EXPECT_EQ(store_->GetPlayer(kWhite)->draws, 1);
  EXPECT_EQ(store_->GetPlayer(kBlack)->draws, 1);
  EXPECT_EQ(store_->GetPlayer(kBlack)->score, 1);
}

TEST_F(MariaDbGameStoreItTest, DuplicateMoveNumberIsRejected) {
  SeedGame("it000004", kWhite, kBlack);
  store_->CommitMove(chessroom::MoveRecord{"it000004", 1, kWhite, "e2", "e4", "e4", kFenAfterE4}, "1. e4",
                     std::nullopt);
  EXPECT_THROW(store_->CommitMove(chessroom::MoveRecord{"it000004", 1, kWhite, "d2", "d4", "d4", kFenAfterD4},
                                  "1. d4", std::string("draw")),
               chessroom::DbException);

  // 실패한 커밋은 포지션, 수순, 결과 어느 것도 남기지 않는다.
  EXPECT_EQ(store_->GetGameMoves("it000004").size(), 1u);
  auto game = store_->GetGame("it000004");
  EXPECT_EQ(game->pgn, "1. e4");
  EXPECT_EQ(game->fen, kFenAfterE4);
  EXPECT_EQ(game->status, GameStatus::kActive);
  EXPECT_EQ(store_->GetPlayer(kWhite)->draws, 0);
}

TEST_F(MariaDbGameStoreItTest, TerminalMoveCompletesGameInSameCommit) {
  SeedGame("it000005", kWhite, kBlack);
  store_->CommitMove(chessroom::MoveRecord{"it000005", 1, kWhite, "e2", "e4", "e4", kFenAfterE4}, "1. e4",
                     std::string("white_wins"));

  auto game = store_->GetGame("it000005");
  EXPECT_EQ(game->status, GameStatus::kCompleted);
  EXPECT_EQ(game->result, "white_wins");
  EXPECT_EQ(game->fen, kFenAfterE4);
  EXPECT_EQ(store_->GetGameMoves("it000005").size(), 1u);
  EXPECT_EQ(store_->GetPlayer(kWhite)->score, 3);
  EXPECT_EQ(store_->GetPlayer(kBlack)->losses, 1);
}

TEST_F(MariaDbGameStoreItTest, TransientFailureIsRetried) {
  std::atomic<int> injected{0};
  db_client_->SetTransientInjector([&injected](std::size_t attempt) {
    if (attempt == 1) {
      ++injected;
      return true;
    }
    return false;
  });
  store_->CreatePlayer(kWhite, "Alice");
  db_client_->SetTransientInjector(nullptr);

  EXPECT_EQ(injected.load(), 1);
  ASSERT_TRUE(store_->GetPlayer(kWhite).has_value());
  EXPECT_EQ(store_->GetPlayer(kWhite)->display_name, "Alice");
}

TEST_F(MariaDbGameStoreItTest, MissingRowsAreEmpty) {
  EXPECT_FALSE(store_->GetGame("missing0").has_value());
  EXPECT_FALSE(store_->GetPlayer(kWhite).has_value());
  EXPECT_TRUE(store_->GetGameMoves("missing0").empty());
  EXPECT_THROW(store_->CompleteGame("missing0", "draw"), chessroom::DbException);
}
