/*
 * 설명: 플레이어/게임/수 기록의 영속 저장소 계약을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_game_store_it_test.cpp, server/tests/unit/session_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace chessroom {

enum class GameStatus { kWaiting, kActive, kCompleted, kAbandoned };

std::string ToString(GameStatus status);
GameStatus ParseGameStatus(const std::string& text);
inline bool IsTerminal(GameStatus status) {
  return status == GameStatus::kCompleted || status == GameStatus::kAbandoned;
}

enum class PlayerOutcome { kWin, kLoss, kDraw };

struct PlayerRecord {
  std::string id;
  std::string display_name;
  int wins{0};
  int losses{0};
  int draws{0};
  int score{0};
  std::string created_at;
};

struct GameRecord {
  std::string id;
  std::string white_player_id;
  std::optional<std::string> black_player_id;
  GameStatus status{GameStatus::kWaiting};
  std::optional<std::string> result;
  std::string pgn;
  std::string fen;
  std::string created_at;
  std::string updated_at;
};

struct MoveRecord {
  std::string game_id;
  int move_number;
  std::string player_id;
  std::string from_square;
  std::string to_square;
  std::string san;
  std::string fen_after;
};

struct RecentGame {
  GameRecord game;
  std::string white_name;
  std::string black_name;
};

struct StoreStats {
  std::size_t total_games{0};
  std::size_t total_players{0};
  std::size_t active_games{0};
};

// 각 쓰기는 원자적이다. 실패는 예외(DbException 등)로 전파되고 아무것도 반영되지 않는다.
class GameStore {
 public:
  virtual ~GameStore() = default;

  virtual void CreatePlayer(const std::string& player_id, const std::string& display_name) = 0;
  virtual std::optional<PlayerRecord> GetPlayer(const std::string& player_id) = 0;
  virtual std::vector<PlayerRecord> GetLeaderboard(std::size_t limit) = 0;

  virtual void CreateGame(const std::string& game_id, const std::string& white_player_id) = 0;
  virtual void JoinGame(const std::string& game_id, const std::string& black_player_id) = 0;
  // 결과 기록과 두 플레이어의 전적 반영을 하나의 단위로 처리한다.
  virtual void CompleteGame(const std::string& game_id, const std::string& result) = 0;
  virtual std::optional<GameRecord> GetGame(const std::string& game_id) = 0;
  virtual std::vector<RecentGame> GetRecentGames(std::size_t limit) = 0;

  // 수 기록, 포지션(move.fen_after)과 수순 갱신, 종국이면 결과와 전적 반영까지 한 트랜잭션으로 처리한다.
  virtual void CommitMove(const MoveRecord& move, const std::string& pgn,
                          const std::optional<std::string>& result) = 0;
  virtual std::vector<MoveRecord> GetGameMoves(const std::string& game_id) = 0;

  virtual StoreStats GetStats() = 0;
};

// 승 +3, 무 +1, 패 0
int ScoreFor(PlayerOutcome outcome);

}  // namespace chessroom
