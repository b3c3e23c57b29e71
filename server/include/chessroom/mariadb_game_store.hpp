/*
 * 설명: GameStore 계약을 MariaDB 테이블(players, games, moves) 위에 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/001_initial.sql
 * 테스트: server/tests/it/mariadb_game_store_it_test.cpp
 */
#pragma once

#include <memory>

#include "chessroom/db_client.hpp"
#include "chessroom/game_store.hpp"

namespace chessroom {

class MariaDbGameStore : public GameStore {
 public:
  explicit MariaDbGameStore(std::shared_ptr<MariaDbClient> db_client);

  void CreatePlayer(const std::string& player_id, const std::string& display_name) override;
  std::optional<PlayerRecord> GetPlayer(const std::string& player_id) override;
  std::vector<PlayerRecord> GetLeaderboard(std::size_t limit) override;

  void CreateGame(const std::string& game_id, const std::string& white_player_id) override;
  void JoinGame(const std::string& game_id, const std::string& black_player_id) override;
  void CompleteGame(const std::string& game_id, const std::string& result) override;
  std::optional<GameRecord> GetGame(const std::string& game_id) override;
  std::vector<RecentGame> GetRecentGames(std::size_t limit) override;

  void CommitMove(const MoveRecord& move, const std::string& pgn,
                  const std::optional<std::string>& result) override;
  std::vector<MoveRecord> GetGameMoves(const std::string& game_id) override;

  StoreStats GetStats() override;

  // 테스트 전용: 모든 행 삭제
  void ClearAll() const;

 private:
  // 행 잠금 후 결과와 전적을 반영한다. 이미 종료된 게임이면 false.
  bool CompleteGameInTx(MYSQL* conn, const std::string& game_id, const std::string& result);
  void UpdateStatsInTx(MYSQL* conn, const std::string& player_id, PlayerOutcome outcome);
  PlayerRecord BuildPlayer(const DbRow& row) const;
  GameRecord BuildGame(const DbRow& row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace chessroom
