/*
 * 설명: 프로세스 메모리에 두는 GameStore 구현. 로컬 실행과 단위 테스트에서 쓴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp, server/tests/unit/game_session_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_map>

#include "chessroom/game_store.hpp"

namespace chessroom {

class MemoryGameStore : public GameStore {
 public:
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

  // 테스트에서 영속 계층 장애를 흉내 낸다. true를 반환하면 해당 쓰기가 예외로 실패한다.
  // CommitMove는 단계별 이름(RecordMove, UpdateGameState, CompleteGame)으로도 묻는다.
  void SetWriteFailureInjector(const std::function<bool(const std::string&)>& injector);

 private:
  void MaybeFail(const std::string& operation) const;
  void ApplyStatsLocked(const std::string& player_id, PlayerOutcome outcome);
  // 이미 종료된 게임이면 false. 전적은 한 번만 반영된다.
  bool CompleteLocked(GameRecord& game, const std::string& result);
  void TouchLocked(GameRecord& game);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, PlayerRecord> players_;
  std::unordered_map<std::string, GameRecord> games_;
  std::unordered_map<std::string, std::vector<MoveRecord>> moves_;
  // 최근 게임 정렬용 갱신 순번
  std::unordered_map<std::string, std::uint64_t> touched_at_;
  std::function<bool(const std::string&)> failure_injector_;
  std::uint64_t clock_{0};
};

}  // namespace chessroom
