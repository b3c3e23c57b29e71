/*
 * 설명: 메모리 기반 GameStore. MariaDB 구현과 같은 의미를 단일 뮤텍스로 보장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp, server/tests/unit/game_session_test.cpp
 */
#include "chessroom/memory_game_store.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "chessroom/db_client.hpp"
#include "chessroom/rules_engine.hpp"

namespace chessroom {
namespace {
std::string NowIsoString() {
  auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}
}  // namespace

void MemoryGameStore::SetWriteFailureInjector(const std::function<bool(const std::string&)>& injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_injector_ = injector;
}

void MemoryGameStore::MaybeFail(const std::string& operation) const {
  if (failure_injector_ && failure_injector_(operation)) {
    throw DbException("주입된 저장 실패: " + operation, 0, false);
  }
}

void MemoryGameStore::TouchLocked(GameRecord& game) {
  game.updated_at = NowIsoString();
  touched_at_[game.id] = ++clock_;
}

void MemoryGameStore::CreatePlayer(const std::string& player_id, const std::string& display_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("CreatePlayer");
  if (players_.count(player_id) > 0) {
    throw DbException("중복 플레이어: " + player_id, 1062, false);
  }
  PlayerRecord player;
  player.id = player_id;
  player.display_name = display_name;
  player.created_at = NowIsoString();
  players_[player_id] = player;
}

std::optional<PlayerRecord> MemoryGameStore::GetPlayer(const std::string& player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = players_.find(player_id);
  if (it == players_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryGameStore::ApplyStatsLocked(const std::string& player_id, PlayerOutcome outcome) {
  auto it = players_.find(player_id);
  if (it == players_.end()) {
    return;
  }
  auto& player = it->second;
  switch (outcome) {
    case PlayerOutcome::kWin:
      ++player.wins;
      break;
    case PlayerOutcome::kLoss:
      ++player.losses;
      break;
    case PlayerOutcome::kDraw:
      ++player.draws;
      break;
  }
  player.score += ScoreFor(outcome);
}

std::vector<PlayerRecord> MemoryGameStore::GetLeaderboard(std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PlayerRecord> players;
  players.reserve(players_.size());
  for (const auto& [id, player] : players_) {
    players.push_back(player);
  }
  std::sort(players.begin(), players.end(), [](const PlayerRecord& a, const PlayerRecord& b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    if (a.wins != b.wins) {
      return a.wins > b.wins;
    }
    return a.id < b.id;
  });
  if (players.size() > limit) {
    players.resize(limit);
  }
  return players;
}

void MemoryGameStore::CreateGame(const std::string& game_id, const std::string& white_player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("CreateGame");
  if (games_.count(game_id) > 0) {
    throw DbException("중복 게임: " + game_id, 1062, false);
  }
  GameRecord game;
  game.id = game_id;
  game.white_player_id = white_player_id;
  game.status = GameStatus::kWaiting;
  game.fen = kInitialFen;
  game.created_at = NowIsoString();
  TouchLocked(game);
  games_[game_id] = game;
}

void MemoryGameStore::JoinGame(const std::string& game_id, const std::string& black_player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("JoinGame");
  auto it = games_.find(game_id);
  if (it == games_.end()) {
    return;
  }
  it->second.black_player_id = black_player_id;
  it->second.status = GameStatus::kActive;
  TouchLocked(it->second);
}

void MemoryGameStore::CompleteGame(const std::string& game_id, const std::string& result) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("CompleteGame");
  auto it = games_.find(game_id);
  if (it == games_.end()) {
    throw DbException("완료할 게임이 없습니다: " + game_id, 0, false);
  }
  CompleteLocked(it->second, result);
}

bool MemoryGameStore::CompleteLocked(GameRecord& game, const std::string& result) {
  if (IsTerminal(game.status)) {
    return false;
  }
  game.status = GameStatus::kCompleted;
  game.result = result;
  TouchLocked(game);
  if (!game.black_player_id) {
    return true;
  }
  if (result == "white_wins") {
    ApplyStatsLocked(game.white_player_id, PlayerOutcome::kWin);
    ApplyStatsLocked(*game.black_player_id, PlayerOutcome::kLoss);
  } else if (result == "black_wins") {
    ApplyStatsLocked(*game.black_player_id, PlayerOutcome::kWin);
    ApplyStatsLocked(game.white_player_id, PlayerOutcome::kLoss);
  } else {
    ApplyStatsLocked(game.white_player_id, PlayerOutcome::kDraw);
    ApplyStatsLocked(*game.black_player_id, PlayerOutcome::kDraw);
  }
  return true;
}

std::optional<GameRecord> MemoryGameStore::GetGame(const std::string& game_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = games_.find(game_id);
  if (it == games_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<RecentGame> MemoryGameStore::GetRecentGames(std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<const GameRecord*> completed;
  for (const auto& [id, game] : games_) {
    if (game.status == GameStatus::kCompleted) {
      completed.push_back(&game);
    }
  }
  std::sort(completed.begin(), completed.end(), [this](const GameRecord* a, const GameRecord* b) {
    return touched_at_.at(a->id) > touched_at_.at(b->id);
  });
  std::vector<RecentGame> recent;
  auto name_of = [this](const std::optional<std::string>& player_id) -> std::string {
    if (!player_id) {
      return "";
    }
    auto it = players_.find(*player_id);
    return it == players_.end() ? "" : it->second.display_name;
  };
  for (const auto* game : completed) {
    if (recent.size() >= limit) {
      break;
    }
    recent.push_back(RecentGame{*game, name_of(game->white_player_id), name_of(game->black_player_id)});
  }
  return recent;
}

void MemoryGameStore::CommitMove(const MoveRecord& move, const std::string& pgn,
                                 const std::optional<std::string>& result) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto game_it = games_.find(move.game_id);
  if (game_it == games_.end()) {
    throw DbException("수를 기록할 게임이 없습니다: " + move.game_id, 0, false);
  }
  // 모든 단계가 통과한 뒤에만 반영한다. 중간 실패는 롤백과 같다.
  MaybeFail("RecordMove");
  auto& moves = moves_[move.game_id];
  for (const auto& existing : moves) {
    if (existing.move_number == move.move_number) {
      throw DbException("중복 수 번호: " + std::to_string(move.move_number), 1062, false);
    }
  }
  MaybeFail("UpdateGameState");
  if (result) {
    MaybeFail("CompleteGame");
  }

  moves.push_back(move);
  auto& game = game_it->second;
  game.fen = move.fen_after;
  game.pgn = pgn;
  TouchLocked(game);
  if (result) {
    CompleteLocked(game, *result);
  }
}

std::vector<MoveRecord> MemoryGameStore::GetGameMoves(const std::string& game_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = moves_.find(game_id);
  if (it == moves_.end()) {
    return {};
  }
  auto moves = it->second;
  std::sort(moves.begin(), moves.end(),
            [](const MoveRecord& a, const MoveRecord& b) { return a.move_number < b.move_number; });
  return moves;
}

StoreStats MemoryGameStore::GetStats() {
  std::lock_guard<std::mutex> lock(mutex_);
  StoreStats stats;
  stats.total_players = players_.size();
  for (const auto& [id, game] : games_) {
    if (game.status == GameStatus::kCompleted) {
      ++stats.total_games;
    } else if (game.status == GameStatus::kWaiting || game.status == GameStatus::kActive) {
      ++stats.active_games;
    }
  }
  return stats;
}

}  // namespace chessroom
