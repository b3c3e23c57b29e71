/*
 * 설명: 플레이어/게임/수 기록을 MariaDB에 저장하고 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/001_initial.sql
 * 테스트: server/tests/it/mariadb_game_store_it_test.cpp
 */
#include "chessroom/mariadb_game_store.hpp"

#include <sstream>

namespace chessroom {
namespace {
constexpr const char* kPlayerColumns =
    "id, display_name, wins, losses, draws, score, DATE_FORMAT(created_at, '%Y-%m-%dT%H:%i:%sZ')";
constexpr const char* kGameColumns =
    "g.id, g.white_player_id, g.black_player_id, g.status, g.result, g.pgn, g.fen, "
    "DATE_FORMAT(g.created_at, '%Y-%m-%dT%H:%i:%sZ'), DATE_FORMAT(g.updated_at, '%Y-%m-%dT%H:%i:%sZ')";

int ToInt(const std::optional<std::string>& value) { return value ? std::stoi(*value) : 0; }
std::string ToText(const std::optional<std::string>& value) { return value.value_or(""); }

std::string StatsColumn(PlayerOutcome outcome) {
  switch (outcome) {
    case PlayerOutcome::kWin:
      return "wins";
    case PlayerOutcome::kLoss:
      return "losses";
    case PlayerOutcome::kDraw:
      return "draws";
  }
  return "draws";
}
}  // namespace

MariaDbGameStore::MariaDbGameStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void MariaDbGameStore::CreatePlayer(const std::string& player_id, const std::string& display_name) {
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO players(id, display_name) VALUES(" << db_client_->Quote(conn, player_id) << ", "
        << db_client_->Quote(conn, display_name) << ");";
    db_client_->Execute(conn, oss.str(), "플레이어 생성 실패");
    return true;
  });
}

std::optional<PlayerRecord> MariaDbGameStore::GetPlayer(const std::string& player_id) {
  std::optional<PlayerRecord> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kPlayerColumns << " FROM players WHERE id=" << db_client_->Quote(conn, player_id) << ";";
    auto rows = db_client_->Select(conn, oss.str(), "플레이어 조회 실패");
    if (!rows.empty()) {
      result = BuildPlayer(rows.front());
    }
  });
  return result;
}

void MariaDbGameStore::UpdateStatsInTx(MYSQL* conn, const std::string& player_id, PlayerOutcome outcome) {
  const auto column = StatsColumn(outcome);
  std::ostringstream oss;
  oss << "UPDATE players SET " << column << " = " << column << " + 1, score = score + " << ScoreFor(outcome)
      << " WHERE id=" << db_client_->Quote(conn, player_id) << ";";
  db_client_->Execute(conn, oss.str(), "전적 갱신 실패");
}

std::vector<PlayerRecord> MariaDbGameStore::GetLeaderboard(std::size_t limit) {
  std::vector<PlayerRecord> players;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kPlayerColumns << " FROM players ORDER BY score DESC, wins DESC LIMIT " << limit << ";";
    players.clear();
    for (const auto& row : db_client_->Select(conn, oss.str(), "리더보드 조회 실패")) {
      players.push_back(BuildPlayer(row));
    }
  });
  return players;
}

void MariaDbGameStore::CreateGame(const std::string& game_id, const std::string& white_player_id) {
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO games(id, white_player_id, status) VALUES(" << db_client_->Quote(conn, game_id) << ", "
        << db_client_->Quote(conn, white_player_id) << ", 'waiting');";
    db_client_->Execute(conn, oss.str(), "게임 생성 실패");
    return true;
  });
}

void MariaDbGameStore::JoinGame(const std::string& game_id, const std::string& black_player_id) {
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE games SET black_player_id=" << db_client_->Quote(conn, black_player_id)
        << ", status='active', updated_at=NOW(6) WHERE id=" << db_client_->Quote(conn, game_id) << ";";
    db_client_->Execute(conn, oss.str(), "게임 참가 기록 실패");
    return true;
  });
}

void MariaDbGameStore::CompleteGame(const std::string& game_id, const std::string& result) {
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) { return CompleteGameInTx(conn, game_id, result); });
}

bool MariaDbGameStore::CompleteGameInTx(MYSQL* conn, const std::string& game_id, const std::string& result) {
  std::ostringstream select;
  select << "SELECT white_player_id, black_player_id, status FROM games WHERE id=" << db_client_->Quote(conn, game_id)
         << " FOR UPDATE;";
  auto rows = db_client_->Select(conn, select.str(), "게임 잠금 실패");
  if (rows.empty()) {
    throw DbException("완료할 게임이 없습니다: " + game_id, 0, false);
  }
  // 이미 종료된 게임이면 전적을 다시 반영하지 않는다.
  if (IsTerminal(ParseGameStatus(ToText(rows.front()[2])))) {
    return false;
  }
  const auto white_id = ToText(rows.front()[0]);
  const auto black_id = rows.front()[1];

  std::ostringstream update;
  update << "UPDATE games SET status='completed', result=" << db_client_->Quote(conn, result)
         << ", updated_at=NOW(6) WHERE id=" << db_client_->Quote(conn, game_id) << ";";
  db_client_->Execute(conn, update.str(), "게임 완료 기록 실패");

  if (!black_id) {
    return true;
  }
  if (result == "white_wins") {
    UpdateStatsInTx(conn, white_id, PlayerOutcome::kWin);
    UpdateStatsInTx(conn, *black_id, PlayerOutcome::kLoss);
  } else if (result == "black_wins") {
    UpdateStatsInTx(conn, *black_id, PlayerOutcome::kWin);
    UpdateStatsInTx(conn, white_id, PlayerOutcome::kLoss);
  } else {
    UpdateStatsInTx(conn, white_id, PlayerOutcome::kDraw);
    UpdateStatsInTx(conn, *black_id, PlayerOutcome::kDraw);
  }
  return true;
}

std::optional<GameRecord> MariaDbGameStore::GetGame(const std::string& game_id) {
  std::optional<GameRecord> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kGameColumns << " FROM games g WHERE g.id=" << db_client_->Quote(conn, game_id) << ";";
    auto rows = db_client_->Select(conn, oss.str(), "게임 조회 실패");
    if (!rows.empty()) {
      result = BuildGame(rows.front());
    }
  });
  return result;
}

std::vector<RecentGame> MariaDbGameStore::GetRecentGames(std::size_t limit) {
  std::vector<RecentGame> games;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kGameColumns << ", wp.display_name, bp.display_name FROM games g "
        << "LEFT JOIN players wp ON g.white_player_id = wp.id "
        << "LEFT JOIN players bp ON g.black_player_id = bp.id "
        << "WHERE g.status = 'completed' ORDER BY g.updated_at DESC LIMIT " << limit << ";";
    games.clear();
    for (const auto& row : db_client_->Select(conn, oss.str(), "최근 게임 조회 실패")) {
      games.push_back(RecentGame{BuildGame(row), ToText(row[9]), ToText(row[10])});
    }
  });
  return games;
}

void MariaDbGameStore::CommitMove(const MoveRecord& move, const std::string& pgn,
                                  const std::optional<std::string>& result) {
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream insert;
    insert << "INSERT INTO moves(game_id, move_number, player_id, from_square, to_square, san, fen_after) VALUES("
           << db_client_->Quote(conn, move.game_id) << ", " << move.move_number << ", "
           << db_client_->Quote(conn, move.player_id) << ", " << db_client_->Quote(conn, move.from_square) << ", "
           << db_client_->Quote(conn, move.to_square) << ", " << db_client_->Quote(conn, move.san) << ", "
           << db_client_->Quote(conn, move.fen_after) << ");";
    db_client_->Execute(conn, insert.str(), "수 기록 실패");

    std::ostringstream update;
    update << "UPDATE games SET fen=" << db_client_->Quote(conn, move.fen_after)
           << ", pgn=" << db_client_->Quote(conn, pgn) << ", updated_at=NOW(6) WHERE id="
           << db_client_->Quote(conn, move.game_id) << ";";
    db_client_->Execute(conn, update.str(), "포지션 저장 실패");

    if (result) {
      CompleteGameInTx(conn, move.game_id, *result);
    }
    return true;
  });
}

std::vector<MoveRecord> MariaDbGameStore::GetGameMoves(const std::string& game_id) {
  std::vector<MoveRecord> moves;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT game_id, move_number, player_id, from_square, to_square, san, fen_after FROM moves WHERE game_id="
        << db_client_->Quote(conn, game_id) << " ORDER BY move_number ASC;";
    moves.clear();
    for (const auto& row : db_client_->Select(conn, oss.str(), "수 기록 조회 실패")) {
      moves.push_back(MoveRecord{ToText(row[0]), ToInt(row[1]), ToText(row[2]), ToText(row[3]), ToText(row[4]),
                                 ToText(row[5]), ToText(row[6])});
    }
  });
  return moves;
}

StoreStats MariaDbGameStore::GetStats() {
  StoreStats stats;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    auto count = [&](const std::string& sql) -> std::size_t {
      auto rows = db_client_->Select(conn, sql, "통계 조회 실패");
      return rows.empty() ? 0 : static_cast<std::size_t>(std::stoull(ToText(rows.front()[0])));
    };
    stats.total_games = count("SELECT COUNT(*) FROM games WHERE status='completed';");
    stats.total_players = count("SELECT COUNT(*) FROM players;");
    stats.active_games = count("SELECT COUNT(*) FROM games WHERE status IN ('waiting', 'active');");
  });
  return stats;
}

void MariaDbGameStore::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM moves;", "수 기록 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM games;", "게임 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM players;", "플레이어 삭제 실패");
  });
}

PlayerRecord MariaDbGameStore::BuildPlayer(const DbRow& row) const {
  return PlayerRecord{ToText(row[0]), ToText(row[1]), ToInt(row[2]), ToInt(row[3]),
                      ToInt(row[4]),  ToInt(row[5]),  ToText(row[6])};
}

GameRecord MariaDbGameStore::BuildGame(const DbRow& row) const {
  GameRecord game;
  game.id = ToText(row[0]);
  game.white_player_id = ToText(row[1]);
  game.black_player_id = row[2];
  game.status = ParseGameStatus(ToText(row[3]));
  game.result = row[4];
  game.pgn = ToText(row[5]);
  game.fen = ToText(row[6]);
  game.created_at = ToText(row[7]);
  game.updated_at = ToText(row[8]);
  return game;
}

}  // namespace chessroom
