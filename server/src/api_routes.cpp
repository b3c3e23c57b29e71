/*
 * 설명: REST 엔드포인트(게임 생성/참가/재접속/조회, 리더보드, 통계, 헬스, 메트릭) 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/api_routes_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#include "chessroom/api_routes.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <unordered_map>
#include <vector>

#include "chessroom/api_response.hpp"

namespace chessroom {

namespace {
namespace http = boost::beast::http;

constexpr std::size_t kMaxNameLength = 30;
constexpr std::size_t kLeaderboardDefault = 20;
constexpr std::size_t kLeaderboardMax = 100;
constexpr std::size_t kRecentDefault = 20;
constexpr std::size_t kRecentMax = 50;

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

// 숫자가 아니거나 0 이하이면 기본값, 상한을 넘으면 상한.
std::size_t ParseLimit(const std::string& query, std::size_t def, std::size_t max) {
  auto params = ParseQueryParams(query);
  auto it = params.find("limit");
  if (it == params.end() || it->second.empty() || !std::isdigit(static_cast<unsigned char>(it->second.front()))) {
    return def;
  }
  std::size_t value = 0;
  for (char c : it->second) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      break;
    }
    value = std::min<std::size_t>(value * 10 + static_cast<std::size_t>(c - '0'), max);
  }
  return value == 0 ? def : value;
}

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (pos <= path.size()) {
    auto slash = path.find('/', pos);
    auto segment = path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
    if (!segment.empty()) {
      segments.push_back(segment);
    }
    if (slash == std::string::npos) {
      break;
    }
    pos = slash + 1;
  }
  return segments;
}

nlohmann::json OptionalJson(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

ApiReply Ok(const nlohmann::json& data, http::status status = http::status::ok) {
  return ApiReply{status, MakeSuccessEnvelope(data)};
}

ApiReply Fail(http::status status, std::string_view code, std::string_view message) {
  return ApiReply{status, MakeErrorEnvelope(code, message)};
}

ApiReply Fail(http::status status, GameError error) { return ApiReply{status, MakeErrorEnvelope(error)}; }

std::optional<nlohmann::json> ParseBody(const std::string& body) {
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  return parsed;
}
}  // namespace

std::optional<std::string> SanitizePlayerName(const nlohmann::json& value) {
  if (!value.is_string()) {
    return std::nullopt;
  }
  auto name = value.get<std::string>();
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  name.erase(name.begin(), std::find_if(name.begin(), name.end(), not_space));
  name.erase(std::find_if(name.rbegin(), name.rend(), not_space).base(), name.end());
  if (name.size() > kMaxNameLength) {
    name.resize(kMaxNameLength);
  }
  std::string cleaned;
  for (char c : name) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) || c == ' ' || c == '_' || c == '-') {
      cleaned.push_back(c);
    }
  }
  if (cleaned.empty()) {
    return std::nullopt;
  }
  return cleaned;
}

ApiRouter::ApiRouter(std::shared_ptr<SessionRegistry> registry, std::shared_ptr<GameStore> store,
                     std::shared_ptr<Observability> observability, std::shared_ptr<RateLimiter> rate_limiter)
    : registry_(std::move(registry)), store_(std::move(store)), observability_(std::move(observability)),
      rate_limiter_(std::move(rate_limiter)) {}

ApiReply ApiRouter::Handle(http::verb method, const std::string& target, const std::string& body,
                           const std::string& client_ip) {
  std::string path = target;
  std::string query;
  auto qpos = target.find('?');
  if (qpos != std::string::npos) {
    path = target.substr(0, qpos);
    query = target.substr(qpos + 1);
  }

  if (path.rfind("/api/", 0) == 0 && rate_limiter_ &&
      !rate_limiter_->Allow(client_ip, std::chrono::steady_clock::now())) {
    return Fail(http::status::too_many_requests, "rate_limited", "Too many requests, please slow down.");
  }

  try {
    return Route(method, path, query, body);
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Log(LogContext{observability_->NextTraceId(), std::nullopt, std::nullopt, "http.failure", 0,
                                     LogLevel::kError, path + ": " + ex.what()});
    }
    return Fail(http::status::internal_server_error, "internal_error", "요청을 처리하지 못했습니다");
  }
}

ApiReply ApiRouter::Route(http::verb method, const std::string& path, const std::string& query,
                          const std::string& body) {
  if (method == http::verb::get && (path == "/health" || path == "/api/health")) {
    return Ok({{"status", "ok"}, {"service", "chessroom"}});
  }
  if (method == http::verb::get && path == "/metrics") {
    return GetMetrics();
  }

  const auto segments = SplitPath(path);
  if (segments.size() < 2 || segments[0] != "api") {
    return Fail(http::status::not_found, "not_found", "지원되지 않는 경로입니다");
  }

  if (segments[1] == "games") {
    if (segments.size() == 2 && method == http::verb::post) {
      return CreateGame(body);
    }
    if (segments.size() == 3 && method == http::verb::get) {
      return GetGame(segments[2]);
    }
    if (segments.size() == 4 && method == http::verb::post && segments[3] == "join") {
      return JoinGame(segments[2], body);
    }
    if (segments.size() == 4 && method == http::verb::post && segments[3] == "reconnect") {
      return ReconnectGame(segments[2], body);
    }
    if (segments.size() == 4 && method == http::verb::get && segments[3] == "moves") {
      return GetGameMoves(segments[2]);
    }
  }
  if (segments.size() == 2 && method == http::verb::get) {
    if (segments[1] == "leaderboard") {
      return GetLeaderboard(query);
    }
    if (segments[1] == "recent-games") {
      return GetRecentGames(query);
    }
    if (segments[1] == "stats") {
      return GetStats();
    }
  }
  return Fail(http::status::not_found, "not_found", "지원되지 않는 경로입니다");
}

ApiReply ApiRouter::CreateGame(const std::string& body) {
  auto json = ParseBody(body);
  auto name = json ? SanitizePlayerName(json->value("playerName", nlohmann::json())) : std::nullopt;
  if (!name) {
    return Fail(http::status::bad_request, "invalid_player_name",
                "Valid player name required (letters, numbers, max 30 chars)");
  }
  auto seat = registry_->Create(*name);
  return Ok({{"gameId", seat.game_id}, {"playerId", seat.player_id}, {"color", ToString(seat.color)}},
            http::status::created);
}

ApiReply ApiRouter::JoinGame(const std::string& game_id, const std::string& body) {
  auto json = ParseBody(body);
  auto name = json ? SanitizePlayerName(json->value("playerName", nlohmann::json())) : std::nullopt;
  if (!name) {
    return Fail(http::status::bad_request, "invalid_player_name",
                "Valid player name required (letters, numbers, max 30 chars)");
  }
  GameError error = GameError::kNone;
  auto seat = registry_->Join(game_id, *name, error);
  if (!seat) {
    return Fail(http::status::bad_request, error);
  }
  return Ok({{"gameId", seat->game_id}, {"playerId", seat->player_id}, {"color", ToString(seat->color)}});
}

ApiReply ApiRouter::ReconnectGame(const std::string& game_id, const std::string& body) {
  auto json = ParseBody(body);
  if (!json || !json->contains("playerId") || !(*json)["playerId"].is_string() ||
      (*json)["playerId"].get<std::string>().empty()) {
    return Fail(http::status::bad_request, "bad_request", "Player ID required");
  }
  GameError error = GameError::kNone;
  auto result = registry_->Reconnect(game_id, (*json)["playerId"].get<std::string>(), error);
  if (!result) {
    return Fail(http::status::bad_request, error);
  }
  nlohmann::json data{{"gameId", result->game_id}, {"playerId", result->player_id},
                      {"color", ToString(result->color)}};
  if (result->completed) {
    data["completed"] = true;
    data["result"] = OptionalJson(result->result);
    data["fen"] = result->fen;
  } else {
    data["reconnected"] = result->reconnected;
  }
  return Ok(data);
}

ApiReply ApiRouter::GetGame(const std::string& game_id) {
  auto game = store_->GetGame(game_id);
  if (!game) {
    return Fail(http::status::not_found, GameError::kGameNotFound);
  }
  auto white = store_->GetPlayer(game->white_player_id);
  auto black = game->black_player_id ? store_->GetPlayer(*game->black_player_id) : std::nullopt;
  return Ok({{"id", game->id},
             {"status", ToString(game->status)},
             {"result", OptionalJson(game->result)},
             {"whiteName", white ? nlohmann::json(white->display_name) : nlohmann::json(nullptr)},
             {"blackName", black ? nlohmann::json(black->display_name) : nlohmann::json(nullptr)},
             {"createdAt", game->created_at}});
}

ApiReply ApiRouter::GetGameMoves(const std::string& game_id) {
  nlohmann::json moves = nlohmann::json::array();
  for (const auto& move : store_->GetGameMoves(game_id)) {
    moves.push_back({{"gameId", move.game_id},
                     {"moveNumber", move.move_number},
                     {"playerId", move.player_id},
                     {"from", move.from_square},
                     {"to", move.to_square},
                     {"san", move.san},
                     {"fenAfter", move.fen_after}});
  }
  return Ok(moves);
}

ApiReply ApiRouter::GetLeaderboard(const std::string& query) {
  const auto limit = ParseLimit(query, kLeaderboardDefault, kLeaderboardMax);
  nlohmann::json entries = nlohmann::json::array();
  for (const auto& player : store_->GetLeaderboard(limit)) {
    entries.push_back({{"id", player.id},
                       {"displayName", player.display_name},
                       {"wins", player.wins},
                       {"losses", player.losses},
                       {"draws", player.draws},
                       {"score", player.score}});
  }
  return Ok(entries);
}

ApiReply ApiRouter::GetRecentGames(const std::string& query) {
  const auto limit = ParseLimit(query, kRecentDefault, kRecentMax);
  nlohmann::json games = nlohmann::json::array();
  for (const auto& recent : store_->GetRecentGames(limit)) {
    games.push_back({{"id", recent.game.id},
                     {"status", ToString(recent.game.status)},
                     {"result", OptionalJson(recent.game.result)},
                     {"pgn", recent.game.pgn},
                     {"whiteName", recent.white_name},
                     {"blackName", recent.black_name},
                     {"createdAt", recent.game.created_at},
                     {"updatedAt", recent.game.updated_at}});
  }
  return Ok(games);
}

ApiReply ApiRouter::GetStats() {
  auto stats = store_->GetStats();
  return Ok({{"totalGames", stats.total_games},
             {"totalPlayers", stats.total_players},
             {"activeGames", stats.active_games}});
}

ApiReply ApiRouter::GetMetrics() {
  auto snapshot = observability_->Snapshot(registry_->ActiveSessionCount());
  return Ok({{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
             {"connections", {{"websocket", snapshot.websocket_active}}},
             {"sessions", {{"active", snapshot.active_sessions}}}});
}

}  // namespace chessroom
