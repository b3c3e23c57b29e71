/*
 * 설명: REST 경로 분기와 응답 엔벨로프 생성. 전송 계층(HttpSession)과 분리해 단위 테스트가 가능하다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/api_routes_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>

#include "chessroom/game_store.hpp"
#include "chessroom/observability.hpp"
#include "chessroom/rate_limiter.hpp"
#include "chessroom/session_registry.hpp"

namespace chessroom {

struct ApiReply {
  boost::beast::http::status status;
  nlohmann::json body;
};

// 앞뒤 공백 제거, 30자 제한, [A-Za-z0-9 _-] 외 문자 제거. 남는 것이 없으면 nullopt.
std::optional<std::string> SanitizePlayerName(const nlohmann::json& value);

class ApiRouter {
 public:
  ApiRouter(std::shared_ptr<SessionRegistry> registry, std::shared_ptr<GameStore> store,
            std::shared_ptr<Observability> observability, std::shared_ptr<RateLimiter> rate_limiter);

  ApiReply Handle(boost::beast::http::verb method, const std::string& target, const std::string& body,
                  const std::string& client_ip);

 private:
  ApiReply Route(boost::beast::http::verb method, const std::string& path, const std::string& query,
                 const std::string& body);
  ApiReply CreateGame(const std::string& body);
  ApiReply JoinGame(const std::string& game_id, const std::string& body);
  ApiReply ReconnectGame(const std::string& game_id, const std::string& body);
  ApiReply GetGame(const std::string& game_id);
  ApiReply GetGameMoves(const std::string& game_id);
  ApiReply GetLeaderboard(const std::string& query);
  ApiReply GetRecentGames(const std::string& query);
  ApiReply GetStats();
  ApiReply GetMetrics();

  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<GameStore> store_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<RateLimiter> rate_limiter_;
};

}  // namespace chessroom
