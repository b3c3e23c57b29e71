/*
 * 설명: 실시간 수신 이벤트를 세션 연산에 연결하고 결과를 방(room)에 전파한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_protocol_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chessroom/game_session.hpp"
#include "chessroom/game_store.hpp"
#include "chessroom/observability.hpp"
#include "chessroom/room_hub.hpp"
#include "chessroom/session_registry.hpp"

namespace chessroom {

// 소켓 하나가 어떤 게임의 어떤 플레이어로 묶였는지. 소켓의 실행 컨텍스트에서만 접근한다.
struct ProtocolConnection {
  std::string subscriber_id;
  std::string game_id;
  std::string player_id;

  bool Bound() const { return !game_id.empty(); }
};

class GameProtocolHandler : public std::enable_shared_from_this<GameProtocolHandler> {
 public:
  GameProtocolHandler(std::shared_ptr<SessionRegistry> registry, std::shared_ptr<RoomHub> hub,
                      std::shared_ptr<GameStore> store, std::shared_ptr<Observability> observability,
                      std::chrono::milliseconds disconnect_grace);

  void HandleEvent(ProtocolConnection& connection, const std::string& event, const nlohmann::json& payload);
  // 전송 계층 연결이 끊겼을 때 호출한다.
  void HandleDisconnect(ProtocolConnection& connection);

 private:
  void OnJoinGame(ProtocolConnection& connection, const nlohmann::json& payload);
  void OnMakeMove(const ProtocolConnection& connection, const nlohmann::json& payload);
  void OnResign(const ProtocolConnection& connection);
  void OnOfferDraw(const ProtocolConnection& connection);
  void OnAcceptDraw(const ProtocolConnection& connection);
  void OnDeclineDraw(const ProtocolConnection& connection);

  std::shared_ptr<GameSession> BoundSession(const ProtocolConnection& connection);
  nlohmann::json BuildGameState(const GameSession& session, Color viewer) const;
  nlohmann::json BuildGameOver(const GameSession& session, const GameOver& game_over) const;
  std::string DisplayName(const std::optional<std::string>& player_id) const;
  void SendError(const std::string& subscriber_id, const std::string& code, const std::string& message);
  void SendError(const std::string& subscriber_id, GameError error);

  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<RoomHub> hub_;
  std::shared_ptr<GameStore> store_;
  std::shared_ptr<Observability> observability_;
  std::chrono::milliseconds disconnect_grace_;
};

}  // namespace chessroom
