/*
 * 설명: 실시간 이벤트 바인딩. 세션 잠금을 쥔 채로 변경과 방송을 수행해 방송 순서가 확정 순서와 같도록 한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_protocol_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#include "chessroom/game_protocol.hpp"

#include <cctype>

namespace chessroom {

namespace {
constexpr const char* kWaitingName = "Waiting...";

std::optional<std::string> StringField(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

nlohmann::json OptionalChar(const std::optional<char>& value) {
  if (!value) {
    return nullptr;
  }
  return std::string(1, *value);
}
}  // namespace

GameProtocolHandler::GameProtocolHandler(std::shared_ptr<SessionRegistry> registry, std::shared_ptr<RoomHub> hub,
                                         std::shared_ptr<GameStore> store,
                                         std::shared_ptr<Observability> observability,
                                         std::chrono::milliseconds disconnect_grace)
    : registry_(std::move(registry)), hub_(std::move(hub)), store_(std::move(store)),
      observability_(std::move(observability)), disconnect_grace_(disconnect_grace) {}

void GameProtocolHandler::HandleEvent(ProtocolConnection& connection, const std::string& event,
                                      const nlohmann::json& payload) {
  try {
    if (event == "join-game") {
      OnJoinGame(connection, payload);
      return;
    }
    if (!connection.Bound()) {
      SendError(connection.subscriber_id, "not_joined", "먼저 join-game으로 게임에 참여해야 합니다");
      return;
    }
    if (event == "make-move") {
      OnMakeMove(connection, payload);
    } else if (event == "resign") {
      OnResign(connection);
    } else if (event == "offer-draw") {
      OnOfferDraw(connection);
    } else if (event == "accept-draw") {
      OnAcceptDraw(connection);
    } else if (event == "decline-draw") {
      OnDeclineDraw(connection);
    } else {
      SendError(connection.subscriber_id, "bad_request", "알 수 없는 이벤트: " + event);
    }
  } catch (const std::exception& ex) {
    // 저장소/규칙 엔진 장애는 이 연산만 거절한다. 확정 뒤의 방송 경로는 예외를 내지 않으므로
    // 여기 도달한 변경은 반영되지 않았다.
    if (observability_) {
      observability_->LogEvent("ws.operation_failed", connection.game_id,
                               connection.player_id.empty() ? std::nullopt
                                                            : std::optional<std::string>(connection.player_id),
                               event + ": " + ex.what(), LogLevel::kError);
    }
    if (event == "make-move") {
      hub_->SendTo(connection.subscriber_id, "move-rejected",
                   {{"error", "수를 저장하지 못했습니다"}, {"code", "internal_error"}});
    } else {
      SendError(connection.subscriber_id, "internal_error", "요청을 처리하지 못했습니다");
    }
  }
}

void GameProtocolHandler::HandleDisconnect(ProtocolConnection& connection) {
  if (!connection.Bound()) {
    return;
  }
  const auto game_id = connection.game_id;
  const auto player_id = connection.player_id;
  connection.game_id.clear();
  connection.player_id.clear();

  auto session = registry_->Find(game_id);
  if (!session) {
    return;
  }
  auto lock = session->Lock();
  std::weak_ptr<GameProtocolHandler> weak_self = weak_from_this();
  std::weak_ptr<GameSession> weak_session = session;
  auto on_abandon = [weak_self, weak_session, game_id](const GameOver& game_over) {
    auto self = weak_self.lock();
    auto live = weak_session.lock();
    if (!self || !live) {
      return;
    }
    try {
      self->hub_->Broadcast(game_id, "game-over", self->BuildGameOver(*live, game_over));
    } catch (const std::exception& ex) {
      if (self->observability_) {
        self->observability_->LogEvent("ws.broadcast_failed", game_id, std::nullopt, ex.what(), LogLevel::kError);
      }
    }
  };
  auto color = session->DetachSubscriber(player_id, connection.subscriber_id, disconnect_grace_, on_abandon);
  if (!color) {
    return;
  }
  hub_->BroadcastExcept(game_id, connection.subscriber_id, "player-disconnected", {{"color", ToString(*color)}});
  if (observability_) {
    observability_->LogEvent("ws.disconnect", game_id, player_id, ToString(*color));
  }
}

void GameProtocolHandler::OnJoinGame(ProtocolConnection& connection, const nlohmann::json& payload) {
  auto game_id = StringField(payload, "gameId");
  if (!game_id) {
    game_id = StringField(payload, "sessionId");
  }
  auto player_id = StringField(payload, "playerId");
  if (!game_id || !player_id) {
    SendError(connection.subscriber_id, "bad_request", "gameId와 playerId가 필요합니다");
    return;
  }
  if (connection.Bound() && (connection.game_id != *game_id || connection.player_id != *player_id)) {
    HandleDisconnect(connection);
  }

  GameError error = GameError::kNone;
  auto session = registry_->Acquire(*game_id, error);
  if (!session) {
    SendError(connection.subscriber_id, error);
    return;
  }
  auto lock = session->Lock();
  auto color = session->AttachSubscriber(*player_id, connection.subscriber_id, error);
  if (!color) {
    SendError(connection.subscriber_id, error);
    return;
  }
  connection.game_id = *game_id;
  connection.player_id = *player_id;
  hub_->JoinRoom(connection.subscriber_id, *game_id);

  hub_->SendTo(connection.subscriber_id, "game-state", BuildGameState(*session, *color));
  hub_->BroadcastExcept(*game_id, connection.subscriber_id, "player-connected",
                        {{"color", ToString(*color)}, {"name", DisplayName(*player_id)}});
  if (session->MarkReadyIfBothConnected()) {
    hub_->Broadcast(*game_id, "game-ready",
                    {{"whiteName", DisplayName(session->PlayerIdOf(Color::kWhite))},
                     {"blackName", DisplayName(session->PlayerIdOf(Color::kBlack))}});
  }
  if (observability_) {
    observability_->LogEvent("ws.join", *game_id, *player_id, ToString(*color));
  }
}

void GameProtocolHandler::OnMakeMove(const ProtocolConnection& connection, const nlohmann::json& payload) {
  auto from = StringField(payload, "from");
  auto to = StringField(payload, "to");
  if (!from || !to) {
    hub_->SendTo(connection.subscriber_id, "move-rejected",
                 {{"error", "from과 to가 필요합니다"}, {"code", "bad_request"}});
    return;
  }
  MoveRequest request{*from, *to, std::nullopt};
  if (auto promotion = StringField(payload, "promotion"); promotion && !promotion->empty()) {
    request.promotion = static_cast<char>(std::tolower(static_cast<unsigned char>(promotion->front())));
  }

  auto session = BoundSession(connection);
  if (!session) {
    return;
  }
  auto lock = session->Lock();
  GameError error = GameError::kNone;
  auto result = session->ApplyMove(connection.player_id, request, error);
  if (!result) {
    hub_->SendTo(connection.subscriber_id, "move-rejected",
                 {{"error", ToErrorMessage(error)}, {"code", ToErrorCode(error)}});
    return;
  }

  hub_->Broadcast(connection.game_id, "move-made",
                  {{"from", result->move.from},
                   {"to", result->move.to},
                   {"promotion", OptionalChar(result->move.promotion)},
                   {"san", result->move.san},
                   {"fen", result->fen},
                   {"turn", ToString(result->turn)},
                   {"inCheck", result->in_check},
                   {"moveNumber", result->move_number},
                   {"captured", OptionalChar(result->move.captured)},
                   {"piece", std::string(1, result->move.piece)},
                   {"legalMoves", result->legal_moves}});
  if (observability_) {
    observability_->LogEvent("game.move", connection.game_id, connection.player_id, result->move.san);
  }
  if (result->game_over) {
    hub_->Broadcast(connection.game_id, "game-over", BuildGameOver(*session, *result->game_over));
    if (observability_) {
      observability_->LogEvent("game.over", connection.game_id, std::nullopt, result->game_over->type);
    }
  }
}

void GameProtocolHandler::OnResign(const ProtocolConnection& connection) {
  auto session = BoundSession(connection);
  if (!session) {
    return;
  }
  auto lock = session->Lock();
  GameError error = GameError::kNone;
  auto game_over = session->Resign(connection.player_id, error);
  if (!game_over) {
    SendError(connection.subscriber_id, error);
    return;
  }
  hub_->Broadcast(connection.game_id, "game-over", BuildGameOver(*session, *game_over));
  if (observability_) {
    observability_->LogEvent("game.over", connection.game_id, connection.player_id, game_over->type);
  }
}

void GameProtocolHandler::OnOfferDraw(const ProtocolConnection& connection) {
  auto session = BoundSession(connection);
  if (!session) {
    return;
  }
  auto lock = session->Lock();
  GameError error = GameError::kNone;
  auto color = session->OfferDraw(connection.player_id, error);
  if (!color) {
    SendError(connection.subscriber_id, error);
    return;
  }
  hub_->BroadcastExcept(connection.game_id, connection.subscriber_id, "draw-offered",
                        {{"offeredBy", ToString(*color)}});
}

void GameProtocolHandler::OnAcceptDraw(const ProtocolConnection& connection) {
  auto session = BoundSession(connection);
  if (!session) {
    return;
  }
  auto lock = session->Lock();
  GameError error = GameError::kNone;
  auto game_over = session->AcceptDraw(connection.player_id, error);
  if (!game_over) {
    SendError(connection.subscriber_id, error);
    return;
  }
  hub_->Broadcast(connection.game_id, "game-over", BuildGameOver(*session, *game_over));
  if (observability_) {
    observability_->LogEvent("game.over", connection.game_id, connection.player_id, game_over->type);
  }
}

void GameProtocolHandler::OnDeclineDraw(const ProtocolConnection& connection) {
  auto session = BoundSession(connection);
  if (!session) {
    return;
  }
  auto lock = session->Lock();
  GameError error = GameError::kNone;
  if (!session->DeclineDraw(connection.player_id, error)) {
    SendError(connection.subscriber_id, error);
    return;
  }
  hub_->BroadcastExcept(connection.game_id, connection.subscriber_id, "draw-declined", nlohmann::json::object());
}

std::shared_ptr<GameSession> GameProtocolHandler::BoundSession(const ProtocolConnection& connection) {
  auto session = registry_->Find(connection.game_id);
  if (!session) {
    // 종료 후 제거된 세션
    SendError(connection.subscriber_id, GameError::kGameNotActive);
  }
  return session;
}

nlohmann::json GameProtocolHandler::BuildGameState(const GameSession& session, Color viewer) const {
  const auto state = session.GetState();
  nlohmann::json draw_offer = nullptr;
  if (state.draw_offer) {
    draw_offer = *state.draw_offer;
  }
  nlohmann::json black_player_id = nullptr;
  if (state.black_player_id) {
    black_player_id = *state.black_player_id;
  }
  return {{"gameId", state.session_id},
          {"fen", state.fen},
          {"pgn", state.pgn},
          {"turn", ToString(state.turn)},
          {"status", ToString(state.status)},
          {"inCheck", state.in_check},
          {"isGameOver", state.is_game_over},
          {"whitePlayerId", state.white_player_id},
          {"blackPlayerId", black_player_id},
          {"whiteConnected", state.white_connected},
          {"blackConnected", state.black_connected},
          {"moveCount", state.move_count},
          {"drawOffer", draw_offer},
          {"legalMoves", state.legal_moves},
          {"whiteName", DisplayName(state.white_player_id)},
          {"blackName", DisplayName(state.black_player_id)},
          {"yourColor", ToString(viewer)}};
}

nlohmann::json GameProtocolHandler::BuildGameOver(const GameSession& session, const GameOver& game_over) const {
  nlohmann::json payload{{"type", game_over.type}, {"result", game_over.result}};
  payload["winner"] = game_over.winner ? nlohmann::json(ToString(*game_over.winner)) : nlohmann::json(nullptr);
  if (!game_over.reason.empty()) {
    payload["reason"] = game_over.reason;
    if (game_over.type == "abandonment") {
      payload["message"] = game_over.reason;
    }
  }
  // 결과는 이미 확정됐으므로 조회에 실패해도 이름과 점수 없이 방송한다.
  try {
    auto white = store_->GetPlayer(session.PlayerIdOf(Color::kWhite).value_or(""));
    auto black_id = session.PlayerIdOf(Color::kBlack);
    auto black = black_id ? store_->GetPlayer(*black_id) : std::nullopt;
    payload["whiteName"] = white ? white->display_name : "";
    payload["blackName"] = black ? black->display_name : "";
    payload["whiteScore"] = white ? white->score : 0;
    payload["blackScore"] = black ? black->score : 0;
  } catch (const std::exception& ex) {
    payload["whiteName"] = "";
    payload["blackName"] = "";
    payload["whiteScore"] = nullptr;
    payload["blackScore"] = nullptr;
    if (observability_) {
      observability_->LogEvent("ws.scores_unavailable", session.Id(), std::nullopt, ex.what(), LogLevel::kWarn);
    }
  }
  return payload;
}

std::string GameProtocolHandler::DisplayName(const std::optional<std::string>& player_id) const {
  if (!player_id) {
    return kWaitingName;
  }
  auto player = store_->GetPlayer(*player_id);
  return player ? player->display_name : kWaitingName;
}

void GameProtocolHandler::SendError(const std::string& subscriber_id, const std::string& code,
                                    const std::string& message) {
  hub_->SendTo(subscriber_id, "error-msg", {{"message", message}, {"code", code}});
}

void GameProtocolHandler::SendError(const std::string& subscriber_id, GameError error) {
  SendError(subscriber_id, ToErrorCode(error), ToErrorMessage(error));
}

}  // namespace chessroom
