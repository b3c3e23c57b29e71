/*
 * 설명: 게임 상태 문자열 변환과 전적 점수표를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "chessroom/game_store.hpp"

#include <stdexcept>

namespace chessroom {

std::string ToString(GameStatus status) {
  switch (status) {
    case GameStatus::kWaiting:
      return "waiting";
    case GameStatus::kActive:
      return "active";
    case GameStatus::kCompleted:
      return "completed";
    case GameStatus::kAbandoned:
      return "abandoned";
  }
  return "waiting";
}

GameStatus ParseGameStatus(const std::string& text) {
  if (text == "waiting") {
    return GameStatus::kWaiting;
  }
  if (text == "active") {
    return GameStatus::kActive;
  }
  if (text == "completed") {
    return GameStatus::kCompleted;
  }
  if (text == "abandoned") {
    return GameStatus::kAbandoned;
  }
  throw std::invalid_argument("알 수 없는 게임 상태: " + text);
}

int ScoreFor(PlayerOutcome outcome) {
  switch (outcome) {
    case PlayerOutcome::kWin:
      return 3;
    case PlayerOutcome::kDraw:
      return 1;
    case PlayerOutcome::kLoss:
      return 0;
  }
  return 0;
}

}  // namespace chessroom
