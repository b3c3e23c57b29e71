/*
 * 설명: 도메인 오류 종류를 안정적인 코드/메시지로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "chessroom/game_error.hpp"

namespace chessroom {

std::string ToErrorCode(GameError error) {
  switch (error) {
    case GameError::kNone:
      return "none";
    case GameError::kGameNotFound:
      return "game_not_found";
    case GameError::kNotAPlayer:
      return "not_a_player";
    case GameError::kNotYourTurn:
      return "not_your_turn";
    case GameError::kGameNotActive:
      return "game_not_active";
    case GameError::kIllegalMove:
      return "illegal_move";
    case GameError::kGameFull:
      return "game_full";
    case GameError::kGameAlreadyStarted:
      return "game_already_started";
    case GameError::kGameAlreadyCompleted:
      return "game_already_completed";
    case GameError::kDrawNotAvailable:
      return "draw_not_available";
  }
  return "unknown";
}

std::string ToErrorMessage(GameError error) {
  switch (error) {
    case GameError::kNone:
      return "";
    case GameError::kGameNotFound:
      return "Game not found";
    case GameError::kNotAPlayer:
      return "Not a player in this game";
    case GameError::kNotYourTurn:
      return "Not your turn";
    case GameError::kGameNotActive:
      return "Game is not active";
    case GameError::kIllegalMove:
      return "Illegal move";
    case GameError::kGameFull:
      return "Game is full";
    case GameError::kGameAlreadyStarted:
      return "Game already started";
    case GameError::kGameAlreadyCompleted:
      return "Game already completed";
    case GameError::kDrawNotAvailable:
      return "No draw offer can be made or answered right now";
  }
  return "Unknown error";
}

}  // namespace chessroom
