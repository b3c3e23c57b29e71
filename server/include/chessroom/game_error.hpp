/*
 * 설명: 세션/레지스트리 연산이 호출자에게 돌려주는 도메인 오류 종류를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <string>

namespace chessroom {

enum class GameError {
  kNone,
  kGameNotFound,
  kNotAPlayer,
  kNotYourTurn,
  kGameNotActive,
  kIllegalMove,
  kGameFull,
  kGameAlreadyStarted,
  kGameAlreadyCompleted,
  // 무승부 제안/수락/거절의 가드 위반 (중복 제안, 자기 제안 수락, 제안 없음)
  kDrawNotAvailable,
};

// snake_case 코드: REST 엔벨로프와 WS error-msg 양쪽에서 그대로 쓴다.
std::string ToErrorCode(GameError error);
std::string ToErrorMessage(GameError error);

}  // namespace chessroom
