/*
 * 설명: 플레이어/세션 식별자를 OpenSSL 난수로 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#pragma once

#include <string>

namespace chessroom {

// 8-4-4-4-12 형식의 버전 4 UUID 문자열.
std::string GeneratePlayerId();

// URL에 그대로 쓸 수 있는 8자리 소문자 16진수.
std::string GenerateSessionId();

}  // namespace chessroom
