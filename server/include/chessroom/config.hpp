/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace chessroom {

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string store_backend;
  std::string log_level;
  std::size_t disconnect_grace_seconds;
  std::size_t eviction_delay_seconds;
  std::size_t api_rate_limit_max;
  std::size_t api_rate_window_seconds;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
};

AppConfig LoadConfigFromEnv();

}  // namespace chessroom
