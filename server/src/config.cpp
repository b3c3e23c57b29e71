/*
 * 설명: 환경 변수에서 서버 설정을 읽는다. 숫자 변환 실패는 변수 이름을 담은 invalid_argument로 알린다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "chessroom/config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace chessroom {

namespace {
std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

std::size_t GetEnvNumber(const char* key, const char* def) {
  const auto text = GetEnv(key, def);
  try {
    std::size_t idx = 0;
    auto value = std::stoul(text, &idx);
    if (idx != text.size() || text.front() == '-') {
      throw std::invalid_argument(text);
    }
    return static_cast<std::size_t>(value);
  } catch (const std::logic_error&) {
    throw std::invalid_argument(std::string("환경 변수 ") + key + " 값이 올바르지 않습니다: " + text);
  }
}

unsigned short GetEnvPort(const char* key, const char* def) {
  auto value = GetEnvNumber(key, def);
  if (value == 0 || value > 65535) {
    throw std::invalid_argument(std::string("환경 변수 ") + key + " 포트 범위를 벗어났습니다");
  }
  return static_cast<unsigned short>(value);
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  AppConfig cfg;
  cfg.port = GetEnvPort("SERVER_PORT", "3000");
  cfg.db_host = GetEnv("DB_HOST", "mariadb");
  cfg.db_port = GetEnvPort("DB_PORT", "3306");
  cfg.db_user = GetEnv("DB_USER", "chess");
  cfg.db_password = GetEnv("DB_PASSWORD", "chess_pass");
  cfg.db_name = GetEnv("DB_NAME", "chessroom");
  cfg.store_backend = GetEnv("STORE_BACKEND", "mariadb");
  if (cfg.store_backend != "mariadb" && cfg.store_backend != "memory") {
    throw std::invalid_argument("STORE_BACKEND는 mariadb 또는 memory 여야 합니다: " + cfg.store_backend);
  }
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  cfg.disconnect_grace_seconds = GetEnvNumber("DISCONNECT_GRACE_SECONDS", "60");
  cfg.eviction_delay_seconds = GetEnvNumber("EVICTION_DELAY_SECONDS", "300");
  cfg.api_rate_limit_max = GetEnvNumber("API_RATE_LIMIT_MAX", "60");
  cfg.api_rate_window_seconds = GetEnvNumber("API_RATE_LIMIT_WINDOW", "60");
  cfg.ws_queue_limit_messages = GetEnvNumber("WS_QUEUE_LIMIT_MESSAGES", "64");
  cfg.ws_queue_limit_bytes = GetEnvNumber("WS_QUEUE_LIMIT_BYTES", "262144");
  return cfg;
}

}  // namespace chessroom
