/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace chessroom {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& text);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> player_id;
  std::optional<std::string> session_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  std::string detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t active_sessions{0};
};

class Observability {
 public:
  Observability();
  // 테스트에서 출력 대상을 바꿀 때 쓴다.
  Observability(LogLevel min_level, std::ostream& out);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  MetricsSnapshot Snapshot(std::uint64_t active_sessions) const;

  void SetMinLevel(LogLevel level) { min_level_.store(static_cast<int>(level)); }
  void Log(const LogContext& ctx) const;
  // 게임 수명주기 이벤트 로그의 축약형
  void LogEvent(const std::string& name, const std::string& session_id,
                const std::optional<std::string>& player_id = std::nullopt, const std::string& detail = "",
                LogLevel level = LogLevel::kInfo) const;

 private:
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  std::atomic<int> min_level_{static_cast<int>(LogLevel::kInfo)};
  std::ostream& out_;
};

}  // namespace chessroom
