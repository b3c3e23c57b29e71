/*
 * 설명: JSON 응답 엔벨로프를 생성하고 WS 프레임을 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "chessroom/api_response.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace chessroom {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto itt = clock::to_time_t(clock::now());
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(GameError error) {
  return MakeErrorEnvelope(ToErrorCode(error), ToErrorMessage(error));
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  j["event"] = env.event;
  j["p"] = env.payload;
  return j;
}

std::optional<WsEnvelope> ParseWsEnvelope(std::string_view text, std::string& error_message) {
  auto message = nlohmann::json::parse(text, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    error_message = "JSON 파싱 오류";
    return std::nullopt;
  }
  auto type_it = message.find("t");
  if (type_it == message.end() || !type_it->is_string() || *type_it != "event") {
    error_message = "알 수 없는 메시지 유형";
    return std::nullopt;
  }
  auto event_it = message.find("event");
  if (event_it == message.end() || !event_it->is_string()) {
    error_message = "event 필드가 필요합니다";
    return std::nullopt;
  }
  WsEnvelope env{.type = "event", .event = event_it->get<std::string>(), .seq = 0,
                 .payload = nlohmann::json::object()};
  auto seq_it = message.find("seq");
  if (seq_it != message.end() && seq_it->is_number_unsigned()) {
    env.seq = seq_it->get<std::uint64_t>();
  }
  auto payload_it = message.find("p");
  if (payload_it != message.end() && !payload_it->is_null()) {
    if (!payload_it->is_object()) {
      error_message = "payload는 객체여야 합니다";
      return std::nullopt;
    }
    env.payload = *payload_it;
  }
  return env;
}

}  // namespace chessroom
