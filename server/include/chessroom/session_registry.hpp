/*
 * 설명: 세션 ID -> 라이브 GameSession 맵. 생성, 참가, 재접속, 저장소 기반 복원, 종료 후 지연 제거를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>

#include "chessroom/game_error.hpp"
#include "chessroom/game_session.hpp"
#include "chessroom/game_store.hpp"
#include "chessroom/observability.hpp"
#include "chessroom/rules_engine.hpp"

namespace chessroom {

struct SeatAssignment {
  std::string game_id;
  std::string player_id;
  Color color;
};

struct ReconnectResult {
  std::string game_id;
  std::string player_id;
  Color color;
  bool completed{false};
  bool reconnected{false};
  // completed일 때만 채워진다.
  std::optional<std::string> result;
  std::string fen;
};

class SessionRegistry : public std::enable_shared_from_this<SessionRegistry> {
 public:
  SessionRegistry(boost::asio::io_context& ioc, std::shared_ptr<GameStore> store, RulesEngineFactory rules_factory,
                  std::shared_ptr<Observability> observability, std::chrono::milliseconds eviction_delay);

  SeatAssignment Create(const std::string& creator_name);
  std::optional<SeatAssignment> Join(const std::string& session_id, const std::string& joiner_name, GameError& error);
  std::optional<ReconnectResult> Reconnect(const std::string& session_id, const std::string& player_id,
                                           GameError& error);

  std::shared_ptr<GameSession> Find(const std::string& session_id) const;
  // 라이브 세션이 없으면 진행 중인 저장 기록에서 복원한다. 종료된 게임은 되살리지 않는다.
  std::shared_ptr<GameSession> Acquire(const std::string& session_id, GameError& error);
  // 종료된 세션만 메모리에서 제거한다. 저장 기록은 그대로 남는다.
  bool Evict(const std::string& session_id);
  std::size_t ActiveSessionCount() const;

 private:
  std::shared_ptr<GameSession> MakeSession(const std::string& session_id, const std::string& white_player_id,
                                           const std::optional<std::string>& fen);
  std::shared_ptr<GameSession> Hydrate(const GameRecord& record);
  // 같은 ID가 이미 있으면 기존 세션을 돌려준다.
  std::shared_ptr<GameSession> InsertIfAbsent(const std::shared_ptr<GameSession>& session);
  void ScheduleEviction(const std::string& session_id);

  boost::asio::io_context& ioc_;
  std::shared_ptr<GameStore> store_;
  RulesEngineFactory rules_factory_;
  std::shared_ptr<Observability> observability_;
  std::chrono::milliseconds eviction_delay_;
  std::unordered_map<std::string, std::shared_ptr<GameSession>> sessions_;
  mutable std::shared_mutex mutex_;
};

}  // namespace chessroom
