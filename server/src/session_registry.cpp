/*
 * 설명: 세션 레지스트리 구현. 맵은 shared_mutex로 보호하고 저장소 접근과 복원은 맵 잠금 밖에서 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#include "chessroom/session_registry.hpp"

#include <mutex>
#include <stdexcept>

#include <boost/asio/steady_timer.hpp>

#include "chessroom/id_generator.hpp"

namespace chessroom {

namespace {
constexpr int kMaxSessionIdAttempts = 8;

std::optional<Color> ColorInRecord(const GameRecord& record, const std::string& player_id) {
  if (player_id == record.white_player_id) {
    return Color::kWhite;
  }
  if (record.black_player_id && player_id == *record.black_player_id) {
    return Color::kBlack;
  }
  return std::nullopt;
}
}  // namespace

SessionRegistry::SessionRegistry(boost::asio::io_context& ioc, std::shared_ptr<GameStore> store,
                                 RulesEngineFactory rules_factory, std::shared_ptr<Observability> observability,
                                 std::chrono::milliseconds eviction_delay)
    : ioc_(ioc), store_(std::move(store)), rules_factory_(std::move(rules_factory)),
      observability_(std::move(observability)), eviction_delay_(eviction_delay) {}

SeatAssignment SessionRegistry::Create(const std::string& creator_name) {
  std::string session_id;
  for (int attempt = 0; attempt < kMaxSessionIdAttempts; ++attempt) {
    auto candidate = GenerateSessionId();
    if (!Find(candidate) && !store_->GetGame(candidate)) {
      session_id = candidate;
      break;
    }
  }
  if (session_id.empty()) {
    throw std::runtime_error("세션 ID 할당 실패");
  }

  const auto player_id = GeneratePlayerId();
  store_->CreatePlayer(player_id, creator_name);
  store_->CreateGame(session_id, player_id);

  InsertIfAbsent(MakeSession(session_id, player_id, std::nullopt));
  if (observability_) {
    observability_->LogEvent("game.created", session_id, player_id);
  }
  return SeatAssignment{session_id, player_id, Color::kWhite};
}

std::optional<SeatAssignment> SessionRegistry::Join(const std::string& session_id, const std::string& joiner_name,
                                                    GameError& error) {
  auto session = Find(session_id);
  if (!session) {
    auto record = store_->GetGame(session_id);
    if (!record) {
      error = GameError::kGameNotFound;
      return std::nullopt;
    }
    if (IsTerminal(record->status)) {
      error = GameError::kGameAlreadyCompleted;
      return std::nullopt;
    }
    if (record->black_player_id) {
      error = GameError::kGameFull;
      return std::nullopt;
    }
    session = InsertIfAbsent(Hydrate(*record));
  }

  auto lock = session->Lock();
  if (session->Status() != GameStatus::kWaiting) {
    error = GameError::kGameAlreadyStarted;
    return std::nullopt;
  }
  if (session->PlayerIdOf(Color::kBlack)) {
    error = GameError::kGameFull;
    return std::nullopt;
  }
  const auto player_id = GeneratePlayerId();
  store_->CreatePlayer(player_id, joiner_name);
  if (!session->Join(player_id, error)) {
    return std::nullopt;
  }
  if (observability_) {
    observability_->LogEvent("game.joined", session_id, player_id);
  }
  return SeatAssignment{session_id, player_id, Color::kBlack};
}

std::optional<ReconnectResult> SessionRegistry::Reconnect(const std::string& session_id, const std::string& player_id,
                                                          GameError& error) {
  auto session = Find(session_id);
  if (!session) {
    auto record = store_->GetGame(session_id);
    if (!record) {
      error = GameError::kGameNotFound;
      return std::nullopt;
    }
    if (IsTerminal(record->status)) {
      auto color = ColorInRecord(*record, player_id);
      if (!color) {
        error = GameError::kNotAPlayer;
        return std::nullopt;
      }
      return ReconnectResult{session_id, player_id, *color, true, false, record->result, record->fen};
    }
    session = InsertIfAbsent(Hydrate(*record));
  }

  auto color = session->ColorOf(player_id);
  if (!color) {
    error = GameError::kNotAPlayer;
    return std::nullopt;
  }
  if (IsTerminal(session->Status())) {
    // 제거 대기 중인 종료 세션: 저장된 결과를 알려준다.
    auto record = store_->GetGame(session_id);
    std::optional<std::string> result = record ? record->result : std::nullopt;
    return ReconnectResult{session_id, player_id, *color, true, false, result, session->GetState().fen};
  }
  if (observability_) {
    observability_->LogEvent("game.reconnect", session_id, player_id);
  }
  return ReconnectResult{session_id, player_id, *color, false, true, std::nullopt, ""};
}

std::shared_ptr<GameSession> SessionRegistry::Find(const std::string& session_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<GameSession> SessionRegistry::Acquire(const std::string& session_id, GameError& error) {
  if (auto session = Find(session_id)) {
    return session;
  }
  auto record = store_->GetGame(session_id);
  if (!record) {
    error = GameError::kGameNotFound;
    return nullptr;
  }
  if (IsTerminal(record->status)) {
    error = GameError::kGameAlreadyCompleted;
    return nullptr;
  }
  return InsertIfAbsent(Hydrate(*record));
}

bool SessionRegistry::Evict(const std::string& session_id) {
  // 세션 잠금을 쥔 쪽이 레지스트리를 조회할 수 있으므로 상태 확인은 맵 잠금 밖에서 한다.
  auto session = Find(session_id);
  if (!session || !IsTerminal(session->Status())) {
    return false;
  }
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second != session) {
      return false;
    }
    sessions_.erase(it);
  }
  if (observability_) {
    observability_->LogEvent("game.evicted", session_id);
  }
  return true;
}

std::size_t SessionRegistry::ActiveSessionCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return sessions_.size();
}

std::shared_ptr<GameSession> SessionRegistry::MakeSession(const std::string& session_id,
                                                          const std::string& white_player_id,
                                                          const std::optional<std::string>& fen) {
  auto session = std::make_shared<GameSession>(ioc_, session_id, white_player_id, rules_factory_(fen), store_,
                                               observability_);
  std::weak_ptr<SessionRegistry> weak = weak_from_this();
  session->SetCompletionHook([weak](const std::string& id) {
    if (auto self = weak.lock()) {
      self->ScheduleEviction(id);
    }
  });
  return session;
}

std::shared_ptr<GameSession> SessionRegistry::Hydrate(const GameRecord& record) {
  std::optional<std::string> fen;
  if (!record.fen.empty()) {
    fen = record.fen;
  }
  auto session = MakeSession(record.id, record.white_player_id, fen);
  const auto move_count = static_cast<int>(store_->GetGameMoves(record.id).size());
  session->Hydrate(record.black_player_id, record.status, move_count, record.pgn);
  if (observability_) {
    observability_->LogEvent("game.hydrated", record.id, std::nullopt, "moves=" + std::to_string(move_count));
  }
  return session;
}

std::shared_ptr<GameSession> SessionRegistry::InsertIfAbsent(const std::shared_ptr<GameSession>& session) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = sessions_.try_emplace(session->Id(), session).first;
  return it->second;
}

void SessionRegistry::ScheduleEviction(const std::string& session_id) {
  auto timer = std::make_shared<boost::asio::steady_timer>(ioc_);
  timer->expires_after(eviction_delay_);
  std::weak_ptr<SessionRegistry> weak = weak_from_this();
  timer->async_wait([weak, session_id, timer](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    if (auto self = weak.lock()) {
      self->Evict(session_id);
    }
  });
}

}  // namespace chessroom
