/*
 * 설명: 게임 세션 상태 기계. 모든 변경은 재진입 뮤텍스 아래에서 직렬화되며
 *       영속 저장이 성공한 뒤에만 메모리 상태를 확정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_session_test.cpp
 */
#include "chessroom/game_session.hpp"

#include <algorithm>

#include <boost/asio/error.hpp>

namespace chessroom {

namespace {
constexpr std::chrono::milliseconds kAbandonRetryDelay{5000};
}  // namespace

GameSession::GameSession(boost::asio::io_context& ioc, std::string id, std::string white_player_id,
                         std::unique_ptr<RulesEngine> rules, std::shared_ptr<GameStore> store,
                         std::shared_ptr<Observability> observability)
    : ioc_(ioc), id_(std::move(id)), white_player_id_(std::move(white_player_id)), rules_(std::move(rules)),
      store_(std::move(store)), observability_(std::move(observability)) {}

GameSession::~GameSession() {
  for (auto& [player_id, timer] : disconnect_timers_) {
    timer->cancel();
  }
}

void GameSession::Hydrate(const std::optional<std::string>& black_player_id, GameStatus status, int move_count,
                          const std::string& movetext) {
  Guard lock(mutex_);
  black_player_id_ = black_player_id;
  status_ = status;
  move_count_ = move_count;
  rules_->SeedMovetext(movetext);
}

void GameSession::SetCompletionHook(CompletionHook hook) {
  Guard lock(mutex_);
  completion_hook_ = std::move(hook);
}

GameStatus GameSession::Status() const {
  Guard lock(mutex_);
  return status_;
}

int GameSession::MoveCount() const {
  Guard lock(mutex_);
  return move_count_;
}

std::optional<Color> GameSession::ColorOf(const std::string& player_id) const {
  Guard lock(mutex_);
  if (player_id == white_player_id_) {
    return Color::kWhite;
  }
  if (black_player_id_ && player_id == *black_player_id_) {
    return Color::kBlack;
  }
  return std::nullopt;
}

std::optional<std::string> GameSession::PlayerIdOf(Color color) const {
  Guard lock(mutex_);
  if (color == Color::kWhite) {
    return white_player_id_;
  }
  return black_player_id_;
}

std::optional<std::string> GameSession::SubscriberOf(Color color) const {
  Guard lock(mutex_);
  return color == Color::kWhite ? white_subscriber_ : black_subscriber_;
}

bool GameSession::Join(const std::string& black_player_id, GameError& error) {
  Guard lock(mutex_);
  if (status_ != GameStatus::kWaiting) {
    error = GameError::kGameAlreadyStarted;
    return false;
  }
  if (black_player_id_) {
    error = GameError::kGameFull;
    return false;
  }
  store_->JoinGame(id_, black_player_id);
  black_player_id_ = black_player_id;
  status_ = GameStatus::kActive;
  return true;
}

std::optional<MoveResult> GameSession::ApplyMove(const std::string& player_id, const MoveRequest& request,
                                                 GameError& error) {
  Guard lock(mutex_);
  auto color = ColorOf(player_id);
  if (!color || *color != rules_->SideToMove()) {
    error = GameError::kNotYourTurn;
    return std::nullopt;
  }
  if (status_ != GameStatus::kActive) {
    error = GameError::kGameNotActive;
    return std::nullopt;
  }

  auto candidate = rules_->Clone();
  auto applied = candidate->ApplyMove(request);
  if (!applied) {
    error = GameError::kIllegalMove;
    return std::nullopt;
  }

  const int move_number = move_count_ + 1;
  const auto fen = candidate->Fen();
  const auto pgn = candidate->Pgn();
  const auto classification = candidate->Classify();
  std::optional<GameOver> game_over;
  switch (classification.termination) {
    case Termination::kCheckmate:
      game_over = GameOver{"checkmate", *color, ResultFor(*color), ""};
      break;
    case Termination::kStalemate:
      game_over = GameOver{"stalemate", std::nullopt, ResultFor(std::nullopt), ""};
      break;
    case Termination::kDraw:
      game_over = GameOver{"draw", std::nullopt, ResultFor(std::nullopt), classification.draw_reason};
      break;
    case Termination::kNone:
      break;
  }
  std::optional<std::string> result;
  if (game_over) {
    result = game_over->result;
  }
  store_->CommitMove(MoveRecord{id_, move_number, player_id, request.from, request.to, applied->san, fen}, pgn,
                     result);

  // 여기부터 메모리 상태 확정. 수를 두면 상대의 무승부 제안은 자동으로 거절된다.
  rules_ = std::move(candidate);
  move_count_ = move_number;
  draw_offer_.reset();
  if (game_over) {
    status_ = GameStatus::kCompleted;
    for (auto& [id, timer] : disconnect_timers_) {
      timer->cancel();
    }
    disconnect_timers_.clear();
  }

  // 종료된 게임이면 GetLegalMoves()는 빈 목록을 준다.
  MoveResult move_result{*applied,    fen,         pgn, rules_->SideToMove(), classification.in_check,
                         move_number, GetLegalMoves(), game_over};
  if (game_over && completion_hook_) {
    completion_hook_(id_);
  }
  return move_result;
}

std::optional<GameOver> GameSession::Resign(const std::string& player_id, GameError& error) {
  Guard lock(mutex_);
  if (status_ != GameStatus::kActive) {
    error = GameError::kGameNotActive;
    return std::nullopt;
  }
  auto color = ColorOf(player_id);
  if (!color) {
    error = GameError::kNotAPlayer;
    return std::nullopt;
  }
  return Complete("resignation", Opposite(*color), "");
}

std::optional<Color> GameSession::OfferDraw(const std::string& player_id, GameError& error) {
  Guard lock(mutex_);
  if (status_ != GameStatus::kActive) {
    error = GameError::kGameNotActive;
    return std::nullopt;
  }
  auto color = ColorOf(player_id);
  if (!color) {
    error = GameError::kNotAPlayer;
    return std::nullopt;
  }
  if (draw_offer_ && *draw_offer_ == player_id) {
    error = GameError::kDrawNotAvailable;
    return std::nullopt;
  }
  draw_offer_ = player_id;
  return color;
}

std::optional<GameOver> GameSession::AcceptDraw(const std::string& player_id, GameError& error) {
  Guard lock(mutex_);
  if (status_ != GameStatus::kActive) {
    error = GameError::kGameNotActive;
    return std::nullopt;
  }
  if (!ColorOf(player_id)) {
    error = GameError::kNotAPlayer;
    return std::nullopt;
  }
  if (!draw_offer_ || *draw_offer_ == player_id) {
    error = GameError::kDrawNotAvailable;
    return std::nullopt;
  }
  return Complete("draw_agreed", std::nullopt, "");
}

bool GameSession::DeclineDraw(const std::string& player_id, GameError& error) {
  Guard lock(mutex_);
  if (status_ != GameStatus::kActive) {
    error = GameError::kGameNotActive;
    return false;
  }
  if (!ColorOf(player_id)) {
    error = GameError::kNotAPlayer;
    return false;
  }
  if (!draw_offer_ || *draw_offer_ == player_id) {
    error = GameError::kDrawNotAvailable;
    return false;
  }
  draw_offer_.reset();
  return true;
}

LegalMoveMap GameSession::GetLegalMoves() const {
  Guard lock(mutex_);
  if (status_ != GameStatus::kActive) {
    return {};
  }
  return rules_->LegalMoves();
}

SessionState GameSession::GetState() const {
  Guard lock(mutex_);
  const auto classification = rules_->Classify();
  return SessionState{id_,
                      rules_->Fen(),
                      rules_->Pgn(),
                      rules_->SideToMove(),
                      status_,
                      classification.in_check,
                      classification.IsTerminal(),
                      white_player_id_,
                      black_player_id_,
                      white_connected_,
                      black_connected_,
                      move_count_,
                      draw_offer_,
                      GetLegalMoves()};
}

std::optional<Color> GameSession::AttachSubscriber(const std::string& player_id, const std::string& subscriber_id,
                                                   GameError& error) {
  Guard lock(mutex_);
  auto color = ColorOf(player_id);
  if (!color) {
    error = GameError::kNotAPlayer;
    return std::nullopt;
  }
  if (*color == Color::kWhite) {
    white_subscriber_ = subscriber_id;
    white_connected_ = true;
  } else {
    black_subscriber_ = subscriber_id;
    black_connected_ = true;
  }
  CancelDisconnectTimer(player_id);
  return color;
}

bool GameSession::MarkReadyIfBothConnected() {
  Guard lock(mutex_);
  if (ready_broadcast_sent_ || status_ != GameStatus::kActive || !white_connected_ || !black_connected_) {
    return false;
  }
  ready_broadcast_sent_ = true;
  return true;
}

std::optional<Color> GameSession::DetachSubscriber(const std::string& player_id, const std::string& subscriber_id,
                                                   std::chrono::milliseconds grace, AbandonHandler on_abandon) {
  Guard lock(mutex_);
  auto color = ColorOf(player_id);
  if (!color) {
    return std::nullopt;
  }
  auto& subscriber = *color == Color::kWhite ? white_subscriber_ : black_subscriber_;
  // 이미 새 소켓으로 재접속한 경우 이전 소켓의 종료는 무시한다.
  if (!subscriber || *subscriber != subscriber_id) {
    return std::nullopt;
  }
  subscriber.reset();
  (*color == Color::kWhite ? white_connected_ : black_connected_) = false;

  if (status_ == GameStatus::kActive) {
    CancelDisconnectTimer(player_id);
    ArmDisconnectTimer(player_id, grace, std::min(grace, kAbandonRetryDelay), std::move(on_abandon));
  }
  return color;
}

void GameSession::ArmDisconnectTimer(const std::string& player_id, std::chrono::milliseconds delay,
                                     std::chrono::milliseconds retry_delay, AbandonHandler on_abandon) {
  auto timer = std::make_shared<boost::asio::steady_timer>(ioc_);
  timer->expires_after(delay);
  disconnect_timers_[player_id] = timer;
  std::weak_ptr<GameSession> weak = shared_from_this();
  timer->async_wait([weak, player_id, timer, retry_delay,
                     on_abandon = std::move(on_abandon)](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    if (auto self = weak.lock()) {
      self->OnDisconnectTimer(player_id, timer, retry_delay, on_abandon);
    }
  });
}

bool GameSession::HasDisconnectTimer(const std::string& player_id) const {
  Guard lock(mutex_);
  return disconnect_timers_.count(player_id) > 0;
}

void GameSession::CancelDisconnectTimer(const std::string& player_id) {
  auto it = disconnect_timers_.find(player_id);
  if (it == disconnect_timers_.end()) {
    return;
  }
  it->second->cancel();
  disconnect_timers_.erase(it);
}

void GameSession::OnDisconnectTimer(const std::string& player_id,
                                    const std::shared_ptr<boost::asio::steady_timer>& timer,
                                    std::chrono::milliseconds retry_delay, const AbandonHandler& on_abandon) {
  Guard lock(mutex_);
  // 취소와 만료가 경합했을 수 있으므로 맵에 남은 타이머가 자신일 때만 진행한다.
  auto it = disconnect_timers_.find(player_id);
  if (it == disconnect_timers_.end() || it->second != timer) {
    return;
  }
  disconnect_timers_.erase(it);
  if (status_ != GameStatus::kActive) {
    return;
  }
  auto color = ColorOf(player_id);
  if (!color) {
    return;
  }
  std::optional<GameOver> game_over;
  try {
    game_over = Complete("abandonment", Opposite(*color), ToString(*color) + " player disconnected");
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->LogEvent("game.abandon_failed", id_, player_id, ex.what(), LogLevel::kError);
    }
    // 기권 처리가 저장될 때까지 재시도한다. 재접속하면 타이머가 취소된다.
    ArmDisconnectTimer(player_id, retry_delay, retry_delay, on_abandon);
    return;
  }
  if (observability_) {
    observability_->LogEvent("game.abandoned", id_, player_id, game_over->result);
  }
  if (on_abandon) {
    on_abandon(*game_over);
  }
}

GameOver GameSession::Complete(std::string type, std::optional<Color> winner, std::string reason) {
  GameOver game_over{std::move(type), winner, ResultFor(winner), std::move(reason)};
  store_->CompleteGame(id_, game_over.result);
  status_ = GameStatus::kCompleted;
  draw_offer_.reset();
  for (auto& [id, timer] : disconnect_timers_) {
    timer->cancel();
  }
  disconnect_timers_.clear();
  if (completion_hook_) {
    completion_hook_(id_);
  }
  return game_over;
}

std::string GameSession::ResultFor(std::optional<Color> winner) {
  if (!winner) {
    return "draw";
  }
  return *winner == Color::kWhite ? "white_wins" : "black_wins";
}

}  // namespace chessroom
