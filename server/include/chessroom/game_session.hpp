/*
 * 설명: 한 판의 권위 있는 상태 기계. 차례, 무승부 협상, 연결 상태, 이탈 유예 타이머를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_session_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "chessroom/game_error.hpp"
#include "chessroom/game_store.hpp"
#include "chessroom/observability.hpp"
#include "chessroom/rules_engine.hpp"

namespace chessroom {

struct GameOver {
  // checkmate, stalemate, draw, draw_agreed, resignation, abandonment
  std::string type;
  std::optional<Color> winner;
  // white_wins, black_wins, draw
  std::string result;
  std::string reason;
};

struct MoveResult {
  AppliedMove move;
  std::string fen;
  std::string pgn;
  Color turn;
  bool in_check;
  int move_number;
  LegalMoveMap legal_moves;
  std::optional<GameOver> game_over;
};

struct SessionState {
  std::string session_id;
  std::string fen;
  std::string pgn;
  Color turn;
  GameStatus status;
  bool in_check;
  bool is_game_over;
  std::string white_player_id;
  std::optional<std::string> black_player_id;
  bool white_connected;
  bool black_connected;
  int move_count;
  std::optional<std::string> draw_offer;
  LegalMoveMap legal_moves;
};

class GameSession : public std::enable_shared_from_this<GameSession> {
 public:
  using AbandonHandler = std::function<void(const GameOver&)>;
  using CompletionHook = std::function<void(const std::string& session_id)>;
  using Guard = std::unique_lock<std::recursive_mutex>;

  GameSession(boost::asio::io_context& ioc, std::string id, std::string white_player_id,
              std::unique_ptr<RulesEngine> rules, std::shared_ptr<GameStore> store,
              std::shared_ptr<Observability> observability);
  ~GameSession();

  // 모든 공개 연산은 내부에서 같은 재진입 뮤텍스를 잡는다. 변경과 그 결과의 방송을
  // 한 묶음으로 직렬화하려는 호출자는 Lock()을 먼저 잡는다.
  Guard Lock() const { return Guard(mutex_); }

  // 콜드 스타트 복원 전용: 저장된 흑 플레이어, 상태, 수 카운터, 수순을 되살린다.
  void Hydrate(const std::optional<std::string>& black_player_id, GameStatus status, int move_count,
               const std::string& movetext);
  void SetCompletionHook(CompletionHook hook);

  const std::string& Id() const { return id_; }
  GameStatus Status() const;
  int MoveCount() const;
  std::optional<Color> ColorOf(const std::string& player_id) const;
  std::optional<std::string> PlayerIdOf(Color color) const;
  std::optional<std::string> SubscriberOf(Color color) const;

  bool Join(const std::string& black_player_id, GameError& error);
  std::optional<MoveResult> ApplyMove(const std::string& player_id, const MoveRequest& request, GameError& error);
  std::optional<GameOver> Resign(const std::string& player_id, GameError& error);
  std::optional<Color> OfferDraw(const std::string& player_id, GameError& error);
  std::optional<GameOver> AcceptDraw(const std::string& player_id, GameError& error);
  bool DeclineDraw(const std::string& player_id, GameError& error);

  LegalMoveMap GetLegalMoves() const;
  SessionState GetState() const;

  // 연결 관리
  std::optional<Color> AttachSubscriber(const std::string& player_id, const std::string& subscriber_id,
                                        GameError& error);
  // 양쪽이 처음으로 모두 연결된 진행 중 게임이면 true를 한 번만 반환한다.
  bool MarkReadyIfBothConnected();
  // subscriber_id가 해당 색의 현재 구독자일 때만 연결 해제로 처리하고 유예 타이머를 건다.
  std::optional<Color> DetachSubscriber(const std::string& player_id, const std::string& subscriber_id,
                                        std::chrono::milliseconds grace, AbandonHandler on_abandon);
  bool HasDisconnectTimer(const std::string& player_id) const;

 private:
  GameOver Complete(std::string type, std::optional<Color> winner, std::string reason);
  void CancelDisconnectTimer(const std::string& player_id);
  void ArmDisconnectTimer(const std::string& player_id, std::chrono::milliseconds delay,
                          std::chrono::milliseconds retry_delay, AbandonHandler on_abandon);
  // 저장 실패 시 retry_delay 뒤에 다시 시도한다.
  void OnDisconnectTimer(const std::string& player_id, const std::shared_ptr<boost::asio::steady_timer>& timer,
                         std::chrono::milliseconds retry_delay, const AbandonHandler& on_abandon);
  static std::string ResultFor(std::optional<Color> winner);

  boost::asio::io_context& ioc_;
  const std::string id_;
  const std::string white_player_id_;
  std::optional<std::string> black_player_id_;
  std::unique_ptr<RulesEngine> rules_;
  std::shared_ptr<GameStore> store_;
  std::shared_ptr<Observability> observability_;

  GameStatus status_{GameStatus::kWaiting};
  int move_count_{0};
  std::optional<std::string> draw_offer_;
  bool ready_broadcast_sent_{false};
  std::optional<std::string> white_subscriber_;
  std::optional<std::string> black_subscriber_;
  bool white_connected_{false};
  bool black_connected_{false};
  std::unordered_map<std::string, std::shared_ptr<boost::asio::steady_timer>> disconnect_timers_;
  CompletionHook completion_hook_;

  mutable std::recursive_mutex mutex_;
};

}  // namespace chessroom
