/*
 * 설명: 세션이 의존하는 체스 규칙 엔진의 좁은 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chess_rules_test.cpp, server/tests/unit/game_session_test.cpp
 */
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chessroom {

inline constexpr const char* kInitialFen = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

enum class Color { kWhite, kBlack };

inline Color Opposite(Color color) { return color == Color::kWhite ? Color::kBlack : Color::kWhite; }
inline std::string ToString(Color color) { return color == Color::kWhite ? "white" : "black"; }

class RulesError : public std::runtime_error {
 public:
  explicit RulesError(const std::string& message) : std::runtime_error(message) {}
};

struct MoveRequest {
  std::string from;
  std::string to;
  std::optional<char> promotion;
};

struct AppliedMove {
  std::string from;
  std::string to;
  std::string san;
  char piece;  // 소문자 기물 기호 (p, n, b, r, q, k)
  std::optional<char> captured;
  std::optional<char> promotion;
};

enum class Termination { kNone, kCheckmate, kStalemate, kDraw };

struct Classification {
  bool in_check{false};
  Termination termination{Termination::kNone};
  std::string draw_reason;

  bool IsTerminal() const { return termination != Termination::kNone; }
};

// 출발 칸 -> 도달 가능한 도착 칸 목록. 클라이언트에 전달되는 유일한 규칙 정보.
using LegalMoveMap = std::map<std::string, std::vector<std::string>>;

class RulesEngine {
 public:
  virtual ~RulesEngine() = default;

  virtual std::string Fen() const = 0;
  virtual Color SideToMove() const = 0;
  // 불법 수이면 nullopt를 반환하고 포지션은 바뀌지 않는다.
  virtual std::optional<AppliedMove> ApplyMove(const MoveRequest& request) = 0;
  virtual LegalMoveMap LegalMoves() const = 0;
  virtual Classification Classify() const = 0;
  virtual std::string Pgn() const = 0;
  // 복원 전용: 저장된 수순을 이후 Pgn() 앞에 이어 붙인다.
  virtual void SeedMovetext(const std::string& movetext) = 0;
  // 후보 수를 적용해 볼 독립 사본. 세션은 저장이 끝난 뒤에만 사본을 채택한다.
  virtual std::unique_ptr<RulesEngine> Clone() const = 0;
};

// fen이 없으면 초기 포지션에서 시작한다. 잘못된 FEN은 RulesError.
using RulesEngineFactory = std::function<std::unique_ptr<RulesEngine>(const std::optional<std::string>& fen)>;

}  // namespace chessroom
