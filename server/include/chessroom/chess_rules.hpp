/*
 * 설명: 표준 체스 규칙(합법 수 생성, SAN, 종국 판정)을 구현한 규칙 엔진.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chess_rules_test.cpp
 */
#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "chessroom/rules_engine.hpp"

namespace chessroom {

class StandardChessRules : public RulesEngine {
 public:
  StandardChessRules();
  explicit StandardChessRules(const std::string& fen);

  std::string Fen() const override;
  Color SideToMove() const override { return turn_; }
  std::optional<AppliedMove> ApplyMove(const MoveRequest& request) override;
  LegalMoveMap LegalMoves() const override;
  Classification Classify() const override;
  std::string Pgn() const override;
  void SeedMovetext(const std::string& movetext) override { movetext_prefix_ = movetext; }
  std::unique_ptr<RulesEngine> Clone() const override;

  bool InCheck() const;
  bool IsInsufficientMaterial() const;
  bool IsThreefoldRepetition() const;

 private:
  struct Move {
    int from;
    int to;
    char piece;
    char captured{0};
    char promotion{0};
    bool en_passant{false};
    bool castle{false};
  };

  void Load(const std::string& fen);
  std::vector<Move> GeneratePseudoLegal() const;
  std::vector<Move> GenerateLegal() const;
  void AddPawnMoves(int sq, std::vector<Move>& out) const;
  void AddStepMoves(int sq, const int (*offsets)[2], int count, bool slide, std::vector<Move>& out) const;
  void AddCastling(std::vector<Move>& out) const;
  bool IsAttacked(int sq, Color by) const;
  int KingSquare(Color color) const;
  void MakeMove(const Move& move);
  std::string SanBase(const Move& move, const std::vector<Move>& legal) const;
  std::string PositionKey() const;

  std::array<char, 64> board_{};
  Color turn_{Color::kWhite};
  // K, Q, k, q 순서
  std::array<bool, 4> castling_{};
  int ep_square_{-1};
  int halfmove_{0};
  int fullmove_{1};
  std::vector<std::string> san_history_;
  int history_start_fullmove_{1};
  Color history_start_turn_{Color::kWhite};
  std::string movetext_prefix_;
  std::unordered_map<std::string, int> repetitions_;
};

RulesEngineFactory MakeStandardRulesFactory();

}  // namespace chessroom
