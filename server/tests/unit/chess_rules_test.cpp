#include <gtest/gtest.h>

#include "chessroom/chess_rules.hpp"

namespace {

using chessroom::Color;
using chessroom::MoveRequest;
using chessroom::StandardChessRules;
using chessroom::Termination;

std::size_t CountMoves(const chessroom::LegalMoveMap& moves) {
  std::size_t total = 0;
  for (const auto& [from, targets] : moves) {
    total += targets.size();
  }
  return total;
}

void Play(StandardChessRules& rules, std::initializer_list<std::pair<const char*, const char*>> moves) {
  for (const auto& [from, to] : moves) {
    ASSERT_TRUE(rules.ApplyMove(MoveRequest{from, to, std::nullopt}).has_value()) << from << to;
  }
}

}  // namespace

TEST(ChessRulesTest, InitialPositionHasTwentyMoves) {
  StandardChessRules rules;
  EXPECT_EQ(rules.Fen(), chessroom::kInitialFen);
  EXPECT_EQ(rules.SideToMove(), Color::kWhite);
  auto moves = rules.LegalMoves();
  EXPECT_EQ(moves.size(), 10u);
  EXPECT_EQ(CountMoves(moves), 20u);
  ASSERT_TRUE(moves.count("e2"));
  EXPECT_EQ(moves["e2"].size(), 2u);
  EXPECT_FALSE(rules.Classify().IsTerminal());
}

TEST(ChessRulesTest, PawnPushUpdatesFenAndSan) {
  StandardChessRules rules;
  auto applied = rules.ApplyMove(MoveRequest{"e2", "e4", std::nullopt});
  ASSERT_TRUE(applied.has_value());
  EXPECT_EQ(applied->san, "e4");
  EXPECT_EQ(applied->piece, 'p');
  EXPECT_FALSE(applied->captured.has_value());
  EXPECT_EQ(rules.Fen(), "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");
  EXPECT_EQ(rules.SideToMove(), Color::kBlack);
}

TEST(ChessRulesTest, IllegalMoveLeavesPositionUnchanged) {
  StandardChessRules rules;
  EXPECT_FALSE(rules.ApplyMove(MoveRequest{"e2", "e5", std::nullopt}).has_value());
  // 상대 기물
  EXPECT_FALSE(rules.ApplyMove(MoveRequest{"e7", "e5", std::nullopt}).has_value());
  EXPECT_FALSE(rules.ApplyMove(MoveRequest{"z9", "e4", std::nullopt}).has_value());
  EXPECT_EQ(rules.Fen(), chessroom::kInitialFen);
  EXPECT_EQ(rules.Pgn(), "");
}

TEST(ChessRulesTest, FoolsMateIsCheckmate) {
  StandardChessRules rules;
  Play(rules, {{"f2", "f3"}, {"e7", "e5"}, {"g2", "g4"}});
  auto mate = rules.ApplyMove(MoveRequest{"d8", "h4", std::nullopt});
  ASSERT_TRUE(mate.has_value());
  EXPECT_EQ(mate->san, "Qh4#");
  auto classification = rules.Classify();
  EXPECT_TRUE(classification.in_check);
  EXPECT_EQ(classification.termination, Termination::kCheckmate);
  EXPECT_TRUE(rules.LegalMoves().empty());
  EXPECT_EQ(rules.Pgn(), "1. f3 e5 2. g4 Qh4#");
}

TEST(ChessRulesTest, CheckSuffixAndPinnedPieceCannotMove) {
  StandardChessRules rules;
  Play(rules, {{"e2", "e4"}, {"d7", "d6"}});
  auto check = rules.ApplyMove(MoveRequest{"f1", "b5", std::nullopt});
  ASSERT_TRUE(check.has_value());
  EXPECT_EQ(check->san, "Bb5+");
  EXPECT_TRUE(rules.Classify().in_check);
  // 체크를 막지 않는 수는 불법
  EXPECT_FALSE(rules.ApplyMove(MoveRequest{"a7", "a6", std::nullopt}).has_value());
  EXPECT_TRUE(rules.ApplyMove(MoveRequest{"c7", "c6", std::nullopt}).has_value());
}

TEST(ChessRulesTest, CastlingMovesRookAndClearsRights) {
  StandardChessRules rules("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
  auto castle = rules.ApplyMove(MoveRequest{"e1", "g1", std::nullopt});
  ASSERT_TRUE(castle.has_value());
  EXPECT_EQ(castle->san, "O-O");
  EXPECT_EQ(rules.Fen(), "r3k2r/8/8/8/8/8/8/R4RK1 b kq - 1 1");

  auto long_castle = rules.ApplyMove(MoveRequest{"e8", "c8", std::nullopt});
  ASSERT_TRUE(long_castle.has_value());
  EXPECT_EQ(long_castle->san, "O-O-O");
  EXPECT_EQ(rules.Fen(), "2kr3r/8/8/8/8/8/8/R4RK1 w - - 2 2");
}

TEST(ChessRulesTest, CastlingThroughAttackedSquareIsIllegal) {
  // f1이 검은 룩에 공격받는다.
  StandardChessRules rules("4kr2/8/8/8/8/8/8/4K2R w K - 0 1");
  EXPECT_FALSE(rules.ApplyMove(MoveRequest{"e1", "g1", std::nullopt}).has_value());
}

TEST(ChessRulesTest, EnPassantCapture) {
  StandardChessRules rules;
  Play(rules, {{"e2", "e4"}, {"a7", "a6"}, {"e4", "e5"}, {"d7", "d5"}});
  EXPECT_NE(rules.Fen().find(" d6 "), std::string::npos);
  auto capture = rules.ApplyMove(MoveRequest{"e5", "d6", std::nullopt});
  ASSERT_TRUE(capture.has_value());
  EXPECT_EQ(capture->san, "exd6");
  ASSERT_TRUE(capture->captured.has_value());
  EXPECT_EQ(*capture->captured, 'p');
  EXPECT_EQ(rules.Fen(), "rnbqkbnr/1pp1pppp/p2P4/8/8/8/PPPP1PPP/RNBQKBNR b KQkq - 0 3");
}

TEST(ChessRulesTest, PromotionDefaultsToQueen) {
  StandardChessRules rules("8/4P3/8/8/8/8/k7/4K3 w - - 0 1");
  auto promoted = rules.ApplyMove(MoveRequest{"e7", "e8", std::nullopt});
  ASSERT_TRUE(promoted.has_value());
  EXPECT_EQ(promoted->san, "e8=Q");
  ASSERT_TRUE(promoted->promotion.has_value());
  EXPECT_EQ(*promoted->promotion, 'q');
  EXPECT_EQ(rules.Fen().rfind("4Q3/", 0), 0u);
}

TEST(ChessRulesTest, UnderPromotionAndInvalidPromotion) {
  StandardChessRules rules("8/4P3/8/8/8/8/k7/4K3 w - - 0 1");
  EXPECT_FALSE(rules.ApplyMove(MoveRequest{"e7", "e8", 'k'}).has_value());
  auto knight = rules.ApplyMove(MoveRequest{"e7", "e8", 'n'});
  ASSERT_TRUE(knight.has_value());
  EXPECT_EQ(knight->san, "e8=N");
  EXPECT_EQ(rules.Fen().rfind("4N3/", 0), 0u);
}

TEST(ChessRulesTest, SanDisambiguatesByFile) {
  StandardChessRules rules("4k3/8/8/8/8/8/8/1N2KN2 w - - 0 1");
  auto move = rules.ApplyMove(MoveRequest{"b1", "d2", std::nullopt});
  ASSERT_TRUE(move.has_value());
  EXPECT_EQ(move->san, "Nbd2");
}

TEST(ChessRulesTest, StalemateIsDetected) {
  StandardChessRules rules("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
  auto classification = rules.Classify();
  EXPECT_FALSE(classification.in_check);
  EXPECT_EQ(classification.termination, Termination::kStalemate);
}

TEST(ChessRulesTest, InsufficientMaterialIsDraw) {
  StandardChessRules bare_kings("8/8/8/4k3/8/8/8/4K3 w - - 0 1");
  auto classification = bare_kings.Classify();
  EXPECT_EQ(classification.termination, Termination::kDraw);
  EXPECT_EQ(classification.draw_reason, "insufficient material");

  StandardChessRules knight("8/8/8/4k3/8/8/8/4KN2 w - - 0 1");
  EXPECT_TRUE(knight.IsInsufficientMaterial());

  StandardChessRules rook("8/8/8/4k3/8/8/8/4KR2 w - - 0 1");
  EXPECT_FALSE(rook.IsInsufficientMaterial());
}

TEST(ChessRulesTest, ThreefoldRepetitionIsDraw) {
  StandardChessRules rules;
  Play(rules, {{"g1", "f3"}, {"g8", "f6"}, {"f3", "g1"}, {"f6", "g8"}});
  EXPECT_FALSE(rules.Classify().IsTerminal());
  Play(rules, {{"g1", "f3"}, {"g8", "f6"}, {"f3", "g1"}, {"f6", "g8"}});
  auto classification = rules.Classify();
  EXPECT_EQ(classification.termination, Termination::kDraw);
  EXPECT_EQ(classification.draw_reason, "threefold repetition");
}

TEST(ChessRulesTest, FiftyMoveRuleIsDraw) {
  StandardChessRules rules("8/8/8/4k3/8/8/8/R3K3 w - - 99 80");
  EXPECT_FALSE(rules.Classify().IsTerminal());
  Play(rules, {{"a1", "a2"}});
  auto classification = rules.Classify();
  EXPECT_EQ(classification.termination, Termination::kDraw);
  EXPECT_EQ(classification.draw_reason, "fifty-move rule");
}

TEST(ChessRulesTest, InvalidFenThrows) {
  EXPECT_THROW(StandardChessRules("not a fen"), chessroom::RulesError);
  EXPECT_THROW(StandardChessRules("8/8/8/8/8/8/8/8 w - - 0 1"), chessroom::RulesError);
  EXPECT_THROW(StandardChessRules("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1"), chessroom::RulesError);
}

TEST(ChessRulesTest, CloneIsIndependent) {
  StandardChessRules rules;
  auto copy = rules.Clone();
  ASSERT_TRUE(copy->ApplyMove(MoveRequest{"d2", "d4", std::nullopt}).has_value());
  EXPECT_EQ(rules.Fen(), chessroom::kInitialFen);
  EXPECT_NE(copy->Fen(), chessroom::kInitialFen);
  EXPECT_EQ(copy->Pgn(), "1. d4");
}

TEST(ChessRulesTest, FactoryStartsFromGivenFen) {
  auto factory = chessroom::MakeStandardRulesFactory();
  EXPECT_EQ(factory(std::nullopt)->Fen(), chessroom::kInitialFen);
  const std::string fen = "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1";
  auto rules = factory(fen);
  EXPECT_EQ(rules->Fen(), fen);
  EXPECT_EQ(rules->SideToMove(), Color::kBlack);
}
