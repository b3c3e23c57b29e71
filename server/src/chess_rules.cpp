/*
 * 설명: 표준 체스 규칙 엔진 구현. 보드는 a1=0 ... h8=63 배열이며 대문자가 백이다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chess_rules_test.cpp
 */
#include "chessroom/chess_rules.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace chessroom {
namespace {
using Board = std::array<char, 64>;

constexpr int kKnightOffsets[8][2] = {{1, 2}, {2, 1}, {2, -1}, {1, -2}, {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
constexpr int kBishopOffsets[4][2] = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};
constexpr int kRookOffsets[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
constexpr int kKingOffsets[8][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}, {1, 1}, {1, -1}, {-1, 1}, {-1, -1}};

int FileOf(int sq) { return sq % 8; }
int RankOf(int sq) { return sq / 8; }
int SquareAt(int file, int rank) { return rank * 8 + file; }
bool OnBoard(int file, int rank) { return file >= 0 && file < 8 && rank >= 0 && rank < 8; }

bool IsWhitePiece(char p) { return p != 0 && std::isupper(static_cast<unsigned char>(p)); }
char Kind(char p) { return static_cast<char>(std::tolower(static_cast<unsigned char>(p))); }
bool Owns(char p, Color color) { return p != 0 && IsWhitePiece(p) == (color == Color::kWhite); }
char PieceFor(char kind, Color color) {
  return color == Color::kWhite ? static_cast<char>(std::toupper(static_cast<unsigned char>(kind))) : kind;
}

std::string SquareName(int sq) {
  std::string name;
  name.push_back(static_cast<char>('a' + FileOf(sq)));
  name.push_back(static_cast<char>('1' + RankOf(sq)));
  return name;
}

int ParseSquare(const std::string& text) {
  if (text.size() != 2 || text[0] < 'a' || text[0] > 'h' || text[1] < '1' || text[1] > '8') {
    return -1;
  }
  return SquareAt(text[0] - 'a', text[1] - '1');
}

bool IsSquareAttacked(const Board& board, int sq, Color by) {
  const int file = FileOf(sq);
  const int rank = RankOf(sq);
  // 공격하는 폰은 목표 칸보다 한 랭크 뒤에 있다.
  const int pawn_rank = by == Color::kWhite ? rank - 1 : rank + 1;
  for (int df : {-1, 1}) {
    if (OnBoard(file + df, pawn_rank) && board[SquareAt(file + df, pawn_rank)] == PieceFor('p', by)) {
      return true;
    }
  }
  for (const auto& off : kKnightOffsets) {
    if (OnBoard(file + off[0], rank + off[1]) && board[SquareAt(file + off[0], rank + off[1])] == PieceFor('n', by)) {
      return true;
    }
  }
  for (const auto& off : kKingOffsets) {
    if (OnBoard(file + off[0], rank + off[1]) && board[SquareAt(file + off[0], rank + off[1])] == PieceFor('k', by)) {
      return true;
    }
  }
  auto slides_to = [&](const int (*offsets)[2], char a, char b) {
    for (int i = 0; i < 4; ++i) {
      int f = file + offsets[i][0];
      int r = rank + offsets[i][1];
      while (OnBoard(f, r)) {
        char p = board[SquareAt(f, r)];
        if (p != 0) {
          if (p == PieceFor(a, by) || p == PieceFor(b, by)) {
            return true;
          }
          break;
        }
        f += offsets[i][0];
        r += offsets[i][1];
      }
    }
    return false;
  };
  return slides_to(kBishopOffsets, 'b', 'q') || slides_to(kRookOffsets, 'r', 'q');
}

int FindKing(const Board& board, Color color) {
  const char king = PieceFor('k', color);
  for (int sq = 0; sq < 64; ++sq) {
    if (board[sq] == king) {
      return sq;
    }
  }
  return -1;
}

std::vector<std::string> Split(const std::string& text, char sep) {
  std::vector<std::string> parts;
  std::string current;
  for (char c : text) {
    if (c == sep) {
      parts.push_back(current);
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  parts.push_back(current);
  return parts;
}
}  // namespace

StandardChessRules::StandardChessRules() : StandardChessRules(kInitialFen) {}

StandardChessRules::StandardChessRules(const std::string& fen) {
  Load(fen);
  history_start_fullmove_ = fullmove_;
  history_start_turn_ = turn_;
  repetitions_[PositionKey()] = 1;
}

void StandardChessRules::Load(const std::string& fen) {
  std::vector<std::string> fields;
  std::istringstream iss(fen);
  std::string field;
  while (iss >> field) {
    fields.push_back(field);
  }
  if (fields.size() != 4 && fields.size() != 6) {
    throw RulesError("FEN 필드 수가 올바르지 않습니다: " + fen);
  }

  board_.fill(0);
  auto ranks = Split(fields[0], '/');
  if (ranks.size() != 8) {
    throw RulesError("FEN 랭크 수가 올바르지 않습니다: " + fen);
  }
  for (int i = 0; i < 8; ++i) {
    const int rank = 7 - i;
    int file = 0;
    for (char c : ranks[i]) {
      if (c >= '1' && c <= '8') {
        file += c - '0';
      } else if (std::string("pnbrqkPNBRQK").find(c) != std::string::npos) {
        if (file >= 8) {
          throw RulesError("FEN 랭크가 8칸을 넘습니다: " + fen);
        }
        board_[SquareAt(file, rank)] = c;
        ++file;
      } else {
        throw RulesError("FEN 기물 기호가 올바르지 않습니다: " + fen);
      }
    }
    if (file != 8) {
      throw RulesError("FEN 랭크가 8칸이 아닙니다: " + fen);
    }
  }
  if (std::count(board_.begin(), board_.end(), 'K') != 1 || std::count(board_.begin(), board_.end(), 'k') != 1) {
    throw RulesError("각 진영에 킹이 하나씩 있어야 합니다: " + fen);
  }

  if (fields[1] == "w") {
    turn_ = Color::kWhite;
  } else if (fields[1] == "b") {
    turn_ = Color::kBlack;
  } else {
    throw RulesError("FEN 차례 필드가 올바르지 않습니다: " + fen);
  }

  castling_ = {false, false, false, false};
  if (fields[2] != "-") {
    for (char c : fields[2]) {
      auto pos = std::string("KQkq").find(c);
      if (pos == std::string::npos) {
        throw RulesError("FEN 캐슬링 필드가 올바르지 않습니다: " + fen);
      }
      castling_[pos] = true;
    }
  }

  ep_square_ = -1;
  if (fields[3] != "-") {
    ep_square_ = ParseSquare(fields[3]);
    if (ep_square_ < 0) {
      throw RulesError("FEN 앙파상 필드가 올바르지 않습니다: " + fen);
    }
  }

  halfmove_ = 0;
  fullmove_ = 1;
  if (fields.size() == 6) {
    try {
      halfmove_ = std::stoi(fields[4]);
      fullmove_ = std::stoi(fields[5]);
    } catch (const std::exception&) {
      throw RulesError("FEN 수 카운터가 올바르지 않습니다: " + fen);
    }
  }
}

std::string StandardChessRules::Fen() const {
  std::ostringstream oss;
  for (int rank = 7; rank >= 0; --rank) {
    int empty = 0;
    for (int file = 0; file < 8; ++file) {
      char p = board_[SquareAt(file, rank)];
      if (p == 0) {
        ++empty;
        continue;
      }
      if (empty > 0) {
        oss << empty;
        empty = 0;
      }
      oss << p;
    }
    if (empty > 0) {
      oss << empty;
    }
    if (rank > 0) {
      oss << '/';
    }
  }
  oss << ' ' << (turn_ == Color::kWhite ? 'w' : 'b') << ' ';
  std::string rights;
  const char* symbols = "KQkq";
  for (int i = 0; i < 4; ++i) {
    if (castling_[i]) {
      rights.push_back(symbols[i]);
    }
  }
  oss << (rights.empty() ? "-" : rights) << ' ';
  oss << (ep_square_ >= 0 ? SquareName(ep_square_) : "-") << ' ' << halfmove_ << ' ' << fullmove_;
  return oss.str();
}

std::string StandardChessRules::PositionKey() const {
  auto fen = Fen();
  // 반수/전체 수 카운터를 제외한 앞의 네 필드만 반복 판정에 쓴다.
  auto pos = fen.rfind(' ');
  pos = fen.rfind(' ', pos - 1);
  return fen.substr(0, pos);
}

void StandardChessRules::AddPawnMoves(int sq, std::vector<Move>& out) const {
  const char pawn = board_[sq];
  const int dir = turn_ == Color::kWhite ? 1 : -1;
  const int start_rank = turn_ == Color::kWhite ? 1 : 6;
  const int last_rank = turn_ == Color::kWhite ? 7 : 0;
  const int file = FileOf(sq);
  const int rank = RankOf(sq);

  auto push = [&](int to, char captured, bool en_passant) {
    if (RankOf(to) == last_rank) {
      for (char promo : {'q', 'r', 'b', 'n'}) {
        out.push_back(Move{sq, to, pawn, captured, promo, false, false});
      }
    } else {
      out.push_back(Move{sq, to, pawn, captured, 0, en_passant, false});
    }
  };

  if (OnBoard(file, rank + dir) && board_[SquareAt(file, rank + dir)] == 0) {
    push(SquareAt(file, rank + dir), 0, false);
    if (rank == start_rank && board_[SquareAt(file, rank + 2 * dir)] == 0) {
      push(SquareAt(file, rank + 2 * dir), 0, false);
    }
  }
  for (int df : {-1, 1}) {
    if (!OnBoard(file + df, rank + dir)) {
      continue;
    }
    int to = SquareAt(file + df, rank + dir);
    char target = board_[to];
    if (target != 0 && !Owns(target, turn_)) {
      push(to, target, false);
    } else if (target == 0 && to == ep_square_) {
      push(to, PieceFor('p', Opposite(turn_)), true);
    }
  }
}

void StandardChessRules::AddStepMoves(int sq, const int (*offsets)[2], int count, bool slide,
                                      std::vector<Move>& out) const {
  const char piece = board_[sq];
  for (int i = 0; i < count; ++i) {
    int f = FileOf(sq) + offsets[i][0];
    int r = RankOf(sq) + offsets[i][1];
    while (OnBoard(f, r)) {
      int to = SquareAt(f, r);
      char target = board_[to];
      if (target != 0) {
        if (!Owns(target, turn_)) {
          out.push_back(Move{sq, to, piece, target, 0, false, false});
        }
        break;
      }
      out.push_back(Move{sq, to, piece, 0, 0, false, false});
      if (!slide) {
        break;
      }
      f += offsets[i][0];
      r += offsets[i][1];
    }
  }
}

void StandardChessRules::AddCastling(std::vector<Move>& out) const {
  const Color enemy = Opposite(turn_);
  const int home = turn_ == Color::kWhite ? 0 : 56;
  const char king = PieceFor('k', turn_);
  const char rook = PieceFor('r', turn_);
  const int rights = turn_ == Color::kWhite ? 0 : 2;
  if (board_[home + 4] != king || IsSquareAttacked(board_, home + 4, enemy)) {
    return;
  }
  if (castling_[rights] && board_[home + 7] == rook && board_[home + 5] == 0 && board_[home + 6] == 0 &&
      !IsSquareAttacked(board_, home + 5, enemy) && !IsSquareAttacked(board_, home + 6, enemy)) {
    out.push_back(Move{home + 4, home + 6, king, 0, 0, false, true});
  }
  if (castling_[rights + 1] && board_[home] == rook && board_[home + 1] == 0 && board_[home + 2] == 0 &&
      board_[home + 3] == 0 && !IsSquareAttacked(board_, home + 3, enemy) &&
      !IsSquareAttacked(board_, home + 2, enemy)) {
    out.push_back(Move{home + 4, home + 2, king, 0, 0, false, true});
  }
}

std::vector<StandardChessRules::Move> StandardChessRules::GeneratePseudoLegal() const {
  std::vector<Move> moves;
  for (int sq = 0; sq < 64; ++sq) {
    char p = board_[sq];
    if (!Owns(p, turn_)) {
      continue;
    }
    switch (Kind(p)) {
      case 'p':
        AddPawnMoves(sq, moves);
        break;
      case 'n':
        AddStepMoves(sq, kKnightOffsets, 8, false, moves);
        break;
      case 'b':
        AddStepMoves(sq, kBishopOffsets, 4, true, moves);
        break;
      case 'r':
        AddStepMoves(sq, kRookOffsets, 4, true, moves);
        break;
      case 'q':
        AddStepMoves(sq, kBishopOffsets, 4, true, moves);
        AddStepMoves(sq, kRookOffsets, 4, true, moves);
        break;
      case 'k':
        AddStepMoves(sq, kKingOffsets, 8, false, moves);
        break;
      default:
        break;
    }
  }
  AddCastling(moves);
  return moves;
}

std::vector<StandardChessRules::Move> StandardChessRules::GenerateLegal() const {
  std::vector<Move> legal;
  for (const auto& move : GeneratePseudoLegal()) {
    Board next = board_;
    next[move.to] = move.piece;
    next[move.from] = 0;
    if (move.en_passant) {
      next[SquareAt(FileOf(move.to), RankOf(move.from))] = 0;
    }
    if (!IsSquareAttacked(next, FindKing(next, turn_), Opposite(turn_))) {
      legal.push_back(move);
    }
  }
  return legal;
}

bool StandardChessRules::IsAttacked(int sq, Color by) const { return IsSquareAttacked(board_, sq, by); }

int StandardChessRules::KingSquare(Color color) const { return FindKing(board_, color); }

bool StandardChessRules::InCheck() const { return IsAttacked(KingSquare(turn_), Opposite(turn_)); }

void StandardChessRules::MakeMove(const Move& move) {
  board_[move.from] = 0;
  board_[move.to] = move.promotion != 0 ? PieceFor(move.promotion, turn_) : move.piece;
  if (move.en_passant) {
    board_[SquareAt(FileOf(move.to), RankOf(move.from))] = 0;
  }
  if (move.castle) {
    const int home = RankOf(move.from) * 8;
    if (FileOf(move.to) == 6) {
      board_[home + 5] = board_[home + 7];
      board_[home + 7] = 0;
    } else {
      board_[home + 3] = board_[home];
      board_[home] = 0;
    }
  }

  if (Kind(move.piece) == 'k') {
    castling_[turn_ == Color::kWhite ? 0 : 2] = false;
    castling_[turn_ == Color::kWhite ? 1 : 3] = false;
  }
  // 코너 칸에서 룩이 떠나거나 잡히면 해당 권리가 사라진다.
  const int corners[4] = {7, 0, 63, 56};
  for (int i = 0; i < 4; ++i) {
    if (move.from == corners[i] || move.to == corners[i]) {
      castling_[i] = false;
    }
  }

  ep_square_ = -1;
  if (Kind(move.piece) == 'p' && std::abs(RankOf(move.to) - RankOf(move.from)) == 2) {
    ep_square_ = (move.from + move.to) / 2;
  }
  halfmove_ = (Kind(move.piece) == 'p' || move.captured != 0) ? 0 : halfmove_ + 1;
  if (turn_ == Color::kBlack) {
    ++fullmove_;
  }
  turn_ = Opposite(turn_);
}

std::string StandardChessRules::SanBase(const Move& move, const std::vector<Move>& legal) const {
  if (move.castle) {
    return FileOf(move.to) == 6 ? "O-O" : "O-O-O";
  }
  std::string san;
  if (Kind(move.piece) == 'p') {
    if (move.captured != 0) {
      san.push_back(static_cast<char>('a' + FileOf(move.from)));
      san.push_back('x');
    }
    san += SquareName(move.to);
    if (move.promotion != 0) {
      san.push_back('=');
      san.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(move.promotion))));
    }
    return san;
  }

  san.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(move.piece))));
  bool ambiguous = false;
  bool same_file = false;
  bool same_rank = false;
  for (const auto& other : legal) {
    if (other.piece != move.piece || other.to != move.to || other.from == move.from) {
      continue;
    }
    ambiguous = true;
    same_file = same_file || FileOf(other.from) == FileOf(move.from);
    same_rank = same_rank || RankOf(other.from) == RankOf(move.from);
  }
  if (ambiguous) {
    if (!same_file) {
      san.push_back(static_cast<char>('a' + FileOf(move.from)));
    } else if (!same_rank) {
      san.push_back(static_cast<char>('1' + RankOf(move.from)));
    } else {
      san += SquareName(move.from);
    }
  }
  if (move.captured != 0) {
    san.push_back('x');
  }
  san += SquareName(move.to);
  return san;
}

std::optional<AppliedMove> StandardChessRules::ApplyMove(const MoveRequest& request) {
  const int from = ParseSquare(request.from);
  const int to = ParseSquare(request.to);
  if (from < 0 || to < 0) {
    return std::nullopt;
  }
  char promotion = 'q';
  if (request.promotion) {
    promotion = Kind(*request.promotion);
    if (std::string("qrbn").find(promotion) == std::string::npos) {
      return std::nullopt;
    }
  }

  auto legal = GenerateLegal();
  auto it = std::find_if(legal.begin(), legal.end(), [&](const Move& m) {
    return m.from == from && m.to == to && (m.promotion == 0 || m.promotion == promotion);
  });
  if (it == legal.end()) {
    return std::nullopt;
  }
  const Move move = *it;

  std::string san = SanBase(move, legal);
  MakeMove(move);
  if (InCheck()) {
    san.push_back(GenerateLegal().empty() ? '#' : '+');
  }
  san_history_.push_back(san);
  ++repetitions_[PositionKey()];

  AppliedMove applied{request.from, request.to, san, Kind(move.piece), std::nullopt, std::nullopt};
  if (move.captured != 0) {
    applied.captured = Kind(move.captured);
  }
  if (move.promotion != 0) {
    applied.promotion = move.promotion;
  }
  return applied;
}

LegalMoveMap StandardChessRules::LegalMoves() const {
  LegalMoveMap grouped;
  for (const auto& move : GenerateLegal()) {
    auto& targets = grouped[SquareName(move.from)];
    auto to = SquareName(move.to);
    if (std::find(targets.begin(), targets.end(), to) == targets.end()) {
      targets.push_back(to);
    }
  }
  return grouped;
}

bool StandardChessRules::IsInsufficientMaterial() const {
  int pieces = 0;
  int minors = 0;
  int bishops = 0;
  int bishop_square_parity = 0;
  for (int sq = 0; sq < 64; ++sq) {
    char p = board_[sq];
    if (p == 0) {
      continue;
    }
    ++pieces;
    char kind = Kind(p);
    if (kind == 'b') {
      ++bishops;
      ++minors;
      bishop_square_parity += (FileOf(sq) + RankOf(sq)) % 2;
    } else if (kind == 'n') {
      ++minors;
    }
  }
  if (pieces == 2) {
    return true;
  }
  if (pieces == 3 && minors == 1) {
    return true;
  }
  // 킹 외에 비숍만 남았고 모두 같은 색 칸에 있으면 메이트가 불가능하다.
  if (bishops > 0 && pieces == bishops + 2) {
    return bishop_square_parity == 0 || bishop_square_parity == bishops;
  }
  return false;
}

bool StandardChessRules::IsThreefoldRepetition() const {
  auto it = repetitions_.find(PositionKey());
  return it != repetitions_.end() && it->second >= 3;
}

Classification StandardChessRules::Classify() const {
  Classification result;
  result.in_check = InCheck();
  if (GenerateLegal().empty()) {
    result.termination = result.in_check ? Termination::kCheckmate : Termination::kStalemate;
    return result;
  }
  if (IsInsufficientMaterial()) {
    result.termination = Termination::kDraw;
    result.draw_reason = "insufficient material";
  } else if (IsThreefoldRepetition()) {
    result.termination = Termination::kDraw;
    result.draw_reason = "threefold repetition";
  } else if (halfmove_ >= 100) {
    result.termination = Termination::kDraw;
    result.draw_reason = "fifty-move rule";
  }
  return result;
}

std::string StandardChessRules::Pgn() const {
  std::ostringstream oss;
  oss << movetext_prefix_;
  int number = history_start_fullmove_;
  bool white_to_move = history_start_turn_ == Color::kWhite;
  for (std::size_t i = 0; i < san_history_.size(); ++i) {
    if (i > 0 || !movetext_prefix_.empty()) {
      oss << ' ';
    }
    if (white_to_move) {
      oss << number << ". ";
    } else if (i == 0 && movetext_prefix_.empty()) {
      oss << number << "... ";
    }
    oss << san_history_[i];
    if (!white_to_move) {
      ++number;
    }
    white_to_move = !white_to_move;
  }
  return oss.str();
}

std::unique_ptr<RulesEngine> StandardChessRules::Clone() const { return std::make_unique<StandardChessRules>(*this); }

RulesEngineFactory MakeStandardRulesFactory() {
  return [](const std::optional<std::string>& fen) -> std::unique_ptr<RulesEngine> {
    return std::make_unique<StandardChessRules>(fen ? *fen : std::string(kInitialFen));
  };
}

}  // namespace chessroom
