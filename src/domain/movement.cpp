#include "domain/movement.hpp"

namespace shogi::review::domain {

namespace {

struct Delta {
    int dx;
    int dy;
};

const std::vector<Delta> kPawnSteps   = {{0, -1}};
const std::vector<Delta> kKnightSteps = {{-1, -2}, {1, -2}};
const std::vector<Delta> kSilverSteps = {{-1, -1}, {0, -1}, {1, -1}, {-1, 1}, {1, 1}};
const std::vector<Delta> kGoldSteps   = {{-1, -1}, {0, -1}, {1, -1}, {-1, 0}, {1, 0}, {0, 1}};
const std::vector<Delta> kKingSteps   = {{-1, -1}, {0, -1}, {1, -1}, {-1, 0}, {1, 0}, {-1, 1}, {0, 1}, {1, 1}};
const std::vector<Delta> kDiagonals   = {{-1, -1}, {1, -1}, {-1, 1}, {1, 1}};
const std::vector<Delta> kOrthogonals = {{0, -1}, {-1, 0}, {1, 0}, {0, 1}};
const std::vector<Delta> kForward     = {{0, -1}};
const std::vector<Delta> kNone        = {};

struct Pattern {
    const std::vector<Delta>& steps;
    const std::vector<Delta>& slides;
};

Pattern patternFor(const Piece& p) {
    if (p.promoted) {
        switch (p.base) {
            case PieceBase::Bishop: return {kOrthogonals, kDiagonals};
            case PieceBase::Rook:   return {kDiagonals, kOrthogonals};
            default:                return {kGoldSteps, kNone};
        }
    }
    switch (p.base) {
        case PieceBase::Pawn:   return {kPawnSteps, kNone};
        case PieceBase::Lance:  return {kNone, kForward};
        case PieceBase::Knight: return {kKnightSteps, kNone};
        case PieceBase::Silver: return {kSilverSteps, kNone};
        case PieceBase::Gold:   return {kGoldSteps, kNone};
        case PieceBase::Bishop: return {kNone, kDiagonals};
        case PieceBase::Rook:   return {kNone, kOrthogonals};
        case PieceBase::King:   return {kKingSteps, kNone};
    }
    return {kNone, kNone};
}

// Shared walker for steps and slides. With includeFriendly the first blocker is
// visited regardless of its owner (coverage); otherwise own pieces are skipped.
// Returns false once the visitor asked to stop.
bool walk(const Board& board, const Square& from, const Piece& piece, bool includeFriendly,
          const SquareVisitor& visitor) {
    const int dir = (piece.owner == Side::Sente) ? 1 : -1;
    const Pattern pat = patternFor(piece);

    auto offer = [&](const Square& sq) -> bool {
        const auto& cell = board.at(sq);
        if (cell && cell->owner == piece.owner && !includeFriendly) return true;
        return visitor(sq);
    };

    for (const Delta& d : pat.steps) {
        const Square sq{from.x + d.dx, from.y + d.dy * dir};
        if (!onBoard(sq)) continue;
        if (!offer(sq)) return false;
    }

    for (const Delta& d : pat.slides) {
        Square sq{from.x + d.dx, from.y + d.dy * dir};
        while (onBoard(sq)) {
            if (!offer(sq)) return false;
            if (!board.isEmpty(sq)) break;
            sq.x += d.dx;
            sq.y += d.dy * dir;
        }
    }
    return true;
}

std::vector<Square> collect(const Board& board, const Square& from, const Piece& piece, bool includeFriendly) {
    std::vector<Square> out;
    walk(board, from, piece, includeFriendly, [&](const Square& sq) {
        out.push_back(sq);
        return true;
    });
    return out;
}

// Ranks counted from the mover's far edge: 0 is the last rank.
inline int ranksFromFarEdge(Side side, int y) {
    return (side == Side::Sente) ? y : (kBoardSize - 1 - y);
}

} // namespace

void forEachReachable(const Board& board, const Square& from, const Piece& piece,
                      const SquareVisitor& visitor) {
    walk(board, from, piece, false, visitor);
}

std::vector<Square> reachableSquares(const Board& board, const Square& from, const Piece& piece) {
    return collect(board, from, piece, false);
}

std::vector<Square> controlledSquares(const Board& board, const Square& from, const Piece& piece) {
    return collect(board, from, piece, true);
}

SquareSet attackSet(const Board& board, Side side) {
    SquareSet set;
    for (int i = 0; i < kSquareCount; ++i) {
        const Square from = squareAt(i);
        const auto& cell = board.at(from);
        if (!cell || cell->owner != side) continue;
        walk(board, from, *cell, true, [&](const Square& sq) {
            set.set(static_cast<std::size_t>(indexOf(sq)));
            return true;
        });
    }
    return set;
}

bool isAttacked(const Board& board, const Square& sq, Side by) {
    return contains(attackSet(board, by), sq);
}

bool isDefended(const Board& board, const Square& sq, Side owner) {
    for (int i = 0; i < kSquareCount; ++i) {
        const Square from = squareAt(i);
        if (from == sq) continue;
        const auto& cell = board.at(from);
        if (!cell || cell->owner != owner) continue;

        bool covers = false;
        walk(board, from, *cell, true, [&](const Square& t) {
            if (t == sq) {
                covers = true;
                return false;
            }
            return true;
        });
        if (covers) return true;
    }
    return false;
}

bool isHanging(const Board& board, const Square& sq) {
    const auto& cell = board.at(sq);
    if (!cell) return false;
    return !isDefended(board, sq, cell->owner);
}

std::vector<Square> hangingPieces(const Board& board, Side side) {
    std::vector<Square> out;
    for (int i = 0; i < kSquareCount; ++i) {
        const Square sq = squareAt(i);
        const auto& cell = board.at(sq);
        if (!cell || cell->owner != side) continue;
        if (isHanging(board, sq)) out.push_back(sq);
    }
    return out;
}

bool inPromotionZone(Side side, int y) {
    return (side == Side::Sente) ? (y <= 2) : (y >= 6);
}

bool canPromote(const Piece& piece, const Square& from, const Square& to) {
    if (piece.promoted || !isPromotable(piece.base)) return false;
    return inPromotionZone(piece.owner, from.y) || inPromotionZone(piece.owner, to.y);
}

bool mustPromote(const Piece& piece, const Square& to) {
    if (piece.promoted) return false;
    const int r = ranksFromFarEdge(piece.owner, to.y);
    switch (piece.base) {
        case PieceBase::Pawn:
        case PieceBase::Lance:
            return r == 0;
        case PieceBase::Knight:
            return r <= 1;
        default:
            return false;
    }
}

bool isDropRankAllowed(PieceBase kind, Side side, int y) {
    const int r = ranksFromFarEdge(side, y);
    switch (kind) {
        case PieceBase::Pawn:
        case PieceBase::Lance:
            return r >= 1;
        case PieceBase::Knight:
            return r >= 2;
        default:
            return true;
    }
}

std::vector<Square> legalDropSquares(const Position& pos, Side side, PieceBase kind) {
    std::vector<Square> out;
    if (pos.handCount(side, kind) == 0) return out;

    for (int i = 0; i < kSquareCount; ++i) {
        const Square sq = squareAt(i);
        if (!pos.board.isEmpty(sq)) continue;
        if (!isDropRankAllowed(kind, side, sq.y)) continue;
        out.push_back(sq);
    }
    return out;
}

bool isPseudoLegal(const Board& board, const Move& move, Side mover) {
    if (move.isDrop()) return false;
    if (!onBoard(move.from) || !onBoard(move.to)) return false;

    const auto& cell = board.at(move.from);
    if (!cell || cell->owner != mover) return false;

    bool found = false;
    forEachReachable(board, move.from, *cell, [&](const Square& sq) {
        if (sq == move.to) {
            found = true;
            return false;
        }
        return true;
    });
    return found;
}

} // namespace shogi::review::domain
