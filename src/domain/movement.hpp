#pragma once

#include <bitset>
#include <functional>
#include <vector>

#include "domain/shogi_model.hpp"

namespace shogi::review::domain {

// One bit per board square, indexed by indexOf().
using SquareSet = std::bitset<kSquareCount>;

inline bool contains(const SquareSet& set, const Square& sq) {
    return set.test(static_cast<std::size_t>(indexOf(sq)));
}

// Return false from the visitor to stop generation.
using SquareVisitor = std::function<bool(const Square&)>;

// --- Piece movement ---------------------------------------------------------
//
// Deltas are written for Sente (forward = y - 1) and mirrored for Gote.
// Sliding directions stop at, and include, the first occupied square.

// Lazily visits the move targets of `piece` standing on `from`.
// Friendly-occupied squares are skipped, enemy-occupied ones are visited.
void forEachReachable(const Board& board, const Square& from, const Piece& piece,
                      const SquareVisitor& visitor);

// Move targets (captures included, own pieces excluded), in generation order.
std::vector<Square> reachableSquares(const Board& board, const Square& from, const Piece& piece);

// Every square the piece covers, own pieces included.
std::vector<Square> controlledSquares(const Board& board, const Square& from, const Piece& piece);

// --- Attack / defence -------------------------------------------------------

SquareSet attackSet(const Board& board, Side side);

bool isAttacked(const Board& board, const Square& sq, Side by);

// True iff a piece of `owner` other than the occupant of `sq` covers `sq`.
bool isDefended(const Board& board, const Square& sq, Side owner);

// Occupied and not defended by its owner.
bool isHanging(const Board& board, const Square& sq);

std::vector<Square> hangingPieces(const Board& board, Side side);

// --- Promotion / drop rules -------------------------------------------------

// Sente: y <= 2, Gote: y >= 6.
bool inPromotionZone(Side side, int y);

bool canPromote(const Piece& piece, const Square& from, const Square& to);

// Pawn/Lance on the last rank, Knight on the last two ranks.
bool mustPromote(const Piece& piece, const Square& to);

bool isDropRankAllowed(PieceBase kind, Side side, int y);

std::vector<Square> legalDropSquares(const Position& pos, Side side, PieceBase kind);

// Destination is among the reachable squares of the piece on move.from.
// Drops are never pseudo-legal here; see legalDropSquares().
bool isPseudoLegal(const Board& board, const Move& move, Side mover);

} // namespace shogi::review::domain
