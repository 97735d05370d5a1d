#include "domain/move_applicator.hpp"

#include "domain/movement.hpp"
#include "domain/sfen_codec.hpp"

#include <utility>

namespace shogi::review::domain {

namespace {

ApplyResult fail(MoveError e, std::string message) {
    ApplyResult r;
    r.error = e;
    r.message = std::move(message);
    return r;
}

ApplyResult applyBoardMove(const Position& pos, const Move& move, ApplyPolicy policy) {
    const Side mover = pos.sideToMove;
    const std::string token = sfen::formatMove(move);

    const auto& src = pos.pieceAt(move.from);
    if (!src || src->owner != mover) {
        return fail(MoveError::WrongOwner,
                    "No " + to_string(mover) + " piece on " + sfen::formatSquare(move.from) + " (" + token + ")");
    }

    const auto& dst = pos.pieceAt(move.to);
    if (dst && dst->owner == mover) {
        return fail(MoveError::OccupiedBySelf,
                    "Destination " + sfen::formatSquare(move.to) + " holds an own piece (" + token + ")");
    }
    if (dst && dst->base == PieceBase::King) {
        return fail(MoveError::KingCapture,
                    "Move " + token + " captures the " + to_string(dst->owner) + " king");
    }

    if (policy == ApplyPolicy::CheckMovement) {
        if (!isPseudoLegal(pos.board, move, mover)) {
            return fail(MoveError::Unreachable,
                        to_string(src->base) + " on " + sfen::formatSquare(move.from) +
                        " cannot reach " + sfen::formatSquare(move.to));
        }
        if (move.promote && !canPromote(*src, move.from, move.to)) {
            return fail(MoveError::CannotPromote, "Promotion not allowed for " + token);
        }
    }

    ApplyResult r;
    r.position = pos.clone();

    if (dst) {
        const Piece taken = dst->demotedCopy();
        r.position.hands.add(mover, taken.base);
        r.captured = taken;
    }

    const Piece moved = move.promote ? src->promotedCopy() : *src;
    r.position.board.clear(move.from);
    r.position.board.place(move.to, moved);
    r.position.sideToMove = opposite(mover);
    r.ok = true;
    return r;
}

ApplyResult applyDrop(const Position& pos, const Move& move) {
    const Side mover = pos.sideToMove;
    const std::string token = sfen::formatMove(move);

    if (pos.handCount(mover, move.piece) == 0) {
        return fail(MoveError::NoPieceInHand,
                    to_string(mover) + " holds no " + to_string(move.piece) + " (" + token + ")");
    }
    if (!pos.board.isEmpty(move.to)) {
        return fail(MoveError::Occupied, "Drop square " + sfen::formatSquare(move.to) + " is occupied");
    }
    if (!isDropRankAllowed(move.piece, mover, move.to.y)) {
        return fail(MoveError::RestrictedDropRank,
                    to_string(move.piece) + " may not be dropped on " + sfen::formatSquare(move.to));
    }

    ApplyResult r;
    r.position = pos.clone();
    r.position.hands.take(mover, move.piece);
    r.position.board.place(move.to, Piece::make(move.piece, mover));
    r.position.sideToMove = opposite(mover);
    r.ok = true;
    return r;
}

} // namespace

ApplyResult applyMove(const Position& pos, const Move& move, ApplyPolicy policy) {
    if (!onBoard(move.to) || (!move.isDrop() && !onBoard(move.from))) {
        return fail(MoveError::Unparsable, "Move square outside the board");
    }
    if (move.isDrop()) return applyDrop(pos, move);
    return applyBoardMove(pos, move, policy);
}

ApplyResult applyMoveToken(const Position& pos, std::string_view token, ApplyPolicy policy) {
    const auto parsed = sfen::parseMove(token);
    if (!parsed.ok) {
        return fail(MoveError::Unparsable, parsed.error.message);
    }
    return applyMove(pos, parsed.move, policy);
}

std::string to_string(MoveError e) {
    switch (e) {
        case MoveError::None:               return "None";
        case MoveError::WrongOwner:         return "WrongOwner";
        case MoveError::OccupiedBySelf:     return "OccupiedBySelf";
        case MoveError::NoPieceInHand:      return "NoPieceInHand";
        case MoveError::Occupied:           return "Occupied";
        case MoveError::RestrictedDropRank: return "RestrictedDropRank";
        case MoveError::Unreachable:        return "Unreachable";
        case MoveError::CannotPromote:      return "CannotPromote";
        case MoveError::KingCapture:        return "KingCapture";
        case MoveError::Unparsable:         return "Unparsable";
    }
    return "Unknown";
}

} // namespace shogi::review::domain
