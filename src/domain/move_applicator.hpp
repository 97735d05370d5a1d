#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "domain/shogi_model.hpp"

namespace shogi::review::domain {

enum class MoveError {
    None = 0,
    WrongOwner,         // source empty or not the mover's piece
    OccupiedBySelf,     // board move onto a friendly piece
    NoPieceInHand,
    Occupied,           // drop onto an occupied square
    RestrictedDropRank,
    Unreachable,        // CheckMovement only
    CannotPromote,      // CheckMovement only
    KingCapture,        // a king can never go to hand
    Unparsable
};

enum class ApplyPolicy {
    Trusting,      // occupancy/ownership/hand checks only (replay)
    CheckMovement  // also piece movement and promotion eligibility (interactive input)
};

struct ApplyResult {
    bool ok{false};
    MoveError error{MoveError::None};
    std::string message;

    Position position;              // valid when ok
    std::optional<Piece> captured;  // demoted piece added to the mover's hand
};

// Value in, value out: `pos` is never modified. On success the side to move flips.
ApplyResult applyMove(const Position& pos, const Move& move,
                      ApplyPolicy policy = ApplyPolicy::Trusting);

// parseMove() followed by applyMove(); parse failures come back as Unparsable.
ApplyResult applyMoveToken(const Position& pos, std::string_view token,
                           ApplyPolicy policy = ApplyPolicy::Trusting);

std::string to_string(MoveError e);

} // namespace shogi::review::domain
