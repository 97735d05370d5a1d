#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "domain/move_applicator.hpp"
#include "domain/sfen_codec.hpp"
#include "domain/shogi_model.hpp"

namespace shogi::review::domain {

struct Timeline {
    std::string header;                 // "startpos" or "sfen ..."
    int startMoveNumber{1};
    std::vector<Position> positions;    // ply 0 = initial position
    std::vector<std::string> moves;     // moves[i] leads from positions[i] to positions[i + 1]
    std::optional<std::string> terminal; // "resign", "win" or "draw" when the record ends with one

    int plyCount() const { return static_cast<int>(moves.size()); }

    Side sideToMoveAt(int ply) const;

    // "<board> <b|w> <hands> <moveNumber>" for the snapshot at `ply`.
    std::string sfenAt(int ply) const;

    // "position <header> moves ..." truncated to the first `ply` moves.
    std::string positionCommandAt(int ply) const;
};

struct TimelineResult {
    bool ok{false};
    std::string error;

    sfen::ParseError parseError;          // header failures
    MoveError moveError{MoveError::None}; // replay failures
    int failedPly{0};                     // 1-based ply that could not be produced
    std::string token;                    // offending move token

    Timeline timeline;                    // snapshots up to failedPly - 1 on replay failure
};

// Parses `notation` and replays every move with ApplyPolicy::Trusting.
TimelineResult buildTimeline(std::string_view notation);

// `position ...` command for `notation` cut after `ply` moves (clamped to the move list).
// Returns an empty string when the header cannot be parsed.
std::string positionCommandForPly(std::string_view notation, int ply);

bool isTerminalToken(std::string_view token);

} // namespace shogi::review::domain
