#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/move_applicator.hpp"
#include "domain/shogi_model.hpp"
#include "domain/timeline.hpp"

namespace shogi::review::app {

struct ReviewSessionCallbacks {
    std::function<void()>    onTimelineChanged;
    std::function<void(int)> onCursorChanged; // new ply
};

struct SessionLoadResult {
    bool ok{false};
    std::string error;

    shogi::review::domain::MoveError moveError{shogi::review::domain::MoveError::None};
    int failedPly{0};
};

// Cursor over one replayed game plus interactive branch moves.
// Owns the timeline; the UI only reads snapshots and asks for hints.
class ReviewSession {
public:
    ReviewSession();

    void setCallbacks(ReviewSessionCallbacks callbacks);

    // Builds a new timeline. On failure the previous one stays loaded.
    SessionLoadResult load(const std::string& notation);

    const shogi::review::domain::Timeline& timeline() const noexcept {
        return timeline_;
    }

    // --- Cursor ---

    int currentPly() const noexcept { return cursor_; }
    int lastPly() const noexcept { return timeline_.plyCount(); }

    // Clamped to [0, lastPly()].
    void setCurrentPly(int ply);
    void first();
    void prev();
    void next();
    void last();

    const shogi::review::domain::Position& currentPosition() const;

    // Move that produced the current ply (none at ply 0).
    std::optional<shogi::review::domain::Move> lastMove() const;

    // One label per ply: labels[i] is the move leading to ply i + 1.
    const std::vector<std::string>& moveLabels() const noexcept {
        return labels_;
    }

    // --- Hints ---

    // Empty unless `sq` holds a piece of the side to move.
    std::vector<shogi::review::domain::Square> reachableFrom(const shogi::review::domain::Square& sq) const;
    std::vector<shogi::review::domain::Square> dropTargets(shogi::review::domain::PieceBase kind) const;
    std::vector<shogi::review::domain::Square> hangingPieces(shogi::review::domain::Side side) const;

    // --- Interactive moves ---

    // Applies `token` at the cursor with ApplyPolicy::CheckMovement. On success
    // everything after the cursor is dropped, the move is appended and the
    // cursor advances; on failure the session is unchanged.
    shogi::review::domain::ApplyResult playMove(const std::string& token);

    // "position ... moves ..." up to the cursor.
    std::string positionCommand() const;

private:
    void rebuildLabels();
    void notifyTimeline();
    void notifyCursor();

    shogi::review::domain::Timeline timeline_;
    std::vector<std::string>        labels_;
    int                             cursor_{0};
    ReviewSessionCallbacks          callbacks_;
};

} // namespace shogi::review::app
