#include "app/ReviewSession.hpp"

#include <algorithm>
#include <utility>

#include "domain/move_label.hpp"
#include "domain/movement.hpp"
#include "domain/sfen_codec.hpp"

namespace shogi::review::app {

using namespace shogi::review::domain;

ReviewSession::ReviewSession() {
    timeline_.header = "startpos";
    timeline_.positions.push_back(sfen::startPosition());
}

void ReviewSession::setCallbacks(ReviewSessionCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

void ReviewSession::notifyTimeline() {
    if (callbacks_.onTimelineChanged) {
        callbacks_.onTimelineChanged();
    }
}

void ReviewSession::notifyCursor() {
    if (callbacks_.onCursorChanged) {
        callbacks_.onCursorChanged(cursor_);
    }
}

void ReviewSession::rebuildLabels() {
    labels_ = formatMoveLabels(timeline_.positions, timeline_.moves);
}

SessionLoadResult ReviewSession::load(const std::string& notation) {
    SessionLoadResult res;

    auto built = buildTimeline(notation);
    if (!built.ok) {
        res.error = built.error;
        res.moveError = built.moveError;
        res.failedPly = built.failedPly;
        return res;
    }

    timeline_ = std::move(built.timeline);
    cursor_ = 0;
    rebuildLabels();

    notifyTimeline();
    notifyCursor();

    res.ok = true;
    return res;
}

void ReviewSession::setCurrentPly(int ply) {
    const int clamped = std::clamp(ply, 0, lastPly());
    if (clamped == cursor_) {
        return;
    }
    cursor_ = clamped;
    notifyCursor();
}

void ReviewSession::first() {
    setCurrentPly(0);
}

void ReviewSession::prev() {
    setCurrentPly(cursor_ - 1);
}

void ReviewSession::next() {
    setCurrentPly(cursor_ + 1);
}

void ReviewSession::last() {
    setCurrentPly(lastPly());
}

const Position& ReviewSession::currentPosition() const {
    return timeline_.positions[static_cast<std::size_t>(cursor_)];
}

std::optional<Move> ReviewSession::lastMove() const {
    if (cursor_ <= 0) {
        return std::nullopt;
    }
    const auto parsed = sfen::parseMove(timeline_.moves[static_cast<std::size_t>(cursor_ - 1)]);
    if (!parsed.ok) {
        return std::nullopt;
    }
    return parsed.move;
}

std::vector<Square> ReviewSession::reachableFrom(const Square& sq) const {
    if (!onBoard(sq)) {
        return {};
    }
    const Position& pos = currentPosition();
    const auto& cell = pos.pieceAt(sq);
    if (!cell || cell->owner != pos.sideToMove) {
        return {};
    }
    return reachableSquares(pos.board, sq, *cell);
}

std::vector<Square> ReviewSession::dropTargets(PieceBase kind) const {
    const Position& pos = currentPosition();
    return legalDropSquares(pos, pos.sideToMove, kind);
}

std::vector<Square> ReviewSession::hangingPieces(Side side) const {
    return domain::hangingPieces(currentPosition().board, side);
}

ApplyResult ReviewSession::playMove(const std::string& token) {
    auto applied = applyMoveToken(currentPosition(), token, ApplyPolicy::CheckMovement);
    if (!applied.ok) {
        return applied;
    }

    const auto keep = static_cast<std::size_t>(cursor_);
    timeline_.positions.resize(keep + 1);
    timeline_.moves.resize(keep);
    timeline_.terminal.reset();

    timeline_.positions.push_back(applied.position);
    timeline_.moves.push_back(sfen::formatMove(sfen::parseMove(token).move));
    ++cursor_;
    rebuildLabels();

    notifyTimeline();
    notifyCursor();
    return applied;
}

std::string ReviewSession::positionCommand() const {
    return timeline_.positionCommandAt(cursor_);
}

} // namespace shogi::review::app
