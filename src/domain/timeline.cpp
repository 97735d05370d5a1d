#include "domain/timeline.hpp"

#include <algorithm>

namespace shogi::review::domain {

bool isTerminalToken(std::string_view token) {
    return token == "resign" || token == "win" || token == "draw";
}

Side Timeline::sideToMoveAt(int ply) const {
    if (positions.empty()) return Side::Sente;
    const int last = static_cast<int>(positions.size()) - 1;
    const int p = std::clamp(ply, 0, last);
    return positions[static_cast<std::size_t>(p)].sideToMove;
}

std::string Timeline::sfenAt(int ply) const {
    if (positions.empty()) return {};
    const int last = static_cast<int>(positions.size()) - 1;
    const int p = std::clamp(ply, 0, last);
    return sfen::formatSfen(positions[static_cast<std::size_t>(p)], startMoveNumber + p);
}

std::string Timeline::positionCommandAt(int ply) const {
    const int p = std::clamp(ply, 0, plyCount());
    const std::vector<std::string> head(moves.begin(), moves.begin() + p);
    return sfen::formatPositionCommand(header, head);
}

TimelineResult buildTimeline(std::string_view notation) {
    TimelineResult res;

    const auto parsed = sfen::parsePosition(notation);
    if (!parsed.ok) {
        res.parseError = parsed.error;
        res.error = parsed.error.message;
        return res;
    }

    Timeline& tl = res.timeline;
    tl.header = parsed.header;
    tl.startMoveNumber = parsed.moveNumber;
    tl.positions.reserve(parsed.moves.size() + 1);
    tl.positions.push_back(parsed.position);

    for (std::size_t i = 0; i < parsed.moves.size(); ++i) {
        const std::string& token = parsed.moves[i];
        // Terminal tokens are not plies.
        const int ply = tl.plyCount() + 1;

        if (tl.terminal) {
            res.moveError = MoveError::Unparsable;
            res.failedPly = ply;
            res.token = token;
            res.error = "Move '" + token + "' after terminal '" + *tl.terminal + "'";
            return res;
        }
        if (isTerminalToken(token)) {
            tl.terminal = token;
            continue;
        }

        const auto applied = applyMoveToken(tl.positions.back(), token, ApplyPolicy::Trusting);
        if (!applied.ok) {
            res.moveError = applied.error;
            res.failedPly = ply;
            res.token = token;
            res.error = "Could not replay beyond ply " + std::to_string(ply - 1) + ": " + applied.message;
            return res;
        }

        tl.positions.push_back(applied.position);
        tl.moves.push_back(token);
    }

    res.ok = true;
    return res;
}

std::string positionCommandForPly(std::string_view notation, int ply) {
    const auto parsed = sfen::parsePosition(notation);
    if (!parsed.ok) return {};

    std::vector<std::string> moves;
    for (const auto& m : parsed.moves) {
        if (isTerminalToken(m)) break;
        moves.push_back(m);
    }
    const int p = std::clamp(ply, 0, static_cast<int>(moves.size()));
    moves.resize(static_cast<std::size_t>(p));
    return sfen::formatPositionCommand(parsed.header, moves);
}

} // namespace shogi::review::domain
