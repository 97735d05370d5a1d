#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/shogi_model.hpp"

namespace shogi::review::domain {

// Japanese piece name: 歩 香 桂 銀 金 角 飛 玉, promoted と 成香 成桂 成銀 馬 龍.
std::string pieceKanji(PieceBase base, bool promoted);

// "７" for file 7, "六" for rank 6 (1-based, as printed on a board).
std::string fullWidthFile(int file);
std::string kanjiRank(int rank);

// "▲７六歩", "△同　歩", "▲３三歩打", "▲２二角成".
// `before` is the position the move is played from; `previousTo` is the
// destination of the preceding ply, if any. Returns "" when a board move's
// source square is empty.
std::string formatMoveLabel(const Position& before, const Move& move,
                            const std::optional<Square>& previousTo = std::nullopt);

// One label per move of a replayed line; positions.size() must be moves.size() + 1.
std::vector<std::string> formatMoveLabels(const std::vector<Position>& positions,
                                          const std::vector<std::string>& moves);

} // namespace shogi::review::domain
