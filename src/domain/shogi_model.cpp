#include "domain/shogi_model.hpp"

namespace shogi::review::domain {

bool exceedsMaterial(const Position& pos) {
    std::array<int, kPieceBaseCount> seen{};

    for (int i = 0; i < kSquareCount; ++i) {
        const auto& cell = pos.board.at(squareAt(i));
        if (cell) ++seen[static_cast<std::size_t>(cell->base)];
    }

    for (Side side : {Side::Sente, Side::Gote}) {
        for (PieceBase b : kHandOrder) {
            seen[static_cast<std::size_t>(b)] += static_cast<int>(pos.hands.count(side, b));
        }
    }

    for (int k = 0; k < kPieceBaseCount; ++k) {
        if (seen[static_cast<std::size_t>(k)] > fullSetCount(static_cast<PieceBase>(k))) return true;
    }
    return false;
}

} // namespace shogi::review::domain
