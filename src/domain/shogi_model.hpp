#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace shogi::review::domain {

constexpr int kBoardSize = 9;
constexpr int kSquareCount = kBoardSize * kBoardSize;

// --- Sides & pieces ---------------------------------------------------------

enum class Side {
    Sente = 0, // first player, uppercase letters, moves "up" the board (y decreasing)
    Gote  = 1
};

inline Side opposite(Side s) {
    return (s == Side::Sente) ? Side::Gote : Side::Sente;
}

enum class PieceBase {
    Pawn   = 0,
    Lance  = 1,
    Knight = 2,
    Silver = 3,
    Gold   = 4,
    Bishop = 5,
    Rook   = 6,
    King   = 7
};

constexpr int kPieceBaseCount = 8;
constexpr int kHandKindCount  = 7; // King never goes to hand

inline bool isPromotable(PieceBase b) {
    return b != PieceBase::Gold && b != PieceBase::King;
}

inline bool isDroppable(PieceBase b) {
    return b != PieceBase::King;
}

// Pieces are values: promoting/demoting returns a new Piece.
struct Piece {
    PieceBase base{PieceBase::Pawn};
    Side      owner{Side::Sente};
    bool      promoted{false};

    static Piece make(PieceBase b, Side s, bool promote = false) {
        Piece p;
        p.base = b;
        p.owner = s;
        p.promoted = promote && isPromotable(b);
        return p;
    }

    // Gold and King have no promoted identity and are returned unchanged.
    Piece promotedCopy() const {
        return make(base, owner, isPromotable(base));
    }

    Piece demotedCopy() const {
        return make(base, owner, false);
    }

    bool operator==(const Piece& o) const {
        return base == o.base && owner == o.owner && promoted == o.promoted;
    }
    bool operator!=(const Piece& o) const { return !(*this == o); }
};

// --- Squares ----------------------------------------------------------------

// Display coordinates: x 0..8 left to right (file 9..1), y 0..8 top to bottom (rank a..i).
struct Square {
    int x{0};
    int y{0};

    bool operator==(const Square& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Square& o) const { return !(*this == o); }
    bool operator<(const Square& o) const {
        return (y != o.y) ? (y < o.y) : (x < o.x);
    }
};

inline bool onBoard(int x, int y) {
    return x >= 0 && x < kBoardSize && y >= 0 && y < kBoardSize;
}

inline bool onBoard(const Square& sq) {
    return onBoard(sq.x, sq.y);
}

inline int indexOf(const Square& sq) {
    return sq.y * kBoardSize + sq.x;
}

inline Square squareAt(int index) {
    return Square{index % kBoardSize, index / kBoardSize};
}

// --- Board ------------------------------------------------------------------

class Board {
public:
    const std::optional<Piece>& at(const Square& sq) const {
        return cells_[static_cast<std::size_t>(indexOf(sq))];
    }

    bool isEmpty(const Square& sq) const { return !at(sq).has_value(); }

    void place(const Square& sq, const Piece& p) {
        cells_[static_cast<std::size_t>(indexOf(sq))] = p;
    }

    void clear(const Square& sq) {
        cells_[static_cast<std::size_t>(indexOf(sq))].reset();
    }

    bool operator==(const Board& o) const { return cells_ == o.cells_; }
    bool operator!=(const Board& o) const { return !(*this == o); }

private:
    std::array<std::optional<Piece>, kSquareCount> cells_{};
};

// --- Hands ------------------------------------------------------------------

class Hands {
public:
    std::uint32_t count(Side s, PieceBase b) const {
        if (!isDroppable(b)) return 0;
        return counts_[sideIndex(s)][static_cast<std::size_t>(b)];
    }

    void add(Side s, PieceBase b, std::uint32_t n = 1) {
        if (!isDroppable(b)) return;
        counts_[sideIndex(s)][static_cast<std::size_t>(b)] += n;
    }

    // Returns false (and leaves the hand untouched) when no such piece is held.
    bool take(Side s, PieceBase b) {
        if (!isDroppable(b)) return false;
        auto& c = counts_[sideIndex(s)][static_cast<std::size_t>(b)];
        if (c == 0) return false;
        --c;
        return true;
    }

    bool empty() const {
        for (const auto& side : counts_) {
            for (auto c : side) {
                if (c > 0) return false;
            }
        }
        return true;
    }

    bool operator==(const Hands& o) const { return counts_ == o.counts_; }
    bool operator!=(const Hands& o) const { return !(*this == o); }

private:
    static std::size_t sideIndex(Side s) { return static_cast<std::size_t>(s); }

    std::array<std::array<std::uint32_t, kHandKindCount>, 2> counts_{};
};

// Canonical hand order used for serialization.
constexpr std::array<PieceBase, kHandKindCount> kHandOrder = {
    PieceBase::Rook, PieceBase::Bishop, PieceBase::Gold, PieceBase::Silver,
    PieceBase::Knight, PieceBase::Lance, PieceBase::Pawn
};

// --- Position ---------------------------------------------------------------

struct Position {
    Board board;
    Hands hands;
    Side  sideToMove{Side::Sente};

    // Deep value copy; take one before any speculative mutation.
    Position clone() const { return *this; }

    const std::optional<Piece>& pieceAt(const Square& sq) const { return board.at(sq); }

    std::uint32_t handCount(Side s, PieceBase b) const { return hands.count(s, b); }

    bool operator==(const Position& o) const {
        return board == o.board && hands == o.hands && sideToMove == o.sideToMove;
    }
    bool operator!=(const Position& o) const { return !(*this == o); }
};

// Number of pieces of each base kind in a full set (both players together).
inline int fullSetCount(PieceBase b) {
    switch (b) {
        case PieceBase::Pawn:   return 18;
        case PieceBase::Lance:  return 4;
        case PieceBase::Knight: return 4;
        case PieceBase::Silver: return 4;
        case PieceBase::Gold:   return 4;
        case PieceBase::Bishop: return 2;
        case PieceBase::Rook:   return 2;
        case PieceBase::King:   return 2;
    }
    return 0;
}

// True when some kind occurs more often (board + both hands) than a full set holds.
bool exceedsMaterial(const Position& pos);

// --- Moves ------------------------------------------------------------------

enum class MoveKind {
    Board = 0,
    Drop  = 1
};

struct Move {
    MoveKind  kind{MoveKind::Board};
    Square    from;                    // board moves only
    Square    to;
    bool      promote{false};          // board moves only
    PieceBase piece{PieceBase::Pawn};  // drops only

    static Move boardMove(Square from, Square to, bool promote = false) {
        Move m;
        m.kind = MoveKind::Board;
        m.from = from;
        m.to = to;
        m.promote = promote;
        return m;
    }

    static Move drop(PieceBase piece, Square to) {
        Move m;
        m.kind = MoveKind::Drop;
        m.piece = piece;
        m.to = to;
        return m;
    }

    bool isDrop() const { return kind == MoveKind::Drop; }

    bool operator==(const Move& o) const {
        if (kind != o.kind || to != o.to) return false;
        if (kind == MoveKind::Drop) return piece == o.piece;
        return from == o.from && promote == o.promote;
    }
    bool operator!=(const Move& o) const { return !(*this == o); }
};

// --- Helpers ----------------------------------------------------------------

inline std::string to_string(Side s) {
    switch (s) {
        case Side::Sente: return "Sente";
        case Side::Gote:  return "Gote";
    }
    return "Unknown";
}

inline std::string to_string(PieceBase b) {
    switch (b) {
        case PieceBase::Pawn:   return "Pawn";
        case PieceBase::Lance:  return "Lance";
        case PieceBase::Knight: return "Knight";
        case PieceBase::Silver: return "Silver";
        case PieceBase::Gold:   return "Gold";
        case PieceBase::Bishop: return "Bishop";
        case PieceBase::Rook:   return "Rook";
        case PieceBase::King:   return "King";
    }
    return "Unknown";
}

} // namespace shogi::review::domain
