#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "domain/shogi_model.hpp"

namespace shogi::review::domain::sfen {

// Board part of the initial position.
inline constexpr const char* kStartposBoard = "lnsgkgsnl/1r5b1/ppppppppp/9/9/9/PPPPPPPPP/1B5R1/LNSGKGSNL";

enum class ParseErrorKind {
    None = 0,
    MalformedBoard,
    MalformedHands,
    MalformedPosition,
    UnsupportedPosition,
    ExcessMaterial,
    InvalidSquare,
    MalformedMove
};

struct ParseError {
    ParseErrorKind kind{ParseErrorKind::None};
    std::string    message;
};

struct BoardParseResult {
    bool       ok{false};
    ParseError error;
    Board      board;
};

struct HandsParseResult {
    bool       ok{false};
    ParseError error;
    Hands      hands;
};

struct MoveParseResult {
    bool       ok{false};
    ParseError error;
    Move       move;
};

struct PositionParseResult {
    bool       ok{false};
    ParseError error;

    Position                 position;
    int                      moveNumber{1};
    std::string              header; // "startpos" or "sfen <board> <side> <hands> <n>"
    std::vector<std::string> moves;  // raw move tokens, not validated
};

// Canonical initial position (Sente to move, empty hands).
Position startPosition();

// Letters ---------------------------------------------------------------------

char pieceLetter(PieceBase b);                        // 'P','L',... (uppercase)
std::optional<PieceBase> pieceFromLetter(char c);      // case-insensitive

// Squares: "7g" <-> {x=2, y=6} --------------------------------------------------

std::optional<Square> parseSquare(std::string_view token);
std::string formatSquare(const Square& sq);

// Board layout / hands / moves ---------------------------------------------------

BoardParseResult parseBoard(std::string_view layout);
std::string formatBoard(const Board& board);

// "-" or runs of [count]<Letter>; uppercase Sente, lowercase Gote.
HandsParseResult parseHands(std::string_view token);
std::string formatHands(const Hands& hands);

// "7g7f", "8h2b+", "P*5e".
MoveParseResult parseMove(std::string_view token);
std::string formatMove(const Move& move);

// Position commands ---------------------------------------------------------------

// Accepts:
//   [position] startpos [moves m1 m2 ...]
//   [position] sfen <board> [b|w] [hands] [movecount] [moves m1 m2 ...]
PositionParseResult parsePosition(std::string_view command);

// "<board> <b|w> <hands> <moveNumber>" (no "sfen" keyword).
std::string formatSfen(const Position& pos, int moveNumber = 1);

// "position <header>[ moves m1 m2 ...]"
std::string formatPositionCommand(const std::string& header, const std::vector<std::string>& moves);

std::string to_string(ParseErrorKind k);

} // namespace shogi::review::domain::sfen
