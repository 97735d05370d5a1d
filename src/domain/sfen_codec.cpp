#include "domain/sfen_codec.hpp"

#include <cctype>
#include <sstream>

namespace shogi::review::domain::sfen {

namespace {

inline bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

inline bool isUpper(char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

inline char toLower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (toLower(a[i]) != toLower(b[i])) return false;
    }
    return true;
}

// File digit '9'..'1' -> x 0..8.
inline std::optional<int> fileToX(char c) {
    if (c < '1' || c > '9') return std::nullopt;
    return 9 - (c - '0');
}

// Rank letter 'a'..'i' -> y 0..8.
inline std::optional<int> rankToY(char c) {
    if (c < 'a' || c > 'i') return std::nullopt;
    return c - 'a';
}

inline char xToFile(int x) { return static_cast<char>('0' + (9 - x)); }
inline char yToRank(int y) { return static_cast<char>('a' + y); }

std::vector<std::string_view> splitWhitespace(std::string_view text) {
    std::vector<std::string_view> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        const size_t b = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i > b) tokens.push_back(text.substr(b, i - b));
    }
    return tokens;
}

ParseError makeError(ParseErrorKind kind, std::string message) {
    ParseError e;
    e.kind = kind;
    e.message = std::move(message);
    return e;
}

// Expands one row of the layout into exactly 9 cells.
bool parseRow(std::string_view row, int y, Board& board, std::string& err) {
    int x = 0;
    for (size_t i = 0; i < row.size(); ++i) {
        const char c = row[i];
        if (isDigit(c)) {
            const int run = c - '0';
            if (run < 1) {
                err = "Zero-length empty run in row " + std::to_string(y + 1);
                return false;
            }
            x += run;
            if (x > kBoardSize) {
                err = "Row " + std::to_string(y + 1) + " is wider than 9 cells";
                return false;
            }
            continue;
        }

        bool promoted = false;
        char letter = c;
        if (c == '+') {
            if (i + 1 >= row.size()) {
                err = "Dangling '+' in row " + std::to_string(y + 1);
                return false;
            }
            promoted = true;
            letter = row[++i];
        }

        const auto base = pieceFromLetter(letter);
        if (!base) {
            err = std::string("Unknown piece letter '") + letter + "' in row " + std::to_string(y + 1);
            return false;
        }
        if (promoted && !isPromotable(*base)) {
            err = std::string("Piece '") + letter + "' cannot be promoted";
            return false;
        }
        if (x >= kBoardSize) {
            err = "Row " + std::to_string(y + 1) + " is wider than 9 cells";
            return false;
        }

        const Side owner = isUpper(letter) ? Side::Sente : Side::Gote;
        board.place(Square{x, y}, Piece::make(*base, owner, promoted));
        ++x;
    }

    if (x != kBoardSize) {
        err = "Row " + std::to_string(y + 1) + " expands to " + std::to_string(x) + " cells instead of 9";
        return false;
    }
    return true;
}

char letterFor(const Piece& p) {
    const char c = pieceLetter(p.base);
    return (p.owner == Side::Sente) ? c : toLower(c);
}

} // namespace

Position startPosition() {
    Position p;
    static const PieceBase backRank[kBoardSize] = {
        PieceBase::Lance, PieceBase::Knight, PieceBase::Silver, PieceBase::Gold, PieceBase::King,
        PieceBase::Gold, PieceBase::Silver, PieceBase::Knight, PieceBase::Lance
    };

    // Gote on top (ranks a..c), Sente at the bottom (ranks g..i).
    for (int x = 0; x < kBoardSize; ++x) {
        p.board.place(Square{x, 0}, Piece::make(backRank[x], Side::Gote));
        p.board.place(Square{x, 2}, Piece::make(PieceBase::Pawn, Side::Gote));
        p.board.place(Square{x, 6}, Piece::make(PieceBase::Pawn, Side::Sente));
        p.board.place(Square{x, 8}, Piece::make(backRank[x], Side::Sente));
    }
    p.board.place(Square{1, 1}, Piece::make(PieceBase::Rook, Side::Gote));
    p.board.place(Square{7, 1}, Piece::make(PieceBase::Bishop, Side::Gote));
    p.board.place(Square{1, 7}, Piece::make(PieceBase::Bishop, Side::Sente));
    p.board.place(Square{7, 7}, Piece::make(PieceBase::Rook, Side::Sente));

    p.sideToMove = Side::Sente;
    return p;
}

char pieceLetter(PieceBase b) {
    switch (b) {
        case PieceBase::Pawn:   return 'P';
        case PieceBase::Lance:  return 'L';
        case PieceBase::Knight: return 'N';
        case PieceBase::Silver: return 'S';
        case PieceBase::Gold:   return 'G';
        case PieceBase::Bishop: return 'B';
        case PieceBase::Rook:   return 'R';
        case PieceBase::King:   return 'K';
    }
    return '?';
}

std::optional<PieceBase> pieceFromLetter(char c) {
    switch (toLower(c)) {
        case 'p': return PieceBase::Pawn;
        case 'l': return PieceBase::Lance;
        case 'n': return PieceBase::Knight;
        case 's': return PieceBase::Silver;
        case 'g': return PieceBase::Gold;
        case 'b': return PieceBase::Bishop;
        case 'r': return PieceBase::Rook;
        case 'k': return PieceBase::King;
        default:  return std::nullopt;
    }
}

std::optional<Square> parseSquare(std::string_view token) {
    if (token.size() != 2) return std::nullopt;
    const auto x = fileToX(token[0]);
    const auto y = rankToY(token[1]);
    if (!x || !y) return std::nullopt;
    return Square{*x, *y};
}

std::string formatSquare(const Square& sq) {
    std::string s;
    s.push_back(xToFile(sq.x));
    s.push_back(yToRank(sq.y));
    return s;
}

BoardParseResult parseBoard(std::string_view layout) {
    BoardParseResult res;

    std::vector<std::string_view> rows;
    size_t start = 0;
    while (true) {
        const size_t slash = layout.find('/', start);
        if (slash == std::string_view::npos) {
            rows.push_back(layout.substr(start));
            break;
        }
        rows.push_back(layout.substr(start, slash - start));
        start = slash + 1;
    }

    if (rows.size() != static_cast<size_t>(kBoardSize)) {
        res.error = makeError(ParseErrorKind::MalformedBoard,
                              "Board layout has " + std::to_string(rows.size()) + " rows instead of 9");
        return res;
    }

    Board board;
    for (int y = 0; y < kBoardSize; ++y) {
        std::string err;
        if (!parseRow(rows[static_cast<size_t>(y)], y, board, err)) {
            res.error = makeError(ParseErrorKind::MalformedBoard, err);
            return res;
        }
    }

    res.ok = true;
    res.board = board;
    return res;
}

std::string formatBoard(const Board& board) {
    std::string out;
    out.reserve(96);
    for (int y = 0; y < kBoardSize; ++y) {
        int emptyRun = 0;
        for (int x = 0; x < kBoardSize; ++x) {
            const auto& cell = board.at(Square{x, y});
            if (!cell) {
                ++emptyRun;
                continue;
            }
            if (emptyRun > 0) {
                out.push_back(static_cast<char>('0' + emptyRun));
                emptyRun = 0;
            }
            if (cell->promoted) out.push_back('+');
            out.push_back(letterFor(*cell));
        }
        if (emptyRun > 0) {
            out.push_back(static_cast<char>('0' + emptyRun));
        }
        if (y != kBoardSize - 1) out.push_back('/');
    }
    return out;
}

HandsParseResult parseHands(std::string_view token) {
    HandsParseResult res;

    if (token == "-") {
        res.ok = true;
        return res;
    }
    if (token.empty()) {
        res.error = makeError(ParseErrorKind::MalformedHands, "Empty hands token");
        return res;
    }

    Hands hands;
    size_t i = 0;
    while (i < token.size()) {
        std::uint32_t count = 1;
        if (isDigit(token[i])) {
            std::uint32_t n = 0;
            size_t digits = 0;
            while (i < token.size() && isDigit(token[i])) {
                n = n * 10 + static_cast<std::uint32_t>(token[i] - '0');
                ++i;
                if (++digits > 2) {
                    res.error = makeError(ParseErrorKind::MalformedHands, "Hand count too large");
                    return res;
                }
            }
            if (n == 0) {
                res.error = makeError(ParseErrorKind::MalformedHands, "Hand count must be positive");
                return res;
            }
            count = n;
        }

        if (i >= token.size()) {
            res.error = makeError(ParseErrorKind::MalformedHands, "Hand count without piece letter");
            return res;
        }

        const char letter = token[i++];
        const auto base = pieceFromLetter(letter);
        if (!base || !isDroppable(*base)) {
            res.error = makeError(ParseErrorKind::MalformedHands,
                                  std::string("Invalid hand piece '") + letter + "'");
            return res;
        }

        hands.add(isUpper(letter) ? Side::Sente : Side::Gote, *base, count);
    }

    res.ok = true;
    res.hands = hands;
    return res;
}

std::string formatHands(const Hands& hands) {
    std::string out;
    for (Side side : {Side::Sente, Side::Gote}) {
        for (PieceBase b : kHandOrder) {
            const auto n = hands.count(side, b);
            if (n == 0) continue;
            if (n > 1) out += std::to_string(n);
            const char c = pieceLetter(b);
            out.push_back(side == Side::Sente ? c : toLower(c));
        }
    }
    if (out.empty()) out = "-";
    return out;
}

MoveParseResult parseMove(std::string_view token) {
    MoveParseResult res;

    // Drop: "P*5e"
    if (token.size() >= 2 && token[1] == '*') {
        if (token.size() != 4) {
            res.error = makeError(ParseErrorKind::MalformedMove,
                                  "Malformed drop '" + std::string(token) + "'");
            return res;
        }
        const auto base = pieceFromLetter(token[0]);
        if (!base || !isDroppable(*base)) {
            res.error = makeError(ParseErrorKind::MalformedMove,
                                  "Invalid drop piece in '" + std::string(token) + "'");
            return res;
        }
        const auto to = parseSquare(token.substr(2, 2));
        if (!to) {
            res.error = makeError(ParseErrorKind::InvalidSquare,
                                  "Invalid square in '" + std::string(token) + "'");
            return res;
        }
        res.ok = true;
        res.move = Move::drop(*base, *to);
        return res;
    }

    // Board move: "7g7f" or "8h2b+"
    const bool promote = token.size() == 5 && token[4] == '+';
    if (token.size() != 4 && !promote) {
        res.error = makeError(ParseErrorKind::MalformedMove,
                              "Malformed move '" + std::string(token) + "'");
        return res;
    }

    const auto from = parseSquare(token.substr(0, 2));
    const auto to   = parseSquare(token.substr(2, 2));
    if (!from || !to) {
        res.error = makeError(ParseErrorKind::InvalidSquare,
                              "Invalid square in '" + std::string(token) + "'");
        return res;
    }

    res.ok = true;
    res.move = Move::boardMove(*from, *to, promote);
    return res;
}

std::string formatMove(const Move& move) {
    std::string out;
    if (move.isDrop()) {
        out.push_back(pieceLetter(move.piece));
        out.push_back('*');
        out += formatSquare(move.to);
        return out;
    }
    out += formatSquare(move.from);
    out += formatSquare(move.to);
    if (move.promote) out.push_back('+');
    return out;
}

PositionParseResult parsePosition(std::string_view command) {
    PositionParseResult res;

    const auto tokens = splitWhitespace(command);
    size_t i = 0;
    if (i < tokens.size() && iequals(tokens[i], "position")) ++i;

    if (i >= tokens.size()) {
        res.error = makeError(ParseErrorKind::UnsupportedPosition, "Empty position command");
        return res;
    }

    // Header tokens run up to "moves" (or the end).
    size_t movesAt = tokens.size();
    for (size_t k = i; k < tokens.size(); ++k) {
        if (iequals(tokens[k], "moves")) {
            movesAt = k;
            break;
        }
    }

    const std::string_view head = tokens[i];
    if (iequals(head, "startpos")) {
        if (movesAt != i + 1) {
            res.error = makeError(ParseErrorKind::MalformedPosition,
                                  "Unexpected token after startpos: '" + std::string(tokens[i + 1]) + "'");
            return res;
        }
        res.position = startPosition();
        res.header = "startpos";
    } else if (iequals(head, "sfen")) {
        const size_t fieldCount = movesAt - (i + 1);
        if (fieldCount < 1 || fieldCount > 4) {
            res.error = makeError(ParseErrorKind::MalformedPosition,
                                  "sfen header needs 1 to 4 fields, got " + std::to_string(fieldCount));
            return res;
        }

        const auto board = parseBoard(tokens[i + 1]);
        if (!board.ok) {
            res.error = board.error;
            return res;
        }
        res.position.board = board.board;

        res.position.sideToMove = Side::Sente;
        if (fieldCount >= 2) {
            const std::string_view side = tokens[i + 2];
            if (side == "b") {
                res.position.sideToMove = Side::Sente;
            } else if (side == "w") {
                res.position.sideToMove = Side::Gote;
            } else {
                res.error = makeError(ParseErrorKind::MalformedPosition,
                                      "Invalid side to move '" + std::string(side) + "'");
                return res;
            }
        }

        if (fieldCount >= 3) {
            const auto hands = parseHands(tokens[i + 3]);
            if (!hands.ok) {
                res.error = hands.error;
                return res;
            }
            res.position.hands = hands.hands;
        }

        if (fieldCount >= 4) {
            const std::string_view n = tokens[i + 4];
            int value = 0;
            for (char c : n) {
                if (!isDigit(c) || value > 100000) {
                    res.error = makeError(ParseErrorKind::MalformedPosition,
                                          "Invalid move count '" + std::string(n) + "'");
                    return res;
                }
                value = value * 10 + (c - '0');
            }
            res.moveNumber = value;
        }

        if (exceedsMaterial(res.position)) {
            res.error = makeError(ParseErrorKind::ExcessMaterial,
                                  "Position holds more pieces than a full set");
            return res;
        }

        res.header = "sfen " + formatSfen(res.position, res.moveNumber);
    } else {
        res.error = makeError(ParseErrorKind::UnsupportedPosition,
                              "Unsupported position header '" + std::string(head) + "'");
        return res;
    }

    for (size_t k = movesAt + 1; k < tokens.size(); ++k) {
        res.moves.emplace_back(tokens[k]);
    }

    res.ok = true;
    return res;
}

std::string formatSfen(const Position& pos, int moveNumber) {
    std::ostringstream out;
    out << formatBoard(pos.board) << ' ';
    out << ((pos.sideToMove == Side::Sente) ? 'b' : 'w') << ' ';
    out << formatHands(pos.hands) << ' ';
    out << moveNumber;
    return out.str();
}

std::string formatPositionCommand(const std::string& header, const std::vector<std::string>& moves) {
    std::string out = "position " + header;
    if (!moves.empty()) {
        out += " moves";
        for (const auto& m : moves) {
            out.push_back(' ');
            out += m;
        }
    }
    return out;
}

std::string to_string(ParseErrorKind k) {
    switch (k) {
        case ParseErrorKind::None:                return "None";
        case ParseErrorKind::MalformedBoard:      return "MalformedBoard";
        case ParseErrorKind::MalformedHands:      return "MalformedHands";
        case ParseErrorKind::MalformedPosition:   return "MalformedPosition";
        case ParseErrorKind::UnsupportedPosition: return "UnsupportedPosition";
        case ParseErrorKind::ExcessMaterial:      return "ExcessMaterial";
        case ParseErrorKind::InvalidSquare:       return "InvalidSquare";
        case ParseErrorKind::MalformedMove:       return "MalformedMove";
    }
    return "Unknown";
}

} // namespace shogi::review::domain::sfen
