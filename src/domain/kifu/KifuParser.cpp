#include "domain/kifu/KifuParser.hpp"

#include <cctype>
#include <optional>
#include <string_view>

#include "domain/move_applicator.hpp"
#include "domain/sfen_codec.hpp"
#include "domain/timeline.hpp"

namespace shogi::review::domain::kifu {

namespace {

constexpr std::string_view kBom = "\xEF\xBB\xBF";
constexpr std::string_view kIdeographicSpace = "　";

// --------------------------- Text helpers ---------------------------------

inline bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

inline bool contains(std::string_view s, std::string_view needle) {
    return s.find(needle) != std::string_view::npos;
}

inline bool consume(std::string_view& s, std::string_view prefix) {
    if (!startsWith(s, prefix)) return false;
    s.remove_prefix(prefix.size());
    return true;
}

inline void skipSpaces(std::string_view& s) {
    while (!s.empty()) {
        if (s.front() == ' ' || s.front() == '\t') {
            s.remove_prefix(1);
            continue;
        }
        if (consume(s, kIdeographicSpace)) continue;
        break;
    }
}

inline std::string_view trim(std::string_view s) {
    skipSpaces(s);
    while (!s.empty()) {
        if (s.back() == ' ' || s.back() == '\t') {
            s.remove_suffix(1);
            continue;
        }
        if (s.size() >= kIdeographicSpace.size() &&
            s.substr(s.size() - kIdeographicSpace.size()) == kIdeographicSpace) {
            s.remove_suffix(kIdeographicSpace.size());
            continue;
        }
        break;
    }
    return s;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string_view rest(text);
    if (startsWith(rest, kBom)) rest.remove_prefix(kBom.size());

    size_t i = 0;
    while (i <= rest.size()) {
        size_t j = i;
        while (j < rest.size() && rest[j] != '\n' && rest[j] != '\r') ++j;
        lines.emplace_back(rest.substr(i, j - i));
        if (j >= rest.size()) break;
        if (rest[j] == '\r' && j + 1 < rest.size() && rest[j + 1] == '\n') ++j;
        i = j + 1;
    }
    return lines;
}

// ASCII, full-width or kanji numeral 1..9.
std::optional<int> consumeNumeral(std::string_view& s) {
    if (s.empty()) return std::nullopt;
    if (s.front() >= '1' && s.front() <= '9') {
        const int n = s.front() - '0';
        s.remove_prefix(1);
        return n;
    }

    static const std::string_view kFullWidth[] = {"１", "２", "３", "４", "５", "６", "７", "８", "９"};
    static const std::string_view kKanji[]     = {"一", "二", "三", "四", "五", "六", "七", "八", "九"};
    for (int k = 0; k < 9; ++k) {
        if (consume(s, kFullWidth[k]) || consume(s, kKanji[k])) return k + 1;
    }
    return std::nullopt;
}

std::optional<int> consumeAsciiNumber(std::string_view& s) {
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front()))) return std::nullopt;
    int n = 0;
    while (!s.empty() && std::isdigit(static_cast<unsigned char>(s.front()))) {
        if (n < 100000) n = n * 10 + (s.front() - '0');
        s.remove_prefix(1);
    }
    return n;
}

inline Square squareFromFileRank(int file, int rank) {
    return Square{kBoardSize - file, rank - 1};
}

std::string joinNotation(const std::string& header, const std::vector<std::string>& moves,
                         const std::string& terminal) {
    std::string out = header;
    if (moves.empty() && terminal.empty()) return out;
    out += " moves";
    for (const auto& m : moves) {
        out.push_back(' ');
        out += m;
    }
    if (!terminal.empty()) {
        out.push_back(' ');
        out += terminal;
    }
    return out;
}

KifuMovesResult failAt(KifuMovesResult& res, int line, std::string error) {
    res.ok = false;
    res.errorLine = line;
    res.error = "Line " + std::to_string(line) + ": " + std::move(error);
    return res;
}

// ------------------------------ CSA ---------------------------------------

struct CsaPiece {
    PieceBase base;
    bool promoted;
};

std::optional<CsaPiece> csaPiece(std::string_view code) {
    static const struct {
        std::string_view code;
        PieceBase base;
        bool promoted;
    } kCodes[] = {
        {"FU", PieceBase::Pawn, false},   {"KY", PieceBase::Lance, false},
        {"KE", PieceBase::Knight, false}, {"GI", PieceBase::Silver, false},
        {"KI", PieceBase::Gold, false},   {"KA", PieceBase::Bishop, false},
        {"HI", PieceBase::Rook, false},   {"OU", PieceBase::King, false},
        {"TO", PieceBase::Pawn, true},    {"NY", PieceBase::Lance, true},
        {"NK", PieceBase::Knight, true},  {"NG", PieceBase::Silver, true},
        {"UM", PieceBase::Bishop, true},  {"RY", PieceBase::Rook, true},
    };
    for (const auto& c : kCodes) {
        if (c.code == code) return CsaPiece{c.base, c.promoted};
    }
    return std::nullopt;
}

inline bool isCsaMove(std::string_view s) {
    if (s.size() < 7) return false;
    if (s[0] != '+' && s[0] != '-') return false;
    for (size_t i = 1; i <= 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return std::isupper(static_cast<unsigned char>(s[5])) && std::isupper(static_cast<unsigned char>(s[6]));
}

inline bool isUsiDrop(std::string_view s) {
    return s.size() == 4 && s[1] == '*';
}

// ------------------------------ KIF ---------------------------------------

struct KifPieceName {
    std::string_view name;
    PieceBase base;
    bool promoted;
};

// Two-character promoted names first so "成銀" is not read as a promotion suffix.
const KifPieceName kKifPieces[] = {
    {"成香", PieceBase::Lance, true},  {"成桂", PieceBase::Knight, true}, {"成銀", PieceBase::Silver, true},
    {"歩", PieceBase::Pawn, false},    {"香", PieceBase::Lance, false},   {"桂", PieceBase::Knight, false},
    {"銀", PieceBase::Silver, false},  {"金", PieceBase::Gold, false},    {"角", PieceBase::Bishop, false},
    {"飛", PieceBase::Rook, false},    {"玉", PieceBase::King, false},    {"王", PieceBase::King, false},
    {"と", PieceBase::Pawn, true},     {"杏", PieceBase::Lance, true},    {"圭", PieceBase::Knight, true},
    {"全", PieceBase::Silver, true},   {"馬", PieceBase::Bishop, true},   {"龍", PieceBase::Rook, true},
    {"竜", PieceBase::Rook, true},
};

// Relative-position qualifiers that may follow the piece name.
const std::string_view kKifQualifiers[] = {"右", "左", "上", "引", "寄", "直", "行", "入"};

struct KifTerminal {
    std::string_view word;
    std::string_view token; // "" = record ends without a USI terminal
};

const KifTerminal kKifTerminals[] = {
    {"投了", "resign"},   {"千日手", "draw"},   {"持将棋", "draw"},
    {"中断", ""},         {"詰み", ""},         {"切れ負け", ""},
    {"反則勝ち", ""},     {"反則負け", ""},     {"入玉勝ち", ""},
    {"不戦勝", ""},       {"不戦敗", ""},
};

struct KifMove {
    std::optional<Side> mark;
    bool same{false};
    Square to;
    PieceBase base{PieceBase::Pawn};
    bool promotedName{false}; // と, 成銀, 馬, ...
    bool promote{false};
    bool drop{false};
    Square from;
};

// Parses the move column of a KIF line (after the move number).
bool parseKifMove(std::string_view s, KifMove& out, std::string& err) {
    skipSpaces(s);
    if (consume(s, "▲") || consume(s, "☗")) out.mark = Side::Sente;
    else if (consume(s, "△") || consume(s, "☖")) out.mark = Side::Gote;

    if (consume(s, "同")) {
        out.same = true;
        skipSpaces(s);
    } else {
        const auto file = consumeNumeral(s);
        const auto rank = file ? consumeNumeral(s) : std::nullopt;
        if (!file || !rank) {
            err = "Missing destination square";
            return false;
        }
        out.to = squareFromFileRank(*file, *rank);
    }

    bool named = false;
    for (const auto& p : kKifPieces) {
        if (consume(s, p.name)) {
            out.base = p.base;
            out.promotedName = p.promoted;
            named = true;
            break;
        }
    }
    if (!named) {
        err = "Unknown piece name";
        return false;
    }

    for (bool more = true; more;) {
        more = false;
        for (auto q : kKifQualifiers) {
            if (consume(s, q)) more = true;
        }
    }

    if (consume(s, "不成")) {
        out.promote = false;
    } else if (consume(s, "成")) {
        out.promote = true;
    } else if (consume(s, "打")) {
        out.drop = true;
    }

    if (out.drop) {
        if (out.same) {
            err = "Drop cannot use 同";
            return false;
        }
        return true;
    }

    skipSpaces(s);
    if (!consume(s, "(") && !consume(s, "（")) {
        err = "Missing source square";
        return false;
    }
    const auto fromFile = consumeNumeral(s);
    const auto fromRank = fromFile ? consumeNumeral(s) : std::nullopt;
    if (!fromFile || !fromRank) {
        err = "Invalid source square";
        return false;
    }
    if (!consume(s, ")") && !consume(s, "）")) {
        err = "Unterminated source square";
        return false;
    }
    out.from = squareFromFileRank(*fromFile, *fromRank);
    return true;
}

} // namespace

KifuFormat detectKifuFormat(const std::string& text) {
    const auto lines = splitLines(text);
    for (const auto& raw : lines) {
        const std::string_view line = trim(raw);
        if (line.empty()) continue;

        if (startsWith(line, "position") || startsWith(line, "startpos") || startsWith(line, "sfen ")) {
            return KifuFormat::Usi;
        }
        if (isCsaMove(line) || startsWith(line, "V2") || startsWith(line, "PI") ||
            startsWith(line, "N+") || startsWith(line, "N-")) {
            return KifuFormat::Csa;
        }
        if (contains(line, "▲") || contains(line, "△") || contains(line, "手数----") ||
            startsWith(line, "手合割") || startsWith(line, "先手：") || startsWith(line, "後手：")) {
            return KifuFormat::Kif;
        }

        std::string_view rest = line;
        if (consumeAsciiNumber(rest)) {
            skipSpaces(rest);
            if (startsWith(rest, "同") || consumeNumeral(rest)) return KifuFormat::Kif;
        }
    }
    return KifuFormat::Unknown;
}

KifuMovesResult csaToUsiMoves(const std::string& text) {
    KifuMovesResult res;
    Position pos = sfen::startPosition();

    const auto lines = splitLines(text);
    for (size_t li = 0; li < lines.size(); ++li) {
        const int lineNo = static_cast<int>(li) + 1;

        std::string_view rest(lines[li]);
        while (!rest.empty()) {
            const size_t comma = rest.find(',');
            const std::string_view stmt = trim(rest.substr(0, comma));
            rest = (comma == std::string_view::npos) ? std::string_view{} : rest.substr(comma + 1);
            if (stmt.empty() || stmt.front() == '\'') continue;

            if (stmt.front() == '%') {
                if (stmt == "%TORYO") res.terminal = "resign";
                else if (stmt == "%SENNICHITE" || stmt == "%JISHOGI" || stmt == "%HIKIWAKE") res.terminal = "draw";
                res.ok = true;
                return res;
            }

            if (startsWith(stmt, "N+")) {
                res.headers["先手"] = std::string(stmt.substr(2));
                continue;
            }
            if (startsWith(stmt, "N-")) {
                res.headers["後手"] = std::string(stmt.substr(2));
                continue;
            }
            if (startsWith(stmt, "$EVENT:")) {
                res.headers["棋戦"] = std::string(stmt.substr(7));
                continue;
            }
            if (startsWith(stmt, "$START_TIME:")) {
                res.headers["開始日時"] = std::string(stmt.substr(12));
                continue;
            }

            if (startsWith(stmt, "PI")) {
                if (stmt.size() > 2) return failAt(res, lineNo, "Handicap initial positions are not supported");
                continue;
            }
            if (stmt.size() >= 2 && stmt[0] == 'P' && (std::isdigit(static_cast<unsigned char>(stmt[1])) ||
                                                       stmt[1] == '+' || stmt[1] == '-')) {
                return failAt(res, lineNo, "Custom initial positions are not supported");
            }

            Move move;
            if (isUsiDrop(stmt)) {
                const auto parsed = sfen::parseMove(stmt);
                if (!parsed.ok) return failAt(res, lineNo, parsed.error.message);
                move = parsed.move;
            } else if (isCsaMove(stmt)) {
                const Side side = (stmt[0] == '+') ? Side::Sente : Side::Gote;
                if (side != pos.sideToMove) {
                    return failAt(res, lineNo, "Move sign does not match the side to move");
                }

                const auto piece = csaPiece(stmt.substr(5, 2));
                if (!piece) return failAt(res, lineNo, "Unknown CSA piece code '" + std::string(stmt.substr(5, 2)) + "'");

                const int fromFile = stmt[1] - '0';
                const int fromRank = stmt[2] - '0';
                const int toFile = stmt[3] - '0';
                const int toRank = stmt[4] - '0';
                if (toFile < 1 || toRank < 1) return failAt(res, lineNo, "Invalid destination square");
                const Square to = squareFromFileRank(toFile, toRank);

                if (fromFile == 0 && fromRank == 0) {
                    if (piece->promoted || !isDroppable(piece->base)) {
                        return failAt(res, lineNo, "Invalid drop piece");
                    }
                    move = Move::drop(piece->base, to);
                } else {
                    if (fromFile < 1 || fromRank < 1) return failAt(res, lineNo, "Invalid source square");
                    const Square from = squareFromFileRank(fromFile, fromRank);
                    const auto& src = pos.pieceAt(from);
                    if (src && (src->base != piece->base || (src->promoted && !piece->promoted))) {
                        return failAt(res, lineNo, "Piece code '" + std::string(stmt.substr(5, 2)) +
                                                       "' does not match the piece on the source square");
                    }
                    const bool promote = piece->promoted && src && !src->promoted;
                    move = Move::boardMove(from, to, promote);
                }
            } else {
                continue;
            }

            const auto applied = applyMove(pos, move, ApplyPolicy::Trusting);
            if (!applied.ok) return failAt(res, lineNo, applied.message);
            pos = applied.position;
            res.moves.push_back(sfen::formatMove(move));
        }
    }

    res.ok = true;
    return res;
}

KifuMovesResult kifToUsiMoves(const std::string& text) {
    KifuMovesResult res;
    Position pos = sfen::startPosition();
    std::optional<Square> lastTo;
    bool inMoves = false;

    const auto lines = splitLines(text);
    for (size_t li = 0; li < lines.size(); ++li) {
        const int lineNo = static_cast<int>(li) + 1;
        std::string_view line = trim(lines[li]);
        if (line.empty()) continue;
        if (line.front() == '*' || line.front() == '#' || line.front() == '&') continue;
        if (startsWith(line, "まで") || startsWith(line, "変化")) break;
        if (contains(line, "手数----")) {
            inMoves = true;
            continue;
        }
        if (line.front() == '|') {
            return failAt(res, lineNo, "Board diagrams are not supported");
        }

        std::string_view body = line;
        const auto number = consumeAsciiNumber(body);
        skipSpaces(body);
        const bool marked = startsWith(body, "▲") || startsWith(body, "△") ||
                            startsWith(body, "☗") || startsWith(body, "☖");

        if (!number && !marked) {
            // Header line before the moves ("先手：...", "手合割：平手").
            const size_t colon = line.find("：");
            if (!inMoves && colon != std::string_view::npos) {
                const std::string key(trim(line.substr(0, colon)));
                const std::string value(trim(line.substr(colon + std::string_view("：").size())));
                if (key == "手合割" && value != "平手") {
                    return failAt(res, lineNo, "Handicap games are not supported");
                }
                res.headers[key] = value;
            }
            continue;
        }
        if (number && body.empty()) continue;
        inMoves = true;

        bool ended = false;
        for (const auto& t : kKifTerminals) {
            std::string_view probe = body;
            if (!consume(probe, "▲")) consume(probe, "△");
            if (startsWith(probe, t.word)) {
                res.terminal = std::string(t.token);
                ended = true;
                break;
            }
        }
        if (ended) break;

        KifMove km;
        std::string err;
        if (!parseKifMove(body, km, err)) return failAt(res, lineNo, err);

        if (km.mark && *km.mark != pos.sideToMove) {
            return failAt(res, lineNo, "Move mark does not match the side to move");
        }
        if (km.same) {
            if (!lastTo) return failAt(res, lineNo, "同 without a previous move");
            km.to = *lastTo;
        }

        if (!km.drop) {
            const auto& src = pos.pieceAt(km.from);
            if (src && (src->base != km.base || src->promoted != km.promotedName)) {
                return failAt(res, lineNo, "Piece name does not match the piece on the source square");
            }
        }

        const Move move = km.drop ? Move::drop(km.base, km.to)
                                  : Move::boardMove(km.from, km.to, km.promote);
        const auto applied = applyMove(pos, move, ApplyPolicy::Trusting);
        if (!applied.ok) return failAt(res, lineNo, applied.message);

        pos = applied.position;
        lastTo = km.to;
        res.moves.push_back(sfen::formatMove(move));
    }

    res.ok = true;
    return res;
}

KifuImportResult importKifu(const std::string& text) {
    KifuImportResult res;
    res.format = detectKifuFormat(text);

    if (res.format == KifuFormat::Unknown) {
        res.error = "Unrecognized kifu format (expected USI, CSA or KIF)";
        return res;
    }

    if (res.format == KifuFormat::Usi) {
        std::string_view body = trim(text);
        while (!body.empty() && (body.back() == '\n' || body.back() == '\r')) body.remove_suffix(1);
        const auto tl = buildTimeline(body);
        if (!tl.ok) {
            res.error = tl.error;
            res.errorLine = 1;
            return res;
        }
        res.notation = joinNotation(tl.timeline.header, tl.timeline.moves, tl.timeline.terminal.value_or(""));
        res.moveCount = tl.timeline.plyCount();
        res.ok = true;
        return res;
    }

    const KifuMovesResult conv = (res.format == KifuFormat::Csa) ? csaToUsiMoves(text) : kifToUsiMoves(text);
    res.headers = conv.headers;
    if (!conv.ok) {
        res.error = conv.error;
        res.errorLine = conv.errorLine;
        return res;
    }

    res.notation = joinNotation("startpos", conv.moves, conv.terminal);
    res.moveCount = static_cast<int>(conv.moves.size());
    res.ok = true;
    return res;
}

KifuSplitResult splitKifuGames(const std::string& text, int maxGames) {
    KifuSplitResult res;
    if (maxGames <= 0) {
        res.ok = true;
        return res;
    }

    std::vector<std::string> cur;
    auto flush = [&]() {
        while (!cur.empty() && trim(cur.back()).empty()) cur.pop_back();
        size_t b = 0;
        while (b < cur.size() && trim(cur[b]).empty()) ++b;
        if (b < cur.size()) {
            std::string game;
            for (size_t k = b; k < cur.size(); ++k) {
                if (!game.empty()) game.push_back('\n');
                game += cur[k];
            }
            res.games.push_back(std::move(game));
        }
        cur.clear();
    };
    auto full = [&]() { return static_cast<int>(res.games.size()) >= maxGames; };

    // A chunk only counts as a game once it holds at least one move line.
    auto hasMoves = [&]() {
        for (const auto& c : cur) {
            std::string_view probe = trim(c);
            if (probe.empty()) continue;
            if (consumeAsciiNumber(probe) || startsWith(probe, "▲") || startsWith(probe, "△") ||
                isCsaMove(probe) || startsWith(probe, "startpos") || startsWith(probe, "sfen ") ||
                startsWith(probe, "position")) {
                return true;
            }
        }
        return false;
    };

    for (const auto& raw : splitLines(text)) {
        const std::string_view line = trim(raw);

        if (line.empty()) {
            if (hasMoves()) {
                flush();
                if (full()) break;
            } else {
                cur.push_back(raw);
            }
            continue;
        }

        if ((startsWith(line, "開始日時") || startsWith(line, "終了日時")) && hasMoves()) {
            flush();
            if (full()) break;
        }

        cur.push_back(raw);

        if (startsWith(line, "まで") && contains(line, "手")) {
            flush();
            if (full()) break;
        }
    }
    if (!full() && hasMoves()) flush();

    if (res.games.empty()) {
        res.error = "No games found";
        return res;
    }

    res.ok = true;
    return res;
}

std::string to_string(KifuFormat f) {
    switch (f) {
        case KifuFormat::Unknown: return "unknown";
        case KifuFormat::Usi:     return "usi";
        case KifuFormat::Csa:     return "csa";
        case KifuFormat::Kif:     return "kif";
    }
    return "unknown";
}

} // namespace shogi::review::domain::kifu
