#include "domain/move_label.hpp"

#include "domain/sfen_codec.hpp"

namespace shogi::review::domain {

namespace {

const char* const kFullWidthDigits[] = {"", "１", "２", "３", "４", "５", "６", "７", "８", "９"};
const char* const kKanjiDigits[]     = {"", "一", "二", "三", "四", "五", "六", "七", "八", "九"};

// Board coordinates back to the printed file / rank numbers.
inline int fileOf(const Square& sq) { return kBoardSize - sq.x; }
inline int rankOf(const Square& sq) { return sq.y + 1; }

} // namespace

std::string pieceKanji(PieceBase base, bool promoted) {
    if (promoted) {
        switch (base) {
            case PieceBase::Pawn:   return "と";
            case PieceBase::Lance:  return "成香";
            case PieceBase::Knight: return "成桂";
            case PieceBase::Silver: return "成銀";
            case PieceBase::Bishop: return "馬";
            case PieceBase::Rook:   return "龍";
            default: break;
        }
    }
    switch (base) {
        case PieceBase::Pawn:   return "歩";
        case PieceBase::Lance:  return "香";
        case PieceBase::Knight: return "桂";
        case PieceBase::Silver: return "銀";
        case PieceBase::Gold:   return "金";
        case PieceBase::Bishop: return "角";
        case PieceBase::Rook:   return "飛";
        case PieceBase::King:   return "玉";
    }
    return "";
}

std::string fullWidthFile(int file) {
    if (file < 1 || file > 9) return "";
    return kFullWidthDigits[file];
}

std::string kanjiRank(int rank) {
    if (rank < 1 || rank > 9) return "";
    return kKanjiDigits[rank];
}

std::string formatMoveLabel(const Position& before, const Move& move, const std::optional<Square>& previousTo) {
    std::string out = (before.sideToMove == Side::Sente) ? "▲" : "△";

    if (move.isDrop()) {
        out += fullWidthFile(fileOf(move.to));
        out += kanjiRank(rankOf(move.to));
        out += pieceKanji(move.piece, false);
        out += "打";
        return out;
    }

    if (!onBoard(move.from)) return {};
    const auto& src = before.pieceAt(move.from);
    if (!src) return {};

    if (previousTo && *previousTo == move.to) {
        out += "同　";
    } else {
        out += fullWidthFile(fileOf(move.to));
        out += kanjiRank(rankOf(move.to));
    }

    if (move.promote && !src->promoted) {
        out += pieceKanji(src->base, false);
        out += "成";
    } else {
        out += pieceKanji(src->base, src->promoted);
    }
    return out;
}

std::vector<std::string> formatMoveLabels(const std::vector<Position>& positions,
                                          const std::vector<std::string>& moves) {
    std::vector<std::string> labels;
    labels.reserve(moves.size());

    std::optional<Square> previousTo;
    for (std::size_t i = 0; i < moves.size() && i < positions.size(); ++i) {
        const auto parsed = sfen::parseMove(moves[i]);
        if (!parsed.ok) {
            labels.push_back(moves[i]);
            previousTo.reset();
            continue;
        }
        labels.push_back(formatMoveLabel(positions[i], parsed.move, previousTo));
        previousTo = parsed.move.to;
    }
    return labels;
}

} // namespace shogi::review::domain
