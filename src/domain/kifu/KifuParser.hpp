#pragma once

#include <map>
#include <string>
#include <vector>

namespace shogi::review::domain::kifu {

enum class KifuFormat {
    Unknown = 0,
    Usi,  // "startpos moves ...", "sfen ...", "position ..."
    Csa,  // "+7776FU" lines
    Kif   // long form "▲７六歩(77)" / numbered move lines
};

struct KifuMovesResult {
    bool ok{false};
    std::string error;
    int errorLine{0}; // 1-based line of the text, 0 when not line related

    std::vector<std::string> moves;           // USI tokens
    std::map<std::string, std::string> headers; // "先手", "後手", "開始日時", "棋戦", ...
    std::string terminal;                     // "resign" when the record ends with a resignation
};

struct KifuImportResult {
    bool ok{false};
    std::string error;
    int errorLine{0};

    KifuFormat format{KifuFormat::Unknown};
    std::string notation; // "startpos moves ..." (or the normalized USI input)
    int moveCount{0};
    std::map<std::string, std::string> headers;
};

struct KifuSplitResult {
    bool ok{false};
    std::string error;
    std::vector<std::string> games;
};

KifuFormat detectKifuFormat(const std::string& text);

// CSA move lines resolved against a replayed position: a promoted piece code
// only counts as promotion when the source piece is not promoted yet, and a
// "00" source square is a drop. Non-move lines are skipped.
KifuMovesResult csaToUsiMoves(const std::string& text);

// KIF long form: "▲７六歩(77)", "△同　歩(76)", "▲３三歩打", "成" / "不成" suffixes,
// full-width and kanji numerals. Stops at "まで…手で" lines; time columns and
// "*" comments are ignored.
KifuMovesResult kifToUsiMoves(const std::string& text);

// Detects the format and converts to a notation string the timeline accepts.
KifuImportResult importKifu(const std::string& text);

// Splits text holding several games: blank-line runs, 開始日時 headers and
// "まで…手" terminators separate games. At most maxGames are returned.
KifuSplitResult splitKifuGames(const std::string& text, int maxGames = 64);

std::string to_string(KifuFormat f);

} // namespace shogi::review::domain::kifu
