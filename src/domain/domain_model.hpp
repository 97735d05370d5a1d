#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace shogi::review::domain {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using GameId    = std::int64_t;

// --- Saved games ------------------------------------------------------------

enum class KifuSource {
    Usi = 0,
    Csa = 1,
    Kif = 2
};

inline std::string to_string(KifuSource s) {
    switch (s) {
        case KifuSource::Usi: return "usi";
        case KifuSource::Csa: return "csa";
        case KifuSource::Kif: return "kif";
    }
    return "usi";
}

inline KifuSource kifuSourceFromString(const std::string& s) {
    if (s == "csa") return KifuSource::Csa;
    if (s == "kif") return KifuSource::Kif;
    return KifuSource::Usi;
}

struct GameRecord {
    GameId      id{0};          // 0 until stored
    std::string title;
    std::string kifuText;       // text as imported
    KifuSource  format{KifuSource::Usi};
    std::string notation;       // "startpos moves ..." replayed by the viewer
    int         moveCount{0};
    TimePoint   createdAt{};
};

// --- Viewer settings --------------------------------------------------------

struct ViewerSettings {
    std::string databasePath{"games.sqlite"};
    std::string startNotation{"startpos"};
    bool        flipBoard{false};
    bool        showHints{true};
    bool        showHanging{false};
    int         maxImportGames{64};
};

} // namespace shogi::review::domain
