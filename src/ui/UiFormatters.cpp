#include "ui/UiFormatters.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QTimeZone>
#include <chrono>

namespace shogi::review::ui::fmt {

qint64 toUnixMs(shogi::review::domain::TimePoint tp) {
    return static_cast<qint64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch())
            .count());
}

QString formatLocalIso(shogi::review::domain::TimePoint tp) {
    const auto ms = toUnixMs(tp);
    const QDateTime dt =
        QDateTime::fromMSecsSinceEpoch(ms, QTimeZone::utc());
    return dt.toLocalTime().toString(Qt::ISODate);
}

QString formatKifuSource(shogi::review::domain::KifuSource source) {
    return QString::fromStdString(shogi::review::domain::to_string(source)).toUpper();
}

QString formatGameTitle(const shogi::review::domain::GameRecord& game) {
    if (!game.title.empty()) {
        return QString::fromStdString(game.title);
    }
    return QCoreApplication::translate("GamesModel", "Untitled (%1 moves)").arg(game.moveCount);
}

} // namespace shogi::review::ui::fmt
