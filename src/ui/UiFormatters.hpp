#pragma once

#include <QString>

#include "domain/domain_model.hpp"

namespace shogi::review::ui::fmt {

// Convert domain timepoint to milliseconds since Unix epoch.
qint64 toUnixMs(shogi::review::domain::TimePoint tp);

// Format a domain timepoint as local ISO datetime (Qt::ISODate).
QString formatLocalIso(shogi::review::domain::TimePoint tp);

QString formatKifuSource(shogi::review::domain::KifuSource source);

// Stored title, or "Untitled (N moves)".
QString formatGameTitle(const shogi::review::domain::GameRecord& game);

} // namespace shogi::review::ui::fmt
