#include "infra/ViewerConfigRepository.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>

namespace shogi::review::infra {

using shogi::review::domain::ViewerSettings;

namespace {

constexpr int kMaxImportGamesLimit = 1000;

QString readString(const QJsonObject& o, const char* key, const std::string& fallback) {
    const auto v = o.value(QLatin1String(key));
    if (v.isUndefined()) {
        return QString::fromStdString(fallback);
    }
    if (!v.isString() || v.toString().trimmed().isEmpty()) {
        qWarning() << "Invalid viewer config value for" << key << ", using default";
        return QString::fromStdString(fallback);
    }
    return v.toString();
}

bool readBool(const QJsonObject& o, const char* key, bool fallback) {
    const auto v = o.value(QLatin1String(key));
    if (v.isUndefined()) {
        return fallback;
    }
    if (!v.isBool()) {
        qWarning() << "Invalid viewer config value for" << key << ", using default";
        return fallback;
    }
    return v.toBool();
}

} // namespace

ViewerConfigRepository::ViewerConfigRepository(std::string path)
    : path_(std::move(path)) {
}

ViewerSettings ViewerConfigRepository::load() const {
    const ViewerSettings defaults;

    QFile file(QString::fromStdString(path_));
    if (!file.exists()) {
        qWarning() << "Viewer config not found, using defaults:" << QString::fromStdString(path_);
        return defaults;
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Failed to open viewer config, using defaults:" << QString::fromStdString(path_);
        return defaults;
    }

    QJsonParseError parseErr{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Invalid viewer config, using defaults:" << parseErr.errorString();
        return defaults;
    }

    const auto o = doc.object();

    ViewerSettings s;
    s.databasePath  = readString(o, "database_path", defaults.databasePath).toStdString();
    s.startNotation = readString(o, "start_notation", defaults.startNotation).toStdString();
    s.flipBoard     = readBool(o, "flip_board", defaults.flipBoard);
    s.showHints     = readBool(o, "show_hints", defaults.showHints);
    s.showHanging   = readBool(o, "show_hanging", defaults.showHanging);

    const auto maxGames = o.value(QStringLiteral("max_import_games"));
    if (!maxGames.isUndefined()) {
        const int n = maxGames.toInt(-1);
        if (!maxGames.isDouble() || n < 1 || n > kMaxImportGamesLimit) {
            qWarning() << "Invalid viewer config value for max_import_games, using default";
        } else {
            s.maxImportGames = n;
        }
    }

    return s;
}

bool ViewerConfigRepository::save(const ViewerSettings& s) const {
    QJsonObject root;
    root.insert(QStringLiteral("database_path"),    QString::fromStdString(s.databasePath));
    root.insert(QStringLiteral("start_notation"),   QString::fromStdString(s.startNotation));
    root.insert(QStringLiteral("flip_board"),       s.flipBoard);
    root.insert(QStringLiteral("show_hints"),       s.showHints);
    root.insert(QStringLiteral("show_hanging"),     s.showHanging);
    root.insert(QStringLiteral("max_import_games"), s.maxImportGames);

    QFile file(QString::fromStdString(path_));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "Failed to write viewer config:" << QString::fromStdString(path_);
        return false;
    }

    QJsonDocument doc(root);
    file.write(doc.toJson(QJsonDocument::Indented));
    file.close();
    return true;
}

} // namespace shogi::review::infra
