#include "infra/GameRepository.hpp"

#include <QVariant>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>
#include <QDebug>
#include <chrono>

namespace shogi::review::infra {

using shogi::review::domain::Clock;
using shogi::review::domain::GameId;
using shogi::review::domain::GameRecord;
using shogi::review::domain::TimePoint;

namespace {

qint64 toUnixMs(TimePoint tp) {
    return static_cast<qint64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

TimePoint fromUnixMs(qint64 ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

} // namespace

GameRepository::GameRepository(const QString& dbPath, const QString& connectionName) {
    if (QSqlDatabase::contains(connectionName)) {
        db_ = QSqlDatabase::database(connectionName);
    } else {
        db_ = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connectionName);
        db_.setDatabaseName(dbPath);
    }

    if (!db_.open()) {
        qWarning() << "Failed to open games DB:" << dbPath << db_.lastError().text();
        return;
    }

    initSchema();
}

void GameRepository::initSchema() const {
    if (!db_.isOpen()) {
        return;
    }

    QSqlQuery q(db_);
    const bool ok = q.exec(
        "CREATE TABLE IF NOT EXISTS games ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "title TEXT,"
        "kifu_text TEXT NOT NULL,"
        "kifu_format TEXT NOT NULL CHECK (kifu_format IN ('kif','csa','usi')),"
        "notation TEXT NOT NULL,"
        "move_count INTEGER,"
        "created_at INTEGER)");
    if (!ok) {
        qWarning() << "Failed to create games table:" << q.lastError().text();
        return;
    }

    if (!q.exec("CREATE INDEX IF NOT EXISTS games_created_at ON games (created_at)")) {
        qWarning() << "Failed to create games index:" << q.lastError().text();
    }
}

GameId GameRepository::saveGame(const GameRecord& game) {
    if (!db_.isOpen()) {
        return 0;
    }

    const TimePoint created = (game.createdAt == TimePoint{}) ? Clock::now() : game.createdAt;

    QSqlQuery q(db_);
    if (game.id > 0) {
        q.prepare(
            "INSERT OR REPLACE INTO games "
            "(id, title, kifu_text, kifu_format, notation, move_count, created_at)"
            " VALUES (?, ?, ?, ?, ?, ?, ?)");
        q.addBindValue(QVariant(static_cast<qint64>(game.id)));
    } else {
        q.prepare(
            "INSERT INTO games "
            "(title, kifu_text, kifu_format, notation, move_count, created_at)"
            " VALUES (?, ?, ?, ?, ?, ?)");
    }

    q.addBindValue(QString::fromStdString(game.title));
    q.addBindValue(QString::fromStdString(game.kifuText));
    q.addBindValue(QString::fromStdString(shogi::review::domain::to_string(game.format)));
    q.addBindValue(QString::fromStdString(game.notation));
    q.addBindValue(game.moveCount);
    q.addBindValue(QVariant(toUnixMs(created)));

    if (!q.exec()) {
        qWarning() << "Failed to save game:" << q.lastError().text();
        return 0;
    }

    if (game.id > 0) {
        return game.id;
    }
    return static_cast<GameId>(q.lastInsertId().toLongLong());
}

std::vector<GameRecord> GameRepository::loadAllGames() const {
    std::vector<GameRecord> out;

    if (!db_.isOpen()) {
        return out;
    }

    QSqlQuery q(db_);
    q.prepare(
        "SELECT id, title, kifu_text, kifu_format, notation, move_count, created_at"
        " FROM games ORDER BY created_at DESC, id DESC");

    if (!q.exec()) {
        qWarning() << "Failed to load games:" << q.lastError().text();
        return out;
    }

    while (q.next()) {
        GameRecord g;
        g.id        = static_cast<GameId>(q.value(0).toLongLong());
        g.title     = q.value(1).toString().toStdString();
        g.kifuText  = q.value(2).toString().toStdString();
        g.format    = shogi::review::domain::kifuSourceFromString(q.value(3).toString().toStdString());
        g.notation  = q.value(4).toString().toStdString();
        g.moveCount = q.value(5).toInt();
        g.createdAt = fromUnixMs(q.value(6).toLongLong());
        out.push_back(std::move(g));
    }

    return out;
}

bool GameRepository::removeGame(GameId id) {
    if (!db_.isOpen()) {
        return false;
    }

    QSqlQuery q(db_);
    q.prepare("DELETE FROM games WHERE id = ?");
    q.addBindValue(QVariant(static_cast<qint64>(id)));

    if (!q.exec()) {
        qWarning() << "Failed to remove game" << id << ":" << q.lastError().text();
        return false;
    }
    return q.numRowsAffected() > 0;
}

} // namespace shogi::review::infra
