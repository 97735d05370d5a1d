#pragma once

#include <QString>
#include <QtSql/QSqlDatabase>
#include <vector>

#include "domain/domain_model.hpp"
#include "app/IGameRepository.hpp"

namespace shogi::review::infra {

// Saved games in SQLite, table `games`.
class GameRepository : public shogi::review::app::IGameRepository {
public:
    // connectionName lets tests open several independent databases.
    explicit GameRepository(const QString& dbPath,
                            const QString& connectionName = QStringLiteral("games"));

    bool isOpen() const { return db_.isOpen(); }

    shogi::review::domain::GameId saveGame(const shogi::review::domain::GameRecord& game) override;

    std::vector<shogi::review::domain::GameRecord> loadAllGames() const override;

    bool removeGame(shogi::review::domain::GameId id) override;

private:
    void initSchema() const;

    QSqlDatabase db_;
};

} // namespace shogi::review::infra
