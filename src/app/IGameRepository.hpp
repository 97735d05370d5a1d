#pragma once

#include <vector>

#include "domain/domain_model.hpp"

namespace shogi::review::app {

// Port/interface for the saved games store.
// Implementations live in infra (SQLite via QtSql).
class IGameRepository {
public:
    virtual ~IGameRepository() = default;

    // Returns the stored id, or 0 when the game could not be saved.
    virtual shogi::review::domain::GameId saveGame(const shogi::review::domain::GameRecord& game) = 0;

    // Newest first.
    virtual std::vector<shogi::review::domain::GameRecord> loadAllGames() const = 0;

    virtual bool removeGame(shogi::review::domain::GameId id) = 0;
};

} // namespace shogi::review::app
