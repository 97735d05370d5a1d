#pragma once

#include <QAbstractTableModel>
#include <optional>
#include <vector>

#include "domain/domain_model.hpp"

namespace shogi::review::ui {

class GamesModel : public QAbstractTableModel {
    Q_OBJECT
public:
    explicit GamesModel(QObject* parent = nullptr);

    void setGames(const std::vector<shogi::review::domain::GameRecord>& games);
    // New games go to the top (the list is newest first).
    void upsertGame(const shogi::review::domain::GameRecord& game);
    void removeGame(shogi::review::domain::GameId id);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    int columnCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;

    std::optional<shogi::review::domain::GameRecord> gameAtRow(int row) const;

private:
    enum Column {
        ColTitle = 0,
        ColFormat,
        ColMoves,
        ColCreated,
        ColumnCount
    };

    QVariant displayData(const shogi::review::domain::GameRecord& game, Column col) const;
    QVariant alignmentData(Column col) const;

    std::vector<shogi::review::domain::GameRecord> games_;
};

} // namespace shogi::review::ui
