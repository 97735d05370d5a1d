#include "ui/GamesModel.hpp"
#include "ui/UiFormatters.hpp"

#include <QString>

namespace shogi::review::ui {

using shogi::review::domain::GameId;
using shogi::review::domain::GameRecord;

GamesModel::GamesModel(QObject* parent)
    : QAbstractTableModel(parent) {
}

void GamesModel::setGames(const std::vector<GameRecord>& games) {
    beginResetModel();
    games_ = games;
    endResetModel();
}

void GamesModel::upsertGame(const GameRecord& game) {
    for (int row = 0; row < static_cast<int>(games_.size()); ++row) {
        if (games_[row].id == game.id) {
            games_[row] = game;
            const QModelIndex topLeft     = index(row, 0);
            const QModelIndex bottomRight = index(row, ColumnCount - 1);
            emit dataChanged(topLeft, bottomRight);
            return;
        }
    }

    beginInsertRows(QModelIndex(), 0, 0);
    games_.insert(games_.begin(), game);
    endInsertRows();
}

void GamesModel::removeGame(GameId id) {
    for (int row = 0; row < static_cast<int>(games_.size()); ++row) {
        if (games_[row].id == id) {
            beginRemoveRows(QModelIndex(), row, row);
            games_.erase(games_.begin() + row);
            endRemoveRows();
            return;
        }
    }
}

int GamesModel::rowCount(const QModelIndex& parent) const {
    return parent.isValid() ? 0 : static_cast<int>(games_.size());
}

int GamesModel::columnCount(const QModelIndex& parent) const {
    return parent.isValid() ? 0 : ColumnCount;
}

QVariant GamesModel::displayData(const GameRecord& game, Column col) const {
    switch (col) {
        case ColTitle:
            return fmt::formatGameTitle(game);

        case ColFormat:
            return fmt::formatKifuSource(game.format);

        case ColMoves:
            return game.moveCount;

        case ColCreated:
            return fmt::formatLocalIso(game.createdAt);

        default:
            return {};
    }
}

QVariant GamesModel::alignmentData(Column col) const {
    switch (col) {
        case ColMoves:
            return static_cast<int>(Qt::AlignRight | Qt::AlignVCenter);
        default:
            return static_cast<int>(Qt::AlignLeft | Qt::AlignVCenter);
    }
}

QVariant GamesModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid()) {
        return {};
    }

    const int row = index.row();
    const int col = index.column();

    if (row < 0 || row >= static_cast<int>(games_.size())) {
        return {};
    }

    const GameRecord& game = games_[row];

    if (role == Qt::DisplayRole) {
        return displayData(game, static_cast<Column>(col));
    }

    if (role == Qt::TextAlignmentRole) {
        return alignmentData(static_cast<Column>(col));
    }

    if (role == Qt::ToolTipRole) {
        return QString::fromStdString(game.notation);
    }

    return {};
}

QVariant GamesModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (orientation == Qt::Horizontal && role == Qt::DisplayRole) {
        switch (section) {
            case ColTitle:
                return QStringLiteral("Title");
            case ColFormat:
                return QStringLiteral("Format");
            case ColMoves:
                return QStringLiteral("Moves");
            case ColCreated:
                return QStringLiteral("Imported");
            default:
                break;
        }
    }
    return QAbstractTableModel::headerData(section, orientation, role);
}

std::optional<GameRecord> GamesModel::gameAtRow(int row) const {
    if (row < 0 || row >= static_cast<int>(games_.size())) {
        return std::nullopt;
    }
    return games_[row];
}

} // namespace shogi::review::ui
