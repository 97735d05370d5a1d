#pragma once

#include <QMainWindow>
#include <optional>

#include "domain/domain_model.hpp"
#include "ui/GamesModel.hpp"

class QLineEdit;
class QPushButton;
class QTableView;
class QPlainTextEdit;
class QItemSelectionModel;
class QVBoxLayout;

namespace shogi::review::app {
class IGameRepository;
}

namespace shogi::review::ui {

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    MainWindow(shogi::review::domain::ViewerSettings settings,
               shogi::review::app::IGameRepository* gameRepo = nullptr,
               QWidget* parent = nullptr);
    ~MainWindow() override;

    // Command line argument: a kifu file path, otherwise a notation string.
    void openArgument(const QString& argument);

private slots:
    void onImportClicked();
    void onPreviewClicked();
    void onImportFileTriggered();
    void onOpenGameClicked();
    void onDeleteGameClicked();
    void onAnalyzeRequested(const QString& positionCommand, const QString& title);

private:
    void setupUi();
    void setupMenu();
    void setupImportForm(QVBoxLayout* mainLayout);
    void setupGamesTable(QVBoxLayout* mainLayout);
    void setupConnections();
    void reloadGames();

    QItemSelectionModel* gamesSelectionModel() const;
    std::optional<int> selectedGameRow() const;
    std::optional<shogi::review::domain::GameRecord> selectedGame() const;

    // Splits, converts and (when save is set) stores every game in `text`.
    // Returns the records that converted successfully.
    std::vector<shogi::review::domain::GameRecord> importText(const QString& text, bool save);

    void openViewer(const shogi::review::domain::GameRecord& game);

private:
    QWidget*        centralWidget_{nullptr};

    QLineEdit*      titleLineEdit_{nullptr};
    QPlainTextEdit* kifuPlainTextEdit_{nullptr};

    QPushButton*    importButton_{nullptr};
    QPushButton*    previewButton_{nullptr};

    QTableView*     gamesTableView_{nullptr};
    QPushButton*    openButton_{nullptr};
    QPushButton*    deleteButton_{nullptr};

    GamesModel      gamesModel_;

    shogi::review::domain::ViewerSettings settings_;
    shogi::review::app::IGameRepository*  gameRepo_{nullptr};
};

} // namespace shogi::review::ui
