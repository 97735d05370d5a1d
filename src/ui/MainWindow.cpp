#include "ui/MainWindow.hpp"

#include "app/IGameRepository.hpp"

#include <QAction>
#include <QApplication>
#include <QClipboard>
#include <QDebug>
#include <QFile>
#include <QFileDialog>
#include <QFileInfo>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QItemSelectionModel>
#include <QLineEdit>
#include <QMenuBar>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QStatusBar>
#include <QTableView>
#include <QVBoxLayout>

#include "domain/kifu/KifuParser.hpp"
#include "ui/GameViewerDialog.hpp"

namespace shogi::review::ui {

using shogi::review::domain::Clock;
using shogi::review::domain::GameRecord;
using shogi::review::domain::KifuSource;
using shogi::review::domain::ViewerSettings;

namespace kifu = shogi::review::domain::kifu;

namespace {

KifuSource toSource(kifu::KifuFormat f) {
    switch (f) {
        case kifu::KifuFormat::Csa: return KifuSource::Csa;
        case kifu::KifuFormat::Kif: return KifuSource::Kif;
        default:                    return KifuSource::Usi;
    }
}

std::string headerValue(const std::map<std::string, std::string>& headers, const char* key) {
    const auto it = headers.find(key);
    return (it == headers.end()) ? std::string() : it->second;
}

// "先手 vs 後手", falling back to the event name.
std::string titleFromHeaders(const std::map<std::string, std::string>& headers) {
    const std::string sente = headerValue(headers, "先手");
    const std::string gote  = headerValue(headers, "後手");
    if (!sente.empty() || !gote.empty()) {
        return sente + " vs " + gote;
    }
    return headerValue(headers, "棋戦");
}

} // namespace

MainWindow::MainWindow(ViewerSettings settings,
                       shogi::review::app::IGameRepository* gameRepo,
                       QWidget* parent)
    : QMainWindow(parent)
    , gamesModel_(this)
    , settings_(std::move(settings))
    , gameRepo_(gameRepo) {
    setupUi();
    setupConnections();
    reloadGames();
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi() {
    resize(1000, 700);
    setWindowTitle(tr("Shogi review"));

    setupMenu();

    centralWidget_ = new QWidget(this);
    setCentralWidget(centralWidget_);

    auto* mainLayout = new QVBoxLayout(centralWidget_);
    setupImportForm(mainLayout);
    setupGamesTable(mainLayout);

    statusBar()->showMessage(gameRepo_ ? tr("Ready") : tr("No game store: imported games are not saved"));
}

void MainWindow::setupMenu() {
    auto* fileMenu = menuBar()->addMenu(tr("&File"));

    auto* importFileAction = fileMenu->addAction(tr("Import kifu file..."));
    connect(importFileAction, &QAction::triggered,
            this, &MainWindow::onImportFileTriggered);

    fileMenu->addSeparator();

    auto* quitAction = fileMenu->addAction(tr("Quit"));
    connect(quitAction, &QAction::triggered, this, &QWidget::close);
}

void MainWindow::setupImportForm(QVBoxLayout* mainLayout) {
    auto* formLayout = new QFormLayout();

    titleLineEdit_ = new QLineEdit(centralWidget_);
    titleLineEdit_->setPlaceholderText(tr("Optional, taken from the kifu headers when empty"));

    kifuPlainTextEdit_ = new QPlainTextEdit(centralWidget_);
    kifuPlainTextEdit_->setPlaceholderText(
        tr("Paste USI (startpos moves 7g7f ...), CSA (+7776FU ...) or KIF (▲７六歩(77) ...)"));
    kifuPlainTextEdit_->setMinimumHeight(80);
    kifuPlainTextEdit_->setMaximumHeight(200);

    formLayout->addRow(tr("Title:"), titleLineEdit_);
    formLayout->addRow(tr("Kifu:"), kifuPlainTextEdit_);
    mainLayout->addLayout(formLayout);

    auto* buttonsLayout = new QHBoxLayout();
    importButton_  = new QPushButton(tr("Import"), centralWidget_);
    previewButton_ = new QPushButton(tr("Open without saving"), centralWidget_);
    buttonsLayout->addWidget(importButton_);
    buttonsLayout->addWidget(previewButton_);
    buttonsLayout->addStretch();
    mainLayout->addLayout(buttonsLayout);
}

void MainWindow::setupGamesTable(QVBoxLayout* mainLayout) {
    gamesTableView_ = new QTableView(centralWidget_);
    gamesTableView_->setModel(&gamesModel_);
    gamesTableView_->setSelectionBehavior(QAbstractItemView::SelectRows);
    gamesTableView_->setSelectionMode(QAbstractItemView::SingleSelection);
    gamesTableView_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    gamesTableView_->horizontalHeader()->setStretchLastSection(true);
    mainLayout->addWidget(gamesTableView_, 1);

    auto* buttonsLayout = new QHBoxLayout();
    openButton_   = new QPushButton(tr("Open"), centralWidget_);
    deleteButton_ = new QPushButton(tr("Delete"), centralWidget_);
    buttonsLayout->addWidget(openButton_);
    buttonsLayout->addWidget(deleteButton_);
    buttonsLayout->addStretch();
    mainLayout->addLayout(buttonsLayout);
}

void MainWindow::setupConnections() {
    connect(importButton_,  &QPushButton::clicked, this, &MainWindow::onImportClicked);
    connect(previewButton_, &QPushButton::clicked, this, &MainWindow::onPreviewClicked);
    connect(openButton_,    &QPushButton::clicked, this, &MainWindow::onOpenGameClicked);
    connect(deleteButton_,  &QPushButton::clicked, this, &MainWindow::onDeleteGameClicked);
    connect(gamesTableView_, &QTableView::doubleClicked, this, [this](const QModelIndex&) {
        onOpenGameClicked();
    });
}

void MainWindow::reloadGames() {
    if (!gameRepo_) {
        return;
    }
    gamesModel_.setGames(gameRepo_->loadAllGames());
}

QItemSelectionModel* MainWindow::gamesSelectionModel() const {
    return gamesTableView_ ? gamesTableView_->selectionModel() : nullptr;
}

std::optional<int> MainWindow::selectedGameRow() const {
    auto* sel = gamesSelectionModel();
    if (!sel) {
        return std::nullopt;
    }
    const auto rows = sel->selectedRows();
    if (rows.isEmpty()) {
        return std::nullopt;
    }
    return rows.first().row();
}

std::optional<GameRecord> MainWindow::selectedGame() const {
    const auto row = selectedGameRow();
    if (!row) {
        return std::nullopt;
    }
    return gamesModel_.gameAtRow(*row);
}

std::vector<GameRecord> MainWindow::importText(const QString& text, bool save) {
    std::vector<GameRecord> imported;

    if (text.trimmed().isEmpty()) {
        QMessageBox::warning(this, tr("Import"), tr("Nothing to import."));
        return imported;
    }

    const auto split = kifu::splitKifuGames(text.toStdString(), settings_.maxImportGames);
    if (!split.ok) {
        QMessageBox::warning(this, tr("Import"), QString::fromStdString(split.error));
        return imported;
    }

    QStringList failures;
    const QString titleOverride = titleLineEdit_ ? titleLineEdit_->text().trimmed() : QString();

    for (size_t i = 0; i < split.games.size(); ++i) {
        const std::string& gameText = split.games[i];
        const auto res = kifu::importKifu(gameText);
        if (!res.ok) {
            qWarning() << "Kifu import failed for game" << (i + 1) << ":" << QString::fromStdString(res.error);
            failures << tr("Game %1: %2").arg(i + 1).arg(QString::fromStdString(res.error));
            continue;
        }

        GameRecord g;
        g.title     = titleOverride.isEmpty() ? titleFromHeaders(res.headers) : titleOverride.toStdString();
        g.kifuText  = gameText;
        g.format    = toSource(res.format);
        g.notation  = res.notation;
        g.moveCount = res.moveCount;
        g.createdAt = Clock::now();

        if (save && gameRepo_) {
            g.id = gameRepo_->saveGame(g);
            if (g.id == 0) {
                failures << tr("Game %1: could not be saved").arg(i + 1);
                continue;
            }
            gamesModel_.upsertGame(g);
        }
        imported.push_back(std::move(g));
    }

    if (!failures.isEmpty()) {
        QMessageBox::warning(this, tr("Import"),
                             tr("%1 of %2 games could not be imported:\n%3")
                                 .arg(failures.size())
                                 .arg(split.games.size())
                                 .arg(failures.join("\n")));
    }

    statusBar()->showMessage(tr("Imported %1 game(s).").arg(imported.size()), 4000);
    return imported;
}

void MainWindow::onImportClicked() {
    const auto games = importText(kifuPlainTextEdit_->toPlainText(), /*save*/ true);
    if (!games.empty()) {
        kifuPlainTextEdit_->clear();
        titleLineEdit_->clear();
    }
}

void MainWindow::onPreviewClicked() {
    const auto games = importText(kifuPlainTextEdit_->toPlainText(), /*save*/ false);
    if (!games.empty()) {
        openViewer(games.front());
    }
}

void MainWindow::onImportFileTriggered() {
    const QString fileName = QFileDialog::getOpenFileName(
        this, tr("Import kifu"), QString(),
        tr("Kifu files (*.kif *.kifu *.csa *.usi *.txt);;All files (*)"));
    if (fileName.isEmpty()) {
        return;
    }

    QFile file(fileName);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        QMessageBox::warning(this, tr("Error"),
                             tr("Cannot open file:\n%1").arg(fileName));
        return;
    }

    const QString text = QString::fromUtf8(file.readAll());
    importText(text, /*save*/ true);
}

void MainWindow::onOpenGameClicked() {
    const auto game = selectedGame();
    if (!game) {
        QMessageBox::warning(this, tr("Open"), tr("Select a game first."));
        return;
    }
    openViewer(*game);
}

void MainWindow::onDeleteGameClicked() {
    const auto game = selectedGame();
    if (!game || !gameRepo_) {
        return;
    }

    const auto answer = QMessageBox::question(
        this, tr("Delete"),
        tr("Delete \"%1\"?").arg(QString::fromStdString(game->title)));
    if (answer != QMessageBox::Yes) {
        return;
    }

    if (!gameRepo_->removeGame(game->id)) {
        QMessageBox::warning(this, tr("Delete"), tr("The game could not be deleted."));
        return;
    }
    gamesModel_.removeGame(game->id);
    statusBar()->showMessage(tr("Game deleted."), 3000);
}

void MainWindow::openViewer(const GameRecord& game) {
    auto* dlg = new GameViewerDialog(settings_, this);
    dlg->setAttribute(Qt::WA_DeleteOnClose);

    GameViewerDialog::Meta meta;
    meta.title = QString::fromStdString(game.title);

    const auto headers = kifu::importKifu(game.kifuText).headers;
    meta.sente = QString::fromStdString(headerValue(headers, "先手"));
    meta.gote  = QString::fromStdString(headerValue(headers, "後手"));
    meta.date  = QString::fromStdString(headerValue(headers, "開始日時"));
    meta.event = QString::fromStdString(headerValue(headers, "棋戦"));

    QString error;
    if (!dlg->setGame(meta, QString::fromStdString(game.notation), &error)) {
        QMessageBox::warning(this, tr("Game viewer"), error);
        dlg->deleteLater();
        return;
    }

    connect(dlg, &GameViewerDialog::analyzeRequested, this, &MainWindow::onAnalyzeRequested);
    dlg->show();
}

void MainWindow::onAnalyzeRequested(const QString& positionCommand, const QString& title) {
    qDebug() << "Analysis requested for" << title << ":" << positionCommand;
    if (auto* clipboard = QApplication::clipboard()) {
        clipboard->setText(positionCommand);
    }
    statusBar()->showMessage(tr("Position command copied: %1").arg(positionCommand), 6000);
}

void MainWindow::openArgument(const QString& argument) {
    if (argument.trimmed().isEmpty()) {
        return;
    }

    QString text = argument;
    const QFileInfo info(argument);
    if (info.exists() && info.isFile()) {
        QFile file(argument);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            qWarning() << "Failed to open kifu file:" << argument;
            QMessageBox::warning(this, tr("Error"), tr("Cannot open file:\n%1").arg(argument));
            return;
        }
        text = QString::fromUtf8(file.readAll());
        qDebug() << "Loaded kifu file:" << argument;
    }

    kifuPlainTextEdit_->setPlainText(text);
    onPreviewClicked();
}

} // namespace shogi::review::ui
