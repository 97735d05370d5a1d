#include "ui/GameViewerDialog.hpp"

#include "domain/movement.hpp"
#include "domain/sfen_codec.hpp"
#include "ui/BoardWidget.hpp"

#include <QAbstractItemView>
#include <QCheckBox>
#include <QDebug>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QMessageBox>
#include <QPushButton>
#include <QSplitter>
#include <QVBoxLayout>

namespace shogi::review::ui {

using shogi::review::domain::Move;
using shogi::review::domain::PieceBase;
using shogi::review::domain::Side;
using shogi::review::domain::Square;
using shogi::review::domain::ViewerSettings;

namespace {

QVector<Square> toVector(const std::vector<Square>& squares) {
    QVector<Square> out;
    out.reserve(static_cast<int>(squares.size()));
    for (const auto& sq : squares) out.push_back(sq);
    return out;
}

} // namespace

GameViewerDialog::GameViewerDialog(const ViewerSettings& settings, QWidget* parent)
    : QDialog(parent) {
    setupUi();

    flipCheck_->setChecked(settings.flipBoard);
    hintsCheck_->setChecked(settings.showHints);
    hangingCheck_->setChecked(settings.showHanging);

    shogi::review::app::ReviewSessionCallbacks cb;
    cb.onTimelineChanged = [this]() { rebuildMovesList(); };
    cb.onCursorChanged = [this](int) {
        clearSelection();
        refreshView();
    };
    session_.setCallbacks(std::move(cb));

    rebuildMovesList();
    refreshView();
}

void GameViewerDialog::setupUi() {
    resize(980, 680);
    setWindowTitle(tr("Game viewer"));

    auto* mainLayout = new QVBoxLayout(this);

    headerLabel_ = new QLabel(this);
    headerLabel_->setWordWrap(true);
    mainLayout->addWidget(headerLabel_);

    auto* splitter = new QSplitter(this);
    splitter->setOrientation(Qt::Horizontal);

    boardWidget_ = new BoardWidget(splitter);

    movesList_ = new QListWidget(splitter);
    movesList_->setSelectionMode(QAbstractItemView::SingleSelection);
    movesList_->setUniformItemSizes(true);

    splitter->addWidget(boardWidget_);
    splitter->addWidget(movesList_);
    splitter->setStretchFactor(0, 3);
    splitter->setStretchFactor(1, 1);

    mainLayout->addWidget(splitter, 1);

    statusLabel_ = new QLabel(this);
    mainLayout->addWidget(statusLabel_);

    auto* optionsLayout = new QHBoxLayout();
    flipCheck_    = new QCheckBox(tr("Flip board"), this);
    hintsCheck_   = new QCheckBox(tr("Show move hints"), this);
    hangingCheck_ = new QCheckBox(tr("Show hanging pieces"), this);
    optionsLayout->addWidget(flipCheck_);
    optionsLayout->addWidget(hintsCheck_);
    optionsLayout->addWidget(hangingCheck_);
    optionsLayout->addStretch(1);
    mainLayout->addLayout(optionsLayout);

    auto* navLayout = new QHBoxLayout();

    firstBtn_ = new QPushButton(tr("<<"), this);
    prevBtn_  = new QPushButton(tr("<"), this);
    nextBtn_  = new QPushButton(tr(">"), this);
    lastBtn_  = new QPushButton(tr(">>"), this);
    analyzeBtn_ = new QPushButton(tr("Analyze this position"), this);

    navLayout->addWidget(firstBtn_);
    navLayout->addWidget(prevBtn_);
    navLayout->addWidget(nextBtn_);
    navLayout->addWidget(lastBtn_);
    navLayout->addStretch(1);
    navLayout->addWidget(analyzeBtn_);

    mainLayout->addLayout(navLayout);

    connect(movesList_, &QListWidget::currentRowChanged,
            this, &GameViewerDialog::onMoveSelectionChanged);

    connect(firstBtn_, &QPushButton::clicked, this, &GameViewerDialog::onFirstClicked);
    connect(prevBtn_,  &QPushButton::clicked, this, &GameViewerDialog::onPrevClicked);
    connect(nextBtn_,  &QPushButton::clicked, this, &GameViewerDialog::onNextClicked);
    connect(lastBtn_,  &QPushButton::clicked, this, &GameViewerDialog::onLastClicked);
    connect(analyzeBtn_, &QPushButton::clicked, this, &GameViewerDialog::onAnalyzeClicked);

    connect(boardWidget_, &BoardWidget::squareClicked, this, &GameViewerDialog::onSquareClicked);
    connect(boardWidget_, &BoardWidget::handPieceClicked, this, &GameViewerDialog::onHandPieceClicked);

    connect(flipCheck_,    &QCheckBox::toggled, this, &GameViewerDialog::onDisplayOptionsChanged);
    connect(hintsCheck_,   &QCheckBox::toggled, this, &GameViewerDialog::onDisplayOptionsChanged);
    connect(hangingCheck_, &QCheckBox::toggled, this, &GameViewerDialog::onDisplayOptionsChanged);
}

bool GameViewerDialog::setGame(const Meta& meta, const QString& notation, QString* outError) {
    const auto res = session_.load(notation.toStdString());
    if (!res.ok) {
        qWarning() << "Game viewer: failed to load notation:" << QString::fromStdString(res.error);
        if (outError) {
            *outError = QString::fromStdString(res.error);
        }
        return false;
    }

    meta_ = meta;

    QString title = tr("Game viewer");
    if (!meta_.sente.isEmpty() || !meta_.gote.isEmpty()) {
        title = tr("Game viewer: %1 vs %2").arg(meta_.sente, meta_.gote);
    } else if (!meta_.title.isEmpty()) {
        title = tr("Game viewer: %1").arg(meta_.title);
    }
    setWindowTitle(title);

    QStringList headerLines;
    if (!meta_.title.isEmpty()) headerLines << meta_.title;
    if (!meta_.event.isEmpty()) headerLines << tr("Event: %1").arg(meta_.event);
    if (!meta_.date.isEmpty())  headerLines << tr("Date: %1").arg(meta_.date);
    if (!meta_.sente.isEmpty() || !meta_.gote.isEmpty()) {
        headerLines << tr("Players: ▲%1 - △%2").arg(meta_.sente, meta_.gote);
    }
    const auto& terminal = session_.timeline().terminal;
    if (terminal) headerLines << tr("Result: %1").arg(QString::fromStdString(*terminal));

    headerLabel_->setText(headerLines.join("\n"));
    statusLabel_->clear();

    return true;
}

void GameViewerDialog::rebuildMovesList() {
    ignoreSelection_ = true;
    movesList_->clear();

    auto* start = new QListWidgetItem(tr("Start position"));
    start->setData(Qt::UserRole, 0);
    movesList_->addItem(start);

    const auto& labels = session_.moveLabels();
    for (size_t i = 0; i < labels.size(); ++i) {
        const int ply = static_cast<int>(i) + 1;
        const QString label = QString::fromStdString(labels[i]);
        auto* item = new QListWidgetItem(QString("%1 %2").arg(ply).arg(label));
        item->setData(Qt::UserRole, ply);
        movesList_->addItem(item);
    }

    ignoreSelection_ = false;
    refreshView();
}

void GameViewerDialog::refreshView() {
    const int ply = session_.currentPly();
    const auto& pos = session_.currentPosition();

    if (boardWidget_) {
        boardWidget_->setFlipped(flipCheck_ && flipCheck_->isChecked());
        boardWidget_->setPosition(pos);
        boardWidget_->setLastMove(session_.lastMove());
        boardWidget_->setSelection(selected_);
        boardWidget_->setSelectedHandPiece(selectedDrop_);

        QVector<Square> hints;
        if (hintsCheck_ && hintsCheck_->isChecked()) {
            if (selected_) hints = toVector(session_.reachableFrom(*selected_));
            else if (selectedDrop_) hints = toVector(session_.dropTargets(*selectedDrop_));
        }
        boardWidget_->setHighlights(hints);

        QVector<Square> warnings;
        if (hangingCheck_ && hangingCheck_->isChecked()) {
            warnings = toVector(session_.hangingPieces(pos.sideToMove));
        }
        boardWidget_->setWarnings(warnings);
    }

    ignoreSelection_ = true;
    if (movesList_) movesList_->setCurrentRow(ply);
    ignoreSelection_ = false;

    const bool atStart = (ply <= 0);
    const bool atEnd = (ply >= session_.lastPly());

    if (firstBtn_) firstBtn_->setEnabled(!atStart);
    if (prevBtn_)  prevBtn_->setEnabled(!atStart);
    if (nextBtn_)  nextBtn_->setEnabled(!atEnd);
    if (lastBtn_)  lastBtn_->setEnabled(!atEnd);
}

void GameViewerDialog::clearSelection() {
    selected_.reset();
    selectedDrop_.reset();
}

void GameViewerDialog::onMoveSelectionChanged() {
    if (ignoreSelection_) {
        return;
    }
    const int row = movesList_ ? movesList_->currentRow() : -1;
    session_.setCurrentPly(row < 0 ? 0 : row);
}

void GameViewerDialog::onFirstClicked() {
    session_.first();
}

void GameViewerDialog::onPrevClicked() {
    session_.prev();
}

void GameViewerDialog::onNextClicked() {
    session_.next();
}

void GameViewerDialog::onLastClicked() {
    session_.last();
}

void GameViewerDialog::onAnalyzeClicked() {
    emit analyzeRequested(QString::fromStdString(session_.positionCommand()), meta_.title);
}

void GameViewerDialog::onDisplayOptionsChanged() {
    refreshView();
}

void GameViewerDialog::onSquareClicked(int x, int y) {
    const Square sq{x, y};
    const auto& pos = session_.currentPosition();
    const auto& cell = pos.pieceAt(sq);

    if (selectedDrop_) {
        const PieceBase kind = *selectedDrop_;
        clearSelection();
        if (!cell) {
            tryDrop(kind, sq);
            return;
        }
    }

    if (selected_) {
        const Square from = *selected_;
        if (from == sq) {
            clearSelection();
            refreshView();
            return;
        }
        if (!cell || cell->owner != pos.sideToMove) {
            clearSelection();
            tryMove(from, sq);
            return;
        }
    }

    clearSelection();
    if (cell && cell->owner == pos.sideToMove) {
        selected_ = sq;
    }
    refreshView();
}

void GameViewerDialog::onHandPieceClicked(int side, int kind) {
    const auto& pos = session_.currentPosition();
    clearSelection();
    if (static_cast<Side>(side) == pos.sideToMove) {
        selectedDrop_ = static_cast<PieceBase>(kind);
    }
    refreshView();
}

void GameViewerDialog::tryMove(const Square& from, const Square& to) {
    const auto& pos = session_.currentPosition();
    const auto& piece = pos.pieceAt(from);
    if (!piece) {
        refreshView();
        return;
    }

    // Unreachable targets go straight to the session so the rejection is reported.
    bool promote = false;
    if (!shogi::review::domain::isPseudoLegal(pos.board, Move::boardMove(from, to), pos.sideToMove)) {
        promote = false;
    } else if (shogi::review::domain::mustPromote(*piece, to)) {
        promote = true;
    } else if (shogi::review::domain::canPromote(*piece, from, to)) {
        const auto answer = QMessageBox::question(this, tr("Promotion"), tr("Promote this piece?"),
                                                  QMessageBox::Yes | QMessageBox::No, QMessageBox::Yes);
        promote = (answer == QMessageBox::Yes);
    }

    playToken(shogi::review::domain::sfen::formatMove(Move::boardMove(from, to, promote)));
}

void GameViewerDialog::tryDrop(PieceBase kind, const Square& to) {
    playToken(shogi::review::domain::sfen::formatMove(Move::drop(kind, to)));
}

void GameViewerDialog::playToken(const std::string& token) {
    const auto res = session_.playMove(token);
    if (!res.ok) {
        statusLabel_->setText(tr("Move %1 rejected: %2")
                                  .arg(QString::fromStdString(token),
                                       QString::fromStdString(res.message)));
        refreshView();
        return;
    }
    statusLabel_->setText(tr("Branch move %1 played").arg(QString::fromStdString(token)));
}

} // namespace shogi::review::ui
