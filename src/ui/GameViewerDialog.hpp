#pragma once

#include <QDialog>
#include <QString>

#include <optional>

#include "app/ReviewSession.hpp"
#include "domain/domain_model.hpp"
#include "domain/shogi_model.hpp"

QT_BEGIN_NAMESPACE
class QCheckBox;
class QListWidget;
class QLabel;
class QPushButton;
QT_END_NAMESPACE

namespace shogi::review::ui {

class BoardWidget;

class GameViewerDialog : public QDialog {
    Q_OBJECT

public:
    struct Meta {
        QString title;
        QString sente;
        QString gote;
        QString date;
        QString event;
    };

    explicit GameViewerDialog(const shogi::review::domain::ViewerSettings& settings,
                              QWidget* parent = nullptr);

    // Replays `notation` ("startpos moves ..." / "sfen ...") into the viewer.
    bool setGame(const Meta& meta, const QString& notation, QString* outError = nullptr);

    const shogi::review::app::ReviewSession& session() const { return session_; }

signals:
    // Requests analysis of the current ply ("position ... moves ...").
    void analyzeRequested(const QString& positionCommand, const QString& title);

private slots:
    void onMoveSelectionChanged();
    void onFirstClicked();
    void onPrevClicked();
    void onNextClicked();
    void onLastClicked();
    void onAnalyzeClicked();
    void onSquareClicked(int x, int y);
    void onHandPieceClicked(int side, int kind);
    void onDisplayOptionsChanged();

private:
    void setupUi();
    void rebuildMovesList();
    void refreshView();
    void clearSelection();
    void tryMove(const shogi::review::domain::Square& from, const shogi::review::domain::Square& to);
    void tryDrop(shogi::review::domain::PieceBase kind, const shogi::review::domain::Square& to);
    void playToken(const std::string& token);

private:
    BoardWidget* boardWidget_{nullptr};
    QListWidget* movesList_{nullptr};
    QLabel* headerLabel_{nullptr};
    QLabel* statusLabel_{nullptr};

    QPushButton* firstBtn_{nullptr};
    QPushButton* prevBtn_{nullptr};
    QPushButton* nextBtn_{nullptr};
    QPushButton* lastBtn_{nullptr};
    QPushButton* analyzeBtn_{nullptr};

    QCheckBox* flipCheck_{nullptr};
    QCheckBox* hintsCheck_{nullptr};
    QCheckBox* hangingCheck_{nullptr};

    Meta meta_;
    shogi::review::app::ReviewSession session_;

    std::optional<shogi::review::domain::Square> selected_;
    std::optional<shogi::review::domain::PieceBase> selectedDrop_;
    bool ignoreSelection_{false};
};

} // namespace shogi::review::ui
