#pragma once

#include <QWidget>
#include <QRectF>
#include <QPointF>
#include <QVector>
#include <optional>

#include "domain/shogi_model.hpp"

class QPainter;
class QMouseEvent;

namespace shogi::review::ui {

// 9x9 board with both hands: Gote's hand above the board, Sente's below
// (swapped when flipped). Gote pieces are drawn rotated.
class BoardWidget : public QWidget {
    Q_OBJECT
public:
    explicit BoardWidget(QWidget* parent = nullptr);

    void setPosition(const shogi::review::domain::Position& pos);
    void setFlipped(bool flipped);
    bool isFlipped() const { return flipped_; }

    // Move targets / drop targets (yellow).
    void setHighlights(const QVector<shogi::review::domain::Square>& squares);
    // Hanging pieces (red frame).
    void setWarnings(const QVector<shogi::review::domain::Square>& squares);
    void setSelection(std::optional<shogi::review::domain::Square> square);
    void setSelectedHandPiece(std::optional<shogi::review::domain::PieceBase> kind);
    void setLastMove(const std::optional<shogi::review::domain::Move>& move);

signals:
    void squareClicked(int x, int y);
    void handPieceClicked(int side, int kind); // domain::Side, domain::PieceBase

protected:
    void paintEvent(QPaintEvent* ev) override;
    void mousePressEvent(QMouseEvent* ev) override;

private:
    qreal cellSize() const;
    QRectF boardRect() const;
    QRectF squareRect(const shogi::review::domain::Square& sq) const;
    QPointF squareCenter(const shogi::review::domain::Square& sq) const;
    QRectF handRect(shogi::review::domain::Side side) const;
    QRectF handSlotRect(shogi::review::domain::Side side, int slot) const;

    void drawBoard(QPainter& p);
    void drawHighlights(QPainter& p);
    void drawPieces(QPainter& p);
    void drawHands(QPainter& p);
    void drawLastMove(QPainter& p);
    void drawPieceGlyph(QPainter& p, const QRectF& r, const shogi::review::domain::Piece& piece);

    shogi::review::domain::Position position_;
    bool flipped_{false};

    QVector<shogi::review::domain::Square> highlights_;
    QVector<shogi::review::domain::Square> warnings_;
    std::optional<shogi::review::domain::Square> selection_;
    std::optional<shogi::review::domain::PieceBase> selectedHand_;
    std::optional<shogi::review::domain::Move> lastMove_;
};

} // namespace shogi::review::ui
