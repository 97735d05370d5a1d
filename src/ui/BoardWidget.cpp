#include "ui/BoardWidget.hpp"

#include <QPainter>
#include <QPainterPath>
#include <QPaintEvent>
#include <QMouseEvent>
#include <QFont>
#include <QtMath>
#include <cmath>

#include "domain/move_label.hpp"

namespace shogi::review::ui {

using shogi::review::domain::kBoardSize;
using shogi::review::domain::kHandOrder;
using shogi::review::domain::Move;
using shogi::review::domain::Piece;
using shogi::review::domain::PieceBase;
using shogi::review::domain::Position;
using shogi::review::domain::Side;
using shogi::review::domain::Square;

namespace {

constexpr qreal kMargin = 12.0;
constexpr qreal kHandRows = 1.2; // hand strip height in cells

// One-character glyphs for the board; two-character promoted names are
// shortened the way printed boards do.
QString glyphFor(const Piece& piece) {
    if (piece.promoted) {
        switch (piece.base) {
            case PieceBase::Lance:  return QStringLiteral("杏");
            case PieceBase::Knight: return QStringLiteral("圭");
            case PieceBase::Silver: return QStringLiteral("全");
            default: break;
        }
    }
    if (piece.base == PieceBase::King && piece.owner == Side::Gote) {
        return QStringLiteral("王");
    }
    return QString::fromStdString(shogi::review::domain::pieceKanji(piece.base, piece.promoted));
}

} // namespace

BoardWidget::BoardWidget(QWidget* parent) : QWidget(parent) {
    setMinimumSize(360, 440);
}

void BoardWidget::setPosition(const Position& pos) {
    position_ = pos;
    update();
}

void BoardWidget::setFlipped(bool flipped) {
    if (flipped_ == flipped) return;
    flipped_ = flipped;
    update();
}

void BoardWidget::setHighlights(const QVector<Square>& squares) {
    highlights_ = squares;
    update();
}

void BoardWidget::setWarnings(const QVector<Square>& squares) {
    warnings_ = squares;
    update();
}

void BoardWidget::setSelection(std::optional<Square> square) {
    selection_ = square;
    update();
}

void BoardWidget::setSelectedHandPiece(std::optional<PieceBase> kind) {
    selectedHand_ = kind;
    update();
}

void BoardWidget::setLastMove(const std::optional<Move>& move) {
    lastMove_ = move;
    update();
}

qreal BoardWidget::cellSize() const {
    const qreal byWidth  = (width() - 2 * kMargin) / kBoardSize;
    const qreal byHeight = (height() - 2 * kMargin) / (kBoardSize + 2 * kHandRows);
    return qMax<qreal>(8.0, qMin(byWidth, byHeight));
}

QRectF BoardWidget::boardRect() const {
    const qreal s = cellSize() * kBoardSize;
    return QRectF((width() - s) / 2.0, (height() - s) / 2.0, s, s);
}

QRectF BoardWidget::squareRect(const Square& sq) const {
    const QRectF br = boardRect();
    const qreal c = cellSize();
    const int vx = flipped_ ? (kBoardSize - 1 - sq.x) : sq.x;
    const int vy = flipped_ ? (kBoardSize - 1 - sq.y) : sq.y;
    return QRectF(br.left() + vx * c, br.top() + vy * c, c, c);
}

QPointF BoardWidget::squareCenter(const Square& sq) const {
    return squareRect(sq).center();
}

QRectF BoardWidget::handRect(Side side) const {
    const QRectF br = boardRect();
    const qreal h = cellSize() * kHandRows;
    const bool top = (side == Side::Gote) != flipped_;
    if (top) {
        return QRectF(br.left(), br.top() - h, br.width(), h);
    }
    return QRectF(br.left(), br.bottom(), br.width(), h);
}

QRectF BoardWidget::handSlotRect(Side side, int slot) const {
    const QRectF hr = handRect(side);
    const qreal c = cellSize();
    const qreal w = hr.width() / static_cast<qreal>(kHandOrder.size());
    return QRectF(hr.left() + slot * w, hr.center().y() - c / 2.0, w, c);
}

void BoardWidget::paintEvent(QPaintEvent* ev) {
    Q_UNUSED(ev);
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing, true);
    p.setRenderHint(QPainter::TextAntialiasing, true);

    drawBoard(p);
    drawHighlights(p);
    drawPieces(p);
    drawLastMove(p);
    drawHands(p);

    // border
    p.setPen(QPen(QColor(0, 0, 0, 120), 2.0));
    p.setBrush(Qt::NoBrush);
    p.drawRect(boardRect());
}

void BoardWidget::mousePressEvent(QMouseEvent* ev) {
    const QPointF pt = ev->position();

    if (boardRect().contains(pt)) {
        for (int y = 0; y < kBoardSize; ++y) {
            for (int x = 0; x < kBoardSize; ++x) {
                if (squareRect(Square{x, y}).contains(pt)) {
                    emit squareClicked(x, y);
                    return;
                }
            }
        }
    }

    for (Side side : {Side::Sente, Side::Gote}) {
        for (int slot = 0; slot < static_cast<int>(kHandOrder.size()); ++slot) {
            const PieceBase kind = kHandOrder[static_cast<std::size_t>(slot)];
            if (position_.handCount(side, kind) == 0) continue;
            if (handSlotRect(side, slot).contains(pt)) {
                emit handPieceClicked(static_cast<int>(side), static_cast<int>(kind));
                return;
            }
        }
    }

    QWidget::mousePressEvent(ev);
}

void BoardWidget::drawBoard(QPainter& p) {
    const QRectF br = boardRect();
    const qreal c = cellSize();

    p.fillRect(br, QColor(234, 196, 120));

    p.setPen(QPen(QColor(40, 30, 20), 1.0));
    for (int i = 1; i < kBoardSize; ++i) {
        p.drawLine(QPointF(br.left() + i * c, br.top()), QPointF(br.left() + i * c, br.bottom()));
        p.drawLine(QPointF(br.left(), br.top() + i * c), QPointF(br.right(), br.top() + i * c));
    }

    // star points at the corners of the central 3x3 block
    p.setBrush(QColor(40, 30, 20));
    const qreal dot = qMax<qreal>(2.0, c * 0.06);
    for (int i : {3, 6}) {
        for (int j : {3, 6}) {
            p.drawEllipse(QPointF(br.left() + i * c, br.top() + j * c), dot, dot);
        }
    }
}

void BoardWidget::drawHighlights(QPainter& p) {
    p.save();
    p.setPen(Qt::NoPen);

    if (lastMove_) {
        p.setBrush(QColor(255, 160, 0, 60));
        p.drawRect(squareRect(lastMove_->to));
    }

    if (selection_) {
        p.setBrush(QColor(60, 120, 255, 90));
        p.drawRect(squareRect(*selection_));
    }

    p.setBrush(QColor(255, 255, 0, 90));
    for (const auto& sq : highlights_) {
        p.drawRect(squareRect(sq));
    }

    p.setBrush(Qt::NoBrush);
    p.setPen(QPen(QColor(220, 40, 40, 200), qMax<qreal>(2.0, cellSize() * 0.06)));
    for (const auto& sq : warnings_) {
        p.drawRect(squareRect(sq).adjusted(2, 2, -2, -2));
    }

    p.restore();
}

void BoardWidget::drawPieceGlyph(QPainter& p, const QRectF& r, const Piece& piece) {
    p.save();

    QFont font = p.font();
    const QString text = glyphFor(piece);
    font.setPixelSize(static_cast<int>(r.height() * 0.72));
    p.setFont(font);
    p.setPen(piece.promoted ? QColor(190, 20, 20) : QColor(20, 20, 20));

    p.translate(r.center());
    const bool upsideDown = (piece.owner == Side::Gote) != flipped_;
    if (upsideDown) p.rotate(180.0);

    const QRectF local(-r.width() / 2.0, -r.height() / 2.0, r.width(), r.height());
    p.drawText(local, Qt::AlignCenter, text);

    p.restore();
}

void BoardWidget::drawPieces(QPainter& p) {
    for (int y = 0; y < kBoardSize; ++y) {
        for (int x = 0; x < kBoardSize; ++x) {
            const Square sq{x, y};
            const auto& cell = position_.pieceAt(sq);
            if (!cell) continue;
            drawPieceGlyph(p, squareRect(sq), *cell);
        }
    }
}

void BoardWidget::drawHands(QPainter& p) {
    p.save();

    for (Side side : {Side::Sente, Side::Gote}) {
        const QRectF hr = handRect(side);
        p.fillRect(hr.adjusted(0, 2, 0, -2), QColor(245, 225, 180));

        for (int slot = 0; slot < static_cast<int>(kHandOrder.size()); ++slot) {
            const PieceBase kind = kHandOrder[static_cast<std::size_t>(slot)];
            const auto n = position_.handCount(side, kind);
            if (n == 0) continue;

            const QRectF r = handSlotRect(side, slot);
            if (selectedHand_ && *selectedHand_ == kind && side == position_.sideToMove) {
                p.fillRect(r, QColor(60, 120, 255, 90));
            }

            const QRectF glyph(r.left(), r.top(), r.height(), r.height());
            drawPieceGlyph(p, glyph, Piece::make(kind, side));

            if (n > 1) {
                QFont font = p.font();
                font.setPixelSize(static_cast<int>(r.height() * 0.4));
                p.setFont(font);
                p.setPen(QColor(20, 20, 20));
                p.drawText(QRectF(glyph.right(), r.top(), r.width() - glyph.width(), r.height()),
                           Qt::AlignLeft | Qt::AlignVCenter, QString::number(n));
            }
        }
    }

    p.restore();
}

void BoardWidget::drawLastMove(QPainter& p) {
    if (!lastMove_ || lastMove_->isDrop()) return;

    const qreal c = cellSize();
    const QPointF start = squareCenter(lastMove_->from);
    const QPointF end   = squareCenter(lastMove_->to);

    const QPointF v = end - start;
    const qreal len = std::hypot(v.x(), v.y());
    if (len < 1e-3) return;

    const QPointF dir(v.x() / len, v.y() / len);
    const QPointF ort(-dir.y(), dir.x());

    // Short moves must not be dominated by the head.
    const qreal headL = qMin(c * 0.22, len * 0.35);
    const qreal headW = qMin(c * 0.16, len * 0.28);
    const QPointF end2 = end - dir * headL;

    const QColor col(40, 140, 70, 150);
    const qreal w = qMax<qreal>(2.0, c * 0.06);

    p.save();
    p.setPen(QPen(col, w, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
    p.drawLine(start, end2);

    QPainterPath head;
    head.moveTo(end);
    head.lineTo(end2 + ort * (headW * 0.5));
    head.lineTo(end2 - ort * (headW * 0.5));
    head.closeSubpath();

    p.setPen(Qt::NoPen);
    p.setBrush(col);
    p.drawPath(head);
    p.restore();
}

} // namespace shogi::review::ui
