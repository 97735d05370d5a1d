#include <QtTest>

#include <algorithm>

#include "app/ReviewSession.hpp"
#include "domain/sfen_codec.hpp"

using shogi::review::app::ReviewSession;
using shogi::review::app::ReviewSessionCallbacks;
using namespace shogi::review::domain;
namespace sfen = shogi::review::domain::sfen;

class ReviewSessionTest : public QObject {
    Q_OBJECT

private slots:
    void startsAtInitialPosition() {
        ReviewSession s;
        QCOMPARE(s.currentPly(), 0);
        QCOMPARE(s.lastPly(), 0);
        QVERIFY(s.currentPosition() == sfen::startPosition());
        QVERIFY(!s.lastMove().has_value());
        QCOMPARE(QString::fromStdString(s.positionCommand()), QStringLiteral("position startpos"));
    }

    void loadAndNavigate() {
        ReviewSession s;
        int timelineChanges = 0;
        QList<int> cursors;
        ReviewSessionCallbacks cb;
        cb.onTimelineChanged = [&] { ++timelineChanges; };
        cb.onCursorChanged = [&](int ply) { cursors << ply; };
        s.setCallbacks(std::move(cb));

        const auto res = s.load("startpos moves 7g7f 3c3d 2g2f");
        QVERIFY2(res.ok, res.error.c_str());
        QCOMPARE(timelineChanges, 1);
        QCOMPARE(s.lastPly(), 3);
        QCOMPARE(static_cast<int>(s.moveLabels().size()), 3);
        QCOMPARE(QString::fromStdString(s.moveLabels()[0]), QStringLiteral("▲７六歩"));

        cursors.clear();
        s.next();
        s.next();
        QCOMPARE(s.currentPly(), 2);
        QVERIFY(s.currentPosition().sideToMove == Side::Sente);
        QVERIFY(s.lastMove().has_value());
        QVERIFY(*s.lastMove() == Move::boardMove(Square{6, 2}, Square{6, 3}));

        s.last();
        s.next();
        QCOMPARE(s.currentPly(), 3);
        s.setCurrentPly(-5);
        QCOMPARE(s.currentPly(), 0);
        s.prev();
        QCOMPARE(s.currentPly(), 0);

        // Only real cursor moves notify.
        QCOMPARE(cursors, (QList<int>{1, 2, 3, 0}));

        s.setCurrentPly(1);
        QCOMPARE(QString::fromStdString(s.positionCommand()),
                 QStringLiteral("position startpos moves 7g7f"));
    }

    void failedLoadKeepsPreviousGame() {
        ReviewSession s;
        QVERIFY(s.load("startpos moves 7g7f 3c3d").ok);
        s.last();

        const auto res = s.load("startpos moves 7g7f 7g7f");
        QVERIFY(!res.ok);
        QCOMPARE(res.failedPly, 2);
        QVERIFY(res.moveError == MoveError::WrongOwner);
        QVERIFY(!res.error.empty());

        QCOMPARE(s.lastPly(), 2);
        QCOMPARE(s.currentPly(), 2);

        QVERIFY(!s.load("nonsense").ok);
        QCOMPARE(s.lastPly(), 2);
    }

    void playMoveAppendsAtEnd() {
        ReviewSession s;
        QVERIFY(s.load("startpos moves 7g7f").ok);
        s.last();

        int timelineChanges = 0;
        ReviewSessionCallbacks cb;
        cb.onTimelineChanged = [&] { ++timelineChanges; };
        s.setCallbacks(std::move(cb));

        const auto r = s.playMove("3c3d");
        QVERIFY(r.ok);
        QCOMPARE(timelineChanges, 1);
        QCOMPARE(s.lastPly(), 2);
        QCOMPARE(s.currentPly(), 2);
        QCOMPARE(QString::fromStdString(s.moveLabels()[1]), QStringLiteral("△３四歩"));
    }

    void playMoveTruncatesFollowingMoves() {
        ReviewSession s;
        QVERIFY(s.load("startpos moves 7g7f 3c3d 2g2f 8c8d resign").ok);
        QVERIFY(s.timeline().terminal.has_value());
        s.setCurrentPly(2);

        const auto r = s.playMove("6g6f");
        QVERIFY(r.ok);
        QCOMPARE(s.lastPly(), 3);
        QCOMPARE(s.currentPly(), 3);
        QVERIFY(!s.timeline().terminal.has_value());
        QCOMPARE(QString::fromStdString(s.positionCommand()),
                 QStringLiteral("position startpos moves 7g7f 3c3d 6g6f"));
    }

    void rejectedMoveLeavesSessionUnchanged() {
        ReviewSession s;
        QVERIFY(s.load("startpos moves 7g7f 3c3d").ok);
        s.setCurrentPly(1);

        int notifications = 0;
        ReviewSessionCallbacks cb;
        cb.onTimelineChanged = [&] { ++notifications; };
        cb.onCursorChanged = [&](int) { ++notifications; };
        s.setCallbacks(std::move(cb));

        const auto far = s.playMove("3c3e");
        QVERIFY(!far.ok);
        QVERIFY(far.error == MoveError::Unreachable);

        const auto garbage = s.playMove("xx");
        QVERIFY(garbage.error == MoveError::Unparsable);

        QCOMPARE(notifications, 0);
        QCOMPARE(s.lastPly(), 2);
        QCOMPARE(s.currentPly(), 1);
    }

    void hints() {
        ReviewSession s;
        QVERIFY(s.load("startpos moves 7g7f 3c3d").ok);
        s.last();

        const auto pawn = s.reachableFrom(Square{2, 5});
        QCOMPARE(static_cast<int>(pawn.size()), 1);
        QVERIFY(pawn.front() == (Square{2, 4}));

        // Gote pieces are not the side to move.
        QVERIFY(s.reachableFrom(Square{6, 3}).empty());
        QVERIFY(s.reachableFrom(Square{4, 4}).empty());
        QVERIFY(s.reachableFrom(Square{-1, 0}).empty());

        QVERIFY(s.dropTargets(PieceBase::Pawn).empty());

        QVERIFY(s.load("sfen 4k4/9/9/9/9/9/9/9/4K4 b G 1").ok);
        QCOMPARE(static_cast<int>(s.dropTargets(PieceBase::Gold).size()), 79);

        const auto hanging = s.hangingPieces(Side::Sente);
        QCOMPARE(static_cast<int>(hanging.size()), 1);
        QVERIFY(hanging.front() == (Square{4, 8}));
    }
};

QTEST_APPLESS_MAIN(ReviewSessionTest)
#include "test_review_session.moc"
