#include <QtTest>

#include "domain/sfen_codec.hpp"

using namespace shogi::review::domain;
namespace sfen = shogi::review::domain::sfen;

class SfenCodecTest : public QObject {
    Q_OBJECT

private slots:
    void startposMatchesCanonicalLayout() {
        const Position p = sfen::startPosition();
        QCOMPARE(QString::fromStdString(sfen::formatBoard(p.board)),
                 QString::fromLatin1(sfen::kStartposBoard));
        QVERIFY(p.hands.empty());
        QVERIFY(p.sideToMove == Side::Sente);

        const auto parsed = sfen::parsePosition("startpos");
        QVERIFY(parsed.ok);
        QVERIFY(parsed.position == p);
        QCOMPARE(QString::fromStdString(parsed.header), QStringLiteral("startpos"));
    }

    void rowExpandsRunsAndLetters() {
        const auto res = sfen::parseBoard("7kl/9/9/9/9/9/9/9/9");
        QVERIFY(res.ok);

        const auto& king = res.board.at(Square{7, 0});
        const auto& lance = res.board.at(Square{8, 0});
        QVERIFY(king.has_value());
        QVERIFY(lance.has_value());
        QVERIFY(king->base == PieceBase::King);
        QVERIFY(king->owner == Side::Gote);
        QVERIFY(lance->base == PieceBase::Lance);
        QVERIFY(lance->owner == Side::Gote);
        for (int x = 0; x < 7; ++x) {
            QVERIFY(res.board.isEmpty(Square{x, 0}));
        }
    }

    void promotedPiecesRoundTrip() {
        const std::string layout = "ln1g1g1+Rl/1ks2s3/1pppp1n1p/p4pp2/9/2P1P4/PP1P1PP1P/1+bK1G4/LNSG2SNL";
        const auto res = sfen::parseBoard(layout);
        QVERIFY(res.ok);
        QCOMPARE(QString::fromStdString(sfen::formatBoard(res.board)), QString::fromStdString(layout));

        const auto& dragon = res.board.at(Square{7, 0});
        QVERIFY(dragon && dragon->promoted && dragon->base == PieceBase::Rook && dragon->owner == Side::Sente);
        const auto& horse = res.board.at(Square{1, 7});
        QVERIFY(horse && horse->promoted && horse->base == PieceBase::Bishop && horse->owner == Side::Gote);
    }

    void malformedBoards_data() {
        QTest::addColumn<QString>("layout");
        QTest::newRow("eight rows")    << "9/9/9/9/9/9/9/9";
        QTest::newRow("short row")     << "8/9/9/9/9/9/9/9/9";
        QTest::newRow("long row")      << "9p/9/9/9/9/9/9/9/9";
        QTest::newRow("unknown letter")<< "8x/9/9/9/9/9/9/9/9";
        QTest::newRow("promoted gold") << "8+G/9/9/9/9/9/9/9/9";
        QTest::newRow("dangling plus") << "8+/9/9/9/9/9/9/9/9";
        QTest::newRow("zero run")      << "09/9/9/9/9/9/9/9/9";
    }

    void malformedBoards() {
        QFETCH(QString, layout);
        const auto res = sfen::parseBoard(layout.toStdString());
        QVERIFY(!res.ok);
        QVERIFY(res.error.kind == sfen::ParseErrorKind::MalformedBoard);
        QVERIFY(!res.error.message.empty());
    }

    void handsWithMultiDigitCounts() {
        const auto res = sfen::parseHands("2RB10Pp3l");
        QVERIFY(res.ok);
        QCOMPARE(res.hands.count(Side::Sente, PieceBase::Rook), 2u);
        QCOMPARE(res.hands.count(Side::Sente, PieceBase::Bishop), 1u);
        QCOMPARE(res.hands.count(Side::Sente, PieceBase::Pawn), 10u);
        QCOMPARE(res.hands.count(Side::Gote, PieceBase::Pawn), 1u);
        QCOMPARE(res.hands.count(Side::Gote, PieceBase::Lance), 3u);
        QCOMPARE(QString::fromStdString(sfen::formatHands(res.hands)), QStringLiteral("2RB10P3lp"));
    }

    void repeatedHandLettersAccumulate() {
        const auto res = sfen::parseHands("PP2P");
        QVERIFY(res.ok);
        QCOMPARE(res.hands.count(Side::Sente, PieceBase::Pawn), 4u);
    }

    void emptyHands() {
        const auto res = sfen::parseHands("-");
        QVERIFY(res.ok);
        QVERIFY(res.hands.empty());
        QCOMPARE(QString::fromStdString(sfen::formatHands(res.hands)), QStringLiteral("-"));
    }

    void malformedHands_data() {
        QTest::addColumn<QString>("token");
        QTest::newRow("king")          << "K";
        QTest::newRow("dangling count")<< "P2";
        QTest::newRow("unknown")       << "X";
        QTest::newRow("zero count")    << "0P";
        QTest::newRow("empty")         << "";
    }

    void malformedHands() {
        QFETCH(QString, token);
        const auto res = sfen::parseHands(token.toStdString());
        QVERIFY(!res.ok);
        QVERIFY(res.error.kind == sfen::ParseErrorKind::MalformedHands);
    }

    void boardMoveCoordinates() {
        const auto res = sfen::parseMove("7g7f");
        QVERIFY(res.ok);
        QVERIFY(!res.move.isDrop());
        QCOMPARE(res.move.from.x, 2);
        QCOMPARE(res.move.from.y, 6);
        QCOMPARE(res.move.to.x, 2);
        QCOMPARE(res.move.to.y, 5);
        QVERIFY(!res.move.promote);

        const auto promo = sfen::parseMove("8h2b+");
        QVERIFY(promo.ok);
        QVERIFY(promo.move.promote);
        QCOMPARE(QString::fromStdString(sfen::formatMove(promo.move)), QStringLiteral("8h2b+"));
    }

    void dropMove() {
        const auto res = sfen::parseMove("p*5e");
        QVERIFY(res.ok);
        QVERIFY(res.move.isDrop());
        QVERIFY(res.move.piece == PieceBase::Pawn);
        QCOMPARE(res.move.to.x, 4);
        QCOMPARE(res.move.to.y, 4);
        QCOMPARE(QString::fromStdString(sfen::formatMove(res.move)), QStringLiteral("P*5e"));
    }

    void badMoves_data() {
        QTest::addColumn<QString>("token");
        QTest::addColumn<int>("kind");
        QTest::newRow("file zero")   << "0a1b"  << static_cast<int>(sfen::ParseErrorKind::InvalidSquare);
        QTest::newRow("rank j")      << "1j1i"  << static_cast<int>(sfen::ParseErrorKind::InvalidSquare);
        QTest::newRow("drop square") << "P*0e"  << static_cast<int>(sfen::ParseErrorKind::InvalidSquare);
        QTest::newRow("king drop")   << "K*5e"  << static_cast<int>(sfen::ParseErrorKind::MalformedMove);
        QTest::newRow("too short")   << "7g7"   << static_cast<int>(sfen::ParseErrorKind::MalformedMove);
        QTest::newRow("bad suffix")  << "7g7f=" << static_cast<int>(sfen::ParseErrorKind::MalformedMove);
    }

    void badMoves() {
        QFETCH(QString, token);
        QFETCH(int, kind);
        const auto res = sfen::parseMove(token.toStdString());
        QVERIFY(!res.ok);
        QCOMPARE(static_cast<int>(res.error.kind), kind);
    }

    void squareHelpers() {
        const auto sq = sfen::parseSquare("1a");
        QVERIFY(sq.has_value());
        QCOMPARE(sq->x, 8);
        QCOMPARE(sq->y, 0);
        QCOMPARE(QString::fromStdString(sfen::formatSquare(Square{0, 8})), QStringLiteral("9i"));
        QVERIFY(!sfen::parseSquare("10a").has_value());
    }

    void sfenPositionWithDefaults() {
        const auto res = sfen::parsePosition("sfen 4k4/9/9/9/9/9/9/9/4K4");
        QVERIFY(res.ok);
        QVERIFY(res.position.sideToMove == Side::Sente);
        QVERIFY(res.position.hands.empty());
        QCOMPARE(res.moveNumber, 1);
        QCOMPARE(QString::fromStdString(res.header),
                 QStringLiteral("sfen 4k4/9/9/9/9/9/9/9/4K4 b - 1"));
    }

    void fullPositionCommand() {
        const auto res = sfen::parsePosition(
            "position sfen lnsgkgsnl/1r5b1/pppppp1pp/9/9/2P6/PP1PPPPPP/1B5R1/LNSGKGSNL w P 2 moves 3c3d 8h2b+");
        QVERIFY(res.ok);
        QVERIFY(res.position.sideToMove == Side::Gote);
        QCOMPARE(res.position.handCount(Side::Sente, PieceBase::Pawn), 1u);
        QCOMPARE(res.moveNumber, 2);
        QCOMPARE(static_cast<int>(res.moves.size()), 2);
        QCOMPARE(QString::fromStdString(res.moves[1]), QStringLiteral("8h2b+"));

        QCOMPARE(QString::fromStdString(sfen::formatPositionCommand(res.header, res.moves)),
                 QStringLiteral("position sfen lnsgkgsnl/1r5b1/pppppp1pp/9/9/2P6/PP1PPPPPP/1B5R1/LNSGKGSNL w P 2 moves 3c3d 8h2b+"));
    }

    void formatSfenRoundTrip() {
        const std::string text = "ln1gk2nl/1r1s2gb1/p1pppsppp/1p4P2/9/2P6/PP1PPPP1P/1BG4R1/LNS1KGSNL b Pp 13";
        const auto res = sfen::parsePosition("sfen " + text);
        QVERIFY(res.ok);
        QCOMPARE(QString::fromStdString(sfen::formatSfen(res.position, res.moveNumber)),
                 QString::fromStdString(text));
    }

    void positionErrors_data() {
        QTest::addColumn<QString>("command");
        QTest::addColumn<int>("kind");
        QTest::newRow("empty")        << ""          << static_cast<int>(sfen::ParseErrorKind::UnsupportedPosition);
        QTest::newRow("keyword only") << "position"  << static_cast<int>(sfen::ParseErrorKind::UnsupportedPosition);
        QTest::newRow("fen header")   << "fen 9/9/9/9/9/9/9/9/9" << static_cast<int>(sfen::ParseErrorKind::UnsupportedPosition);
        QTest::newRow("bad side")     << "sfen 4k4/9/9/9/9/9/9/9/4K4 x - 1" << static_cast<int>(sfen::ParseErrorKind::MalformedPosition);
        QTest::newRow("bad count")    << "sfen 4k4/9/9/9/9/9/9/9/4K4 b - one" << static_cast<int>(sfen::ParseErrorKind::MalformedPosition);
        QTest::newRow("extra token")  << "sfen 4k4/9/9/9/9/9/9/9/4K4 b - 1 junk" << static_cast<int>(sfen::ParseErrorKind::MalformedPosition);
        QTest::newRow("startpos junk")<< "startpos junk" << static_cast<int>(sfen::ParseErrorKind::MalformedPosition);
        QTest::newRow("bad board")    << "sfen 4k4/9/9 b - 1" << static_cast<int>(sfen::ParseErrorKind::MalformedBoard);
        QTest::newRow("bad hands")    << "sfen 4k4/9/9/9/9/9/9/9/4K4 b K 1" << static_cast<int>(sfen::ParseErrorKind::MalformedHands);
        QTest::newRow("three kings")  << "sfen 4k4/9/9/9/9/9/9/4k4/4K4 b - 1" << static_cast<int>(sfen::ParseErrorKind::ExcessMaterial);
        QTest::newRow("19 pawns")     << "sfen 4k4/9/9/9/9/9/9/9/4K4 b 19P 1" << static_cast<int>(sfen::ParseErrorKind::ExcessMaterial);
    }

    void positionErrors() {
        QFETCH(QString, command);
        QFETCH(int, kind);
        const auto res = sfen::parsePosition(command.toStdString());
        QVERIFY(!res.ok);
        QCOMPARE(static_cast<int>(res.error.kind), kind);
    }

    void moveTokensAreNotValidated() {
        const auto res = sfen::parsePosition("startpos moves 7g7f zz99");
        QVERIFY(res.ok);
        QCOMPARE(static_cast<int>(res.moves.size()), 2);
    }
};

QTEST_APPLESS_MAIN(SfenCodecTest)
#include "test_sfen_codec.moc"
