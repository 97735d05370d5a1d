#include <QtTest>

#include "domain/kifu/KifuParser.hpp"

using namespace shogi::review::domain::kifu;

namespace {

const char* kCsaGame =
    "V2.2\n"
    "N+Alice\n"
    "N-Bob\n"
    "$EVENT:Test Cup\n"
    "PI\n"
    "+\n"
    "+7776FU,T1\n"
    "-3334FU,T2\n"
    "+8822UM\n"
    "-3122GI\n"
    "+0045KA\n"
    "%TORYO\n";

const char* kKifGame =
    "開始日時：2024/01/01\n"
    "先手：Alice\n"
    "後手：Bob\n"
    "手合割：平手\n"
    "手数----指手---------消費時間--\n"
    "   1 ７六歩(77)   ( 0:01/00:00:01)\n"
    "   2 ３四歩(33)   ( 0:01/00:00:01)\n"
    "*comment\n"
    "   3 ２二角成(88)   ( 0:01/00:00:02)\n"
    "   4 同　銀(31)   ( 0:01/00:00:02)\n"
    "   5 ４五角打   ( 0:01/00:00:03)\n"
    "   6 投了\n"
    "まで5手で先手の勝ち\n";

QString joined(const std::vector<std::string>& moves) {
    QStringList out;
    for (const auto& m : moves) out << QString::fromStdString(m);
    return out.join(QLatin1Char(' '));
}

} // namespace

class KifuParserTest : public QObject {
    Q_OBJECT

private slots:
    void detectsFormats() {
        QVERIFY(detectKifuFormat("startpos moves 7g7f") == KifuFormat::Usi);
        QVERIFY(detectKifuFormat("position sfen 4k4/9/9/9/9/9/9/9/4K4 b - 1") == KifuFormat::Usi);
        QVERIFY(detectKifuFormat(kCsaGame) == KifuFormat::Csa);
        QVERIFY(detectKifuFormat(kKifGame) == KifuFormat::Kif);
        QVERIFY(detectKifuFormat("1 ７六歩(77)") == KifuFormat::Kif);
        QVERIFY(detectKifuFormat("hello world") == KifuFormat::Unknown);
        QVERIFY(detectKifuFormat("") == KifuFormat::Unknown);
        QCOMPARE(QString::fromStdString(to_string(KifuFormat::Csa)), QStringLiteral("csa"));
    }

    void csaMovesWithPromotionAndDrop() {
        const auto res = csaToUsiMoves(kCsaGame);
        QVERIFY2(res.ok, res.error.c_str());
        QCOMPARE(joined(res.moves), QStringLiteral("7g7f 3c3d 8h2b+ 3a2b B*4e"));
        QCOMPARE(QString::fromStdString(res.terminal), QStringLiteral("resign"));
        QCOMPARE(QString::fromStdString(res.headers.at("先手")), QStringLiteral("Alice"));
        QCOMPARE(QString::fromStdString(res.headers.at("後手")), QStringLiteral("Bob"));
        QCOMPARE(QString::fromStdString(res.headers.at("棋戦")), QStringLiteral("Test Cup"));
    }

    void csaPromotedPieceMovingIsNotPromotion() {
        const auto res = csaToUsiMoves("+7776FU\n-3334FU\n+8822UM\n-4132KI\n+2231UM\n%SENNICHITE\n");
        QVERIFY2(res.ok, res.error.c_str());
        QCOMPARE(joined(res.moves), QStringLiteral("7g7f 3c3d 8h2b+ 4a3b 2b3a"));
        QCOMPARE(QString::fromStdString(res.terminal), QStringLiteral("draw"));
    }

    void csaErrorsCarryLineNumbers() {
        const auto wrongSide = csaToUsiMoves("V2.2\n-7776FU\n");
        QVERIFY(!wrongSide.ok);
        QCOMPARE(wrongSide.errorLine, 2);
        QVERIFY(QString::fromStdString(wrongSide.error).startsWith(QStringLiteral("Line 2:")));

        const auto emptySource = csaToUsiMoves("+5554FU\n");
        QVERIFY(!emptySource.ok);
        QCOMPARE(emptySource.errorLine, 1);

        const auto custom = csaToUsiMoves("P1-KY-KE-GI-KI-OU-KI-GI-KE-KY\n");
        QVERIFY(!custom.ok);
        QCOMPARE(custom.errorLine, 1);

        const auto handicap = csaToUsiMoves("PI82HI22KA\n");
        QVERIFY(!handicap.ok);
    }

    void csaPieceCodeMustMatchSource() {
        const auto wrongKind = csaToUsiMoves("+7776HI\n");
        QVERIFY(!wrongKind.ok);
        QCOMPARE(wrongKind.errorLine, 1);
        QVERIFY(QString::fromStdString(wrongKind.error).contains(QStringLiteral("HI")));

        // A promoted piece cannot be recorded under its unpromoted code.
        const auto demoted = csaToUsiMoves("+7776FU\n-3334FU\n+8822UM\n-4132KI\n+2231KA\n");
        QVERIFY(!demoted.ok);
        QCOMPARE(demoted.errorLine, 5);
    }

    void kifLongForm() {
        const auto res = kifToUsiMoves(kKifGame);
        QVERIFY2(res.ok, res.error.c_str());
        QCOMPARE(joined(res.moves), QStringLiteral("7g7f 3c3d 8h2b+ 3a2b B*4e"));
        QCOMPARE(QString::fromStdString(res.terminal), QStringLiteral("resign"));
        QCOMPARE(QString::fromStdString(res.headers.at("先手")), QStringLiteral("Alice"));
        QCOMPARE(QString::fromStdString(res.headers.at("開始日時")), QStringLiteral("2024/01/01"));
    }

    void kifMarksAndNonPromotion() {
        const auto res = kifToUsiMoves("▲７六歩(77)\n△３四歩(33)\n▲２二角不成(88)\n");
        QVERIFY2(res.ok, res.error.c_str());
        QCOMPARE(joined(res.moves), QStringLiteral("7g7f 3c3d 8h2b"));
        QVERIFY(res.terminal.empty());
    }

    void kifPromotedNamesAreNotPromotions() {
        // Replay does not check piece movement, so the silver may jump to 3c.
        const auto res = kifToUsiMoves(
            "1 ７六歩(77)\n2 ３四歩(33)\n3 ２二角成(88)\n4 同　銀(31)\n5 ４五角打\n6 ５二金(41)\n"
            "7 ３三銀成(39)\n8 ８四歩(83)\n9 ４二成銀(33)\n");
        QVERIFY2(res.ok, res.error.c_str());
        QCOMPARE(joined(res.moves), QStringLiteral("7g7f 3c3d 8h2b+ 3a2b B*4e 4a5b 3i3c+ 8c8d 3c4b"));
    }

    void kifPieceNameMustMatchSource() {
        const auto wrongKind = kifToUsiMoves("1 ７六飛(77)\n");
        QVERIFY(!wrongKind.ok);
        QCOMPARE(wrongKind.errorLine, 1);

        const auto promotedName = kifToUsiMoves("1 ７六と(77)\n");
        QVERIFY(!promotedName.ok);
        QCOMPARE(promotedName.errorLine, 1);

        const auto unpromotedName = kifToUsiMoves("1 ７六歩(77)\n2 ３四歩(33)\n3 ２二角成(88)\n4 ４二金(41)\n5 ３一角(22)\n");
        QVERIFY(!unpromotedName.ok);
        QCOMPARE(unpromotedName.errorLine, 5);
    }

    void kifStopsAtTerminalLines() {
        const auto res = kifToUsiMoves("1 ７六歩(77)\nまで1手で中断\n2 ３四歩(33)\n");
        QVERIFY(res.ok);
        QCOMPARE(joined(res.moves), QStringLiteral("7g7f"));

        const auto draw = kifToUsiMoves("1 ７六歩(77)\n2 千日手\n");
        QVERIFY(draw.ok);
        QCOMPARE(QString::fromStdString(draw.terminal), QStringLiteral("draw"));
    }

    void kifErrorsCarryLineNumbers() {
        const auto replay = kifToUsiMoves("先手：A\n手数----指手--\n   1 ７六歩(77)\n   2 ７六歩(77)\n");
        QVERIFY(!replay.ok);
        QCOMPARE(replay.errorLine, 4);
        QVERIFY(QString::fromStdString(replay.error).startsWith(QStringLiteral("Line 4:")));

        const auto mark = kifToUsiMoves("△７六歩(77)\n");
        QVERIFY(!mark.ok);
        QCOMPARE(mark.errorLine, 1);

        const auto same = kifToUsiMoves("1 同　歩(77)\n");
        QVERIFY(!same.ok);

        const auto piece = kifToUsiMoves("1 ７六象(77)\n");
        QVERIFY(!piece.ok);

        const auto handicap = kifToUsiMoves("手合割：香落ち\n1 ７六歩(77)\n");
        QVERIFY(!handicap.ok);
        QCOMPARE(handicap.errorLine, 1);

        const auto diagram = kifToUsiMoves("| ・ ・ ・|\n");
        QVERIFY(!diagram.ok);
    }

    void importUsiNormalizes() {
        const auto res = importKifu("position startpos moves 7g7f 3c3d resign\n");
        QVERIFY2(res.ok, res.error.c_str());
        QVERIFY(res.format == KifuFormat::Usi);
        QCOMPARE(QString::fromStdString(res.notation), QStringLiteral("startpos moves 7g7f 3c3d resign"));
        QCOMPARE(res.moveCount, 2);

        const auto bad = importKifu("startpos moves 7g7f 7g7f");
        QVERIFY(!bad.ok);
        QVERIFY(!bad.error.empty());
    }

    void importCsaAndKif() {
        const auto csa = importKifu(kCsaGame);
        QVERIFY2(csa.ok, csa.error.c_str());
        QVERIFY(csa.format == KifuFormat::Csa);
        QCOMPARE(QString::fromStdString(csa.notation),
                 QStringLiteral("startpos moves 7g7f 3c3d 8h2b+ 3a2b B*4e resign"));
        QCOMPARE(csa.moveCount, 5);

        const auto kif = importKifu(kKifGame);
        QVERIFY2(kif.ok, kif.error.c_str());
        QVERIFY(kif.format == KifuFormat::Kif);
        QCOMPARE(QString::fromStdString(kif.notation), QString::fromStdString(csa.notation));
        QCOMPARE(QString::fromStdString(kif.headers.at("後手")), QStringLiteral("Bob"));
    }

    void importRejectsUnknownText() {
        const auto res = importKifu("just some words");
        QVERIFY(!res.ok);
        QVERIFY(res.format == KifuFormat::Unknown);
    }

    void splitsSeveralGames() {
        const std::string text =
            "先手：A\n"
            "後手：B\n"
            "\n"
            "手数----指手--\n"
            "   1 ７六歩(77)\n"
            "まで1手で中断\n"
            "\n"
            "開始日時：2024/01/02\n"
            "   1 ２六歩(27)\n"
            "   2 ８四歩(83)\n";
        const auto res = splitKifuGames(text);
        QVERIFY(res.ok);
        QCOMPARE(static_cast<int>(res.games.size()), 2);
        QVERIFY(QString::fromStdString(res.games[0]).startsWith(QStringLiteral("先手：A")));
        QVERIFY(QString::fromStdString(res.games[0]).endsWith(QStringLiteral("まで1手で中断")));
        QVERIFY(QString::fromStdString(res.games[1]).startsWith(QStringLiteral("開始日時")));

        const auto first = splitKifuGames(text, 1);
        QVERIFY(first.ok);
        QCOMPARE(static_cast<int>(first.games.size()), 1);

        const auto second = importKifu(res.games[1]);
        QVERIFY2(second.ok, second.error.c_str());
        QCOMPARE(second.moveCount, 2);
    }

    void splitsCsaOnBlankLines() {
        const auto res = splitKifuGames("+7776FU\n-3334FU\n\n\n+2726FU\n");
        QVERIFY(res.ok);
        QCOMPARE(static_cast<int>(res.games.size()), 2);
        QCOMPARE(QString::fromStdString(res.games[1]), QStringLiteral("+2726FU"));
    }

    void splitWithoutGamesFails() {
        const auto res = splitKifuGames("先手：A\n\n後手：B\n");
        QVERIFY(!res.ok);
        QVERIFY(res.games.empty());
        QVERIFY(!splitKifuGames("").ok);
    }
};

QTEST_APPLESS_MAIN(KifuParserTest)
#include "test_kifu_parser.moc"
