#include <QtTest>

#include <QTemporaryDir>
#include <QtSql/QSqlDatabase>

#include "infra/GameRepository.hpp"

using namespace shogi::review::domain;
using shogi::review::infra::GameRepository;

namespace {

GameRecord makeGame(const std::string& title, TimePoint createdAt) {
    GameRecord g;
    g.title = title;
    g.kifuText = "+7776FU\n%TORYO\n";
    g.format = KifuSource::Csa;
    g.notation = "startpos moves 7g7f resign";
    g.moveCount = 1;
    g.createdAt = createdAt;
    return g;
}

} // namespace

class GameRepositoryTest : public QObject {
    Q_OBJECT

private slots:
    void saveLoadRemove() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString connection = QStringLiteral("test_save_load_remove");
        {
            GameRepository repo(dir.filePath(QStringLiteral("games.sqlite")), connection);
            QVERIFY(repo.isOpen());
            QVERIFY(repo.loadAllGames().empty());

            const TimePoint older = TimePoint(std::chrono::milliseconds(1700000000000LL));
            const TimePoint newer = older + std::chrono::minutes(5);

            const GameId a = repo.saveGame(makeGame("older", older));
            const GameId b = repo.saveGame(makeGame("newer", newer));
            QVERIFY(a > 0);
            QVERIFY(b > 0);
            QVERIFY(a != b);

            const auto games = repo.loadAllGames();
            QCOMPARE(static_cast<int>(games.size()), 2);
            QCOMPARE(QString::fromStdString(games[0].title), QStringLiteral("newer"));
            QCOMPARE(games[0].id, b);
            QVERIFY(games[0].format == KifuSource::Csa);
            QCOMPARE(QString::fromStdString(games[0].notation), QStringLiteral("startpos moves 7g7f resign"));
            QCOMPARE(games[0].moveCount, 1);
            QVERIFY(games[0].createdAt == newer);
            QCOMPARE(QString::fromStdString(games[1].kifuText), QStringLiteral("+7776FU\n%TORYO\n"));

            QVERIFY(repo.removeGame(a));
            QVERIFY(!repo.removeGame(a));
            QCOMPARE(static_cast<int>(repo.loadAllGames().size()), 1);
        }
        QSqlDatabase::removeDatabase(connection);
    }

    void saveWithIdReplaces() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString connection = QStringLiteral("test_save_with_id");
        {
            GameRepository repo(dir.filePath(QStringLiteral("games.sqlite")), connection);
            QVERIFY(repo.isOpen());

            GameRecord g = makeGame("first", TimePoint{});
            g.id = repo.saveGame(g);
            QVERIFY(g.id > 0);

            g.title = "renamed";
            QCOMPARE(repo.saveGame(g), g.id);

            const auto games = repo.loadAllGames();
            QCOMPARE(static_cast<int>(games.size()), 1);
            QCOMPARE(QString::fromStdString(games[0].title), QStringLiteral("renamed"));
            QVERIFY(games[0].createdAt != TimePoint{});
        }
        QSqlDatabase::removeDatabase(connection);
    }

    void gamesSurviveReopen() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("games.sqlite"));
        const QString connection = QStringLiteral("test_reopen");
        {
            GameRepository repo(path, connection);
            QVERIFY(repo.saveGame(makeGame("kept", Clock::now())) > 0);
        }
        QSqlDatabase::removeDatabase(connection);
        {
            GameRepository repo(path, connection);
            const auto games = repo.loadAllGames();
            QCOMPARE(static_cast<int>(games.size()), 1);
            QCOMPARE(QString::fromStdString(games[0].title), QStringLiteral("kept"));
        }
        QSqlDatabase::removeDatabase(connection);
    }
};

QTEST_GUILESS_MAIN(GameRepositoryTest)
#include "test_game_repository.moc"
