#include <QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "infra/ViewerConfigRepository.hpp"

using shogi::review::domain::ViewerSettings;
using shogi::review::infra::ViewerConfigRepository;

namespace {

bool writeFile(const QString& path, const QByteArray& data) {
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Text)) return false;
    return f.write(data) == data.size();
}

} // namespace

class ViewerConfigRepositoryTest : public QObject {
    Q_OBJECT

private slots:
    void missingFileGivesDefaults() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        ViewerConfigRepository repo(dir.filePath(QStringLiteral("absent.json")).toStdString());

        const ViewerSettings s = repo.load();
        const ViewerSettings defaults;
        QCOMPARE(QString::fromStdString(s.databasePath), QString::fromStdString(defaults.databasePath));
        QCOMPARE(QString::fromStdString(s.startNotation), QStringLiteral("startpos"));
        QCOMPARE(s.showHints, true);
        QCOMPARE(s.maxImportGames, 64);
    }

    void saveThenLoad() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        ViewerConfigRepository repo(dir.filePath(QStringLiteral("viewer.json")).toStdString());

        ViewerSettings s;
        s.databasePath = "/tmp/review.sqlite";
        s.startNotation = "startpos moves 7g7f";
        s.flipBoard = true;
        s.showHints = false;
        s.showHanging = true;
        s.maxImportGames = 12;
        QVERIFY(repo.save(s));

        const ViewerSettings back = repo.load();
        QCOMPARE(QString::fromStdString(back.databasePath), QStringLiteral("/tmp/review.sqlite"));
        QCOMPARE(QString::fromStdString(back.startNotation), QStringLiteral("startpos moves 7g7f"));
        QCOMPARE(back.flipBoard, true);
        QCOMPARE(back.showHints, false);
        QCOMPARE(back.showHanging, true);
        QCOMPARE(back.maxImportGames, 12);
    }

    void invalidValuesFallBackPerKey() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("viewer.json"));
        QVERIFY(writeFile(path,
                          "{ \"database_path\": 42, \"flip_board\": true,"
                          "  \"show_hints\": \"yes\", \"max_import_games\": 5000 }"));

        ViewerConfigRepository repo(path.toStdString());
        const ViewerSettings s = repo.load();
        QCOMPARE(QString::fromStdString(s.databasePath), QStringLiteral("games.sqlite"));
        QCOMPARE(s.flipBoard, true);
        QCOMPARE(s.showHints, true);
        QCOMPARE(s.maxImportGames, 64);
    }

    void brokenJsonGivesDefaults() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("viewer.json"));
        QVERIFY(writeFile(path, "{ not json"));

        ViewerConfigRepository repo(path.toStdString());
        const ViewerSettings s = repo.load();
        QCOMPARE(s.flipBoard, false);
        QCOMPARE(QString::fromStdString(s.startNotation), QStringLiteral("startpos"));
    }
};

QTEST_APPLESS_MAIN(ViewerConfigRepositoryTest)
#include "test_viewer_config_repository.moc"
