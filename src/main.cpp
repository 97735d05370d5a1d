#include <QApplication>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QString>

#include "infra/GameRepository.hpp"
#include "infra/ViewerConfigRepository.hpp"
#include "ui/MainWindow.hpp"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("shogi-review"));

    const QString appDir = QCoreApplication::applicationDirPath();
    qDebug() << "Application dir:" << appDir;

    // Help Qt find plugins shipped next to the exe (e.g. sqldrivers/qsqlite.dll).
    QCoreApplication::addLibraryPath(appDir);
    QCoreApplication::addLibraryPath(appDir + "/plugins");
    QCoreApplication::addLibraryPath(appDir + "/sqldrivers");

    const QString configPath = appDir + "/viewer.json";
    qDebug() << "Viewer config path:" << configPath;

    shogi::review::infra::ViewerConfigRepository configRepo(configPath.toStdString());
    const auto settings = configRepo.load();

    // Relative database paths live next to the executable.
    const QString dbPath = QDir(appDir).absoluteFilePath(QString::fromStdString(settings.databasePath));
    qDebug() << "Games DB path:" << dbPath;

    shogi::review::infra::GameRepository gameRepo(dbPath);

    shogi::review::ui::MainWindow w(settings, gameRepo.isOpen() ? &gameRepo : nullptr);
    w.show();

    const QStringList args = QCoreApplication::arguments();
    if (args.size() > 1) {
        w.openArgument(args.mid(1).join(' '));
    } else if (settings.startNotation != "startpos") {
        w.openArgument(QString::fromStdString(settings.startNotation));
    }

    return app.exec();
}
