#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>
#include <QTextStream>
#include "ChapterNavigator.h"
#include "ChapterSource.h"
#include "DirectoryChapterSource.h"
#include "PagingConfig.h"
#include "ReadingPositionStore.h"

static void printUsage(QTextStream &out) {
    out << "Usage: speedyreader-inspect [--resume] <chapter-folder> [chapter]\n";
    out << "  --resume   start from the position saved for this folder\n";
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("SpeedyReader");
    QCoreApplication::setApplicationName("App");

    QTextStream out(stdout);
    QTextStream err(stderr);

    bool resume = false;
    QString folderPath;
    QString chapterArg;
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == "--resume") {
            resume = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(out);
            return 0;
        } else if (folderPath.isEmpty()) {
            folderPath = arg;
        } else if (chapterArg.isEmpty()) {
            chapterArg = arg;
        } else {
            printUsage(err);
            return 2;
        }
    }

    if (folderPath.isEmpty()) {
        printUsage(err);
        return 2;
    }

    QSettings settings("SpeedyReader", "App");
    const PagingConfig config = PagingConfig::load(settings);

    DirectoryChapterSource source(folderPath, config.charactersPerPage);
    if (!source.isValid()) {
        err << "No chapters found in " << folderPath << "\n";
        return 1;
    }

    CharacterPageMeasurer measurer(config.charactersPerPage);
    ChapterNavigator navigator(&source, &measurer, config);
    ReadingPositionStore positions(settings);
    const QString bookId = QFileInfo(folderPath).absoluteFilePath();

    PagingError error = PagingError::None;
    BookmarkRecord saved;
    if (resume && chapterArg.isEmpty() && positions.loadPosition(bookId, saved)) {
        navigator.initializeFromBookmark(saved, &error);
    } else {
        bool ok = true;
        const int startChapter = chapterArg.isEmpty() ? 0 : chapterArg.toInt(&ok);
        if (!ok) {
            err << "Invalid chapter index: " << chapterArg << "\n";
            return 2;
        }
        navigator.initialize(startChapter, &error);
    }

    // A chapter that failed to load still leaves the navigator usable
    if (!navigator.isInitialized()) {
        err << "Initialization failed: " << pagingErrorToString(error) << "\n";
        return 1;
    }
    if (error == PagingError::LoadFailure) {
        err << "Some chapters could not be loaded\n";
    }

    const PageLocation location = navigator.currentLocation();
    QJsonObject report = navigator.getWindowInfo().toJson();
    QJsonObject locationObject;
    locationObject["globalPageIndex"] = location.globalPageIndex;
    locationObject["chapterIndex"] = location.chapterIndex;
    locationObject["inChapterPageIndex"] = location.inChapterPageIndex;
    locationObject["characterOffset"] = location.characterOffset;
    report["location"] = locationObject;

    out << QJsonDocument(report).toJson(QJsonDocument::Indented);
    out.flush();

    positions.savePosition(bookId, navigator.currentBookmark());
    return 0;
}
