#include "test_utils.h"

#include "ChapterNavigator.h"
#include "ChapterSource.h"
#include "DirectoryChapterSource.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

static bool writeFile(const QString &path, const QString &content) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    file.write(content.toUtf8());
    return true;
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    TestUtils::TestRunner runner("DirectoryChapterSource");

    // Test 1: Page estimate
    {
        runner.expectEq(1, CharacterPageMeasurer::estimatePageCount(0, 100), "Empty chapter has one page");
        runner.expectEq(1, CharacterPageMeasurer::estimatePageCount(100, 100), "Exactly one page");
        runner.expectEq(2, CharacterPageMeasurer::estimatePageCount(101, 100), "Partial page rounds up");

        CharacterPageMeasurer measurer(10);
        ChapterPayload payload;
        payload.html = QString(25, 'x');
        runner.expectEq(3, measurer.measurePageCount(payload), "Markup length used when there is no text");
        measurer.setCharactersPerPage(50);
        runner.expectEq(1, measurer.measurePageCount(payload), "Smaller layout needs fewer pages");
    }

    QTemporaryDir dir;
    runner.expectTrue(dir.isValid(), "Temporary chapter folder");
    writeFile(dir.filePath("02-second.html"), "<p>" + QString(250, 'b') + "</p>");
    writeFile(dir.filePath("01-first.txt"), QString(90, 'a'));
    writeFile(dir.filePath("03-third.md"), QString::fromUtf8("# Kapitel \xc3\xbc") + QString(10, 'c'));
    writeFile(dir.filePath("cover.jpg"), "binary");

    // Test 2: Chapter discovery
    {
        DirectoryChapterSource source(dir.path(), 100);
        runner.expectTrue(source.isValid(), "Folder with chapters is valid");
        runner.expectEq(3, source.getChapterCount(), "Images are not chapters");
        runner.expectTrue(source.chapterFilePath(0).endsWith("01-first.txt"), "Chapters sorted by name");
        runner.expectTrue(source.chapterFilePath(2).endsWith("03-third.md"), "Last chapter is the markdown file");
        runner.expectTrue(source.chapterFilePath(3).isEmpty(), "No path past the last chapter");
    }

    // Test 3: Loading
    {
        DirectoryChapterSource source(dir.path(), 100);
        ChapterPayload payload;
        QString message;

        runner.expectTrue(source.loadChapter(0, payload, &message), "Text chapter loads");
        runner.expectEq(90, payload.text.size(), "Text content read");
        runner.expectTrue(payload.html.isEmpty(), "Text chapter has no markup");
        runner.expectEq(1, payload.pageCount, "90 characters fit one page");

        runner.expectTrue(source.loadChapter(1, payload, &message), "Markup chapter loads");
        runner.expectTrue(payload.html.startsWith("<p>"), "Markup kept as html");
        runner.expectEq(3, payload.pageCount, "257 characters need three pages");

        runner.expectTrue(source.loadChapter(2, payload, &message), "Markdown chapter loads");
        runner.expectTrue(payload.text.contains(QChar(0x00FC)), "UTF-8 decoded");

        runner.expectFalse(source.loadChapter(5, payload, &message), "Unknown chapter fails");
        runner.expectFalse(message.isEmpty(), "Failure has a message");

        QFile::remove(dir.filePath("03-third.md"));
        message.clear();
        runner.expectFalse(source.loadChapter(2, payload, &message), "Deleted file fails to load");
        runner.expectFalse(message.isEmpty(), "I/O failure has a message");
        writeFile(dir.filePath("03-third.md"), QString(10, 'c'));
    }

    // Test 4: Missing folder
    {
        DirectoryChapterSource source(dir.filePath("nowhere"));
        runner.expectFalse(source.isValid(), "Missing folder is invalid");
        runner.expectEq(0, source.getChapterCount(), "Missing folder has no chapters");
    }

    // Test 5: Driving a navigator from a folder
    {
        DirectoryChapterSource source(dir.path(), 100);
        CharacterPageMeasurer measurer(100);
        PagingConfig config;
        config.windowSize = 3;
        ChapterNavigator navigator(&source, &measurer, config);

        runner.expectTrue(navigator.initialize(0), "Navigator opens the folder");
        runner.expectEq(3, navigator.getWindowInfo().windowChapters.size(), "Whole short book is resident");
        runner.expectEq(5, navigator.totalGlobalPages(), "1 + 3 + 1 pages");
        const PageContent content = navigator.getPageContent(3);
        runner.expectTrue(content.isReady(), "Last page of chapter 1 is ready");
        runner.expectEq(1, content.chapterIndex, "Page 3 is in chapter 1");
    }

    // Test 6: An unreadable chapter still leaves the navigator open
    {
        DirectoryChapterSource source(dir.path(), 100);
        CharacterPageMeasurer measurer(100);
        PagingConfig config;
        config.windowSize = 3;
        ChapterNavigator navigator(&source, &measurer, config);
        QFile::remove(dir.filePath("03-third.md"));

        PagingError error = PagingError::None;
        runner.expectFalse(navigator.initialize(0, &error), "Initialization reports the failed chapter");
        runner.expectTrue(error == PagingError::LoadFailure, "Failure is a load failure");
        runner.expectTrue(navigator.isInitialized(), "Navigator is open anyway");
        runner.expectTrue(navigator.getPageContent(0).isReady(), "Readable chapters are served");
        runner.expectEq(QVector<int>{ 0, 1 }, navigator.getWindowInfo().loadedChapterIndices, "Only readable chapters are resident");
        writeFile(dir.filePath("03-third.md"), QString(10, 'c'));
    }

    return runner.allPassed() ? 0 : 1;
}
