#include "DirectoryChapterSource.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

DirectoryChapterSource::DirectoryChapterSource(const QString &folderPath, int charactersPerPage)
    : folder(QFileInfo(folderPath).absoluteFilePath()), perPage(qMax(1, charactersPerPage)) {
    QDir dir(folder);
    if (!dir.exists()) {
        qWarning() << "Chapter folder doesn't exist:" << folderPath;
        return;
    }

    const QFileInfoList entries = dir.entryInfoList(supportedNameFilters(), QDir::Files | QDir::Readable,
                                                    QDir::Name | QDir::IgnoreCase);
    for (const QFileInfo &entry : entries) {
        chapterFiles.append(entry.absoluteFilePath());
    }

    if (chapterFiles.isEmpty()) {
        qWarning() << "No chapter files found in" << folderPath;
    } else {
        qDebug() << "Found" << chapterFiles.size() << "chapters in" << folder;
    }
}

QStringList DirectoryChapterSource::supportedNameFilters() {
    return { "*.html", "*.xhtml", "*.htm", "*.txt", "*.md" };
}

QString DirectoryChapterSource::chapterFilePath(int chapterIndex) const {
    if (chapterIndex < 0 || chapterIndex >= chapterFiles.size()) {
        return QString();
    }
    return chapterFiles.at(chapterIndex);
}

int DirectoryChapterSource::getChapterCount() const {
    return chapterFiles.size();
}

bool DirectoryChapterSource::loadChapter(int chapterIndex, ChapterPayload &payload, QString *errorMessage) {
    const QString path = chapterFilePath(chapterIndex);
    if (path.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QString("Chapter %1 is out of range").arg(chapterIndex);
        }
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QString("Failed to open %1: %2").arg(path, file.errorString());
        }
        return false;
    }

    const QString content = QString::fromUtf8(file.readAll());
    file.close();

    const QString suffix = QFileInfo(path).suffix().toLower();
    payload = ChapterPayload();
    if (suffix == "html" || suffix == "xhtml" || suffix == "htm") {
        payload.html = content;
    } else {
        payload.text = content;
    }
    payload.pageCount = CharacterPageMeasurer::estimatePageCount(payload.characterCount(), perPage);
    return true;
}
