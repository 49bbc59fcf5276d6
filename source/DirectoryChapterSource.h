#ifndef DIRECTORYCHAPTERSOURCE_H
#define DIRECTORYCHAPTERSOURCE_H

#include <QString>
#include <QStringList>
#include "ChapterSource.h"

// Treats every markup or text file of a folder as one chapter, in file name order
class DirectoryChapterSource : public ChapterSource {
public:
    explicit DirectoryChapterSource(const QString &folderPath, int charactersPerPage = 1800);

    bool isValid() const { return !chapterFiles.isEmpty(); }
    QString folderPath() const { return folder; }
    QString chapterFilePath(int chapterIndex) const;

    int getChapterCount() const override;
    bool loadChapter(int chapterIndex, ChapterPayload &payload, QString *errorMessage = nullptr) override;

    static QStringList supportedNameFilters();

private:
    QString folder;
    QStringList chapterFiles;
    int perPage;
};

#endif // DIRECTORYCHAPTERSOURCE_H
