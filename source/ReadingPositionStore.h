#ifndef READINGPOSITIONSTORE_H
#define READINGPOSITIONSTORE_H

#include <QSettings>
#include <QString>
#include <QStringList>
#include "PagingTypes.h"

// Remembers the last reading position per book in the application settings.
// The settings object is owned by the caller and must outlive the store.
class ReadingPositionStore {
public:
    explicit ReadingPositionStore(QSettings &settings);

    void savePosition(const QString &bookId, const BookmarkRecord &bookmark);
    bool loadPosition(const QString &bookId, BookmarkRecord &bookmark) const;
    void removePosition(const QString &bookId);
    bool hasPosition(const QString &bookId) const;
    QStringList storedBooks() const;

private:
    static QString keyForBook(const QString &bookId);

    QSettings &settings;
};

#endif // READINGPOSITIONSTORE_H
