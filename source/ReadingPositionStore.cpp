#include "ReadingPositionStore.h"
#include <QCryptographicHash>
#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

static const char *POSITIONS_GROUP = "readingPositions";

ReadingPositionStore::ReadingPositionStore(QSettings &settings)
    : settings(settings) {
}

QString ReadingPositionStore::keyForBook(const QString &bookId) {
    // Book ids are usually paths; hash them so separators don't create nested groups
    QCryptographicHash hash(QCryptographicHash::Md5);
    hash.addData(bookId.toUtf8());
    return QString::fromLatin1(hash.result().toHex());
}

void ReadingPositionStore::savePosition(const QString &bookId, const BookmarkRecord &bookmark) {
    if (bookId.isEmpty()) return;

    QJsonObject entry = bookmark.toJson();
    entry["bookId"] = bookId;

    settings.beginGroup(POSITIONS_GROUP);
    settings.setValue(keyForBook(bookId), QString::fromUtf8(QJsonDocument(entry).toJson(QJsonDocument::Compact)));
    settings.endGroup();
}

bool ReadingPositionStore::loadPosition(const QString &bookId, BookmarkRecord &bookmark) const {
    if (bookId.isEmpty()) return false;

    settings.beginGroup(POSITIONS_GROUP);
    const QString raw = settings.value(keyForBook(bookId)).toString();
    settings.endGroup();
    if (raw.isEmpty()) {
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(raw.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Corrupt reading position for" << bookId << ":" << parseError.errorString();
        return false;
    }

    bool ok = false;
    const BookmarkRecord record = BookmarkRecord::fromJson(doc.object(), &ok);
    if (!ok) {
        qWarning() << "Reading position for" << bookId << "has no chapter index";
        return false;
    }
    bookmark = record;
    return true;
}

void ReadingPositionStore::removePosition(const QString &bookId) {
    settings.beginGroup(POSITIONS_GROUP);
    settings.remove(keyForBook(bookId));
    settings.endGroup();
}

bool ReadingPositionStore::hasPosition(const QString &bookId) const {
    settings.beginGroup(POSITIONS_GROUP);
    const bool found = settings.contains(keyForBook(bookId));
    settings.endGroup();
    return found;
}

QStringList ReadingPositionStore::storedBooks() const {
    QStringList books;
    settings.beginGroup(POSITIONS_GROUP);
    const QStringList keys = settings.childKeys();
    for (const QString &key : keys) {
        const QJsonDocument doc = QJsonDocument::fromJson(settings.value(key).toString().toUtf8());
        const QString bookId = doc.object().value("bookId").toString();
        if (!bookId.isEmpty()) {
            books.append(bookId);
        }
    }
    settings.endGroup();
    books.sort();
    return books;
}
