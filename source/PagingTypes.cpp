#include "PagingTypes.h"
#include <QJsonArray>

QString pagingErrorToString(PagingError error) {
    switch (error) {
    case PagingError::None:
        return QStringLiteral("None");
    case PagingError::OutOfRange:
        return QStringLiteral("OutOfRange");
    case PagingError::InvalidChapter:
        return QStringLiteral("InvalidChapter");
    case PagingError::InvalidPage:
        return QStringLiteral("InvalidPage");
    case PagingError::NotInitialized:
        return QStringLiteral("NotInitialized");
    case PagingError::LoadFailure:
        return QStringLiteral("LoadFailure");
    }
    return QStringLiteral("Unknown");
}

QString pagingPhaseToString(PagingPhase phase) {
    return phase == PagingPhase::Steady ? QStringLiteral("STEADY") : QStringLiteral("STARTUP");
}

static QJsonArray toJsonArray(const QVector<int> &values) {
    QJsonArray array;
    for (int value : values) {
        array.append(value);
    }
    return array;
}

QJsonObject WindowInfo::toJson() const {
    QJsonObject object;
    object["activeChapter"] = activeChapter;
    object["windowChapters"] = toJsonArray(windowChapters);
    object["loadedChapterIndices"] = toJsonArray(loadedChapterIndices);
    object["unavailableChapterIndices"] = toJsonArray(unavailableChapterIndices);
    object["totalChapters"] = totalChapters;
    object["totalGlobalPages"] = totalGlobalPages;
    object["phase"] = pagingPhaseToString(phase);
    return object;
}

QJsonObject BookmarkRecord::toJson() const {
    QJsonObject object;
    object["chapterIndex"] = chapterIndex;
    object["inChapterPageIndex"] = inChapterPageIndex;
    object["characterOffset"] = characterOffset;
    return object;
}

BookmarkRecord BookmarkRecord::fromJson(const QJsonObject &object, bool *ok) {
    BookmarkRecord record;
    const bool valid = object.contains("chapterIndex") && object.value("chapterIndex").isDouble();
    if (ok) *ok = valid;
    if (!valid) {
        return record;
    }

    record.chapterIndex = qMax(0, object.value("chapterIndex").toInt());
    record.inChapterPageIndex = qMax(0, object.value("inChapterPageIndex").toInt(0));
    record.characterOffset = object.value("characterOffset").toInt(-1);
    if (record.characterOffset < -1) {
        record.characterOffset = -1;
    }
    return record;
}
