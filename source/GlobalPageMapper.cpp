#include "GlobalPageMapper.h"
#include <QDebug>
#include <algorithm>

bool GlobalPageMapper::buildMapping(const QVector<QPair<int, int>> &chapterPageCounts, PagingError *error) {
    QVector<int> counts;
    counts.reserve(chapterPageCounts.size());

    for (int i = 0; i < chapterPageCounts.size(); ++i) {
        if (chapterPageCounts[i].first != i) {
            qWarning() << "buildMapping: chapter" << chapterPageCounts[i].first << "found at position" << i;
            setPagingError(error, PagingError::InvalidChapter);
            return false; // Keep the previous table
        }
        counts.append(qMax(1, chapterPageCounts[i].second));
    }

    pageCounts = counts;
    startIndices = QVector<int>(pageCounts.size(), 0);
    total = 0;
    rebuildFrom(0);

    setPagingError(error, PagingError::None);
    return true;
}

void GlobalPageMapper::rebuildFrom(int chapterIndex) {
    int next = chapterIndex > 0 ? startIndices[chapterIndex - 1] + pageCounts[chapterIndex - 1] : 0;
    for (int i = chapterIndex; i < pageCounts.size(); ++i) {
        startIndices[i] = next;
        next += pageCounts[i];
    }
    total = next;
}

PageLocation GlobalPageMapper::locate(int globalPageIndex, PagingError *error) const {
    if (globalPageIndex < 0 || globalPageIndex >= total) {
        setPagingError(error, PagingError::OutOfRange);
        return PageLocation();
    }

    // Last chapter whose start is <= globalPageIndex
    auto it = std::upper_bound(startIndices.cbegin(), startIndices.cend(), globalPageIndex);
    const int chapterIndex = static_cast<int>(it - startIndices.cbegin()) - 1;

    PageLocation location;
    location.globalPageIndex = globalPageIndex;
    location.chapterIndex = chapterIndex;
    location.inChapterPageIndex = globalPageIndex - startIndices[chapterIndex];

    setPagingError(error, PagingError::None);
    return location;
}

int GlobalPageMapper::globalIndexFor(int chapterIndex, int inChapterPageIndex, PagingError *error) const {
    if (!isValidChapter(chapterIndex)) {
        setPagingError(error, PagingError::InvalidChapter);
        return -1;
    }
    if (inChapterPageIndex < 0 || inChapterPageIndex >= pageCounts[chapterIndex]) {
        setPagingError(error, PagingError::InvalidPage);
        return -1;
    }

    setPagingError(error, PagingError::None);
    return startIndices[chapterIndex] + inChapterPageIndex;
}

int GlobalPageMapper::clampedGlobalIndexFor(int chapterIndex, int inChapterPageIndex, PagingError *error) const {
    if (!isValidChapter(chapterIndex)) {
        setPagingError(error, PagingError::InvalidChapter);
        return -1;
    }
    const int page = qBound(0, inChapterPageIndex, pageCounts[chapterIndex] - 1);
    return globalIndexFor(chapterIndex, page, error);
}

bool GlobalPageMapper::updateChapterPageCount(int chapterIndex, int newCount, PagingError *error) {
    if (!isValidChapter(chapterIndex)) {
        setPagingError(error, PagingError::InvalidChapter);
        return false;
    }

    setPagingError(error, PagingError::None);
    const int safeCount = qMax(1, newCount);
    if (pageCounts[chapterIndex] == safeCount) {
        return false;
    }

    qDebug() << "Chapter" << chapterIndex << "page count" << pageCounts[chapterIndex] << "->" << safeCount;
    pageCounts[chapterIndex] = safeCount;
    rebuildFrom(chapterIndex);
    return true;
}

int GlobalPageMapper::pageCount(int chapterIndex) const {
    return isValidChapter(chapterIndex) ? pageCounts[chapterIndex] : 0;
}

int GlobalPageMapper::chapterStart(int chapterIndex) const {
    return isValidChapter(chapterIndex) ? startIndices[chapterIndex] : -1;
}
