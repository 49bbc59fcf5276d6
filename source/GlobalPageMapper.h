#ifndef GLOBALPAGEMAPPER_H
#define GLOBALPAGEMAPPER_H

#include <QPair>
#include <QVector>
#include "PagingTypes.h"

// Maps the document-wide page counter to (chapter, in-chapter page) and back.
// Value type: the navigator publishes copies of it to lock-free readers (QVector is implicitly shared).
class GlobalPageMapper {
public:
    GlobalPageMapper() = default;

    // Rebuilds the whole table. Chapter indices must be 0..n-1 in order.
    bool buildMapping(const QVector<QPair<int, int>> &chapterPageCounts, PagingError *error = nullptr);

    PageLocation locate(int globalPageIndex, PagingError *error = nullptr) const;
    int globalIndexFor(int chapterIndex, int inChapterPageIndex, PagingError *error = nullptr) const;
    int clampedGlobalIndexFor(int chapterIndex, int inChapterPageIndex, PagingError *error = nullptr) const;

    // Returns true when the mapping changed. Only start indices after chapterIndex are rewritten.
    bool updateChapterPageCount(int chapterIndex, int newCount, PagingError *error = nullptr);

    int chapterCount() const { return pageCounts.size(); }
    int totalPages() const { return total; }
    int pageCount(int chapterIndex) const;
    int chapterStart(int chapterIndex) const;
    bool isValidChapter(int chapterIndex) const { return chapterIndex >= 0 && chapterIndex < pageCounts.size(); }

private:
    void rebuildFrom(int chapterIndex);

    QVector<int> pageCounts;
    QVector<int> startIndices;
    int total = 0;
};

#endif // GLOBALPAGEMAPPER_H
