#ifndef CHAPTERSOURCE_H
#define CHAPTERSOURCE_H

#include <QString>
#include "PagingTypes.h"

// Produces per-chapter content for the buffer engine.
// loadChapter() may be slow and is called from worker threads, possibly for several chapters at once.
class ChapterSource {
public:
    virtual ~ChapterSource() = default;

    virtual int getChapterCount() const = 0;

    // Returns false on I/O or parse error; errorMessage receives a description when provided
    virtual bool loadChapter(int chapterIndex, ChapterPayload &payload, QString *errorMessage = nullptr) = 0;
};

// The rendering layer seen as a pure function of (chapter block, viewport) -> page count
class PageMeasurer {
public:
    virtual ~PageMeasurer() = default;

    virtual int measurePageCount(const ChapterPayload &chapter) const = 0;
};

// Estimates pages from the chapter length; charactersPerPage stands in for the viewport and font size
class CharacterPageMeasurer : public PageMeasurer {
public:
    explicit CharacterPageMeasurer(int charactersPerPage = 1800);

    int measurePageCount(const ChapterPayload &chapter) const override;

    void setCharactersPerPage(int charactersPerPage);
    int charactersPerPage() const { return perPage; }

    static int estimatePageCount(int characterCount, int charactersPerPage);

private:
    int perPage;
};

#endif // CHAPTERSOURCE_H
