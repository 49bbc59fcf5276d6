#ifndef PAGINGTYPES_H
#define PAGINGTYPES_H

#include <QString>
#include <QVector>
#include <QJsonObject>
#include <QMetaType>

// Error taxonomy shared by the mapper, the buffer engine and the navigator.
// Operations report through an optional PagingError* (Qt's bool *ok idiom).
enum class PagingError {
    None = 0,
    OutOfRange,      // Global page index outside [0, totalPages)
    InvalidChapter,  // Chapter index outside [0, totalChapters)
    InvalidPage,     // In-chapter page outside the chapter's known page count
    NotInitialized,  // Navigation before initialize()
    LoadFailure      // Chapter content could not be produced by the source
};

QString pagingErrorToString(PagingError error);

inline void setPagingError(PagingError *error, PagingError value) {
    if (error) *error = value;
}

struct PageLocation {
    int globalPageIndex = -1;
    int chapterIndex = -1;
    int inChapterPageIndex = -1;
    int characterOffset = -1; // -1 when unknown

    bool isValid() const { return globalPageIndex >= 0 && chapterIndex >= 0 && inChapterPageIndex >= 0; }

    bool operator==(const PageLocation &other) const {
        return globalPageIndex == other.globalPageIndex
            && chapterIndex == other.chapterIndex
            && inChapterPageIndex == other.inChapterPageIndex
            && characterOffset == other.characterOffset;
    }
    bool operator!=(const PageLocation &other) const { return !(*this == other); }
};

// What the chapter source hands back for one chapter
struct ChapterPayload {
    QString text;
    QString html;
    int pageCount = 0;

    int characterCount() const { return text.isEmpty() ? html.size() : text.size(); }
};

// Content delivered to the rendering layer for a single global page.
// The rendering layer paginates the chapter block itself; the coordinate tells it which page to show.
struct PageContent {
    enum class Status {
        Ready,
        Unavailable, // Chapter failed to load, render the "chapter unavailable" marker
        NotResident  // Chapter is outside the resident window
    };

    Status status = Status::NotResident;
    int chapterIndex = -1;
    int inChapterPageIndex = -1;
    QString text;
    QString html;

    bool isReady() const { return status == Status::Ready; }
};

enum class PagingPhase {
    Startup,
    Steady
};

QString pagingPhaseToString(PagingPhase phase);

struct WindowInfo {
    int activeChapter = -1;
    QVector<int> windowChapters;
    QVector<int> loadedChapterIndices;
    QVector<int> unavailableChapterIndices;
    int totalChapters = 0;
    int totalGlobalPages = 0;
    PagingPhase phase = PagingPhase::Startup;

    QJsonObject toJson() const;
};

// Position record persisted by the host shell
struct BookmarkRecord {
    int chapterIndex = 0;
    int inChapterPageIndex = 0;
    int characterOffset = -1;

    QJsonObject toJson() const;
    static BookmarkRecord fromJson(const QJsonObject &object, bool *ok = nullptr);
};

Q_DECLARE_METATYPE(WindowInfo)
Q_DECLARE_METATYPE(PagingPhase)

#endif // PAGINGTYPES_H
