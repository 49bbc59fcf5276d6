#ifndef CHAPTERNAVIGATOR_H
#define CHAPTERNAVIGATOR_H

#include <QObject>
#include <QAtomicInt>
#include <QMutex>
#include <QVector>
#include "ChapterSource.h"
#include "GlobalPageMapper.h"
#include "PagingConfig.h"
#include "PagingStatePublisher.h"
#include "PagingTypes.h"
#include "PhaseStateMachine.h"
#include "WindowBufferEngine.h"

// Entry point for the UI shell: turns navigation intents into window loads, phase transitions
// and page locations. All intents are serialized; the const queries read the last published snapshot.
class ChapterNavigator : public QObject {
    Q_OBJECT

signals:
    // Delivered queued, never while a navigation is in progress
    void chaptersUnavailable(const QVector<int> &chapterIndices);

public:
    ChapterNavigator(ChapterSource *source, PageMeasurer *measurer,
                     const PagingConfig &config = PagingConfig(), QObject *parent = nullptr);
    ~ChapterNavigator();

    bool initialize(int startingChapterIndex, PagingError *error = nullptr);
    bool initializeFromBookmark(const BookmarkRecord &bookmark, PagingError *error = nullptr);

    PageLocation navigateToGlobalPage(int globalPageIndex, PagingError *error = nullptr);
    PageLocation navigateToChapter(int chapterIndex, int inChapterPageIndex = 0, PagingError *error = nullptr);
    PageLocation navigateNextChapter(PagingError *error = nullptr);
    PageLocation navigatePreviousChapter(PagingError *error = nullptr);

    // Boundary notifications from the rendering layer
    bool onActiveChapterEntered(int chapterIndex, PagingError *error = nullptr);
    bool onPageWithinChapterChanged(int inChapterPageIndex, PagingError *error = nullptr);
    bool reportMeasuredPageCount(int chapterIndex, int pageCount, PagingError *error = nullptr);
    bool onChapterEvicted(int chapterIndex); // Memory pressure; ignored for the active chapter

    // Layout parameters changed: re-measure resident chapters and keep the reader on the same text
    PageLocation repaginate(PagingError *error = nullptr);

    PageContent getPageContent(int globalPageIndex, PagingError *error = nullptr) const;
    WindowInfo getWindowInfo() const;
    PageLocation currentLocation() const;
    BookmarkRecord currentBookmark() const;
    PagingPhase phase() const { return phaseMachine.phase(); }
    bool isInitialized() const { return initialized.loadAcquire() != 0; }

    int chapterPageCount(int chapterIndex) const;
    int totalGlobalPages() const;

    PagingStatePublisher *statePublisher() const { return publisher; }
    const PagingConfig &pagingConfig() const { return config; }

private:
    bool initializeLocked(int chapterIndex, int inChapterPageIndex, int characterOffset, PagingError *error);
    PageLocation moveToLocked(int chapterIndex, int inChapterPageIndex, PagingError *error);
    void announceTarget(int chapterIndex);
    bool recomputeWindowLocked(int chapterIndex, PagingError *loadError);
    void rehydrateWindowLocked(PagingError *loadError);
    void evaluateShiftLocked(int chapterIndex, PagingError *loadError);
    void measureNewlyLoaded(const QVector<int> &loadedBefore);
    void reportUnavailable();

    PageLocation resolveLocation(int chapterIndex, int inChapterPageIndex, int characterOffset) const;
    int characterOffsetFor(int chapterIndex, int inChapterPageIndex) const;
    void refreshLocationLocked();
    void publishState();
    bool checkInitialized(PagingError *error) const;

    ChapterSource *source;
    PageMeasurer *measurer;
    PagingConfig config;

    PhaseStateMachine phaseMachine;
    WindowBufferEngine engine;
    GlobalPageMapper mapper;
    PageLocation location;

    QMutex navigationMutex;
    QAtomicInt initialized { 0 };

    // Published snapshot for lock-free readers
    mutable QMutex snapshotMutex;
    GlobalPageMapper publishedMapper;
    PageLocation publishedLocation;
    WindowInfo publishedInfo;

    PagingStatePublisher *publisher;
};

#endif // CHAPTERNAVIGATOR_H
