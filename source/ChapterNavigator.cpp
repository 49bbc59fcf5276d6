#include "ChapterNavigator.h"
#include <QDebug>
#include <QMetaObject>
#include <QMutexLocker>
#include <QPair>

ChapterNavigator::ChapterNavigator(ChapterSource *source, PageMeasurer *measurer,
                                   const PagingConfig &config, QObject *parent)
    : QObject(parent),
      source(source),
      measurer(measurer),
      config(config.sanitized()),
      engine(source, &phaseMachine, this->config),
      publisher(new PagingStatePublisher(this)) {}

ChapterNavigator::~ChapterNavigator() = default;

bool ChapterNavigator::checkInitialized(PagingError *error) const {
    if (!isInitialized()) {
        qWarning() << "Navigation before initialize()";
        setPagingError(error, PagingError::NotInitialized);
        return false;
    }
    return true;
}

bool ChapterNavigator::initialize(int startingChapterIndex, PagingError *error) {
    QMutexLocker locker(&navigationMutex);
    return initializeLocked(startingChapterIndex, 0, -1, error);
}

bool ChapterNavigator::initializeFromBookmark(const BookmarkRecord &bookmark, PagingError *error) {
    QMutexLocker locker(&navigationMutex);

    const int total = source ? source->getChapterCount() : 0;
    if (total <= 0) {
        qWarning() << "Cannot restore bookmark: book has no chapters";
        setPagingError(error, PagingError::InvalidChapter);
        return false;
    }

    // The book may have changed since the bookmark was written
    const int chapterIndex = qBound(0, bookmark.chapterIndex, total - 1);
    if (chapterIndex != bookmark.chapterIndex) {
        qWarning() << "Bookmark chapter" << bookmark.chapterIndex << "clamped to" << chapterIndex;
    }
    return initializeLocked(chapterIndex, bookmark.inChapterPageIndex, bookmark.characterOffset, error);
}

bool ChapterNavigator::initializeLocked(int chapterIndex, int inChapterPageIndex, int characterOffset, PagingError *error) {
    const int total = source ? source->getChapterCount() : 0;
    if (chapterIndex < 0 || chapterIndex >= total) {
        qWarning() << "initialize: chapter" << chapterIndex << "outside [0," << total << ")";
        setPagingError(error, PagingError::InvalidChapter);
        return false; // Previous document state stays intact
    }

    qDebug() << "Initializing navigator: chapters=" << total << "start=" << chapterIndex
             << "windowSize=" << config.windowSize;

    engine.reset(total);

    QVector<QPair<int, int>> counts;
    counts.reserve(total);
    for (int i = 0; i < total; ++i) {
        counts.append(qMakePair(i, config.fallbackPageCount));
    }
    mapper.buildMapping(counts);

    phaseMachine.reset(engine.computeWindow(chapterIndex));

    PagingError loadError = PagingError::None;
    engine.loadWindow(chapterIndex, &loadError);
    measureNewlyLoaded(QVector<int>());
    engine.setActiveChapter(chapterIndex);

    location = resolveLocation(chapterIndex, inChapterPageIndex, characterOffset);
    initialized.storeRelease(1);

    publishState();
    publisher->publishPhase(phaseMachine.phase());
    if (loadError != PagingError::None) {
        reportUnavailable();
    }

    setPagingError(error, loadError);
    return loadError == PagingError::None;
}

void ChapterNavigator::announceTarget(int chapterIndex) {
    if (!isInitialized()) {
        return;
    }
    {
        QMutexLocker locker(&snapshotMutex);
        if (!publishedMapper.isValidChapter(chapterIndex)) {
            return;
        }
    }
    // Lets a load still running for an older intent see that it was superseded
    engine.announceTarget(chapterIndex);
}

PageLocation ChapterNavigator::navigateToGlobalPage(int globalPageIndex, PagingError *error) {
    PageLocation announced;
    {
        QMutexLocker locker(&snapshotMutex);
        announced = publishedMapper.locate(globalPageIndex);
    }
    announceTarget(announced.chapterIndex);

    QMutexLocker locker(&navigationMutex);
    if (!checkInitialized(error)) {
        return PageLocation();
    }

    PagingError locateError = PagingError::None;
    const PageLocation target = mapper.locate(globalPageIndex, &locateError);
    if (locateError != PagingError::None) {
        qWarning() << "navigateToGlobalPage: index" << globalPageIndex << "outside [0," << mapper.totalPages() << ")";
        setPagingError(error, locateError);
        return PageLocation();
    }

    return moveToLocked(target.chapterIndex, target.inChapterPageIndex, error);
}

PageLocation ChapterNavigator::navigateToChapter(int chapterIndex, int inChapterPageIndex, PagingError *error) {
    announceTarget(chapterIndex);
    QMutexLocker locker(&navigationMutex);
    if (!checkInitialized(error)) {
        return PageLocation();
    }
    if (!mapper.isValidChapter(chapterIndex)) {
        qWarning() << "navigateToChapter: invalid chapter" << chapterIndex;
        setPagingError(error, PagingError::InvalidChapter);
        return PageLocation();
    }

    return moveToLocked(chapterIndex, inChapterPageIndex, error);
}

PageLocation ChapterNavigator::navigateNextChapter(PagingError *error) {
    announceTarget(currentLocation().chapterIndex + 1);
    QMutexLocker locker(&navigationMutex);
    if (!checkInitialized(error)) {
        return PageLocation();
    }

    const int next = location.chapterIndex + 1;
    if (!mapper.isValidChapter(next)) {
        setPagingError(error, PagingError::OutOfRange);
        return PageLocation();
    }
    return moveToLocked(next, 0, error);
}

PageLocation ChapterNavigator::navigatePreviousChapter(PagingError *error) {
    announceTarget(currentLocation().chapterIndex - 1);
    QMutexLocker locker(&navigationMutex);
    if (!checkInitialized(error)) {
        return PageLocation();
    }

    const int previous = location.chapterIndex - 1;
    if (!mapper.isValidChapter(previous)) {
        setPagingError(error, PagingError::OutOfRange);
        return PageLocation();
    }
    return moveToLocked(previous, 0, error);
}

PageLocation ChapterNavigator::moveToLocked(int chapterIndex, int inChapterPageIndex, PagingError *error) {
    PagingError loadError = PagingError::None;
    if (!engine.windowContains(chapterIndex)) {
        if (!recomputeWindowLocked(chapterIndex, &loadError)) {
            // A newer intent owns the window now; stay where we are
            setPagingError(error, PagingError::None);
            return location;
        }
    } else if (engine.loadedChapterIndices() != engine.window()) {
        rehydrateWindowLocked(&loadError); // Retry unavailable or evicted members
    }
    engine.setActiveChapter(chapterIndex);

    // Page counts may have been corrected by the load, so resolve against the updated mapping
    location = resolveLocation(chapterIndex, inChapterPageIndex, -1);
    publishState();

    setPagingError(error, loadError);
    return location;
}

bool ChapterNavigator::recomputeWindowLocked(int chapterIndex, PagingError *loadError) {
    const QVector<int> loadedBefore = engine.loadedChapterIndices();

    bool superseded = false;
    engine.loadWindow(chapterIndex, loadError, &superseded);
    if (superseded) {
        return false;
    }
    measureNewlyLoaded(loadedBefore);

    if (phaseMachine.onWindowRecomputed(chapterIndex, engine.window())) {
        publisher->publishPhase(phaseMachine.phase());
    }
    if (loadError && *loadError != PagingError::None) {
        reportUnavailable();
    }
    return true;
}

void ChapterNavigator::rehydrateWindowLocked(PagingError *loadError) {
    const QVector<int> loadedBefore = engine.loadedChapterIndices();

    // The middle of the current window recomputes to the same window
    bool superseded = false;
    engine.loadWindow(PhaseStateMachine::centerOf(engine.window()), loadError, &superseded);
    if (superseded) {
        return;
    }
    measureNewlyLoaded(loadedBefore);
    if (loadError && *loadError != PagingError::None) {
        reportUnavailable();
    }
}

bool ChapterNavigator::onActiveChapterEntered(int chapterIndex, PagingError *error) {
    announceTarget(chapterIndex);
    QMutexLocker locker(&navigationMutex);
    if (!checkInitialized(error)) {
        return false;
    }
    if (!mapper.isValidChapter(chapterIndex)) {
        qWarning() << "onActiveChapterEntered: invalid chapter" << chapterIndex;
        setPagingError(error, PagingError::InvalidChapter);
        return false;
    }

    PagingError loadError = PagingError::None;
    if (!engine.windowContains(chapterIndex)) {
        // Reader left the window without a shift: full recomputation
        if (!recomputeWindowLocked(chapterIndex, &loadError)) {
            setPagingError(error, PagingError::None);
            return true;
        }
    } else if (!engine.isResident(chapterIndex)) {
        rehydrateWindowLocked(&loadError);
    }
    engine.setActiveChapter(chapterIndex);
    if (location.chapterIndex != chapterIndex) {
        location = resolveLocation(chapterIndex, 0, -1);
    }

    if (phaseMachine.onChapterEntered(chapterIndex)) {
        publisher->publishPhase(phaseMachine.phase());
    }

    PagingError shiftError = PagingError::None;
    evaluateShiftLocked(chapterIndex, &shiftError);
    if (loadError == PagingError::None) {
        loadError = shiftError;
    }

    // A load or shift may have corrected page counts before the active chapter
    refreshLocationLocked();
    publishState();

    setPagingError(error, loadError);
    return loadError == PagingError::None;
}

void ChapterNavigator::evaluateShiftLocked(int chapterIndex, PagingError *loadError) {
    if (!phaseMachine.allowsShift()) {
        return;
    }

    const QVector<int> window = engine.window();
    const int position = window.indexOf(chapterIndex);
    if (position < 0) {
        return;
    }

    const QVector<int> loadedBefore = engine.loadedChapterIndices();
    bool shifted = false;
    if (window.size() - 1 - position <= config.shiftMargin) {
        shifted = engine.shiftForward(loadError);
    } else if (position <= config.shiftMargin) {
        shifted = engine.shiftBackward(loadError);
    }

    if (shifted) {
        measureNewlyLoaded(loadedBefore);
        if (loadError && *loadError != PagingError::None) {
            reportUnavailable();
        }
    }
}

bool ChapterNavigator::onPageWithinChapterChanged(int inChapterPageIndex, PagingError *error) {
    QMutexLocker locker(&navigationMutex);
    if (!checkInitialized(error)) {
        return false;
    }

    PagingError pageError = PagingError::None;
    mapper.globalIndexFor(location.chapterIndex, inChapterPageIndex, &pageError);
    if (pageError != PagingError::None) {
        qWarning() << "Page" << inChapterPageIndex << "outside chapter" << location.chapterIndex
                   << "(" << mapper.pageCount(location.chapterIndex) << "pages)";
        setPagingError(error, pageError);
        return false;
    }

    location = resolveLocation(location.chapterIndex, inChapterPageIndex, -1);
    publishState();

    setPagingError(error, PagingError::None);
    return true;
}

bool ChapterNavigator::reportMeasuredPageCount(int chapterIndex, int pageCount, PagingError *error) {
    QMutexLocker locker(&navigationMutex);
    if (!checkInitialized(error)) {
        return false;
    }
    if (!mapper.isValidChapter(chapterIndex)) {
        setPagingError(error, PagingError::InvalidChapter);
        return false;
    }

    engine.updateResidentPageCount(chapterIndex, pageCount);
    if (mapper.updateChapterPageCount(chapterIndex, pageCount)) {
        if (location.chapterIndex == chapterIndex) {
            // The active chapter reflowed: follow the text, not the old page number
            location = resolveLocation(chapterIndex, location.inChapterPageIndex, location.characterOffset);
        } else {
            refreshLocationLocked();
        }
        publishState();
    }

    setPagingError(error, PagingError::None);
    return true;
}

bool ChapterNavigator::onChapterEvicted(int chapterIndex) {
    QMutexLocker locker(&navigationMutex);
    if (!isInitialized()) {
        return false;
    }
    if (!engine.markChapterEvicted(chapterIndex)) {
        return false;
    }
    publishState();
    return true;
}

PageLocation ChapterNavigator::repaginate(PagingError *error) {
    QMutexLocker locker(&navigationMutex);
    if (!checkInitialized(error)) {
        return PageLocation();
    }

    // Page numbers are invalidated by reflow, the character offset is not
    const int chapterIndex = location.chapterIndex;
    const int offset = location.characterOffset >= 0
        ? location.characterOffset
        : characterOffsetFor(chapterIndex, location.inChapterPageIndex);

    if (!measurer) {
        qWarning() << "repaginate: no page measurer installed";
    } else {
        const QVector<int> residentChapters = engine.loadedChapterIndices();
        int changed = 0;
        for (int residentChapter : residentChapters) {
            ChapterPayload payload;
            if (!engine.chapterPayload(residentChapter, payload)) {
                continue; // Evicted in the meantime
            }
            const int measured = qMax(1, measurer->measurePageCount(payload));
            engine.updateResidentPageCount(residentChapter, measured);
            if (mapper.updateChapterPageCount(residentChapter, measured)) {
                ++changed;
            }
        }
        qDebug() << "Repaginated" << residentChapters.size() << "resident chapters," << changed << "changed";
    }

    const int oldGlobal = location.globalPageIndex;
    location = resolveLocation(chapterIndex, location.inChapterPageIndex, offset);
    qDebug() << "Repagination position: old=" << oldGlobal << "new=" << location.globalPageIndex;
    publishState();

    setPagingError(error, PagingError::None);
    return location;
}

void ChapterNavigator::measureNewlyLoaded(const QVector<int> &loadedBefore) {
    const QVector<int> loadedNow = engine.loadedChapterIndices();
    for (int chapterIndex : loadedNow) {
        if (loadedBefore.contains(chapterIndex)) {
            continue;
        }

        int count = engine.residentPageCount(chapterIndex);
        if (measurer) {
            ChapterPayload payload;
            if (engine.chapterPayload(chapterIndex, payload)) {
                count = qMax(1, measurer->measurePageCount(payload));
                engine.updateResidentPageCount(chapterIndex, count);
            }
        }
        if (count > 0) {
            mapper.updateChapterPageCount(chapterIndex, count);
        }
    }
}

void ChapterNavigator::reportUnavailable() {
    const QVector<int> unavailable = engine.unavailableChapterIndices();
    if (!unavailable.isEmpty()) {
        // Queued: receivers run after the navigation lock is released and may navigate again
        QMetaObject::invokeMethod(this, [this, unavailable]() {
            emit chaptersUnavailable(unavailable);
        }, Qt::QueuedConnection);
    }
}

int ChapterNavigator::characterOffsetFor(int chapterIndex, int inChapterPageIndex) const {
    ChapterPayload payload;
    const int pages = mapper.pageCount(chapterIndex);
    if (pages <= 0 || !engine.chapterPayload(chapterIndex, payload)) {
        return -1;
    }
    // Rounded up so that mapping the offset back lands on the same page
    const qint64 characters = payload.characterCount();
    const qint64 page = qBound(0, inChapterPageIndex, pages - 1);
    return static_cast<int>((characters * page + pages - 1) / pages);
}

PageLocation ChapterNavigator::resolveLocation(int chapterIndex, int inChapterPageIndex, int characterOffset) const {
    int page = inChapterPageIndex;
    const int pages = mapper.pageCount(chapterIndex);

    ChapterPayload payload;
    if (characterOffset >= 0 && pages > 0 && engine.chapterPayload(chapterIndex, payload)
        && payload.characterCount() > 0) {
        // Pages share offsets when a chapter has more pages than characters: keep the page the offset came from
        if (inChapterPageIndex < 0 || inChapterPageIndex >= pages
            || characterOffsetFor(chapterIndex, inChapterPageIndex) != characterOffset) {
            page = static_cast<int>(static_cast<qint64>(characterOffset) * pages / payload.characterCount());
        }
    }

    PageLocation resolved;
    resolved.globalPageIndex = mapper.clampedGlobalIndexFor(chapterIndex, page);
    if (resolved.globalPageIndex < 0) {
        return PageLocation();
    }
    resolved.chapterIndex = chapterIndex;
    resolved.inChapterPageIndex = resolved.globalPageIndex - mapper.chapterStart(chapterIndex);
    resolved.characterOffset = characterOffset >= 0
        ? characterOffset
        : characterOffsetFor(chapterIndex, resolved.inChapterPageIndex);
    return resolved;
}

void ChapterNavigator::refreshLocationLocked() {
    const int globalPageIndex = mapper.clampedGlobalIndexFor(location.chapterIndex, location.inChapterPageIndex);
    if (globalPageIndex < 0) {
        return;
    }
    location.globalPageIndex = globalPageIndex;
    location.inChapterPageIndex = globalPageIndex - mapper.chapterStart(location.chapterIndex);
}

void ChapterNavigator::publishState() {
    WindowInfo info;
    info.activeChapter = engine.activeChapter();
    info.windowChapters = engine.window();
    info.loadedChapterIndices = engine.loadedChapterIndices();
    info.unavailableChapterIndices = engine.unavailableChapterIndices();
    info.totalChapters = engine.totalChapters();
    info.totalGlobalPages = mapper.totalPages();
    info.phase = phaseMachine.phase();

    {
        QMutexLocker locker(&snapshotMutex);
        publishedMapper = mapper;
        publishedLocation = location;
        publishedInfo = info;
    }
    publisher->publishWindow(info);
}

PageContent ChapterNavigator::getPageContent(int globalPageIndex, PagingError *error) const {
    PageContent content;
    if (!checkInitialized(error)) {
        return content;
    }

    GlobalPageMapper snapshot;
    {
        QMutexLocker locker(&snapshotMutex);
        snapshot = publishedMapper;
    }

    PagingError locateError = PagingError::None;
    const PageLocation pageLocation = snapshot.locate(globalPageIndex, &locateError);
    if (locateError != PagingError::None) {
        setPagingError(error, locateError);
        return content;
    }

    content.chapterIndex = pageLocation.chapterIndex;
    content.inChapterPageIndex = pageLocation.inChapterPageIndex;

    ChapterPayload payload;
    if (engine.chapterPayload(pageLocation.chapterIndex, payload)) {
        content.status = PageContent::Status::Ready;
        content.text = payload.text;
        content.html = payload.html;
    } else if (engine.isUnavailable(pageLocation.chapterIndex)) {
        content.status = PageContent::Status::Unavailable;
    } else {
        content.status = PageContent::Status::NotResident;
    }

    setPagingError(error, PagingError::None);
    return content;
}

WindowInfo ChapterNavigator::getWindowInfo() const {
    QMutexLocker locker(&snapshotMutex);
    return publishedInfo;
}

PageLocation ChapterNavigator::currentLocation() const {
    QMutexLocker locker(&snapshotMutex);
    return publishedLocation;
}

BookmarkRecord ChapterNavigator::currentBookmark() const {
    const PageLocation current = currentLocation();
    BookmarkRecord bookmark;
    bookmark.chapterIndex = qMax(0, current.chapterIndex);
    bookmark.inChapterPageIndex = qMax(0, current.inChapterPageIndex);
    bookmark.characterOffset = current.characterOffset;
    return bookmark;
}

int ChapterNavigator::chapterPageCount(int chapterIndex) const {
    QMutexLocker locker(&snapshotMutex);
    return publishedMapper.pageCount(chapterIndex);
}

int ChapterNavigator::totalGlobalPages() const {
    QMutexLocker locker(&snapshotMutex);
    return publishedMapper.totalPages();
}
