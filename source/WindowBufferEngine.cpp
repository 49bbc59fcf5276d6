#include "WindowBufferEngine.h"
#include "PhaseStateMachine.h"
#include <QDebug>
#include <QFuture>
#include <QMutexLocker>
#include <QtConcurrent/QtConcurrentRun>
#include <algorithm>

WindowBufferEngine::WindowBufferEngine(ChapterSource *source, const PhaseStateMachine *phase, const PagingConfig &config)
    : source(source), phase(phase), config(config.sanitized()) {
    // One worker per window slot is enough to fill a whole window in parallel
    loadPool.setMaxThreadCount(this->config.windowSize);
}

WindowBufferEngine::~WindowBufferEngine() {
    loadPool.waitForDone();
}

void WindowBufferEngine::reset(int totalChapters) {
    QMutexLocker locker(&bufferMutex);
    QMutexLocker residentLocker(&residentMutex);

    resident.clear();
    currentWindow.clear();
    desiredWindow.clear();
    ++requestGeneration;
    active = -1;
    chapterTotal.storeRelease(qMax(0, totalChapters));
}

QVector<int> WindowBufferEngine::computeWindow(int centerChapterIndex) const {
    const int total = chapterTotal.loadAcquire();
    QVector<int> result;
    if (total <= 0) {
        return result;
    }

    const int size = qMin(config.windowSize, total);
    const int center = qBound(0, centerChapterIndex, total - 1);
    const int start = qBound(0, center - config.windowSize / 2, total - size);

    result.reserve(size);
    for (int chapterIndex = start; chapterIndex < start + size; ++chapterIndex) {
        result.append(chapterIndex);
    }
    return result;
}

WindowBufferEngine::ChapterSlot WindowBufferEngine::fetchChapter(int chapterIndex) const {
    ChapterSlot slot;
    if (!source) {
        slot.errorMessage = QStringLiteral("No chapter source");
        return slot;
    }

    // First attempt plus loadRetryLimit automatic retries
    for (int attempt = 0; attempt <= config.loadRetryLimit; ++attempt) {
        ChapterPayload payload;
        QString message;
        if (source->loadChapter(chapterIndex, payload, &message)) {
            if (payload.pageCount <= 0) {
                payload.pageCount = config.fallbackPageCount;
            }
            slot.state = ChapterSlot::State::Resident;
            slot.payload = payload;
            slot.errorMessage.clear();
            return slot;
        }

        qWarning() << "Chapter" << chapterIndex << "load failed (attempt" << attempt + 1 << "):" << message;
        slot.errorMessage = message;
    }

    slot.state = ChapterSlot::State::Unavailable;
    return slot;
}

QHash<int, WindowBufferEngine::ChapterSlot> WindowBufferEngine::fetchChapters(const QVector<int> &chapterIndices) {
    QVector<QFuture<ChapterSlot>> futures;
    futures.reserve(chapterIndices.size());

    for (int chapterIndex : chapterIndices) {
        futures.append(QtConcurrent::run(&loadPool, [this, chapterIndex]() {
            return fetchChapter(chapterIndex);
        }));
    }

    QHash<int, ChapterSlot> fetched;
    for (int i = 0; i < chapterIndices.size(); ++i) {
        fetched.insert(chapterIndices[i], futures[i].result());
    }
    return fetched;
}

void WindowBufferEngine::announceTarget(int chapterIndex) {
    QMutexLocker residentLocker(&residentMutex);
    ++requestGeneration;
    desiredWindow = currentWindow.contains(chapterIndex) ? currentWindow : computeWindow(chapterIndex);
}

bool WindowBufferEngine::loadWindow(int centerChapterIndex, PagingError *error, bool *superseded) {
    if (superseded) *superseded = false;
    const QVector<int> target = computeWindow(centerChapterIndex);
    {
        // Announce the newest desire before queueing on the mutation lock,
        // so an older request that is still loading knows it has been superseded
        QMutexLocker residentLocker(&residentMutex);
        desiredWindow = target;
        ++requestGeneration;
    }

    QMutexLocker locker(&bufferMutex);

    if (target.isEmpty()) {
        setPagingError(error, PagingError::None);
        return true;
    }

    QVector<int> toLoad;
    {
        QMutexLocker residentLocker(&residentMutex);
        for (int chapterIndex : target) {
            auto it = resident.constFind(chapterIndex);
            if (it == resident.constEnd() || it->state != ChapterSlot::State::Resident) {
                toLoad.append(chapterIndex); // Missing or previously unavailable
            }
        }
    }

    qDebug() << "Loading window" << target.first() << "-" << target.last() << "missing:" << toLoad;
    const QHash<int, ChapterSlot> fetched = fetchChapters(toLoad);

    QVector<int> failed;
    {
        QMutexLocker residentLocker(&residentMutex);
        if (desiredWindow != target) {
            qDebug() << "Discarding superseded load for window" << target.first() << "-" << target.last();
            if (superseded) *superseded = true;
            setPagingError(error, PagingError::None);
            return true;
        }

        // Evict everything outside the new window, then attach the fetched chapters
        const QList<int> residentKeys = resident.keys();
        for (int chapterIndex : residentKeys) {
            if (!target.contains(chapterIndex)) {
                qDebug() << "Unloading chapter" << chapterIndex;
                resident.remove(chapterIndex);
            }
        }
        for (auto it = fetched.constBegin(); it != fetched.constEnd(); ++it) {
            resident.insert(it.key(), it.value());
            if (it->state == ChapterSlot::State::Unavailable) {
                failed.append(it.key());
            }
        }
        currentWindow = target;
    }

    if (!failed.isEmpty()) {
        std::sort(failed.begin(), failed.end());
        qWarning() << "Chapters unavailable after retries:" << failed;
        setPagingError(error, PagingError::LoadFailure);
        return false;
    }

    setPagingError(error, PagingError::None);
    return true;
}

bool WindowBufferEngine::markChapterEvicted(int chapterIndex) {
    QMutexLocker locker(&bufferMutex);
    QMutexLocker residentLocker(&residentMutex);

    if (chapterIndex == active) {
        qDebug() << "Ignoring eviction for active chapter" << chapterIndex;
        return false;
    }
    if (resident.remove(chapterIndex) > 0) {
        qDebug() << "Evicted chapter" << chapterIndex << "on request";
        return true;
    }
    return false;
}

bool WindowBufferEngine::shiftForward(PagingError *error) {
    return shift(true, error);
}

bool WindowBufferEngine::shiftBackward(PagingError *error) {
    return shift(false, error);
}

bool WindowBufferEngine::shift(bool forward, PagingError *error) {
    setPagingError(error, PagingError::None);
    const char *direction = forward ? "forward" : "backward";

    QMutexLocker locker(&bufferMutex);

    if (!phase || !phase->allowsShift()) {
        qDebug() << "Shift" << direction << "blocked outside steady phase";
        return false;
    }

    QVector<int> before;
    int trailing = -1;
    int leading = -1;
    quint64 generation = 0;
    {
        QMutexLocker residentLocker(&residentMutex);
        if (currentWindow.isEmpty()) {
            return false;
        }
        if (desiredWindow != currentWindow) {
            qDebug() << "Shift" << direction << "skipped, a window load is queued";
            return false;
        }

        leading = forward ? currentWindow.last() + 1 : currentWindow.first() - 1;
        trailing = forward ? currentWindow.first() : currentWindow.last();
        if (leading < 0 || leading >= chapterTotal.loadAcquire()) {
            qDebug() << "Shift" << direction << "at document boundary, window" << currentWindow;
            return false;
        }
        if (trailing == active) {
            qDebug() << "Shift" << direction << "would drop active chapter" << active;
            return false;
        }

        before = currentWindow;
        generation = requestGeneration;
    }

    const ChapterSlot slot = fetchChapters(QVector<int>{ leading }).value(leading);

    {
        QMutexLocker residentLocker(&residentMutex);
        if (requestGeneration != generation) {
            // The resident set was not touched yet, so the window stays as it was
            qDebug() << "Discarding superseded shift" << direction;
            return false;
        }

        // Drop the trailing chapter before the leading one is appended
        resident.remove(trailing);

        QVector<int> after = before;
        if (forward) {
            after.removeFirst();
            after.append(leading);
        } else {
            after.removeLast();
            after.prepend(leading);
        }
        resident.insert(leading, slot);
        currentWindow = after;
        desiredWindow = after;

        qDebug() << "*** SHIFT" << direction << "***" << before << "->" << after << "dropped" << trailing << "appended" << leading;
    }

    if (slot.state == ChapterSlot::State::Unavailable) {
        setPagingError(error, PagingError::LoadFailure);
    }
    return true;
}

void WindowBufferEngine::setActiveChapter(int chapterIndex) {
    QMutexLocker residentLocker(&residentMutex);
    active = chapterIndex;
}

int WindowBufferEngine::activeChapter() const {
    QMutexLocker residentLocker(&residentMutex);
    return active;
}

QVector<int> WindowBufferEngine::window() const {
    QMutexLocker residentLocker(&residentMutex);
    return currentWindow;
}

bool WindowBufferEngine::windowContains(int chapterIndex) const {
    QMutexLocker residentLocker(&residentMutex);
    return currentWindow.contains(chapterIndex);
}

QVector<int> WindowBufferEngine::loadedChapterIndices() const {
    QVector<int> indices;
    {
        QMutexLocker residentLocker(&residentMutex);
        for (auto it = resident.constBegin(); it != resident.constEnd(); ++it) {
            if (it->state == ChapterSlot::State::Resident) {
                indices.append(it.key());
            }
        }
    }
    std::sort(indices.begin(), indices.end());
    return indices;
}

QVector<int> WindowBufferEngine::unavailableChapterIndices() const {
    QVector<int> indices;
    {
        QMutexLocker residentLocker(&residentMutex);
        for (auto it = resident.constBegin(); it != resident.constEnd(); ++it) {
            if (it->state == ChapterSlot::State::Unavailable) {
                indices.append(it.key());
            }
        }
    }
    std::sort(indices.begin(), indices.end());
    return indices;
}

bool WindowBufferEngine::isResident(int chapterIndex) const {
    QMutexLocker residentLocker(&residentMutex);
    auto it = resident.constFind(chapterIndex);
    return it != resident.constEnd() && it->state == ChapterSlot::State::Resident;
}

bool WindowBufferEngine::isUnavailable(int chapterIndex) const {
    QMutexLocker residentLocker(&residentMutex);
    auto it = resident.constFind(chapterIndex);
    return it != resident.constEnd() && it->state == ChapterSlot::State::Unavailable;
}

bool WindowBufferEngine::chapterPayload(int chapterIndex, ChapterPayload &payload) const {
    QMutexLocker residentLocker(&residentMutex);
    auto it = resident.constFind(chapterIndex);
    if (it == resident.constEnd() || it->state != ChapterSlot::State::Resident) {
        return false;
    }
    payload = it->payload;
    return true;
}

int WindowBufferEngine::residentPageCount(int chapterIndex) const {
    QMutexLocker residentLocker(&residentMutex);
    auto it = resident.constFind(chapterIndex);
    if (it == resident.constEnd() || it->state != ChapterSlot::State::Resident) {
        return -1;
    }
    return it->payload.pageCount;
}

bool WindowBufferEngine::updateResidentPageCount(int chapterIndex, int pageCount) {
    QMutexLocker locker(&bufferMutex);
    QMutexLocker residentLocker(&residentMutex);

    auto it = resident.find(chapterIndex);
    if (it == resident.end() || it->state != ChapterSlot::State::Resident) {
        return false;
    }
    const int safeCount = qMax(1, pageCount);
    if (it->payload.pageCount == safeCount) {
        return false;
    }
    it->payload.pageCount = safeCount;
    return true;
}
