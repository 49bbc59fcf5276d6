#ifndef WINDOWBUFFERENGINE_H
#define WINDOWBUFFERENGINE_H

#include <QAtomicInt>
#include <QHash>
#include <QMutex>
#include <QString>
#include <QThreadPool>
#include <QVector>
#include "ChapterSource.h"
#include "PagingConfig.h"
#include "PagingTypes.h"

class PhaseStateMachine;

// Keeps a fixed-size contiguous window of chapters resident.
//
// Every mutation (load, eviction, shift, reset) is serialized by bufferMutex, which stays locked while
// the chapter source works. Queries only take residentMutex for a moment, so they never wait on a load.
class WindowBufferEngine {
public:
    WindowBufferEngine(ChapterSource *source, const PhaseStateMachine *phase, const PagingConfig &config = PagingConfig());
    ~WindowBufferEngine();

    WindowBufferEngine(const WindowBufferEngine &) = delete;
    WindowBufferEngine &operator=(const WindowBufferEngine &) = delete;

    // Drops every resident chapter and adopts a new chapter total (new document)
    void reset(int totalChapters);

    QVector<int> computeWindow(int centerChapterIndex) const;

    // Makes exactly computeWindow(center) resident. Returns false with LoadFailure when a member
    // stayed unavailable after retries; the rest of the window is still committed.
    // A load whose target stopped being the desired window is discarded and sets *superseded.
    bool loadWindow(int centerChapterIndex, PagingError *error = nullptr, bool *superseded = nullptr);

    // Records the window a caller is about to ask for, without waiting for the mutation lock.
    // A target already inside the committed window keeps that window.
    void announceTarget(int chapterIndex);

    // Memory pressure hint from the rendering layer. Never evicts the active chapter.
    bool markChapterEvicted(int chapterIndex);

    // Steady phase only. Returns true when the window moved by one chapter.
    bool shiftForward(PagingError *error = nullptr);
    bool shiftBackward(PagingError *error = nullptr);

    void setActiveChapter(int chapterIndex);
    int activeChapter() const;

    int totalChapters() const { return chapterTotal.loadAcquire(); }
    int windowSize() const { return config.windowSize; }

    QVector<int> window() const;
    bool windowContains(int chapterIndex) const;
    QVector<int> loadedChapterIndices() const;
    QVector<int> unavailableChapterIndices() const;
    bool isResident(int chapterIndex) const;
    bool isUnavailable(int chapterIndex) const;
    bool chapterPayload(int chapterIndex, ChapterPayload &payload) const;

    int residentPageCount(int chapterIndex) const; // -1 when not resident
    bool updateResidentPageCount(int chapterIndex, int pageCount);

private:
    struct ChapterSlot {
        enum class State { Resident, Unavailable };

        State state = State::Unavailable;
        ChapterPayload payload;
        QString errorMessage;
    };

    ChapterSlot fetchChapter(int chapterIndex) const;
    QHash<int, ChapterSlot> fetchChapters(const QVector<int> &chapterIndices);
    bool shift(bool forward, PagingError *error);

    ChapterSource *source;
    const PhaseStateMachine *phase;
    PagingConfig config;

    QMutex bufferMutex; // Mutation lock

    mutable QMutex residentMutex; // Guards the members below
    QHash<int, ChapterSlot> resident;
    QVector<int> currentWindow;
    QVector<int> desiredWindow; // Target of the newest request, written before bufferMutex is taken
    quint64 requestGeneration = 0; // Bumped by every load request or announcement
    int active = -1;

    QAtomicInt chapterTotal { 0 };
    QThreadPool loadPool;
};

#endif // WINDOWBUFFERENGINE_H
