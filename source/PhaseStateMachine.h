#ifndef PHASESTATEMACHINE_H
#define PHASESTATEMACHINE_H

#include <QAtomicInt>
#include <QVector>
#include "PagingTypes.h"

// STARTUP -> STEADY, exactly once per open document.
// Mutated only under the navigator's mutation lock; phase() may be read from any thread.
class PhaseStateMachine {
public:
    PhaseStateMachine() = default;

    // Back to STARTUP with the middle of the initial window as the designated center
    void reset(const QVector<int> &initialWindow);

    // Active chapter changed. Returns true when this call moved the machine to STEADY.
    bool onChapterEntered(int chapterIndex);

    // A navigation recomputed the window. Landing at or after the center promotes to STEADY,
    // otherwise the center follows the recomputed window. Returns true on transition.
    bool onWindowRecomputed(int landingChapter, const QVector<int> &newWindow);

    PagingPhase phase() const { return static_cast<PagingPhase>(currentPhase.loadAcquire()); }
    bool allowsShift() const { return phase() == PagingPhase::Steady; }
    int centerChapter() const { return center; }

    static int centerOf(const QVector<int> &window);

private:
    bool enterSteady(int chapterIndex);

    QAtomicInt currentPhase { static_cast<int>(PagingPhase::Startup) };
    int center = -1;
};

#endif // PHASESTATEMACHINE_H
