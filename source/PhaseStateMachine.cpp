#include "PhaseStateMachine.h"
#include <QDebug>

int PhaseStateMachine::centerOf(const QVector<int> &window) {
    return window.isEmpty() ? -1 : window.at(window.size() / 2);
}

void PhaseStateMachine::reset(const QVector<int> &initialWindow) {
    currentPhase.storeRelease(static_cast<int>(PagingPhase::Startup));
    center = centerOf(initialWindow);
}

bool PhaseStateMachine::onChapterEntered(int chapterIndex) {
    if (phase() == PagingPhase::Steady) {
        return false; // Terminal
    }
    if (center < 0 || chapterIndex != center) {
        return false;
    }
    return enterSteady(chapterIndex);
}

bool PhaseStateMachine::onWindowRecomputed(int landingChapter, const QVector<int> &newWindow) {
    if (phase() == PagingPhase::Steady) {
        return false;
    }
    if (center >= 0 && landingChapter >= center) {
        return enterSteady(landingChapter);
    }

    center = centerOf(newWindow);
    qDebug() << "Startup center re-designated to chapter" << center;
    return false;
}

bool PhaseStateMachine::enterSteady(int chapterIndex) {
    currentPhase.storeRelease(static_cast<int>(PagingPhase::Steady));
    qDebug() << "*** PHASE TRANSITION: STARTUP -> STEADY at chapter" << chapterIndex << "(center" << center << ") ***";
    return true;
}
