#include "test_utils.h"

#include "ChapterNavigator.h"
#include "FakeChapterSource.h"
#include "PagingStatePublisher.h"

#include <QCoreApplication>

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    TestUtils::TestRunner runner("PagingStatePublisher");

    // Test 1: Bursts of window updates collapse into the newest value
    {
        PagingStatePublisher publisher;
        int deliveries = 0;
        WindowInfo received;
        QObject::connect(&publisher, &PagingStatePublisher::activeWindowChanged,
                         [&](const WindowInfo &info) { ++deliveries; received = info; });

        for (int active = 0; active < 3; ++active) {
            WindowInfo info;
            info.activeChapter = active;
            publisher.publishWindow(info);
        }
        runner.expectEq(0, deliveries, "Delivery is queued, not immediate");
        runner.expectEq(2, publisher.latestWindow().activeChapter, "Latest value is readable right away");

        QCoreApplication::processEvents();
        runner.expectEq(1, deliveries, "Three publishes delivered once");
        runner.expectEq(2, received.activeChapter, "Observer sees the newest value");

        WindowInfo next;
        next.activeChapter = 7;
        publisher.publishWindow(next);
        QCoreApplication::processEvents();
        runner.expectEq(2, deliveries, "A later publish is delivered again");
        runner.expectEq(7, received.activeChapter, "Later value delivered");
    }

    // Test 2: Phase channel only reports changes
    {
        PagingStatePublisher publisher;
        int deliveries = 0;
        PagingPhase received = PagingPhase::Startup;
        QObject::connect(&publisher, &PagingStatePublisher::phaseChanged,
                         [&](PagingPhase phase) { ++deliveries; received = phase; });

        publisher.publishPhase(PagingPhase::Startup);
        QCoreApplication::processEvents();
        runner.expectEq(0, deliveries, "Unchanged phase is not delivered");

        publisher.publishPhase(PagingPhase::Steady);
        publisher.publishPhase(PagingPhase::Steady);
        QCoreApplication::processEvents();
        runner.expectEq(1, deliveries, "Phase change delivered once");
        runner.expectTrue(received == PagingPhase::Steady, "Observer sees STEADY");
        runner.expectTrue(publisher.latestPhase() == PagingPhase::Steady, "Latest phase is STEADY");
    }

    // Test 3: Navigator publishes through the channel
    {
        FakeChapterSource source(QVector<int>(10, 3));
        FakePageMeasurer measurer;
        ChapterNavigator navigator(&source, &measurer);

        int windowDeliveries = 0;
        WindowInfo lastWindow;
        QVector<PagingPhase> phases;
        QObject::connect(navigator.statePublisher(), &PagingStatePublisher::activeWindowChanged,
                         [&](const WindowInfo &info) { ++windowDeliveries; lastWindow = info; });
        QObject::connect(navigator.statePublisher(), &PagingStatePublisher::phaseChanged,
                         [&](PagingPhase phase) { phases.append(phase); });

        navigator.initialize(2);
        navigator.onActiveChapterEntered(2);
        navigator.onActiveChapterEntered(3);
        navigator.onActiveChapterEntered(4);
        QCoreApplication::processEvents();

        runner.expectEq(1, windowDeliveries, "Several navigations coalesce into one delivery");
        runner.expectEq(4, lastWindow.activeChapter, "Delivered window has the newest active chapter");
        runner.expectTrue(lastWindow.windowChapters == QVector<int>({ 1, 2, 3, 4, 5 }), "Delivered window is [1..5]");
        runner.expectEq(1, phases.size(), "One phase delivery");
        runner.expectTrue(!phases.isEmpty() && phases.last() == PagingPhase::Steady, "Phase delivery is STEADY");

        const QJsonObject json = navigator.getWindowInfo().toJson();
        runner.expectEq(QString("STEADY"), json.value("phase").toString(), "Window info JSON carries the phase");
        runner.expectEq(4, json.value("activeChapter").toInt(), "Window info JSON carries the active chapter");
    }

    return runner.allPassed() ? 0 : 1;
}
