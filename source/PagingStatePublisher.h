#ifndef PAGINGSTATEPUBLISHER_H
#define PAGINGSTATEPUBLISHER_H

#include <QObject>
#include <QMutex>
#include "PagingTypes.h"

// Latest-value notification channels for the active window and the phase.
// publish*() may be called from any thread; each channel schedules at most one queued delivery,
// so observers see the newest value and intermediate values may be skipped.
class PagingStatePublisher : public QObject {
    Q_OBJECT

signals:
    void activeWindowChanged(const WindowInfo &info);
    void phaseChanged(PagingPhase phase);

public:
    explicit PagingStatePublisher(QObject *parent = nullptr);

    void publishWindow(const WindowInfo &info);
    void publishPhase(PagingPhase phase);

    WindowInfo latestWindow() const;
    PagingPhase latestPhase() const;

private slots:
    void deliverWindow();
    void deliverPhase();

private:
    mutable QMutex channelMutex;
    WindowInfo windowValue;
    PagingPhase phaseValue = PagingPhase::Startup;
    bool windowDeliveryPending = false;
    bool phaseDeliveryPending = false;
};

#endif // PAGINGSTATEPUBLISHER_H
