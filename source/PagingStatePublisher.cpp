#include "PagingStatePublisher.h"
#include <QMetaObject>
#include <QMutexLocker>

PagingStatePublisher::PagingStatePublisher(QObject *parent)
    : QObject(parent) {
    qRegisterMetaType<WindowInfo>("WindowInfo");
    qRegisterMetaType<PagingPhase>("PagingPhase");
}

void PagingStatePublisher::publishWindow(const WindowInfo &info) {
    {
        QMutexLocker locker(&channelMutex);
        windowValue = info;
        if (windowDeliveryPending) {
            return; // The pending delivery will carry this value
        }
        windowDeliveryPending = true;
    }
    QMetaObject::invokeMethod(this, "deliverWindow", Qt::QueuedConnection);
}

void PagingStatePublisher::publishPhase(PagingPhase phase) {
    {
        QMutexLocker locker(&channelMutex);
        if (phaseValue == phase && !phaseDeliveryPending) {
            return;
        }
        phaseValue = phase;
        if (phaseDeliveryPending) {
            return;
        }
        phaseDeliveryPending = true;
    }
    QMetaObject::invokeMethod(this, "deliverPhase", Qt::QueuedConnection);
}

WindowInfo PagingStatePublisher::latestWindow() const {
    QMutexLocker locker(&channelMutex);
    return windowValue;
}

PagingPhase PagingStatePublisher::latestPhase() const {
    QMutexLocker locker(&channelMutex);
    return phaseValue;
}

void PagingStatePublisher::deliverWindow() {
    WindowInfo info;
    {
        QMutexLocker locker(&channelMutex);
        windowDeliveryPending = false;
        info = windowValue;
    }
    emit activeWindowChanged(info);
}

void PagingStatePublisher::deliverPhase() {
    PagingPhase phase;
    {
        QMutexLocker locker(&channelMutex);
        phaseDeliveryPending = false;
        phase = phaseValue;
    }
    emit phaseChanged(phase);
}
