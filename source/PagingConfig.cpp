#include "PagingConfig.h"
#include <QDebug>

PagingConfig PagingConfig::sanitized() const {
    PagingConfig config = *this;
    if (config.windowSize < 1) {
        qWarning() << "Invalid paging window size" << config.windowSize << "- using 1";
        config.windowSize = 1;
    }
    config.shiftMargin = qBound(0, config.shiftMargin, config.windowSize / 2);
    config.fallbackPageCount = qMax(1, config.fallbackPageCount);
    config.charactersPerPage = qMax(1, config.charactersPerPage);
    config.loadRetryLimit = qMax(0, config.loadRetryLimit);
    return config;
}

PagingConfig PagingConfig::load(QSettings &settings) {
    const PagingConfig defaults;
    PagingConfig config;

    settings.beginGroup("paging");
    config.windowSize = settings.value("windowSize", defaults.windowSize).toInt();
    config.shiftMargin = settings.value("shiftMargin", defaults.shiftMargin).toInt();
    config.fallbackPageCount = settings.value("fallbackPageCount", defaults.fallbackPageCount).toInt();
    config.charactersPerPage = settings.value("charactersPerPage", defaults.charactersPerPage).toInt();
    config.loadRetryLimit = settings.value("loadRetryLimit", defaults.loadRetryLimit).toInt();
    settings.endGroup();

    return config.sanitized();
}

void PagingConfig::save(QSettings &settings) const {
    settings.beginGroup("paging");
    settings.setValue("windowSize", windowSize);
    settings.setValue("shiftMargin", shiftMargin);
    settings.setValue("fallbackPageCount", fallbackPageCount);
    settings.setValue("charactersPerPage", charactersPerPage);
    settings.setValue("loadRetryLimit", loadRetryLimit);
    settings.endGroup();
}
