#ifndef PAGINGCONFIG_H
#define PAGINGCONFIG_H

#include <QSettings>

struct PagingConfig {
    int windowSize = 5;           // Number of chapters kept resident
    int shiftMargin = 0;          // Distance from a window edge that triggers a shift in steady phase
    int fallbackPageCount = 1;    // Page count assumed for chapters that were never loaded
    int charactersPerPage = 1800; // Used by CharacterPageMeasurer and DirectoryChapterSource estimates
    int loadRetryLimit = 1;       // Automatic retries for a failing chapter load

    // Clamp every field into its valid range
    PagingConfig sanitized() const;

    static PagingConfig load(QSettings &settings);
    void save(QSettings &settings) const;
};

#endif // PAGINGCONFIG_H
