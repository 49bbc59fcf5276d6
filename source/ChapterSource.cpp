#include "ChapterSource.h"

CharacterPageMeasurer::CharacterPageMeasurer(int charactersPerPage)
    : perPage(qMax(1, charactersPerPage)) {}

int CharacterPageMeasurer::measurePageCount(const ChapterPayload &chapter) const {
    return estimatePageCount(chapter.characterCount(), perPage);
}

void CharacterPageMeasurer::setCharactersPerPage(int charactersPerPage) {
    perPage = qMax(1, charactersPerPage);
}

int CharacterPageMeasurer::estimatePageCount(int characterCount, int charactersPerPage) {
    if (characterCount <= 0 || charactersPerPage <= 0) {
        return 1; // An empty chapter still occupies one page
    }
    return (characterCount + charactersPerPage - 1) / charactersPerPage;
}
