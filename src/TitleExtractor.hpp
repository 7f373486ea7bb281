#ifndef TITLE_EXTRACTOR_HPP
#define TITLE_EXTRACTOR_HPP

#include <string>

// Series title and the trailing volume designator of an archive stem.
struct TitleParts {
    std::string title;
    std::string suffix;
};

// Split an archive stem ("Foo第1巻") into title ("Foo") and suffix ("第1巻").
// Without a volume marker the suffix is empty and the trimmed stem is the title.
TitleParts splitTitle(const std::string& stem);

// Strip the "あ) [author]" prefix of a series folder name and trim the rest.
std::string cleanSeriesName(const std::string& folderName);

// Trim ASCII whitespace and U+3000 from both ends.
std::string trimWhitespace(const std::string& value);

#endif
