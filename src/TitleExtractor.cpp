#include "TitleExtractor.hpp"

#include <cctype>
#include <regex>

namespace {
// UTF-8 encoding of U+3000 IDEOGRAPHIC SPACE.
constexpr char kIdeographicSpace[] = "\xE3\x80\x80";
constexpr std::size_t kIdeographicSpaceSize = sizeof(kIdeographicSpace) - 1;

// UTF-8 encoding of the volume ordinal prefix.
constexpr char kOrdinalPrefix[] = "第";
constexpr std::size_t kOrdinalPrefixSize = sizeof(kOrdinalPrefix) - 1;

// The kanji are multi-byte, so the optional prefix needs a group.
// Digits are ASCII or full-width U+FF10..U+FF19 (EF BC 90..99).
const std::regex& volumePattern() {
    static const std::regex pattern("^(.+?)((?:第)?(?:[0-9]|\xEF\xBC[\x90-\x99])+巻.*)?$");
    return pattern;
}

// The separator after ')' may be an ideographic space.
const std::regex& seriesPrefixPattern() {
    static const std::regex pattern("^.*\\)(?:\\s|\xE3\x80\x80)\\[.*\\]");
    return pattern;
}

bool startsWithDigit(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    const auto first = static_cast<unsigned char>(value[0]);
    if (first >= '0' && first <= '9') {
        return true;
    }
    if (value.size() < 3 || first != 0xEF || static_cast<unsigned char>(value[1]) != 0xBC) {
        return false;
    }
    const auto last = static_cast<unsigned char>(value[2]);
    return last >= 0x90 && last <= 0x99;
}

bool endsWith(const std::string& value, const char* tail, std::size_t tailSize) {
    return value.size() >= tailSize && value.compare(value.size() - tailSize, tailSize, tail) == 0;
}

bool startsWithSpace(const std::string& value, std::size_t pos, std::size_t& width) {
    if (std::isspace(static_cast<unsigned char>(value[pos]))) {
        width = 1;
        return true;
    }
    if (value.compare(pos, kIdeographicSpaceSize, kIdeographicSpace) == 0) {
        width = kIdeographicSpaceSize;
        return true;
    }
    return false;
}

bool endsWithSpace(const std::string& value, std::size_t end, std::size_t& width) {
    if (std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        width = 1;
        return true;
    }
    if (end >= kIdeographicSpaceSize &&
        value.compare(end - kIdeographicSpaceSize, kIdeographicSpaceSize, kIdeographicSpace) == 0) {
        width = kIdeographicSpaceSize;
        return true;
    }
    return false;
}
}

std::string trimWhitespace(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    std::size_t width = 0;

    while (begin < end && startsWithSpace(value, begin, width)) {
        begin += width;
    }
    while (end > begin && endsWithSpace(value, end, width)) {
        end -= width;
    }

    return value.substr(begin, end - begin);
}

TitleParts splitTitle(const std::string& stem) {
    std::smatch match;
    if (std::regex_match(stem, match, volumePattern())) {
        std::string title = match[1].str();
        std::string suffix = match[2].matched ? match[2].str() : std::string{};

        // The title needs at least one character, so a stem that is only a marker
        // leaves its leading 第 behind in the title.
        if (startsWithDigit(suffix) && endsWith(title, kOrdinalPrefix, kOrdinalPrefixSize)) {
            title.erase(title.size() - kOrdinalPrefixSize);
            suffix.insert(0, kOrdinalPrefix);
        }

        title = trimWhitespace(title);
        if (title.empty()) {
            return {trimWhitespace(stem), {}};
        }
        return {title, suffix};
    }

    // Only the empty stem fails the pattern.
    return {trimWhitespace(stem), {}};
}

std::string cleanSeriesName(const std::string& folderName) {
    return trimWhitespace(std::regex_replace(folderName, seriesPrefixPattern(), "",
                                             std::regex_constants::format_first_only));
}
