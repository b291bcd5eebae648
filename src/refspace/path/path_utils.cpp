#include "path_utils.hpp"

#include <cstddef>

namespace RS {

namespace {

// Matches one pattern element at patternIdx against name[nameIdx]. On success
// patternIdx is advanced past the element.
auto match_single(std::string_view const pattern, size_t& patternIdx, char const ch) -> bool {
    if (pattern[patternIdx] == '\\') {
        patternIdx++; // Skip backslash
        if (patternIdx < pattern.size() && pattern[patternIdx] == ch) {
            patternIdx++;
            return true;
        }
        return false;
    }
    if (pattern[patternIdx] == '?') {
        patternIdx++;
        return true;
    }
    if (pattern[patternIdx] == '[') {
        size_t idx    = patternIdx + 1;
        bool   invert = false;
        if (idx < pattern.size() && pattern[idx] == '!') {
            invert = true;
            idx++;
        }

        bool matched  = false;
        char prevChar = '\0';
        while (idx < pattern.size() && pattern[idx] != ']') {
            if (pattern[idx] == '-' && prevChar != '\0' && idx + 1 < pattern.size() && pattern[idx + 1] != ']') {
                char rangeEnd = pattern[idx + 1];
                if (ch >= prevChar && ch <= rangeEnd) {
                    matched = true;
                }
                idx += 2; // Skip both the hyphen and range end character
            } else {
                if (pattern[idx] == ch) {
                    matched = true;
                }
                prevChar = pattern[idx];
                idx++;
            }
        }

        if (idx >= pattern.size()) {
            return false; // Malformed pattern - missing closing bracket
        }
        if (matched == invert) {
            return false;
        }
        patternIdx = idx + 1;
        return true;
    }
    if (pattern[patternIdx] == ch) {
        patternIdx++;
        return true;
    }
    return false;
}

} // namespace

auto match_names(std::string_view const pattern, std::string_view const name) -> bool {
    size_t patternIdx = 0;
    size_t nameIdx    = 0;
    // Resume point for the most recent '*', used to backtrack when a later element fails.
    size_t starPatternIdx = std::string_view::npos;
    size_t starNameIdx    = 0;

    while (nameIdx < name.size()) {
        if (patternIdx < pattern.size() && pattern[patternIdx] == '*') {
            starPatternIdx = ++patternIdx;
            starNameIdx    = nameIdx;
            continue;
        }
        if (patternIdx < pattern.size() && match_single(pattern, patternIdx, name[nameIdx])) {
            nameIdx++;
            continue;
        }
        if (starPatternIdx == std::string_view::npos) {
            return false;
        }
        patternIdx = starPatternIdx;
        nameIdx    = ++starNameIdx;
    }

    // Skip any remaining wildcards
    while (patternIdx < pattern.size() && pattern[patternIdx] == '*') {
        patternIdx++;
    }
    return patternIdx == pattern.size();
}

auto is_glob(std::string_view text) -> bool {
    bool previousCharWasEscape = false;
    for (auto const& ch : text) {
        if (ch == '\\' && !previousCharWasEscape) {
            previousCharWasEscape = true;
            continue;
        }
        if (previousCharWasEscape) {
            previousCharWasEscape = false;
            continue;
        }
        if (ch == '*' || ch == '?' || ch == '[') {
            return true;
        }
    }
    return false;
}

} // namespace RS
