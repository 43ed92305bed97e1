#pragma once

#include <memory>
#include <string>
#include <unicode/unistr.h>
#include <unicode/brkiter.h>
#include <unicode/locid.h>

namespace lazybar::util {

/// Number of user-perceived characters (extended grapheme clusters) in a UTF-8 string
inline size_t grapheme_count(const std::string& text) {
    if (text.empty()) {
        return 0;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::BreakIterator> it(
        icu::BreakIterator::createCharacterInstance(icu::Locale::getDefault(), status));

    if (U_FAILURE(status) || !it) {
        // Fallback: count code points
        return static_cast<size_t>(unicode_text.countChar32());
    }

    it->setText(unicode_text);
    size_t count = 0;
    for (int32_t pos = it->next(); pos != icu::BreakIterator::DONE; pos = it->next()) {
        ++count;
    }
    return count;
}

/// Cut a UTF-8 string after max_graphemes clusters, appending an ellipsis
/// when anything was removed. Never splits a combining sequence or emoji.
inline std::string truncate_graphemes(const std::string& text, size_t max_graphemes) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::BreakIterator> it(
        icu::BreakIterator::createCharacterInstance(icu::Locale::getDefault(), status));

    int32_t cut = unicode_text.length();
    if (U_FAILURE(status) || !it) {
        if (static_cast<size_t>(unicode_text.countChar32()) <= max_graphemes) {
            return text;
        }
        cut = unicode_text.moveIndex32(0, static_cast<int32_t>(max_graphemes));
    } else {
        it->setText(unicode_text);
        size_t count = 0;
        int32_t pos = it->first();
        while (count < max_graphemes) {
            pos = it->next();
            if (pos == icu::BreakIterator::DONE) {
                return text;
            }
            ++count;
        }
        if (it->next() == icu::BreakIterator::DONE) {
            return text;
        }
        cut = pos;
    }

    std::string result;
    unicode_text.tempSubString(0, cut).toUTF8String(result);
    result += "…";
    return result;
}

/// Case-folded copy, used for case-insensitive config values
inline std::string fold_case(const std::string& text) {
    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);
    unicode_text.foldCase();
    std::string result;
    unicode_text.toUTF8String(result);
    return result;
}

} // namespace lazybar::util
