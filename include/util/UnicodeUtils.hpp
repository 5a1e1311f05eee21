#pragma once

#include <memory>
#include <string>
#include <unicode/unistr.h>
#include <unicode/translit.h>

namespace minstrel::util {

/// Transliterate arbitrary UTF-8 text to lowercase ASCII
/// (Björk → bjork, Сплин → splin). Characters with no Latin
/// equivalent are kept as-is and dropped later by slugify().
inline std::string to_ascii_lower(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);

    // Any-Latin: script conversion (Cyrillic, Greek, Kana...)
    // NFD + [:Nonspacing Mark:] Remove: strip diacritics
    // Latin-ASCII: fold remaining Latin letters to pure ASCII
    // One instance per thread; Transliterator is not safe for concurrent use.
    thread_local std::unique_ptr<icu::Transliterator> trans = [] {
        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<icu::Transliterator> t(
            icu::Transliterator::createInstance(
                "Any-Latin; NFD; [:Nonspacing Mark:] Remove; NFC; Latin-ASCII",
                UTRANS_FORWARD,
                status
            )
        );
        if (U_FAILURE(status)) {
            t.reset();
        }
        return t;
    }();

    if (trans) {
        trans->transliterate(unicode_text);
    }

    std::string result;
    unicode_text.toLower().toUTF8String(result);
    return result;
}

/// URL/filesystem safe slug: ASCII lowercase, runs of anything other than
/// [a-z0-9] collapsed to a single '-', no leading or trailing '-'.
/// Result is at most max_length bytes (0 = unbounded).
inline std::string slugify(const std::string& text, size_t max_length = 0) {
    const std::string ascii = to_ascii_lower(text);

    std::string slug;
    slug.reserve(ascii.size());
    bool pending_dash = false;
    for (unsigned char c : ascii) {
        bool alnum = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
        if (!alnum) {
            pending_dash = !slug.empty();
            continue;
        }
        if (pending_dash) {
            slug.push_back('-');
            pending_dash = false;
        }
        slug.push_back(static_cast<char>(c));
    }

    if (max_length > 0 && slug.size() > max_length) {
        slug.resize(max_length);
        while (!slug.empty() && slug.back() == '-') {
            slug.pop_back();
        }
    }
    return slug;
}

} // namespace minstrel::util
