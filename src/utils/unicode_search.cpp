#include "utils/unicode_search.h"

#include <unicode/unistr.h>
#include <unicode/utypes.h>
#include <unicode/utf8.h>
#include <unicode/utf16.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace docsan {
namespace utils {

namespace {

// Decodes `text` and records, for every UTF-16 unit, the byte offset of the
// code point it belongs to. `offsets` gets one extra entry for the end.
icu::UnicodeString decodeUtf8(const std::string& text, std::vector<size_t>& offsets) {
    icu::UnicodeString out;
    offsets.clear();
    offsets.reserve(text.size() + 1);

    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    int32_t length = static_cast<int32_t>(text.size());
    int32_t i = 0;
    while (i < length) {
        int32_t start = i;
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c < 0) {
            c = 0xFFFD;
        }
        out.append(c);
        for (int32_t k = 0; k < U16_LENGTH(c); ++k) {
            offsets.push_back(static_cast<size_t>(start));
        }
    }
    offsets.push_back(text.size());
    return out;
}

} // namespace

CaseInsensitiveFinder::CaseInsensitiveFinder(const std::string& needle) {
    UErrorCode status = U_ZERO_ERROR;
    icu::RegexPattern* compiled = icu::RegexPattern::compile(
        icu::UnicodeString::fromUTF8(needle), UREGEX_LITERAL | UREGEX_CASE_INSENSITIVE, status);
    if (U_FAILURE(status)) {
        delete compiled;
        throw std::runtime_error(std::string("ICU pattern compilation failed: ") + u_errorName(status));
    }
    pattern_.reset(compiled);
}

std::optional<ByteRange> CaseInsensitiveFinder::find(const std::string& haystack, size_t from) const {
    if (from > haystack.size()) {
        return std::nullopt;
    }

    std::vector<size_t> offsets;
    icu::UnicodeString text = decodeUtf8(haystack, offsets);

    // First UTF-16 unit whose code point starts at or after `from`
    auto first = std::lower_bound(offsets.begin(), offsets.end(), from);
    int64_t start = static_cast<int64_t>(first - offsets.begin());

    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher(pattern_->matcher(text, status));
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("ICU matcher creation failed: ") + u_errorName(status));
    }
    bool found = matcher->find(start, status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("ICU search failed: ") + u_errorName(status));
    }
    if (!found) {
        return std::nullopt;
    }
    int32_t begin = matcher->start(status);
    int32_t end = matcher->end(status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("ICU search failed: ") + u_errorName(status));
    }
    return ByteRange{offsets[static_cast<size_t>(begin)], offsets[static_cast<size_t>(end)]};
}

} // namespace utils
} // namespace docsan
