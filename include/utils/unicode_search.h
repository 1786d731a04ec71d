#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <unicode/regex.h>

namespace docsan {
namespace utils {

/**
 * @brief Byte range [begin, end) in a UTF-8 string
 */
struct ByteRange {
    size_t begin;
    size_t end;
};

/**
 * @brief Case-insensitive literal search over UTF-8 text
 *
 * Uses ICU full case folding, so "José" also finds "JOSÉ" and "josé".
 * Offsets are UTF-8 byte offsets into the searched string. Malformed
 * UTF-8 bytes are treated as U+FFFD and never match a well-formed needle.
 *
 * Copies share the compiled pattern.
 */
class CaseInsensitiveFinder {
public:
    // Throws std::runtime_error when ICU rejects the pattern
    explicit CaseInsensitiveFinder(const std::string& needle);

    // First occurrence starting at or after byte offset `from`
    std::optional<ByteRange> find(const std::string& haystack, size_t from = 0) const;

private:
    std::shared_ptr<const icu::RegexPattern> pattern_;
};

} // namespace utils
} // namespace docsan
