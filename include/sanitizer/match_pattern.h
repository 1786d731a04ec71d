#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "utils/unicode_search.h"

namespace docsan {
namespace sanitizer {

/**
 * @brief Character range [start, end) in a container's concatenated text
 */
struct Match {
    size_t start;
    size_t end;
};

/**
 * @brief Compiled search pattern for one replacement original
 *
 * Short all-uppercase alphabetic tokens ("IT", "HR", "SAP") match
 * case-sensitively and only as whole words, so "IT" never fires inside
 * "within" or "City". Everything else is a case-insensitive literal with
 * Unicode case folding.
 */
class MatchPattern {
public:
    explicit MatchPattern(const std::string& original, size_t short_token_max_length = 3);

    const std::string& original() const { return original_; }
    bool wordBounded() const { return word_bounded_; }

    // First match starting at or after `from`
    std::optional<Match> findFirst(const std::string& text, size_t from = 0) const;
    std::vector<Match> findAll(const std::string& text) const;

    /**
     * @brief Accept a page-search hit given the text rendered under it
     *
     * Page search is case-insensitive; word-bounded tokens additionally need
     * the rendered text (the hit plus its neighbouring glyphs) to contain the
     * original with its exact case as a whole word.
     */
    bool acceptsRendered(const std::string& rendered) const;

    static bool needsWordBoundary(const std::string& original, size_t short_token_max_length = 3);
    static std::string escapeRegex(const std::string& literal);

private:
    std::string original_;
    bool word_bounded_;
    std::regex regex_;
    std::optional<utils::CaseInsensitiveFinder> finder_;
};

} // namespace sanitizer
} // namespace docsan
