#pragma once

#include "document/fragment_container.h"
#include "sanitizer/match_pattern.h"
#include "sanitizer/replacement.h"
#include <cstddef>
#include <string>
#include <vector>

namespace docsan {
namespace sanitizer {

struct SplicerOptions {
    size_t max_iterations = 50;        // splices per entry per container
    size_t short_token_max_length = 3;
    bool enable_fallback = true;
};

/**
 * @brief Offsets of one fragment inside the concatenated text
 */
struct FragmentBoundary {
    size_t start;
    size_t end;
    size_t index;
};

/**
 * @brief Concatenated text of a container plus its fragment boundaries
 *
 * Only valid until the next fragment rewrite.
 */
struct FragmentMap {
    std::string text;
    std::vector<FragmentBoundary> bounds;

    static FragmentMap build(const document::IFragmentContainer& container);

    // Fragments overlapping [start, end), in order
    std::vector<FragmentBoundary> overlapping(size_t start, size_t end) const;
};

struct SpliceResult {
    size_t replacements = 0;
    size_t degraded_rewrites = 0;
    size_t abandoned_entries = 0;

    bool changed() const { return replacements > 0; }
};

/**
 * @brief Rewrites replacement originals across fragment boundaries
 *
 * For each entry (longest first) the splicer repeatedly rebuilds the
 * container's FragmentMap, finds the next match and splices it:
 * - the first overlapping fragment keeps its prefix and receives the
 *   replacement
 * - fully covered fragments in between are emptied
 * - the last overlapping fragment keeps only its suffix
 * A match inside a single fragment becomes prefix + replacement + suffix.
 * Only text payloads change; fragment styling is never touched.
 *
 * Searching resumes after the text just written, so a replacement that
 * contains its own original cannot re-match. The number of splices per
 * entry is bounded by SplicerOptions::max_iterations; hitting the bound
 * abandons the entry for that container.
 */
class FragmentSplicer {
public:
    explicit FragmentSplicer(const ReplacementSet& replacements, SplicerOptions options = {});

    SpliceResult splice(document::IFragmentContainer& container) const;

    // Apply one entry; `abandoned` is set when the iteration bound was hit
    size_t spliceEntry(document::IFragmentContainer& container, const Replacement& entry,
                       const MatchPattern& pattern, bool& abandoned) const;

    const SplicerOptions& options() const { return options_; }
    size_t entryCount() const { return entries_.size(); }

private:
    struct CompiledEntry {
        Replacement entry;
        MatchPattern pattern;
    };

    size_t fallbackRewrite(document::IFragmentContainer& container, SpliceResult& result) const;

    SplicerOptions options_;
    std::vector<CompiledEntry> entries_;
};

} // namespace sanitizer
} // namespace docsan
