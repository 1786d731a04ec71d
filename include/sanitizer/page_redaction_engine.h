#pragma once

#include "document/fixed_layout.h"
#include "sanitizer/match_pattern.h"
#include "sanitizer/replacement.h"
#include "sanitizer/sanitize_result.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace docsan {
namespace sanitizer {

struct PageRedactionOptions {
    size_t short_token_max_length = 3;
    std::string default_font = "helv";
    double default_font_size = 11.0;
    bool scrub_document = true;
    document::ScrubOptions scrub;
};

/**
 * @brief Styling found under a redaction rectangle
 */
struct RedrawStyle {
    std::string font_name;      // as reported by the span, empty if none matched
    std::string font_code;      // standard font used for the redraw
    double size = 11.0;
    uint32_t color = 0;
    uint32_t flags = 0;
    bool from_span = false;
};

/**
 * @brief Destructive cover-and-redraw of replacement originals on fixed pages
 *
 * Entries are processed longest-first. All occurrences of one entry are
 * registered and then applied before the next entry is searched, so a
 * shorter original can never be found inside text that was already
 * replaced ("Priya" after "Priya Anjali Fernando").
 */
class PageRedactionEngine {
public:
    explicit PageRedactionEngine(const ReplacementSet& replacements,
                                 PageRedactionOptions options = {});

    /**
     * @brief Redact every entry on one page
     * @return Number of rectangles applied on this page
     */
    size_t redactPage(document::IPageSurface& page, SanitizeStats& stats) const;

    /**
     * @brief Redact all pages, then scrub document-level carriers
     *
     * Every page is loaded before the first mutation; a page that cannot be
     * loaded fails the whole operation with MalformedDocument and leaves the
     * document untouched.
     */
    Status redactDocument(document::IFixedLayoutDocument& doc, SanitizeStats& stats) const;

    /**
     * @brief Style of the span overlapping `rect` the most
     *
     * Falls back to the configured default font and size in black when no
     * span overlaps.
     */
    RedrawStyle styleAtRect(const document::IPageSurface& page, const document::Rect& rect) const;

    const PageRedactionOptions& options() const { return options_; }

private:
    struct CompiledEntry {
        Replacement entry;
        MatchPattern pattern;
    };

    PageRedactionOptions options_;
    std::vector<CompiledEntry> entries_;
};

} // namespace sanitizer
} // namespace docsan
