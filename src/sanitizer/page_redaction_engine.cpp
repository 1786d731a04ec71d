#include "sanitizer/page_redaction_engine.h"
#include "sanitizer/font_mapper.h"
#include "utils/logger.h"

namespace docsan {
namespace sanitizer {

PageRedactionEngine::PageRedactionEngine(const ReplacementSet& replacements,
                                         PageRedactionOptions options)
    : options_(std::move(options)) {
    entries_.reserve(replacements.size());
    for (const auto& r : replacements) {
        entries_.push_back(CompiledEntry{r, MatchPattern(r.original, options_.short_token_max_length)});
    }
}

RedrawStyle PageRedactionEngine::styleAtRect(const document::IPageSurface& page,
                                             const document::Rect& rect) const {
    RedrawStyle style;
    style.font_code = options_.default_font;
    style.size = options_.default_font_size;

    double best = 0.0;
    for (const auto& span : page.spans()) {
        double overlap = span.bbox.intersect(rect).area();
        if (overlap > best) {
            best = overlap;
            style.font_name = span.font;
            style.size = span.size;
            style.color = span.color;
            style.flags = span.flags;
            style.from_span = true;
        }
    }

    if (style.from_span) {
        style.font_code = FontMapper::code(FontMapper::map(style.font_name, style.flags));
    }
    return style;
}

size_t PageRedactionEngine::redactPage(document::IPageSurface& page, SanitizeStats& stats) const {
    size_t page_applied = 0;

    for (const auto& ce : entries_) {
        auto rects = page.searchFor(ce.entry.original);
        if (rects.empty()) {
            continue;
        }

        size_t registered = 0;
        for (const auto& rect : rects) {
            if (ce.pattern.wordBounded()) {
                // Widen horizontally so the neighbouring glyphs decide the word boundary
                document::Rect context = rect;
                context.x0 -= rect.height() * 0.5;
                context.x1 += rect.height() * 0.5;
                if (!ce.pattern.acceptsRendered(page.textInRect(context))) {
                    continue;
                }
            }

            RedrawStyle style = styleAtRect(page, rect);
            if (style.from_span) {
                stats.fonts_detected.insert(style.font_name);
                stats.colors_detected.insert(style.color);
                stats.sizes_detected.insert(style.size);
            }

            document::RedactionOp op;
            op.rect = rect;
            op.text = ce.entry.replacement;
            op.font_code = style.font_code;
            op.font_size = style.size;
            op.text_color = document::RgbColor::fromInt(style.color);

            if (page.addRedaction(op)) {
                ++registered;
            } else {
                ++stats.skipped_rects;
                DOCSAN_WARN("PageRedactionEngine: Could not register rect for {}",
                            KindUtils::maskValue(ce.entry.kind, ce.entry.original));
            }
        }

        if (registered == 0) {
            continue;
        }

        // Apply before the next entry is searched
        document::ApplyReport report = page.applyRedactions();
        stats.skipped_rects += report.failed;
        stats.total_replacements += report.applied;
        page_applied += report.applied;

        if (report.failed > 0) {
            DOCSAN_WARN("PageRedactionEngine: {} rect(s) failed to apply for {}",
                        report.failed, KindUtils::maskValue(ce.entry.kind, ce.entry.original));
        }
    }

    if (page_applied > 0) {
        ++stats.pages_changed;
    }
    return page_applied;
}

Status PageRedactionEngine::redactDocument(document::IFixedLayoutDocument& doc,
                                           SanitizeStats& stats) const {
    std::vector<document::IPageSurface*> pages;
    pages.reserve(doc.pageCount());
    for (size_t i = 0; i < doc.pageCount(); ++i) {
        document::IPageSurface* page = doc.page(i);
        if (page == nullptr) {
            DOCSAN_ERROR("PageRedactionEngine: Page {} could not be loaded", i);
            return Status::Error(ErrorCode::MalformedDocument,
                                 "page " + std::to_string(i) + " could not be loaded");
        }
        pages.push_back(page);
    }

    for (size_t i = 0; i < pages.size(); ++i) {
        size_t applied = redactPage(*pages[i], stats);
        DOCSAN_DEBUG("PageRedactionEngine: Page {} -> {} redaction(s)", i, applied);
    }

    if (options_.scrub_document) {
        document::ScrubReport report = doc.scrub(options_.scrub);
        DOCSAN_INFO("PageRedactionEngine: Scrubbed {} metadata entries, {} script(s), "
                    "{} attachment(s), {} hidden span(s), {} thumbnail(s)",
                    report.metadata_entries, report.scripts, report.attached_files,
                    report.hidden_spans, report.thumbnails);
    }
    return Status::OK();
}

} // namespace sanitizer
} // namespace docsan
