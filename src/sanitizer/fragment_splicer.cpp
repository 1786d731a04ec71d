#include "sanitizer/fragment_splicer.h"
#include "utils/logger.h"

namespace docsan {
namespace sanitizer {

FragmentMap FragmentMap::build(const document::IFragmentContainer& container) {
    FragmentMap map;
    size_t count = container.fragmentCount();
    map.bounds.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const std::string& t = container.fragmentText(i);
        size_t start = map.text.size();
        map.text += t;
        map.bounds.push_back(FragmentBoundary{start, map.text.size(), i});
    }
    return map;
}

std::vector<FragmentBoundary> FragmentMap::overlapping(size_t start, size_t end) const {
    std::vector<FragmentBoundary> out;
    for (const auto& b : bounds) {
        // Empty fragments never overlap anything
        if (b.start < b.end && b.start < end && b.end > start) {
            out.push_back(b);
        }
    }
    return out;
}

FragmentSplicer::FragmentSplicer(const ReplacementSet& replacements, SplicerOptions options)
    : options_(options) {
    entries_.reserve(replacements.size());
    for (const auto& r : replacements) {
        entries_.push_back(CompiledEntry{r, MatchPattern(r.original, options_.short_token_max_length)});
    }
}

SpliceResult FragmentSplicer::splice(document::IFragmentContainer& container) const {
    SpliceResult result;

    for (const auto& ce : entries_) {
        bool abandoned = false;
        result.replacements += spliceEntry(container, ce.entry, ce.pattern, abandoned);
        if (abandoned) {
            ++result.abandoned_entries;
        }
    }

    if (result.replacements == 0 && options_.enable_fallback) {
        result.replacements += fallbackRewrite(container, result);
    }
    return result;
}

size_t FragmentSplicer::spliceEntry(document::IFragmentContainer& container,
                                    const Replacement& entry, const MatchPattern& pattern,
                                    bool& abandoned) const {
    abandoned = false;
    size_t count = 0;
    size_t from = 0;
    // Rescanning from the start would find the original again inside its own
    // replacement ("Ann" -> "Ann Smith"), so such entries resume after it
    const bool resume_after = pattern.findFirst(entry.replacement).has_value();

    while (true) {
        FragmentMap map = FragmentMap::build(container);
        auto m = pattern.findFirst(map.text, from);
        if (!m) {
            break;
        }
        if (count >= options_.max_iterations) {
            abandoned = true;
            DOCSAN_WARN("FragmentSplicer: Iteration bound {} reached for {}, entry abandoned",
                        options_.max_iterations, KindUtils::maskValue(entry.kind, entry.original));
            break;
        }

        auto parts = map.overlapping(m->start, m->end);
        if (parts.empty()) {
            break;
        }

        const FragmentBoundary& first = parts.front();
        const FragmentBoundary& last = parts.back();
        const std::string& first_text = container.fragmentText(first.index);

        if (parts.size() == 1) {
            std::string updated = first_text.substr(0, m->start - first.start);
            updated += entry.replacement;
            updated += first_text.substr(m->end - first.start);
            container.setFragmentText(first.index, std::move(updated));
        } else {
            std::string head = first_text.substr(0, m->start - first.start) + entry.replacement;
            std::string tail = container.fragmentText(last.index).substr(m->end - last.start);
            container.setFragmentText(first.index, std::move(head));
            for (size_t i = 1; i + 1 < parts.size(); ++i) {
                container.setFragmentText(parts[i].index, std::string());
            }
            container.setFragmentText(last.index, std::move(tail));
        }

        ++count;
        from = resume_after ? m->start + entry.replacement.size() : 0;
    }

    if (count > 0) {
        DOCSAN_DEBUG("FragmentSplicer: {} -> {} occurrence(s)",
                     KindUtils::maskValue(entry.kind, entry.original), count);
    }
    return count;
}

size_t FragmentSplicer::fallbackRewrite(document::IFragmentContainer& container,
                                        SpliceResult& result) const {
    size_t total = 0;

    for (const auto& ce : entries_) {
        if (!ce.pattern.findFirst(container.visibleText())) {
            continue;
        }

        const bool resume_after = ce.pattern.findFirst(ce.entry.replacement).has_value();
        size_t rewritten = 0;
        for (std::string* node : container.textNodes()) {
            size_t from = 0;
            size_t n = 0;
            while (n < options_.max_iterations) {
                auto m = ce.pattern.findFirst(*node, from);
                if (!m) {
                    break;
                }
                node->replace(m->start, m->end - m->start, ce.entry.replacement);
                from = resume_after ? m->start + ce.entry.replacement.size() : 0;
                ++n;
            }
            if (n > 0) {
                ++result.degraded_rewrites;
                rewritten += n;
            }
        }

        if (rewritten > 0) {
            DOCSAN_WARN("FragmentSplicer: Degraded per-node rewrite for {} ({} occurrence(s))",
                        KindUtils::maskValue(ce.entry.kind, ce.entry.original), rewritten);
        } else {
            DOCSAN_WARN("FragmentSplicer: {} is visible but spans nodes outside the fragment list",
                        KindUtils::maskValue(ce.entry.kind, ce.entry.original));
        }
        total += rewritten;
    }
    return total;
}

} // namespace sanitizer
} // namespace docsan
