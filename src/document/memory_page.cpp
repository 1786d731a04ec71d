#include "document/memory_page.h"
#include "utils/unicode_search.h"
#include <algorithm>

namespace docsan {
namespace document {

namespace {

// Byte length of the UTF-8 sequence starting with `lead`
size_t utf8SequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;
}

size_t codePointCount(const std::string& s) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ) {
        i += std::min(utf8SequenceLength(static_cast<unsigned char>(s[i])), s.size() - i);
        ++count;
    }
    return count;
}

} // namespace

MemoryPage::MemoryPage(double width, double height)
    : width_(width), height_(height) {}

void MemoryPage::addLine(std::vector<GlyphSpan> spans) {
    lines_.push_back(std::move(spans));
}

void MemoryPage::addLine(double x, double top, std::vector<GlyphSpan> spans) {
    double cursor = x;
    for (auto& span : spans) {
        double w = static_cast<double>(codePointCount(span.text)) * span.size / 2.0;
        span.bbox = Rect{cursor, top, cursor + w, top + span.size};
        cursor += w;
    }
    lines_.push_back(std::move(spans));
}

std::vector<MemoryPage::Cell> MemoryPage::layoutLine(const std::vector<GlyphSpan>& line) {
    std::vector<Cell> cells;
    size_t line_offset = 0;
    for (size_t si = 0; si < line.size(); ++si) {
        const auto& span = line[si];
        size_t n = codePointCount(span.text);
        if (n == 0) continue;
        double w = span.bbox.width() / static_cast<double>(n);
        size_t i = 0;
        for (size_t b = 0; b < span.text.size(); ++i) {
            size_t len = std::min(utf8SequenceLength(static_cast<unsigned char>(span.text[b])),
                                  span.text.size() - b);
            Cell cell;
            cell.span = si;
            cell.begin = b;
            cell.end = b + len;
            cell.line_begin = line_offset + b;
            cell.line_end = line_offset + b + len;
            cell.box = Rect{span.bbox.x0 + w * static_cast<double>(i), span.bbox.y0,
                            span.bbox.x0 + w * static_cast<double>(i + 1), span.bbox.y1};
            cells.push_back(cell);
            b += len;
        }
        line_offset += span.text.size();
    }
    return cells;
}

std::string MemoryPage::lineText(const std::vector<GlyphSpan>& line) {
    std::string out;
    for (const auto& span : line) {
        out += span.text;
    }
    return out;
}

std::vector<Rect> MemoryPage::searchFor(const std::string& needle) const {
    std::vector<Rect> hits;
    if (needle.empty()) return hits;

    utils::CaseInsensitiveFinder finder(needle);

    for (const auto& line : lines_) {
        std::string haystack = lineText(line);
        auto cells = layoutLine(line);

        auto range = finder.find(haystack);
        while (range) {
            Rect hit;
            for (const auto& cell : cells) {
                if (cell.line_begin < range->end && cell.line_end > range->begin) {
                    hit = hit.unite(cell.box);
                }
            }
            if (!hit.isEmpty()) {
                hits.push_back(hit);
            }
            range = finder.find(haystack, range->end);
        }
    }
    return hits;
}

std::string MemoryPage::textInRect(const Rect& rect) const {
    std::string out;
    for (const auto& line : lines_) {
        std::string line_out;
        for (const auto& cell : layoutLine(line)) {
            double cx = (cell.box.x0 + cell.box.x1) / 2.0;
            double cy = (cell.box.y0 + cell.box.y1) / 2.0;
            if (rect.contains(cx, cy)) {
                line_out += line[cell.span].text.substr(cell.begin, cell.end - cell.begin);
            }
        }
        if (!line_out.empty()) {
            if (!out.empty()) out += '\n';
            out += line_out;
        }
    }
    return out;
}

std::vector<GlyphSpan> MemoryPage::spans() const {
    std::vector<GlyphSpan> out;
    for (const auto& line : lines_) {
        out.insert(out.end(), line.begin(), line.end());
    }
    return out;
}

std::string MemoryPage::text() const {
    std::string out;
    for (const auto& line : lines_) {
        if (!out.empty()) out += '\n';
        out += lineText(line);
    }
    return out;
}

bool MemoryPage::addRedaction(const RedactionOp& op) {
    if (op.rect.isEmpty()) return false;
    if (!op.rect.intersects(Rect{0.0, 0.0, width_, height_})) return false;
    pending_.push_back(op);
    return true;
}

ApplyReport MemoryPage::applyRedactions() {
    ApplyReport report;
    for (const auto& op : pending_) {
        if (applyOne(op)) {
            applied_.push_back(op);
            ++report.applied;
        } else {
            ++report.failed;
        }
    }
    pending_.clear();
    return report;
}

bool MemoryPage::applyOne(const RedactionOp& op) {
    bool removed_any = false;
    bool inserted = false;

    GlyphSpan redraw;
    redraw.text = op.text;
    redraw.font = op.font_code;
    redraw.size = op.font_size;
    redraw.color = op.text_color.toInt();
    redraw.bbox = op.rect;

    for (auto& line : lines_) {
        auto cells = layoutLine(line);

        std::vector<bool> removed(cells.size(), false);
        bool line_hit = false;
        for (size_t i = 0; i < cells.size(); ++i) {
            double cx = (cells[i].box.x0 + cells[i].box.x1) / 2.0;
            double cy = (cells[i].box.y0 + cells[i].box.y1) / 2.0;
            if (op.rect.contains(cx, cy)) {
                removed[i] = true;
                line_hit = true;
            }
        }
        if (!line_hit) continue;
        removed_any = true;

        std::vector<GlyphSpan> rebuilt;
        size_t ci = 0;
        for (size_t si = 0; si < line.size(); ++si) {
            const auto& span = line[si];
            if (span.text.empty()) {
                rebuilt.push_back(span);
                continue;
            }

            GlyphSpan piece = span;
            piece.text.clear();
            piece.bbox = Rect{};

            auto flush = [&]() {
                if (!piece.text.empty()) {
                    rebuilt.push_back(piece);
                    piece.text.clear();
                    piece.bbox = Rect{};
                }
            };

            for (; ci < cells.size() && cells[ci].span == si; ++ci) {
                const auto& cell = cells[ci];
                if (removed[ci]) {
                    flush();
                    if (!inserted && !redraw.text.empty()) {
                        rebuilt.push_back(redraw);
                    }
                    inserted = true;
                } else {
                    piece.text += span.text.substr(cell.begin, cell.end - cell.begin);
                    piece.bbox = piece.bbox.unite(cell.box);
                }
            }
            flush();
        }
        line = std::move(rebuilt);
    }
    return removed_any;
}

size_t MemoryPage::removeHiddenText() {
    size_t removed = 0;
    for (auto& line : lines_) {
        auto it = std::remove_if(line.begin(), line.end(),
                                 [](const GlyphSpan& s) { return s.hidden; });
        removed += static_cast<size_t>(std::distance(it, line.end()));
        line.erase(it, line.end());
    }
    lines_.erase(std::remove_if(lines_.begin(), lines_.end(),
                                [](const std::vector<GlyphSpan>& l) { return l.empty(); }),
                 lines_.end());
    return removed;
}

MemoryPage& MemoryFixedDocument::addPage(double width, double height) {
    pages_.push_back(std::make_unique<MemoryPage>(width, height));
    return *pages_.back();
}

IPageSurface* MemoryFixedDocument::page(size_t index) {
    if (index >= pages_.size()) return nullptr;
    return pages_[index].get();
}

ScrubReport MemoryFixedDocument::scrub(const ScrubOptions& options) {
    ScrubReport report;
    if (options.metadata) {
        report.metadata_entries = metadata_.size();
        metadata_.clear();
    }
    if (options.xml_metadata) {
        report.xml_metadata = !xml_metadata_.empty();
        xml_metadata_.clear();
    }
    if (options.javascript) {
        report.scripts = scripts_.size();
        scripts_.clear();
    }
    if (options.attached_files) {
        report.attached_files = attachments_.size();
        attachments_.clear();
    }
    for (auto& page : pages_) {
        if (options.hidden_text) {
            report.hidden_spans += page->removeHiddenText();
        }
        if (options.thumbnails && page->hasThumbnail()) {
            page->setThumbnail(false);
            ++report.thumbnails;
        }
    }
    return report;
}

} // namespace document
} // namespace docsan
