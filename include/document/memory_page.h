#pragma once

#include "document/fixed_layout.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace docsan {
namespace document {

/**
 * @brief In-memory fixed-layout page
 *
 * Text is stored as lines of glyph spans. Glyphs of a span are laid out
 * evenly across the span's bounding box (one cell per UTF-8 code point),
 * which is enough to answer rectangle queries consistently:
 * - searchFor() matches case-insensitively (Unicode case folding) within
 *   a line, across spans
 * - applyRedactions() deletes every glyph whose centre lies inside an
 *   operation's rectangle, splitting spans where needed, and inserts the
 *   redraw text as a new span at the position of the first deleted glyph
 */
class MemoryPage : public IPageSurface {
public:
    explicit MemoryPage(double width = 595.0, double height = 842.0);

    // Append a line whose spans already carry their bounding boxes
    void addLine(std::vector<GlyphSpan> spans);

    /**
     * @brief Append a line laid out left to right from (x, top)
     *
     * Each span is given a box of (code points * size / 2) by size.
     */
    void addLine(double x, double top, std::vector<GlyphSpan> spans);

    const std::vector<std::vector<GlyphSpan>>& lines() const { return lines_; }
    const std::vector<RedactionOp>& appliedRedactions() const { return applied_; }
    size_t pendingRedactions() const { return pending_.size(); }

    bool hasThumbnail() const { return thumbnail_; }
    void setThumbnail(bool thumbnail) { thumbnail_ = thumbnail; }

    // Drops hidden spans, returns how many were removed
    size_t removeHiddenText();

    // IPageSurface
    std::vector<Rect> searchFor(const std::string& needle) const override;
    std::string textInRect(const Rect& rect) const override;
    std::vector<GlyphSpan> spans() const override;
    std::string text() const override;
    bool addRedaction(const RedactionOp& op) override;
    ApplyReport applyRedactions() override;

private:
    struct Cell {
        size_t span;          // index within the line
        size_t begin;         // byte range within the span text
        size_t end;
        size_t line_begin;    // byte range within the line text
        size_t line_end;
        Rect box;
    };

    static std::vector<Cell> layoutLine(const std::vector<GlyphSpan>& line);
    static std::string lineText(const std::vector<GlyphSpan>& line);
    bool applyOne(const RedactionOp& op);

    double width_;
    double height_;
    bool thumbnail_ = false;
    std::vector<std::vector<GlyphSpan>> lines_;
    std::vector<RedactionOp> pending_;
    std::vector<RedactionOp> applied_;
};

/**
 * @brief In-memory fixed-layout document
 */
class MemoryFixedDocument : public IFixedLayoutDocument {
public:
    MemoryFixedDocument() = default;

    MemoryPage& addPage(double width = 595.0, double height = 842.0);
    MemoryPage& memoryPage(size_t index) { return *pages_.at(index); }

    void setMetadata(const std::string& key, const std::string& value) { metadata_[key] = value; }
    const std::map<std::string, std::string>& metadata() const { return metadata_; }
    void setXmlMetadata(std::string xml) { xml_metadata_ = std::move(xml); }
    const std::string& xmlMetadata() const { return xml_metadata_; }
    void addScript(std::string script) { scripts_.push_back(std::move(script)); }
    const std::vector<std::string>& scripts() const { return scripts_; }
    void addAttachment(std::string name) { attachments_.push_back(std::move(name)); }
    const std::vector<std::string>& attachments() const { return attachments_; }

    // IFixedLayoutDocument
    size_t pageCount() const override { return pages_.size(); }
    IPageSurface* page(size_t index) override;
    ScrubReport scrub(const ScrubOptions& options) override;

private:
    std::vector<std::unique_ptr<MemoryPage>> pages_;
    std::map<std::string, std::string> metadata_;
    std::string xml_metadata_;
    std::vector<std::string> scripts_;
    std::vector<std::string> attachments_;
};

} // namespace document
} // namespace docsan
