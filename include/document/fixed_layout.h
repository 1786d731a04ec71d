#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace docsan {
namespace document {

/**
 * @brief Axis-aligned rectangle in page space (y grows downwards)
 */
struct Rect {
    double x0 = 0.0;
    double y0 = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;

    double width() const { return x1 - x0; }
    double height() const { return y1 - y0; }
    double area() const { return isEmpty() ? 0.0 : width() * height(); }
    bool isEmpty() const { return x1 <= x0 || y1 <= y0; }

    Rect intersect(const Rect& other) const;
    Rect unite(const Rect& other) const;
    // Strict overlap: rectangles that only share an edge do not intersect
    bool intersects(const Rect& other) const;
    bool contains(double x, double y) const;
};

// Span flag bits as reported by the text layer
namespace span_flags {
constexpr uint32_t kSuperscript = 1;
constexpr uint32_t kItalic = 2;
constexpr uint32_t kSerif = 4;
constexpr uint32_t kMonospace = 8;
constexpr uint32_t kBold = 16;
} // namespace span_flags

/**
 * @brief Rendered run of glyphs sharing one style
 */
struct GlyphSpan {
    std::string text;
    std::string font = "Helvetica";
    double size = 11.0;
    uint32_t color = 0;         // 0xRRGGBB
    uint32_t flags = 0;         // span_flags bits
    Rect bbox;
    bool hidden = false;        // invisible text (render mode 3, white-on-white)
};

struct RgbColor {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    static RgbColor fromInt(uint32_t color);
    uint32_t toInt() const;
};

enum class TextAlign { Left, Center, Right };

/**
 * @brief Destructive cover-and-redraw of one rectangle
 *
 * Applying it removes every glyph under `rect`, paints `fill` and draws
 * `text` with the given standard font code, size and colour.
 */
struct RedactionOp {
    Rect rect;
    std::string text;
    std::string font_code = "helv";
    double font_size = 11.0;
    RgbColor text_color;
    RgbColor fill{1.0, 1.0, 1.0};
    TextAlign align = TextAlign::Left;
};

struct ApplyReport {
    size_t applied = 0;
    size_t failed = 0;
};

/**
 * @brief Fixed-layout page as seen by the page redaction engine
 *
 * searchFor() and spans() always reflect the page's CURRENT content, i.e.
 * after every applyRedactions() so far.
 */
class IPageSurface {
public:
    virtual ~IPageSurface() = default;

    // One rectangle per occurrence; matching is case-insensitive
    virtual std::vector<Rect> searchFor(const std::string& needle) const = 0;
    virtual std::string textInRect(const Rect& rect) const = 0;
    virtual std::vector<GlyphSpan> spans() const = 0;
    virtual std::string text() const = 0;

    // false if the operation cannot be registered (degenerate or off-page rect)
    virtual bool addRedaction(const RedactionOp& op) = 0;
    virtual ApplyReport applyRedactions() = 0;
};

struct ScrubOptions {
    bool metadata = true;
    bool xml_metadata = true;
    bool javascript = true;
    bool attached_files = true;
    bool hidden_text = true;
    bool thumbnails = true;
};

struct ScrubReport {
    size_t metadata_entries = 0;
    bool xml_metadata = false;
    size_t scripts = 0;
    size_t attached_files = 0;
    size_t hidden_spans = 0;
    size_t thumbnails = 0;
};

class IFixedLayoutDocument {
public:
    virtual ~IFixedLayoutDocument() = default;

    virtual size_t pageCount() const = 0;
    // nullptr if the page cannot be loaded
    virtual IPageSurface* page(size_t index) = 0;
    virtual ScrubReport scrub(const ScrubOptions& options) = 0;
};

} // namespace document
} // namespace docsan
