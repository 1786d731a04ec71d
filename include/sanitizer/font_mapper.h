#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace docsan {
namespace sanitizer {

/**
 * @brief The fourteen standard fonts every fixed-layout renderer provides
 */
enum class StandardFont {
    Helvetica,
    HelveticaBold,
    HelveticaOblique,
    HelveticaBoldOblique,
    Times,
    TimesBold,
    TimesItalic,
    TimesBoldItalic,
    Courier,
    CourierBold,
    CourierOblique,
    CourierBoldOblique,
    Symbol,
    ZapfDingbats
};

/**
 * @brief Maps an embedded font to the closest standard font
 *
 * Redraw text cannot use the original (usually subset) font, so the family
 * and weight/slant are approximated from the font name and the span flags:
 * - bold: name contains "bold"/"black"/"heavy", or the bold flag
 * - italic: name contains "italic"/"oblique", or the italic flag
 * - family: monospace (courier, mono, consolas, menlo) before serif
 *   (times, serif, georgia, garamond), otherwise sans-serif
 * - "symbol" and "zapf"/"dingbat" map to their own fonts
 *
 * Names containing "sans" are never treated as serif.
 */
class FontMapper {
public:
    static StandardFont map(const std::string& font_name, uint32_t flags);

    // Short resource code used in redaction operations ("helv", "tibo", ...)
    static const char* code(StandardFont font);
    static const char* postscriptName(StandardFont font);
    static std::optional<StandardFont> fromCode(const std::string& code);
};

} // namespace sanitizer
} // namespace docsan
