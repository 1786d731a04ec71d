#include "sanitizer/font_mapper.h"
#include "document/fixed_layout.h"
#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace docsan {
namespace sanitizer {

namespace {

struct FontEntry {
    StandardFont font;
    const char* code;
    const char* postscript;
};

constexpr FontEntry kFonts[] = {
    {StandardFont::Helvetica, "helv", "Helvetica"},
    {StandardFont::HelveticaBold, "hebo", "Helvetica-Bold"},
    {StandardFont::HelveticaOblique, "heit", "Helvetica-Oblique"},
    {StandardFont::HelveticaBoldOblique, "hebi", "Helvetica-BoldOblique"},
    {StandardFont::Times, "tiro", "Times-Roman"},
    {StandardFont::TimesBold, "tibo", "Times-Bold"},
    {StandardFont::TimesItalic, "tiit", "Times-Italic"},
    {StandardFont::TimesBoldItalic, "tibi", "Times-BoldItalic"},
    {StandardFont::Courier, "cour", "Courier"},
    {StandardFont::CourierBold, "cobo", "Courier-Bold"},
    {StandardFont::CourierOblique, "coit", "Courier-Oblique"},
    {StandardFont::CourierBoldOblique, "cobi", "Courier-BoldOblique"},
    {StandardFont::Symbol, "symb", "Symbol"},
    {StandardFont::ZapfDingbats, "zadb", "ZapfDingbats"},
};

bool containsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

StandardFont pick(StandardFont regular, bool bold, bool italic) {
    // Enum order within a family: regular, bold, italic, bold-italic
    int offset = (bold ? 1 : 0) + (italic ? 2 : 0);
    return static_cast<StandardFont>(static_cast<int>(regular) + offset);
}

} // namespace

StandardFont FontMapper::map(const std::string& font_name, uint32_t flags) {
    std::string name = font_name;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name.find("symbol") != std::string::npos) {
        return StandardFont::Symbol;
    }
    if (containsAny(name, {"zapf", "dingbat"})) {
        return StandardFont::ZapfDingbats;
    }

    bool bold = containsAny(name, {"bold", "black", "heavy"}) ||
                (flags & document::span_flags::kBold) != 0;
    bool italic = containsAny(name, {"italic", "oblique"}) ||
                  (flags & document::span_flags::kItalic) != 0;

    if (containsAny(name, {"courier", "mono", "consolas", "menlo"}) ||
        (flags & document::span_flags::kMonospace) != 0) {
        return pick(StandardFont::Courier, bold, italic);
    }

    bool sans = name.find("sans") != std::string::npos;
    if (!sans && (containsAny(name, {"times", "serif", "georgia", "garamond"}) ||
                  (flags & document::span_flags::kSerif) != 0)) {
        return pick(StandardFont::Times, bold, italic);
    }

    return pick(StandardFont::Helvetica, bold, italic);
}

const char* FontMapper::code(StandardFont font) {
    for (const auto& e : kFonts) {
        if (e.font == font) return e.code;
    }
    return "helv";
}

const char* FontMapper::postscriptName(StandardFont font) {
    for (const auto& e : kFonts) {
        if (e.font == font) return e.postscript;
    }
    return "Helvetica";
}

std::optional<StandardFont> FontMapper::fromCode(const std::string& code) {
    for (const auto& e : kFonts) {
        if (code == e.code) return e.font;
    }
    return std::nullopt;
}

} // namespace sanitizer
} // namespace docsan
