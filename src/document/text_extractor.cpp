#include "document/text_extractor.h"
#include <cctype>

namespace docsan {
namespace document {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

void appendLine(std::string& out, const std::string& line) {
    if (line.empty()) return;
    if (!out.empty()) out += '\n';
    out += line;
}

void appendParagraphs(std::string& out, const std::vector<Paragraph>& paragraphs) {
    for (const auto& p : paragraphs) {
        appendLine(out, TextExtractor::paragraphLine(p));
    }
}

} // namespace

std::string TextExtractor::paragraphLine(const Paragraph& paragraph) {
    std::string text = trim(paragraph.visibleText());
    if (text.empty()) return text;
    return paragraph.isListItem() ? "- " + text : text;
}

std::string TextExtractor::extract(const FlowDocument& doc) {
    std::string out;
    appendParagraphs(out, doc.paragraphs);
    for (const auto& table : doc.tables) {
        for (const auto& row : table.rows) {
            for (const auto& cell : row.cells) {
                appendParagraphs(out, cell.paragraphs);
            }
        }
    }
    for (const auto& section : doc.sections) {
        appendParagraphs(out, section.header);
        appendParagraphs(out, section.footer);
    }
    return out;
}

std::pair<sanitizer::Status, std::string> TextExtractor::extract(IFixedLayoutDocument& doc) {
    std::string out;
    for (size_t i = 0; i < doc.pageCount(); ++i) {
        IPageSurface* page = doc.page(i);
        if (page == nullptr) {
            return {sanitizer::Status::Error(sanitizer::ErrorCode::MalformedDocument,
                                             "page " + std::to_string(i) + " could not be loaded"),
                    std::string()};
        }
        appendLine(out, trim(page->text()));
    }
    return {sanitizer::Status::OK(), out};
}

} // namespace document
} // namespace docsan
