#pragma once

#include "document/fragment_container.h"
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace docsan {
namespace document {

/**
 * @brief Character formatting of a run
 *
 * Opaque to the replacement engine: it is carried along and never
 * inspected or rewritten.
 */
struct RunStyle {
    std::string font_name;
    double font_size = 0.0;     // points, 0 = inherited
    bool bold = false;
    bool italic = false;
    bool underline = false;
    std::string color;          // "RRGGBB", empty = inherited
    std::string highlight;

    bool operator==(const RunStyle& other) const {
        return font_name == other.font_name && font_size == other.font_size &&
               bold == other.bold && italic == other.italic &&
               underline == other.underline && color == other.color &&
               highlight == other.highlight;
    }
    bool operator!=(const RunStyle& other) const { return !(*this == other); }
};

struct Run {
    std::string text;
    RunStyle style;
    bool has_drawing = false;   // inline image anchored in this run
};

/**
 * @brief Inline hyperlink wrapper; its runs are not direct paragraph runs
 */
struct Hyperlink {
    std::string target;         // URL or mailto:, may itself contain PII
    std::vector<Run> runs;
};

using InlineNode = std::variant<Run, Hyperlink>;

/**
 * @brief Word-processing paragraph
 *
 * Fragments are the DIRECT runs only, in document order. Runs wrapped in a
 * Hyperlink are part of visibleText() but are not fragments until the
 * hyperlink is unwrapped.
 */
class Paragraph : public IFragmentContainer {
public:
    Paragraph() = default;
    explicit Paragraph(std::string style_name);

    Run& addRun(std::string text, RunStyle style = {});
    Hyperlink& addHyperlink(std::string target, std::vector<Run> runs);

    std::vector<InlineNode>& children() { return children_; }
    const std::vector<InlineNode>& children() const { return children_; }

    std::vector<Run*> runs();
    std::vector<const Run*> runs() const;
    size_t hyperlinkCount() const;

    // Concatenated text of the direct runs
    std::string text() const;

    const std::string& styleName() const { return style_name_; }
    void setStyleName(std::string name) { style_name_ = std::move(name); }

    // Bullet / numbered list paragraph (judged by style name)
    bool isListItem() const;

    // IFragmentContainer
    size_t fragmentCount() const override;
    const std::string& fragmentText(size_t index) const override;
    void setFragmentText(size_t index, std::string text) override;
    std::string visibleText() const override;
    std::vector<std::string*> textNodes() override;

private:
    Run& directRun(size_t index);
    const Run& directRun(size_t index) const;

    std::vector<InlineNode> children_;
    std::string style_name_;
};

struct TableCell {
    std::vector<Paragraph> paragraphs;
};

struct TableRow {
    std::vector<TableCell> cells;
};

struct Table {
    std::vector<TableRow> rows;
};

struct Section {
    std::vector<Paragraph> header;
    std::vector<Paragraph> footer;
};

/**
 * @brief Flowing (word-processing) document
 */
struct FlowDocument {
    std::vector<Paragraph> paragraphs;
    std::vector<Table> tables;
    std::vector<Section> sections;

    Paragraph& addParagraph(std::string style_name = {});
    Table& addTable(size_t rows, size_t cols);
    Section& addSection();
};

} // namespace document
} // namespace docsan
