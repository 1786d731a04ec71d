#include "document/flow_document.h"
#include <stdexcept>

namespace docsan {
namespace document {

Paragraph::Paragraph(std::string style_name)
    : style_name_(std::move(style_name)) {}

Run& Paragraph::addRun(std::string text, RunStyle style) {
    Run run;
    run.text = std::move(text);
    run.style = std::move(style);
    children_.emplace_back(std::move(run));
    return std::get<Run>(children_.back());
}

Hyperlink& Paragraph::addHyperlink(std::string target, std::vector<Run> runs) {
    children_.emplace_back(Hyperlink{std::move(target), std::move(runs)});
    return std::get<Hyperlink>(children_.back());
}

std::vector<Run*> Paragraph::runs() {
    std::vector<Run*> out;
    for (auto& child : children_) {
        if (auto* run = std::get_if<Run>(&child)) {
            out.push_back(run);
        }
    }
    return out;
}

std::vector<const Run*> Paragraph::runs() const {
    std::vector<const Run*> out;
    for (const auto& child : children_) {
        if (const auto* run = std::get_if<Run>(&child)) {
            out.push_back(run);
        }
    }
    return out;
}

size_t Paragraph::hyperlinkCount() const {
    size_t count = 0;
    for (const auto& child : children_) {
        if (std::holds_alternative<Hyperlink>(child)) ++count;
    }
    return count;
}

std::string Paragraph::text() const {
    std::string out;
    for (const auto* run : runs()) {
        out += run->text;
    }
    return out;
}

bool Paragraph::isListItem() const {
    for (const char* keyword : {"List Bullet", "List Number", "Bullet", "Numbered"}) {
        if (style_name_.find(keyword) != std::string::npos) return true;
    }
    return false;
}

Run& Paragraph::directRun(size_t index) {
    size_t seen = 0;
    for (auto& child : children_) {
        if (auto* run = std::get_if<Run>(&child)) {
            if (seen == index) return *run;
            ++seen;
        }
    }
    throw std::out_of_range("Paragraph: run index " + std::to_string(index) + " out of range");
}

const Run& Paragraph::directRun(size_t index) const {
    return const_cast<Paragraph*>(this)->directRun(index);
}

size_t Paragraph::fragmentCount() const {
    return runs().size();
}

const std::string& Paragraph::fragmentText(size_t index) const {
    return directRun(index).text;
}

void Paragraph::setFragmentText(size_t index, std::string text) {
    directRun(index).text = std::move(text);
}

std::string Paragraph::visibleText() const {
    std::string out;
    for (const auto& child : children_) {
        if (const auto* run = std::get_if<Run>(&child)) {
            out += run->text;
        } else {
            for (const auto& nested : std::get<Hyperlink>(child).runs) {
                out += nested.text;
            }
        }
    }
    return out;
}

std::vector<std::string*> Paragraph::textNodes() {
    std::vector<std::string*> nodes;
    for (auto& child : children_) {
        if (auto* run = std::get_if<Run>(&child)) {
            nodes.push_back(&run->text);
        } else {
            for (auto& nested : std::get<Hyperlink>(child).runs) {
                nodes.push_back(&nested.text);
            }
        }
    }
    return nodes;
}

Paragraph& FlowDocument::addParagraph(std::string style_name) {
    paragraphs.emplace_back(std::move(style_name));
    return paragraphs.back();
}

Table& FlowDocument::addTable(size_t rows, size_t cols) {
    Table table;
    table.rows.resize(rows);
    for (auto& row : table.rows) {
        row.cells.resize(cols);
    }
    tables.push_back(std::move(table));
    return tables.back();
}

Section& FlowDocument::addSection() {
    sections.emplace_back();
    return sections.back();
}

} // namespace document
} // namespace docsan
