#include "document/document_json.h"
#include "utils/logger.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace docsan {
namespace document {

namespace {

using nlohmann::json;

// Thrown for structural problems, mapped to MalformedDocument together
// with nlohmann's own type errors.
void require(bool condition, const std::string& what) {
    if (!condition) {
        throw std::invalid_argument(what);
    }
}

Run parseRun(const json& j) {
    require(j.is_object(), "run must be an object");
    Run run;
    run.text = j.value("text", std::string());
    run.has_drawing = j.value("drawing", false);
    run.style.font_name = j.value("font", std::string());
    run.style.font_size = j.value("size", 0.0);
    run.style.bold = j.value("bold", false);
    run.style.italic = j.value("italic", false);
    run.style.underline = j.value("underline", false);
    run.style.color = j.value("color", std::string());
    run.style.highlight = j.value("highlight", std::string());
    return run;
}

Paragraph parseParagraph(const json& j) {
    require(j.is_object(), "paragraph must be an object");
    Paragraph p(j.value("style", std::string()));
    if (!j.contains("runs")) {
        return p;
    }
    require(j["runs"].is_array(), "paragraph runs must be an array");
    for (const auto& node : j["runs"]) {
        require(node.is_object(), "inline node must be an object");
        if (node.contains("hyperlink")) {
            std::vector<Run> runs;
            if (node.contains("runs")) {
                require(node["runs"].is_array(), "hyperlink runs must be an array");
                for (const auto& r : node["runs"]) runs.push_back(parseRun(r));
            }
            p.addHyperlink(node["hyperlink"].get<std::string>(), std::move(runs));
        } else {
            Run run = parseRun(node);
            Run& added = p.addRun(std::move(run.text), std::move(run.style));
            added.has_drawing = run.has_drawing;
        }
    }
    return p;
}

std::vector<Paragraph> parseParagraphs(const json& j, const char* what) {
    require(j.is_array(), std::string(what) + " must be an array");
    std::vector<Paragraph> out;
    out.reserve(j.size());
    for (const auto& p : j) out.push_back(parseParagraph(p));
    return out;
}

json runToJson(const Run& run) {
    json j = {{"text", run.text}};
    if (run.has_drawing) j["drawing"] = true;
    if (!run.style.font_name.empty()) j["font"] = run.style.font_name;
    if (run.style.font_size > 0.0) j["size"] = run.style.font_size;
    if (run.style.bold) j["bold"] = true;
    if (run.style.italic) j["italic"] = true;
    if (run.style.underline) j["underline"] = true;
    if (!run.style.color.empty()) j["color"] = run.style.color;
    if (!run.style.highlight.empty()) j["highlight"] = run.style.highlight;
    return j;
}

json paragraphsToJson(const std::vector<Paragraph>& paragraphs) {
    json arr = json::array();
    for (const auto& p : paragraphs) arr.push_back(DocumentJson::toJson(p));
    return arr;
}

GlyphSpan parseSpan(const json& j) {
    require(j.is_object(), "span must be an object");
    GlyphSpan span;
    span.text = j.value("text", std::string());
    span.font = j.value("font", span.font);
    span.size = j.value("size", span.size);
    span.color = j.value("color", span.color);
    span.flags = j.value("flags", span.flags);
    span.hidden = j.value("hidden", false);
    if (j.contains("bbox")) {
        const auto& b = j["bbox"];
        require(b.is_array() && b.size() == 4, "span bbox must be [x0, y0, x1, y1]");
        span.bbox = Rect{b[0].get<double>(), b[1].get<double>(), b[2].get<double>(),
                         b[3].get<double>()};
    }
    return span;
}

void parsePage(const json& j, MemoryFixedDocument& doc) {
    require(j.is_object(), "page must be an object");
    MemoryPage& page = doc.addPage(j.value("width", 595.0), j.value("height", 842.0));
    page.setThumbnail(j.value("thumbnail", false));
    if (!j.contains("lines")) return;

    require(j["lines"].is_array(), "page lines must be an array");
    for (const auto& line : j["lines"]) {
        require(line.is_object() && line.contains("spans") && line["spans"].is_array(),
                "line must be an object with a spans array");
        std::vector<GlyphSpan> spans;
        bool explicit_boxes = !line["spans"].empty();
        for (const auto& s : line["spans"]) {
            spans.push_back(parseSpan(s));
            explicit_boxes = explicit_boxes && s.contains("bbox");
        }
        if (explicit_boxes) {
            page.addLine(std::move(spans));
        } else {
            page.addLine(line.value("x", 72.0), line.value("y", 72.0), std::move(spans));
        }
    }
}

} // namespace

std::pair<sanitizer::Status, FlowDocument> DocumentJson::loadFlow(const nlohmann::json& j) {
    FlowDocument doc;
    try {
        require(j.is_object(), "document must be an object");
        if (j.contains("paragraphs")) {
            doc.paragraphs = parseParagraphs(j["paragraphs"], "paragraphs");
        }
        if (j.contains("tables")) {
            require(j["tables"].is_array(), "tables must be an array");
            for (const auto& t : j["tables"]) {
                require(t.is_object() && t.contains("rows") && t["rows"].is_array(),
                        "table must be an object with a rows array");
                Table table;
                for (const auto& r : t["rows"]) {
                    require(r.is_array(), "table row must be an array of cells");
                    TableRow row;
                    for (const auto& c : r) {
                        require(c.is_object(), "table cell must be an object");
                        TableCell cell;
                        if (c.contains("paragraphs")) {
                            cell.paragraphs = parseParagraphs(c["paragraphs"], "cell paragraphs");
                        }
                        row.cells.push_back(std::move(cell));
                    }
                    table.rows.push_back(std::move(row));
                }
                doc.tables.push_back(std::move(table));
            }
        }
        if (j.contains("sections")) {
            require(j["sections"].is_array(), "sections must be an array");
            for (const auto& s : j["sections"]) {
                require(s.is_object(), "section must be an object");
                Section section;
                if (s.contains("header")) section.header = parseParagraphs(s["header"], "header");
                if (s.contains("footer")) section.footer = parseParagraphs(s["footer"], "footer");
                doc.sections.push_back(std::move(section));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        DOCSAN_ERROR("DocumentJson: Malformed flow document: {}", e.what());
        return {sanitizer::Status::Error(sanitizer::ErrorCode::MalformedDocument, e.what()),
                FlowDocument{}};
    } catch (const std::invalid_argument& e) {
        DOCSAN_ERROR("DocumentJson: Malformed flow document: {}", e.what());
        return {sanitizer::Status::Error(sanitizer::ErrorCode::MalformedDocument, e.what()),
                FlowDocument{}};
    }
    return {sanitizer::Status::OK(), std::move(doc)};
}

std::pair<sanitizer::Status, std::unique_ptr<MemoryFixedDocument>> DocumentJson::loadFixed(
    const nlohmann::json& j) {
    auto doc = std::make_unique<MemoryFixedDocument>();
    try {
        require(j.is_object(), "document must be an object");
        require(j.contains("pages") && j["pages"].is_array(), "document needs a pages array");
        for (const auto& p : j["pages"]) {
            parsePage(p, *doc);
        }
        if (j.contains("metadata")) {
            require(j["metadata"].is_object(), "metadata must be an object");
            for (auto it = j["metadata"].begin(); it != j["metadata"].end(); ++it) {
                doc->setMetadata(it.key(), it.value().get<std::string>());
            }
        }
        doc->setXmlMetadata(j.value("xml_metadata", std::string()));
        if (j.contains("scripts")) {
            for (const auto& s : j["scripts"]) doc->addScript(s.get<std::string>());
        }
        if (j.contains("attachments")) {
            for (const auto& a : j["attachments"]) doc->addAttachment(a.get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        DOCSAN_ERROR("DocumentJson: Malformed fixed-layout document: {}", e.what());
        return {sanitizer::Status::Error(sanitizer::ErrorCode::MalformedDocument, e.what()),
                nullptr};
    } catch (const std::invalid_argument& e) {
        DOCSAN_ERROR("DocumentJson: Malformed fixed-layout document: {}", e.what());
        return {sanitizer::Status::Error(sanitizer::ErrorCode::MalformedDocument, e.what()),
                nullptr};
    }
    return {sanitizer::Status::OK(), std::move(doc)};
}

nlohmann::json DocumentJson::toJson(const Paragraph& paragraph) {
    json runs = json::array();
    for (const auto& child : paragraph.children()) {
        if (const auto* run = std::get_if<Run>(&child)) {
            runs.push_back(runToJson(*run));
        } else {
            const auto& link = std::get<Hyperlink>(child);
            json nested = json::array();
            for (const auto& r : link.runs) nested.push_back(runToJson(r));
            runs.push_back({{"hyperlink", link.target}, {"runs", nested}});
        }
    }
    json j = {{"runs", runs}};
    if (!paragraph.styleName().empty()) j["style"] = paragraph.styleName();
    return j;
}

nlohmann::json DocumentJson::toJson(const FlowDocument& doc) {
    json tables = json::array();
    for (const auto& table : doc.tables) {
        json rows = json::array();
        for (const auto& row : table.rows) {
            json cells = json::array();
            for (const auto& cell : row.cells) {
                cells.push_back({{"paragraphs", paragraphsToJson(cell.paragraphs)}});
            }
            rows.push_back(cells);
        }
        tables.push_back({{"rows", rows}});
    }
    json sections = json::array();
    for (const auto& s : doc.sections) {
        sections.push_back({{"header", paragraphsToJson(s.header)},
                            {"footer", paragraphsToJson(s.footer)}});
    }
    return {{"paragraphs", paragraphsToJson(doc.paragraphs)},
            {"tables", tables},
            {"sections", sections}};
}

nlohmann::json DocumentJson::toJson(MemoryFixedDocument& doc) {
    json pages = json::array();
    for (size_t i = 0; i < doc.pageCount(); ++i) {
        const MemoryPage& page = doc.memoryPage(i);
        json lines = json::array();
        for (const auto& line : page.lines()) {
            json spans = json::array();
            for (const auto& s : line) {
                spans.push_back({{"text", s.text}, {"font", s.font}, {"size", s.size},
                                 {"color", s.color}, {"flags", s.flags},
                                 {"bbox", {s.bbox.x0, s.bbox.y0, s.bbox.x1, s.bbox.y1}}});
            }
            lines.push_back({{"spans", spans}});
        }
        pages.push_back({{"lines", lines}, {"thumbnail", page.hasThumbnail()}});
    }
    return {{"pages", pages},
            {"metadata", doc.metadata()},
            {"xml_metadata", doc.xmlMetadata()},
            {"scripts", doc.scripts()},
            {"attachments", doc.attachments()}};
}

} // namespace document
} // namespace docsan
