#include <gtest/gtest.h>
#include "document/document_json.h"
#include "document/flow_document.h"
#include "document/image_placeholders.h"
#include "document/text_extractor.h"
#include <stdexcept>

using namespace docsan::document;

TEST(ParagraphTest, FragmentsAreDirectRunsOnly) {
    Paragraph p;
    p.addRun("Mail ");
    p.addHyperlink("mailto:a@b.lk", {docsan::document::Run{"a@b.lk"}});
    p.addRun(" now");

    EXPECT_EQ(p.fragmentCount(), 2u);
    EXPECT_EQ(p.fragmentText(1), " now");
    EXPECT_EQ(p.text(), "Mail  now");
    EXPECT_EQ(p.visibleText(), "Mail a@b.lk now");
    EXPECT_EQ(p.textNodes().size(), 3u);
    EXPECT_EQ(p.hyperlinkCount(), 1u);
}

TEST(ParagraphTest, SetFragmentTextKeepsStyle) {
    Paragraph p;
    RunStyle style;
    style.italic = true;
    p.addRun("old", style);

    p.setFragmentText(0, "new");
    EXPECT_EQ(p.runs()[0]->text, "new");
    EXPECT_EQ(p.runs()[0]->style, style);
    EXPECT_THROW(p.setFragmentText(3, "x"), std::out_of_range);
}

TEST(ParagraphTest, ListStyles) {
    EXPECT_TRUE(Paragraph("List Bullet").isListItem());
    EXPECT_TRUE(Paragraph("List Number 2").isListItem());
    EXPECT_FALSE(Paragraph("Heading 1").isListItem());
}

TEST(TextExtractorTest, FlowOrderAndListPrefix) {
    FlowDocument doc;
    doc.addParagraph().addRun("  Curriculum Vitae  ");
    doc.addParagraph().addRun("   ");
    doc.addParagraph("List Bullet").addRun("Python");
    Table& table = doc.addTable(1, 1);
    table.rows[0].cells[0].paragraphs.emplace_back().addRun("Cell text");
    Section& section = doc.addSection();
    section.header.emplace_back().addRun("Header");
    section.footer.emplace_back().addRun("Footer");

    EXPECT_EQ(TextExtractor::extract(doc),
              "Curriculum Vitae\n- Python\nCell text\nHeader\nFooter");
}

TEST(TextExtractorTest, FixedPages) {
    MemoryFixedDocument doc;
    GlyphSpan a;
    a.text = "Page one";
    GlyphSpan b;
    b.text = "Page two";
    doc.addPage().addLine(72, 72, {a});
    doc.addPage().addLine(72, 72, {b});

    auto [status, text] = TextExtractor::extract(doc);
    ASSERT_TRUE(status.ok);
    EXPECT_EQ(text, "Page one\nPage two");
}

TEST(ImagePlaceholdersTest, NumbersBodyImages) {
    FlowDocument doc;
    Paragraph& p = doc.addParagraph();
    p.addRun("").has_drawing = true;
    p.addRun(" and ");
    p.addRun("").has_drawing = true;
    Section& section = doc.addSection();
    section.header.emplace_back().addRun("").has_drawing = true;
    section.footer.emplace_back().addRun("").has_drawing = true;

    ImageReport report = ImagePlaceholders::replace(doc);

    EXPECT_EQ(report.body, 2u);
    EXPECT_EQ(report.total(), 4u);
    EXPECT_EQ(doc.paragraphs[0].text(), "[Photo-1]  and [Photo-2] ");
    EXPECT_EQ(doc.sections[0].header[0].text(), "[Header Image] ");
    EXPECT_EQ(doc.sections[0].footer[0].text(), "[Footer Image] ");
    EXPECT_TRUE(doc.paragraphs[0].runs()[0]->style.bold);
    EXPECT_FALSE(doc.paragraphs[0].runs()[0]->has_drawing);
}

TEST(DocumentJsonTest, LoadFlowDocument) {
    auto j = nlohmann::json::parse(R"({
        "paragraphs": [
            {"style": "Normal", "runs": [
                {"text": "Email: ", "bold": true, "font": "Arial", "size": 11},
                {"hyperlink": "mailto:a@b.lk", "runs": [{"text": "a@b.lk", "underline": true}]},
                {"drawing": true}
            ]}
        ],
        "tables": [{"rows": [[{"paragraphs": [{"runs": [{"text": "cell"}]}]}, {}]]}],
        "sections": [{"header": [{"runs": [{"text": "head"}]}], "footer": []}]
    })");

    auto [status, doc] = DocumentJson::loadFlow(j);
    ASSERT_TRUE(status.ok) << status.message;
    ASSERT_EQ(doc.paragraphs.size(), 1u);
    const Paragraph& p = doc.paragraphs[0];
    EXPECT_EQ(p.styleName(), "Normal");
    EXPECT_EQ(p.visibleText(), "Email: a@b.lk");
    EXPECT_TRUE(p.runs()[0]->style.bold);
    EXPECT_TRUE(p.runs()[1]->has_drawing);
    ASSERT_EQ(doc.tables.size(), 1u);
    EXPECT_EQ(doc.tables[0].rows[0].cells.size(), 2u);
    EXPECT_EQ(doc.sections[0].header[0].text(), "head");

    nlohmann::json back = DocumentJson::toJson(doc);
    EXPECT_EQ(back["paragraphs"][0]["runs"][1]["hyperlink"], "mailto:a@b.lk");
}

TEST(DocumentJsonTest, MalformedFlowDocument) {
    auto [status, doc] = DocumentJson::loadFlow(nlohmann::json::parse(R"({"paragraphs": {"runs": []}})"));
    EXPECT_FALSE(status.ok);
    EXPECT_EQ(status.code, docsan::sanitizer::ErrorCode::MalformedDocument);

    auto [type_status, type_doc] = DocumentJson::loadFlow(
        nlohmann::json::parse(R"({"paragraphs": [{"runs": [{"text": 5}]}]})"));
    EXPECT_FALSE(type_status.ok);
}

TEST(DocumentJsonTest, LoadFixedDocument) {
    auto j = nlohmann::json::parse(R"json({
        "pages": [{
            "thumbnail": true,
            "lines": [
                {"x": 72, "y": 100, "spans": [{"text": "Priya", "font": "Arial-BoldMT", "size": 12, "flags": 16}]},
                {"spans": [{"text": "boxed", "bbox": [10, 10, 60, 20]}]}
            ]
        }],
        "metadata": {"Author": "Priya"},
        "scripts": ["app.alert(1)"],
        "attachments": ["cv.txt"]
    })json");

    auto [status, doc] = DocumentJson::loadFixed(j);
    ASSERT_TRUE(status.ok) << status.message;
    ASSERT_EQ(doc->pageCount(), 1u);
    const MemoryPage& page = doc->memoryPage(0);
    EXPECT_EQ(page.text(), "Priya\nboxed");
    EXPECT_DOUBLE_EQ(page.lines()[0][0].bbox.x1, 72.0 + 5 * 6.0);
    EXPECT_DOUBLE_EQ(page.lines()[1][0].bbox.x1, 60.0);
    EXPECT_TRUE(page.hasThumbnail());
    EXPECT_EQ(doc->metadata().at("Author"), "Priya");
    EXPECT_EQ(doc->scripts().size(), 1u);
}

TEST(DocumentJsonTest, MalformedFixedDocument) {
    auto [status, doc] = DocumentJson::loadFixed(nlohmann::json::parse(R"({"lines": []})"));
    EXPECT_FALSE(status.ok);
    EXPECT_EQ(status.code, docsan::sanitizer::ErrorCode::MalformedDocument);
    EXPECT_FALSE(doc);
}
