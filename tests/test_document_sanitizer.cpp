#include <gtest/gtest.h>
#include "document/document_json.h"
#include "document/memory_page.h"
#include "sanitizer/document_sanitizer.h"

using namespace docsan::document;
using namespace docsan::sanitizer;

namespace {

GlyphSpan span(const std::string& text) {
    GlyphSpan s;
    s.text = text;
    return s;
}

const nlohmann::json kCandidates = nlohmann::json::parse(R"([
    {"original": "Priya Fernando", "type": "person", "replacement": "Person_1"},
    {"original": "priya.fernando92@finance.lk", "type": "email", "replacement": "person_1@example.com"}
])");

} // namespace

class DocumentSanitizerTest : public ::testing::Test {
protected:
    DocumentSanitizer sanitizer_;

    FlowDocument buildFlow() {
        FlowDocument doc;
        Paragraph& email = doc.addParagraph();
        email.addRun("Email: priya");
        email.addRun(".fernando92@finance");
        email.addRun(".lk");

        Paragraph& contact = doc.addParagraph();
        contact.addRun("Contact ");
        contact.addHyperlink("mailto:priya.fernando92@finance.lk", {docsan::document::Run{"Priya Fernando"}});

        Table& table = doc.addTable(1, 2);
        table.rows[0].cells[0].paragraphs.emplace_back().addRun("Name");
        table.rows[0].cells[1].paragraphs.emplace_back().addRun("Priya Fernando");

        Section& section = doc.addSection();
        section.header.emplace_back().addRun("Hotline 0771234567");
        return doc;
    }
};

TEST_F(DocumentSanitizerTest, FlowDocumentEndToEnd) {
    FlowDocument doc = buildFlow();

    auto [status, stats] = sanitizer_.sanitize(doc, kCandidates);
    ASSERT_TRUE(status.ok) << status.message;

    EXPECT_EQ(doc.paragraphs[0].text(), "Email: person_1@example.com");
    EXPECT_EQ(doc.paragraphs[1].text(), "Contact Person_1");
    EXPECT_EQ(doc.paragraphs[1].hyperlinkCount(), 0u);
    EXPECT_EQ(doc.tables[0].rows[0].cells[0].paragraphs[0].text(), "Name");
    EXPECT_EQ(doc.tables[0].rows[0].cells[1].paragraphs[0].text(), "Person_1");
    EXPECT_EQ(doc.sections[0].header[0].text(), "Hotline +00 00 000 0001");

    EXPECT_EQ(stats.paragraphs_changed, 2u);
    EXPECT_EQ(stats.table_cells_changed, 1u);
    EXPECT_EQ(stats.header_footer_changed, 1u);
    EXPECT_EQ(stats.total_replacements, 4u);
    EXPECT_EQ(stats.unique_entries, 3u);
    EXPECT_EQ(stats.safety_net_additions, 1u);
    EXPECT_EQ(stats.degraded_rewrites, 0u);
}

TEST_F(DocumentSanitizerTest, EmptySetLeavesDocumentUnmodified) {
    FlowDocument doc;
    doc.addParagraph().addRun("Quarterly report, no contact details");
    doc.addParagraph().addHyperlink("https://example.org", {docsan::document::Run{"website"}});
    nlohmann::json before = DocumentJson::toJson(doc);

    auto [status, stats] = sanitizer_.sanitize(doc, nlohmann::json::array());

    ASSERT_TRUE(status.ok);
    EXPECT_TRUE(stats.empty());
    EXPECT_EQ(DocumentJson::toJson(doc), before);
}

TEST_F(DocumentSanitizerTest, LongEmbeddedBlobIsHandled) {
    std::string blob(100000, 'Q');
    FlowDocument doc;
    doc.addParagraph().addRun("Attachment " + blob + " signed by Priya Fernando");

    auto [status, stats] = sanitizer_.sanitize(doc, kCandidates);

    ASSERT_TRUE(status.ok) << status.message;
    EXPECT_EQ(doc.paragraphs[0].text(), "Attachment " + blob + " signed by Person_1");
    EXPECT_EQ(stats.safety_net_additions, 0u);
    EXPECT_EQ(stats.total_replacements, 1u);
}

TEST_F(DocumentSanitizerTest, DetectorReplyWithFence) {
    FlowDocument doc = buildFlow();
    std::string reply = "```json\n" + kCandidates.dump() + "\n```";

    auto [status, stats] = sanitizer_.sanitizeDetectorResponse(doc, reply);
    ASSERT_TRUE(status.ok);
    EXPECT_EQ(doc.paragraphs[0].text(), "Email: person_1@example.com");
    EXPECT_EQ(stats.unique_entries, 3u);
}

TEST_F(DocumentSanitizerTest, UnparsableReplyStillRunsSafetyNet) {
    FlowDocument doc = buildFlow();

    auto [status, stats] = sanitizer_.sanitizeDetectorResponse(doc, "I could not find any PII.");

    ASSERT_TRUE(status.ok);
    EXPECT_EQ(stats.safety_net_additions, 2u);
    EXPECT_EQ(doc.paragraphs[0].text(), "Email: person_1@example.com");
    EXPECT_EQ(doc.sections[0].header[0].text(), "Hotline +00 00 000 0001");
    // Names are the detector's job
    EXPECT_EQ(doc.tables[0].rows[0].cells[1].paragraphs[0].text(), "Priya Fernando");
}

TEST_F(DocumentSanitizerTest, NonArrayCandidatesAreRejected) {
    FlowDocument doc = buildFlow();

    auto [status, stats] = sanitizer_.sanitize(doc, nlohmann::json{{"original", "Priya"}});

    EXPECT_FALSE(status.ok);
    EXPECT_EQ(status.code, ErrorCode::InvalidReplacementData);
    EXPECT_EQ(doc.paragraphs[0].text(), "Email: priya.fernando92@finance.lk");
}

TEST_F(DocumentSanitizerTest, ImagesBecomePlaceholders) {
    FlowDocument doc;
    Paragraph& p = doc.addParagraph();
    p.addRun("Photo: ");
    p.addRun("").has_drawing = true;

    auto [status, stats] = sanitizer_.sanitize(doc, nlohmann::json::array());

    ASSERT_TRUE(status.ok);
    EXPECT_EQ(stats.images_replaced, 1u);
    EXPECT_EQ(p.text(), "Photo: [Photo-1] ");
    EXPECT_TRUE(p.runs()[1]->style.bold);
}

TEST_F(DocumentSanitizerTest, FixedLayoutEndToEnd) {
    MemoryFixedDocument doc;
    MemoryPage& page = doc.addPage();
    page.addLine(72, 100, {span("Priya Fernando")});
    page.addLine(72, 120, {span("Call 0771234567")});
    doc.setMetadata("Author", "Priya Fernando");

    auto [status, stats] = sanitizer_.sanitize(doc, kCandidates);

    ASSERT_TRUE(status.ok) << status.message;
    EXPECT_EQ(doc.memoryPage(0).text(), "Person_1\nCall +00 00 000 0001");
    EXPECT_TRUE(doc.metadata().empty());
    EXPECT_EQ(stats.pages_changed, 1u);
    EXPECT_EQ(stats.total_replacements, 2u);
    EXPECT_EQ(stats.safety_net_additions, 1u);
}

TEST_F(DocumentSanitizerTest, FixedLayoutNoOp) {
    MemoryFixedDocument doc;
    doc.addPage().addLine(72, 100, {span("Quarterly report")});
    doc.setMetadata("Title", "Report");

    auto [status, stats] = sanitizer_.sanitize(doc, nlohmann::json::array());

    ASSERT_TRUE(status.ok);
    EXPECT_TRUE(stats.empty());
    EXPECT_EQ(doc.memoryPage(0).text(), "Quarterly report");
    EXPECT_EQ(doc.metadata().size(), 1u);
}

TEST_F(DocumentSanitizerTest, ConfigDisablesUnwrapAndImages) {
    SanitizerConfig cfg;
    cfg.unwrap_hyperlinks = false;
    cfg.replace_images = false;
    cfg.splicer.enable_fallback = false;
    DocumentSanitizer sanitizer(cfg);

    FlowDocument doc;
    Paragraph& p = doc.addParagraph();
    p.addHyperlink("mailto:x@y.com", {docsan::document::Run{"x@y.com"}});
    p.addRun("").has_drawing = true;

    auto [status, stats] = sanitizer.sanitize(doc, nlohmann::json::array());

    ASSERT_TRUE(status.ok);
    EXPECT_EQ(stats.images_replaced, 0u);
    EXPECT_EQ(stats.safety_net_additions, 1u);
    EXPECT_EQ(p.hyperlinkCount(), 1u);
    EXPECT_EQ(p.visibleText(), "x@y.com");
}
