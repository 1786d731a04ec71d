#include "document/image_placeholders.h"
#include "utils/logger.h"
#include <string>

namespace docsan {
namespace document {

namespace {

bool replaceDrawing(Run& run, const std::string& placeholder) {
    if (!run.has_drawing) return false;
    run.has_drawing = false;
    run.text = placeholder;
    run.style.bold = true;
    return true;
}

size_t replaceIn(std::vector<Paragraph>& paragraphs, const std::string& placeholder) {
    size_t count = 0;
    for (auto& p : paragraphs) {
        for (Run* run : p.runs()) {
            if (replaceDrawing(*run, placeholder)) ++count;
        }
    }
    return count;
}

} // namespace

ImageReport ImagePlaceholders::replace(FlowDocument& doc) {
    ImageReport report;

    for (auto& p : doc.paragraphs) {
        for (Run* run : p.runs()) {
            if (replaceDrawing(*run, "[Photo-" + std::to_string(report.body + 1) + "] ")) {
                ++report.body;
            }
        }
    }
    for (auto& section : doc.sections) {
        report.header += replaceIn(section.header, "[Header Image] ");
        report.footer += replaceIn(section.footer, "[Footer Image] ");
    }

    if (report.total() > 0) {
        DOCSAN_INFO("ImagePlaceholders: Replaced {} image(s) with placeholders", report.total());
    }
    return report;
}

} // namespace document
} // namespace docsan
