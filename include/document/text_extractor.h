#pragma once

#include "document/fixed_layout.h"
#include "document/flow_document.h"
#include "sanitizer/sanitize_result.h"
#include <string>
#include <utility>

namespace docsan {
namespace document {

/**
 * @brief Flattens a document into the plain text handed to detection
 *
 * Flow documents: body paragraphs, then table cells, then headers and
 * footers of every section; one trimmed line per non-blank paragraph,
 * list paragraphs prefixed with "- ". Fixed documents: page texts.
 * Lines are joined with '\n'.
 */
class TextExtractor {
public:
    static std::string extract(const FlowDocument& doc);
    static std::pair<sanitizer::Status, std::string> extract(IFixedLayoutDocument& doc);

    // Trimmed visible text of one paragraph, "- " prefixed for list items
    static std::string paragraphLine(const Paragraph& paragraph);
};

} // namespace document
} // namespace docsan
