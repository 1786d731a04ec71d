#pragma once

#include "document/flow_document.h"
#include <cstddef>

namespace docsan {
namespace sanitizer {

/**
 * @brief Flattens inline hyperlinks into plain runs
 *
 * The runs of each hyperlink are moved, in order and with their styles, to
 * the hyperlink's position among the paragraph's direct children. The link
 * target is discarded, since it often carries the same PII as its text
 * (mailto:, personal profile URLs). Afterwards every visible run is a
 * fragment and can be reached by the splicer.
 */
class HyperlinkUnwrapper {
public:
    // Returns the number of hyperlinks removed
    static size_t unwrap(document::Paragraph& paragraph);
};

} // namespace sanitizer
} // namespace docsan
