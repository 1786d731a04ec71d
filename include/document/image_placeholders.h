#pragma once

#include "document/flow_document.h"
#include <cstddef>

namespace docsan {
namespace document {

struct ImageReport {
    size_t body = 0;
    size_t header = 0;
    size_t footer = 0;

    size_t total() const { return body + header + footer; }
};

/**
 * @brief Replaces inline drawings with bold text placeholders
 *
 * Body images become "[Photo-1] ", "[Photo-2] ", ... in document order;
 * header and footer images become "[Header Image] " / "[Footer Image] ".
 * The drawing is dropped from the run, the rest of its style is kept.
 */
class ImagePlaceholders {
public:
    static ImageReport replace(FlowDocument& doc);
};

} // namespace document
} // namespace docsan
