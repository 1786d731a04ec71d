#include "sanitizer/hyperlink_unwrapper.h"
#include "utils/logger.h"
#include <utility>
#include <vector>

namespace docsan {
namespace sanitizer {

size_t HyperlinkUnwrapper::unwrap(document::Paragraph& paragraph) {
    auto& children = paragraph.children();
    if (paragraph.hyperlinkCount() == 0) {
        return 0;
    }

    size_t removed = 0;
    std::vector<document::InlineNode> flattened;
    flattened.reserve(children.size());

    for (auto& child : children) {
        if (auto* link = std::get_if<document::Hyperlink>(&child)) {
            for (auto& run : link->runs) {
                flattened.emplace_back(std::move(run));
            }
            ++removed;
        } else {
            flattened.push_back(std::move(child));
        }
    }

    children = std::move(flattened);
    DOCSAN_DEBUG("HyperlinkUnwrapper: Removed {} hyperlink(s)", removed);
    return removed;
}

} // namespace sanitizer
} // namespace docsan
