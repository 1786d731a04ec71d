#pragma once

#include "document/flow_document.h"
#include "document/memory_page.h"
#include "sanitizer/sanitize_result.h"
#include <memory>
#include <utility>
#include <nlohmann/json.hpp>

namespace docsan {
namespace document {

/**
 * @brief JSON descriptions of the in-memory document models
 *
 * Flow document:
 * @code{.json}
 * {
 *   "paragraphs": [
 *     {"style": "List Bullet",
 *      "runs": [{"text": "Email: ", "bold": true},
 *               {"hyperlink": "mailto:a@b.lk", "runs": [{"text": "a@b.lk"}]},
 *               {"drawing": true}]}
 *   ],
 *   "tables": [{"rows": [[{"paragraphs": [...]}, {"paragraphs": [...]}]]}],
 *   "sections": [{"header": [...], "footer": [...]}]
 * }
 * @endcode
 *
 * Fixed document:
 * @code{.json}
 * {
 *   "pages": [{"width": 595, "height": 842, "thumbnail": false,
 *              "lines": [{"x": 72, "y": 100,
 *                         "spans": [{"text": "Priya", "font": "Arial-BoldMT",
 *                                    "size": 12, "color": 0, "flags": 16}]}]}],
 *   "metadata": {"Author": "..."}, "xml_metadata": "...",
 *   "scripts": ["..."], "attachments": ["cv.txt"]
 * }
 * @endcode
 * A span may carry an explicit "bbox": [x0, y0, x1, y1]; otherwise the line
 * is laid out from (x, y).
 */
class DocumentJson {
public:
    static std::pair<sanitizer::Status, FlowDocument> loadFlow(const nlohmann::json& j);
    static std::pair<sanitizer::Status, std::unique_ptr<MemoryFixedDocument>> loadFixed(
        const nlohmann::json& j);

    static nlohmann::json toJson(const FlowDocument& doc);
    static nlohmann::json toJson(const Paragraph& paragraph);
    static nlohmann::json toJson(MemoryFixedDocument& doc);
};

} // namespace document
} // namespace docsan
