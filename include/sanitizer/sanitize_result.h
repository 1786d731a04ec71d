#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace docsan {
namespace sanitizer {

enum class ErrorCode {
    None,
    MalformedDocument,       // containers/pages cannot be enumerated
    InvalidReplacementData,  // detector payload is not a candidate list
    ConfigError,
    Internal
};

const char* errorCodeToString(ErrorCode code);

/**
 * @brief Outcome of a fatal-capable operation
 *
 * Only structural failures are reported here. Recoverable conditions
 * (unmatched entries, degraded rewrites, skipped rectangles) are counted
 * in SanitizeStats instead.
 */
struct Status {
    bool ok = true;
    ErrorCode code = ErrorCode::None;
    std::string message;

    static Status OK() { return {}; }
    static Status Error(ErrorCode code, std::string msg) {
        return Status{false, code, std::move(msg)};
    }
    operator bool() const { return ok; }
};

/**
 * @brief Observability summary of one sanitize operation
 *
 * Not used for control flow.
 */
struct SanitizeStats {
    size_t paragraphs_changed = 0;
    size_t table_cells_changed = 0;
    size_t header_footer_changed = 0;
    size_t pages_changed = 0;
    size_t total_replacements = 0;
    size_t unique_entries = 0;
    size_t safety_net_additions = 0;
    size_t degraded_rewrites = 0;
    size_t abandoned_entries = 0;
    size_t skipped_rects = 0;
    size_t images_replaced = 0;

    // Distinct styling observed at page redaction sites
    std::set<std::string> fonts_detected;
    std::set<uint32_t> colors_detected;
    std::set<double> sizes_detected;

    bool empty() const;
    nlohmann::json toJson() const;
};

} // namespace sanitizer
} // namespace docsan
