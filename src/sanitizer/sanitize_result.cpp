#include "sanitizer/sanitize_result.h"

namespace docsan {
namespace sanitizer {

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::MalformedDocument: return "malformed_document";
        case ErrorCode::InvalidReplacementData: return "invalid_replacement_data";
        case ErrorCode::ConfigError: return "config_error";
        case ErrorCode::Internal: return "internal";
        default: return "unknown";
    }
}

bool SanitizeStats::empty() const {
    return paragraphs_changed == 0 && table_cells_changed == 0 &&
           header_footer_changed == 0 && pages_changed == 0 &&
           total_replacements == 0 && unique_entries == 0 &&
           safety_net_additions == 0 && degraded_rewrites == 0 &&
           abandoned_entries == 0 && skipped_rects == 0 &&
           images_replaced == 0 && fonts_detected.empty() &&
           colors_detected.empty() && sizes_detected.empty();
}

nlohmann::json SanitizeStats::toJson() const {
    nlohmann::json j;
    j["paragraphs_changed"] = paragraphs_changed;
    j["table_cells_changed"] = table_cells_changed;
    j["header_footer_changed"] = header_footer_changed;
    j["pages_changed"] = pages_changed;
    j["total_replacements"] = total_replacements;
    j["unique_entries"] = unique_entries;
    j["safety_net_additions"] = safety_net_additions;
    j["degraded_rewrites"] = degraded_rewrites;
    j["abandoned_entries"] = abandoned_entries;
    j["skipped_rects"] = skipped_rects;
    j["images_replaced"] = images_replaced;
    j["format_preservation"] = {
        {"fonts_detected", fonts_detected.size()},
        {"colors_detected", colors_detected.size()},
        {"sizes_detected", sizes_detected.size()}
    };
    return j;
}

} // namespace sanitizer
} // namespace docsan
