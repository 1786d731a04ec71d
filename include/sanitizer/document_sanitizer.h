#pragma once

#include "document/fixed_layout.h"
#include "document/flow_document.h"
#include "sanitizer/regex_safety_net.h"
#include "sanitizer/replacement_set_builder.h"
#include "sanitizer/sanitize_result.h"
#include "sanitizer/sanitizer_config.h"
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace docsan {
namespace sanitizer {

/**
 * @brief Entry point: one sanitize operation per document
 *
 * Pipeline for flow documents:
 *   image placeholders -> text extraction -> ReplacementSetBuilder ->
 *   RegexSafetyNet -> per paragraph: HyperlinkUnwrapper + FragmentSplicer
 * and for fixed-layout documents:
 *   text extraction -> ReplacementSetBuilder -> RegexSafetyNet ->
 *   PageRedactionEngine (incremental apply, then scrub)
 *
 * A failed status means the document may be partially modified and must be
 * discarded by the caller. Everything recoverable is counted in the stats.
 *
 * Usage:
 * @code
 * auto [cfg_status, cfg] = SanitizerConfig::loadFromYaml();
 * DocumentSanitizer sanitizer(cfg);
 * auto [status, stats] = sanitizer.sanitizeDetectorResponse(doc, reply);
 * if (!status) { ... discard doc ... }
 * @endcode
 */
class DocumentSanitizer {
public:
    explicit DocumentSanitizer(SanitizerConfig config = SanitizerConfig::defaults());

    // Set up the process logger from the `logging` section
    static void initLogging(const SanitizerConfig& config);

    /**
     * @brief Sanitize with a candidate array [{original, type, replacement}, ...]
     *
     * A payload that is neither null nor an array fails with
     * InvalidReplacementData before the document is touched.
     */
    std::pair<Status, SanitizeStats> sanitize(document::FlowDocument& doc,
                                              const nlohmann::json& candidates) const;
    std::pair<Status, SanitizeStats> sanitize(document::IFixedLayoutDocument& doc,
                                              const nlohmann::json& candidates) const;

    /**
     * @brief Sanitize with the raw text of a detector reply
     *
     * An unparsable reply is logged and treated as an empty candidate list,
     * so the safety net still runs.
     */
    std::pair<Status, SanitizeStats> sanitizeDetectorResponse(document::FlowDocument& doc,
                                                              const std::string& raw) const;
    std::pair<Status, SanitizeStats> sanitizeDetectorResponse(document::IFixedLayoutDocument& doc,
                                                              const std::string& raw) const;

    // Sanitize with an already filled builder (safety net still applies)
    std::pair<Status, SanitizeStats> sanitizeWith(document::FlowDocument& doc,
                                                  ReplacementSetBuilder builder) const;
    std::pair<Status, SanitizeStats> sanitizeWith(document::IFixedLayoutDocument& doc,
                                                  ReplacementSetBuilder builder) const;

    const SanitizerConfig& config() const { return config_; }
    const RegexSafetyNet& safetyNet() const { return safety_net_; }

private:
    ReplacementSetBuilder builderFromResponse(const std::string& raw) const;
    void spliceFlow(document::FlowDocument& doc, const ReplacementSet& set,
                    SanitizeStats& stats) const;

    SanitizerConfig config_;
    RegexSafetyNet safety_net_;
};

} // namespace sanitizer
} // namespace docsan
