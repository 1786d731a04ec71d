#pragma once

#include "sanitizer/replacement.h"
#include "sanitizer/replacement_set_builder.h"
#include <mutex>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace docsan {
namespace sanitizer {

/**
 * @brief Configuration for a single safety-net pattern
 */
struct SafetyNetPattern {
    std::string name;
    std::string regex_str;
    std::regex compiled_regex;
    KindCategory category = KindCategory::OTHER;
    bool digit_guard = false;   // reject matches touching another digit
    bool enabled = true;
};

/**
 * @brief A value the safety net found that the detector did not cover
 */
struct SafetyNetFinding {
    std::string value;
    KindCategory category;
    std::string pattern_name;
    size_t offset;
};

/**
 * @brief Deterministic regex scan for contact data the detector missed
 *
 * Scans the flattened document text for emails, phone numbers and
 * national-ID-like numbers. Every match whose normalized form is not yet
 * covered by the builder is appended with a sequential placeholder
 * (person_N@example.com, +00 00 000 NNNN, ID_NNNNNN) that continues the
 * builder's per-kind numbering. A second run over the same text adds
 * nothing.
 *
 * Example configuration section:
 * @code{.yaml}
 * safety_net:
 *   enabled: true
 *   min_phone_digits: 7
 *   email_placeholder: "person_{}@example.com"
 *   patterns:
 *     - name: EMAIL
 *       kind: email
 *       regex: '[a-zA-Z0-9._%+\-]+@[a-zA-Z0-9.\-]+\.[a-zA-Z]{2,}'
 * @endcode
 */
class RegexSafetyNet {
public:
    RegexSafetyNet();

    /**
     * @brief Apply a `safety_net` configuration section
     *
     * Invalid patterns are skipped; if no valid pattern remains the embedded
     * defaults are used.
     * @return false if the section itself could not be read
     */
    bool initialize(const nlohmann::json& config);

    /**
     * @brief Replace the pattern table at runtime
     * @return false if the new section has no valid pattern (old table kept)
     */
    bool reload(const nlohmann::json& config);

    bool isEnabled() const;
    std::string getLastError() const;
    nlohmann::json getMetadata() const;

    /**
     * @brief Find uncovered matches without modifying the builder
     */
    std::vector<SafetyNetFinding> scan(const std::string& text,
                                       const ReplacementSetBuilder& builder) const;

    /**
     * @brief Append uncovered matches to the builder
     * @return Number of entries added
     */
    size_t apply(const std::string& text, ReplacementSetBuilder& builder) const;

    std::string placeholderFor(KindCategory category, size_t number) const;

private:
    bool enabled_;
    mutable std::string last_error_;
    mutable std::mutex mutex_;

    std::vector<SafetyNetPattern> patterns_;
    size_t min_phone_digits_;
    std::string email_placeholder_;
    std::string phone_placeholder_;
    std::string id_placeholder_;

    void loadEmbeddedDefaults();
    bool loadPatternsFromConfig(const nlohmann::json& config);
    bool compilePattern(SafetyNetPattern& pattern);
    bool acceptMatch(const SafetyNetPattern& pattern, const std::string& text,
                     size_t pos, size_t len) const;
    // Caller holds mutex_; adds accepted findings to `builder`
    std::vector<SafetyNetFinding> collect(const std::string& text,
                                          ReplacementSetBuilder& builder) const;
    std::string formatPlaceholder(const std::string& format, size_t number,
                                  const std::string& fallback) const;
};

} // namespace sanitizer
} // namespace docsan
