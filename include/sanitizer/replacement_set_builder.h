#pragma once

#include "sanitizer/replacement.h"
#include "sanitizer/sanitize_result.h"
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace docsan {
namespace sanitizer {

/**
 * @brief Ingress boundary for detector output
 *
 * Turns untrusted, loosely typed candidate triples into a validated
 * ReplacementSet:
 * - entries with an empty original or without a replacement are dropped
 * - an original already present (case-insensitive) is not added twice
 * - per-kind counters (email, phone, id) track accepted entries so that
 *   later additions continue the numbering instead of restarting at 1
 * - build() orders the result longest-first
 *
 * Example detector reply accepted by addDetectorResponse():
 * @code
 * ```json
 * [{"original": "john.doe87@company.lk", "type": "email", "replacement": "person_1@example.com"}]
 * ```
 * @endcode
 */
class ReplacementSetBuilder {
public:
    ReplacementSetBuilder() = default;

    /**
     * @brief Add one candidate
     * @return false if the candidate was dropped (empty or already covered)
     */
    bool add(const std::string& original, const std::string& kind,
             const std::string& replacement);
    bool add(const Replacement& entry);

    /**
     * @brief Add one candidate object {original, type, replacement}
     *
     * Numeric fields are converted to their text form; null, missing or
     * structured `original` / `replacement` drop the entry.
     */
    bool addCandidate(const nlohmann::json& candidate);

    /**
     * @brief Add every object of a candidate array
     * @return Number of accepted entries
     */
    size_t addCandidates(const nlohmann::json& candidates);

    /**
     * @brief Parse a raw detector reply and add its candidates
     * @return Status (InvalidReplacementData if the reply is not a JSON array)
     *         and the number of accepted entries
     */
    std::pair<Status, size_t> addDetectorResponse(const std::string& raw);

    /**
     * @brief Strip an optional ``` / ```json fence and parse the payload
     */
    static std::pair<Status, nlohmann::json> parseDetectorResponse(const std::string& raw);

    /**
     * @brief Check whether a value is already represented in the set
     *
     * Uses lower-case comparison, and for emails additionally ignores dots
     * in the local part (john.doe@x.com == johndoe@x.com).
     */
    bool isCovered(const std::string& value) const;

    /**
     * @brief Next sequential number for a kind category (accepted count + 1)
     */
    size_t nextNumber(KindCategory category) const;

    size_t size() const { return entries_.size(); }
    size_t droppedCount() const { return dropped_; }
    const std::vector<Replacement>& entries() const { return entries_; }

    ReplacementSet build() const;

    // Normalization used for coverage checks
    static std::string normalize(std::string_view value);
    static std::string normalizeEmail(std::string_view value);

private:
    void markCovered(const std::string& original);

    std::vector<Replacement> entries_;
    std::unordered_set<std::string> originals_;   // normalize(original)
    std::unordered_set<std::string> covered_;     // normalize + normalizeEmail keys
    size_t email_count_ = 0;
    size_t phone_count_ = 0;
    size_t id_count_ = 0;
    size_t dropped_ = 0;
};

} // namespace sanitizer
} // namespace docsan
