#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docsan {
namespace sanitizer {

/**
 * @brief One (original -> replacement) pair proposed for a document
 *
 * `original` is never empty once the entry is inside a ReplacementSet.
 * `kind` is the free-form category tag reported by the detector
 * ("email", "phone", "person", ...).
 */
struct Replacement {
    std::string original;
    std::string kind;
    std::string replacement;

    bool operator==(const Replacement& other) const {
        return original == other.original && kind == other.kind &&
               replacement == other.replacement;
    }
};

/**
 * @brief Replacements ordered by descending original length
 *
 * Ties keep their input order. The ordering is what lets a longer target
 * ("Priya Anjali Fernando") be consumed before any shorter target it
 * contains ("Priya") gets a chance to match inside it.
 */
class ReplacementSet {
public:
    using const_iterator = std::vector<Replacement>::const_iterator;

    ReplacementSet() = default;
    explicit ReplacementSet(std::vector<Replacement> entries);

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const Replacement& operator[](size_t i) const { return entries_[i]; }
    const std::vector<Replacement>& entries() const { return entries_; }

private:
    std::vector<Replacement> entries_;
};

enum class KindCategory { EMAIL, PHONE, ID, OTHER };

/**
 * @brief Helpers for the detector's kind tags
 */
class KindUtils {
public:
    /**
     * @brief Map a kind tag to its numbering category
     *
     * "email" -> EMAIL, "phone" -> PHONE, "id_number" / "nic" / "passport" /
     * "ssn" -> ID. Comparison is case-insensitive.
     */
    static KindCategory categorize(const std::string& kind);

    static const char* toString(KindCategory category);

    /**
     * @brief Mask a value before it is written to a log line
     *
     * @return e.g. "p***@finance.lk", "***4567", "***23V", "P*** (5 chars)"
     */
    static std::string maskValue(const std::string& kind, const std::string& value);
};

} // namespace sanitizer
} // namespace docsan
