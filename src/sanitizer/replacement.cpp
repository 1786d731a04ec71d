#include "sanitizer/replacement.h"
#include <algorithm>
#include <cctype>

namespace docsan {
namespace sanitizer {

ReplacementSet::ReplacementSet(std::vector<Replacement> entries)
    : entries_(std::move(entries)) {
    std::stable_sort(entries_.begin(), entries_.end(),
                     [](const Replacement& a, const Replacement& b) {
                         return a.original.size() > b.original.size();
                     });
}

KindCategory KindUtils::categorize(const std::string& kind) {
    std::string lower = kind;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "email") return KindCategory::EMAIL;
    if (lower == "phone") return KindCategory::PHONE;
    if (lower == "id_number" || lower == "nic" || lower == "passport" || lower == "ssn") {
        return KindCategory::ID;
    }
    return KindCategory::OTHER;
}

const char* KindUtils::toString(KindCategory category) {
    switch (category) {
        case KindCategory::EMAIL: return "email";
        case KindCategory::PHONE: return "phone";
        case KindCategory::ID: return "id_number";
        case KindCategory::OTHER: return "other";
        default: return "other";
    }
}

std::string KindUtils::maskValue(const std::string& kind, const std::string& value) {
    if (value.empty()) return value;

    switch (categorize(kind)) {
        case KindCategory::EMAIL: {
            size_t at_pos = value.find('@');
            if (at_pos != std::string::npos && at_pos > 0) {
                return value.substr(0, 1) + "***" + value.substr(at_pos);
            }
            return std::string(value.length(), '*');
        }
        case KindCategory::PHONE: {
            if (value.size() <= 4) return std::string(value.size(), '*');
            return "***" + value.substr(value.size() - 4);
        }
        case KindCategory::ID: {
            if (value.size() <= 3) return std::string(value.size(), '*');
            return "***" + value.substr(value.size() - 3);
        }
        case KindCategory::OTHER:
        default:
            return value.substr(0, 1) + "*** (" + std::to_string(value.size()) + " chars)";
    }
}

} // namespace sanitizer
} // namespace docsan
