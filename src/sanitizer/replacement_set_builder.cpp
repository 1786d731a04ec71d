#include "sanitizer/replacement_set_builder.h"
#include "utils/logger.h"
#include <algorithm>
#include <cctype>

namespace docsan {
namespace sanitizer {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Returns false when the field cannot be used as text
bool fieldAsText(const nlohmann::json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return false;
    if (it->is_string()) {
        out = it->get<std::string>();
        return true;
    }
    if (it->is_number()) {
        out = it->dump();
        return true;
    }
    return false;
}

} // namespace

std::string ReplacementSetBuilder::normalize(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string ReplacementSetBuilder::normalizeEmail(std::string_view value) {
    std::string lower = normalize(value);
    size_t at_pos = lower.find('@');
    if (at_pos == std::string::npos) {
        return lower;
    }
    std::string local = lower.substr(0, at_pos);
    local.erase(std::remove(local.begin(), local.end(), '.'), local.end());
    return local + lower.substr(at_pos);
}

void ReplacementSetBuilder::markCovered(const std::string& original) {
    covered_.insert(normalize(original));
    if (original.find('@') != std::string::npos) {
        covered_.insert(normalizeEmail(original));
    }
}

bool ReplacementSetBuilder::add(const std::string& original, const std::string& kind,
                                const std::string& replacement) {
    // A blank original would rewrite every run of whitespace
    if (trim(original).empty()) {
        ++dropped_;
        return false;
    }

    std::string key = normalize(original);
    if (originals_.count(key) > 0) {
        ++dropped_;
        DOCSAN_DEBUG("ReplacementSetBuilder: duplicate original dropped ({})",
                     KindUtils::maskValue(kind, original));
        return false;
    }

    originals_.insert(key);
    markCovered(original);
    entries_.push_back(Replacement{original, kind, replacement});

    switch (KindUtils::categorize(kind)) {
        case KindCategory::EMAIL: ++email_count_; break;
        case KindCategory::PHONE: ++phone_count_; break;
        case KindCategory::ID: ++id_count_; break;
        default: break;
    }
    return true;
}

bool ReplacementSetBuilder::add(const Replacement& entry) {
    return add(entry.original, entry.kind, entry.replacement);
}

bool ReplacementSetBuilder::addCandidate(const nlohmann::json& candidate) {
    if (!candidate.is_object()) {
        ++dropped_;
        return false;
    }

    std::string original;
    std::string replacement;
    if (!fieldAsText(candidate, "original", original) ||
        !fieldAsText(candidate, "replacement", replacement)) {
        ++dropped_;
        return false;
    }

    std::string kind = "unknown";
    auto type_it = candidate.find("type");
    if (type_it != candidate.end() && type_it->is_string()) {
        kind = type_it->get<std::string>();
    }
    return add(original, kind, replacement);
}

size_t ReplacementSetBuilder::addCandidates(const nlohmann::json& candidates) {
    if (!candidates.is_array()) {
        return 0;
    }
    size_t accepted = 0;
    for (const auto& c : candidates) {
        if (addCandidate(c)) ++accepted;
    }
    return accepted;
}

std::pair<Status, nlohmann::json> ReplacementSetBuilder::parseDetectorResponse(
    const std::string& raw) {
    std::string content = trim(raw);

    // Detectors frequently wrap their JSON in a markdown fence
    if (content.rfind("```", 0) == 0) {
        size_t body_start = content.find('\n');
        if (content.rfind("```json", 0) == 0) {
            body_start = 7;
        } else if (body_start == std::string::npos) {
            body_start = 3;
        }
        size_t fence_end = content.find("```", body_start);
        content = trim(content.substr(body_start,
            fence_end == std::string::npos ? std::string::npos : fence_end - body_start));
    }

    nlohmann::json parsed = nlohmann::json::parse(content, nullptr, false);
    if (parsed.is_discarded()) {
        return {Status::Error(ErrorCode::InvalidReplacementData,
                              "Detector response is not valid JSON"), nlohmann::json::array()};
    }
    if (!parsed.is_array()) {
        return {Status::Error(ErrorCode::InvalidReplacementData,
                              "Detector response is not a JSON array"), nlohmann::json::array()};
    }
    return {Status::OK(), std::move(parsed)};
}

std::pair<Status, size_t> ReplacementSetBuilder::addDetectorResponse(const std::string& raw) {
    auto [status, payload] = parseDetectorResponse(raw);
    if (!status) {
        DOCSAN_WARN("ReplacementSetBuilder: {}", status.message);
        return {status, 0};
    }
    size_t accepted = addCandidates(payload);
    DOCSAN_INFO("ReplacementSetBuilder: accepted {} of {} detector candidate(s)",
                accepted, payload.size());
    return {Status::OK(), accepted};
}

bool ReplacementSetBuilder::isCovered(const std::string& value) const {
    if (covered_.count(normalize(value)) > 0) {
        return true;
    }
    if (value.find('@') != std::string::npos) {
        return covered_.count(normalizeEmail(value)) > 0;
    }
    return false;
}

size_t ReplacementSetBuilder::nextNumber(KindCategory category) const {
    switch (category) {
        case KindCategory::EMAIL: return email_count_ + 1;
        case KindCategory::PHONE: return phone_count_ + 1;
        case KindCategory::ID: return id_count_ + 1;
        default: return 1;
    }
}

ReplacementSet ReplacementSetBuilder::build() const {
    return ReplacementSet(entries_);
}

} // namespace sanitizer
} // namespace docsan
