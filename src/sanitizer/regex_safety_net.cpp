#include "sanitizer/regex_safety_net.h"
#include "utils/logger.h"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace docsan {
namespace sanitizer {

namespace {

constexpr const char* kDefaultEmailPlaceholder = "person_{}@example.com";
constexpr const char* kDefaultPhonePlaceholder = "+00 00 000 {:04d}";
constexpr const char* kDefaultIdPlaceholder = "ID_{:06d}";

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

size_t countDigits(const std::string& value) {
    return static_cast<size_t>(std::count_if(value.begin(), value.end(), isDigit));
}

std::string trimmed(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// True for `+`, `*` or `{n,}` outside a character class. std::regex recurses
// once per repeated character, so an unbounded repeat over a long token
// exhausts the stack.
bool hasUnboundedRepeat(const std::string& regex) {
    bool in_class = false;
    for (size_t i = 0; i < regex.size(); ++i) {
        char c = regex[i];
        if (c == '\\') {
            ++i;
            continue;
        }
        if (in_class) {
            if (c == ']') in_class = false;
            continue;
        }
        if (c == '[') {
            in_class = true;
        } else if (c == '+' || c == '*') {
            return true;
        } else if (c == '{') {
            size_t close = regex.find('}', i);
            if (close != std::string::npos && close > i + 1 && regex[close - 1] == ',') {
                return true;
            }
        }
    }
    return false;
}

} // namespace

RegexSafetyNet::RegexSafetyNet()
    : enabled_(true)
    , min_phone_digits_(7)
    , email_placeholder_(kDefaultEmailPlaceholder)
    , phone_placeholder_(kDefaultPhonePlaceholder)
    , id_placeholder_(kDefaultIdPlaceholder) {
    loadEmbeddedDefaults();
}

bool RegexSafetyNet::initialize(const nlohmann::json& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    last_error_.clear();

    try {
        enabled_ = config.value("enabled", true);
        min_phone_digits_ = config.value("min_phone_digits", static_cast<size_t>(7));
        email_placeholder_ = config.value("email_placeholder", std::string(kDefaultEmailPlaceholder));
        phone_placeholder_ = config.value("phone_placeholder", std::string(kDefaultPhonePlaceholder));
        id_placeholder_ = config.value("id_placeholder", std::string(kDefaultIdPlaceholder));

        if (config.contains("patterns")) {
            if (!loadPatternsFromConfig(config)) {
                DOCSAN_WARN("RegexSafetyNet: Pattern loading failed, using embedded defaults");
                loadEmbeddedDefaults();
            }
        }

        DOCSAN_INFO("RegexSafetyNet: Initialized with {} patterns (enabled={})",
                    patterns_.size(), enabled_);
        return true;

    } catch (const std::exception& e) {
        last_error_ = std::string("Initialization failed: ") + e.what();
        DOCSAN_ERROR("RegexSafetyNet: {}", last_error_);
        return false;
    }
}

bool RegexSafetyNet::reload(const nlohmann::json& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto old_patterns = patterns_;
    last_error_.clear();

    if (!loadPatternsFromConfig(config)) {
        patterns_ = old_patterns;
        DOCSAN_ERROR("RegexSafetyNet: Reload failed, retained previous patterns");
        return false;
    }

    DOCSAN_INFO("RegexSafetyNet: Reloaded {} patterns", patterns_.size());
    return true;
}

bool RegexSafetyNet::isEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

std::string RegexSafetyNet::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

nlohmann::json RegexSafetyNet::getMetadata() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json metadata;
    metadata["enabled"] = enabled_;
    metadata["pattern_count"] = std::count_if(patterns_.begin(), patterns_.end(),
                                              [](const SafetyNetPattern& p) { return p.enabled; });
    metadata["total_patterns"] = patterns_.size();
    metadata["min_phone_digits"] = min_phone_digits_;

    nlohmann::json names = nlohmann::json::array();
    for (const auto& p : patterns_) {
        names.push_back(p.name);
    }
    metadata["patterns"] = names;
    return metadata;
}

std::vector<SafetyNetFinding> RegexSafetyNet::scan(const std::string& text,
                                                   const ReplacementSetBuilder& builder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_) {
        return {};
    }
    ReplacementSetBuilder scratch = builder;
    return collect(text, scratch);
}

size_t RegexSafetyNet::apply(const std::string& text, ReplacementSetBuilder& builder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_) {
        return 0;
    }

    auto findings = collect(text, builder);

    if (!findings.empty()) {
        DOCSAN_INFO("RegexSafetyNet: added {} item(s) missed by the detector", findings.size());
    } else {
        DOCSAN_INFO("RegexSafetyNet: detector covered all emails/phones/IDs, no additions needed");
    }
    return findings.size();
}

std::string RegexSafetyNet::placeholderFor(KindCategory category, size_t number) const {
    switch (category) {
        case KindCategory::EMAIL:
            return formatPlaceholder(email_placeholder_, number, kDefaultEmailPlaceholder);
        case KindCategory::PHONE:
            return formatPlaceholder(phone_placeholder_, number, kDefaultPhonePlaceholder);
        case KindCategory::ID:
            return formatPlaceholder(id_placeholder_, number, kDefaultIdPlaceholder);
        default:
            return fmt::format("Item_{}", number);
    }
}

std::vector<SafetyNetFinding> RegexSafetyNet::collect(const std::string& text,
                                                      ReplacementSetBuilder& builder) const {
    std::vector<SafetyNetFinding> findings;

    for (const auto& pattern : patterns_) {
        if (!pattern.enabled) continue;

        std::sregex_iterator it(text.begin(), text.end(), pattern.compiled_regex);
        std::sregex_iterator end;

        for (; it != end; ++it) {
            const std::smatch& match = *it;
            size_t pos = static_cast<size_t>(match.position());
            size_t len = static_cast<size_t>(match.length());
            if (!acceptMatch(pattern, text, pos, len)) {
                continue;
            }

            std::string value = trimmed(match.str());
            if (value.empty() || builder.isCovered(value)) {
                continue;
            }

            size_t number = builder.nextNumber(pattern.category);
            std::string placeholder = placeholderFor(pattern.category, number);
            if (!builder.add(value, KindUtils::toString(pattern.category), placeholder)) {
                continue;
            }

            DOCSAN_INFO("RegexSafetyNet: caught missed {} '{}' -> {}",
                        KindUtils::toString(pattern.category),
                        KindUtils::maskValue(KindUtils::toString(pattern.category), value),
                        placeholder);

            findings.push_back(SafetyNetFinding{value, pattern.category, pattern.name, pos});
        }
    }

    return findings;
}

bool RegexSafetyNet::acceptMatch(const SafetyNetPattern& pattern, const std::string& text,
                                 size_t pos, size_t len) const {
    if (pattern.digit_guard) {
        if (pos > 0 && isDigit(text[pos - 1])) return false;
        if (pos + len < text.size() && isDigit(text[pos + len])) return false;
    }
    if (pattern.category == KindCategory::PHONE) {
        // Years, amounts and short codes carry too few digits
        if (countDigits(text.substr(pos, len)) < min_phone_digits_) return false;
    }
    return true;
}

std::string RegexSafetyNet::formatPlaceholder(const std::string& format, size_t number,
                                              const std::string& fallback) const {
    try {
        return fmt::format(fmt::runtime(format), number);
    } catch (const fmt::format_error& e) {
        DOCSAN_WARN("RegexSafetyNet: invalid placeholder format '{}': {}", format, e.what());
        return fmt::format(fmt::runtime(fallback), number);
    }
}

void RegexSafetyNet::loadEmbeddedDefaults() {
    patterns_.clear();

    std::vector<SafetyNetPattern> defaults = {
        // local@domain.tld, lengths capped at the RFC 5321 limits
        {"EMAIL", R"([a-zA-Z0-9._%+\-]{1,64}@[a-zA-Z0-9.\-]{1,253}\.[a-zA-Z]{2,63})", {},
         KindCategory::EMAIL, false, true},
        // +94 77 523 4567, +1-555-123-4567
        {"PHONE_INTERNATIONAL", R"(\+\d{1,3}[\s\-]?\d{1,4}[\s\-]?\d{2,4}[\s\-]?\d{3,4})", {},
         KindCategory::PHONE, false, true},
        // 077-523-4567, (077) 523 4567, 077.523.4567
        {"PHONE_LOCAL", R"(\(?\d{3,4}\)?[\s\-\.]\d{3,4}[\s\-\.]\d{3,4})", {},
         KindCategory::PHONE, false, true},
        {"PHONE_COMPACT", R"(\d{10,12})", {}, KindCategory::PHONE, true, true},
        // 9 digits + V/X suffix, or 12 digits
        {"ID_SUFFIXED", R"(\d{9}[VvXx])", {}, KindCategory::ID, true, true},
        {"ID_NUMERIC", R"(\d{12})", {}, KindCategory::ID, true, true},
    };

    for (auto& pattern : defaults) {
        if (compilePattern(pattern)) {
            patterns_.push_back(pattern);
        }
    }

    DOCSAN_DEBUG("RegexSafetyNet: Loaded {} embedded default patterns", patterns_.size());
}

bool RegexSafetyNet::loadPatternsFromConfig(const nlohmann::json& config) {
    if (!config.contains("patterns") || !config["patterns"].is_array()) {
        last_error_ = "No 'patterns' list found in configuration";
        return false;
    }

    std::vector<SafetyNetPattern> loaded;

    for (const auto& node : config["patterns"]) {
        SafetyNetPattern pattern;

        try {
            pattern.name = node.value("name", "");
            pattern.regex_str = node.value("regex", "");
            pattern.category = KindUtils::categorize(node.value("kind", ""));
            pattern.digit_guard = node.value("digit_guard", false);
            pattern.enabled = node.value("enabled", true);
        } catch (const std::exception& e) {
            DOCSAN_WARN("RegexSafetyNet: Failed to parse pattern: {}", e.what());
            continue;
        }

        if (pattern.category == KindCategory::OTHER) {
            DOCSAN_WARN("RegexSafetyNet: Pattern '{}' has no email/phone/id kind", pattern.name);
            continue;
        }

        if (hasUnboundedRepeat(pattern.regex_str)) {
            DOCSAN_WARN("RegexSafetyNet: Pattern '{}' has an unbounded repeat, use {{m,n}}",
                        pattern.name);
            continue;
        }

        if (pattern.regex_str.empty() || !compilePattern(pattern)) {
            DOCSAN_WARN("RegexSafetyNet: Failed to compile pattern '{}'", pattern.name);
            continue;
        }

        loaded.push_back(std::move(pattern));
    }

    if (loaded.empty()) {
        last_error_ = "No valid patterns loaded from configuration";
        return false;
    }

    patterns_ = std::move(loaded);
    return true;
}

bool RegexSafetyNet::compilePattern(SafetyNetPattern& pattern) {
    try {
        pattern.compiled_regex = std::regex(pattern.regex_str, std::regex::ECMAScript);
        return true;
    } catch (const std::regex_error& e) {
        DOCSAN_ERROR("RegexSafetyNet: Regex compilation failed for '{}': {}",
                     pattern.name, e.what());
        return false;
    }
}

} // namespace sanitizer
} // namespace docsan
