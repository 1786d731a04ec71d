#include "sanitizer/match_pattern.h"
#include <cctype>

namespace docsan {
namespace sanitizer {

MatchPattern::MatchPattern(const std::string& original, size_t short_token_max_length)
    : original_(original)
    , word_bounded_(needsWordBoundary(original, short_token_max_length)) {
    if (word_bounded_) {
        regex_ = std::regex("\\b" + escapeRegex(original) + "\\b", std::regex::ECMAScript);
    } else if (!original.empty()) {
        finder_.emplace(original);
    }
}

bool MatchPattern::needsWordBoundary(const std::string& original, size_t short_token_max_length) {
    if (original.empty() || original.size() > short_token_max_length) {
        return false;
    }
    for (char c : original) {
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string MatchPattern::escapeRegex(const std::string& literal) {
    static const std::string kSpecial = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(literal.size() * 2);
    for (char c : literal) {
        if (kSpecial.find(c) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::optional<Match> MatchPattern::findFirst(const std::string& text, size_t from) const {
    if (original_.empty() || from > text.size()) {
        return std::nullopt;
    }
    if (!word_bounded_) {
        auto range = finder_->find(text, from);
        if (!range) {
            return std::nullopt;
        }
        return Match{range->begin, range->end};
    }
    auto flags = from > 0 ? std::regex_constants::match_prev_avail
                          : std::regex_constants::match_default;
    std::smatch m;
    if (!std::regex_search(text.cbegin() + static_cast<std::ptrdiff_t>(from), text.cend(),
                           m, regex_, flags)) {
        return std::nullopt;
    }
    size_t start = from + static_cast<size_t>(m.position(0));
    return Match{start, start + static_cast<size_t>(m.length(0))};
}

std::vector<Match> MatchPattern::findAll(const std::string& text) const {
    std::vector<Match> matches;
    size_t from = 0;
    while (auto m = findFirst(text, from)) {
        matches.push_back(*m);
        from = m->end;
    }
    return matches;
}

bool MatchPattern::acceptsRendered(const std::string& rendered) const {
    if (!word_bounded_) {
        return true;
    }
    return findFirst(rendered).has_value();
}

} // namespace sanitizer
} // namespace docsan
