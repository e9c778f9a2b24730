#include "recognizer/pattern_recognizer.hpp"
#include "core/error.hpp"

#include <cctype>
#include <format>

namespace piishield {

namespace {

// libstdc++'s regex executor recurses once per consumed character, so a
// search over tens of kilobytes overflows the stack. Searches run over
// whitespace-delimited regions of at most this many bytes; a single token
// longer than this is never handed to the regex engine.
constexpr size_t kMaxRegionBytes = 4096;

struct Region {
    size_t begin;
    size_t end;
};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::vector<Region> split_regions(std::string_view text) {
    if (text.size() <= kMaxRegionBytes) {
        return {Region{0, text.size()}};
    }

    std::vector<Region> regions;
    bool open = false;
    size_t region_begin = 0;
    size_t region_end = 0;

    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && is_space(text[pos])) ++pos;
        if (pos == text.size()) break;

        const size_t token_begin = pos;
        while (pos < text.size() && !is_space(text[pos])) ++pos;
        const size_t token_end = pos;

        if (token_end - token_begin > kMaxRegionBytes) {
            if (open) regions.push_back({region_begin, region_end});
            open = false;
            continue;
        }
        if (open && token_end - region_begin > kMaxRegionBytes) {
            regions.push_back({region_begin, region_end});
            open = false;
        }
        if (!open) {
            region_begin = token_begin;
            open = true;
        }
        region_end = token_end;
    }
    if (open) regions.push_back({region_begin, region_end});
    return regions;
}

} // anonymous namespace

PatternRecognizer::PatternRecognizer(std::string name,
                                     std::string entity_type,
                                     std::string pattern,
                                     double score,
                                     Validator validator)
    : name_(std::move(name)),
      entity_type_(std::move(entity_type)),
      pattern_(std::move(pattern)),
      score_(score),
      validator_(std::move(validator)) {

    if (name_.empty()) {
        throw InvalidRuleError("Regex rule requires a non-empty name");
    }
    if (entity_type_.empty()) {
        throw InvalidRuleError(std::format("Regex rule '{}' requires an entity type", name_));
    }
    if (pattern_.empty()) {
        throw InvalidRuleError(std::format("Regex rule '{}' requires a pattern", name_));
    }
    if (!(score_ >= 0.0 && score_ <= 1.0)) {
        throw InvalidRuleError(
            std::format("Regex rule '{}': score {} outside [0, 1]", name_, score_));
    }

    try {
        regex_ = std::regex(pattern_, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw InvalidRuleError(
            std::format("Regex rule '{}': invalid pattern '{}': {}", name_, pattern_, e.what()));
    }
}

std::vector<Span> PatternRecognizer::detect(std::string_view text) const {
    std::vector<Span> spans;
    if (text.empty()) {
        return spans;
    }

    const char* const base = text.data();

    for (const auto& region : split_regions(text)) {
        // Anchors and \b see the surrounding text, not the region edges
        auto flags = std::regex_constants::match_default;
        if (region.begin > 0) flags |= std::regex_constants::match_prev_avail;
        if (region.end < text.size()) flags |= std::regex_constants::match_not_eol;

        const char* const begin = base + region.begin;
        const char* const end = base + region.end;

        for (std::cregex_iterator it(begin, end, regex_, flags), last; it != last; ++it) {
            const auto& match = *it;
            if (match.length(0) == 0) {
                continue;   // zero-width matches (e.g. "a*") carry nothing to redact
            }

            const auto start = region.begin + static_cast<size_t>(match.position(0));
            const auto len = static_cast<size_t>(match.length(0));

            if (validator_ && !validator_(text.substr(start, len))) {
                continue;
            }
            spans.emplace_back(entity_type_, start, start + len, score_, name_);
        }
    }
    return spans;
}

} // namespace piishield
