#include "recognizer/whitelist_recognizer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_set>

namespace piishield {

WhitelistRecognizer::WhitelistRecognizer(std::string name,
                                         std::string entity_type,
                                         const std::vector<std::string>& examples,
                                         double score)
    : name_(std::move(name)),
      entity_type_(std::move(entity_type)),
      score_(score) {

    if (name_.empty()) {
        throw InvalidRuleError("Whitelist rule requires a non-empty name");
    }
    if (entity_type_.empty()) {
        throw InvalidRuleError(std::format("Whitelist rule '{}' requires an entity type", name_));
    }
    if (!(score_ >= 0.0 && score_ <= 1.0)) {
        throw InvalidRuleError(
            std::format("Whitelist rule '{}': score {} outside [0, 1]", name_, score_));
    }

    std::unordered_set<std::string> seen;
    for (const auto& raw : examples) {
        std::string example = utils::trim(raw);
        if (example.empty()) continue;

        std::string lowered = utils::to_lower(example);
        if (!seen.insert(lowered).second) continue;

        examples_.emplace_back(std::move(example));
        lowered_.emplace_back(std::move(lowered));
    }

    if (examples_.empty()) {
        throw InvalidRuleError(
            std::format("Whitelist rule '{}' requires at least one non-empty example", name_));
    }
}

std::vector<Span> WhitelistRecognizer::detect(std::string_view text) const {
    std::vector<Span> spans;
    if (text.empty()) {
        return spans;
    }

    const std::string haystack = utils::to_lower(text);

    for (const auto& needle : lowered_) {
        if (needle.size() > haystack.size()) continue;

        const bool word_front = utils::is_word_char(needle.front());
        const bool word_back = utils::is_word_char(needle.back());

        size_t pos = haystack.find(needle);
        while (pos != std::string::npos) {
            const size_t end = pos + needle.size();

            // Boundary check mirrors \b: only enforced where the example itself
            // starts/ends with a word character
            const bool front_ok = !word_front || pos == 0 ||
                                  !utils::is_word_char(haystack[pos - 1]);
            const bool back_ok = !word_back || end == haystack.size() ||
                                 !utils::is_word_char(haystack[end]);

            if (front_ok && back_ok) {
                spans.emplace_back(entity_type_, pos, end, score_, name_);
            }
            pos = haystack.find(needle, pos + 1);
        }
    }
    return spans;
}

} // namespace piishield
