#pragma once

#include "recognizer/recognizer.hpp"
#include <functional>
#include <regex>
#include <string>

namespace piishield {

/**
 * @brief Regex-backed recognizer: one span per non-empty match
 *
 * The pattern is compiled once at construction (ECMAScript grammar).
 * An optional validator rejects structurally invalid matches, e.g. a Luhn
 * check for card numbers.
 *
 * Text longer than 4 KiB is searched in whitespace-delimited regions of at
 * most 4 KiB; a single token longer than that is skipped. A match that
 * straddles two regions is not reported.
 */
class PatternRecognizer final : public IRecognizer {
public:
    using Validator = std::function<bool(std::string_view)>;

    /**
     * @throws InvalidRuleError on empty name/type, invalid pattern or score outside [0,1]
     */
    PatternRecognizer(std::string name,
                      std::string entity_type,
                      std::string pattern,
                      double score,
                      Validator validator = nullptr);

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] RecognizerKind kind() const override { return RecognizerKind::PATTERN; }
    [[nodiscard]] std::vector<std::string> supported_entities() const override {
        return {entity_type_};
    }
    [[nodiscard]] std::vector<Span> detect(std::string_view text) const override;

    [[nodiscard]] const std::string& pattern() const { return pattern_; }
    [[nodiscard]] double score() const { return score_; }

private:
    std::string name_;
    std::string entity_type_;
    std::string pattern_;
    double score_;
    std::regex regex_;
    Validator validator_;
};

} // namespace piishield
