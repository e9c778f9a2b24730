#pragma once

#include "recognizer/recognizer.hpp"
#include <string>
#include <vector>

namespace piishield {

/**
 * @brief Example-list recognizer: one span per occurrence of a listed string
 *
 * Matching is case-insensitive. An occurrence is rejected when it is glued to
 * a longer word, so "school123" does not fire inside "myschool1234".
 */
class WhitelistRecognizer final : public IRecognizer {
public:
    /**
     * @throws InvalidRuleError on empty name, no non-blank example or score outside [0,1]
     */
    WhitelistRecognizer(std::string name,
                        std::string entity_type,
                        const std::vector<std::string>& examples,
                        double score);

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] RecognizerKind kind() const override { return RecognizerKind::WHITELIST; }
    [[nodiscard]] std::vector<std::string> supported_entities() const override {
        return {entity_type_};
    }
    [[nodiscard]] std::vector<Span> detect(std::string_view text) const override;

    // Normalized (trimmed, de-duplicated) examples in registration order
    [[nodiscard]] const std::vector<std::string>& examples() const { return examples_; }
    [[nodiscard]] double score() const { return score_; }

private:
    std::string name_;
    std::string entity_type_;
    std::vector<std::string> examples_;
    std::vector<std::string> lowered_;
    double score_;
};

} // namespace piishield
