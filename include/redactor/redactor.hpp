#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace piishield {

struct RedactorOptions {
    RedactionAction default_action = RedactionAction::REPLACE;
    std::unordered_map<std::string, RedactionAction> actions;   // entity type -> action
};

/**
 * @brief Redactor - single-pass copy-and-splice rewriting of one text unit
 *
 * Actions:
 * - REPLACE: "[PII:<type>]"
 * - MASK:    every byte of the span replaced by '*' (length preserved)
 * - HASH:    "[PII:<type>:<first 16 hex chars of SHA-256(span text)>]"
 *
 * Spans must be sorted ascending by start, non-overlapping and inside the text
 * (as the Analyzer produces them). Violations raise OverlappingSpanError
 * instead of producing corrupted output. The input is never modified, so
 * redacting the same text with the same spans always yields the same string.
 */
class Redactor {
public:
    Redactor() = default;
    explicit Redactor(RedactorOptions options);

    /**
     * @throws OverlappingSpanError on unsorted, overlapping or out-of-range spans
     */
    [[nodiscard]] std::string redact(std::string_view text, const std::vector<Span>& spans) const;

    [[nodiscard]] RedactionAction action_for(const std::string& type) const;

    [[nodiscard]] const RedactorOptions& options() const { return options_; }

    [[nodiscard]] static std::string placeholder(std::string_view type);

private:
    void emit(std::string& out, std::string_view original, const Span& span) const;

    [[nodiscard]] static std::string hash_value(std::string_view value);

    RedactorOptions options_;
};

} // namespace piishield
