#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace piishield {

// ============================================================================
// Detection Results
// ============================================================================

/**
 * @brief One detected region of a single text unit.
 *
 * Offsets are byte offsets into the unit's UTF-8 string, half-open [start, end).
 * A span is only meaningful against the text it was produced from.
 */
struct Span {
    std::string type;
    size_t start = 0;
    size_t end = 0;
    double score = 0.0;
    std::string recognizer;     // Name of the recognizer that produced it

    Span() = default;
    Span(std::string t, size_t s, size_t e, double sc, std::string rec = {})
        : type(std::move(t)), start(s), end(e), score(sc), recognizer(std::move(rec)) {}

    [[nodiscard]] size_t length() const { return end - start; }

    [[nodiscard]] bool overlaps(const Span& other) const {
        return start < other.end && other.start < end;
    }

    // Span invariants against a text of the given size
    [[nodiscard]] bool valid_for(size_t text_size) const {
        return start < end && end <= text_size && score >= 0.0 && score <= 1.0;
    }

    bool operator==(const Span&) const = default;
};

enum class RecognizerKind {
    MODEL,
    PATTERN,
    WHITELIST
};

[[nodiscard]] inline const char* recognizer_kind_to_string(RecognizerKind kind) {
    switch (kind) {
        case RecognizerKind::MODEL:     return "model";
        case RecognizerKind::PATTERN:   return "regex";
        case RecognizerKind::WHITELIST: return "whitelist";
    }
    return "unknown";
}

// ============================================================================
// Rule Definitions (runtime registration input)
// ============================================================================

enum class RuleKind {
    REGEX,
    WHITELIST
};

struct RuleDefinition {
    std::string name;
    RuleKind kind = RuleKind::REGEX;
    std::string pattern;                // kind == REGEX
    std::vector<std::string> examples;  // kind == WHITELIST
    double score = 0.8;
};

// ============================================================================
// Degraded-result Reporting
// ============================================================================

enum class FailureKind {
    FAULT,          // recognizer threw
    TIMEOUT,        // recognizer exceeded its time budget
    INVALID_SPAN    // recognizer returned spans violating the span invariants
};

[[nodiscard]] inline const char* failure_kind_to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::FAULT:        return "FAULT";
        case FailureKind::TIMEOUT:      return "TIMEOUT";
        case FailureKind::INVALID_SPAN: return "INVALID_SPAN";
    }
    return "UNKNOWN";
}

struct RecognizerFailure {
    std::string recognizer;
    FailureKind kind = FailureKind::FAULT;
    std::string message;

    bool operator==(const RecognizerFailure&) const = default;
};

/**
 * @brief Output of one analysis pass over one text unit
 */
struct AnalysisResult {
    std::vector<Span> spans;                    // conflict-free, ascending by start
    std::vector<RecognizerFailure> warnings;    // isolated recognizer failures

    [[nodiscard]] bool degraded() const { return !warnings.empty(); }
};

// ============================================================================
// Findings (report rows)
// ============================================================================

struct UnitId {
    std::string column;
    size_t row = 0;

    bool operator==(const UnitId&) const = default;
};

struct Finding {
    std::optional<UnitId> unit;     // nullopt for a single text document
    std::string type;
    std::string excerpt;
    double score = 0.0;
    size_t start = 0;
    size_t end = 0;
    std::string recognizer;
};

// ============================================================================
// Redaction
// ============================================================================

enum class RedactionAction {
    REPLACE,    // [PII:<type>]
    MASK,       // every byte of the span becomes '*'
    HASH        // [PII:<type>:<sha256 prefix>]
};

[[nodiscard]] inline const char* redaction_action_to_string(RedactionAction action) {
    switch (action) {
        case RedactionAction::REPLACE: return "replace";
        case RedactionAction::MASK:    return "mask";
        case RedactionAction::HASH:    return "hash";
    }
    return "replace";
}

} // namespace piishield
