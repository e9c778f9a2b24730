#pragma once

#include "core/types.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace piishield {

/**
 * @brief Findings report handed to the presentation layer
 *
 * A pure value: building or serializing it never touches engine state.
 */
struct FindingsReport {
    std::string source;                         // file name or label
    std::vector<Finding> findings;
    std::vector<RecognizerFailure> warnings;

    [[nodiscard]] size_t total() const { return findings.size(); }
    [[nodiscard]] bool degraded() const { return !warnings.empty(); }

    // entity type -> count, sorted by type
    [[nodiscard]] std::map<std::string, size_t> counts_by_type() const;

    /**
     * @brief JSON document: source, summary, findings, warnings
     *
     * Findings carry column/row only when they come from a table cell.
     */
    [[nodiscard]] nlohmann::ordered_json to_json() const;

    /**
     * @brief Serialized to_json()
     *
     * Excerpts are byte slices and may cut a multi-byte character; invalid
     * UTF-8 is written as U+FFFD instead of failing.
     */
    [[nodiscard]] std::string to_json_string(int indent = 2) const;

    /**
     * @brief CSV with header Column,Row,PII_Type,Text,Score,Start,End,Recognizer
     */
    [[nodiscard]] std::string to_csv() const;
};

} // namespace piishield
