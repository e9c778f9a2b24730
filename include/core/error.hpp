#pragma once

#include <stdexcept>
#include <string>

namespace piishield {

/**
 * @brief Base class for every error the engine reports to its caller
 */
class PiiShieldError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Malformed rule registration (empty name, bad regex, empty whitelist,
 * score out of range). The registry is left unchanged.
 */
class InvalidRuleError : public PiiShieldError {
public:
    using PiiShieldError::PiiShieldError;
};

/**
 * @brief Span sequence handed to the Redactor is unsorted, overlapping,
 * or points outside the text.
 */
class OverlappingSpanError : public PiiShieldError {
public:
    using PiiShieldError::PiiShieldError;
};

/**
 * @brief Input text/table fails basic shape checks (ragged rows,
 * duplicate columns, unparsable CSV/JSON). No partial output is produced.
 */
class MalformedInputError : public PiiShieldError {
public:
    using PiiShieldError::PiiShieldError;
};

} // namespace piishield
