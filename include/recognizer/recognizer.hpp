#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace piishield {

/**
 * @brief Pluggable detector interface
 *
 * Implementations must be safe to call concurrently from several analysis
 * passes: detect() is const and may not mutate shared state.
 */
class IRecognizer {
public:
    virtual ~IRecognizer() = default;

    [[nodiscard]] virtual const std::string& name() const = 0;

    [[nodiscard]] virtual RecognizerKind kind() const = 0;

    /**
     * @brief Entity types this recognizer may emit
     */
    [[nodiscard]] virtual std::vector<std::string> supported_entities() const = 0;

    /**
     * @brief Detect spans in one text unit
     * @param text Unit text (document or cell)
     * @return Spans relative to text, in any order, possibly overlapping
     */
    [[nodiscard]] virtual std::vector<Span> detect(std::string_view text) const = 0;
};

} // namespace piishield
