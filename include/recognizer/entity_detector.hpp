#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace piishield {

/**
 * @brief Natural-language entity recognizer (external collaborator)
 *
 * Implemented in-process or by a loaded plugin (see plugin/plugin_loader.hpp).
 * The engine only consumes the spans; it never trains or tunes the model.
 */
class IEntityDetector {
public:
    virtual ~IEntityDetector() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Detect entities in text
     * @param text Text unit
     * @param requested_types Entity types to report; empty means all supported types
     * @return Raw spans (type, start, end, score); recognizer field may be left empty
     */
    [[nodiscard]] virtual std::vector<Span> detect(
        std::string_view text,
        const std::vector<std::string>& requested_types) const = 0;
};

} // namespace piishield
