#pragma once

#include "recognizer/recognizer.hpp"
#include "recognizer/entity_detector.hpp"
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace piishield {

/**
 * @brief Recognizer delegating to an IEntityDetector for a fixed entity catalog
 *
 * Spans of types outside the catalog are discarded even if the detector
 * returns them. An empty catalog forwards every type the detector supports.
 */
class ModelRecognizer final : public IRecognizer {
public:
    ModelRecognizer(std::string name,
                    std::shared_ptr<const IEntityDetector> detector,
                    std::vector<std::string> entities);

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] RecognizerKind kind() const override { return RecognizerKind::MODEL; }
    [[nodiscard]] std::vector<std::string> supported_entities() const override {
        return entities_;
    }
    [[nodiscard]] std::vector<Span> detect(std::string_view text) const override;

private:
    std::string name_;
    std::shared_ptr<const IEntityDetector> detector_;
    std::vector<std::string> entities_;
    std::unordered_set<std::string> entity_set_;
};

} // namespace piishield
