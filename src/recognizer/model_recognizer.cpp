#include "recognizer/model_recognizer.hpp"
#include "core/error.hpp"

#include <format>

namespace piishield {

ModelRecognizer::ModelRecognizer(std::string name,
                                 std::shared_ptr<const IEntityDetector> detector,
                                 std::vector<std::string> entities)
    : name_(std::move(name)),
      detector_(std::move(detector)),
      entities_(std::move(entities)),
      entity_set_(entities_.begin(), entities_.end()) {

    if (name_.empty()) {
        throw InvalidRuleError("Model recognizer requires a non-empty name");
    }
    if (!detector_) {
        throw InvalidRuleError(std::format("Model recognizer '{}' has no entity detector", name_));
    }
}

std::vector<Span> ModelRecognizer::detect(std::string_view text) const {
    if (text.empty()) {
        return {};
    }

    auto raw = detector_->detect(text, entities_);

    std::vector<Span> spans;
    spans.reserve(raw.size());
    for (auto& span : raw) {
        if (!entity_set_.empty() && !entity_set_.contains(span.type)) {
            continue;
        }
        span.recognizer = name_;
        spans.emplace_back(std::move(span));
    }
    return spans;
}

} // namespace piishield
