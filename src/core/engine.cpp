#include "core/engine.hpp"
#include "core/utils.hpp"
#include "recognizer/builtin_recognizers.hpp"
#include "recognizer/model_recognizer.hpp"

#include <format>

namespace piishield {

PiiShield::PiiShield(EngineConfig config)
    : config_(std::move(config)),
      registry_(config_.builtin_recognizers),
      analyzer_(registry_, config_.analyzer),
      redactor_(config_.redactor),
      tabular_(analyzer_, redactor_, config_.tabular) {
    utils::log::debug(std::format("Engine ready with {} recognizer(s)", registry_.size()));
}

void PiiShield::add_rule(const RuleDefinition& rule) {
    static_cast<void>(registry_.add_rule(rule));
}

void PiiShield::add_regex_rule(const std::string& name, const std::string& pattern, double score) {
    RuleDefinition rule;
    rule.name = name;
    rule.kind = RuleKind::REGEX;
    rule.pattern = pattern;
    rule.score = score;
    add_rule(rule);
}

void PiiShield::add_whitelist_rule(const std::string& name,
                                   const std::vector<std::string>& examples,
                                   double score) {
    RuleDefinition rule;
    rule.name = name;
    rule.kind = RuleKind::WHITELIST;
    rule.examples = examples;
    rule.score = score;
    add_rule(rule);
}

void PiiShield::add_entity_detector(std::shared_ptr<const IEntityDetector> detector,
                                    std::vector<std::string> entities) {
    if (entities.empty()) {
        entities = default_model_entities();
    }
    const std::string name = detector ? std::format("ModelRecognizer:{}", detector->name())
                                      : std::string("ModelRecognizer");
    registry_.register_builtin(
        std::make_shared<ModelRecognizer>(name, std::move(detector), std::move(entities)));
    utils::log::info(std::format("Model-backed recognizer '{}' installed", name));
}

AnalysisResult PiiShield::analyze(std::string_view text) const {
    return analyzer_.analyze(text);
}

std::string PiiShield::redact(std::string_view text, const std::vector<Span>& spans) const {
    return redactor_.redact(text, spans);
}

TextAnalysis PiiShield::analyze_text(std::string_view text) const {
    return tabular_.analyze_text(text);
}

TableAnalysis PiiShield::analyze_table(const Table& table) const {
    return tabular_.analyze_table(table);
}

} // namespace piishield
