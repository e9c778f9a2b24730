#pragma once

#include "core/types.hpp"
#include "analyzer/analyzer.hpp"
#include "recognizer/entity_detector.hpp"
#include "redactor/redactor.hpp"
#include "registry/recognizer_registry.hpp"
#include "tabular/tabular_adapter.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace piishield {

struct EngineConfig {
    bool builtin_recognizers = true;
    AnalyzerOptions analyzer;
    RedactorOptions redactor;
    TabularOptions tabular;
};

/**
 * @brief Detection & Redaction Engine
 *
 * One instance per session, passed by reference to whatever needs it. Owns the
 * recognizer registry (the only mutable shared state) and the stateless
 * Analyzer/Redactor/TabularAdapter built on top of it. All analysis calls are
 * safe to issue concurrently with each other and with rule registration.
 */
class PiiShield {
public:
    explicit PiiShield(EngineConfig config = {});

    PiiShield(const PiiShield&) = delete;
    PiiShield& operator=(const PiiShield&) = delete;

    /**
     * @brief Register a custom regex/whitelist rule
     * @throws InvalidRuleError; registry unchanged
     */
    void add_rule(const RuleDefinition& rule);

    void add_regex_rule(const std::string& name, const std::string& pattern, double score = 0.8);
    void add_whitelist_rule(const std::string& name,
                            const std::vector<std::string>& examples,
                            double score = 0.8);

    /**
     * @brief Install a model-backed built-in recognizer over an entity detector
     * @param entities Entity catalog; empty uses default_model_entities()
     */
    void add_entity_detector(std::shared_ptr<const IEntityDetector> detector,
                             std::vector<std::string> entities = {});

    [[nodiscard]] AnalysisResult analyze(std::string_view text) const;

    /**
     * @throws OverlappingSpanError on spans that are not canonical
     */
    [[nodiscard]] std::string redact(std::string_view text, const std::vector<Span>& spans) const;

    [[nodiscard]] TextAnalysis analyze_text(std::string_view text) const;

    /**
     * @throws MalformedInputError on a malformed table
     */
    [[nodiscard]] TableAnalysis analyze_table(const Table& table) const;

    [[nodiscard]] RecognizerRegistry& registry() { return registry_; }
    [[nodiscard]] const RecognizerRegistry& registry() const { return registry_; }
    [[nodiscard]] const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    RecognizerRegistry registry_;
    Analyzer analyzer_;
    Redactor redactor_;
    TabularAdapter tabular_;
};

} // namespace piishield
