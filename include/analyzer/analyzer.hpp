#pragma once

#include "core/types.hpp"
#include "registry/recognizer_registry.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace piishield {

struct AnalyzerOptions {
    // Run the recognizers of one pass concurrently
    bool parallel = false;

    // Per-recognizer time budget; zero disables the budget
    std::chrono::milliseconds recognizer_timeout{0};

    // Spans scoring below this are dropped before conflict resolution
    double score_threshold = 0.0;

    // Entity types to report; empty means all types
    std::vector<std::string> entities;
};

/**
 * @brief Analyzer - runs every recognizer of a registry snapshot over one text
 * unit and merges their outputs
 *
 * Pipeline:
 * 1. Snapshot the registry (rules added afterwards do not affect this pass)
 * 2. Run each recognizer independently (optionally concurrently, each under
 *    its own time budget)
 * 3. Drop spans violating the span invariants, spans of unrequested types and
 *    spans under the score threshold
 * 4. Resolve overlaps (see span_resolver.hpp) and sort by start
 *
 * A recognizer that throws, times out or returns invalid spans is isolated:
 * its failure is reported in AnalysisResult::warnings and the pass continues.
 * While a timed-out invocation is still running, later passes report the
 * same recognizer as timed out without starting another worker.
 */
class Analyzer {
public:
    explicit Analyzer(const RecognizerRegistry& registry, AnalyzerOptions options = {});

    /**
     * @brief Analyze text against the registry's current recognizer set
     */
    [[nodiscard]] AnalysisResult analyze(std::string_view text) const;

    /**
     * @brief Analyze text against an explicit snapshot (shared by table passes)
     */
    [[nodiscard]] AnalysisResult analyze(std::string_view text,
                                         const RegistrySnapshot& snapshot) const;

    [[nodiscard]] const AnalyzerOptions& options() const { return options_; }
    [[nodiscard]] const RecognizerRegistry& registry() const { return registry_; }

private:
    struct Outcome {
        std::vector<Span> spans;
        std::optional<RecognizerFailure> failure;
    };

    // Set by a worker when detect() returns or throws
    using DoneFlag = std::shared_ptr<std::atomic<bool>>;

    struct Abandoned {
        std::shared_ptr<const IRecognizer> recognizer;   // pins the key's address
        DoneFlag done;
    };

    // Workers whose pass gave up on them, keyed by recognizer
    struct AbandonedWorkers {
        std::mutex mutex;
        std::unordered_map<const IRecognizer*, Abandoned> workers;
    };

    [[nodiscard]] bool still_running(const IRecognizer* recognizer) const;
    void abandon(const std::shared_ptr<const IRecognizer>& recognizer, DoneFlag done) const;

    [[nodiscard]] std::vector<Outcome> run_inline(std::string_view text,
                                                  const RecognizerSet& set) const;
    [[nodiscard]] std::vector<Outcome> run_on_workers(std::string_view text,
                                                      const RecognizerSet& set) const;

    void collect(const IRecognizer& recognizer,
                 Outcome&& outcome,
                 size_t text_size,
                 std::vector<Span>& spans,
                 std::vector<RecognizerFailure>& warnings) const;

    const RecognizerRegistry& registry_;
    AnalyzerOptions options_;
    std::unordered_set<std::string> entity_filter_;
    std::shared_ptr<AbandonedWorkers> abandoned_ = std::make_shared<AbandonedWorkers>();
};

} // namespace piishield
